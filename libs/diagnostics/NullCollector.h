#pragma once
#include "IDiagnosticsObserver.h"

namespace treestat::diagnostics {

class NullCollector : public IDerivativeObserver, public IBootstrapObserver {
public:
    NullCollector() = default;
    ~NullCollector() override = default;

    void onDerivativeComputed(const DerivativeRecord& /*record*/) override {}
    void onBootstrapCompleted(const BootstrapRecord& /*record*/) override {}
};

} // namespace treestat::diagnostics
