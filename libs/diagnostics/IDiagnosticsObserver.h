#pragma once
#include "DerivativeRecord.h"
#include "BootstrapRecord.h"

namespace treestat::diagnostics {

class IDerivativeObserver {
public:
    virtual ~IDerivativeObserver() = default;
    virtual void onDerivativeComputed(const DerivativeRecord& record) = 0;
};

class IBootstrapObserver {
public:
    virtual ~IBootstrapObserver() = default;
    virtual void onBootstrapCompleted(const BootstrapRecord& record) = 0;
};

} // namespace treestat::diagnostics
