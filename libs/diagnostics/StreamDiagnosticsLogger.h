#pragma once
#include "IDiagnosticsObserver.h"
#include <ostream>
#include <mutex>

namespace treestat::diagnostics {

/**
 * @brief Writes one human-readable line per derivative or bootstrap event.
 *
 * The stream is not owned and must outlive the logger.
 */
class StreamDiagnosticsLogger : public IDerivativeObserver, public IBootstrapObserver {
public:
    explicit StreamDiagnosticsLogger(std::ostream& os);

    void onDerivativeComputed(const DerivativeRecord& record) override;
    void onBootstrapCompleted(const BootstrapRecord& record) override;

private:
    std::ostream& m_os;
    std::mutex m_mutex;
};

} // namespace treestat::diagnostics
