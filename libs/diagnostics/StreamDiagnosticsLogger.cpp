#include "StreamDiagnosticsLogger.h"

namespace treestat::diagnostics
{
  StreamDiagnosticsLogger::StreamDiagnosticsLogger(std::ostream& os)
    : m_os(os)
  {}

  void StreamDiagnosticsLogger::onDerivativeComputed(const DerivativeRecord& r)
  {
    std::lock_guard<std::mutex> lk(m_mutex);

    m_os << "[numdiff] "
	 << (r.getOrder() == DerivativeOrder::First ? "first" : "second") << " derivative"
	 << " method=" << r.getRequestedMethod()
	 << " params=" << r.getParamDim()
	 << " outputs=" << r.getOutputDim()
	 << " evaluations=" << r.getNumEvaluations()
	 << " fallback=" << r.getNumFallbackCoordinates();

    if (r.getParamDim() > 0)
      m_os << " step=[" << r.getMinStepUsed() << ", " << r.getMaxStepUsed() << "]";

    m_os << " workers=" << r.getNumWorkers() << std::endl;
  }

  void StreamDiagnosticsLogger::onBootstrapCompleted(const BootstrapRecord& r)
  {
    std::lock_guard<std::mutex> lk(m_mutex);

    m_os << "[bootstrap] " << toString(r.getMode())
	 << " draws=" << r.getNumDraws()
	 << " new=" << r.getNumNewDraws()
	 << " rows=" << r.getNumRows();

    if (r.getNumClusters() > 0)
      m_os << " clusters=" << r.getNumClusters();

    m_os << " outcome_dim=" << r.getOutcomeDim()
	 << " seed=" << r.getSeed()
	 << " workers=" << r.getNumWorkers() << std::endl;
  }
} // namespace treestat::diagnostics
