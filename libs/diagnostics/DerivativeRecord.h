#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace treestat::diagnostics
{
  enum class DerivativeOrder { First, Second };

  /**
   * @brief Summary of one firstDerivative() or secondDerivative() call.
   *
   * numFallbackCoordinates counts coordinates whose stencil differs from the
   * requested method, either because of bounds or non-finite outputs.
   */
  class DerivativeRecord {
  public:
    DerivativeRecord(DerivativeOrder order,
		     std::string requestedMethod,
		     std::size_t paramDim,
		     std::size_t outputDim,
		     std::size_t numEvaluations,
		     std::size_t numFallbackCoordinates,
		     double minStepUsed,
		     double maxStepUsed,
		     std::size_t numWorkers)
    : m_order(order),
      m_requestedMethod(std::move(requestedMethod)),
      m_paramDim(paramDim),
      m_outputDim(outputDim),
      m_numEvaluations(numEvaluations),
      m_numFallbackCoordinates(numFallbackCoordinates),
      m_minStepUsed(minStepUsed),
      m_maxStepUsed(maxStepUsed),
      m_numWorkers(numWorkers)
    {}

    DerivativeRecord() = delete;

    DerivativeOrder getOrder() const { return m_order; }
    const std::string& getRequestedMethod() const { return m_requestedMethod; }
    std::size_t getParamDim() const { return m_paramDim; }
    std::size_t getOutputDim() const { return m_outputDim; }
    std::size_t getNumEvaluations() const { return m_numEvaluations; }
    std::size_t getNumFallbackCoordinates() const { return m_numFallbackCoordinates; }
    double getMinStepUsed() const { return m_minStepUsed; }
    double getMaxStepUsed() const { return m_maxStepUsed; }
    std::size_t getNumWorkers() const { return m_numWorkers; }

  private:
    const DerivativeOrder m_order;
    const std::string m_requestedMethod;
    const std::size_t m_paramDim;
    const std::size_t m_outputDim;
    const std::size_t m_numEvaluations;
    const std::size_t m_numFallbackCoordinates;
    const double m_minStepUsed;
    const double m_maxStepUsed;
    const std::size_t m_numWorkers;
  };

} // namespace treestat::diagnostics
