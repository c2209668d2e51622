#pragma once

#include <cstddef>
#include <cstdint>

namespace treestat::diagnostics
{
  // How a bootstrap() call produced its outcomes.
  enum class BootstrapMode { Fresh, Extended, Subset };

  class BootstrapRecord {
  public:
    BootstrapRecord(BootstrapMode mode,
		    std::size_t numDraws,
		    std::size_t numNewDraws,
		    std::size_t numRows,
		    std::size_t numClusters,
		    std::size_t outcomeDim,
		    std::uint64_t seed,
		    std::size_t numWorkers)
    : m_mode(mode),
      m_numDraws(numDraws),
      m_numNewDraws(numNewDraws),
      m_numRows(numRows),
      m_numClusters(numClusters),
      m_outcomeDim(outcomeDim),
      m_seed(seed),
      m_numWorkers(numWorkers)
    {}

    BootstrapRecord() = delete;

    BootstrapMode getMode() const { return m_mode; }
    std::size_t getNumDraws() const { return m_numDraws; }
    std::size_t getNumNewDraws() const { return m_numNewDraws; }
    std::size_t getNumRows() const { return m_numRows; }
    // 0 for i.i.d. row sampling
    std::size_t getNumClusters() const { return m_numClusters; }
    std::size_t getOutcomeDim() const { return m_outcomeDim; }
    std::uint64_t getSeed() const { return m_seed; }
    std::size_t getNumWorkers() const { return m_numWorkers; }

  private:
    const BootstrapMode m_mode;
    const std::size_t m_numDraws;
    const std::size_t m_numNewDraws;
    const std::size_t m_numRows;
    const std::size_t m_numClusters;
    const std::size_t m_outcomeDim;
    const std::uint64_t m_seed;
    const std::size_t m_numWorkers;
  };

  inline const char* toString(BootstrapMode mode)
  {
    switch (mode)
      {
      case BootstrapMode::Fresh:    return "fresh";
      case BootstrapMode::Extended: return "extended";
      case BootstrapMode::Subset:   return "subset";
      }
    return "unknown";
  }

} // namespace treestat::diagnostics
