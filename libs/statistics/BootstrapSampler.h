#ifndef __BOOTSTRAP_SAMPLER_H
#define __BOOTSTRAP_SAMPLER_H 1

#include <cstddef>
#include <string>
#include <vector>

#include "DataTable.h"
#include "RngUtils.h"

namespace treestat
{
  namespace statistics
  {
    /**
     * @class BootstrapSampler
     * @brief Draws resamples of a table's rows, either row by row or by whole cluster.
     *
     * A sampling unit is a single row (i.i.d. bootstrap) or every row sharing
     * one value of the cluster column (cluster bootstrap). Each draw picks
     * numUnits() units uniformly with replacement and returns the row indices
     * of the picked units, concatenated in draw order, so a cluster is either
     * wholly present (possibly several times) or absent.
     *
     * Clusters are numbered by order of first appearance in the column.
     */
    class BootstrapSampler
    {
    public:
      // i.i.d. rows
      explicit BootstrapSampler(std::size_t numRows);

      /**
       * @throws MissingColumnError if clusterBy is not a column of data,
       *         std::invalid_argument for a NaN cluster key.
       */
      BootstrapSampler(const DataTable& data, const std::string& clusterBy);

      bool isClustered() const
      {
	return m_clustered;
      }

      std::size_t numRows() const
      {
	return m_numRows;
      }

      std::size_t numUnits() const
      {
	return m_clustered ? m_unitRows.size() : m_numRows;
      }

      // Number of clusters, 0 for i.i.d. sampling.
      std::size_t numClusters() const
      {
	return m_clustered ? m_unitRows.size() : 0;
      }

      const std::vector<std::size_t>& rowsOfCluster(std::size_t cluster) const
      {
	return m_unitRows.at(cluster);
      }

      std::vector<std::size_t> draw(rng_utils::Engine& rng) const;

      // nDraws consecutive draws from rng; draw b is element b.
      std::vector<std::vector<std::size_t>> drawMany(std::size_t nDraws, rng_utils::Engine& rng) const;

      // Rows of the table with one unit left out, in original order (jackknife).
      std::vector<std::size_t> rowsWithoutUnit(std::size_t unit) const;

    private:
      std::size_t                           m_numRows;
      bool                                  m_clustered;
      std::vector<std::vector<std::size_t>> m_unitRows;
      std::vector<std::size_t>              m_unitOfRow;
    };
  }
}

#endif
