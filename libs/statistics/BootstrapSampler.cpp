#include "BootstrapSampler.h"

#include <cmath>
#include <map>
#include <stdexcept>

namespace treestat
{
  namespace statistics
  {
    namespace
    {
      // Map each key to a cluster number in order of first appearance.
      template <class Key>
      std::vector<std::size_t> numberByFirstAppearance(const std::vector<Key>& keys,
						       std::size_t& numClusters)
      {
	std::map<Key, std::size_t> seen;
	std::vector<std::size_t> clusterOfRow;
	clusterOfRow.reserve(keys.size());

	for (const Key& k : keys)
	  {
	    auto it = seen.find(k);
	    if (it == seen.end())
	      it = seen.emplace(k, seen.size()).first;
	    clusterOfRow.push_back(it->second);
	  }

	numClusters = seen.size();
	return clusterOfRow;
      }
    }

    BootstrapSampler::BootstrapSampler(std::size_t numRows)
      : m_numRows(numRows),
	m_clustered(false),
	m_unitRows(),
	m_unitOfRow()
    {}

    BootstrapSampler::BootstrapSampler(const DataTable& data, const std::string& clusterBy)
      : m_numRows(data.numRows()),
	m_clustered(true),
	m_unitRows(),
	m_unitOfRow()
    {
      if (!data.hasColumn(clusterBy))
	throw MissingColumnError("bootstrap: cluster column '" + clusterBy + "' not found in data");

      std::size_t numClusters = 0;
      if (data.isNumeric(clusterBy))
	{
	  const auto& keys = data.numeric(clusterBy);
	  for (double k : keys)
	    {
	      if (std::isnan(k))
		throw std::invalid_argument("bootstrap: cluster column '" + clusterBy + "' contains NaN");
	    }
	  m_unitOfRow = numberByFirstAppearance(keys, numClusters);
	}
      else
	m_unitOfRow = numberByFirstAppearance(data.labels(clusterBy), numClusters);

      m_unitRows.resize(numClusters);
      for (std::size_t row = 0; row < m_unitOfRow.size(); ++row)
	m_unitRows[m_unitOfRow[row]].push_back(row);
    }

    std::vector<std::size_t> BootstrapSampler::draw(rng_utils::Engine& rng) const
    {
      std::vector<std::size_t> rows;
      rows.reserve(m_numRows);

      const std::size_t units = numUnits();
      for (std::size_t i = 0; i < units; ++i)
	{
	  const std::size_t u = rng_utils::getRandomIndex(rng, units);
	  if (m_clustered)
	    rows.insert(rows.end(), m_unitRows[u].begin(), m_unitRows[u].end());
	  else
	    rows.push_back(u);
	}

      return rows;
    }

    std::vector<std::vector<std::size_t>>
    BootstrapSampler::drawMany(std::size_t nDraws, rng_utils::Engine& rng) const
    {
      std::vector<std::vector<std::size_t>> draws;
      draws.reserve(nDraws);
      for (std::size_t b = 0; b < nDraws; ++b)
	draws.push_back(draw(rng));
      return draws;
    }

    std::vector<std::size_t> BootstrapSampler::rowsWithoutUnit(std::size_t unit) const
    {
      if (unit >= numUnits())
	throw std::out_of_range("BootstrapSampler::rowsWithoutUnit: unit out of range");

      std::vector<std::size_t> rows;
      rows.reserve(m_numRows);
      for (std::size_t row = 0; row < m_numRows; ++row)
	{
	  const std::size_t u = m_clustered ? m_unitOfRow[row] : row;
	  if (u != unit)
	    rows.push_back(row);
	}
      return rows;
    }
  }
}
