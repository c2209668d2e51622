// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "BootstrapResult.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <initializer_list>
#include <numeric>
#include <stdexcept>

#include "BootstrapSampler.h"
#include "NormalQuantile.h"
#include "RngUtils.h"
#include "SummaryStatistics.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace treestat
{
  namespace statistics
  {
    using tree::ParamTree;
    using tree::Matrix;

    namespace
    {
      bool allEqual(const std::vector<double>& v)
      {
	return std::adjacent_find(v.begin(), v.end(), std::not_equal_to<double>()) == v.end();
      }

      /*
       * Adjusted percentile level of the BC / BCa interval:
       *   alpha = Phi(z0 + (z0 + z) / (1 - a (z0 + z)))
       * which reduces to Phi(2 z0 + z) when a = 0.
       */
      double adjustedLevel(double z0, double z, double a)
      {
	const double num   = z0 + z;
	const double denom = 1.0 - a * num;

	// The acceleration pushed the level past the end of the distribution.
	if (!(denom > 0.0))
	  return (num > 0.0) ? 1.0 : 0.0;

	return detail::normalCdf(z0 + num / denom);
      }

      void checkCiLevel(double ciLevel)
      {
	if (!(ciLevel > 0.0 && ciLevel < 1.0))
	  throw std::invalid_argument("BootstrapResult::ci: ciLevel must be in (0, 1)");
      }
    }

    const char* toString(SeMethod m)
    {
      switch (m)
	{
	case SeMethod::StdDev: return "stddev";
	case SeMethod::Robust: return "robust";
	}
      return "unknown";
    }

    const char* toString(CiMethod m)
    {
      switch (m)
	{
	case CiMethod::Percentile: return "percentile";
	case CiMethod::BC:         return "bc";
	case CiMethod::BCa:        return "bca";
	case CiMethod::T:          return "t";
	case CiMethod::Normal:     return "normal";
	case CiMethod::Basic:      return "basic";
	}
      return "unknown";
    }

    SeMethod parseSeMethod(const std::string& name)
    {
      if (name == "stddev")
	return SeMethod::StdDev;
      if (name == "robust")
	return SeMethod::Robust;

      throw std::invalid_argument("Unknown standard error method: " + name);
    }

    CiMethod parseCiMethod(const std::string& name)
    {
      for (CiMethod m : { CiMethod::Percentile, CiMethod::BC, CiMethod::BCa,
			  CiMethod::T, CiMethod::Normal, CiMethod::Basic })
	{
	  if (name == toString(m))
	    return m;
	}

      throw std::invalid_argument("Unknown confidence interval method: " + name);
    }

    BootstrapResult::BootstrapResult(std::vector<ParamTree> outcomes,
				     ParamTree baseOutcome,
				     std::vector<SeedSegment> seedSegments,
				     std::optional<JackknifeInputs> jackknife)
      : m_outcomes(std::move(outcomes)),
	m_baseOutcome(std::move(baseOutcome)),
	m_spec(m_baseOutcome),
	m_flat(),
	m_flatBase(m_spec.flattenLike(m_baseOutcome)),
	m_seedSegments(std::move(seedSegments)),
	m_jackknife(std::move(jackknife))
    {
      if (m_outcomes.empty())
	throw std::invalid_argument("BootstrapResult: at least one outcome is required");

      m_flat.reserve(m_outcomes.size());
      for (const auto& o : m_outcomes)
	m_flat.push_back(m_spec.flattenLike(o));
    }

    std::vector<double> BootstrapResult::column(std::size_t k) const
    {
      std::vector<double> col;
      col.reserve(m_flat.size());
      for (const auto& row : m_flat)
	col.push_back(row[k]);
      return col;
    }

    ParamTree BootstrapResult::se(SeMethod method) const
    {
      if (method == SeMethod::StdDev && numDraws() < 2)
	throw std::logic_error("BootstrapResult::se: the standard deviation needs at least two draws");

      const std::size_t dim = m_spec.totalDim();
      std::vector<double> out(dim);

      for (std::size_t k = 0; k < dim; ++k)
	{
	  const std::vector<double> col = column(k);
	  out[k] = (method == SeMethod::StdDev) ? sampleMoments(col).stdDev : robustStdDev(col);
	}

      return m_spec.unflatten(out);
    }

    std::vector<double> BootstrapResult::acceleration() const
    {
      if (!m_jackknife || !m_jackknife->data || !m_jackknife->outcome)
	throw std::logic_error("BootstrapResult: the BCa interval needs the data and outcome "
			       "function the result was computed from");

      const DataTable& data = *m_jackknife->data;
      const BootstrapSampler sampler = m_jackknife->clusterBy
	? BootstrapSampler(data, *m_jackknife->clusterBy)
	: BootstrapSampler(data.numRows());

      const std::size_t units = sampler.numUnits();
      if (units < 2)
	throw std::logic_error("BootstrapResult: the jackknife needs at least two sampling units");

      std::vector<std::vector<double>> jk(units);
      auto executor = concurrency::makeExecutor(m_jackknife->nCores);
      concurrency::parallel_for(units, *executor, [&](std::size_t u) {
	  const DataTable reduced = data.selectRows(sampler.rowsWithoutUnit(u));
	  jk[u] = m_spec.flattenLike(m_jackknife->outcome(reduced));
	});

      const std::size_t dim = m_spec.totalDim();
      std::vector<double> accel(dim, 0.0);

      for (std::size_t k = 0; k < dim; ++k)
	{
	  double jkMean = 0.0;
	  for (const auto& v : jk)
	    jkMean += v[k];
	  jkMean /= static_cast<double>(units);

	  double num = 0.0;
	  double den = 0.0;
	  for (const auto& v : jk)
	    {
	      const double d  = jkMean - v[k];
	      const double d2 = d * d;
	      num += d2 * d;
	      den += d2;
	    }

	  // A flat jackknife carries no skew information.
	  accel[k] = (den > 0.0) ? num / (6.0 * std::pow(den, 1.5)) : 0.0;
	}

      return accel;
    }

    ConfidenceInterval BootstrapResult::ci(CiMethod method, double ciLevel) const
    {
      checkCiLevel(ciLevel);

      const std::size_t dim   = m_spec.totalDim();
      const double      alpha = 1.0 - ciLevel;
      const double      pLo   = alpha / 2.0;
      const double      pHi   = 1.0 - alpha / 2.0;

      std::vector<double> lower(dim);
      std::vector<double> upper(dim);

      if (method == CiMethod::T || method == CiMethod::Normal)
	{
	  if (numDraws() < 2)
	    throw std::logic_error("BootstrapResult::ci: normal intervals need at least two draws");

	  const double z = detail::normalCriticalValue(ciLevel);
	  for (std::size_t k = 0; k < dim; ++k)
	    {
	      const SampleMoments mom = sampleMoments(column(k));
	      const double center = (method == CiMethod::T) ? m_flatBase[k] : mom.mean;
	      lower[k] = center - z * mom.stdDev;
	      upper[k] = center + z * mom.stdDev;
	    }

	  return ConfidenceInterval{ m_spec.unflatten(lower), m_spec.unflatten(upper) };
	}

      std::vector<double> accel;
      if (method == CiMethod::BCa)
	accel = acceleration();

      const double B    = static_cast<double>(numDraws());
      const double zLo  = detail::normalQuantile(pLo);
      const double zHi  = detail::normalQuantile(pHi);

      for (std::size_t k = 0; k < dim; ++k)
	{
	  const std::vector<double> col = column(k);

	  if (method == CiMethod::Percentile)
	    {
	      lower[k] = quantileType7(col, pLo);
	      upper[k] = quantileType7(col, pHi);
	      continue;
	    }

	  if (method == CiMethod::Basic)
	    {
	      lower[k] = 2.0 * m_flatBase[k] - quantileType7(col, pHi);
	      upper[k] = 2.0 * m_flatBase[k] - quantileType7(col, pLo);
	      continue;
	    }

	  if (allEqual(col))
	    {
	      lower[k] = upper[k] = col.front();
	      continue;
	    }

	  // Keep z0 finite when the base lies outside the draws.
	  double p0 = detail::proportionBelow(col, m_flatBase[k]);
	  p0 = std::clamp(p0, 0.5 / B, 1.0 - 0.5 / B);
	  const double z0 = detail::normalQuantile(p0);
	  const double a  = accel.empty() ? 0.0 : accel[k];

	  const double a1 = adjustedLevel(z0, zLo, a);
	  const double a2 = adjustedLevel(z0, zHi, a);

	  lower[k] = quantileType7(col, std::min(a1, a2));
	  upper[k] = quantileType7(col, std::max(a1, a2));
	}

      return ConfidenceInterval{ m_spec.unflatten(lower), m_spec.unflatten(upper) };
    }

    Matrix BootstrapResult::covMatrix() const
    {
      const std::size_t n = numDraws();
      if (n < 2)
	throw std::logic_error("BootstrapResult::cov: the covariance needs at least two draws");

      const std::size_t dim = m_spec.totalDim();

      std::vector<double> means(dim);
      for (std::size_t k = 0; k < dim; ++k)
	means[k] = sampleMoments(column(k)).mean;

      Matrix c(dim, dim);
      for (const auto& row : m_flat)
	{
	  for (std::size_t i = 0; i < dim; ++i)
	    {
	      const double di = row[i] - means[i];
	      for (std::size_t j = i; j < dim; ++j)
		c(i, j) += di * (row[j] - means[j]);
	    }
	}

      const double denom = static_cast<double>(n - 1);
      for (std::size_t i = 0; i < dim; ++i)
	{
	  for (std::size_t j = i; j < dim; ++j)
	    {
	      c(i, j) /= denom;
	      c(j, i) = c(i, j);
	    }
	}

      return c;
    }

    ParamTree BootstrapResult::cov() const
    {
      return tree::outerProductStructure(m_spec, m_spec).toTree(covMatrix());
    }

    ParamTree BootstrapResult::pValues() const
    {
      const std::vector<double> stdErr = m_spec.flattenLike(se(SeMethod::StdDev));

      std::vector<double> p(stdErr.size());
      for (std::size_t k = 0; k < stdErr.size(); ++k)
	{
	  const double t = m_flatBase[k] / std::max(stdErr[k], 1e-300);
	  p[k] = 2.0 * detail::normalCdf(-std::fabs(t));
	}

      return m_spec.unflatten(p);
    }

    BootstrapResult BootstrapResult::subset(std::size_t nDraws,
					    std::optional<std::uint64_t> seed) const
    {
      if (nDraws == 0 || nDraws > numDraws())
	throw std::invalid_argument("BootstrapResult::subset: nDraws must be in [1, "
				    + std::to_string(numDraws()) + "]");

      rng_utils::Engine rng = rng_utils::makeEngine(seed ? *seed : rng_utils::randomSeed());

      // Partial Fisher-Yates: the first nDraws slots become a uniform sample.
      std::vector<std::size_t> idx(numDraws());
      std::iota(idx.begin(), idx.end(), 0);
      for (std::size_t i = 0; i < nDraws; ++i)
	{
	  const std::size_t j = i + rng_utils::getRandomIndex(rng, idx.size() - i);
	  std::swap(idx[i], idx[j]);
	}
      idx.resize(nDraws);
      std::sort(idx.begin(), idx.end());

      std::vector<ParamTree> picked;
      picked.reserve(nDraws);
      for (std::size_t i : idx)
	picked.push_back(m_outcomes[i]);

      return BootstrapResult(std::move(picked), m_baseOutcome, m_seedSegments, m_jackknife);
    }
  }
}
