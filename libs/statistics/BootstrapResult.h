// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __BOOTSTRAP_RESULT_H
#define __BOOTSTRAP_RESULT_H 1

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ParamTree.h"
#include "TreeSpec.h"
#include "BlockSpec.h"
#include "DataTable.h"

namespace treestat
{
  namespace statistics
  {
    using OutcomeFunction = std::function<tree::ParamTree(const DataTable&)>;

    enum class SeMethod { StdDev, Robust };

    enum class CiMethod { Percentile, BC, BCa, T, Normal, Basic };

    const char* toString(SeMethod m);
    const char* toString(CiMethod m);

    // Accepts "stddev", "robust"; throws std::invalid_argument otherwise.
    SeMethod parseSeMethod(const std::string& name);

    // Accepts "percentile", "bc", "bca", "t", "normal", "basic"; throws
    // std::invalid_argument otherwise.
    CiMethod parseCiMethod(const std::string& name);

    // A run of consecutive draws generated from one seed.
    struct SeedSegment
    {
      std::uint64_t seed;
      std::size_t   numDraws;

      bool operator==(const SeedSegment& rhs) const
      {
	return seed == rhs.seed && numDraws == rhs.numDraws;
      }
    };

    struct ConfidenceInterval
    {
      tree::ParamTree lower;
      tree::ParamTree upper;
    };

    // What a result needs to recompute the outcome on leave-one-out data (BCa).
    struct JackknifeInputs
    {
      std::shared_ptr<const DataTable> data;
      OutcomeFunction                  outcome;
      std::optional<std::string>       clusterBy;
      std::size_t                      nCores = 1;
    };

    /**
     * @class BootstrapResult
     * @brief Outcome trees of every bootstrap draw plus summary statistics over them.
     *
     * All outcomes share the structure of baseOutcome(), the outcome of the
     * unresampled data. Statistics are computed leafwise on the flattened
     * outcomes and returned in the outcome's tree shape.
     *
     * A result is immutable. bootstrap() extends a result by building a new
     * one whose outcomes start with the old outcomes unchanged.
     */
    class BootstrapResult
    {
    public:
      /**
       * @throws std::invalid_argument if outcomes is empty,
       *         TreeStructureError if an outcome is not shaped like baseOutcome.
       */
      BootstrapResult(std::vector<tree::ParamTree> outcomes,
		      tree::ParamTree baseOutcome,
		      std::vector<SeedSegment> seedSegments,
		      std::optional<JackknifeInputs> jackknife = std::nullopt);

      const std::vector<tree::ParamTree>& outcomes() const
      {
	return m_outcomes;
      }

      const tree::ParamTree& baseOutcome() const
      {
	return m_baseOutcome;
      }

      std::size_t numDraws() const
      {
	return m_outcomes.size();
      }

      // Seeds that generated the draws, in draw order. A subset keeps the
      // segments of the pool it was taken from.
      const std::vector<SeedSegment>& seedSegments() const
      {
	return m_seedSegments;
      }

      const tree::TreeSpec& outcomeSpec() const
      {
	return m_spec;
      }

      const std::optional<JackknifeInputs>& jackknifeInputs() const
      {
	return m_jackknife;
      }

      /**
       * @brief Leafwise bootstrap standard error.
       *
       * StdDev is the sample standard deviation (ddof = 1) and needs at least
       * two draws (std::logic_error otherwise). Robust is 1.4826 times the
       * median absolute deviation.
       */
      tree::ParamTree se(SeMethod method = SeMethod::StdDev) const;

      /**
       * @brief Leafwise two-sided confidence interval at ciLevel.
       *
       * Percentile: type 7 quantiles of the draws at (1-level)/2 and (1+level)/2.
       * Basic:      [2 base - q_hi, 2 base - q_lo].
       * BC:         percentile levels shifted by z0 = Phi^-1(share of draws below base).
       * BCa:        BC plus the jackknife acceleration; needs jackknifeInputs(),
       *             std::logic_error otherwise.
       * T:          base +/- z * se.
       * Normal:     bootstrap mean +/- z * se.
       *
       * A coordinate whose draws are all equal gets the degenerate interval
       * [v, v] under Percentile, BC and BCa.
       *
       * @throws std::invalid_argument if ciLevel is not in (0, 1).
       */
      ConfidenceInterval ci(CiMethod method = CiMethod::Percentile, double ciLevel = 0.95) const;

      // Sample covariance (ddof = 1) of the flattened outcomes.
      tree::Matrix covMatrix() const;

      // covMatrix() as a block tree, outerProductStructure(outcomeSpec, outcomeSpec).
      tree::ParamTree cov() const;

      // Two-sided normal p-values of base / se, leafwise.
      tree::ParamTree pValues() const;

      /**
       * @brief Uniform random subset of nDraws outcomes, without replacement.
       *
       * Selected outcomes keep their relative order. With no seed a fresh one
       * is taken from std::random_device.
       *
       * @throws std::invalid_argument if nDraws is 0 or exceeds numDraws().
       */
      BootstrapResult subset(std::size_t nDraws,
			     std::optional<std::uint64_t> seed = std::nullopt) const;

    private:
      // Draw values of flat coordinate k.
      std::vector<double> column(std::size_t k) const;

      // Jackknife acceleration for every flat coordinate.
      std::vector<double> acceleration() const;

    private:
      std::vector<tree::ParamTree>     m_outcomes;
      tree::ParamTree                  m_baseOutcome;
      tree::TreeSpec                   m_spec;
      std::vector<std::vector<double>> m_flat;      // m_flat[draw][coordinate]
      std::vector<double>              m_flatBase;
      std::vector<SeedSegment>         m_seedSegments;
      std::optional<JackknifeInputs>   m_jackknife;
    };
  }
}

#endif
