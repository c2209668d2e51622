// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "Bootstrap.h"

#include <stdexcept>
#include <utility>
#include <vector>

#include "BootstrapSampler.h"
#include "BootstrapRecord.h"
#include "RngUtils.h"
#include "TreeSpec.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace treestat
{
  namespace statistics
  {
    using tree::ParamTree;

    namespace
    {
      void validateOptions(const DataTable& data, const BootstrapOptions& options)
      {
	if (options.nDraws == 0)
	  throw std::invalid_argument("bootstrap: nDraws must be at least 1");

	if (options.nCores == 0)
	  throw std::invalid_argument("bootstrap: nCores must be at least 1");

	if (data.numRows() == 0)
	  throw std::invalid_argument("bootstrap: data has no rows");
      }

      void notify(const BootstrapOptions& options,
		  diagnostics::BootstrapMode mode,
		  const BootstrapResult& result,
		  std::size_t numNew,
		  std::size_t numRows,
		  std::size_t numClusters,
		  std::uint64_t seed)
      {
	if (!options.observer)
	  return;

	options.observer->onBootstrapCompleted(
	  diagnostics::BootstrapRecord(mode,
				       result.numDraws(),
				       numNew,
				       numRows,
				       numClusters,
				       result.outcomeSpec().totalDim(),
				       seed,
				       options.nCores));
      }
    }

    BootstrapResult bootstrap(const DataTable& data,
			      const OutcomeFunction& outcome,
			      const BootstrapOptions& options)
    {
      validateOptions(data, options);

      const BootstrapSampler sampler = options.clusterBy
	? BootstrapSampler(data, *options.clusterBy)
	: BootstrapSampler(data.numRows());

      const std::uint64_t seed = options.seed ? *options.seed : rng_utils::randomSeed();
      const std::shared_ptr<const BootstrapResult>& existing = options.existingResult;

      if (existing && options.nDraws <= existing->numDraws())
	{
	  BootstrapResult result = existing->subset(options.nDraws, seed);
	  notify(options, diagnostics::BootstrapMode::Subset, result, 0,
		 data.numRows(), sampler.numClusters(), seed);
	  return result;
	}

      const std::size_t numExisting = existing ? existing->numDraws() : 0;
      const std::size_t numNew      = options.nDraws - numExisting;

      // All generator state is consumed here, before any worker runs.
      rng_utils::Engine rng = rng_utils::makeEngine(seed);
      const std::vector<std::vector<std::size_t>> draws = sampler.drawMany(numNew, rng);

      ParamTree baseOutcome = existing ? existing->baseOutcome() : outcome(data);

      std::vector<ParamTree> newOutcomes(numNew);
      auto executor = concurrency::makeExecutor(options.nCores);
      concurrency::parallel_for(numNew, *executor, [&](std::size_t b) {
	  newOutcomes[b] = outcome(data.selectRows(draws[b]));
	});

      std::vector<ParamTree> outcomes;
      std::vector<SeedSegment> segments;
      if (existing)
	{
	  outcomes = existing->outcomes();
	  segments = existing->seedSegments();
	}
      outcomes.reserve(options.nDraws);
      for (auto& o : newOutcomes)
	outcomes.push_back(std::move(o));
      segments.push_back(SeedSegment{ seed, numNew });

      JackknifeInputs jackknife;
      jackknife.data      = std::make_shared<const DataTable>(data);
      jackknife.outcome   = outcome;
      jackknife.clusterBy = options.clusterBy;
      jackknife.nCores    = options.nCores;

      BootstrapResult result(std::move(outcomes), std::move(baseOutcome),
			     std::move(segments), std::move(jackknife));

      notify(options,
	     existing ? diagnostics::BootstrapMode::Extended : diagnostics::BootstrapMode::Fresh,
	     result, numNew, data.numRows(), sampler.numClusters(), seed);

      return result;
    }
  }
}
