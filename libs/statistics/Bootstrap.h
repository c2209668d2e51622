// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __BOOTSTRAP_H
#define __BOOTSTRAP_H 1

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "DataTable.h"
#include "BootstrapResult.h"
#include "IDiagnosticsObserver.h"

namespace treestat
{
  namespace statistics
  {
    struct BootstrapOptions
    {
      std::size_t nDraws = 1000;

      // Resample whole groups of rows sharing a value of this column.
      std::optional<std::string> clusterBy;

      // 1 evaluates inline on the calling thread.
      std::size_t nCores = 1;

      // Missing: a seed is drawn from std::random_device and recorded in
      // the result's seed segments.
      std::optional<std::uint64_t> seed;

      // Extend (nDraws larger) or subset (nDraws not larger) this result.
      std::shared_ptr<const BootstrapResult> existingResult;

      std::shared_ptr<diagnostics::IBootstrapObserver> observer;
    };

    /**
     * @brief Bootstrap distribution of outcome over resamples of data.
     *
     * Every draw's row indices are generated up front from a single
     * std::mt19937_64 seeded from options.seed; the outcome calls then run on
     * options.nCores workers, so outcome must be safe to call concurrently
     * when nCores > 1. Results do not depend on nCores.
     *
     * With options.existingResult holding n outcomes:
     *  - nDraws > n computes nDraws - n new draws and appends them to the
     *    existing outcomes, which are kept unchanged and in order. Use a seed
     *    different from the earlier runs or the new draws repeat old ones.
     *  - nDraws <= n returns a random subset of the existing outcomes
     *    without calling outcome.
     *
     * @throws std::invalid_argument if nDraws or nCores is 0 or data has no
     *         rows, MissingColumnError if clusterBy is not a column of data,
     *         TreeStructureError if outcomes differ in structure. Exceptions
     *         thrown by outcome propagate unchanged and no result is produced.
     */
    BootstrapResult bootstrap(const DataTable& data,
			      const OutcomeFunction& outcome,
			      const BootstrapOptions& options = BootstrapOptions());
  }
}

#endif
