// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __OPTIONS_FILE_READER_H
#define __OPTIONS_FILE_READER_H 1

#include <istream>
#include <memory>
#include <string>

#include "TreestatException.h"
#include "Differentiation.h"
#include "Bootstrap.h"

namespace treestat
{
  class ConfigurationError : public TreestatException
  {
  public:
    explicit ConfigurationError(const std::string& msg)
      : TreestatException(msg)
    {}
  };

  /**
   * @class AnalysisConfiguration
   * @brief Differentiation and bootstrap settings read from an options file.
   *
   * Observers and existing results are not configurable from a file and
   * are left empty.
   */
  class AnalysisConfiguration
  {
  public:
    AnalysisConfiguration(const numdiff::NumdiffOptions& numdiffOptions,
			  const statistics::BootstrapOptions& bootstrapOptions,
			  double ciLevel)
      : mNumdiffOptions(numdiffOptions),
	mBootstrapOptions(bootstrapOptions),
	mCiLevel(ciLevel)
    {}

    const numdiff::NumdiffOptions& getNumdiffOptions() const
    {
      return mNumdiffOptions;
    }

    const statistics::BootstrapOptions& getBootstrapOptions() const
    {
      return mBootstrapOptions;
    }

    double getCiLevel() const
    {
      return mCiLevel;
    }

  private:
    numdiff::NumdiffOptions      mNumdiffOptions;
    statistics::BootstrapOptions mBootstrapOptions;
    double                       mCiLevel;
  };

  /**
   * @class OptionsFileReader
   * @brief Reads "key = value" option files.
   *
   * Blank lines and everything after a '#' are ignored. Recognized keys:
   *
   *   numdiff.method          central | forward | backward
   *   numdiff.second_method   central_cross | forward
   *   numdiff.n_cores         positive integer
   *   numdiff.min_step        positive number
   *   numdiff.n_steps         positive integer
   *   numdiff.step_ratio      number greater than 1
   *   bootstrap.n_draws       positive integer
   *   bootstrap.n_cores       positive integer
   *   bootstrap.seed          non-negative integer
   *   bootstrap.cluster_by    column name
   *   bootstrap.ci_level      number in (0, 1)
   *
   * Keys not given keep the defaults of the option structs.
   */
  class OptionsFileReader
  {
  public:
    explicit OptionsFileReader(const std::string& configFileName);

    // @throws ConfigurationError for an unreadable file, unknown key or bad value.
    std::shared_ptr<AnalysisConfiguration> readConfigurationFile() const;

    static std::shared_ptr<AnalysisConfiguration> readConfiguration(std::istream& in);

  private:
    std::string mConfigFileName;
  };
}

#endif
