// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "OptionsFileReader.h"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace treestat
{
  static std::size_t parsePositiveCount(const std::string& key, const std::string& value);
  static std::uint64_t parseSeed(const std::string& value);
  static double parseDouble(const std::string& key, const std::string& value);

  OptionsFileReader::OptionsFileReader(const std::string& configFileName)
    : mConfigFileName(configFileName)
  {}

  std::shared_ptr<AnalysisConfiguration> OptionsFileReader::readConfigurationFile() const
  {
    std::ifstream in(mConfigFileName);
    if (!in)
      throw ConfigurationError("OptionsFileReader: cannot open " + mConfigFileName);

    return readConfiguration(in);
  }

  std::shared_ptr<AnalysisConfiguration> OptionsFileReader::readConfiguration(std::istream& in)
  {
    numdiff::NumdiffOptions numdiffOptions;
    statistics::BootstrapOptions bootstrapOptions;
    double ciLevel = 0.95;

    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line))
      {
	++lineNumber;

	const std::size_t hash = line.find('#');
	if (hash != std::string::npos)
	  line.erase(hash);

	boost::algorithm::trim(line);
	if (line.empty())
	  continue;

	const std::size_t eq = line.find('=');
	if (eq == std::string::npos)
	  throw ConfigurationError("OptionsFileReader: line " + std::to_string(lineNumber)
				   + " is not of the form key = value");

	std::string key = line.substr(0, eq);
	std::string value = line.substr(eq + 1);
	boost::algorithm::trim(key);
	boost::algorithm::trim(value);

	if (value.empty())
	  throw ConfigurationError("OptionsFileReader: no value for " + key);

	try
	  {
	    if (key == "numdiff.method")
	      numdiffOptions.method = numdiff::parseFirstDerivativeMethod(boost::algorithm::to_lower_copy(value));
	    else if (key == "numdiff.second_method")
	      numdiffOptions.secondMethod = numdiff::parseSecondDerivativeMethod(boost::algorithm::to_lower_copy(value));
	    else if (key == "numdiff.n_cores")
	      numdiffOptions.nCores = parsePositiveCount(key, value);
	    else if (key == "numdiff.min_step")
	      {
		numdiffOptions.minStep = parseDouble(key, value);
		if (!(numdiffOptions.minStep > 0.0))
		  throw ConfigurationError("OptionsFileReader: numdiff.min_step must be positive");
	      }
	    else if (key == "numdiff.n_steps")
	      numdiffOptions.nSteps = parsePositiveCount(key, value);
	    else if (key == "numdiff.step_ratio")
	      {
		numdiffOptions.stepRatio = parseDouble(key, value);
		if (!(numdiffOptions.stepRatio > 1.0))
		  throw ConfigurationError("OptionsFileReader: numdiff.step_ratio must be greater than 1");
	      }
	    else if (key == "bootstrap.n_draws")
	      bootstrapOptions.nDraws = parsePositiveCount(key, value);
	    else if (key == "bootstrap.n_cores")
	      bootstrapOptions.nCores = parsePositiveCount(key, value);
	    else if (key == "bootstrap.seed")
	      bootstrapOptions.seed = parseSeed(value);
	    else if (key == "bootstrap.cluster_by")
	      bootstrapOptions.clusterBy = value;
	    else if (key == "bootstrap.ci_level")
	      {
		ciLevel = parseDouble(key, value);
		if (!(ciLevel > 0.0 && ciLevel < 1.0))
		  throw ConfigurationError("OptionsFileReader: bootstrap.ci_level must be in (0, 1)");
	      }
	    else
	      throw ConfigurationError("OptionsFileReader: unknown key " + key);
	  }
	catch (const std::invalid_argument& e)
	  {
	    throw ConfigurationError(std::string("OptionsFileReader: ") + e.what());
	  }
      }

    return std::make_shared<AnalysisConfiguration>(numdiffOptions, bootstrapOptions, ciLevel);
  }

  static std::size_t parsePositiveCount(const std::string& key, const std::string& value)
  {
    long long n = 0;
    if (!boost::conversion::try_lexical_convert(value, n) || n <= 0)
      throw ConfigurationError("OptionsFileReader: " + key + " must be a positive integer, got " + value);

    return static_cast<std::size_t>(n);
  }

  static std::uint64_t parseSeed(const std::string& value)
  {
    std::uint64_t seed = 0;
    if (value[0] == '-' || !boost::conversion::try_lexical_convert(value, seed))
      throw ConfigurationError("OptionsFileReader: bootstrap.seed must be a non-negative integer, got " + value);

    return seed;
  }

  static double parseDouble(const std::string& key, const std::string& value)
  {
    double d = 0.0;
    if (!boost::conversion::try_lexical_convert(value, d))
      throw ConfigurationError("OptionsFileReader: " + key + " must be a number, got " + value);

    return d;
  }
}
