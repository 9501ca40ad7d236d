// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "AnalyzerConfiguration.h"
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

namespace mkc_measurement
{
  namespace
  {
    double parseDoubleSetting(const std::string& key, const std::string& value)
    {
      try
	{
	  return boost::lexical_cast<double>(value);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw AnalyzerConfigurationException("AnalyzerConfigurationFileReader - value '" + value +
					       "' of " + key + " is not a number");
	}
    }

    std::size_t parseCountSetting(const std::string& key, const std::string& value)
    {
      // lexical_cast to an unsigned type accepts a leading minus sign
      if (!value.empty() && value[0] == '-')
	throw AnalyzerConfigurationException("AnalyzerConfigurationFileReader - value of " + key +
					     " must not be negative");
      try
	{
	  return boost::lexical_cast<std::size_t>(value);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw AnalyzerConfigurationException("AnalyzerConfigurationFileReader - value '" + value +
					       "' of " + key + " is not a whole number");
	}
    }
  }

  AnalyzerConfiguration::AnalyzerConfiguration()
    : mTargetYield(0.90),
      mMinYield(ToleranceSolverOptions().minYield),
      mMaxYield(ToleranceSolverOptions().maxYield),
      mMinConfidentSamples(ToleranceSolverOptions().minConfidentSamples),
      mHeaderScanLines(ReportSourceOptions().headerScanLines),
      mWorkerThreads(0),
      mMaxReportedFailures(ImportResult::kDefaultMaxReportedFailures),
      mDuplicatePolicy(DuplicateReportPolicy::PreferCsv)
  {}

  void AnalyzerConfiguration::setTargetYield(double targetYield)
  {
    if (!(targetYield >= mMinYield && targetYield <= mMaxYield))
      throw AnalyzerConfigurationException("AnalyzerConfiguration::setTargetYield - target yield " +
					   boost::lexical_cast<std::string>(targetYield) +
					   " is outside the allowed yield range");
    mTargetYield = targetYield;
  }

  void AnalyzerConfiguration::setYields(double minYield, double maxYield, double targetYield)
  {
    if (!(minYield > 0.0 && minYield < maxYield && maxYield < 1.0))
      throw AnalyzerConfigurationException("AnalyzerConfiguration::setYields - yield range must satisfy 0 < minYield < maxYield < 1");

    if (!(targetYield >= minYield && targetYield <= maxYield))
      throw AnalyzerConfigurationException("AnalyzerConfiguration::setYields - target yield " +
					   boost::lexical_cast<std::string>(targetYield) +
					   " is outside the allowed yield range");
    mMinYield = minYield;
    mMaxYield = maxYield;
    mTargetYield = targetYield;
  }

  void AnalyzerConfiguration::setMinConfidentSamples(std::size_t minConfidentSamples)
  {
    if (minConfidentSamples < 2)
      throw AnalyzerConfigurationException("AnalyzerConfiguration::setMinConfidentSamples - at least 2 samples are required");
    mMinConfidentSamples = minConfidentSamples;
  }

  void AnalyzerConfiguration::setHeaderScanLines(std::size_t headerScanLines)
  {
    if (headerScanLines == 0)
      throw AnalyzerConfigurationException("AnalyzerConfiguration::setHeaderScanLines - must scan at least one line");
    mHeaderScanLines = headerScanLines;
  }

  void AnalyzerConfiguration::setWorkerThreads(std::size_t workerThreads)
  {
    if (workerThreads > kMaxWorkerThreads)
      throw AnalyzerConfigurationException("AnalyzerConfiguration::setWorkerThreads - " +
					   boost::lexical_cast<std::string>(workerThreads) +
					   " workers exceeds the limit of " +
					   boost::lexical_cast<std::string>(kMaxWorkerThreads));
    mWorkerThreads = workerThreads;
  }

  void AnalyzerConfiguration::setMaxReportedFailures(std::size_t maxReportedFailures)
  {
    mMaxReportedFailures = maxReportedFailures;
  }

  void AnalyzerConfiguration::setDuplicateReportPolicy(DuplicateReportPolicy policy)
  {
    mDuplicatePolicy = policy;
  }

  ToleranceSolverOptions AnalyzerConfiguration::getToleranceSolverOptions() const
  {
    ToleranceSolverOptions options;
    options.minYield = mMinYield;
    options.maxYield = mMaxYield;
    options.minConfidentSamples = mMinConfidentSamples;
    return options;
  }

  ReportSourceOptions AnalyzerConfiguration::getReportSourceOptions() const
  {
    ReportSourceOptions options;
    options.headerScanLines = mHeaderScanLines;
    return options;
  }

  AnalyzerConfigurationFileReader::AnalyzerConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  AnalyzerConfiguration AnalyzerConfigurationFileReader::readConfigurationFile() const
  {
    if (!boost::filesystem::exists(mConfigurationFileName))
      throw AnalyzerConfigurationException("AnalyzerConfigurationFileReader - configuration file " +
					   mConfigurationFileName + " does not exist");

    AnalyzerConfiguration configuration;
    double minYield = configuration.getMinYield();
    double maxYield = configuration.getMaxYield();
    double targetYield = configuration.getTargetYield();

    try
      {
	// Check if the file has a header row by reading the first line
	bool hasHeader = false;
	{
	  io::CSVReader<2> csvConfigFileCheck(mConfigurationFileName.c_str());
	  char* firstLine = csvConfigFileCheck.next_line();
	  if (firstLine)
	    {
	      std::string firstLineStr(firstLine);
	      hasHeader = (firstLineStr.find("Key") != std::string::npos &&
			   firstLineStr.find("Value") != std::string::npos);
	    }
	}

	io::CSVReader<2, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>,
		      io::throw_on_overflow, io::single_and_empty_line_comment<'#'>>
	  csvConfigFile(mConfigurationFileName.c_str());

	if (hasHeader)
	  csvConfigFile.read_header(io::ignore_no_column, "Key", "Value");
	else
	  csvConfigFile.set_header("Key", "Value");

	std::string key, value;
	while (csvConfigFile.read_row(key, value))
	  {
	    if (boost::iequals(key, "targetYield"))
	      {
		// Yields are applied together after the whole file is read
		targetYield = parseDoubleSetting(key, value);
	      }
	    else
	      applySetting(configuration, key, value, minYield, maxYield);
	  }
      }
    catch (const io::error::base& e)
      {
	throw AnalyzerConfigurationException("AnalyzerConfigurationFileReader - cannot read " +
					     mConfigurationFileName + ": " + e.what());
      }

    configuration.setYields(minYield, maxYield, targetYield);

    return configuration;
  }

  void AnalyzerConfigurationFileReader::applySetting(AnalyzerConfiguration& configuration,
						     const std::string& key,
						     const std::string& value,
						     double& minYield,
						     double& maxYield)
  {
    if (boost::iequals(key, "minYield"))
      minYield = parseDoubleSetting(key, value);
    else if (boost::iequals(key, "maxYield"))
      maxYield = parseDoubleSetting(key, value);
    else if (boost::iequals(key, "minConfidentSamples"))
      configuration.setMinConfidentSamples(parseCountSetting(key, value));
    else if (boost::iequals(key, "headerScanLines"))
      configuration.setHeaderScanLines(parseCountSetting(key, value));
    else if (boost::iequals(key, "workerThreads"))
      configuration.setWorkerThreads(parseCountSetting(key, value));
    else if (boost::iequals(key, "maxReportedFailures"))
      configuration.setMaxReportedFailures(parseCountSetting(key, value));
    else if (boost::iequals(key, "duplicatePolicy"))
      {
	try
	  {
	    configuration.setDuplicateReportPolicy(parseDuplicateReportPolicy(value));
	  }
	catch (const std::invalid_argument& e)
	  {
	    throw AnalyzerConfigurationException(std::string("AnalyzerConfigurationFileReader - ") + e.what());
	  }
      }
    else
      throw AnalyzerConfigurationException("AnalyzerConfigurationFileReader - unknown configuration key: " + key);
  }
} // namespace mkc_measurement
