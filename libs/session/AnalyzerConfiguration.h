// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ANALYZER_CONFIGURATION_H
#define __ANALYZER_CONFIGURATION_H 1

#include <cstddef>
#include <stdexcept>
#include <string>
#include "BatchImporter.h"
#include "ReportRowSource.h"
#include "ToleranceSolver.h"

namespace mkc_measurement
{
  class AnalyzerConfigurationException : public std::runtime_error
  {
  public:
  AnalyzerConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~AnalyzerConfigurationException()
      {}
  };

  /**
   * @class AnalyzerConfiguration
   * @brief Tunable settings of a measurement analysis session.
   *
   * Setters validate their argument and throw AnalyzerConfigurationException
   * for values outside the accepted range.
   */
  class AnalyzerConfiguration
  {
  public:
    static constexpr std::size_t kMaxWorkerThreads = 256;

    AnalyzerConfiguration();

    double getTargetYield() const
    {
      return mTargetYield;
    }

    double getMinYield() const
    {
      return mMinYield;
    }

    double getMaxYield() const
    {
      return mMaxYield;
    }

    std::size_t getMinConfidentSamples() const
    {
      return mMinConfidentSamples;
    }

    std::size_t getHeaderScanLines() const
    {
      return mHeaderScanLines;
    }

    // 0 means one worker per hardware thread
    std::size_t getWorkerThreads() const
    {
      return mWorkerThreads;
    }

    std::size_t getMaxReportedFailures() const
    {
      return mMaxReportedFailures;
    }

    DuplicateReportPolicy getDuplicateReportPolicy() const
    {
      return mDuplicatePolicy;
    }

    // Target must lie inside the current yield range
    void setTargetYield(double targetYield);

    // Replaces the yield range and the target yield together
    void setYields(double minYield, double maxYield, double targetYield);
    void setMinConfidentSamples(std::size_t minConfidentSamples);
    void setHeaderScanLines(std::size_t headerScanLines);
    void setWorkerThreads(std::size_t workerThreads);
    void setMaxReportedFailures(std::size_t maxReportedFailures);
    void setDuplicateReportPolicy(DuplicateReportPolicy policy);

    ToleranceSolverOptions getToleranceSolverOptions() const;
    ReportSourceOptions getReportSourceOptions() const;

  private:
    double mTargetYield;
    double mMinYield;
    double mMaxYield;
    std::size_t mMinConfidentSamples;
    std::size_t mHeaderScanLines;
    std::size_t mWorkerThreads;
    std::size_t mMaxReportedFailures;
    DuplicateReportPolicy mDuplicatePolicy;
  };

  /**
   * @class AnalyzerConfigurationFileReader
   * @brief Reads an AnalyzerConfiguration from a two column Key,Value CSV file.
   *
   * An optional "Key,Value" header line is accepted. Keys not present in the
   * file keep their default value.
   */
  class AnalyzerConfigurationFileReader
  {
  public:
    explicit AnalyzerConfigurationFileReader(const std::string& configurationFileName);

    AnalyzerConfiguration readConfigurationFile() const;

  private:
    static void applySetting(AnalyzerConfiguration& configuration,
			     const std::string& key,
			     const std::string& value,
			     double& minYield,
			     double& maxYield);

  private:
    std::string mConfigurationFileName;
  };
} // namespace mkc_measurement

#endif // __ANALYZER_CONFIGURATION_H
