#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fstream>
#include <boost/filesystem.hpp>
#include "AnalyzerConfiguration.h"

using namespace mkc_measurement;
using Catch::Approx;

namespace
{
  std::string writeConfigFile(const std::string& contents)
  {
    boost::filesystem::path path = boost::filesystem::temp_directory_path() /
      boost::filesystem::unique_path("analyzer-config-%%%%-%%%%.csv");

    std::ofstream out(path.string());
    out << contents;
    return path.string();
  }

  AnalyzerConfiguration readConfig(const std::string& contents)
  {
    std::string fileName = writeConfigFile(contents);
    try
      {
	AnalyzerConfiguration configuration = AnalyzerConfigurationFileReader(fileName).readConfigurationFile();
	boost::filesystem::remove(fileName);
	return configuration;
      }
    catch (const AnalyzerConfigurationException&)
      {
	boost::filesystem::remove(fileName);
	throw;
      }
  }
}

TEST_CASE("AnalyzerConfiguration defaults", "[AnalyzerConfiguration]")
{
  AnalyzerConfiguration configuration;

  REQUIRE(configuration.getTargetYield() == Approx(0.90));
  REQUIRE(configuration.getMinYield() == Approx(0.80));
  REQUIRE(configuration.getMaxYield() == Approx(0.9973));
  REQUIRE(configuration.getMinConfidentSamples() == 30u);
  REQUIRE(configuration.getHeaderScanLines() == 60u);
  REQUIRE(configuration.getWorkerThreads() == 0u);
  REQUIRE(configuration.getMaxReportedFailures() == 50u);
  REQUIRE(configuration.getDuplicateReportPolicy() == DuplicateReportPolicy::PreferCsv);

  ToleranceSolverOptions solverOptions = configuration.getToleranceSolverOptions();
  REQUIRE(solverOptions.minYield == Approx(0.80));
  REQUIRE(solverOptions.maxYield == Approx(0.9973));
  REQUIRE(solverOptions.minConfidentSamples == 30u);
  REQUIRE(configuration.getReportSourceOptions().headerScanLines == 60u);
}

TEST_CASE("AnalyzerConfiguration setters validate", "[AnalyzerConfiguration]")
{
  AnalyzerConfiguration configuration;

  configuration.setTargetYield(0.95);
  REQUIRE(configuration.getTargetYield() == Approx(0.95));

  REQUIRE_THROWS_AS(configuration.setTargetYield(0.5), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(configuration.setTargetYield(0.999), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(configuration.setYields(0.9, 0.8, 0.85), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(configuration.setYields(0.8, 1.0, 0.9), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(configuration.setYields(0.8, 0.99, 0.995), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(configuration.setMinConfidentSamples(1), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(configuration.setHeaderScanLines(0), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(configuration.setWorkerThreads(AnalyzerConfiguration::kMaxWorkerThreads + 1),
		    AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(configuration.setWorkerThreads(static_cast<std::size_t>(-1)),
		    AnalyzerConfigurationException);

  configuration.setWorkerThreads(AnalyzerConfiguration::kMaxWorkerThreads);
  REQUIRE(configuration.getWorkerThreads() == AnalyzerConfiguration::kMaxWorkerThreads);

  // A rejected value leaves the configuration unchanged
  REQUIRE(configuration.getTargetYield() == Approx(0.95));
  REQUIRE(configuration.getMaxYield() == Approx(0.9973));
}

TEST_CASE("AnalyzerConfigurationFileReader reads settings", "[AnalyzerConfiguration]")
{
  SECTION("With header")
  {
    AnalyzerConfiguration configuration =
      readConfig("Key,Value\n"
		 "targetYield,0.95\n"
		 "minYield,0.85\n"
		 "maxYield,0.99\n"
		 "minConfidentSamples,50\n"
		 "headerScanLines,80\n"
		 "workerThreads,4\n"
		 "maxReportedFailures,10\n"
		 "duplicatePolicy,PreferPdf\n");

    REQUIRE(configuration.getTargetYield() == Approx(0.95));
    REQUIRE(configuration.getMinYield() == Approx(0.85));
    REQUIRE(configuration.getMaxYield() == Approx(0.99));
    REQUIRE(configuration.getMinConfidentSamples() == 50u);
    REQUIRE(configuration.getHeaderScanLines() == 80u);
    REQUIRE(configuration.getWorkerThreads() == 4u);
    REQUIRE(configuration.getMaxReportedFailures() == 10u);
    REQUIRE(configuration.getDuplicateReportPolicy() == DuplicateReportPolicy::PreferPdf);
  }

  SECTION("Without header, comments and blank lines")
  {
    AnalyzerConfiguration configuration =
      readConfig("# yield used for the report\n"
		 "targetYield, 0.9973\n"
		 "\n"
		 "workerThreads,1\n");

    REQUIRE(configuration.getTargetYield() == Approx(0.9973));
    REQUIRE(configuration.getWorkerThreads() == 1u);
    REQUIRE(configuration.getMinConfidentSamples() == 30u);
  }

  SECTION("Target read before a narrower range")
  {
    AnalyzerConfiguration configuration =
      readConfig("targetYield,0.97\n"
		 "minYield,0.95\n");

    REQUIRE(configuration.getTargetYield() == Approx(0.97));
    REQUIRE(configuration.getMinYield() == Approx(0.95));
  }
}

TEST_CASE("AnalyzerConfigurationFileReader rejects bad input", "[AnalyzerConfiguration]")
{
  REQUIRE_THROWS_AS(readConfig("colour,blue\n"), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(readConfig("targetYield,high\n"), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(readConfig("targetYield,0.5\n"), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(readConfig("workerThreads,-2\n"), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(readConfig("workerThreads,100000\n"), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(readConfig("duplicatePolicy,Newest\n"), AnalyzerConfigurationException);
  REQUIRE_THROWS_AS(readConfig("targetYield\n"), AnalyzerConfigurationException);

  boost::filesystem::path missing = boost::filesystem::temp_directory_path() /
    boost::filesystem::unique_path("missing-config-%%%%-%%%%.csv");
  REQUIRE_THROWS_AS(AnalyzerConfigurationFileReader(missing.string()).readConfigurationFile(),
		    AnalyzerConfigurationException);
}
