#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "MeasurementException.h"
#include "StatisticsEngine.h"
#include "ToleranceSolver.h"

using namespace mkc_measurement;
using Catch::Approx;

namespace
{
  ItemStatistics computeStatistics(const std::vector<double>& values,
				   double design = 100.0,
				   double upper = 5.0,
				   double lower = -5.0)
  {
    std::vector<MeasurementRecord> records;
    int chip = 0;
    for (double value : values)
      {
	++chip;
	records.push_back(MeasurementRecord("Gap-A", chip, std::to_string(chip),
					    value, design, upper, lower,
					    std::nullopt, 1, "gap.csv"));
      }

    return StatisticsEngine().compute(records);
  }

  // Population standard deviation is exactly sigma
  std::vector<double> createSymmetricSample(double mean, double sigma, int pairs)
  {
    std::vector<double> values;
    for (int i = 0; i < pairs; ++i)
      {
	values.push_back(mean - sigma);
	values.push_back(mean + sigma);
      }

    return values;
  }
}

TEST_CASE("ToleranceSolver round trip on a known sigma", "[ToleranceSolver]")
{
  ToleranceSolver solver;
  const double sigma = 0.5;
  ItemStatistics stats = computeStatistics(createSymmetricSample(100.0, sigma, 20));

  REQUIRE(*stats.getStdDev() == Approx(sigma));

  SECTION("Yield 0.80")
  {
    ToleranceSuggestion suggestion = solver.suggestTolerance(stats, 0.80);

    REQUIRE(suggestion.getZScore() == Approx(1.281552).margin(1e-5));
    REQUIRE(suggestion.getSuggestedTolerance() == Approx(1.281552 * sigma).margin(1e-3));
  }

  SECTION("Yield 0.90")
  {
    ToleranceSuggestion suggestion = solver.suggestTolerance(stats, 0.90);

    REQUIRE(suggestion.getSuggestedTolerance() == Approx(1.644854 * sigma).margin(1e-3));
  }

  SECTION("Yield 0.9973")
  {
    ToleranceSuggestion suggestion = solver.suggestTolerance(stats, 0.9973);

    REQUIRE(suggestion.getSuggestedTolerance() == Approx(3.0 * sigma).margin(1e-3));
  }

  SECTION("Band is centered on the mean")
  {
    ToleranceSuggestion suggestion = solver.suggestTolerance(stats, 0.90);

    REQUIRE(suggestion.getMean() == Approx(100.0));
    REQUIRE(suggestion.getLowerBound() == Approx(100.0 - suggestion.getSuggestedTolerance()));
    REQUIRE(suggestion.getUpperBound() == Approx(100.0 + suggestion.getSuggestedTolerance()));
    REQUIRE(suggestion.getSampleCount() == 40u);
    REQUIRE_FALSE(suggestion.isLowConfidence());
    REQUIRE_FALSE(suggestion.isZeroSpread());
  }
}

TEST_CASE("ToleranceSolver yield domain", "[ToleranceSolver]")
{
  ToleranceSolver solver;
  ItemStatistics stats = computeStatistics({ 98, 99, 100, 101, 102, 103, 97, 100, 100, 104 });

  REQUIRE_THROWS_AS(solver.suggestTolerance(stats, 0.5), InvalidParameterError);
  REQUIRE_THROWS_AS(solver.suggestTolerance(stats, 0.79), InvalidParameterError);
  REQUIRE_THROWS_AS(solver.suggestTolerance(stats, 0.9999), InvalidParameterError);
  REQUIRE_THROWS_AS(solver.suggestTolerance(stats, 1.5), InvalidParameterError);
  REQUIRE_NOTHROW(solver.suggestTolerance(stats, 0.80));
  REQUIRE_NOTHROW(solver.suggestTolerance(stats, 0.9973));
}

TEST_CASE("ToleranceSolver sample size", "[ToleranceSolver]")
{
  ToleranceSolver solver;

  SECTION("Fewer than two samples")
  {
    REQUIRE_THROWS_AS(solver.suggestTolerance(computeStatistics({}), 0.9), InsufficientDataError);
    REQUIRE_THROWS_AS(solver.suggestTolerance(computeStatistics({ 100.0 }), 0.9), InsufficientDataError);
    REQUIRE_THROWS_AS(solver.suggestTolerance(computeStatistics({ 1.0, 2.0 }, 0.0), 0.9),
		      InsufficientDataError);
  }

  SECTION("The yield is validated first")
  {
    REQUIRE_THROWS_AS(solver.suggestTolerance(computeStatistics({ 100.0 }), 0.5), InvalidParameterError);
  }

  SECTION("Small samples are flagged, not refused")
  {
    ToleranceSuggestion suggestion = solver.suggestTolerance(computeStatistics({ 99.0, 101.0 }), 0.9);

    REQUIRE(suggestion.isLowConfidence());
    REQUIRE(suggestion.getSuggestedTolerance() == Approx(1.644854).margin(1e-5));
  }

  SECTION("Configurable confidence threshold")
  {
    ToleranceSolverOptions options;
    options.minConfidentSamples = 2;
    ToleranceSolver lenient(options);

    REQUIRE_FALSE(lenient.suggestTolerance(computeStatistics({ 99.0, 101.0 }), 0.9).isLowConfidence());
  }
}

TEST_CASE("ToleranceSolver zero spread", "[ToleranceSolver]")
{
  ToleranceSolver solver;
  ToleranceSuggestion suggestion = solver.suggestTolerance(computeStatistics({ 100.0, 100.0, 100.0 }), 0.9);

  REQUIRE(suggestion.isZeroSpread());
  REQUIRE(suggestion.getSuggestedTolerance() == Approx(0.0).margin(1e-12));
  REQUIRE(suggestion.getLowerBound() == Approx(100.0));
  REQUIRE(suggestion.getUpperBound() == Approx(100.0));
  REQUIRE(*suggestion.getCurrentSpecYield() == Approx(1.0));
}

TEST_CASE("ToleranceSolver tolerances relative to the design value", "[ToleranceSolver]")
{
  ToleranceSolver solver;
  ItemStatistics stats = computeStatistics({ 98, 99, 100, 101, 102, 103, 97, 100, 100, 104 });
  ToleranceSuggestion suggestion = solver.suggestTolerance(stats, 0.9);

  REQUIRE(suggestion.getSuggestedTolerance() == Approx(3.38696).margin(1e-4));
  REQUIRE(*suggestion.getDesignOffset() == Approx(0.4));
  REQUIRE(*suggestion.getRequiredUpperTolerance() == Approx(3.78696).margin(1e-4));
  REQUIRE(*suggestion.getRequiredLowerTolerance() == Approx(-2.98696).margin(1e-4));
  REQUIRE(*suggestion.getCurrentSpecYield() == Approx(0.98289).margin(1e-4));
  REQUIRE(suggestion.isLowConfidence());
}

TEST_CASE("ToleranceSolver estimateYield", "[ToleranceSolver]")
{
  SECTION("Limits three sigma from the mean")
  {
    ItemStatistics stats = computeStatistics(createSymmetricSample(100.0, 1.0, 10), 100.0, 3.0, -3.0);

    REQUIRE(*ToleranceSolver::estimateYield(stats) == Approx(0.9973).margin(1e-4));
  }

  SECTION("Zero spread outside the band")
  {
    ItemStatistics stats = computeStatistics({ 110.0, 110.0 });

    REQUIRE(*ToleranceSolver::estimateYield(stats) == Approx(0.0));
  }

  SECTION("No samples")
  {
    REQUIRE_FALSE(ToleranceSolver::estimateYield(computeStatistics({})).has_value());
  }
}

TEST_CASE("ToleranceSolver options", "[ToleranceSolver]")
{
  ToleranceSolverOptions options;
  options.minYield = 0.5;
  options.maxYield = 0.99;
  ToleranceSolver wide(options);

  REQUIRE(wide.computeZScore(0.5) == Approx(0.674490).margin(1e-5));
  REQUIRE_THROWS_AS(wide.computeZScore(0.995), InvalidParameterError);

  ToleranceSolverOptions inverted;
  inverted.minYield = 0.95;
  inverted.maxYield = 0.90;
  REQUIRE_THROWS_AS(ToleranceSolver(inverted), InvalidParameterError);

  ToleranceSolverOptions outside;
  outside.maxYield = 1.0;
  REQUIRE_THROWS_AS(ToleranceSolver(outside), InvalidParameterError);
}
