// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ToleranceSolver.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <boost/lexical_cast.hpp>
#include "MeasurementException.h"
#include "NormalQuantile.h"

namespace mkc_measurement
{
  namespace
  {
    const double kZeroSpreadEpsilon = 1e-9;

    std::string formatYield(double yield)
    {
      return boost::lexical_cast<std::string>(yield);
    }
  }

  ToleranceSolver::ToleranceSolver(const ToleranceSolverOptions& options)
    : mOptions(options)
  {
    if (!(options.minYield > 0.0) || !(options.maxYield < 1.0) ||
	!(options.minYield <= options.maxYield))
      throw InvalidParameterError("ToleranceSolver: yield domain [" + formatYield(options.minYield) +
				  ", " + formatYield(options.maxYield) + "] is not inside (0, 1)");
  }

  ToleranceSuggestion ToleranceSolver::suggestTolerance(const ItemStatistics& statistics,
							double targetYield) const
  {
    const double zScore = computeZScore(targetYield);

    if (statistics.getSampleCount() < 2 || !statistics.getSummary())
      throw InsufficientDataError("ToleranceSolver: at least 2 evaluated samples are required, found " +
				  std::to_string(statistics.getSampleCount()));

    const SampleSummary& summary = *statistics.getSummary();

    std::optional<double> designValue;
    if (statistics.getToleranceSpec())
      designValue = statistics.getToleranceSpec()->getDesignValue();

    return ToleranceSuggestion(targetYield,
			       zScore,
			       summary.getMean(),
			       summary.getStdDev(),
			       statistics.getSampleCount(),
			       statistics.getSampleCount() < mOptions.minConfidentSamples,
			       designValue,
			       estimateYield(statistics));
  }

  double ToleranceSolver::computeZScore(double targetYield) const
  {
    validateYield(targetYield);
    return detail::compute_normal_critical_value(targetYield);
  }

  std::optional<double> ToleranceSolver::estimateYield(const ItemStatistics& statistics)
  {
    if (!statistics.getSummary() || !statistics.getToleranceSpec())
      return std::nullopt;

    const double mean = statistics.getSummary()->getMean();
    const double stdDev = statistics.getSummary()->getStdDev();
    const ToleranceSpec& spec = *statistics.getToleranceSpec();

    if (stdDev < kZeroSpreadEpsilon)
      {
	const bool inside = mean >= spec.getLowerSpecLimit() && mean <= spec.getUpperSpecLimit();
	return inside ? 1.0 : 0.0;
      }

    const double yield = detail::compute_normal_cdf((spec.getUpperSpecLimit() - mean) / stdDev) -
      detail::compute_normal_cdf((spec.getLowerSpecLimit() - mean) / stdDev);

    return std::max(0.0, yield);
  }

  void ToleranceSolver::validateYield(double targetYield) const
  {
    if (!(targetYield >= mOptions.minYield && targetYield <= mOptions.maxYield))
      throw InvalidParameterError("Target yield " + formatYield(targetYield) +
				  " is outside [" + formatYield(mOptions.minYield) + ", " +
				  formatYield(mOptions.maxYield) + "]");
  }
} // namespace mkc_measurement
