// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "StatisticsEngine.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/variance.hpp>

namespace mkc_measurement
{
  namespace
  {
    using namespace boost::accumulators;

    typedef accumulator_set<double,
			    stats<tag::count,
				  tag::mean,
				  tag::variance,
				  tag::min,
				  tag::max>> MeasurementAccumulator;

    // Below this a spread or a specification width counts as zero
    const double kDegenerateEpsilon = 1e-9;
  }

  ItemStatistics StatisticsEngine::compute(const std::vector<MeasurementRecord>& records) const
  {
    MeasurementAccumulator accumulator;
    std::map<ToleranceSpec, std::size_t> tolerances;
    std::size_t ngCount = 0;
    std::size_t notEvaluatedCount = 0;

    for (const auto& record : records)
      {
	if (!record.isEvaluated())
	  {
	    ++notEvaluatedCount;
	    continue;
	  }

	accumulator(record.getMeasuredValue());
	if (record.isFailure())
	  ++ngCount;

	++tolerances[ToleranceSpec(record.getDesignValue(),
				   record.getUpperTolerance(),
				   record.getLowerTolerance())];
      }

    const std::size_t sampleCount = boost::accumulators::count(accumulator);
    const bool lowConfidence = sampleCount < mMinConfidentSamples;

    if (sampleCount == 0)
      return ItemStatistics(0, 0, notEvaluatedCount, std::nullopt, std::nullopt,
			    std::nullopt, false, lowConfidence);

    const double stdDev = std::sqrt(std::max(0.0, variance(accumulator)));
    SampleSummary summary(mean(accumulator), stdDev,
			  (min)(accumulator), (max)(accumulator));

    // First maximum in key order, so ties go to the smallest triple
    auto representative = std::max_element(tolerances.begin(), tolerances.end(),
					   [](const auto& lhs, const auto& rhs) {
					     return lhs.second < rhs.second;
					   });
    const ToleranceSpec& spec = representative->first;

    return ItemStatistics(sampleCount,
			  ngCount,
			  notEvaluatedCount,
			  summary,
			  computeCpk(sampleCount, summary.getMean(), summary.getStdDev(), spec),
			  spec,
			  tolerances.size() > 1,
			  lowConfidence);
  }

  std::optional<double> StatisticsEngine::computeCpk(std::size_t sampleCount,
						     double mean,
						     double stdDev,
						     const ToleranceSpec& spec)
  {
    if (sampleCount < 2 || stdDev < kDegenerateEpsilon ||
	std::fabs(spec.getSpecWidth()) < kDegenerateEpsilon)
      return std::nullopt;

    const double upperCapability = (spec.getUpperSpecLimit() - mean) / (3.0 * stdDev);
    const double lowerCapability = (mean - spec.getLowerSpecLimit()) / (3.0 * stdDev);

    return std::min(upperCapability, lowerCapability);
  }
} // namespace mkc_measurement
