// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __STATISTICS_ENGINE_H
#define __STATISTICS_ENGINE_H 1

#include <cstddef>
#include <optional>
#include <vector>
#include "ItemStatistics.h"
#include "MeasurementRecord.h"

namespace mkc_measurement
{
  /**
   * @class StatisticsEngine
   * @brief Computes ItemStatistics from the records of a single item.
   *
   * compute() is a pure function of its input: the same records always give
   * the same statistics, and no other item is consulted.
   *
   * - mean and standard deviation come from Boost.Accumulators; the
   *   deviation is the population estimator, the same one the tolerance
   *   solver uses
   * - CPK = min(USL - mean, mean - LSL) / (3 * sd) with the limits of the
   *   most frequent tolerance triple (ties go to the smallest triple)
   * - CPK is undefined for fewer than two samples, a zero spread, or a
   *   degenerate specification band
   */
  class StatisticsEngine
  {
  public:
    static constexpr std::size_t kDefaultMinConfidentSamples = 30;

    explicit StatisticsEngine(std::size_t minConfidentSamples = kDefaultMinConfidentSamples)
      : mMinConfidentSamples(minConfidentSamples)
    {}

    ItemStatistics compute(const std::vector<MeasurementRecord>& records) const;

    std::size_t getMinConfidentSamples() const
    {
      return mMinConfidentSamples;
    }

    static std::optional<double> computeCpk(std::size_t sampleCount,
					    double mean,
					    double stdDev,
					    const ToleranceSpec& spec);

  private:
    std::size_t mMinConfidentSamples;
  };
} // namespace mkc_measurement

#endif // __STATISTICS_ENGINE_H
