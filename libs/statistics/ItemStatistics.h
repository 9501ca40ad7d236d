// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ITEM_STATISTICS_H
#define __ITEM_STATISTICS_H 1

#include <cstddef>
#include <optional>
#include "ToleranceSpec.h"

namespace mkc_measurement
{
  //
  // class SampleSummary
  //
  // Moments of the measured values of the evaluated records. The standard
  // deviation is the population deviation (divide by N).
  //

  class SampleSummary
  {
  public:
    SampleSummary(double mean, double stdDev, double minimum, double maximum)
      : mMean(mean),
	mStdDev(stdDev),
	mMinimum(minimum),
	mMaximum(maximum)
    {}

    double getMean() const
    {
      return mMean;
    }

    double getStdDev() const
    {
      return mStdDev;
    }

    double getMinimum() const
    {
      return mMinimum;
    }

    double getMaximum() const
    {
      return mMaximum;
    }

  private:
    double mMean;
    double mStdDev;
    double mMinimum;
    double mMaximum;
  };

  /**
   * @class ItemStatistics
   * @brief Statistics derived from all records of one item.
   *
   * Only evaluated records (design value != 0) enter the sample; records that
   * were not evaluated are counted separately. Every value that is undefined
   * for the sample at hand is an empty optional and is reported as N/A.
   */
  class ItemStatistics
  {
  public:
    // Statistics of an item without records
    ItemStatistics()
      : mSampleCount(0),
	mNgCount(0),
	mNotEvaluatedCount(0),
	mSummary(),
	mCpk(),
	mToleranceSpec(),
	mToleranceDivergence(false),
	mLowConfidence(true)
    {}

    ItemStatistics(std::size_t sampleCount,
		   std::size_t ngCount,
		   std::size_t notEvaluatedCount,
		   const std::optional<SampleSummary>& summary,
		   const std::optional<double>& cpk,
		   const std::optional<ToleranceSpec>& toleranceSpec,
		   bool toleranceDivergence,
		   bool lowConfidence)
      : mSampleCount(sampleCount),
	mNgCount(ngCount),
	mNotEvaluatedCount(notEvaluatedCount),
	mSummary(summary),
	mCpk(cpk),
	mToleranceSpec(toleranceSpec),
	mToleranceDivergence(toleranceDivergence),
	mLowConfidence(lowConfidence)
    {}

    std::size_t getSampleCount() const
    {
      return mSampleCount;
    }

    std::size_t getNgCount() const
    {
      return mNgCount;
    }

    std::size_t getNotEvaluatedCount() const
    {
      return mNotEvaluatedCount;
    }

    std::size_t getRecordCount() const
    {
      return mSampleCount + mNotEvaluatedCount;
    }

    // ngCount / sampleCount in [0, 1]
    std::optional<double> getFailRate() const
    {
      if (mSampleCount == 0)
	return std::nullopt;

      return static_cast<double>(mNgCount) / static_cast<double>(mSampleCount);
    }

    std::optional<double> getMean() const
    {
      if (!mSummary)
	return std::nullopt;

      return mSummary->getMean();
    }

    std::optional<double> getStdDev() const
    {
      if (!mSummary)
	return std::nullopt;

      return mSummary->getStdDev();
    }

    std::optional<double> getMinimum() const
    {
      if (!mSummary)
	return std::nullopt;

      return mSummary->getMinimum();
    }

    std::optional<double> getMaximum() const
    {
      if (!mSummary)
	return std::nullopt;

      return mSummary->getMaximum();
    }

    const std::optional<SampleSummary>& getSummary() const
    {
      return mSummary;
    }

    const std::optional<double>& getCpk() const
    {
      return mCpk;
    }

    // Most frequent tolerance triple among the evaluated records
    const std::optional<ToleranceSpec>& getToleranceSpec() const
    {
      return mToleranceSpec;
    }

    bool hasToleranceDivergence() const
    {
      return mToleranceDivergence;
    }

    bool isLowConfidence() const
    {
      return mLowConfidence;
    }

  private:
    std::size_t mSampleCount;
    std::size_t mNgCount;
    std::size_t mNotEvaluatedCount;
    std::optional<SampleSummary> mSummary;
    std::optional<double> mCpk;
    std::optional<ToleranceSpec> mToleranceSpec;
    bool mToleranceDivergence;
    bool mLowConfidence;
  };
} // namespace mkc_measurement

#endif // __ITEM_STATISTICS_H
