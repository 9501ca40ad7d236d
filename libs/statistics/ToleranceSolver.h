// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TOLERANCE_SOLVER_H
#define __TOLERANCE_SOLVER_H 1

#include <cstddef>
#include <optional>
#include "ItemStatistics.h"

namespace mkc_measurement
{
  struct ToleranceSolverOptions
  {
    double minYield = 0.80;
    double maxYield = 0.9973;
    std::size_t minConfidentSamples = 30;
  };

  //
  // class ToleranceSuggestion
  //
  // Symmetric band mean +/- suggestedTolerance expected to hold targetYield
  // of the population under a normal model.
  //

  class ToleranceSuggestion
  {
  public:
    ToleranceSuggestion(double targetYield,
			double zScore,
			double mean,
			double stdDev,
			std::size_t sampleCount,
			bool lowConfidence,
			const std::optional<double>& designValue,
			const std::optional<double>& currentSpecYield)
      : mTargetYield(targetYield),
	mZScore(zScore),
	mMean(mean),
	mStdDev(stdDev),
	mSampleCount(sampleCount),
	mLowConfidence(lowConfidence),
	mDesignValue(designValue),
	mCurrentSpecYield(currentSpecYield)
    {}

    double getTargetYield() const
    {
      return mTargetYield;
    }

    double getZScore() const
    {
      return mZScore;
    }

    double getSuggestedTolerance() const
    {
      return mZScore * mStdDev;
    }

    double getMean() const
    {
      return mMean;
    }

    double getStdDev() const
    {
      return mStdDev;
    }

    double getLowerBound() const
    {
      return mMean - getSuggestedTolerance();
    }

    double getUpperBound() const
    {
      return mMean + getSuggestedTolerance();
    }

    std::size_t getSampleCount() const
    {
      return mSampleCount;
    }

    bool isLowConfidence() const
    {
      return mLowConfidence;
    }

    // All samples identical: the band collapses onto the mean
    bool isZeroSpread() const
    {
      return mStdDev < 1e-9;
    }

    // mean - design; N/A without a tolerance spec
    std::optional<double> getDesignOffset() const
    {
      if (!mDesignValue)
	return std::nullopt;

      return mMean - *mDesignValue;
    }

    /**
     * Tolerance offsets relative to the design value that contain the
     * suggested band: z*sd + offset above and -(z*sd - offset) below.
     */
    std::optional<double> getRequiredUpperTolerance() const
    {
      std::optional<double> offset = getDesignOffset();
      if (!offset)
	return std::nullopt;

      return getSuggestedTolerance() + *offset;
    }

    std::optional<double> getRequiredLowerTolerance() const
    {
      std::optional<double> offset = getDesignOffset();
      if (!offset)
	return std::nullopt;

      return -(getSuggestedTolerance() - *offset);
    }

    // Predicted yield of the current USL/LSL under the same model
    const std::optional<double>& getCurrentSpecYield() const
    {
      return mCurrentSpecYield;
    }

  private:
    double mTargetYield;
    double mZScore;
    double mMean;
    double mStdDev;
    std::size_t mSampleCount;
    bool mLowConfidence;
    std::optional<double> mDesignValue;
    std::optional<double> mCurrentSpecYield;
  };

  /**
   * @class ToleranceSolver
   * @brief Reverse-solves the symmetric tolerance that achieves a target yield.
   *
   * Assumes the measured values of an item are normally distributed with the
   * mean and population standard deviation of its ItemStatistics. For a
   * two-sided yield Y the band is +/- z * sd around the mean where
   * z = Phi^-1(0.5 + Y / 2).
   *
   * The yield is checked against [minYield, maxYield] first
   * (InvalidParameterError), then the sample size (InsufficientDataError
   * below two evaluated samples). A small sample only sets the low
   * confidence flag.
   */
  class ToleranceSolver
  {
  public:
    explicit ToleranceSolver(const ToleranceSolverOptions& options = ToleranceSolverOptions());

    ToleranceSuggestion suggestTolerance(const ItemStatistics& statistics, double targetYield) const;

    // z for a two-sided yield inside the configured domain
    double computeZScore(double targetYield) const;

    // Phi((USL - mean) / sd) - Phi((LSL - mean) / sd); N/A without data or spec
    static std::optional<double> estimateYield(const ItemStatistics& statistics);

    const ToleranceSolverOptions& getOptions() const
    {
      return mOptions;
    }

  private:
    void validateYield(double targetYield) const;

  private:
    ToleranceSolverOptions mOptions;
  };
} // namespace mkc_measurement

#endif // __TOLERANCE_SOLVER_H
