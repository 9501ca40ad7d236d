// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MEASUREMENT_RECORD_H
#define __MEASUREMENT_RECORD_H 1

#include <cstdint>
#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_measurement
{
  using boost::posix_time::ptime;

  typedef std::uint64_t BatchId;

  enum class InspectionResult
    {
      Pass,
      Fail,
      NotEvaluated
    };

  /**
   * @brief Classifies one measurement against its tolerance band.
   *
   * NotEvaluated when designValue is exactly zero (the instrument's marker
   * for "no tolerance check"), otherwise Pass iff
   * designValue + lowerTolerance <= measuredValue <= designValue + upperTolerance.
   */
  InspectionResult classifyMeasurement(double measuredValue,
				       double designValue,
				       double upperTolerance,
				       double lowerTolerance);

  // "OK", "FAIL" or "---", the labels used in exported tables
  std::string toString(InspectionResult result);

  //
  // class MeasurementRecord
  //
  // One inspected characteristic of one unit. The result is fixed at
  // construction and never recomputed.
  //

  class MeasurementRecord
  {
  public:
    MeasurementRecord(const std::string& itemName,
		      int chipIndex,
		      const std::string& indexLabel,
		      double measuredValue,
		      double designValue,
		      double upperTolerance,
		      double lowerTolerance,
		      const std::optional<ptime>& timestamp,
		      BatchId sourceBatchId,
		      const std::string& sourceFile,
		      const std::optional<std::string>& unit = std::nullopt,
		      const std::optional<std::string>& instrumentJudgement = std::nullopt);

    MeasurementRecord(const MeasurementRecord& rhs) = default;
    MeasurementRecord(MeasurementRecord&& rhs) noexcept = default;
    MeasurementRecord& operator=(const MeasurementRecord& rhs) = default;
    MeasurementRecord& operator=(MeasurementRecord&& rhs) noexcept = default;

    ~MeasurementRecord() = default;

    const std::string& getItemName() const
    {
      return mItemName;
    }

    int getChipIndex() const
    {
      return mChipIndex;
    }

    const std::string& getIndexLabel() const
    {
      return mIndexLabel;
    }

    double getMeasuredValue() const
    {
      return mMeasuredValue;
    }

    double getDesignValue() const
    {
      return mDesignValue;
    }

    double getUpperTolerance() const
    {
      return mUpperTolerance;
    }

    double getLowerTolerance() const
    {
      return mLowerTolerance;
    }

    double getUpperSpecLimit() const
    {
      return mDesignValue + mUpperTolerance;
    }

    double getLowerSpecLimit() const
    {
      return mDesignValue + mLowerTolerance;
    }

    double getDifference() const
    {
      return mMeasuredValue - mDesignValue;
    }

    const std::optional<ptime>& getTimestamp() const
    {
      return mTimestamp;
    }

    BatchId getSourceBatchId() const
    {
      return mSourceBatchId;
    }

    const std::string& getSourceFile() const
    {
      return mSourceFile;
    }

    const std::optional<std::string>& getUnit() const
    {
      return mUnit;
    }

    const std::optional<std::string>& getInstrumentJudgement() const
    {
      return mInstrumentJudgement;
    }

    InspectionResult getResult() const
    {
      return mResult;
    }

    bool isEvaluated() const
    {
      return mResult != InspectionResult::NotEvaluated;
    }

    bool isFailure() const
    {
      return mResult == InspectionResult::Fail;
    }

  private:
    std::string mItemName;
    int mChipIndex;
    std::string mIndexLabel;
    double mMeasuredValue;
    double mDesignValue;
    double mUpperTolerance;
    double mLowerTolerance;
    std::optional<ptime> mTimestamp;
    BatchId mSourceBatchId;
    std::string mSourceFile;
    std::optional<std::string> mUnit;
    std::optional<std::string> mInstrumentJudgement;
    InspectionResult mResult;
  };
} // namespace mkc_measurement

#endif // __MEASUREMENT_RECORD_H
