// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "MeasurementRecord.h"

namespace mkc_measurement
{
  InspectionResult classifyMeasurement(double measuredValue,
				       double designValue,
				       double upperTolerance,
				       double lowerTolerance)
  {
    if (designValue == 0.0)
      return InspectionResult::NotEvaluated;

    const double lowerLimit = designValue + lowerTolerance;
    const double upperLimit = designValue + upperTolerance;

    if (measuredValue < lowerLimit || measuredValue > upperLimit)
      return InspectionResult::Fail;

    return InspectionResult::Pass;
  }

  std::string toString(InspectionResult result)
  {
    switch (result)
      {
      case InspectionResult::Pass:
	return "OK";
      case InspectionResult::Fail:
	return "FAIL";
      case InspectionResult::NotEvaluated:
	return "---";
      }

    return "---";
  }

  MeasurementRecord::MeasurementRecord(const std::string& itemName,
				       int chipIndex,
				       const std::string& indexLabel,
				       double measuredValue,
				       double designValue,
				       double upperTolerance,
				       double lowerTolerance,
				       const std::optional<ptime>& timestamp,
				       BatchId sourceBatchId,
				       const std::string& sourceFile,
				       const std::optional<std::string>& unit,
				       const std::optional<std::string>& instrumentJudgement)
    : mItemName(itemName),
      mChipIndex(chipIndex),
      mIndexLabel(indexLabel),
      mMeasuredValue(measuredValue),
      mDesignValue(designValue),
      mUpperTolerance(upperTolerance),
      mLowerTolerance(lowerTolerance),
      mTimestamp(timestamp),
      mSourceBatchId(sourceBatchId),
      mSourceFile(sourceFile),
      mUnit(unit),
      mInstrumentJudgement(instrumentJudgement),
      mResult(classifyMeasurement(measuredValue, designValue,
				  upperTolerance, lowerTolerance))
  {}
} // namespace mkc_measurement
