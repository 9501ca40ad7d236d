// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __RECORD_NORMALIZER_H
#define __RECORD_NORMALIZER_H 1

#include <optional>
#include <string>
#include "MeasurementRecord.h"
#include "RawReportRow.h"

namespace mkc_measurement
{
  //
  // class ReportContext
  //
  // What the normalizer knows about the file a row came from.
  //

  class ReportContext
  {
  public:
    ReportContext(const std::string& sourcePath,
		  BatchId batchId,
		  const std::optional<ptime>& reportTimestamp = std::nullopt)
      : mSourcePath(sourcePath),
	mBatchId(batchId),
	mReportTimestamp(reportTimestamp)
    {}

    const std::string& getSourcePath() const
    {
      return mSourcePath;
    }

    BatchId getBatchId() const
    {
      return mBatchId;
    }

    const std::optional<ptime>& getReportTimestamp() const
    {
      return mReportTimestamp;
    }

  private:
    std::string mSourcePath;
    BatchId mBatchId;
    std::optional<ptime> mReportTimestamp;
  };

  /**
   * @class RecordNormalizer
   * @brief Converts raw report rows of one file into MeasurementRecords.
   *
   * One normalizer is used per file: rows whose index cell is not an integer
   * take their chip index from the row's ordinal within the file.
   *
   * Timestamps resolve in this order: the row's own timestamp cell, the
   * date from the report metadata, a date-time embedded in the file name.
   * Without any of them the record has no timestamp and arrival order is
   * its ordering key.
   *
   * normalize() throws RecordParseError for a bad row and leaves the
   * normalizer usable for the following rows.
   */
  class RecordNormalizer
  {
  public:
    explicit RecordNormalizer(const ReportContext& context);

    MeasurementRecord normalize(const RawReportRow& row);

    const std::optional<ptime>& getFileTimestamp() const
    {
      return mFileTimestamp;
    }

    // Strict numeric grammar: the whole trimmed cell must be a finite number.
    static double parseNumber(const std::string& text, ReportField field, unsigned int lineNumber);

  private:
    static std::string requireField(const RawReportRow& row, ReportField field);

  private:
    ReportContext mContext;
    std::optional<ptime> mFileTimestamp;
    int mRowOrdinal;
  };
} // namespace mkc_measurement

#endif // __RECORD_NORMALIZER_H
