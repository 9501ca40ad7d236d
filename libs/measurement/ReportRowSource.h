// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REPORT_ROW_SOURCE_H
#define __REPORT_ROW_SOURCE_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "RawReportRow.h"

namespace mkc_measurement
{
  using boost::posix_time::ptime;

  struct ReportSourceOptions
  {
    // Lines searched for the header row before a report is rejected
    std::size_t headerScanLines = 60;
    // Preamble lines searched for the measurement date
    std::size_t metadataScanLines = 20;
  };

  /**
   * @class ReportRowSource
   * @brief Lazy sequence of raw rows read from one report file.
   *
   * Concrete sources locate the measurement table when they are constructed
   * and throw MalformedReportError if there is none. Rows are then pulled one
   * at a time with readRow(). A RecordParseError thrown by readRow() affects
   * only that row; the source stays positioned after it and can be read on.
   */
  class ReportRowSource
  {
  public:
    explicit ReportRowSource(const std::string& fileName)
      : mFileName(fileName),
	mReportTimestamp()
    {}

    ReportRowSource(const ReportRowSource&) = delete;
    ReportRowSource& operator=(const ReportRowSource&) = delete;

    virtual ~ReportRowSource()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    // Measurement date found in the report metadata, if any
    const std::optional<ptime>& getReportTimestamp() const
    {
      return mReportTimestamp;
    }

    // Fills row with the next data row; returns false at the end of the table.
    virtual bool readRow(RawReportRow& row) = 0;

  protected:
    void setReportTimestamp(const ptime& timestamp)
    {
      mReportTimestamp = timestamp;
    }

  private:
    std::string mFileName;
    std::optional<ptime> mReportTimestamp;
  };
} // namespace mkc_measurement

#endif // __REPORT_ROW_SOURCE_H
