// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REPORT_SOURCE_FACTORY_H
#define __REPORT_SOURCE_FACTORY_H 1

#include <memory>
#include <string>
#include "ReportRowSource.h"

namespace mkc_measurement
{
  enum class ReportFormat
    {
      Delimited,
      Pdf,
      Unsupported
    };

  class ReportSourceFactory
  {
  public:
    // Format from the file extension, case-insensitive
    static ReportFormat getReportFormat(const std::string& fileName);

    static bool isSupportedReport(const std::string& fileName)
    {
      return getReportFormat(fileName) != ReportFormat::Unsupported;
    }

    /**
     * @brief Opens a report and locates its measurement table.
     *
     * @throws MalformedReportError for unsupported extensions or when no
     *         header is found.
     * @throws IOFailure when the file cannot be read.
     */
    static std::unique_ptr<ReportRowSource>
    createReportSource(const std::string& fileName,
		       const ReportSourceOptions& options = ReportSourceOptions());
  };
} // namespace mkc_measurement

#endif // __REPORT_SOURCE_FACTORY_H
