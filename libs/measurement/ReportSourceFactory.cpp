// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ReportSourceFactory.h"
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "DelimitedReportSource.h"
#include "MeasurementException.h"
#include "PdfReportSource.h"

namespace mkc_measurement
{
  ReportFormat ReportSourceFactory::getReportFormat(const std::string& fileName)
  {
    const std::string extension =
      boost::to_lower_copy(boost::filesystem::path(fileName).extension().string());

    if (extension == ".csv" || extension == ".txt")
      return ReportFormat::Delimited;
    else if (extension == ".pdf")
      return ReportFormat::Pdf;
    else
      return ReportFormat::Unsupported;
  }

  std::unique_ptr<ReportRowSource>
  ReportSourceFactory::createReportSource(const std::string& fileName,
					  const ReportSourceOptions& options)
  {
    switch (getReportFormat(fileName))
      {
      case ReportFormat::Delimited:
	return std::make_unique<DelimitedReportSource>(fileName, options);
      case ReportFormat::Pdf:
	return std::make_unique<PdfReportSource>(fileName, options);
      case ReportFormat::Unsupported:
	break;
      }

    throw MalformedReportError("unsupported report format: " + fileName);
  }
} // namespace mkc_measurement
