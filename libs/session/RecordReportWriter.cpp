// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "RecordReportWriter.h"
#include <boost/date_time/posix_time/posix_time.hpp>
#include "MeasurementException.h"
#include "StatisticsReportWriter.h"

namespace mkc_measurement
{
  namespace
  {
    std::string formatTimestamp(const std::optional<ptime>& timestamp)
    {
      if (!timestamp)
	return "";

      std::string text = boost::posix_time::to_iso_extended_string(*timestamp);
      std::string::size_type separator = text.find('T');
      if (separator != std::string::npos)
	text[separator] = ' ';

      return text;
    }
  }

  RecordReportWriter::RecordReportWriter(const std::string& fileName,
					 const std::vector<SessionStore::SeriesPtr>& snapshot,
					 bool onlyFailures)
    : mCsvFile(fileName),
      mOut(mCsvFile),
      mSnapshot(snapshot),
      mOnlyFailures(onlyFailures)
  {
    if (!mCsvFile)
      throw IOFailure("Cannot create record report " + fileName);
  }

  RecordReportWriter::RecordReportWriter(std::ostream& out,
					 const std::vector<SessionStore::SeriesPtr>& snapshot,
					 bool onlyFailures)
    : mCsvFile(),
      mOut(out),
      mSnapshot(snapshot),
      mOnlyFailures(onlyFailures)
  {}

  std::size_t RecordReportWriter::writeFile()
  {
    mOut << "File,Time,Index,Item,Measured,Design,Difference,Upper,Lower,Result\n";

    std::size_t numWritten = 0;
    for (const auto& series : mSnapshot)
      for (const auto& record : series->getRecords())
	{
	  if (mOnlyFailures && !record.isFailure())
	    continue;

	  writeRecord(record);
	  ++numWritten;
	}

    mOut.flush();
    if (!mOut)
      throw IOFailure("Error writing record report");

    return numWritten;
  }

  void RecordReportWriter::writeRecord(const MeasurementRecord& record)
  {
    mOut << quoteCsvField(record.getSourceFile()) << ','
	 << formatTimestamp(record.getTimestamp()) << ','
	 << quoteCsvField(record.getIndexLabel()) << ','
	 << quoteCsvField(record.getItemName()) << ','
	 << formatReportValue(record.getMeasuredValue(), 4) << ','
	 << formatReportValue(record.getDesignValue(), 4) << ','
	 << formatReportValue(record.getDifference(), 4) << ','
	 << formatReportValue(record.getUpperTolerance(), 4) << ','
	 << formatReportValue(record.getLowerTolerance(), 4) << ','
	 << toString(record.getResult()) << '\n';
  }
} // namespace mkc_measurement
