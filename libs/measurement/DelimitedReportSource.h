// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __DELIMITED_REPORT_SOURCE_H
#define __DELIMITED_REPORT_SOURCE_H 1

#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "ReportRowSource.h"
#include "ReportFieldResolver.h"

namespace io
{
  class LineReader;
}

namespace mkc_measurement
{
  //
  // class DelimitedReportSource
  //
  // Reads comma, tab or semicolon separated instrument exports. Lines above
  // the header row are instrument metadata; the delimiter is whichever one
  // makes the header row resolve.
  //

  class DelimitedReportSource : public ReportRowSource
  {
  public:
    DelimitedReportSource(const std::string& fileName,
			  const ReportSourceOptions& options = ReportSourceOptions(),
			  const ReportFieldResolver& resolver = ReportFieldResolver());

    // Reads the report text from in; fileName is used for messages only.
    DelimitedReportSource(const std::string& fileName,
			  std::istream& in,
			  const ReportSourceOptions& options = ReportSourceOptions(),
			  const ReportFieldResolver& resolver = ReportFieldResolver());

    ~DelimitedReportSource();

    bool readRow(RawReportRow& row) override;

    char getDelimiter() const
    {
      return mDelimiter;
    }

    const ReportColumnMap& getColumnMap() const
    {
      return mColumnMap;
    }

    // Line number (1-based) of the header row
    unsigned int getHeaderLine() const
    {
      return mHeaderLine;
    }

  private:
    void locateHeader(const ReportSourceOptions& options, const ReportFieldResolver& resolver);
    void scanMetadataLine(const std::string& line);
    std::optional<std::string> nextLine();

    static std::vector<std::string> splitLine(const std::string& line, char delimiter);

  private:
    std::unique_ptr<io::LineReader> mLineReader;
    ReportColumnMap mColumnMap;
    char mDelimiter;
    unsigned int mHeaderLine;
    unsigned int mCurrentLine;
  };
} // namespace mkc_measurement

#endif // __DELIMITED_REPORT_SOURCE_H
