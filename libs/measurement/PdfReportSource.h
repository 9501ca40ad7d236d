// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __PDF_REPORT_SOURCE_H
#define __PDF_REPORT_SOURCE_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "ReportRowSource.h"

namespace mkc_measurement
{
  //
  // class PdfTextExtractor
  //
  // Turns a PDF report into layout-preserving text lines by running
  // pdftotext. Throws IOFailure when the file or the tool is unavailable.
  //

  class PdfTextExtractor
  {
  public:
    static std::vector<std::string> extractLines(const std::string& pdfPath);

  private:
    static std::string quoteForShell(const std::string& text);
  };

  //
  // class PdfReportSource
  //
  // Keyence PDF part reports. Each table line has the layout
  //   No  Item  Measured  Unit  Design  Upper  Lower  Judgement
  // and is matched as a whole; rows come out with the same fields a
  // delimited report would produce.
  //

  class PdfReportSource : public ReportRowSource
  {
  public:
    explicit PdfReportSource(const std::string& fileName,
			     const ReportSourceOptions& options = ReportSourceOptions());

    // Builds the source from already extracted text lines.
    PdfReportSource(const std::string& fileName,
		    const std::vector<std::string>& textLines,
		    const ReportSourceOptions& options = ReportSourceOptions());

    bool readRow(RawReportRow& row) override;

    std::size_t getNumRows() const
    {
      return mRows.size();
    }

  private:
    void parseLines(const std::vector<std::string>& textLines,
		    const ReportSourceOptions& options);

  private:
    std::vector<RawReportRow> mRows;
    std::size_t mNextRow;
  };
} // namespace mkc_measurement

#endif // __PDF_REPORT_SOURCE_H
