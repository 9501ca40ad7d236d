// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "PdfReportSource.h"
#include <cstdio>
#include <regex>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "MeasurementException.h"
#include "ReportDateParser.h"

namespace mkc_measurement
{
  namespace
  {
    // Page and table headings repeated on every page
    const std::vector<std::string> kHeadingMarkers = {
      "測量專案", "部件報告", "測量結果", "Measurement Item", "Part Report"
    };

    bool isHeadingLine(const std::string& line)
    {
      for (const auto& marker : kHeadingMarkers)
	{
	  if (line.find(marker) != std::string::npos)
	    return true;
	}

      return false;
    }
  }

  std::vector<std::string> PdfTextExtractor::extractLines(const std::string& pdfPath)
  {
    if (!boost::filesystem::exists(pdfPath))
      throw IOFailure("PDF report " + pdfPath + " does not exist");

    const std::string command = "pdftotext -layout " + quoteForShell(pdfPath) + " - 2>/dev/null";
    FILE *pipe = popen(command.c_str(), "r");
    if (pipe == nullptr)
      throw IOFailure("Unable to start pdftotext for " + pdfPath);

    std::string output;
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
      output.append(buffer);

    const int status = pclose(pipe);
    if (status != 0)
      throw IOFailure("pdftotext failed for " + pdfPath);

    std::vector<std::string> lines;
    std::istringstream text(output);
    std::string line;
    while (std::getline(text, line))
      {
	// pdftotext separates pages with a form feed
	boost::erase_all(line, "\f");
	lines.push_back(line);
      }

    return lines;
  }

  std::string PdfTextExtractor::quoteForShell(const std::string& text)
  {
    return "'" + boost::replace_all_copy(text, "'", "'\\''") + "'";
  }

  PdfReportSource::PdfReportSource(const std::string& fileName,
				   const ReportSourceOptions& options)
    : PdfReportSource(fileName, PdfTextExtractor::extractLines(fileName), options)
  {}

  PdfReportSource::PdfReportSource(const std::string& fileName,
				   const std::vector<std::string>& textLines,
				   const ReportSourceOptions& options)
    : ReportRowSource(fileName),
      mRows(),
      mNextRow(0)
  {
    parseLines(textLines, options);
  }

  void PdfReportSource::parseLines(const std::vector<std::string>& textLines,
				   const ReportSourceOptions& options)
  {
    static const std::regex tableLine(
      "^\\s*(\\d+)\\s+(.+?)\\s+(-?\\d+(?:\\.\\d+)?)\\s+(mm|um)\\s+"
      "(-?\\d+(?:\\.\\d+)?)\\s+(-?\\d+(?:\\.\\d+)?)\\s+(-?\\d+(?:\\.\\d+)?)\\s+"
      "(OK|NG|---|Warning)");

    for (std::size_t i = 0; i < textLines.size(); ++i)
      {
	const std::string& line = textLines[i];

	if (!getReportTimestamp() && i < options.metadataScanLines && isMeasurementDateLabel(line))
	  {
	    std::optional<ptime> timestamp = parseReportTimestamp(line);
	    if (timestamp)
	      setReportTimestamp(*timestamp);
	    continue;
	  }

	if (isHeadingLine(line))
	  continue;

	std::smatch match;
	if (!std::regex_search(line, match, tableLine))
	  continue;

	RawReportRow row;
	row.setLineNumber(static_cast<unsigned int>(i + 1));
	row.setField(ReportField::Index, match[1].str());
	row.setField(ReportField::ItemName, boost::trim_copy(match[2].str()));
	row.setField(ReportField::MeasuredValue, match[3].str());
	row.setField(ReportField::Unit, match[4].str());
	row.setField(ReportField::DesignValue, match[5].str());
	row.setField(ReportField::UpperTolerance, match[6].str());
	row.setField(ReportField::LowerTolerance, match[7].str());
	row.setField(ReportField::Judgement, match[8].str());
	mRows.push_back(row);
      }

    if (mRows.empty())
      throw MalformedReportError("header not found in " + getFileName());
  }

  bool PdfReportSource::readRow(RawReportRow& row)
  {
    if (mNextRow >= mRows.size())
      return false;

    row = mRows[mNextRow++];
    return true;
  }
} // namespace mkc_measurement
