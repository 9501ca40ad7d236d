// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "DelimitedReportSource.h"
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/tokenizer.hpp>
#include "MeasurementException.h"
#include "ReportDateParser.h"
#include "csv.h"

namespace mkc_measurement
{
  namespace
  {
    const char kCandidateDelimiters[] = { ',', '\t', ';' };

    typedef boost::escaped_list_separator<char> CellSeparator;
    typedef boost::tokenizer<CellSeparator> CellTokenizer;

    bool isBlankRow(const std::vector<std::string>& cells)
    {
      return std::all_of(cells.begin(), cells.end(),
			 [](const std::string& cell) { return cell.empty(); });
    }
  }

  DelimitedReportSource::DelimitedReportSource(const std::string& fileName,
					       const ReportSourceOptions& options,
					       const ReportFieldResolver& resolver)
    : ReportRowSource(fileName),
      mLineReader(),
      mColumnMap(),
      mDelimiter(','),
      mHeaderLine(0),
      mCurrentLine(0)
  {
    try
      {
	mLineReader = std::make_unique<io::LineReader>(fileName);
      }
    catch (const io::error::can_not_open_file&)
      {
	throw IOFailure("Cannot open report file: " + fileName);
      }

    locateHeader(options, resolver);
  }

  DelimitedReportSource::DelimitedReportSource(const std::string& fileName,
					       std::istream& in,
					       const ReportSourceOptions& options,
					       const ReportFieldResolver& resolver)
    : ReportRowSource(fileName),
      mLineReader(std::make_unique<io::LineReader>(fileName, in)),
      mColumnMap(),
      mDelimiter(','),
      mHeaderLine(0),
      mCurrentLine(0)
  {
    locateHeader(options, resolver);
  }

  DelimitedReportSource::~DelimitedReportSource()
  {}

  void DelimitedReportSource::locateHeader(const ReportSourceOptions& options,
					   const ReportFieldResolver& resolver)
  {
    for (std::size_t scanned = 0; scanned < options.headerScanLines; ++scanned)
      {
	std::optional<std::string> line = nextLine();
	if (!line)
	  break;

	for (char delimiter : kCandidateDelimiters)
	  {
	    if (line->find(delimiter) == std::string::npos)
	      continue;

	    std::vector<std::string> cells;
	    try
	      {
		cells = splitLine(*line, delimiter);
	      }
	    catch (const boost::escaped_list_error&)
	      {
		// Not tokenizable with this delimiter, so not a header either
		continue;
	      }

	    std::optional<ReportColumnMap> columnMap = resolver.resolveHeader(cells);
	    if (columnMap)
	      {
		mColumnMap = *columnMap;
		mDelimiter = delimiter;
		mHeaderLine = mCurrentLine;
		return;
	      }
	  }

	if (scanned < options.metadataScanLines && !getReportTimestamp())
	  scanMetadataLine(*line);
      }

    throw MalformedReportError("header not found in " + getFileName());
  }

  void DelimitedReportSource::scanMetadataLine(const std::string& line)
  {
    if (!isMeasurementDateLabel(line))
      return;

    for (char delimiter : kCandidateDelimiters)
      {
	std::vector<std::string> cells;
	try
	  {
	    cells = splitLine(line, delimiter);
	  }
	catch (const boost::escaped_list_error&)
	  {
	    continue;
	  }

	for (std::size_t i = 0; i < cells.size(); ++i)
	  {
	    if (!isMeasurementDateLabel(cells[i]))
	      continue;

	    for (std::size_t j = i + 1; j < cells.size(); ++j)
	      {
		std::optional<ptime> timestamp = parseReportTimestamp(cells[j]);
		if (timestamp)
		  {
		    setReportTimestamp(*timestamp);
		    return;
		  }
	      }
	  }
      }

    std::optional<ptime> timestamp = parseReportTimestamp(line);
    if (timestamp)
      setReportTimestamp(*timestamp);
  }

  bool DelimitedReportSource::readRow(RawReportRow& row)
  {
    for (;;)
      {
	std::optional<std::string> line = nextLine();
	if (!line)
	  return false;

	std::vector<std::string> cells;
	try
	  {
	    cells = splitLine(*line, mDelimiter);
	  }
	catch (const boost::escaped_list_error& e)
	  {
	    throw RecordParseError(std::string("Unreadable row: ") + e.what(), mCurrentLine);
	  }

	if (isBlankRow(cells))
	  continue;

	row.clear();
	row.setLineNumber(mCurrentLine);
	for (auto it = mColumnMap.beginColumns(); it != mColumnMap.endColumns(); ++it)
	  {
	    if (it->second < cells.size())
	      row.setField(it->first, cells[it->second]);
	  }

	return true;
      }
  }

  std::optional<std::string> DelimitedReportSource::nextLine()
  {
    char *line = nullptr;
    try
      {
	line = mLineReader->next_line();
      }
    catch (const io::error::base& e)
      {
	throw MalformedReportError(getFileName() + ": " + e.what());
      }

    if (line == nullptr)
      return std::nullopt;

    ++mCurrentLine;
    std::string text(line);
    boost::trim_right_if(text, boost::is_any_of("\r"));
    return text;
  }

  std::vector<std::string> DelimitedReportSource::splitLine(const std::string& line, char delimiter)
  {
    CellSeparator separator(std::string(), std::string(1, delimiter), std::string("\""));
    CellTokenizer tokens(line, separator);

    std::vector<std::string> cells;
    for (const auto& token : tokens)
      cells.push_back(boost::trim_copy(token));

    return cells;
  }
} // namespace mkc_measurement
