// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "RecordNormalizer.h"
#include <cmath>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "MeasurementException.h"
#include "ReportDateParser.h"

namespace mkc_measurement
{
  namespace
  {
    std::optional<std::string> optionalText(const RawReportRow& row, ReportField field)
    {
      std::optional<std::string> value = row.getField(field);
      if (!value)
	return std::nullopt;

      std::string trimmed = boost::trim_copy(*value);
      if (trimmed.empty())
	return std::nullopt;

      return trimmed;
    }
  }

  RecordNormalizer::RecordNormalizer(const ReportContext& context)
    : mContext(context),
      mFileTimestamp(context.getReportTimestamp()),
      mRowOrdinal(0)
  {
    if (!mFileTimestamp)
      mFileTimestamp = parseTimestampFromFileName(context.getSourcePath());
  }

  MeasurementRecord RecordNormalizer::normalize(const RawReportRow& row)
  {
    ++mRowOrdinal;
    const unsigned int line = row.getLineNumber();

    const std::string indexLabel = requireField(row, ReportField::Index);

    int chipIndex = mRowOrdinal;
    try
      {
	chipIndex = boost::lexical_cast<int>(indexLabel);
      }
    catch (const boost::bad_lexical_cast&)
      {
	// Alphanumeric index labels (A1, B2, ...) keep the row ordinal
	chipIndex = mRowOrdinal;
      }

    std::optional<std::string> itemName = optionalText(row, ReportField::ItemName);
    if (!itemName)
      itemName = "No." + indexLabel;

    const double measuredValue =
      parseNumber(requireField(row, ReportField::MeasuredValue), ReportField::MeasuredValue, line);
    const double designValue =
      parseNumber(requireField(row, ReportField::DesignValue), ReportField::DesignValue, line);

    double upperTolerance = 0.0;
    double lowerTolerance = 0.0;
    if (row.hasField(ReportField::UpperTolerance) && row.hasField(ReportField::LowerTolerance))
      {
	upperTolerance = parseNumber(requireField(row, ReportField::UpperTolerance),
				     ReportField::UpperTolerance, line);
	lowerTolerance = parseNumber(requireField(row, ReportField::LowerTolerance),
				     ReportField::LowerTolerance, line);
      }
    else if (row.hasField(ReportField::UpperSpecLimit) && row.hasField(ReportField::LowerSpecLimit))
      {
	upperTolerance = parseNumber(requireField(row, ReportField::UpperSpecLimit),
				     ReportField::UpperSpecLimit, line) - designValue;
	lowerTolerance = parseNumber(requireField(row, ReportField::LowerSpecLimit),
				     ReportField::LowerSpecLimit, line) - designValue;
      }
    else
      throw RecordParseError("Row has neither tolerance nor specification limit values", line);

    std::optional<ptime> timestamp = mFileTimestamp;
    std::optional<std::string> rowTimestamp = optionalText(row, ReportField::Timestamp);
    if (rowTimestamp)
      {
	timestamp = parseReportTimestamp(*rowTimestamp);
	if (!timestamp)
	  throw RecordParseError("Unparseable timestamp '" + *rowTimestamp + "'", line);
      }

    const std::string sourceFile =
      boost::filesystem::path(mContext.getSourcePath()).filename().string();

    return MeasurementRecord(*itemName,
			     chipIndex,
			     indexLabel,
			     measuredValue,
			     designValue,
			     upperTolerance,
			     lowerTolerance,
			     timestamp,
			     mContext.getBatchId(),
			     sourceFile,
			     optionalText(row, ReportField::Unit),
			     optionalText(row, ReportField::Judgement));
  }

  double RecordNormalizer::parseNumber(const std::string& text, ReportField field, unsigned int lineNumber)
  {
    const std::string trimmed = boost::trim_copy(text);
    if (trimmed.empty())
      throw RecordParseError("Empty " + toString(field) + " value", lineNumber);

    double value = 0.0;
    try
      {
	value = boost::lexical_cast<double>(trimmed);
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw RecordParseError("Non-numeric " + toString(field) + " value '" + trimmed + "'",
			       lineNumber);
      }

    if (!std::isfinite(value))
      throw RecordParseError("Non-finite " + toString(field) + " value '" + trimmed + "'",
			     lineNumber);

    return value;
  }

  std::string RecordNormalizer::requireField(const RawReportRow& row, ReportField field)
  {
    std::optional<std::string> value = optionalText(row, field);
    if (!value)
      throw RecordParseError("Missing " + toString(field) + " value", row.getLineNumber());

    return *value;
  }
} // namespace mkc_measurement
