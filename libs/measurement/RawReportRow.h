// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __RAW_REPORT_ROW_H
#define __RAW_REPORT_ROW_H 1

#include <map>
#include <optional>
#include <string>

namespace mkc_measurement
{
  // Canonical fields a report column can be resolved to
  enum class ReportField
    {
      Index,
      ItemName,
      MeasuredValue,
      DesignValue,
      UpperTolerance,
      LowerTolerance,
      UpperSpecLimit,
      LowerSpecLimit,
      Unit,
      Judgement,
      Timestamp
    };

  std::string toString(ReportField field);

  //
  // class RawReportRow
  //
  // One data row of a report: raw cell text keyed by the field its column
  // was resolved to, plus the line it came from. Every row source produces
  // this shape regardless of the file format.
  //

  class RawReportRow
  {
  public:
    typedef std::map<ReportField, std::string>::const_iterator ConstFieldIterator;

    RawReportRow()
      : mFields(),
	mLineNumber(0)
    {}

    void clear()
    {
      mFields.clear();
      mLineNumber = 0;
    }

    void setField(ReportField field, const std::string& value)
    {
      mFields[field] = value;
    }

    bool hasField(ReportField field) const
    {
      return mFields.find(field) != mFields.end();
    }

    std::optional<std::string> getField(ReportField field) const
    {
      auto it = mFields.find(field);
      if (it == mFields.end())
	return std::nullopt;

      return it->second;
    }

    unsigned int getLineNumber() const
    {
      return mLineNumber;
    }

    void setLineNumber(unsigned int lineNumber)
    {
      mLineNumber = lineNumber;
    }

    std::size_t getNumFields() const
    {
      return mFields.size();
    }

    ConstFieldIterator beginFields() const
    {
      return mFields.begin();
    }

    ConstFieldIterator endFields() const
    {
      return mFields.end();
    }

  private:
    std::map<ReportField, std::string> mFields;
    unsigned int mLineNumber;
  };
} // namespace mkc_measurement

#endif // __RAW_REPORT_ROW_H
