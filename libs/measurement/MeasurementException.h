// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MEASUREMENT_EXCEPTION_H
#define __MEASUREMENT_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_measurement
{
  // Base of every error raised by the measurement libraries
  class MeasurementException : public std::runtime_error
  {
  public:
    explicit MeasurementException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~MeasurementException() = default;
  };

  // File level: no parseable header (or no table) in a report.
  class MalformedReportError : public MeasurementException
  {
  public:
    explicit MalformedReportError(const std::string& msg)
      : MeasurementException(msg)
    {}
  };

  // Row level: a single data row could not be turned into a record.
  class RecordParseError : public MeasurementException
  {
  public:
    RecordParseError(const std::string& msg, unsigned int lineNumber)
      : MeasurementException(msg),
	mLineNumber(lineNumber)
    {}

    unsigned int getLineNumber() const
    {
      return mLineNumber;
    }

  private:
    unsigned int mLineNumber;
  };

  class InsufficientDataError : public MeasurementException
  {
  public:
    explicit InsufficientDataError(const std::string& msg)
      : MeasurementException(msg)
    {}
  };

  class InvalidParameterError : public MeasurementException
  {
  public:
    explicit InvalidParameterError(const std::string& msg)
      : MeasurementException(msg)
    {}
  };

  // File unreadable or folder missing
  class IOFailure : public MeasurementException
  {
  public:
    explicit IOFailure(const std::string& msg)
      : MeasurementException(msg)
    {}
  };
} // namespace mkc_measurement

#endif // __MEASUREMENT_EXCEPTION_H
