// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ReportDateParser.h"
#include <regex>
#include <stdexcept>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/filesystem.hpp>

namespace mkc_measurement
{
  using boost::posix_time::time_duration;

  namespace
  {
    const std::string kAfternoonMarker("下午");

    std::optional<ptime> makeTimestamp(int year, int month, int day,
				       int hour, int minute, int second)
    {
      if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59)
	return std::nullopt;

      try
	{
	  boost::gregorian::date measurementDate(year, month, day);
	  return ptime(measurementDate, time_duration(hour, minute, second));
	}
      catch (const std::out_of_range&)
	{
	  // bad_year, bad_month and bad_day_of_month all derive from out_of_range
	  return std::nullopt;
	}
    }

    // Converts a 12 hour clock reading; returns -1 for an invalid hour.
    int toTwentyFourHour(int hour, bool afternoon)
    {
      if (hour < 1 || hour > 12)
	return -1;

      if (afternoon)
	return (hour < 12) ? hour + 12 : 12;

      return (hour == 12) ? 0 : hour;
    }
  }

  std::optional<ptime> parseReportTimestamp(const std::string& text)
  {
    const std::string trimmed = boost::trim_copy(text);
    if (trimmed.empty())
      return std::nullopt;

    static const std::regex keyenceForm(
      "(\\d{4})/(\\d{1,2})/(\\d{1,2})\\s+(上午|下午|AM|PM|am|pm)\\s*(\\d{1,2}):(\\d{1,2}):(\\d{1,2})");
    static const std::regex numericForm(
      "(\\d{4})[/-](\\d{1,2})[/-](\\d{1,2})[ T]+(\\d{1,2}):(\\d{1,2})(?::(\\d{1,2}))?");

    std::smatch match;
    if (std::regex_search(trimmed, match, keyenceForm))
      {
	const std::string marker = boost::to_upper_copy(match[4].str());
	const bool afternoon = (marker == kAfternoonMarker || marker == "PM");
	const int hour = toTwentyFourHour(std::stoi(match[5].str()), afternoon);
	if (hour < 0)
	  return std::nullopt;

	return makeTimestamp(std::stoi(match[1].str()), std::stoi(match[2].str()),
			     std::stoi(match[3].str()), hour,
			     std::stoi(match[6].str()), std::stoi(match[7].str()));
      }

    if (std::regex_search(trimmed, match, numericForm))
      {
	const int second = match[6].matched ? std::stoi(match[6].str()) : 0;
	return makeTimestamp(std::stoi(match[1].str()), std::stoi(match[2].str()),
			     std::stoi(match[3].str()), std::stoi(match[4].str()),
			     std::stoi(match[5].str()), second);
      }

    return std::nullopt;
  }

  std::optional<ptime> parseTimestampFromFileName(const std::string& fileName)
  {
    const std::string stem = boost::filesystem::path(fileName).stem().string();

    static const std::regex embeddedForm(
      "(\\d{4})-?(\\d{2})-?(\\d{2})[_T -]?(\\d{2})[-:]?(\\d{2})[-:]?(\\d{2})");

    std::smatch match;
    if (!std::regex_search(stem, match, embeddedForm))
      return std::nullopt;

    return makeTimestamp(std::stoi(match[1].str()), std::stoi(match[2].str()),
			 std::stoi(match[3].str()), std::stoi(match[4].str()),
			 std::stoi(match[5].str()), std::stoi(match[6].str()));
  }

  bool isMeasurementDateLabel(const std::string& text)
  {
    static const std::vector<std::string> labels = {
      "測量日期及時間", "测量日期及时间", "測定日時", "Measurement Date", "Measured Date"
    };

    for (const auto& label : labels)
      {
	if (boost::icontains(text, label))
	  return true;
      }

    return false;
  }
} // namespace mkc_measurement
