// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REPORT_DATE_PARSER_H
#define __REPORT_DATE_PARSER_H 1

#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_measurement
{
  using boost::posix_time::ptime;

  /**
   * @brief Parses a measurement date-time as written by the instruments.
   *
   * Accepted forms:
   *   2023/01/01 下午 01:23:45   (上午/下午 or AM/PM, 12 hour clock)
   *   2023/01/01 13:23:45
   *   2023-01-01 13:23:45
   *   2023/01/01 13:23
   *
   * @return std::nullopt when the text is not a valid date-time.
   */
  std::optional<ptime> parseReportTimestamp(const std::string& text);

  /**
   * @brief Extracts a date-time embedded in a report file name,
   * e.g. part_20230101_132045.csv, 20230101132045.csv or
   * part_2023-01-01_13-20-45.pdf.
   */
  std::optional<ptime> parseTimestampFromFileName(const std::string& fileName);

  // Metadata labels that precede the measurement date in report preambles
  bool isMeasurementDateLabel(const std::string& text);
} // namespace mkc_measurement

#endif // __REPORT_DATE_PARSER_H
