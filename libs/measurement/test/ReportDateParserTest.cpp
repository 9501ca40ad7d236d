#include <catch2/catch_test_macros.hpp>
#include "ReportDateParser.h"

using namespace mkc_measurement;
using namespace boost::gregorian;
using boost::posix_time::time_duration;

TEST_CASE("parseReportTimestamp accepts instrument formats", "[ReportDateParser]")
{
  SECTION("Keyence afternoon marker")
  {
    auto timestamp = parseReportTimestamp("2023/01/01 下午 01:23:45");

    REQUIRE(timestamp.has_value());
    REQUIRE(*timestamp == ptime(date(2023, 1, 1), time_duration(13, 23, 45)));
  }

  SECTION("Keyence morning marker at twelve")
  {
    auto timestamp = parseReportTimestamp("2023/03/15 上午 12:05:00");

    REQUIRE(timestamp.has_value());
    REQUIRE(*timestamp == ptime(date(2023, 3, 15), time_duration(0, 5, 0)));
  }

  SECTION("English markers")
  {
    auto timestamp = parseReportTimestamp("2023/7/4 PM 12:00:01");

    REQUIRE(timestamp.has_value());
    REQUIRE(*timestamp == ptime(date(2023, 7, 4), time_duration(12, 0, 1)));
  }

  SECTION("24 hour numeric forms")
  {
    REQUIRE(parseReportTimestamp("2023/01/01 13:23:45") ==
	    ptime(date(2023, 1, 1), time_duration(13, 23, 45)));
    REQUIRE(parseReportTimestamp("2023-01-01 13:23:45") ==
	    ptime(date(2023, 1, 1), time_duration(13, 23, 45)));
    REQUIRE(parseReportTimestamp("2023-01-01T08:00") ==
	    ptime(date(2023, 1, 1), time_duration(8, 0, 0)));
  }

  SECTION("Label in front of the date")
  {
    REQUIRE(parseReportTimestamp("測量日期及時間: 2024/02/29 09:30:00") ==
	    ptime(date(2024, 2, 29), time_duration(9, 30, 0)));
  }
}

TEST_CASE("parseReportTimestamp rejects invalid input", "[ReportDateParser]")
{
  REQUIRE_FALSE(parseReportTimestamp("").has_value());
  REQUIRE_FALSE(parseReportTimestamp("yesterday").has_value());
  REQUIRE_FALSE(parseReportTimestamp("2023/02/30 10:00:00").has_value());
  REQUIRE_FALSE(parseReportTimestamp("2023/13/01 10:00:00").has_value());
  REQUIRE_FALSE(parseReportTimestamp("2023/01/01 25:00:00").has_value());
  REQUIRE_FALSE(parseReportTimestamp("2023/01/01 下午 13:00:00").has_value());
}

TEST_CASE("parseTimestampFromFileName", "[ReportDateParser]")
{
  const ptime expected(date(2023, 1, 1), time_duration(13, 20, 45));

  REQUIRE(parseTimestampFromFileName("part_20230101_132045.csv") == expected);
  REQUIRE(parseTimestampFromFileName("/data/line3/20230101132045.csv") == expected);
  REQUIRE(parseTimestampFromFileName("part_2023-01-01_13-20-45.pdf") == expected);
  REQUIRE_FALSE(parseTimestampFromFileName("part_A.csv").has_value());
  REQUIRE_FALSE(parseTimestampFromFileName("part_20231301_132045.csv").has_value());
}

TEST_CASE("isMeasurementDateLabel", "[ReportDateParser]")
{
  REQUIRE(isMeasurementDateLabel("測量日期及時間"));
  REQUIRE(isMeasurementDateLabel("测量日期及时间,2023/01/01 13:00:00"));
  REQUIRE(isMeasurementDateLabel("measurement date"));
  REQUIRE_FALSE(isMeasurementDateLabel("機種"));
}
