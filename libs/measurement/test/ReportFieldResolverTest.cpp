#include <catch2/catch_test_macros.hpp>
#include <boost/algorithm/string.hpp>
#include "ReportFieldResolver.h"

using namespace mkc_measurement;

TEST_CASE("ReportFieldResolver label normalization", "[ReportFieldResolver]")
{
  SECTION("Unit suffixes are removed")
  {
    REQUIRE(ReportFieldResolver::normalizeLabel("實測值（mm）") == "實測值");
    REQUIRE(ReportFieldResolver::normalizeLabel("Measured Value (mm)") == "measuredvalue");
  }

  SECTION("BOM, punctuation and case are ignored")
  {
    REQUIRE(ReportFieldResolver::normalizeLabel("\xEF\xBB\xBFNo.") == "no");
    REQUIRE(ReportFieldResolver::normalizeLabel("  Upper_Tolerance: ") == "uppertolerance");
    REQUIRE(ReportFieldResolver::normalizeLabel("上限公差：") == "上限公差");
  }

  SECTION("Full-width spaces are ignored")
  {
    REQUIRE(ReportFieldResolver::normalizeLabel("\xE3\x80\x80設計值\xE3\x80\x80") == "設計值");
  }
}

TEST_CASE("ReportFieldResolver resolves single labels", "[ReportFieldResolver]")
{
  ReportFieldResolver resolver;

  REQUIRE(resolver.resolveLabel("No") == ReportField::Index);
  REQUIRE(resolver.resolveLabel("測量專案") == ReportField::ItemName);
  REQUIRE(resolver.resolveLabel("实测值") == ReportField::MeasuredValue);
  REQUIRE(resolver.resolveLabel("Design Value") == ReportField::DesignValue);
  REQUIRE(resolver.resolveLabel("下限公差") == ReportField::LowerTolerance);
  REQUIRE(resolver.resolveLabel("USL") == ReportField::UpperSpecLimit);
  REQUIRE(resolver.resolveLabel("lsl") == ReportField::LowerSpecLimit);
  REQUIRE(resolver.resolveLabel("判斷") == ReportField::Judgement);
  REQUIRE_FALSE(resolver.resolveLabel("Comment").has_value());
  REQUIRE_FALSE(resolver.resolveLabel("").has_value());
}

TEST_CASE("ReportFieldResolver resolves header rows", "[ReportFieldResolver]")
{
  ReportFieldResolver resolver;

  SECTION("Keyence header")
  {
    std::vector<std::string> cells = { "No", "測量專案", "實測值", "設計值", "上限公差", "下限公差", "判斷" };
    auto columnMap = resolver.resolveHeader(cells);

    REQUIRE(columnMap.has_value());
    REQUIRE(columnMap->isComplete());
    REQUIRE(columnMap->hasToleranceColumns());
    REQUIRE_FALSE(columnMap->hasLimitColumns());
    REQUIRE(columnMap->getColumn(ReportField::Index) == 0u);
    REQUIRE(columnMap->getColumn(ReportField::ItemName) == 1u);
    REQUIRE(columnMap->getColumn(ReportField::MeasuredValue) == 2u);
    REQUIRE(columnMap->getColumn(ReportField::DesignValue) == 3u);
    REQUIRE(columnMap->getColumn(ReportField::UpperTolerance) == 4u);
    REQUIRE(columnMap->getColumn(ReportField::LowerTolerance) == 5u);
    REQUIRE(columnMap->getColumn(ReportField::Judgement) == 6u);
    REQUIRE(columnMap->getNumColumns() == 7u);
  }

  SECTION("Column order does not matter")
  {
    std::vector<std::string> cells = { "Design Value", "Lower Tolerance", "Measured Value (mm)",
				       "Upper Tolerance", "No." };
    auto columnMap = resolver.resolveHeader(cells);

    REQUIRE(columnMap.has_value());
    REQUIRE(columnMap->getColumn(ReportField::Index) == 4u);
    REQUIRE(columnMap->getColumn(ReportField::MeasuredValue) == 2u);
    REQUIRE(columnMap->getColumn(ReportField::DesignValue) == 0u);
    REQUIRE(columnMap->getColumn(ReportField::UpperTolerance) == 3u);
    REQUIRE(columnMap->getColumn(ReportField::LowerTolerance) == 1u);
    REQUIRE_FALSE(columnMap->hasColumn(ReportField::ItemName));
  }

  SECTION("Specification limits instead of tolerances")
  {
    std::vector<std::string> cells = { "No", "Item", "Measured", "Design", "USL", "LSL" };
    auto columnMap = resolver.resolveHeader(cells);

    REQUIRE(columnMap.has_value());
    REQUIRE(columnMap->hasLimitColumns());
    REQUIRE_FALSE(columnMap->hasToleranceColumns());
  }

  SECTION("First matching column wins")
  {
    std::vector<std::string> cells = { "No", "實測值", "設計值", "上限公差", "下限公差", "Measured" };
    auto columnMap = resolver.resolveHeader(cells);

    REQUIRE(columnMap.has_value());
    REQUIRE(columnMap->getColumn(ReportField::MeasuredValue) == 1u);
  }

  SECTION("Index column falls back to a short cell containing no")
  {
    std::vector<std::string> cells = { "Chip No#", "實測值", "設計值", "上限公差", "下限公差" };
    auto columnMap = resolver.resolveHeader(cells);

    REQUIRE(columnMap.has_value());
    REQUIRE(columnMap->getColumn(ReportField::Index) == 0u);
  }

  SECTION("Incomplete headers are rejected")
  {
    REQUIRE_FALSE(resolver.resolveHeader({ "No", "實測值", "上限公差", "下限公差" }).has_value());
    REQUIRE_FALSE(resolver.resolveHeader({ "No", "實測值", "設計值", "上限公差" }).has_value());
    REQUIRE_FALSE(resolver.resolveHeader({ "實測值", "設計值", "上限公差", "下限公差" }).has_value());
    REQUIRE_FALSE(resolver.resolveHeader({}).has_value());
  }
}

TEST_CASE("ReportFieldResolver vocabulary can be extended", "[ReportFieldResolver]")
{
  SECTION("Additional label")
  {
    ReportFieldResolver resolver;
    resolver.addLabel(ReportField::MeasuredValue, "Reading");

    REQUIRE(resolver.resolveLabel("READING") == ReportField::MeasuredValue);
  }

  SECTION("Custom matcher")
  {
    ReportFieldResolver resolver([](const std::string& cell, const std::string& label) {
	return boost::starts_with(cell, label);
      });

    REQUIRE(resolver.resolveLabel("Measured Value Avg") == ReportField::MeasuredValue);
  }
}
