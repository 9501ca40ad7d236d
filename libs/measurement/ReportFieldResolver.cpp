// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ReportFieldResolver.h"
#include <algorithm>
#include <set>
#include <boost/algorithm/string.hpp>

namespace mkc_measurement
{
  namespace
  {
    const std::string kUtf8Bom("\xEF\xBB\xBF");
    const std::string kFullWidthSpace("\xE3\x80\x80");
    const std::string kFullWidthOpenParen("\xEF\xBC\x88");
    const std::string kFullWidthCloseParen("\xEF\xBC\x89");
    const std::string kFullWidthColon("\xEF\xBC\x9A");

    // Longest header cell the index fallback will consider
    const std::size_t kMaxIndexFallbackLength = 10;

    void eraseTrailingGroup(std::string& text, const std::string& open, const std::string& close)
    {
      if (!boost::ends_with(text, close))
	return;

      std::string::size_type openPos = text.rfind(open);
      if (openPos != std::string::npos && openPos > 0)
	text.erase(openPos);
    }

    bool isAsciiSpace(char c)
    {
      return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
    }
  }

  std::string toString(ReportField field)
  {
    switch (field)
      {
      case ReportField::Index:
	return "Index";
      case ReportField::ItemName:
	return "Item";
      case ReportField::MeasuredValue:
	return "Measured Value";
      case ReportField::DesignValue:
	return "Design Value";
      case ReportField::UpperTolerance:
	return "Upper Tolerance";
      case ReportField::LowerTolerance:
	return "Lower Tolerance";
      case ReportField::UpperSpecLimit:
	return "USL";
      case ReportField::LowerSpecLimit:
	return "LSL";
      case ReportField::Unit:
	return "Unit";
      case ReportField::Judgement:
	return "Judgement";
      case ReportField::Timestamp:
	return "Timestamp";
      }

    return "Unknown";
  }

  ReportFieldResolver::ReportFieldResolver()
    : ReportFieldResolver(&ReportFieldResolver::exactMatch)
  {}

  ReportFieldResolver::ReportFieldResolver(LabelMatcher matcher)
    : mVocabulary(),
      mMatcher(std::move(matcher))
  {
    addDefaultVocabulary();
  }

  void ReportFieldResolver::addLabel(ReportField field, const std::string& label)
  {
    mVocabulary.emplace_back(field, normalizeLabel(label));
  }

  std::optional<ReportField> ReportFieldResolver::resolveLabel(const std::string& cell) const
  {
    const std::string normalizedCell = normalizeLabel(cell);
    if (normalizedCell.empty())
      return std::nullopt;

    for (const auto& entry : mVocabulary)
      {
	if (mMatcher(normalizedCell, entry.second))
	  return entry.first;
      }

    return std::nullopt;
  }

  std::optional<ReportColumnMap>
  ReportFieldResolver::resolveHeader(const std::vector<std::string>& cells) const
  {
    ReportColumnMap columnMap;
    std::set<std::size_t> assignedColumns;

    for (std::size_t column = 0; column < cells.size(); ++column)
      {
	std::optional<ReportField> field = resolveLabel(cells[column]);
	if (field && !columnMap.hasColumn(*field))
	  {
	    columnMap.setColumn(*field, column);
	    assignedColumns.insert(column);
	  }
      }

    if (!columnMap.hasColumn(ReportField::Index))
      {
	for (std::size_t column = 0; column < cells.size(); ++column)
	  {
	    if (assignedColumns.count(column) != 0)
	      continue;

	    const std::string normalizedCell = normalizeLabel(cells[column]);
	    if (normalizedCell.size() < kMaxIndexFallbackLength &&
		normalizedCell.find("no") != std::string::npos)
	      {
		columnMap.setColumn(ReportField::Index, column);
		break;
	      }
	  }
      }

    if (!columnMap.isComplete())
      return std::nullopt;

    return columnMap;
  }

  std::string ReportFieldResolver::normalizeLabel(const std::string& label)
  {
    std::string result(label);

    if (boost::starts_with(result, kUtf8Bom))
      result.erase(0, kUtf8Bom.size());

    boost::erase_all(result, kFullWidthSpace);
    boost::trim(result);

    // "Measured Value (mm)" and "實測值（mm）" carry a unit suffix
    eraseTrailingGroup(result, "(", ")");
    eraseTrailingGroup(result, kFullWidthOpenParen, kFullWidthCloseParen);

    result.erase(std::remove_if(result.begin(), result.end(), isAsciiSpace), result.end());
    boost::erase_all(result, kFullWidthColon);
    result.erase(std::remove_if(result.begin(), result.end(),
				[](char c) { return c == '.' || c == ':' || c == '_' || c == '"'; }),
		 result.end());

    std::transform(result.begin(), result.end(), result.begin(),
		   [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; });

    return result;
  }

  bool ReportFieldResolver::exactMatch(const std::string& normalizedCell,
				       const std::string& normalizedLabel)
  {
    return normalizedCell == normalizedLabel;
  }

  void ReportFieldResolver::addDefaultVocabulary()
  {
    static const std::vector<std::pair<ReportField, std::vector<std::string>>> vocabulary = {
      { ReportField::Index,
	{ "No", "Index", "Idx", "序號", "編號", "序号", "编号", "番号" } },
      { ReportField::ItemName,
	{ "測量專案", "測量項目", "测量项目", "測定項目", "Item", "Item Name", "Feature",
	  "Characteristic", "Measurement Item", "Project", "Name" } },
      { ReportField::MeasuredValue,
	{ "實測值", "实测值", "測定値", "実測値", "Measured Value", "Measured", "Actual",
	  "Actual Value" } },
      { ReportField::DesignValue,
	{ "設計值", "设计值", "設計値", "Design Value", "Design", "Nominal", "Nominal Value" } },
      { ReportField::UpperTolerance,
	{ "上限公差", "上公差", "上側公差", "Upper Tolerance", "Upper Tol", "+Tol", "Tol+" } },
      { ReportField::LowerTolerance,
	{ "下限公差", "下公差", "下側公差", "Lower Tolerance", "Lower Tol", "-Tol", "Tol-" } },
      { ReportField::UpperSpecLimit,
	{ "USL", "上限", "上限值", "上限値", "Upper Limit", "Upper Spec Limit" } },
      { ReportField::LowerSpecLimit,
	{ "LSL", "下限", "下限值", "下限値", "Lower Limit", "Lower Spec Limit" } },
      { ReportField::Unit,
	{ "單位", "单位", "単位", "Unit" } },
      { ReportField::Judgement,
	{ "判斷", "判断", "判定", "判定結果", "Judgement", "Judgment", "Result" } },
      { ReportField::Timestamp,
	{ "測量時間", "测量时间", "測定日時", "Timestamp", "Time", "Date Time", "Measurement Time" } }
    };

    for (const auto& entry : vocabulary)
      for (const auto& label : entry.second)
	addLabel(entry.first, label);
  }
} // namespace mkc_measurement
