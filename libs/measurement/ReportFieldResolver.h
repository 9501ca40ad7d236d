// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REPORT_FIELD_RESOLVER_H
#define __REPORT_FIELD_RESOLVER_H 1

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "RawReportRow.h"

namespace mkc_measurement
{
  //
  // class ReportColumnMap
  //
  // Column position of every field found in a report header.
  //

  class ReportColumnMap
  {
  public:
    typedef std::map<ReportField, std::size_t>::const_iterator ConstColumnIterator;

    void setColumn(ReportField field, std::size_t column)
    {
      mColumns[field] = column;
    }

    bool hasColumn(ReportField field) const
    {
      return mColumns.find(field) != mColumns.end();
    }

    std::optional<std::size_t> getColumn(ReportField field) const
    {
      auto it = mColumns.find(field);
      if (it == mColumns.end())
	return std::nullopt;

      return it->second;
    }

    bool hasToleranceColumns() const
    {
      return hasColumn(ReportField::UpperTolerance) && hasColumn(ReportField::LowerTolerance);
    }

    bool hasLimitColumns() const
    {
      return hasColumn(ReportField::UpperSpecLimit) && hasColumn(ReportField::LowerSpecLimit);
    }

    // Index, measured and design value plus a tolerance or a limit pair
    bool isComplete() const
    {
      return hasColumn(ReportField::Index) &&
	hasColumn(ReportField::MeasuredValue) &&
	hasColumn(ReportField::DesignValue) &&
	(hasToleranceColumns() || hasLimitColumns());
    }

    std::size_t getNumColumns() const
    {
      return mColumns.size();
    }

    ConstColumnIterator beginColumns() const
    {
      return mColumns.begin();
    }

    ConstColumnIterator endColumns() const
    {
      return mColumns.end();
    }

  private:
    std::map<ReportField, std::size_t> mColumns;
  };

  /**
   * @class ReportFieldResolver
   * @brief Maps header cells to report fields using a fixed label vocabulary.
   *
   * Instrument firmware versions shift column order and vary the header
   * wording, so columns are located by label, never by position. Cells and
   * vocabulary labels are both passed through normalizeLabel() before the
   * matcher compares them.
   *
   * The default vocabulary covers the Keyence labels in Traditional and
   * Simplified Chinese and Japanese, plus common English spellings.
   * A custom LabelMatcher can replace the default exact comparison.
   */
  class ReportFieldResolver
  {
  public:
    typedef std::function<bool (const std::string& normalizedCell,
				const std::string& normalizedLabel)> LabelMatcher;

    ReportFieldResolver();
    explicit ReportFieldResolver(LabelMatcher matcher);

    void addLabel(ReportField field, const std::string& label);

    std::optional<ReportField> resolveLabel(const std::string& cell) const;

    /**
     * @brief Resolves a candidate header row.
     *
     * Each field is bound to the first column that matches it. When no
     * cell matches the index vocabulary, a short unassigned cell containing
     * "no" is taken as the index column.
     *
     * @return The column map when the header is complete, std::nullopt otherwise.
     */
    std::optional<ReportColumnMap> resolveHeader(const std::vector<std::string>& cells) const;

    static std::string normalizeLabel(const std::string& label);
    static bool exactMatch(const std::string& normalizedCell, const std::string& normalizedLabel);

  private:
    void addDefaultVocabulary();

  private:
    std::vector<std::pair<ReportField, std::string>> mVocabulary;
    LabelMatcher mMatcher;
  };
} // namespace mkc_measurement

#endif // __REPORT_FIELD_RESOLVER_H
