// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __STATISTICS_REPORT_WRITER_H
#define __STATISTICS_REPORT_WRITER_H 1

#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "SessionStore.h"
#include "ToleranceSolver.h"

namespace mkc_measurement
{
  // Quotes a CSV cell when it contains a delimiter, a quote or a line break
  std::string quoteCsvField(const std::string& field);

  // Fixed point text of a value, or N/A
  std::string formatReportValue(const std::optional<double>& value, int precision);

  /**
   * @class StatisticsReportWriter
   * @brief Writes the statistics table of a session snapshot as CSV.
   *
   * One row per item in natural item order with the columns
   * Item, Sample Count, NG Count, Fail Rate (%), Mean, Std Dev, CPK,
   * Suggested Tolerance (+/-). Undefined values are written as N/A.
   */
  class StatisticsReportWriter
  {
  public:
    /**
     * @throws IOFailure if the file cannot be created.
     * @throws InvalidParameterError if targetYield is outside the solver's domain.
     */
    StatisticsReportWriter(const std::string& fileName,
			   const std::vector<SessionStore::SeriesPtr>& snapshot,
			   const ToleranceSolver& solver,
			   double targetYield);

    StatisticsReportWriter(std::ostream& out,
			   const std::vector<SessionStore::SeriesPtr>& snapshot,
			   const ToleranceSolver& solver,
			   double targetYield);

    StatisticsReportWriter(const StatisticsReportWriter& rhs) = delete;
    StatisticsReportWriter& operator=(const StatisticsReportWriter& rhs) = delete;

    ~StatisticsReportWriter() = default;

    void writeFile();

  private:
    void writeItem(const ItemSeries& series);

  private:
    std::ofstream mCsvFile;
    std::ostream& mOut;
    const std::vector<SessionStore::SeriesPtr> mSnapshot;
    const ToleranceSolver& mSolver;
    double mTargetYield;
  };
} // namespace mkc_measurement

#endif // __STATISTICS_REPORT_WRITER_H
