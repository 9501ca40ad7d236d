// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "StatisticsReportWriter.h"
#include <iomanip>
#include <sstream>
#include <boost/algorithm/string/replace.hpp>
#include "MeasurementException.h"

namespace mkc_measurement
{
  std::string quoteCsvField(const std::string& field)
  {
    if (field.find_first_of(",\"\r\n") == std::string::npos)
      return field;

    return "\"" + boost::replace_all_copy(field, "\"", "\"\"") + "\"";
  }

  std::string formatReportValue(const std::optional<double>& value, int precision)
  {
    if (!value)
      return "N/A";

    std::ostringstream text;
    text << std::fixed << std::setprecision(precision) << *value;
    return text.str();
  }

  StatisticsReportWriter::StatisticsReportWriter(const std::string& fileName,
						 const std::vector<SessionStore::SeriesPtr>& snapshot,
						 const ToleranceSolver& solver,
						 double targetYield)
    : mCsvFile(fileName),
      mOut(mCsvFile),
      mSnapshot(snapshot),
      mSolver(solver),
      mTargetYield(targetYield)
  {
    // Rejects a yield outside the solver's domain before anything is written
    mSolver.computeZScore(mTargetYield);

    if (!mCsvFile)
      throw IOFailure("Cannot create statistics report " + fileName);
  }

  StatisticsReportWriter::StatisticsReportWriter(std::ostream& out,
						 const std::vector<SessionStore::SeriesPtr>& snapshot,
						 const ToleranceSolver& solver,
						 double targetYield)
    : mCsvFile(),
      mOut(out),
      mSnapshot(snapshot),
      mSolver(solver),
      mTargetYield(targetYield)
  {
    mSolver.computeZScore(mTargetYield);
  }

  void StatisticsReportWriter::writeFile()
  {
    mOut << "Item,Sample Count,NG Count,Fail Rate (%),Mean,Std Dev,CPK,Suggested Tolerance (+/-)\n";

    for (const auto& series : mSnapshot)
      writeItem(*series);

    mOut.flush();
    if (!mOut)
      throw IOFailure("Error writing statistics report");
  }

  void StatisticsReportWriter::writeItem(const ItemSeries& series)
  {
    const ItemStatistics& stats = series.getStatistics();

    std::optional<double> failRatePercent;
    if (stats.getFailRate())
      failRatePercent = *stats.getFailRate() * 100.0;

    std::optional<double> suggestedTolerance;
    try
      {
	suggestedTolerance = mSolver.suggestTolerance(stats, mTargetYield).getSuggestedTolerance();
      }
    catch (const InsufficientDataError&)
      {
	// Fewer than two evaluated samples: reported as N/A
      }

    mOut << quoteCsvField(series.getItemName()) << ','
	 << stats.getSampleCount() << ','
	 << stats.getNgCount() << ','
	 << formatReportValue(failRatePercent, 2) << ','
	 << formatReportValue(stats.getMean(), 4) << ','
	 << formatReportValue(stats.getStdDev(), 4) << ','
	 << formatReportValue(stats.getCpk(), 4) << ','
	 << formatReportValue(suggestedTolerance, 4) << '\n';
  }
} // namespace mkc_measurement
