#include "OutputUtils.h"
#include <iomanip>
#include <optional>
#include "StatisticsReportWriter.h"

using namespace mkc_measurement;

namespace measanalyzer
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

void printImportSummary(std::ostream& out, const ImportResult& result)
{
    const ImportBatch& batch = result.getBatch();

    out << "Batch " << batch.getBatchId() << " (" << batch.getSourcePath() << "): "
        << result.getNumFilesImported() << " of " << batch.getFileCount() << " files imported, "
        << result.getNumRecordsImported() << " records" << std::endl;

    if (result.getNumFilesFailed() > 0)
        out << "  Files failed: " << result.getNumFilesFailed() << std::endl;

    if (result.getNumRowsFailed() > 0)
        out << "  Rows rejected: " << result.getNumRowsFailed() << std::endl;

    if (result.isCancelled())
        out << "  Files skipped after cancellation: " << result.getNumFilesCancelled() << std::endl;

    for (const auto& failure : result.getFailures())
        out << "  " << failure << std::endl;

    if (result.getNumUnreportedFailures() > 0)
        out << "  ... and " << result.getNumUnreportedFailures() << " more" << std::endl;
}

void printItemStatistics(std::ostream& out,
                         const std::string& itemName,
                         const ItemStatistics& statistics)
{
    std::optional<double> failRatePercent;
    if (statistics.getFailRate())
        failRatePercent = *statistics.getFailRate() * 100.0;

    out << std::left << std::setw(24) << itemName << std::right
        << " n=" << std::setw(6) << statistics.getSampleCount()
        << " NG=" << std::setw(5) << statistics.getNgCount()
        << " fail=" << std::setw(7) << formatReportValue(failRatePercent, 2) << "%"
        << " mean=" << formatReportValue(statistics.getMean(), 4)
        << " sd=" << formatReportValue(statistics.getStdDev(), 4)
        << " CPK=" << formatReportValue(statistics.getCpk(), 4);

    if (statistics.isLowConfidence())
        out << " [low confidence]";

    if (statistics.hasToleranceDivergence())
        out << " [mixed tolerances]";

    out << std::endl;
}

void printToleranceSuggestion(std::ostream& out,
                              const std::string& itemName,
                              const ToleranceSuggestion& suggestion)
{
    out << "Tolerance suggestion for " << itemName << std::endl;
    out << "  Target yield:         " << formatReportValue(suggestion.getTargetYield() * 100.0, 2) << "%" << std::endl;
    out << "  z:                    " << formatReportValue(suggestion.getZScore(), 4) << std::endl;
    out << "  Mean / sd:            " << formatReportValue(suggestion.getMean(), 4)
        << " / " << formatReportValue(suggestion.getStdDev(), 4) << std::endl;
    out << "  Suggested tolerance:  +/-" << formatReportValue(suggestion.getSuggestedTolerance(), 4) << std::endl;
    out << "  Process window:       [" << formatReportValue(suggestion.getLowerBound(), 4)
        << ", " << formatReportValue(suggestion.getUpperBound(), 4) << "]" << std::endl;

    if (suggestion.getDesignOffset())
    {
        out << "  Offset from design:   " << formatReportValue(suggestion.getDesignOffset(), 4) << std::endl;
        out << "  Required tolerances:  +" << formatReportValue(suggestion.getRequiredUpperTolerance(), 4)
            << " / " << formatReportValue(suggestion.getRequiredLowerTolerance(), 4) << std::endl;
    }

    if (suggestion.getCurrentSpecYield())
        out << "  Yield of current spec: "
            << formatReportValue(*suggestion.getCurrentSpecYield() * 100.0, 2) << "%" << std::endl;

    if (suggestion.isZeroSpread())
        out << "  Warning: measurements show no spread" << std::endl;

    if (suggestion.isLowConfidence())
        out << "  Warning: only " << suggestion.getSampleCount() << " samples, suggestion has low confidence" << std::endl;
}

} // namespace utils
} // namespace measanalyzer
