#include "ConsoleProgressObserver.h"
#include <boost/filesystem.hpp>

using namespace mkc_measurement;

namespace measanalyzer
{

ConsoleProgressObserver::ConsoleProgressObserver(std::ostream& out, bool verbose)
    : mOut(out),
      mVerbose(verbose)
{
}

void ConsoleProgressObserver::importStarted(const ImportBatch& batch, std::size_t fileCount)
{
    std::lock_guard<std::mutex> lock(mMutex);
    mOut << "Importing " << fileCount << " report files from " << batch.getSourcePath() << std::endl;
}

void ConsoleProgressObserver::fileCompleted(const FileImportOutcome& outcome,
                                            std::size_t completed,
                                            std::size_t total)
{
    if (!mVerbose && outcome.isImported() && outcome.getRowFailures().empty())
        return;

    std::lock_guard<std::mutex> lock(mMutex);
    mOut << "  [" << completed << "/" << total << "] "
         << boost::filesystem::path(outcome.getFilePath()).filename().string() << ": "
         << toString(outcome.getStatus());

    if (outcome.isImported())
    {
        mOut << ", " << outcome.getRecordCount() << " records";
        if (!outcome.getRowFailures().empty())
            mOut << ", " << outcome.getRowFailures().size() << " rows rejected";
    }
    else if (!outcome.getMessage().empty())
    {
        mOut << " (" << outcome.getMessage() << ")";
    }

    mOut << std::endl;
}

void ConsoleProgressObserver::importFinished(const ImportResult& result)
{
    std::lock_guard<std::mutex> lock(mMutex);
    mOut << "Import finished: " << result.getNumRecordsImported() << " records merged" << std::endl;
}

} // namespace measanalyzer
