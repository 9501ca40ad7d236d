#pragma once

#include <mutex>
#include <ostream>
#include "ImportProgressObserver.h"

namespace measanalyzer
{

/**
 * @brief Reports import progress on a log stream
 *
 * fileCompleted() is called from worker threads; writes are serialized
 * with a mutex.
 */
class ConsoleProgressObserver : public mkc_measurement::ImportProgressObserver
{
public:
    ConsoleProgressObserver(std::ostream& out, bool verbose);

    void importStarted(const mkc_measurement::ImportBatch& batch, std::size_t fileCount) override;

    void fileCompleted(const mkc_measurement::FileImportOutcome& outcome,
                       std::size_t completed,
                       std::size_t total) override;

    void importFinished(const mkc_measurement::ImportResult& result) override;

private:
    std::ostream& mOut;
    bool mVerbose;
    std::mutex mMutex;
};

} // namespace measanalyzer
