// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __IMPORT_PROGRESS_OBSERVER_H
#define __IMPORT_PROGRESS_OBSERVER_H 1

#include <cstddef>
#include "ImportBatch.h"
#include "ImportResult.h"

namespace mkc_measurement
{
  /**
   * @class ImportProgressObserver
   * @brief Observer interface for progress notifications of a batch import.
   *
   * importStarted() and importFinished() are called from the thread running
   * the import. fileCompleted() is called from worker threads as soon as a
   * report has been parsed, so implementations must be thread-safe. The
   * completion order of files is not the merge order.
   */
  class ImportProgressObserver
  {
  public:
    virtual ~ImportProgressObserver() = default;

    virtual void importStarted(const ImportBatch& batch, std::size_t fileCount) = 0;

    /**
     * @param outcome   Outcome of the file just parsed
     * @param completed Number of files completed so far, including this one
     * @param total     Number of files in the batch
     */
    virtual void fileCompleted(const FileImportOutcome& outcome,
			       std::size_t completed,
			       std::size_t total) = 0;

    virtual void importFinished(const ImportResult& result) = 0;
  };
} // namespace mkc_measurement

#endif // __IMPORT_PROGRESS_OBSERVER_H
