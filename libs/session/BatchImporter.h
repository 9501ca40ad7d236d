// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BATCH_IMPORTER_H
#define __BATCH_IMPORTER_H 1

#include <string>
#include <vector>
#include "CancellationToken.h"
#include "IParallelExecutor.h"
#include "ImportProgressObserver.h"
#include "ImportResult.h"
#include "ReportRowSource.h"
#include "SessionStore.h"

namespace mkc_measurement
{
  // Which report to import when a folder holds a CSV and a PDF of the same stem
  enum class DuplicateReportPolicy
    {
      PreferCsv,
      PreferPdf,
      ImportAll
    };

  std::string toString(DuplicateReportPolicy policy);

  // Throws std::invalid_argument for an unknown policy name
  DuplicateReportPolicy parseDuplicateReportPolicy(const std::string& name);

  /**
   * @class BatchImporter
   * @brief Parses a set of report files in parallel and merges them as one batch.
   *
   * Each file is parsed by one task on the executor. A malformed or
   * unreadable file only fails itself, and a bad row only fails that row.
   * After every task has finished the parsed reports are merged into the
   * store in the order of the file list, so the result does not depend on
   * which worker finished first.
   *
   * When the cancellation token is set, files that have not started are
   * skipped and reported as Cancelled; files already parsed are still merged.
   */
  class BatchImporter
  {
  public:
    BatchImporter(SessionStore& store,
		  concurrency::IParallelExecutor& executor,
		  const ReportSourceOptions& options = ReportSourceOptions(),
		  DuplicateReportPolicy policy = DuplicateReportPolicy::PreferCsv);

    /**
     * @brief Imports every supported report directly inside a folder.
     *
     * @throws IOFailure if the folder does not exist or is not a directory.
     */
    ImportResult importFolder(const std::string& folder,
			      const CancellationToken* token = nullptr,
			      ImportProgressObserver* observer = nullptr);

    // Imports an explicit list of report files as one batch
    ImportResult importFiles(const std::string& sourcePath,
			     const std::vector<std::string>& files,
			     const CancellationToken* token = nullptr,
			     ImportProgressObserver* observer = nullptr);

    /**
     * @brief Lists supported report files in natural file name order.
     *
     * Subfolders are not searched.
     *
     * @throws IOFailure if the folder does not exist or is not a directory.
     */
    static std::vector<std::string> listReportFiles(const std::string& folder,
						    DuplicateReportPolicy policy);

    /**
     * @brief Parses one report file into normalized records.
     *
     * Never throws for problems in the file itself: they are described by
     * the outcome of the returned report.
     */
    static ParsedReport parseReport(const std::string& file,
				    BatchId batchId,
				    const ReportSourceOptions& options);

    DuplicateReportPolicy getDuplicateReportPolicy() const
    {
      return mPolicy;
    }

  private:
    SessionStore& mStore;
    concurrency::IParallelExecutor& mExecutor;
    ReportSourceOptions mOptions;
    DuplicateReportPolicy mPolicy;
  };
} // namespace mkc_measurement

#endif // __BATCH_IMPORTER_H
