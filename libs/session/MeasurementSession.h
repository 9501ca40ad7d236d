// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MEASUREMENT_SESSION_H
#define __MEASUREMENT_SESSION_H 1

#include <future>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "AnalyzerConfiguration.h"
#include "BatchImporter.h"
#include "CancellationToken.h"
#include "ImportProgressObserver.h"
#include "ImportResult.h"
#include "IParallelExecutor.h"
#include "SessionStore.h"
#include "ToleranceSolver.h"

namespace mkc_measurement
{
  /**
   * @class MeasurementSession
   * @brief Query surface of one analysis session.
   *
   * Owns the session store, the tolerance solver and the worker pool used
   * for imports. Imports accumulate; reset() empties the session. All
   * queries are safe to call while an import is running and see either the
   * state before or after each merged batch.
   *
   * Queries for an unknown item throw std::out_of_range.
   */
  class MeasurementSession
  {
  public:
    explicit MeasurementSession(const AnalyzerConfiguration& configuration = AnalyzerConfiguration());

    MeasurementSession(const MeasurementSession&) = delete;
    MeasurementSession& operator=(const MeasurementSession&) = delete;

    // @throws IOFailure if the folder does not exist or is not a directory
    ImportResult importFolder(const std::string& folder,
			      const CancellationToken* token = nullptr,
			      ImportProgressObserver* observer = nullptr);

    ImportResult importFiles(const std::vector<std::string>& files,
			     const CancellationToken* token = nullptr,
			     ImportProgressObserver* observer = nullptr);

    /**
     * @brief Runs importFolder() on a background thread.
     *
     * The token and observer are shared with the background import. The
     * session must outlive the returned future.
     */
    std::future<ImportResult>
    importFolderAsync(const std::string& folder,
		      std::shared_ptr<CancellationToken> token = std::shared_ptr<CancellationToken>(),
		      std::shared_ptr<ImportProgressObserver> observer = std::shared_ptr<ImportProgressObserver>());

    std::vector<std::string> listItems() const;

    ItemStatistics getStatistics(const std::string& itemName) const;

    std::vector<MeasurementRecord> getRecords(const std::string& itemName) const;

    /**
     * @throws InvalidParameterError if targetYield is outside the yield domain.
     * @throws InsufficientDataError if the item has fewer than two samples.
     */
    ToleranceSuggestion suggestTolerance(const std::string& itemName, double targetYield) const;

    // Uses the configured target yield
    ToleranceSuggestion suggestTolerance(const std::string& itemName) const;

    void exportStatistics(std::ostream& out, double targetYield) const;
    void exportStatistics(const std::string& fileName, double targetYield) const;

    // Returns the number of records written
    std::size_t exportRecords(std::ostream& out, bool onlyFailures = false) const;
    std::size_t exportRecords(const std::string& fileName, bool onlyFailures = false) const;

    void reset();

    const SessionStore& getStore() const
    {
      return mStore;
    }

    const AnalyzerConfiguration& getConfiguration() const
    {
      return mConfiguration;
    }

    const ToleranceSolver& getToleranceSolver() const
    {
      return mSolver;
    }

  private:
    const AnalyzerConfiguration mConfiguration;
    SessionStore mStore;
    const ToleranceSolver mSolver;
    std::unique_ptr<concurrency::IParallelExecutor> mExecutor;
    BatchImporter mImporter;
  };
} // namespace mkc_measurement

#endif // __MEASUREMENT_SESSION_H
