// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __SESSION_STORE_H
#define __SESSION_STORE_H 1

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ImportBatch.h"
#include "ImportResult.h"
#include "ItemSeries.h"
#include "NaturalOrder.h"
#include "StatisticsEngine.h"

namespace mkc_measurement
{
  /**
   * @class SessionStore
   * @brief In-memory store of every item series of one analysis session.
   *
   * Accumulation is append-only: each merge adds the records of a batch to
   * the series of their items, creating series as needed. Importing the same
   * files twice therefore doubles their records; reset() is the only way to
   * remove data.
   *
   * Locking: mMergeMutex serializes writers (merge, reset, createBatch), so
   * a merge builds the new series snapshots and their statistics without
   * blocking readers. mDataMutex is held only to publish the new snapshots
   * and to copy pointers out for readers. All series touched by one merge
   * are published together, so a reader sees either none or all of a batch.
   *
   * Queries for an unknown item throw std::out_of_range.
   */
  class SessionStore
  {
  public:
    typedef std::shared_ptr<const ItemSeries> SeriesPtr;

    explicit SessionStore(const StatisticsEngine& engine = StatisticsEngine(),
			  std::size_t maxReportedFailures = ImportResult::kDefaultMaxReportedFailures);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Registers a new batch with the next batch id.
    ImportBatch createBatch(const std::string& sourcePath, std::size_t fileCount);

    /**
     * @brief Appends the records of every imported report, in list order.
     *
     * Reports that are not Imported contribute no records; their outcome is
     * still recorded in the result.
     */
    ImportResult merge(const ImportBatch& batch, const std::vector<ParsedReport>& reports);

    ImportResult merge(const ImportBatch& batch, const std::vector<MeasurementRecord>& records);

    // Item names in natural order
    std::vector<std::string> listItems() const;

    bool hasItem(const std::string& itemName) const;

    SeriesPtr getSeries(const std::string& itemName) const;

    ItemStatistics getStatistics(const std::string& itemName) const;

    std::vector<MeasurementRecord> getRecords(const std::string& itemName) const;

    // Consistent view of every series, in natural item order
    std::vector<SeriesPtr> getSnapshot() const;

    std::vector<ImportBatch> getBatches() const;

    std::size_t getNumItems() const;

    std::size_t getTotalRecordCount() const;

    const StatisticsEngine& getStatisticsEngine() const
    {
      return mEngine;
    }

    // Drops all series and batches. Batch ids keep increasing.
    void reset();

  private:
    void appendRecords(const std::vector<const std::vector<MeasurementRecord>*>& recordLists);

  private:
    typedef std::map<std::string, SeriesPtr, NaturalLess> SeriesMap;

    const StatisticsEngine mEngine;
    const std::size_t mMaxReportedFailures;
    mutable std::mutex mMergeMutex;
    mutable std::mutex mDataMutex;
    SeriesMap mSeries;
    std::vector<ImportBatch> mBatches;
    BatchId mNextBatchId;
  };
} // namespace mkc_measurement

#endif // __SESSION_STORE_H
