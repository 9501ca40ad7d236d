// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SessionStore.h"
#include <stdexcept>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_measurement
{
  SessionStore::SessionStore(const StatisticsEngine& engine, std::size_t maxReportedFailures)
    : mEngine(engine),
      mMaxReportedFailures(maxReportedFailures),
      mMergeMutex(),
      mDataMutex(),
      mSeries(),
      mBatches(),
      mNextBatchId(1)
  {}

  ImportBatch SessionStore::createBatch(const std::string& sourcePath, std::size_t fileCount)
  {
    std::lock_guard<std::mutex> mergeLock(mMergeMutex);
    std::lock_guard<std::mutex> dataLock(mDataMutex);

    ImportBatch batch(mNextBatchId++, sourcePath, fileCount,
		      boost::posix_time::second_clock::local_time());
    mBatches.push_back(batch);
    return batch;
  }

  ImportResult SessionStore::merge(const ImportBatch& batch, const std::vector<ParsedReport>& reports)
  {
    ImportResult result(batch, mMaxReportedFailures);
    std::vector<const std::vector<MeasurementRecord>*> recordLists;

    for (const auto& report : reports)
      {
	result.addFileOutcome(report.getOutcome());
	if (report.getOutcome().isImported())
	  recordLists.push_back(&report.getRecords());
      }

    appendRecords(recordLists);
    return result;
  }

  ImportResult SessionStore::merge(const ImportBatch& batch, const std::vector<MeasurementRecord>& records)
  {
    ImportResult result(batch, mMaxReportedFailures);
    result.addRecords(records.size());

    appendRecords({ &records });
    return result;
  }

  void SessionStore::appendRecords(const std::vector<const std::vector<MeasurementRecord>*>& recordLists)
  {
    std::lock_guard<std::mutex> mergeLock(mMergeMutex);

    // Group by item, keeping arrival order within each item
    std::map<std::string, std::vector<MeasurementRecord>> recordsByItem;
    for (const auto* records : recordLists)
      for (const auto& record : *records)
	recordsByItem[record.getItemName()].push_back(record);

    if (recordsByItem.empty())
      return;

    // Only writers modify mSeries and they hold mMergeMutex, so reading it here is safe
    std::vector<SeriesPtr> updated;
    updated.reserve(recordsByItem.size());
    for (auto& entry : recordsByItem)
      {
	auto existing = mSeries.find(entry.first);
	if (existing == mSeries.end())
	  updated.push_back(std::make_shared<const ItemSeries>(entry.first, std::move(entry.second), mEngine));
	else
	  updated.push_back(existing->second->appendRecords(entry.second, mEngine));
      }

    std::lock_guard<std::mutex> dataLock(mDataMutex);
    for (const auto& series : updated)
      mSeries[series->getItemName()] = series;
  }

  std::vector<std::string> SessionStore::listItems() const
  {
    std::lock_guard<std::mutex> dataLock(mDataMutex);

    std::vector<std::string> items;
    items.reserve(mSeries.size());
    for (const auto& entry : mSeries)
      items.push_back(entry.first);

    return items;
  }

  bool SessionStore::hasItem(const std::string& itemName) const
  {
    std::lock_guard<std::mutex> dataLock(mDataMutex);
    return mSeries.find(itemName) != mSeries.end();
  }

  SessionStore::SeriesPtr SessionStore::getSeries(const std::string& itemName) const
  {
    std::lock_guard<std::mutex> dataLock(mDataMutex);

    auto it = mSeries.find(itemName);
    if (it == mSeries.end())
      throw std::out_of_range("Measurement item not found: " + itemName);

    return it->second;
  }

  ItemStatistics SessionStore::getStatistics(const std::string& itemName) const
  {
    return getSeries(itemName)->getStatistics();
  }

  std::vector<MeasurementRecord> SessionStore::getRecords(const std::string& itemName) const
  {
    return getSeries(itemName)->getRecords();
  }

  std::vector<SessionStore::SeriesPtr> SessionStore::getSnapshot() const
  {
    std::lock_guard<std::mutex> dataLock(mDataMutex);

    std::vector<SeriesPtr> snapshot;
    snapshot.reserve(mSeries.size());
    for (const auto& entry : mSeries)
      snapshot.push_back(entry.second);

    return snapshot;
  }

  std::vector<ImportBatch> SessionStore::getBatches() const
  {
    std::lock_guard<std::mutex> dataLock(mDataMutex);
    return mBatches;
  }

  std::size_t SessionStore::getNumItems() const
  {
    std::lock_guard<std::mutex> dataLock(mDataMutex);
    return mSeries.size();
  }

  std::size_t SessionStore::getTotalRecordCount() const
  {
    std::lock_guard<std::mutex> dataLock(mDataMutex);

    std::size_t total = 0;
    for (const auto& entry : mSeries)
      total += entry.second->getNumRecords();

    return total;
  }

  void SessionStore::reset()
  {
    std::lock_guard<std::mutex> mergeLock(mMergeMutex);
    std::lock_guard<std::mutex> dataLock(mDataMutex);

    mSeries.clear();
    mBatches.clear();
  }
} // namespace mkc_measurement
