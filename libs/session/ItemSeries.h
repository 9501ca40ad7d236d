// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ITEM_SERIES_H
#define __ITEM_SERIES_H 1

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "ItemStatistics.h"
#include "MeasurementRecord.h"
#include "StatisticsEngine.h"

namespace mkc_measurement
{
  /**
   * @class ItemSeries
   * @brief Immutable snapshot of all records of one item, in arrival order,
   * together with the statistics computed from them.
   *
   * A series never changes once built. appendRecords() returns a new
   * snapshot, so a reader holding a shared_ptr to the old one keeps seeing
   * a complete and consistent series.
   */
  class ItemSeries
  {
  public:
    // Throws std::invalid_argument if a record belongs to another item
    ItemSeries(const std::string& itemName,
	       std::vector<MeasurementRecord> records,
	       const StatisticsEngine& engine);

    std::shared_ptr<const ItemSeries>
    appendRecords(const std::vector<MeasurementRecord>& newRecords,
		  const StatisticsEngine& engine) const;

    const std::string& getItemName() const
    {
      return mItemName;
    }

    const std::vector<MeasurementRecord>& getRecords() const
    {
      return mRecords;
    }

    std::size_t getNumRecords() const
    {
      return mRecords.size();
    }

    const ItemStatistics& getStatistics() const
    {
      return mStatistics;
    }

  private:
    std::string mItemName;
    std::vector<MeasurementRecord> mRecords;
    ItemStatistics mStatistics;
  };
} // namespace mkc_measurement

#endif // __ITEM_SERIES_H
