// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ItemSeries.h"
#include <stdexcept>
#include <utility>

namespace mkc_measurement
{
  ItemSeries::ItemSeries(const std::string& itemName,
			 std::vector<MeasurementRecord> records,
			 const StatisticsEngine& engine)
    : mItemName(itemName),
      mRecords(std::move(records)),
      mStatistics()
  {
    for (const auto& record : mRecords)
      {
	if (record.getItemName() != mItemName)
	  throw std::invalid_argument("ItemSeries: record of item " + record.getItemName() +
				      " cannot join series " + mItemName);
      }

    mStatistics = engine.compute(mRecords);
  }

  std::shared_ptr<const ItemSeries>
  ItemSeries::appendRecords(const std::vector<MeasurementRecord>& newRecords,
			    const StatisticsEngine& engine) const
  {
    std::vector<MeasurementRecord> combined;
    combined.reserve(mRecords.size() + newRecords.size());
    combined.insert(combined.end(), mRecords.begin(), mRecords.end());
    combined.insert(combined.end(), newRecords.begin(), newRecords.end());

    return std::make_shared<const ItemSeries>(mItemName, std::move(combined), engine);
  }
} // namespace mkc_measurement
