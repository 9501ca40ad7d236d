#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "SessionStore.h"

using namespace mkc_measurement;
using Catch::Approx;

namespace
{
  std::vector<MeasurementRecord> createRecords(const std::string& itemName,
					       const std::vector<double>& values,
					       BatchId batchId = 1,
					       double design = 100.0,
					       double tolerance = 5.0)
  {
    std::vector<MeasurementRecord> records;
    int chip = 0;
    for (double value : values)
      {
	++chip;
	records.push_back(MeasurementRecord(itemName, chip, std::to_string(chip),
					    value, design, tolerance, -tolerance,
					    std::nullopt, batchId, itemName + ".csv"));
      }

    return records;
  }

  std::vector<MeasurementRecord> concat(std::vector<MeasurementRecord> lhs,
					const std::vector<MeasurementRecord>& rhs)
  {
    lhs.insert(lhs.end(), rhs.begin(), rhs.end());
    return lhs;
  }
}

TEST_CASE("SessionStore merges records per item", "[SessionStore]")
{
  SessionStore store;
  ImportBatch batch = store.createBatch("lot1", 1);

  std::vector<MeasurementRecord> records =
    concat(createRecords("Gap-A", { 98, 99, 100, 101, 102, 103, 97, 100, 100, 104 }, batch.getBatchId()),
	   createRecords("Bore", { 5.0, 5.1 }, batch.getBatchId(), 5.0));

  ImportResult result = store.merge(batch, records);

  REQUIRE(result.getNumRecordsImported() == 12u);
  REQUIRE(store.getNumItems() == 2u);
  REQUIRE(store.getTotalRecordCount() == 12u);
  REQUIRE(store.hasItem("Gap-A"));
  REQUIRE_FALSE(store.hasItem("Gap-B"));

  ItemStatistics stats = store.getStatistics("Gap-A");
  REQUIRE(stats.getSampleCount() == 10u);
  REQUIRE(*stats.getMean() == Approx(100.4));
  REQUIRE(*stats.getStdDev() == Approx(2.0591).margin(1e-4));
  REQUIRE(*stats.getCpk() == Approx(0.7447).margin(1e-3));

  // Arrival order is kept within an item
  std::vector<MeasurementRecord> gapRecords = store.getRecords("Gap-A");
  REQUIRE(gapRecords.size() == 10u);
  REQUIRE(gapRecords.front().getMeasuredValue() == 98.0);
  REQUIRE(gapRecords.back().getMeasuredValue() == 104.0);
}

TEST_CASE("SessionStore unknown item", "[SessionStore]")
{
  SessionStore store;

  REQUIRE(store.listItems().empty());
  REQUIRE_THROWS_AS(store.getSeries("Missing"), std::out_of_range);
  REQUIRE_THROWS_AS(store.getStatistics("Missing"), std::out_of_range);
  REQUIRE_THROWS_AS(store.getRecords("Missing"), std::out_of_range);
}

TEST_CASE("SessionStore lists items in natural order", "[SessionStore]")
{
  SessionStore store;
  ImportBatch batch = store.createBatch("lot1", 1);

  std::vector<MeasurementRecord> records;
  for (const std::string& name : { "Pin10", "Pin2", "Pin1", "Bore" })
    records = concat(records, createRecords(name, { 100.0 }, batch.getBatchId()));

  store.merge(batch, records);

  REQUIRE(store.listItems() == std::vector<std::string>({ "Bore", "Pin1", "Pin2", "Pin10" }));

  std::vector<SessionStore::SeriesPtr> snapshot = store.getSnapshot();
  REQUIRE(snapshot.size() == 4u);
  REQUIRE(snapshot[0]->getItemName() == "Bore");
  REQUIRE(snapshot[3]->getItemName() == "Pin10");
}

TEST_CASE("SessionStore statistics do not depend on merge order", "[SessionStore]")
{
  std::vector<MeasurementRecord> first = createRecords("Gap-A", { 98, 99, 100, 101, 102 });
  std::vector<MeasurementRecord> second = createRecords("Gap-A", { 103, 97, 100, 100, 104 });

  SessionStore forward;
  forward.merge(forward.createBatch("a", 1), first);
  forward.merge(forward.createBatch("b", 1), second);

  SessionStore backward;
  backward.merge(backward.createBatch("b", 1), second);
  backward.merge(backward.createBatch("a", 1), first);

  ItemStatistics lhs = forward.getStatistics("Gap-A");
  ItemStatistics rhs = backward.getStatistics("Gap-A");

  REQUIRE(lhs.getSampleCount() == rhs.getSampleCount());
  REQUIRE(lhs.getNgCount() == rhs.getNgCount());
  REQUIRE(*lhs.getMean() == Approx(*rhs.getMean()));
  REQUIRE(*lhs.getStdDev() == Approx(*rhs.getStdDev()));
  REQUIRE(*lhs.getCpk() == Approx(*rhs.getCpk()));
  REQUIRE(*lhs.getMinimum() == *rhs.getMinimum());
  REQUIRE(*lhs.getMaximum() == *rhs.getMaximum());
}

TEST_CASE("SessionStore picks the same tolerance for a tied split in either merge order", "[SessionStore]")
{
  std::vector<MeasurementRecord> wide = createRecords("Gap-A", { 99.5, 100.0, 100.5 }, 1, 100.0, 5.0);
  std::vector<MeasurementRecord> narrow = createRecords("Gap-A", { 99.5, 100.0, 100.5 }, 1, 100.0, 1.0);

  SessionStore forward;
  forward.merge(forward.createBatch("wide", 1), wide);
  forward.merge(forward.createBatch("narrow", 1), narrow);

  SessionStore backward;
  backward.merge(backward.createBatch("narrow", 1), narrow);
  backward.merge(backward.createBatch("wide", 1), wide);

  ItemStatistics lhs = forward.getStatistics("Gap-A");
  ItemStatistics rhs = backward.getStatistics("Gap-A");

  REQUIRE(lhs.hasToleranceDivergence());
  REQUIRE(rhs.hasToleranceDivergence());
  REQUIRE(lhs.getToleranceSpec()->getUpperTolerance() == Approx(1.0));
  REQUIRE(rhs.getToleranceSpec()->getUpperTolerance() == Approx(1.0));
  REQUIRE(*lhs.getCpk() == Approx(*rhs.getCpk()));
}

TEST_CASE("SessionStore accumulation is append-only", "[SessionStore]")
{
  SessionStore store;
  std::vector<MeasurementRecord> records = createRecords("Gap-A", { 98, 99, 100, 101, 102 });

  store.merge(store.createBatch("lot1", 1), records);
  ItemStatistics once = store.getStatistics("Gap-A");

  // The same data imported again is counted twice
  store.merge(store.createBatch("lot1", 1), records);
  ItemStatistics twice = store.getStatistics("Gap-A");

  REQUIRE(twice.getSampleCount() == 2 * once.getSampleCount());
  REQUIRE(*twice.getMean() == Approx(*once.getMean()));
  REQUIRE(*twice.getStdDev() == Approx(*once.getStdDev()));
  REQUIRE(store.getBatches().size() == 2u);
}

TEST_CASE("SessionStore snapshots are immutable", "[SessionStore]")
{
  SessionStore store;
  store.merge(store.createBatch("lot1", 1), createRecords("Gap-A", { 98, 99, 100 }));

  SessionStore::SeriesPtr before = store.getSeries("Gap-A");
  store.merge(store.createBatch("lot2", 1), createRecords("Gap-A", { 101, 102 }));

  REQUIRE(before->getNumRecords() == 3u);
  REQUIRE(before->getStatistics().getSampleCount() == 3u);
  REQUIRE(store.getSeries("Gap-A")->getNumRecords() == 5u);
}

TEST_CASE("SessionStore reset", "[SessionStore]")
{
  SessionStore store;
  ImportBatch first = store.createBatch("lot1", 1);
  store.merge(first, createRecords("Gap-A", { 98, 99, 100 }, first.getBatchId()));

  store.reset();

  REQUIRE(store.getNumItems() == 0u);
  REQUIRE(store.getTotalRecordCount() == 0u);
  REQUIRE(store.getBatches().empty());
  REQUIRE_THROWS_AS(store.getStatistics("Gap-A"), std::out_of_range);

  // Batch ids are never reused
  ImportBatch second = store.createBatch("lot1", 1);
  REQUIRE(second.getBatchId() > first.getBatchId());

  store.merge(second, createRecords("Gap-A", { 101, 102 }, second.getBatchId()));
  REQUIRE(store.getStatistics("Gap-A").getSampleCount() == 2u);
}

TEST_CASE("SessionStore merge of parsed reports", "[SessionStore]")
{
  SessionStore store;
  ImportBatch batch = store.createBatch("folder", 3);

  FileImportOutcome partial("b.csv", FileImportStatus::Imported);
  partial.addRowFailure(RowFailure(7, "Measured Value is not a number"));

  std::vector<ParsedReport> reports;
  reports.emplace_back(FileImportOutcome("a.csv", FileImportStatus::Imported),
		       createRecords("Gap-A", { 98, 99 }, batch.getBatchId()));
  reports.emplace_back(partial, createRecords("Gap-A", { 100 }, batch.getBatchId()));
  reports.emplace_back(FileImportOutcome("c.pdf", FileImportStatus::Malformed, "header not found"));

  ImportResult result = store.merge(batch, reports);

  REQUIRE(result.getNumFilesImported() == 2u);
  REQUIRE(result.getNumFilesFailed() == 1u);
  REQUIRE(result.getNumRecordsImported() == 3u);
  REQUIRE(result.getNumRowsFailed() == 1u);
  REQUIRE(result.hasFailures());
  REQUIRE_FALSE(result.isCancelled());
  REQUIRE(result.getFailures().size() == 2u);

  // Records of one batch follow the file order
  std::vector<MeasurementRecord> records = store.getRecords("Gap-A");
  REQUIRE(records.size() == 3u);
  REQUIRE(records[0].getMeasuredValue() == 98.0);
  REQUIRE(records[2].getMeasuredValue() == 100.0);
}

TEST_CASE("SessionStore readers see whole batches", "[SessionStore]")
{
  const std::size_t kBatchSize = 20;
  const int kNumBatches = 50;

  SessionStore store;
  std::atomic<bool> done(false);
  std::atomic<bool> torn(false);

  std::vector<double> values;
  for (std::size_t i = 0; i < kBatchSize; ++i)
    values.push_back(100.0 + static_cast<double>(i % 5));

  std::thread writer([&]() {
      for (int i = 0; i < kNumBatches; ++i)
	{
	  ImportBatch batch = store.createBatch("lot", 1);
	  std::vector<MeasurementRecord> records =
	    concat(createRecords("Gap-A", values, batch.getBatchId()),
		   createRecords("Gap-B", values, batch.getBatchId()));
	  store.merge(batch, records);
	}
      done = true;
    });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r)
    readers.emplace_back([&]() {
	while (!done)
	  {
	    std::vector<SessionStore::SeriesPtr> snapshot = store.getSnapshot();
	    for (const auto& series : snapshot)
	      {
		const std::size_t numRecords = series->getNumRecords();
		if (numRecords % kBatchSize != 0 ||
		    series->getStatistics().getRecordCount() != numRecords)
		  torn = true;
	      }

	    // Both items of a batch are published together
	    if (snapshot.size() == 2 &&
		snapshot[0]->getNumRecords() != snapshot[1]->getNumRecords())
	      torn = true;
	  }
      });

  writer.join();
  for (auto& reader : readers)
    reader.join();

  REQUIRE_FALSE(torn.load());
  REQUIRE(store.getStatistics("Gap-A").getSampleCount() == kBatchSize * kNumBatches);
}
