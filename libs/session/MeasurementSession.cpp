// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "MeasurementSession.h"
#include "ParallelExecutors.h"
#include "RecordReportWriter.h"
#include "StatisticsReportWriter.h"

namespace mkc_measurement
{
  MeasurementSession::MeasurementSession(const AnalyzerConfiguration& configuration)
    : mConfiguration(configuration),
      mStore(StatisticsEngine(configuration.getMinConfidentSamples()),
	     configuration.getMaxReportedFailures()),
      mSolver(configuration.getToleranceSolverOptions()),
      mExecutor(concurrency::createExecutor(configuration.getWorkerThreads())),
      mImporter(mStore, *mExecutor,
		configuration.getReportSourceOptions(),
		configuration.getDuplicateReportPolicy())
  {}

  ImportResult MeasurementSession::importFolder(const std::string& folder,
						const CancellationToken* token,
						ImportProgressObserver* observer)
  {
    return mImporter.importFolder(folder, token, observer);
  }

  ImportResult MeasurementSession::importFiles(const std::vector<std::string>& files,
					       const CancellationToken* token,
					       ImportProgressObserver* observer)
  {
    const std::string sourcePath = (files.size() == 1) ? files.front() : std::string("<file list>");
    return mImporter.importFiles(sourcePath, files, token, observer);
  }

  std::future<ImportResult>
  MeasurementSession::importFolderAsync(const std::string& folder,
					std::shared_ptr<CancellationToken> token,
					std::shared_ptr<ImportProgressObserver> observer)
  {
    return std::async(std::launch::async, [this, folder, token, observer]() {
	return mImporter.importFolder(folder, token.get(), observer.get());
      });
  }

  std::vector<std::string> MeasurementSession::listItems() const
  {
    return mStore.listItems();
  }

  ItemStatistics MeasurementSession::getStatistics(const std::string& itemName) const
  {
    return mStore.getStatistics(itemName);
  }

  std::vector<MeasurementRecord> MeasurementSession::getRecords(const std::string& itemName) const
  {
    return mStore.getRecords(itemName);
  }

  ToleranceSuggestion MeasurementSession::suggestTolerance(const std::string& itemName,
							   double targetYield) const
  {
    // The yield is checked before the item is looked up
    mSolver.computeZScore(targetYield);
    return mSolver.suggestTolerance(mStore.getStatistics(itemName), targetYield);
  }

  ToleranceSuggestion MeasurementSession::suggestTolerance(const std::string& itemName) const
  {
    return suggestTolerance(itemName, mConfiguration.getTargetYield());
  }

  void MeasurementSession::exportStatistics(std::ostream& out, double targetYield) const
  {
    StatisticsReportWriter writer(out, mStore.getSnapshot(), mSolver, targetYield);
    writer.writeFile();
  }

  void MeasurementSession::exportStatistics(const std::string& fileName, double targetYield) const
  {
    StatisticsReportWriter writer(fileName, mStore.getSnapshot(), mSolver, targetYield);
    writer.writeFile();
  }

  std::size_t MeasurementSession::exportRecords(std::ostream& out, bool onlyFailures) const
  {
    RecordReportWriter writer(out, mStore.getSnapshot(), onlyFailures);
    return writer.writeFile();
  }

  std::size_t MeasurementSession::exportRecords(const std::string& fileName, bool onlyFailures) const
  {
    RecordReportWriter writer(fileName, mStore.getSnapshot(), onlyFailures);
    return writer.writeFile();
  }

  void MeasurementSession::reset()
  {
    mStore.reset();
  }
} // namespace mkc_measurement
