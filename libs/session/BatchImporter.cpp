// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "BatchImporter.h"
#include <algorithm>
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "MeasurementException.h"
#include "NaturalOrder.h"
#include "RecordNormalizer.h"
#include "ReportSourceFactory.h"

namespace fs = boost::filesystem;

namespace mkc_measurement
{
  std::string toString(DuplicateReportPolicy policy)
  {
    switch (policy)
      {
      case DuplicateReportPolicy::PreferCsv:
	return "PreferCsv";
      case DuplicateReportPolicy::PreferPdf:
	return "PreferPdf";
      case DuplicateReportPolicy::ImportAll:
	return "ImportAll";
      }

    return "Unknown";
  }

  DuplicateReportPolicy parseDuplicateReportPolicy(const std::string& name)
  {
    const std::string key = boost::to_lower_copy(boost::trim_copy(name));

    if (key == "prefercsv")
      return DuplicateReportPolicy::PreferCsv;
    else if (key == "preferpdf")
      return DuplicateReportPolicy::PreferPdf;
    else if (key == "importall")
      return DuplicateReportPolicy::ImportAll;

    throw std::invalid_argument("Unknown duplicate report policy: " + name);
  }

  BatchImporter::BatchImporter(SessionStore& store,
			       concurrency::IParallelExecutor& executor,
			       const ReportSourceOptions& options,
			       DuplicateReportPolicy policy)
    : mStore(store),
      mExecutor(executor),
      mOptions(options),
      mPolicy(policy)
  {}

  ImportResult BatchImporter::importFolder(const std::string& folder,
					   const CancellationToken* token,
					   ImportProgressObserver* observer)
  {
    return importFiles(folder, listReportFiles(folder, mPolicy), token, observer);
  }

  ImportResult BatchImporter::importFiles(const std::string& sourcePath,
					  const std::vector<std::string>& files,
					  const CancellationToken* token,
					  ImportProgressObserver* observer)
  {
    ImportBatch batch = mStore.createBatch(sourcePath, files.size());
    if (observer)
      observer->importStarted(batch, files.size());

    // One slot per file; a slot left untouched reports the file as cancelled
    std::vector<ParsedReport> reports;
    reports.reserve(files.size());
    for (const auto& file : files)
      reports.emplace_back(FileImportOutcome(file, FileImportStatus::Cancelled));

    std::atomic<std::size_t> completed(0);
    const std::size_t total = files.size();
    const BatchId batchId = batch.getBatchId();
    const ReportSourceOptions options = mOptions;

    std::vector<std::future<void>> futures;
    futures.reserve(files.size());
    try
      {
	for (std::size_t i = 0; i < files.size(); ++i)
	  {
	    futures.emplace_back(mExecutor.submit([&, i]() {
		  if (token && token->isCancelled())
		    return;

		  reports[i] = parseReport(files[i], batchId, options);

		  std::size_t done = ++completed;
		  if (observer)
		    observer->fileCompleted(reports[i].getOutcome(), done, total);
		}));
	  }
      }
    catch (...)
      {
	// Tasks already queued reference this frame
	for (auto& f : futures)
	  f.wait();
	throw;
      }

    mExecutor.waitAll(futures);

    ImportResult result = mStore.merge(batch, reports);
    if (observer)
      observer->importFinished(result);

    return result;
  }

  std::vector<std::string> BatchImporter::listReportFiles(const std::string& folder,
							  DuplicateReportPolicy policy)
  {
    fs::path folderPath(folder);
    boost::system::error_code ec;

    if (!fs::exists(folderPath, ec))
      throw IOFailure("Report folder does not exist: " + folder);

    if (!fs::is_directory(folderPath, ec))
      throw IOFailure("Report folder is not a directory: " + folder);

    std::vector<fs::path> candidates;
    fs::directory_iterator it(folderPath, ec);
    if (ec)
      throw IOFailure("Cannot list report folder " + folder + ": " + ec.message());

    for (; it != fs::directory_iterator(); it.increment(ec))
      {
	if (ec)
	  throw IOFailure("Cannot list report folder " + folder + ": " + ec.message());

	const fs::path& entry = it->path();
	if (fs::is_regular_file(entry, ec) &&
	    ReportSourceFactory::isSupportedReport(entry.filename().string()))
	  candidates.push_back(entry);
      }

    if (policy != DuplicateReportPolicy::ImportAll)
      {
	// Formats present per file stem
	std::map<std::string, std::pair<bool, bool>> formatsByStem;
	for (const auto& candidate : candidates)
	  {
	    auto& formats = formatsByStem[boost::to_lower_copy(candidate.stem().string())];
	    if (ReportSourceFactory::getReportFormat(candidate.string()) == ReportFormat::Pdf)
	      formats.second = true;
	    else
	      formats.first = true;
	  }

	const ReportFormat dropped = (policy == DuplicateReportPolicy::PreferCsv) ?
	  ReportFormat::Pdf : ReportFormat::Delimited;

	candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
					[&](const fs::path& candidate) {
					  const auto& formats =
					    formatsByStem[boost::to_lower_copy(candidate.stem().string())];
					  return formats.first && formats.second &&
					    ReportSourceFactory::getReportFormat(candidate.string()) == dropped;
					}),
			 candidates.end());
      }

    std::sort(candidates.begin(), candidates.end(),
	      [](const fs::path& lhs, const fs::path& rhs) {
		return naturalLess(lhs.filename().string(), rhs.filename().string());
	      });

    std::vector<std::string> files;
    files.reserve(candidates.size());
    for (const auto& candidate : candidates)
      files.push_back(candidate.string());

    return files;
  }

  ParsedReport BatchImporter::parseReport(const std::string& file,
					  BatchId batchId,
					  const ReportSourceOptions& options)
  {
    try
      {
	std::unique_ptr<ReportRowSource> source =
	  ReportSourceFactory::createReportSource(file, options);

	RecordNormalizer normalizer(ReportContext(file, batchId, source->getReportTimestamp()));
	FileImportOutcome outcome(file, FileImportStatus::Imported);
	std::vector<MeasurementRecord> records;

	RawReportRow row;
	while (true)
	  {
	    try
	      {
		if (!source->readRow(row))
		  break;

		records.push_back(normalizer.normalize(row));
	      }
	    catch (const RecordParseError& e)
	      {
		outcome.addRowFailure(RowFailure(e.getLineNumber(), e.what()));
	      }
	  }

	return ParsedReport(outcome, std::move(records));
      }
    catch (const MalformedReportError& e)
      {
	return ParsedReport(FileImportOutcome(file, FileImportStatus::Malformed, e.what()));
      }
    catch (const IOFailure& e)
      {
	return ParsedReport(FileImportOutcome(file, FileImportStatus::IOError, e.what()));
      }
  }
} // namespace mkc_measurement
