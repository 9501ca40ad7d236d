// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ImportResult.h"

namespace mkc_measurement
{
  std::string toString(FileImportStatus status)
  {
    switch (status)
      {
      case FileImportStatus::Imported:
	return "Imported";
      case FileImportStatus::Malformed:
	return "Malformed";
      case FileImportStatus::IOError:
	return "IOError";
      case FileImportStatus::Cancelled:
	return "Cancelled";
      }

    return "Unknown";
  }

  ImportResult::ImportResult(const ImportBatch& batch, std::size_t maxReportedFailures)
    : mBatch(batch),
      mMaxReportedFailures(maxReportedFailures),
      mFileOutcomes(),
      mNumFilesImported(0),
      mNumFilesFailed(0),
      mNumFilesCancelled(0),
      mNumRecordsImported(0),
      mNumRowsFailed(0),
      mFailures(),
      mNumUnreportedFailures(0)
  {}

  void ImportResult::addFileOutcome(const FileImportOutcome& outcome)
  {
    mFileOutcomes.push_back(outcome);

    switch (outcome.getStatus())
      {
      case FileImportStatus::Imported:
	++mNumFilesImported;
	mNumRecordsImported += outcome.getRecordCount();
	break;
      case FileImportStatus::Malformed:
      case FileImportStatus::IOError:
	++mNumFilesFailed;
	addFailure(outcome.getFilePath() + ": " + outcome.getMessage());
	break;
      case FileImportStatus::Cancelled:
	++mNumFilesCancelled;
	break;
      }

    for (const auto& rowFailure : outcome.getRowFailures())
      {
	++mNumRowsFailed;
	addFailure(outcome.getFilePath() + ":" + std::to_string(rowFailure.getLineNumber()) +
		   ": " + rowFailure.getMessage());
      }
  }

  void ImportResult::addRecords(std::size_t recordCount)
  {
    mNumRecordsImported += recordCount;
  }

  void ImportResult::addFailure(const std::string& description)
  {
    if (mFailures.size() < mMaxReportedFailures)
      mFailures.push_back(description);
    else
      ++mNumUnreportedFailures;
  }
} // namespace mkc_measurement
