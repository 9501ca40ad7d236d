// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __IMPORT_RESULT_H
#define __IMPORT_RESULT_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ImportBatch.h"
#include "MeasurementRecord.h"

namespace mkc_measurement
{
  enum class FileImportStatus
    {
      Imported,
      Malformed,
      IOError,
      Cancelled
    };

  std::string toString(FileImportStatus status);

  // A data row that could not be normalized
  class RowFailure
  {
  public:
    RowFailure(unsigned int lineNumber, const std::string& message)
      : mLineNumber(lineNumber),
	mMessage(message)
    {}

    unsigned int getLineNumber() const
    {
      return mLineNumber;
    }

    const std::string& getMessage() const
    {
      return mMessage;
    }

  private:
    unsigned int mLineNumber;
    std::string mMessage;
  };

  //
  // class FileImportOutcome
  //
  // What happened to one report file. Only an Imported file contributes
  // records; its rejected rows are listed in getRowFailures().
  //

  class FileImportOutcome
  {
  public:
    FileImportOutcome(const std::string& filePath,
		      FileImportStatus status,
		      const std::string& message = std::string())
      : mFilePath(filePath),
	mStatus(status),
	mMessage(message),
	mRecordCount(0),
	mRowFailures()
    {}

    const std::string& getFilePath() const
    {
      return mFilePath;
    }

    FileImportStatus getStatus() const
    {
      return mStatus;
    }

    bool isImported() const
    {
      return mStatus == FileImportStatus::Imported;
    }

    // Reason for a file level failure, empty when imported
    const std::string& getMessage() const
    {
      return mMessage;
    }

    std::size_t getRecordCount() const
    {
      return mRecordCount;
    }

    void setRecordCount(std::size_t recordCount)
    {
      mRecordCount = recordCount;
    }

    void addRowFailure(const RowFailure& failure)
    {
      mRowFailures.push_back(failure);
    }

    const std::vector<RowFailure>& getRowFailures() const
    {
      return mRowFailures;
    }

  private:
    std::string mFilePath;
    FileImportStatus mStatus;
    std::string mMessage;
    std::size_t mRecordCount;
    std::vector<RowFailure> mRowFailures;
  };

  //
  // class ParsedReport
  //
  // Outcome of parsing one file plus the records it produced.
  //

  class ParsedReport
  {
  public:
    explicit ParsedReport(const FileImportOutcome& outcome,
			  std::vector<MeasurementRecord> records = std::vector<MeasurementRecord>())
      : mOutcome(outcome),
	mRecords(std::move(records))
    {
      mOutcome.setRecordCount(mRecords.size());
    }

    const FileImportOutcome& getOutcome() const
    {
      return mOutcome;
    }

    const std::vector<MeasurementRecord>& getRecords() const
    {
      return mRecords;
    }

  private:
    FileImportOutcome mOutcome;
    std::vector<MeasurementRecord> mRecords;
  };

  /**
   * @class ImportResult
   * @brief Aggregate result of one merge into the session store.
   *
   * Row and file level problems never raise; they are counted here and
   * described in a bounded list of failure messages. Messages beyond the
   * bound are only counted (getNumUnreportedFailures()).
   */
  class ImportResult
  {
  public:
    static constexpr std::size_t kDefaultMaxReportedFailures = 50;

    explicit ImportResult(const ImportBatch& batch,
			  std::size_t maxReportedFailures = kDefaultMaxReportedFailures);

    void addFileOutcome(const FileImportOutcome& outcome);
    void addRecords(std::size_t recordCount);

    const ImportBatch& getBatch() const
    {
      return mBatch;
    }

    const std::vector<FileImportOutcome>& getFileOutcomes() const
    {
      return mFileOutcomes;
    }

    std::size_t getNumFilesImported() const
    {
      return mNumFilesImported;
    }

    // Malformed and unreadable files
    std::size_t getNumFilesFailed() const
    {
      return mNumFilesFailed;
    }

    std::size_t getNumFilesCancelled() const
    {
      return mNumFilesCancelled;
    }

    std::size_t getNumRecordsImported() const
    {
      return mNumRecordsImported;
    }

    std::size_t getNumRowsFailed() const
    {
      return mNumRowsFailed;
    }

    const std::vector<std::string>& getFailures() const
    {
      return mFailures;
    }

    std::size_t getNumUnreportedFailures() const
    {
      return mNumUnreportedFailures;
    }

    bool isCancelled() const
    {
      return mNumFilesCancelled > 0;
    }

    bool hasFailures() const
    {
      return mNumFilesFailed > 0 || mNumRowsFailed > 0;
    }

  private:
    void addFailure(const std::string& description);

  private:
    ImportBatch mBatch;
    std::size_t mMaxReportedFailures;
    std::vector<FileImportOutcome> mFileOutcomes;
    std::size_t mNumFilesImported;
    std::size_t mNumFilesFailed;
    std::size_t mNumFilesCancelled;
    std::size_t mNumRecordsImported;
    std::size_t mNumRowsFailed;
    std::vector<std::string> mFailures;
    std::size_t mNumUnreportedFailures;
  };
} // namespace mkc_measurement

#endif // __IMPORT_RESULT_H
