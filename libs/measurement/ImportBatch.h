// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __IMPORT_BATCH_H
#define __IMPORT_BATCH_H 1

#include <cstddef>
#include <string>
#include "MeasurementRecord.h"

namespace mkc_measurement
{
  //
  // class ImportBatch
  //
  // Metadata of one import operation. Batches are never mutated.
  //

  class ImportBatch
  {
  public:
    ImportBatch(BatchId batchId,
		const std::string& sourcePath,
		std::size_t fileCount,
		const ptime& importedAt)
      : mBatchId(batchId),
	mSourcePath(sourcePath),
	mFileCount(fileCount),
	mImportedAt(importedAt)
    {}

    BatchId getBatchId() const
    {
      return mBatchId;
    }

    const std::string& getSourcePath() const
    {
      return mSourcePath;
    }

    std::size_t getFileCount() const
    {
      return mFileCount;
    }

    const ptime& getImportedAt() const
    {
      return mImportedAt;
    }

  private:
    BatchId mBatchId;
    std::string mSourcePath;
    std::size_t mFileCount;
    ptime mImportedAt;
  };
} // namespace mkc_measurement

#endif // __IMPORT_BATCH_H
