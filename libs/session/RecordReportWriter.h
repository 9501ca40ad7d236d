// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __RECORD_REPORT_WRITER_H
#define __RECORD_REPORT_WRITER_H 1

#include <fstream>
#include <ostream>
#include <string>
#include <vector>
#include "SessionStore.h"

namespace mkc_measurement
{
  //
  // class RecordReportWriter
  //
  // Writes the raw record table of a session snapshot as CSV, item by item
  // in natural order and in arrival order within an item. With onlyFailures
  // set, only records judged FAIL are written.
  //

  class RecordReportWriter
  {
  public:
    // Throws IOFailure if the file cannot be created
    RecordReportWriter(const std::string& fileName,
		       const std::vector<SessionStore::SeriesPtr>& snapshot,
		       bool onlyFailures = false);

    RecordReportWriter(std::ostream& out,
		       const std::vector<SessionStore::SeriesPtr>& snapshot,
		       bool onlyFailures = false);

    RecordReportWriter(const RecordReportWriter& rhs) = delete;
    RecordReportWriter& operator=(const RecordReportWriter& rhs) = delete;

    ~RecordReportWriter() = default;

    // Returns the number of records written
    std::size_t writeFile();

  private:
    void writeRecord(const MeasurementRecord& record);

  private:
    std::ofstream mCsvFile;
    std::ostream& mOut;
    const std::vector<SessionStore::SeriesPtr> mSnapshot;
    bool mOnlyFailures;
  };
} // namespace mkc_measurement

#endif // __RECORD_REPORT_WRITER_H
