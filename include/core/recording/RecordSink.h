// ============================================================================
// RECORD_SINK - Append-only sample series (memory + CSV)
// ============================================================================
// Accepts SampleRecords in arrival order and keeps them in a SeriesBuffer.
// When opened with a path, each record is also written as a CSV row:
//   Time_Relative_sec,Position_deg
//   0.000000,12.5000
// Timestamps must strictly increase. Missing ticks are counted as gaps,
// never written as rows. The series is handed out only after seal().
// After the first failed CSV write or flush every append is refused.
// ============================================================================

#ifndef RECORD_SINK_H
#define RECORD_SINK_H

#include <cstdio>
#include <mutex>
#include <string>
#include "core/Types.h"

class RecordSink {
public:
  RecordSink();
  ~RecordSink();

  RecordSink(const RecordSink&) = delete;
  RecordSink& operator=(const RecordSink&) = delete;

  /**
   * Create / truncate the CSV file and write the header
   * @param path CSV path (empty = memory only)
   * @param flushEvery Rows between fflush() calls (0 treated as 1)
   * @param errorMsg Output error message on failure
   */
  bool open(const std::string& path, uint32_t flushEvery, std::string& errorMsg);

  /**
   * Append one sample
   * @return false if sealed, out of order, or the CSV write failed
   *         (now or on an earlier append)
   */
  bool append(const SampleRecord& record);

  /** Record a tick that produced no sample */
  void recordGap(uint64_t tick, double elapsedSec);

  /** Close the series: flush + close the CSV, no further appends */
  void seal();
  bool isSealed() const;

  /** True once a CSV row could not be written or flushed */
  bool hasWriteFailed() const;

  /**
   * Move the series out (sealed sinks only; empty otherwise)
   */
  SeriesBuffer takeSeries();

  uint64_t getSampleCount() const;
  uint64_t getGapCount() const;
  uint64_t getRejectedCount() const;
  const std::string& getPath() const { return _path; }

private:
  mutable std::mutex _mutex;
  SeriesBuffer _series;
  std::string _path;
  FILE* _file;
  uint32_t _flushEvery;
  uint32_t _rowsSinceFlush;
  bool _sealed;
  bool _writeFailed;
  uint64_t _gaps;
  uint64_t _rejected;

  void markWriteFailed();
  void closeFile();
};

#endif // RECORD_SINK_H
