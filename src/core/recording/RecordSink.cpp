// ============================================================================
// RECORD_SINK IMPLEMENTATION
// ============================================================================

#include "core/recording/RecordSink.h"
#include "core/Config.h"
#include "core/Format.h"
#include "core/UtilityEngine.h"

#include <cerrno>
#include <cstring>
#include <filesystem>

RecordSink::RecordSink()
  : _file(nullptr),
    _flushEvery(CSV_FLUSH_EVERY),
    _rowsSinceFlush(0),
    _sealed(false),
    _writeFailed(false),
    _gaps(0),
    _rejected(0) {
}

RecordSink::~RecordSink() {
  std::lock_guard<std::mutex> lock(_mutex);
  closeFile();
}

// ============================================================================
// OPEN
// ============================================================================

bool RecordSink::open(const std::string& path, uint32_t flushEvery, std::string& errorMsg) {
  std::lock_guard<std::mutex> lock(_mutex);

  if (_sealed) {
    errorMsg = "Record sink already sealed";
    return false;
  }
  closeFile();

  _path = path;
  _flushEvery = flushEvery > 0 ? flushEvery : 1;
  _rowsSinceFlush = 0;

  if (path.empty()) {
    engine->debug("[RecordSink] Memory-only series");
    return true;
  }

  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      errorMsg = "Cannot create " + parent.string() + ": " + ec.message();
      return false;
    }
  }

  _file = fopen(path.c_str(), "w");
  if (!_file) {
    errorMsg = "Cannot create " + path + ": " + std::strerror(errno);
    return false;
  }

  if (fprintf(_file, "%s\n", CSV_HEADER) < 0 || fflush(_file) != 0) {
    errorMsg = "Cannot write CSV header to " + path;
    closeFile();
    return false;
  }

  engine->info("[RecordSink] 📝 Recording to " + path);
  return true;
}

// ============================================================================
// APPEND
// ============================================================================

bool RecordSink::append(const SampleRecord& record) {
  std::lock_guard<std::mutex> lock(_mutex);

  if (_sealed) {
    _rejected++;
    engine->error("[RecordSink] ❌ Append after seal rejected");
    return false;
  }

  if (!_series.empty() && record.timeSec <= _series.back().timeSec) {
    _rejected++;
    engine->error("[RecordSink] ❌ Out-of-order sample rejected: " + toFixed(record.timeSec, 6) +
                  " <= " + toFixed(_series.back().timeSec, 6));
    return false;
  }

  if (_writeFailed) {
    _rejected++;
    return false;
  }

  _series.push_back(record);

  if (!_file) return true;

  if (fprintf(_file, "%.6f,%.4f\n", record.timeSec, static_cast<double>(record.positionDeg)) < 0) {
    engine->error("[RecordSink] ❌ CSV write failed: " + std::string(std::strerror(errno)));
    markWriteFailed();
    return false;
  }

  if (++_rowsSinceFlush >= _flushEvery) {
    _rowsSinceFlush = 0;
    if (fflush(_file) != 0) {
      engine->error("[RecordSink] ❌ CSV flush failed: " + std::string(std::strerror(errno)));
      markWriteFailed();
      return false;
    }
  }

  return true;
}

void RecordSink::recordGap(uint64_t tick, double elapsedSec) {
  std::lock_guard<std::mutex> lock(_mutex);
  _gaps++;
  engine->debug("[RecordSink] Gap at tick " + std::to_string(tick) + " (t=" + toFixed(elapsedSec, 3) + " s)");
}

// ============================================================================
// SEAL / HANDOUT
// ============================================================================

void RecordSink::seal() {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_sealed) return;

  closeFile();
  _sealed = true;
  engine->info("[RecordSink] 🔒 Series sealed: " + std::to_string(_series.size()) + " samples, " +
               std::to_string(_gaps) + " gaps");
}

bool RecordSink::isSealed() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _sealed;
}

SeriesBuffer RecordSink::takeSeries() {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_sealed) {
    engine->error("[RecordSink] ❌ Series requested before seal");
    return SeriesBuffer();
  }
  return std::move(_series);
}

bool RecordSink::hasWriteFailed() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _writeFailed;
}

uint64_t RecordSink::getSampleCount() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _series.size();
}

uint64_t RecordSink::getGapCount() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _gaps;
}

uint64_t RecordSink::getRejectedCount() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _rejected;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

// The row that hit the failure is dropped from the series too
void RecordSink::markWriteFailed() {
  _writeFailed = true;
  _series.pop_back();
  _rejected++;
}

void RecordSink::closeFile() {
  if (!_file) return;
  if (fflush(_file) != 0) {
    engine->error("[RecordSink] ❌ Final CSV flush failed: " + _path);
  }
  if (fclose(_file) != 0) {
    engine->error("[RecordSink] ❌ Closing CSV failed: " + _path);
  }
  _file = nullptr;
}
