// ============================================================================
// LOGGER IMPLEMENTATION
// ============================================================================

#include "core/logger/Logger.h"
#include "core/filesystem/FileSystem.h"
#include "core/TimeUtils.h"
#include <cstdlib>
#include <iostream>

// ============================================================================
// CONSTRUCTOR
// ============================================================================

Logger::Logger(FileSystem& fs)
  : _fs(fs),
    _fileOpen(false),
    _currentLogLevel(LogLevel::LOG_INFO),
    _loggingEnabled(true),
    _logBufferHead(0),
    _logBufferCount(0),
    _lastLogFlush(std::chrono::steady_clock::now()) {
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool Logger::initializeLogFile() {
  if (!_fs.isReady()) return false;

  // Create logs directory if needed
  if (!_fs.directoryExists(LOG_DIRECTORY)) {
    std::cout << "[Logger] 📁 Creating " << LOG_DIRECTORY << " directory..." << std::endl;
    if (!_fs.createDirectory(LOG_DIRECTORY)) {
      std::cerr << "[Logger] ❌ Failed to create " << LOG_DIRECTORY << std::endl;
      return false;
    }
  }

  _currentLogFileName = generateLogFilename();

  std::lock_guard<std::mutex> lock(_fileMutex);
  _logFile.open(_fs.resolve(_currentLogFileName), std::ios::app);
  if (!_logFile) {
    std::cerr << "[Logger] ❌ Failed to open log file: " << _currentLogFileName << std::endl;
    return false;
  }

  // Write session header
  _logFile << "\n";
  _logFile << "========================================\n";
  _logFile << "SESSION START: " << TimeUtils::format("%Y-%m-%d %H:%M:%S") << "\n";
  _logFile << "========================================\n";
  _logFile.flush();
  _fileOpen = true;

  return true;
}

void Logger::shutdown() {
  if (!_fileOpen) return;

  flushLogBuffer(true);

  std::lock_guard<std::mutex> lock(_fileMutex);
  _logFile << "========================================\n";
  _logFile << "SESSION ENDING - Engine shutdown\n";
  _logFile << "========================================\n";
  _logFile.close();
  _fileOpen = false;
}

// ============================================================================
// LOGGING
// ============================================================================

void Logger::log(LogLevel level, const std::string& message) {
  if (!_loggingEnabled) return;
  if (level > _currentLogLevel) return;

  const char* prefix = getLevelPrefix(level);

  // 1. Console output (always)
  {
    std::lock_guard<std::mutex> lock(_consoleMutex);
    std::ostream& out = (level <= LogLevel::LOG_WARNING) ? std::cerr : std::cout;
    out << prefix << message << '\n';
    out.flush();
  }

  // 2. Buffer for file write (if a session file is open)
  if (!_fileOpen) return;

  if (_logMutex.try_lock_for(std::chrono::milliseconds(10))) {
    _logBuffer[_logBufferHead].timestamp = std::chrono::system_clock::now();
    _logBuffer[_logBufferHead].level = level;
    _logBuffer[_logBufferHead].message = std::string(prefix) + message;

    _logBufferHead = (_logBufferHead + 1) % LOG_BUFFER_SIZE;
    if (_logBufferCount < LOG_BUFFER_SIZE) _logBufferCount++;
    _logMutex.unlock();
  }
}

void Logger::error(const std::string& message) { log(LogLevel::LOG_ERROR, message); }
void Logger::warn(const std::string& message)  { log(LogLevel::LOG_WARNING, message); }
void Logger::info(const std::string& message)  { log(LogLevel::LOG_INFO, message); }
void Logger::debug(const std::string& message) { log(LogLevel::LOG_DEBUG, message); }

// ============================================================================
// FLUSH BUFFER
// ============================================================================

void Logger::flushLogBuffer(bool forceFlush) {
  if (!_fileOpen) return;

  auto now = std::chrono::steady_clock::now();

  // Take mutex to safely read buffer (short hold: count + copy)
  if (!_logMutex.try_lock_for(std::chrono::milliseconds(50))) return;

  int validEntries = _logBufferCount;

  float bufferUsagePercent = (static_cast<float>(validEntries) * 100.0f) / LOG_BUFFER_SIZE;

  // Force flush if buffer is 80% full
  bool shouldForce = (bufferUsagePercent >= 80.0f);

  if (!forceFlush && !shouldForce && now - _lastLogFlush < std::chrono::milliseconds(LOG_FLUSH_INTERVAL_MS)) {
    _logMutex.unlock();
    return;
  }

  if (validEntries == 0) {
    _lastLogFlush = now;
    _logMutex.unlock();
    return;
  }

  // Oldest entry is at (_logBufferHead - _logBufferCount + LOG_BUFFER_SIZE) % LOG_BUFFER_SIZE
  int tail = (_logBufferHead - _logBufferCount + LOG_BUFFER_SIZE) % LOG_BUFFER_SIZE;
  std::array<LogEntry, LOG_BUFFER_SIZE> localBuffer;
  int localCount = validEntries;
  for (int i = 0; i < validEntries; i++) {
    int idx = (tail + i) % LOG_BUFFER_SIZE;
    localBuffer[i].timestamp = _logBuffer[idx].timestamp;
    localBuffer[i].level = _logBuffer[idx].level;
    localBuffer[i].message = std::move(_logBuffer[idx].message);
    _logBuffer[idx].message.clear();
  }
  _logBufferCount = 0;
  _lastLogFlush = now;
  _logMutex.unlock();

  // Write all valid entries in one batch (local copy, file mutex only)
  std::lock_guard<std::mutex> lock(_fileMutex);
  for (int i = 0; i < localCount; i++) {
    _logFile << "[" << TimeUtils::formatMillis(localBuffer[i].timestamp) << "] "
             << localBuffer[i].message << "\n";
  }

  _logFile.flush();
  if (!_logFile) {
    std::lock_guard<std::mutex> consoleLock(_consoleMutex);
    std::cerr << "[Logger] ⚠️ Log file write failed: " << _currentLogFileName << std::endl;
    _logFile.clear();
  }
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

std::string Logger::generateLogFilename() {
  auto dateStr = TimeUtils::format("%Y%m%d");

  // Find max suffix by scanning the logs directory
  int maxSuffix = -1;
  const std::string prefix = std::string(LOG_FILE_PREFIX) + dateStr + "_";
  const std::string extension = LOG_FILE_EXTENSION;

  for (const auto& fileName : _fs.listFiles(LOG_DIRECTORY)) {
    if (fileName.rfind(prefix, 0) != 0) continue;
    if (fileName.size() <= prefix.size() + extension.size()) continue;
    if (fileName.compare(fileName.size() - extension.size(), extension.size(), extension) != 0) continue;
    std::string suffixStr = fileName.substr(prefix.size(), fileName.size() - prefix.size() - extension.size());
    int suffix = std::atoi(suffixStr.c_str());
    if (suffix > maxSuffix) maxSuffix = suffix;
  }

  return std::string(LOG_DIRECTORY) + "/" + prefix + std::to_string(maxSuffix + 1) + extension;
}

const char* Logger::getLevelPrefix(LogLevel level) const {
  using enum LogLevel;
  switch (level) {
    case LOG_ERROR:   return "[ERROR] ";
    case LOG_WARNING: return "[WARN]  ";
    case LOG_INFO:    return "[INFO]  ";
    case LOG_DEBUG:   return "[DEBUG] ";
    default:          return "[LOG]   ";
  }
}
