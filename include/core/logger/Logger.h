// ============================================================================
// LOGGER - Multi-Channel Structured Logging
// ============================================================================
// Multi-level logging (ERROR, WARN, INFO, DEBUG) with two output channels:
// - Console (ERROR/WARN on stderr, the rest on stdout)
// - Buffered session file output with circular log buffer
// Includes log file management (session file naming, start/end banners).
// ============================================================================

#ifndef LOGGER_H
#define LOGGER_H

#include <array>
#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <string>
#include "core/Config.h"
#include "core/Types.h"

// Forward declaration
class FileSystem;

// ============================================================================
// LOG ENTRY STRUCTURE
// ============================================================================
struct LogEntry {
  std::chrono::system_clock::time_point timestamp{};
  LogLevel level = LogLevel::LOG_INFO;
  std::string message;

  LogEntry() = default;
};

// ============================================================================
// LOGGER CLASS
// ============================================================================
class Logger {
public:
  // ========================================================================
  // CONSTRUCTOR & LIFECYCLE
  // ========================================================================

  /**
   * @param fs Reference to FileSystem for log file operations
   */
  explicit Logger(FileSystem& fs);

  /**
   * Initialize log file (creates logs dir, opens session file)
   * Must be called after FileSystem::mount()
   * @return true if log file opened successfully
   */
  bool initializeLogFile();

  /**
   * Shutdown: flush + close log file
   */
  void shutdown();

  // ========================================================================
  // LOGGING INTERFACE
  // ========================================================================

  /**
   * Main logging function: outputs to console + file buffer
   * Safe to call from any thread
   * @param level Severity level
   * @param message Log message
   */
  void log(LogLevel level, const std::string& message);

  // Convenience methods
  void error(const std::string& message);
  void warn(const std::string& message);
  void info(const std::string& message);
  void debug(const std::string& message);

  /**
   * Flush log buffer to disk
   * Cheap when nothing is due: callers can invoke it from hot loops
   * @param forceFlush Flush even if the interval has not elapsed
   */
  void flushLogBuffer(bool forceFlush = false);

  // ========================================================================
  // LOG LEVEL MANAGEMENT
  // ========================================================================

  void setLogLevel(LogLevel level) { _currentLogLevel = level; }
  LogLevel getLogLevel() const { return _currentLogLevel; }

  /** Fast check for hot-path debug guards */
  bool isDebugEnabled() const { return _loggingEnabled && _currentLogLevel >= LogLevel::LOG_DEBUG; }

  void setLoggingEnabled(bool enabled) { _loggingEnabled = enabled; }
  bool isLoggingEnabled() const { return _loggingEnabled; }

  // ========================================================================
  // LOG FILE INFO
  // ========================================================================

  std::string getCurrentLogFile() const { return _currentLogFileName; }

private:
  FileSystem& _fs;

  // Log file state
  std::ofstream _logFile;
  std::atomic<bool> _fileOpen;
  std::string _currentLogFileName;

  // Logging state
  LogLevel _currentLogLevel;
  bool _loggingEnabled;

  // Circular log buffer (protected by _logMutex, writers never block long)
  // Head/tail ring buffer: _head = next write position, _count = valid entries
  std::array<LogEntry, LOG_BUFFER_SIZE> _logBuffer;
  int _logBufferHead;            // Next write position (0..LOG_BUFFER_SIZE-1)
  int _logBufferCount;           // Number of valid entries (0..LOG_BUFFER_SIZE)
  std::chrono::steady_clock::time_point _lastLogFlush;
  std::timed_mutex _logMutex;
  std::mutex _consoleMutex;
  std::mutex _fileMutex;         // Serializes flushes

  // ========================================================================
  // PRIVATE HELPERS
  // ========================================================================

  /** Generate log filename with session suffix */
  std::string generateLogFilename();

  /** Get log level prefix string ([ERROR], [WARN], etc.) */
  const char* getLevelPrefix(LogLevel level) const;
};

#endif // LOGGER_H
