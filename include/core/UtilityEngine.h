// ============================================================================
// UTILITY ENGINE - System Services Facade
// ============================================================================
// Lightweight facade that coordinates two focused sub-systems:
//   - Logger         (core/logger/): console + session file logging
//   - FileSystem     (core/filesystem/): data directory + JSON helpers
//
// Public methods forward inline to sub-objects, providing a single
// access point for all system services.
// ============================================================================

#ifndef UTILITY_ENGINE_H
#define UTILITY_ENGINE_H

#include <ArduinoJson.h>
#include <string>
#include "core/Types.h"

// Sub-object headers
#include "core/logger/Logger.h"
#include "core/filesystem/FileSystem.h"

// ============================================================================
// UTILITY ENGINE CLASS
// ============================================================================
class UtilityEngine {

public:
  // ========================================================================
  // CONSTRUCTOR & LIFECYCLE
  // ========================================================================

  UtilityEngine();

  /**
   * Full initialization sequence:
   * 1. FileSystem (mount data directory) → 2. Logger (session file)
   * Console logging works before (and without) initialize()
   * @param dataDirectory Root for logs, CSV and summaries
   * @param fileLogging Open a session log file under <data>/logs
   */
  bool initialize(const std::string& dataDirectory, bool fileLogging);

  /** Flush and close the session log */
  void shutdown();

  // ========================================================================
  // LOGGING FACADE (inline forwarding)
  // ========================================================================

  void log(LogLevel level, const std::string& message)  { _logger.log(level, message); }
  void error(const std::string& message)                { _logger.error(message); }
  void warn(const std::string& message)                 { _logger.warn(message); }
  void info(const std::string& message)                 { _logger.info(message); }
  void debug(const std::string& message)                { _logger.debug(message); }
  void flushLogBuffer(bool forceFlush = false)          { _logger.flushLogBuffer(forceFlush); }
  void setLogLevel(LogLevel level)                      { _logger.setLogLevel(level); }
  LogLevel getLogLevel() const                          { return _logger.getLogLevel(); }
  bool isDebugEnabled() const                           { return _logger.isDebugEnabled(); }
  std::string getCurrentLogFile() const                 { return _logger.getCurrentLogFile(); }

  // ========================================================================
  // FILESYSTEM FACADE
  // ========================================================================

  bool isFilesystemReady() const                                  { return _fs.isReady(); }
  std::string resolvePath(const std::string& path) const          { return _fs.resolve(path); }
  bool fileExists(const std::string& path) const                  { return _fs.fileExists(path); }
  bool createDirectory(const std::string& path)                   { return _fs.createDirectory(path); }
  uint64_t getAvailableBytes() const                              { return _fs.getAvailableBytes(); }
  bool loadJsonFile(const std::string& path, JsonDocument& doc, std::string& errorMsg) const {
    return _fs.loadJsonFile(path, doc, errorMsg);
  }
  bool saveJsonFile(const std::string& path, const JsonDocument& doc, std::string& errorMsg) {
    return _fs.saveJsonFile(path, doc, errorMsg);
  }

  // ========================================================================
  // TIME UTILITIES
  // ========================================================================

  std::string getFormattedTime(const char* format = "%Y-%m-%d %H:%M:%S") const;

private:
  // ========================================================================
  // SUB-OBJECTS (owned)
  // ========================================================================

  FileSystem     _fs;
  Logger         _logger;

}; // class UtilityEngine

// ============================================================================
// GLOBAL ENGINE POINTER (set by main / test runner, accessible everywhere)
// ============================================================================
extern UtilityEngine* engine;

#endif // UTILITY_ENGINE_H
