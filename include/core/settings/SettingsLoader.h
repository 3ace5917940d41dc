// ============================================================================
// SETTINGS_LOADER - JSON run settings
// ============================================================================
// Maps a JSON settings file onto RunSettings. Every key is optional and
// falls back to its Config.h default; present keys are type-checked and the
// result is validated before use.
//
// {
//   "serial":    { "port": "/dev/ttyUSB0", "baudRate": 9600,
//                  "responseTimeoutMs": 2000, "queryTimeoutMs": 500,
//                  "settleDelayMs": 2000 },
//   "profile":   { "kind": "sinusoid" | "stationary",
//                  "targetPositionDeg": 0, "amplitudeDeg": 20,
//                  "frequencyHz": 0.3, "cycleCount": 54,
//                  "samplePeriodSec": 0.2, "durationSec": 180 },
//   "sequencer": { "stopBeforeHoming": true, "homingMaxAttempts": 5, ... },
//   "output":    { "dataDirectory": ".", "csvFile": "rate_table_test.csv",
//                  "flushEvery": 1 },
//   "logging":   { "level": "INFO", "file": true }
// }
// ============================================================================

#ifndef SETTINGS_LOADER_H
#define SETTINGS_LOADER_H

#include <ArduinoJson.h>
#include <string>
#include "core/Config.h"
#include "core/Types.h"
#include "hardware/SerialTransport.h"

/**
 * Everything one invocation of the executable needs
 */
struct RunSettings {
  SerialSettings serial;
  TestProfile profile;
  SequencerTiming timing;

  std::string dataDirectory = DEFAULT_DATA_DIRECTORY;
  std::string outputFile = DEFAULT_OUTPUT_FILE;
  uint32_t csvFlushEvery = CSV_FLUSH_EVERY;

  LogLevel logLevel = LogLevel::LOG_INFO;
  bool fileLogging = true;
};

class SettingsLoader {
public:
  /**
   * Apply a parsed JSON document on top of the defaults already in out
   * @param root Document root (must be an object)
   * @param out Settings to update
   * @param errorMsg Output error message (first problem found)
   * @return true if every present key had the right type and the result is valid
   */
  static bool fromJson(JsonVariantConst root, RunSettings& out, std::string& errorMsg);

  /**
   * Load settings from a file. A missing file keeps the defaults
   * @return false on unreadable / malformed / invalid settings
   */
  static bool loadFile(const std::string& path, RunSettings& out, std::string& errorMsg);

  /** Final consistency check (also run by fromJson) */
  static bool validate(const RunSettings& settings, std::string& errorMsg);

  /** "ERROR" | "WARN" | "INFO" | "DEBUG" (case-insensitive) */
  static bool parseLogLevel(const std::string& text, LogLevel& level);

  /** "stationary" | "sinusoid" (case-insensitive) */
  static bool parseProfileKind(const std::string& text, ProfileKind& kind);
};

#endif // SETTINGS_LOADER_H
