// ============================================================================
// SETTINGS_LOADER IMPLEMENTATION
// ============================================================================

#include "core/settings/SettingsLoader.h"
#include "core/Format.h"
#include "core/UtilityEngine.h"
#include "core/Validators.h"
#include "core/filesystem/FileSystem.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace {

std::string keyName(const char* section, const char* key) {
  return std::string(section) + "." + key;
}

bool readNumber(JsonObjectConst obj, const char* section, const char* key, double& out, std::string& errorMsg) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return true;
  if (!v.is<double>()) {
    errorMsg = keyName(section, key) + " must be a number";
    return false;
  }
  out = v.as<double>();
  return true;
}

bool readFloat(JsonObjectConst obj, const char* section, const char* key, float& out, std::string& errorMsg) {
  double value = out;
  if (!readNumber(obj, section, key, value, errorMsg)) return false;
  out = static_cast<float>(value);
  return true;
}

bool readUnsigned(JsonObjectConst obj, const char* section, const char* key, uint32_t& out, std::string& errorMsg) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return true;
  if (!v.is<int64_t>()) {
    errorMsg = keyName(section, key) + " must be an integer";
    return false;
  }
  int64_t n = v.as<int64_t>();
  if (n < 0 || n > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
    errorMsg = keyName(section, key) + " out of range: " + std::to_string(n);
    return false;
  }
  out = static_cast<uint32_t>(n);
  return true;
}

bool readInt(JsonObjectConst obj, const char* section, const char* key, int& out, std::string& errorMsg) {
  uint32_t value = static_cast<uint32_t>(out > 0 ? out : 0);
  if (!readUnsigned(obj, section, key, value, errorMsg)) return false;
  if (value > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
    errorMsg = keyName(section, key) + " out of range";
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

bool readBool(JsonObjectConst obj, const char* section, const char* key, bool& out, std::string& errorMsg) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return true;
  if (!v.is<bool>()) {
    errorMsg = keyName(section, key) + " must be true or false";
    return false;
  }
  out = v.as<bool>();
  return true;
}

bool readString(JsonObjectConst obj, const char* section, const char* key, std::string& out, std::string& errorMsg) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return true;
  if (!v.is<const char*>()) {
    errorMsg = keyName(section, key) + " must be a string";
    return false;
  }
  out = v.as<const char*>();
  return true;
}

// Missing section = empty object, anything else but an object is an error
bool section(JsonVariantConst root, const char* name, JsonObjectConst& obj, std::string& errorMsg) {
  JsonVariantConst v = root[name];
  if (v.isNull()) {
    obj = JsonObjectConst();
    return true;
  }
  if (!v.is<JsonObjectConst>()) {
    errorMsg = std::string("\"") + name + "\" must be an object";
    return false;
  }
  obj = v.as<JsonObjectConst>();
  return true;
}

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

} // namespace

// ============================================================================
// JSON → SETTINGS
// ============================================================================

bool SettingsLoader::fromJson(JsonVariantConst root, RunSettings& out, std::string& errorMsg) {
  if (!root.is<JsonObjectConst>()) {
    errorMsg = "Settings root must be a JSON object";
    return false;
  }

  JsonObjectConst serial, profile, sequencer, output, logging;
  if (!section(root, "serial", serial, errorMsg)) return false;
  if (!section(root, "profile", profile, errorMsg)) return false;
  if (!section(root, "sequencer", sequencer, errorMsg)) return false;
  if (!section(root, "output", output, errorMsg)) return false;
  if (!section(root, "logging", logging, errorMsg)) return false;

  // Serial
  SerialSettings& s = out.serial;
  if (!readString(serial, "serial", "port", s.port, errorMsg)) return false;
  if (!readUnsigned(serial, "serial", "baudRate", s.baudRate, errorMsg)) return false;
  if (!readUnsigned(serial, "serial", "responseTimeoutMs", s.responseTimeoutMs, errorMsg)) return false;
  if (!readUnsigned(serial, "serial", "queryTimeoutMs", s.queryTimeoutMs, errorMsg)) return false;
  if (!readUnsigned(serial, "serial", "settleDelayMs", s.settleDelayMs, errorMsg)) return false;

  // Profile
  TestProfile& p = out.profile;
  std::string kind;
  if (!readString(profile, "profile", "kind", kind, errorMsg)) return false;
  if (!kind.empty() && !parseProfileKind(kind, p.kind)) {
    errorMsg = "profile.kind must be \"stationary\" or \"sinusoid\" (got \"" + kind + "\")";
    return false;
  }
  if (!readFloat(profile, "profile", "targetPositionDeg", p.targetPositionDeg, errorMsg)) return false;
  if (!readFloat(profile, "profile", "amplitudeDeg", p.amplitudeDeg, errorMsg)) return false;
  if (!readFloat(profile, "profile", "frequencyHz", p.frequencyHz, errorMsg)) return false;
  if (!readUnsigned(profile, "profile", "cycleCount", p.cycleCount, errorMsg)) return false;
  if (!readNumber(profile, "profile", "samplePeriodSec", p.samplePeriodSec, errorMsg)) return false;
  if (!readNumber(profile, "profile", "durationSec", p.durationSec, errorMsg)) return false;

  // Alternative to samplePeriodSec
  if (!profile["sampleRateHz"].isNull()) {
    if (!profile["samplePeriodSec"].isNull()) {
      errorMsg = "profile.sampleRateHz and profile.samplePeriodSec are mutually exclusive";
      return false;
    }
    double rateHz = 0.0;
    if (!readNumber(profile, "profile", "sampleRateHz", rateHz, errorMsg)) return false;
    if (rateHz <= 0.0) {
      errorMsg = "profile.sampleRateHz must be > 0";
      return false;
    }
    p.samplePeriodSec = 1.0 / rateHz;
  }

  // Sequencer timing
  SequencerTiming& t = out.timing;
  if (!readBool(sequencer, "sequencer", "stopBeforeHoming", t.stopBeforeHoming, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "preHomingSettleMs", t.preHomingSettleMs, errorMsg)) return false;
  if (!readInt(sequencer, "sequencer", "homingMaxAttempts", t.homingMaxAttempts, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "homingPollIntervalMs", t.homingPollIntervalMs, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "homingTimeoutMs", t.homingTimeoutMs, errorMsg)) return false;
  if (!readFloat(sequencer, "sequencer", "homingStableToleranceDeg", t.homingStableToleranceDeg, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "homingMinSettleMs", t.homingMinSettleMs, errorMsg)) return false;
  if (!readBool(sequencer, "sequencer", "zeroAfterHoming", t.zeroAfterHoming, errorMsg)) return false;
  if (!readInt(sequencer, "sequencer", "positioningMaxAttempts", t.positioningMaxAttempts, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "positioningPollIntervalMs", t.positioningPollIntervalMs, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "positioningTimeoutMs", t.positioningTimeoutMs, errorMsg)) return false;
  if (!readFloat(sequencer, "sequencer", "positionToleranceDeg", t.positionToleranceDeg, errorMsg)) return false;
  if (!readInt(sequencer, "sequencer", "configurationMaxAttempts", t.configurationMaxAttempts, errorMsg)) return false;
  if (!readInt(sequencer, "sequencer", "startMaxAttempts", t.startMaxAttempts, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "startConfirmIntervalMs", t.startConfirmIntervalMs, errorMsg)) return false;
  if (!readFloat(sequencer, "sequencer", "startMotionThresholdDeg", t.startMotionThresholdDeg, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "retryBackoffMs", t.retryBackoffMs, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "acquisitionMaxRetries", t.acquisitionMaxRetries, errorMsg)) return false;
  if (!readUnsigned(sequencer, "sequencer", "progressLogInterval", t.progressLogInterval, errorMsg)) return false;

  // Output
  if (!readString(output, "output", "dataDirectory", out.dataDirectory, errorMsg)) return false;
  if (!readString(output, "output", "csvFile", out.outputFile, errorMsg)) return false;
  if (!readUnsigned(output, "output", "flushEvery", out.csvFlushEvery, errorMsg)) return false;

  // Logging
  std::string level;
  if (!readString(logging, "logging", "level", level, errorMsg)) return false;
  if (!level.empty() && !parseLogLevel(level, out.logLevel)) {
    errorMsg = "logging.level must be ERROR, WARN, INFO or DEBUG (got \"" + level + "\")";
    return false;
  }
  if (!readBool(logging, "logging", "file", out.fileLogging, errorMsg)) return false;

  return validate(out, errorMsg);
}

// ============================================================================
// FILE
// ============================================================================

bool SettingsLoader::loadFile(const std::string& path, RunSettings& out, std::string& errorMsg) {
  // Settings paths are relative to the working directory, not the data root
  FileSystem cwd;
  if (!cwd.mount(".")) {
    errorMsg = "Cannot access working directory";
    return false;
  }

  if (!cwd.fileExists(path)) {
    engine->info("[Settings] No " + path + ", using built-in defaults");
    return validate(out, errorMsg);
  }

  JsonDocument doc;
  if (!cwd.loadJsonFile(path, doc, errorMsg)) {
    return false;
  }

  if (!fromJson(doc.as<JsonVariantConst>(), out, errorMsg)) {
    errorMsg = path + ": " + errorMsg;
    return false;
  }

  engine->info("[Settings] ✅ Loaded " + path);
  return true;
}

bool SettingsLoader::validate(const RunSettings& settings, std::string& errorMsg) {
  if (settings.serial.port.empty()) {
    errorMsg = "serial.port must not be empty";
    return false;
  }
  if (!Validators::baudRate(settings.serial.baudRate, errorMsg)) return false;
  if (!Validators::timeoutMs(settings.serial.responseTimeoutMs, "serial.responseTimeoutMs", errorMsg)) return false;
  if (!Validators::timeoutMs(settings.serial.queryTimeoutMs, "serial.queryTimeoutMs", errorMsg)) return false;
  if (!Validators::testProfile(settings.profile, errorMsg)) return false;
  if (!Validators::sequencerTiming(settings.timing, errorMsg)) return false;

  if (settings.csvFlushEvery == 0) {
    errorMsg = "output.flushEvery must be >= 1";
    return false;
  }
  return true;
}

// ============================================================================
// ENUM PARSERS
// ============================================================================

bool SettingsLoader::parseLogLevel(const std::string& text, LogLevel& level) {
  std::string t = lower(text);
  if (t == "error")                     { level = LogLevel::LOG_ERROR;   return true; }
  if (t == "warn" || t == "warning")    { level = LogLevel::LOG_WARNING; return true; }
  if (t == "info")                      { level = LogLevel::LOG_INFO;    return true; }
  if (t == "debug")                     { level = LogLevel::LOG_DEBUG;   return true; }
  return false;
}

bool SettingsLoader::parseProfileKind(const std::string& text, ProfileKind& kind) {
  std::string t = lower(text);
  if (t == "stationary") { kind = ProfileKind::PROFILE_STATIONARY; return true; }
  if (t == "sinusoid")   { kind = ProfileKind::PROFILE_SINUSOID;   return true; }
  return false;
}
