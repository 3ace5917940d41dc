// ============================================================================
// VALIDATORS - Centralized Parameter Validation
// ============================================================================
// Purpose: All validation functions in one place for cleaner code
// - Acquisition parameters (sample period, duration)
// - Sinusoid parameters (amplitude, frequency, cycles)
// - Serial link parameters (baud rate, timeouts)
// - Composite checks (whole test profile, sequencer timing)
//
// Usage: Include this header and use Validators namespace
//   #include "core/Validators.h"
//   std::string err;
//   if (!Validators::testProfile(profile, err)) { engine->error(err); }
// ============================================================================

#ifndef VALIDATORS_H
#define VALIDATORS_H

#include <cmath>
#include <string>
#include "core/Config.h"
#include "core/Format.h"
#include "core/Types.h"

namespace Validators {

// ============================================================================
// ACQUISITION VALIDATORS
// ============================================================================

/**
 * Validate sample period (MIN_SAMPLE_PERIOD_SEC - MAX_SAMPLE_PERIOD_SEC)
 * @param periodSec Sample period in seconds
 * @param errorMsg Output error message if validation fails
 * @return true if valid, false otherwise
 */
inline bool samplePeriod(double periodSec, std::string& errorMsg) {
  if (!std::isfinite(periodSec) || periodSec <= 0.0) {
    errorMsg = "Sample period must be > 0 s (got " + toFixed(periodSec, 4) + ")";
    return false;
  }

  if (periodSec < MIN_SAMPLE_PERIOD_SEC) {
    errorMsg = "Sample period too short: " + toFixed(periodSec, 4) + " s (min: " + toFixed(MIN_SAMPLE_PERIOD_SEC, 3) + ")";
    return false;
  }

  if (periodSec > MAX_SAMPLE_PERIOD_SEC) {
    errorMsg = "Sample period too long: " + toFixed(periodSec, 1) + " s (max: " + toFixed(MAX_SAMPLE_PERIOD_SEC, 1) + ")";
    return false;
  }

  return true;
}

/**
 * Validate acquisition duration
 * @param durationSec Duration in seconds (> 0)
 */
inline bool duration(double durationSec, std::string& errorMsg) {
  if (!std::isfinite(durationSec) || durationSec <= 0.0) {
    errorMsg = "Duration must be > 0 s (got " + toFixed(durationSec, 3) + ")";
    return false;
  }

  if (durationSec > MAX_DURATION_SEC) {
    errorMsg = "Duration too long: " + toFixed(durationSec, 0) + " s (max: " + toFixed(MAX_DURATION_SEC, 0) + ")";
    return false;
  }

  return true;
}

// ============================================================================
// SINUSOID VALIDATORS
// ============================================================================

inline bool amplitude(float amplitudeDeg, std::string& errorMsg) {
  if (!std::isfinite(amplitudeDeg) || amplitudeDeg <= 0.0f) {
    errorMsg = "Amplitude must be > 0 deg (got " + toFixed(amplitudeDeg, 2) + ")";
    return false;
  }

  if (amplitudeDeg < MIN_AMPLITUDE_DEG) {
    errorMsg = "Amplitude too small: " + toFixed(amplitudeDeg, 6) + " deg (min: " + toFixed(MIN_AMPLITUDE_DEG, 4) + ")";
    return false;
  }

  if (amplitudeDeg > MAX_AMPLITUDE_DEG) {
    errorMsg = "Amplitude too large: " + toFixed(amplitudeDeg, 1) + " deg (max: " + toFixed(MAX_AMPLITUDE_DEG, 1) + ")";
    return false;
  }

  return true;
}

inline bool frequency(float frequencyHz, std::string& errorMsg) {
  if (!std::isfinite(frequencyHz) || frequencyHz <= 0.0f) {
    errorMsg = "Frequency must be > 0 Hz (got " + toFixed(frequencyHz, 3) + ")";
    return false;
  }

  if (frequencyHz < MIN_FREQUENCY_HZ) {
    errorMsg = "Frequency too low: " + toFixed(frequencyHz, 6) + " Hz (min: " + toFixed(MIN_FREQUENCY_HZ, 4) + ")";
    return false;
  }

  if (frequencyHz > MAX_FREQUENCY_HZ) {
    errorMsg = "Frequency too high: " + toFixed(frequencyHz, 2) + " Hz (max: " + toFixed(MAX_FREQUENCY_HZ, 1) + ")";
    return false;
  }

  return true;
}

inline bool cycleCount(uint32_t cycles, std::string& errorMsg) {
  if (cycles == 0) {
    errorMsg = "Cycle count must be > 0";
    return false;
  }

  if (cycles > MAX_CYCLE_COUNT) {
    errorMsg = "Too many cycles: " + std::to_string(cycles) + " (max: " + std::to_string(MAX_CYCLE_COUNT) + ")";
    return false;
  }

  return true;
}

// ============================================================================
// STATIONARY VALIDATORS
// ============================================================================

/**
 * Validate stationary target (|target| <= MAX_TARGET_POSITION_DEG)
 */
inline bool targetPosition(float positionDeg, std::string& errorMsg) {
  if (!std::isfinite(positionDeg)) {
    errorMsg = "Target position is not a number";
    return false;
  }

  if (std::fabs(positionDeg) > MAX_TARGET_POSITION_DEG) {
    errorMsg = "Target position out of range: " + toFixed(positionDeg, 2) + " deg (max: ±" + toFixed(MAX_TARGET_POSITION_DEG, 0) + ")";
    return false;
  }

  return true;
}

// ============================================================================
// SERIAL LINK VALIDATORS
// ============================================================================

inline bool baudRate(uint32_t baud, std::string& errorMsg) {
  switch (baud) {
    case 1200: case 2400: case 4800: case 9600: case 19200:
    case 38400: case 57600: case 115200: case 230400:
      return true;
    default:
      errorMsg = "Unsupported baud rate: " + std::to_string(baud);
      return false;
  }
}

/**
 * Validate a response timeout (MIN_RESPONSE_TIMEOUT_MS - MAX_RESPONSE_TIMEOUT_MS)
 * @param name Parameter name used in the error message
 */
inline bool timeoutMs(uint32_t timeout, const char* name, std::string& errorMsg) {
  if (timeout < MIN_RESPONSE_TIMEOUT_MS || timeout > MAX_RESPONSE_TIMEOUT_MS) {
    errorMsg = std::string(name) + " out of range: " + std::to_string(timeout) + " ms (" +
               std::to_string(MIN_RESPONSE_TIMEOUT_MS) + "-" + std::to_string(MAX_RESPONSE_TIMEOUT_MS) + ")";
    return false;
  }
  return true;
}

// ============================================================================
// COMPOSITE VALIDATORS
// ============================================================================

/**
 * Validate a whole test profile before any command is sent
 * - Stationary: target in range, duration > 0
 * - Sinusoid: amplitude/frequency/cycles in range, duration optional
 *   (<= 0 means cycles / frequency)
 * - Sample period must fit in the acquisition duration
 * @param profile Profile to validate
 * @param errorMsg Output error message if validation fails
 * @return true if valid, false otherwise
 */
inline bool testProfile(const TestProfile& profile, std::string& errorMsg) {
  if (profile.kind != ProfileKind::PROFILE_STATIONARY && profile.kind != ProfileKind::PROFILE_SINUSOID) {
    errorMsg = "Unknown profile kind";
    return false;
  }

  if (!samplePeriod(profile.samplePeriodSec, errorMsg)) {
    return false;
  }

  if (profile.isSinusoid()) {
    if (!amplitude(profile.amplitudeDeg, errorMsg)) return false;
    if (!frequency(profile.frequencyHz, errorMsg)) return false;
    if (!cycleCount(profile.cycleCount, errorMsg)) return false;

    // Explicit duration is optional on a sinusoid, but must be sane if set
    if (profile.durationSec > 0.0 && !duration(profile.durationSec, errorMsg)) {
      return false;
    }
  } else {
    if (!targetPosition(profile.targetPositionDeg, errorMsg)) return false;
    if (!duration(profile.durationSec, errorMsg)) return false;
  }

  double effective = profile.effectiveDurationSec();
  if (!duration(effective, errorMsg)) {
    return false;
  }

  if (profile.samplePeriodSec > effective) {
    errorMsg = "Sample period " + toFixed(profile.samplePeriodSec, 3) + " s exceeds duration " +
               toFixed(effective, 3) + " s";
    return false;
  }

  return true;
}

/**
 * Validate sequencer timing (attempt counts >= 1, intervals > 0)
 */
inline bool sequencerTiming(const SequencerTiming& timing, std::string& errorMsg) {
  if (timing.homingMaxAttempts < 1 || timing.positioningMaxAttempts < 1 ||
      timing.configurationMaxAttempts < 1 || timing.startMaxAttempts < 1) {
    errorMsg = "Attempt counts must be >= 1";
    return false;
  }

  if (timing.homingPollIntervalMs == 0 || timing.positioningPollIntervalMs == 0 ||
      timing.startConfirmIntervalMs == 0) {
    errorMsg = "Poll intervals must be > 0 ms";
    return false;
  }

  if (timing.homingTimeoutMs < timing.homingPollIntervalMs) {
    errorMsg = "Homing timeout shorter than its poll interval";
    return false;
  }

  if (timing.homingMinSettleMs >= timing.homingTimeoutMs) {
    errorMsg = "Homing settle time must be shorter than the homing timeout";
    return false;
  }

  if (timing.positioningTimeoutMs < timing.positioningPollIntervalMs) {
    errorMsg = "Positioning timeout shorter than its poll interval";
    return false;
  }

  if (timing.homingStableToleranceDeg < 0.0f || timing.positionToleranceDeg <= 0.0f ||
      timing.startMotionThresholdDeg < 0.0f) {
    errorMsg = "Tolerances must be positive";
    return false;
  }

  if (timing.progressLogInterval == 0) {
    errorMsg = "Progress log interval must be > 0";
    return false;
  }

  return true;
}

} // namespace Validators

#endif // VALIDATORS_H
