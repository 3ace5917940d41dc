// ============================================================================
// TYPES.H - Data Structures and Enums
// ============================================================================
// All type definitions (enums, structs) centralized for clarity
// Runtime configuration structures with default values from Config.h
// ============================================================================
//
// RUN LIFECYCLE:
// ═══════════════════════════════════════════════════════════════════════════
//
//   STATE_IDLE → STATE_HOMING → STATE_READY
//     → STATE_POSITIONING (stationary) | STATE_CONFIGURING (sinusoid)
//     → STATE_AWAITING_OPERATOR → STATE_RUNNING
//     → STATE_STOPPING → STATE_COMPLETED | STATE_ABORTED | STATE_FAILED
//
//   Every path into a terminal state goes through STATE_STOPPING.
//   Samples exist only while in STATE_RUNNING.
// ═══════════════════════════════════════════════════════════════════════════

#ifndef TYPES_H
#define TYPES_H

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/Config.h"

// Monotonic time since the owning Clock's epoch
using MonoTime = std::chrono::nanoseconds;

// ============================================================================
// LOG LEVEL
// ============================================================================

enum class LogLevel : int {
  LOG_ERROR = 0,
  LOG_WARNING = 1,
  LOG_INFO = 2,
  LOG_DEBUG = 3
};

// ============================================================================
// SEQUENCER STATE
// ============================================================================

enum class RunState {
  STATE_IDLE,
  STATE_HOMING,
  STATE_READY,
  STATE_POSITIONING,
  STATE_CONFIGURING,
  STATE_AWAITING_OPERATOR,
  STATE_RUNNING,
  STATE_STOPPING,
  STATE_COMPLETED,
  STATE_ABORTED,
  STATE_FAILED
};

enum class TerminalOutcome {
  OUTCOME_NONE,
  OUTCOME_COMPLETED,
  OUTCOME_ABORTED,
  OUTCOME_FAILED
};

enum class StopOutcome {
  STOP_NOT_ATTEMPTED,
  STOP_ACKNOWLEDGED,
  STOP_FAILED
};

// ============================================================================
// ERROR TAXONOMY
// ============================================================================
// Per-call errors (retryable by the caller):
//   ERR_COMMUNICATION_TIMEOUT, ERR_PROTOCOL_DESYNC, ERR_DEVICE_ERROR
// Run-level failures (terminal, always after a STOP attempt):
//   ERR_HOMING_FAILED, ERR_POSITIONING_FAILED, ERR_CONFIGURATION_FAILED,
//   ERR_START_FAILED, ERR_INVALID_PROFILE, ERR_RECORDING_FAILED
// ============================================================================

enum class ErrorKind {
  ERR_NONE = 0,
  ERR_COMMUNICATION_TIMEOUT,
  ERR_PROTOCOL_DESYNC,
  ERR_DEVICE_ERROR,          // Table answered '?'
  ERR_TRANSPORT_CLOSED,
  ERR_HOMING_FAILED,
  ERR_POSITIONING_FAILED,
  ERR_CONFIGURATION_FAILED,
  ERR_START_FAILED,
  ERR_ACQUISITION_GAP,
  ERR_ABORTED_BY_OPERATOR,
  ERR_INVALID_PROFILE,
  ERR_RECORDING_FAILED       // CSV row could not be written
};

// ============================================================================
// COMMANDS & RESPONSES
// ============================================================================

enum class CommandVerb {
  CMD_HOME,
  CMD_STOP,
  CMD_QUERY_POSITION,
  CMD_MOVE_TO,
  CMD_SET_AMPLITUDE,
  CMD_SET_FREQUENCY,
  CMD_SET_CYCLES,
  CMD_START_OSCILLATION,
  CMD_ZERO_POSITION
};

/**
 * One table command. Built per call, never reused.
 */
struct Command {
  const CommandVerb verb;
  const std::optional<double> argument;

  explicit Command(CommandVerb v) : verb(v), argument(std::nullopt) {}
  Command(CommandVerb v, double arg) : verb(v), argument(arg) {}
};

enum class ResponseKind {
  RESP_NONE,       // Not decoded (transport level)
  RESP_ACK,
  RESP_POSITION,
  RESP_ERROR
};

struct Response {
  std::string raw;
  ResponseKind kind = ResponseKind::RESP_NONE;
  float positionDeg = 0.0f;            // RESP_POSITION only
  int errorCode = 0;                   // RESP_ERROR only
  std::chrono::microseconds latency{0};
};

/**
 * Raw result of one request/response exchange on the wire
 */
struct TransportReply {
  ErrorKind error = ErrorKind::ERR_NONE;
  std::string raw;
};

/**
 * Decoded result of one command. sentAt/receivedAt are Clock timestamps
 */
struct CommandResult {
  ErrorKind error = ErrorKind::ERR_NONE;
  Response response;
  MonoTime sentAt{0};
  MonoTime receivedAt{0};

  bool ok() const { return error == ErrorKind::ERR_NONE; }
};

// ============================================================================
// TEST PROFILE
// ============================================================================

enum class ProfileKind {
  PROFILE_STATIONARY = 0,    // Hold at target, ADEV noise run
  PROFILE_SINUSOID = 1       // Oscillate, accuracy run
};

struct TestProfile {
  ProfileKind kind = ProfileKind::PROFILE_STATIONARY;

  // Stationary
  float targetPositionDeg = DEFAULT_TARGET_POSITION_DEG;

  // Sinusoid (forwarded verbatim to AMP / FRQ / CYC)
  float amplitudeDeg = DEFAULT_AMPLITUDE_DEG;
  float frequencyHz = DEFAULT_FREQUENCY_HZ;
  uint32_t cycleCount = DEFAULT_CYCLE_COUNT;

  // Acquisition
  double samplePeriodSec = DEFAULT_SAMPLE_PERIOD_SEC;
  double durationSec = DEFAULT_DURATION_SEC;   // <= 0 on sinusoid = cycles / frequency

  TestProfile() = default;

  bool isSinusoid() const { return kind == ProfileKind::PROFILE_SINUSOID; }

  /** Expected motion length of a sinusoid run (cycles / frequency as sent on the wire) */
  double expectedMotionSec() const {
    if (!isSinusoid() || frequencyHz <= 0.0f) return 0.0;
    // FRQ carries 4 decimals: 0.3f must give 180 s for 54 cycles, not 179.99999 s
    const double wireHz = std::round(static_cast<double>(frequencyHz) * 1e4) / 1e4;
    if (wireHz <= 0.0) return 0.0;
    return static_cast<double>(cycleCount) / wireHz;
  }

  /** Acquisition duration actually used by the run */
  double effectiveDurationSec() const {
    if (durationSec > 0.0) return durationSec;
    return expectedMotionSec();
  }
};

// ============================================================================
// SEQUENCER TIMING (operational tuning, all overridable)
// ============================================================================

struct SequencerTiming {
  // Homing
  bool stopBeforeHoming = DEFAULT_STOP_BEFORE_HOMING;
  uint32_t preHomingSettleMs = PRE_HOMING_SETTLE_MS;
  int homingMaxAttempts = HOMING_MAX_ATTEMPTS;
  uint32_t homingPollIntervalMs = HOMING_POLL_INTERVAL_MS;
  uint32_t homingTimeoutMs = HOMING_TIMEOUT_MS;
  float homingStableToleranceDeg = HOMING_STABLE_TOLERANCE_DEG;
  uint32_t homingMinSettleMs = HOMING_MIN_SETTLE_MS;
  bool zeroAfterHoming = DEFAULT_ZERO_AFTER_HOMING;

  // Positioning
  int positioningMaxAttempts = POSITIONING_MAX_ATTEMPTS;
  uint32_t positioningPollIntervalMs = POSITIONING_POLL_INTERVAL_MS;
  uint32_t positioningTimeoutMs = POSITIONING_TIMEOUT_MS;
  float positionToleranceDeg = POSITION_TOLERANCE_DEG;

  // Configuring / start
  int configurationMaxAttempts = CONFIGURATION_MAX_ATTEMPTS;
  int startMaxAttempts = START_MAX_ATTEMPTS;
  uint32_t startConfirmIntervalMs = START_CONFIRM_INTERVAL_MS;
  float startMotionThresholdDeg = START_MOTION_THRESHOLD_DEG;

  uint32_t retryBackoffMs = RETRY_BACKOFF_MS;

  // Acquisition
  uint32_t acquisitionMaxRetries = ACQ_MAX_RETRIES_PER_TICK;
  uint32_t progressLogInterval = ACQ_PROGRESS_LOG_INTERVAL;

  SequencerTiming() = default;
};

// ============================================================================
// RECORDING
// ============================================================================

struct SampleRecord {
  double timeSec = 0.0;       // Elapsed since acquisition start (monotonic)
  float positionDeg = 0.0f;
};

using SeriesBuffer = std::vector<SampleRecord>;

struct AcquisitionStats {
  uint64_t plannedTicks = 0;
  uint64_t ticksAttempted = 0;
  uint64_t samplesRecorded = 0;
  uint64_t gaps = 0;
  uint64_t retries = 0;
  uint64_t lateTicks = 0;                    // Fired one period or more behind schedule
  std::chrono::microseconds maxLatency{0};
  double elapsedSec = 0.0;
  bool cancelled = false;
  ErrorKind failure = ErrorKind::ERR_NONE;   // Set when the link or the CSV died mid-run

  /** Gap ratio over attempted ticks (0..1) */
  double gapRatio() const {
    return ticksAttempted > 0 ? static_cast<double>(gaps) / static_cast<double>(ticksAttempted) : 0.0;
  }
};

// ============================================================================
// RUN REPORT
// ============================================================================

struct RunReport {
  TerminalOutcome outcome = TerminalOutcome::OUTCOME_NONE;
  ErrorKind failure = ErrorKind::ERR_NONE;
  RunState lastActiveState = RunState::STATE_IDLE;   // State the run was in when it left the main path
  StopOutcome stop = StopOutcome::STOP_NOT_ATTEMPTED;
  AcquisitionStats acquisition;
  std::string message;

  bool completed() const { return outcome == TerminalOutcome::OUTCOME_COMPLETED; }
};

// ============================================================================
// NAME HELPERS (implemented in Types.cpp)
// ============================================================================

const char* toString(RunState state);
const char* toString(ErrorKind error);
const char* toString(CommandVerb verb);
const char* toString(ProfileKind kind);
const char* toString(StopOutcome stop);
const char* toString(TerminalOutcome outcome);
const char* toString(LogLevel level);

#endif // TYPES_H
