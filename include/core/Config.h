// ============================================================================
// CONFIG.H - System Configuration (Serial link, Sequencer, Acquisition)
// ============================================================================
// Central configuration file for all device and timing defaults
// Every value here can be overridden at runtime from the JSON settings file
// (see core/settings/SettingsLoader.h)
// ============================================================================

#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>
#include <cstdint>

// ============================================================================
// CONFIGURATION - Serial Link
// ============================================================================
constexpr const char* DEFAULT_SERIAL_PORT = "/dev/ttyUSB0";
constexpr uint32_t DEFAULT_BAUD_RATE = 9600;

// Worst-case latency observed on the table for configuration commands
constexpr uint32_t DEFAULT_RESPONSE_TIMEOUT_MS = 2000;

// Position queries answer much faster than configuration commands
// Why 500? Keeps a single lost reply from eating more than a few ticks at 5 Hz
constexpr uint32_t DEFAULT_QUERY_TIMEOUT_MS = 500;

// The controller resets its UART when the port is opened
constexpr uint32_t SERIAL_SETTLE_DELAY_MS = 2000;

// Wire framing (fixed by the device family)
constexpr char COMMAND_TERMINATOR = '\r';
constexpr char RESPONSE_PROMPT = '>';
constexpr char RESPONSE_ERROR_MARKER = '?';

// Longest legal response. Anything larger means we lost framing
constexpr size_t MAX_RESPONSE_BYTES = 256;

// ============================================================================
// CONFIGURATION - Homing
// ============================================================================
constexpr bool DEFAULT_STOP_BEFORE_HOMING = true;
constexpr uint32_t PRE_HOMING_SETTLE_MS = 1000;

// Why 5? A healthy table occasionally drops a reply while the drive is busy
constexpr int HOMING_MAX_ATTEMPTS = 5;
constexpr uint32_t HOMING_POLL_INTERVAL_MS = 500;
constexpr uint32_t HOMING_TIMEOUT_MS = 60000;       // Full turn at slowest homing speed

// Two consecutive readings within this band = table at rest
constexpr float HOMING_STABLE_TOLERANCE_DEG = 0.01f;

// Stable readings only count once the table was seen moving or this long
// after the HOME ack (a slow drive may not have left its start position yet)
constexpr uint32_t HOMING_MIN_SETTLE_MS = 2000;

constexpr bool DEFAULT_ZERO_AFTER_HOMING = true;

// ============================================================================
// CONFIGURATION - Positioning (stationary profile)
// ============================================================================
constexpr int POSITIONING_MAX_ATTEMPTS = 3;
constexpr uint32_t POSITIONING_POLL_INTERVAL_MS = 250;
constexpr uint32_t POSITIONING_TIMEOUT_MS = 30000;
constexpr float POSITION_TOLERANCE_DEG = 0.05f;

// ============================================================================
// CONFIGURATION - Configuring / Start (sinusoid profile)
// ============================================================================
constexpr int CONFIGURATION_MAX_ATTEMPTS = 3;
constexpr int START_MAX_ATTEMPTS = 2;

// Motion check used to confirm an unanswered start command
constexpr uint32_t START_CONFIRM_INTERVAL_MS = 250;
constexpr float START_MOTION_THRESHOLD_DEG = 0.05f;

// Pause between two attempts of the same command
constexpr uint32_t RETRY_BACKOFF_MS = 100;

// ============================================================================
// CONFIGURATION - Acquisition
// ============================================================================
constexpr double DEFAULT_SAMPLE_PERIOD_SEC = 0.2;   // 5 Hz
constexpr uint32_t ACQ_MAX_RETRIES_PER_TICK = 3;
constexpr uint32_t ACQ_PROGRESS_LOG_INTERVAL = 50;  // samples between progress logs

// ============================================================================
// CONFIGURATION - Test Profile Defaults
// ============================================================================
constexpr float DEFAULT_AMPLITUDE_DEG = 20.0f;
constexpr float DEFAULT_FREQUENCY_HZ = 0.3f;
constexpr uint32_t DEFAULT_CYCLE_COUNT = 54;
constexpr double DEFAULT_DURATION_SEC = 180.0;
constexpr float DEFAULT_TARGET_POSITION_DEG = 0.0f;

// ============================================================================
// CONFIGURATION - Validation Limits
// ============================================================================
constexpr double MIN_SAMPLE_PERIOD_SEC = 0.001;
constexpr double MAX_SAMPLE_PERIOD_SEC = 60.0;
constexpr double MAX_DURATION_SEC = 7.0 * 24.0 * 3600.0;  // One week of logging
// Wire arguments carry 4 decimals: anything smaller would go out as 0
constexpr float MIN_AMPLITUDE_DEG = 0.0001f;
constexpr float MAX_AMPLITUDE_DEG = 180.0f;
constexpr float MIN_FREQUENCY_HZ = 0.0001f;
constexpr float MAX_FREQUENCY_HZ = 20.0f;
constexpr uint32_t MAX_CYCLE_COUNT = 1000000;
constexpr float MAX_TARGET_POSITION_DEG = 360.0f;
constexpr uint32_t MIN_RESPONSE_TIMEOUT_MS = 10;
constexpr uint32_t MAX_RESPONSE_TIMEOUT_MS = 60000;

// ============================================================================
// CONFIGURATION - Recording
// ============================================================================
constexpr const char* DEFAULT_OUTPUT_FILE = "rate_table_test.csv";
constexpr const char* SUMMARY_FILE_SUFFIX = ".summary.json";
constexpr const char* CSV_HEADER = "Time_Relative_sec,Position_deg";
constexpr uint32_t CSV_FLUSH_EVERY = 1;             // Rows per flush (1 = flush on append)
constexpr size_t CSV_BYTES_PER_ROW_ESTIMATE = 24;

// ============================================================================
// CONFIGURATION - Settings / Data
// ============================================================================
constexpr const char* DEFAULT_SETTINGS_FILE = "ratetable.json";
constexpr const char* DEFAULT_DATA_DIRECTORY = ".";

// ============================================================================
// CONFIGURATION - Logging
// ============================================================================
constexpr int LOG_BUFFER_SIZE = 100;                // Circular buffer size for file writes
constexpr uint32_t LOG_FLUSH_INTERVAL_MS = 5000;
constexpr const char* LOG_DIRECTORY = "logs";
constexpr const char* LOG_FILE_PREFIX = "log_";
constexpr const char* LOG_FILE_EXTENSION = ".txt";

// ============================================================================
// CONFIGURATION - Operator Rendezvous
// ============================================================================
constexpr uint32_t RENDEZVOUS_POLL_MS = 50;

#endif // CONFIG_H
