// ============================================================================
// TYPES.CPP - Enum name helpers
// ============================================================================
// Names used in logs, the CSV summary and the JSON run report
// ============================================================================

#include "core/Types.h"

const char* toString(RunState state) {
  using enum RunState;
  switch (state) {
    case STATE_IDLE:              return "IDLE";
    case STATE_HOMING:            return "HOMING";
    case STATE_READY:             return "READY";
    case STATE_POSITIONING:       return "POSITIONING";
    case STATE_CONFIGURING:       return "CONFIGURING";
    case STATE_AWAITING_OPERATOR: return "AWAITING_OPERATOR";
    case STATE_RUNNING:           return "RUNNING";
    case STATE_STOPPING:          return "STOPPING";
    case STATE_COMPLETED:         return "COMPLETED";
    case STATE_ABORTED:           return "ABORTED";
    case STATE_FAILED:            return "FAILED";
  }
  return "UNKNOWN";
}

const char* toString(ErrorKind error) {
  using enum ErrorKind;
  switch (error) {
    case ERR_NONE:                  return "NONE";
    case ERR_COMMUNICATION_TIMEOUT: return "COMMUNICATION_TIMEOUT";
    case ERR_PROTOCOL_DESYNC:       return "PROTOCOL_DESYNC";
    case ERR_DEVICE_ERROR:          return "DEVICE_ERROR";
    case ERR_TRANSPORT_CLOSED:      return "TRANSPORT_CLOSED";
    case ERR_HOMING_FAILED:         return "HOMING_FAILED";
    case ERR_POSITIONING_FAILED:    return "POSITIONING_FAILED";
    case ERR_CONFIGURATION_FAILED:  return "CONFIGURATION_FAILED";
    case ERR_START_FAILED:          return "START_FAILED";
    case ERR_ACQUISITION_GAP:       return "ACQUISITION_GAP";
    case ERR_ABORTED_BY_OPERATOR:   return "ABORTED_BY_OPERATOR";
    case ERR_INVALID_PROFILE:       return "INVALID_PROFILE";
    case ERR_RECORDING_FAILED:      return "RECORDING_FAILED";
  }
  return "UNKNOWN";
}

const char* toString(CommandVerb verb) {
  using enum CommandVerb;
  switch (verb) {
    case CMD_HOME:              return "HOME";
    case CMD_STOP:              return "STOP";
    case CMD_QUERY_POSITION:    return "QUERY_POSITION";
    case CMD_MOVE_TO:           return "MOVE_TO";
    case CMD_SET_AMPLITUDE:     return "SET_AMPLITUDE";
    case CMD_SET_FREQUENCY:     return "SET_FREQUENCY";
    case CMD_SET_CYCLES:        return "SET_CYCLES";
    case CMD_START_OSCILLATION: return "START_OSCILLATION";
    case CMD_ZERO_POSITION:     return "ZERO_POSITION";
  }
  return "UNKNOWN";
}

const char* toString(ProfileKind kind) {
  return kind == ProfileKind::PROFILE_SINUSOID ? "sinusoid" : "stationary";
}

const char* toString(StopOutcome stop) {
  using enum StopOutcome;
  switch (stop) {
    case STOP_NOT_ATTEMPTED: return "NOT_ATTEMPTED";
    case STOP_ACKNOWLEDGED:  return "ACKNOWLEDGED";
    case STOP_FAILED:        return "FAILED";
  }
  return "UNKNOWN";
}

const char* toString(TerminalOutcome outcome) {
  using enum TerminalOutcome;
  switch (outcome) {
    case OUTCOME_NONE:      return "NONE";
    case OUTCOME_COMPLETED: return "COMPLETED";
    case OUTCOME_ABORTED:   return "ABORTED";
    case OUTCOME_FAILED:    return "FAILED";
  }
  return "UNKNOWN";
}

const char* toString(LogLevel level) {
  using enum LogLevel;
  switch (level) {
    case LOG_ERROR:   return "ERROR";
    case LOG_WARNING: return "WARN";
    case LOG_INFO:    return "INFO";
    case LOG_DEBUG:   return "DEBUG";
  }
  return "INFO";
}
