// ============================================================================
// UTILITY ENGINE IMPLEMENTATION
// ============================================================================

#include "core/UtilityEngine.h"
#include "core/TimeUtils.h"

UtilityEngine* engine = nullptr;

// ============================================================================
// CONSTRUCTOR
// ============================================================================

UtilityEngine::UtilityEngine()
  : _fs(),
    _logger(_fs) {
}

// ============================================================================
// LIFECYCLE METHODS
// ============================================================================

bool UtilityEngine::initialize(const std::string& dataDirectory, bool fileLogging) {
  if (!_fs.mount(dataDirectory)) {
    _logger.error("[UtilityEngine] ❌ Cannot use data directory: " + dataDirectory);
    return false;
  }
  _logger.debug("[UtilityEngine] Data directory: " + _fs.getRoot());

  if (fileLogging) {
    if (_logger.initializeLogFile()) {
      _logger.info("[UtilityEngine] Session log: " + _fs.resolve(_logger.getCurrentLogFile()));
    } else {
      // Not fatal - console logging still works
      _logger.warn("[UtilityEngine] ⚠️ Session log file unavailable, console only");
    }
  }

  return true;
}

void UtilityEngine::shutdown() {
  _logger.shutdown();
}

// ============================================================================
// TIME UTILITIES
// ============================================================================

std::string UtilityEngine::getFormattedTime(const char* format) const {
  return TimeUtils::format(format);
}
