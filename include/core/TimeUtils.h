// ============================================================================
// TIME UTILS - Wall-clock formatting helpers
// ============================================================================
// Wall-clock time is only used for log lines and file names.
// Sample timestamps never use it (see core/Clock.h).
// ============================================================================

#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace TimeUtils {

/** Current wall-clock time as epoch seconds */
inline time_t epochSeconds() {
  return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

/**
 * Format epoch seconds with strftime (local time)
 * @param format strftime format
 * @param t Epoch seconds (default: now)
 */
inline std::string format(const char* format, time_t t = epochSeconds()) {
  struct tm timeinfo {};
  localtime_r(&t, &timeinfo);
  char buf[64];
  size_t n = strftime(buf, sizeof(buf), format, &timeinfo);
  return std::string(buf, n);
}

/** "YYYY-MM-DD HH:MM:SS.mmm" for a system_clock time point */
inline std::string formatMillis(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  std::string base = format("%Y-%m-%d %H:%M:%S", std::chrono::system_clock::to_time_t(tp));
  char suffix[8];
  snprintf(suffix, sizeof(suffix), ".%03d", static_cast<int>(ms));
  return base + suffix;
}

}  // namespace TimeUtils

#endif // TIME_UTILS_H
