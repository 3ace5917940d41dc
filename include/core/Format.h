// ============================================================================
// FORMAT - Number to text helpers
// ============================================================================
// Fixed-decimal formatting for log messages and wire encoding
// (C locale: '.' decimal separator regardless of the host locale)
// ============================================================================

#ifndef FORMAT_H
#define FORMAT_H

#include <cstdio>
#include <string>

/** Fixed-decimal text (printf "%.*f") */
inline std::string toFixed(double value, int decimals) {
  char buf[48];
  snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  return std::string(buf);
}

/**
 * Shortest fixed-point text (max 4 decimals): 20 → "20", 0.3 → "0.3", -12.5 → "-12.5"
 */
inline std::string toCompact(double value) {
  std::string s = toFixed(value, 4);
  if (s.find('.') != std::string::npos) {
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
  }
  if (s == "-0") s = "0";
  return s;
}

#endif // FORMAT_H
