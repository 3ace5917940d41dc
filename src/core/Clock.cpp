// ============================================================================
// CLOCK IMPLEMENTATION
// ============================================================================

#include "core/Clock.h"
#include "core/CancellationController.h"

SteadyClock::SteadyClock()
  : _epoch(std::chrono::steady_clock::now()) {
}

MonoTime SteadyClock::now() const {
  return std::chrono::duration_cast<MonoTime>(std::chrono::steady_clock::now() - _epoch);
}

bool SteadyClock::sleepUntil(MonoTime deadline, CancellationController& cancel) {
  if (cancel.isCancelled()) return false;
  auto target = _epoch + std::chrono::duration_cast<std::chrono::steady_clock::duration>(deadline);
  return !cancel.waitUntil(target);
}
