// ============================================================================
// CLOCK - Monotonic time source
// ============================================================================
// Every timestamp and wait in the control path goes through a Clock, so a
// simulated clock can replay hours of acquisition instantly in tests.
// now() never goes backwards. Wall-clock time is only used for log lines.
// ============================================================================

#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>
#include "core/Types.h"

class CancellationController;

class Clock {
public:
  virtual ~Clock() = default;

  /** Monotonic time since the clock's epoch */
  virtual MonoTime now() const = 0;

  /**
   * Sleep until deadline (returns immediately if already past)
   * @return false if cancellation was requested before or during the wait
   */
  virtual bool sleepUntil(MonoTime deadline, CancellationController& cancel) = 0;

  /** sleepUntil(now() + duration) */
  bool sleepFor(std::chrono::milliseconds duration, CancellationController& cancel) {
    return sleepUntil(now() + std::chrono::duration_cast<MonoTime>(duration), cancel);
  }
};

// ============================================================================
// STEADY CLOCK (std::chrono::steady_clock, epoch = construction)
// ============================================================================

class SteadyClock : public Clock {
public:
  SteadyClock();

  MonoTime now() const override;
  bool sleepUntil(MonoTime deadline, CancellationController& cancel) override;

private:
  std::chrono::steady_clock::time_point _epoch;
};

#endif // CLOCK_H
