// ============================================================================
// CANCELLATION CONTROLLER - Operator interrupt & final STOP guard
// ============================================================================
// One cancellation flag per run, observed cooperatively at suspension points
// (command boundaries, acquisition ticks, the operator rendezvous, sleeps).
//
// Interrupts (SIGINT/SIGTERM) never run code asynchronously: they are blocked
// in every thread and consumed by a watcher thread with sigwait(), which only
// calls requestCancel().
//
// Usage:
//   CancellationController::blockTerminationSignals();  // first thing in main
//   CancellationController cancel;
//   cancel.startSignalWatcher();
//   ...
//   if (cancel.claimFinalStop()) protocol.stop();
// ============================================================================

#ifndef CANCELLATION_CONTROLLER_H
#define CANCELLATION_CONTROLLER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

class CancellationController {
public:
  CancellationController();
  ~CancellationController();

  CancellationController(const CancellationController&) = delete;
  CancellationController& operator=(const CancellationController&) = delete;

  // ========================================================================
  // CANCELLATION FLAG
  // ========================================================================

  /**
   * Raise the flag and wake every waiter. Idempotent, callable from any thread
   * @param reason Logged once, on the first request
   */
  void requestCancel(const std::string& reason = "operator interrupt");

  bool isCancelled() const { return _cancelled.load(); }

  /** Reason given to the first requestCancel() (empty if not cancelled) */
  std::string getReason() const;

  /**
   * Sleep until deadline, returning early on cancellation
   * @return true if cancelled (before or during the wait)
   */
  bool waitUntil(std::chrono::steady_clock::time_point deadline);

  /** waitUntil(now + duration) */
  bool waitFor(std::chrono::milliseconds duration);

  // ========================================================================
  // FINAL STOP GUARD
  // ========================================================================

  /**
   * Claim the right to send the terminal STOP
   * @return true exactly once; every later call returns false
   */
  bool claimFinalStop();

  bool isFinalStopClaimed() const { return _stopClaimed.load(); }

  // ========================================================================
  // SIGNAL WATCHER
  // ========================================================================

  /**
   * Block SIGINT, SIGTERM and the watcher wake-up signal in the calling thread
   * Must run in main() before any other thread is created (threads inherit it)
   */
  static bool blockTerminationSignals();

  /** Start the sigwait() thread. Requires blockTerminationSignals() */
  bool startSignalWatcher();

  /** Stop and join the watcher thread (no-op if not started) */
  void stopSignalWatcher();

private:
  std::atomic<bool> _cancelled;
  std::atomic<bool> _stopClaimed;
  std::atomic<bool> _watcherStopping;

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::string _reason;

  std::thread _watcher;

  void watchSignals();
};

#endif // CANCELLATION_CONTROLLER_H
