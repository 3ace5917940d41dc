// ============================================================================
// CANCELLATION CONTROLLER IMPLEMENTATION
// ============================================================================

#include "core/CancellationController.h"
#include "core/UtilityEngine.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <pthread.h>

namespace {

// SIGUSR1 only wakes the watcher for shutdown
sigset_t watchedSignals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGUSR1);
  return set;
}

} // namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

CancellationController::CancellationController()
  : _cancelled(false),
    _stopClaimed(false),
    _watcherStopping(false) {
}

CancellationController::~CancellationController() {
  stopSignalWatcher();
}

// ============================================================================
// CANCELLATION FLAG
// ============================================================================

void CancellationController::requestCancel(const std::string& reason) {
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_cancelled.exchange(true)) {
      _reason = reason;
      first = true;
    }
  }
  _cv.notify_all();

  if (first) {
    engine->warn("[Cancel] ⏹️ Cancellation requested: " + reason);
  } else {
    engine->debug("[Cancel] Already cancelling, ignored: " + reason);
  }
}

std::string CancellationController::getReason() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _reason;
}

bool CancellationController::waitUntil(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(_mutex);
  return _cv.wait_until(lock, deadline, [this] { return _cancelled.load(); });
}

bool CancellationController::waitFor(std::chrono::milliseconds duration) {
  return waitUntil(std::chrono::steady_clock::now() + duration);
}

// ============================================================================
// FINAL STOP GUARD
// ============================================================================

bool CancellationController::claimFinalStop() {
  return !_stopClaimed.exchange(true);
}

// ============================================================================
// SIGNAL WATCHER
// ============================================================================

bool CancellationController::blockTerminationSignals() {
  sigset_t set = watchedSignals();
  int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
  if (rc != 0) {
    engine->error(std::string("[Cancel] ❌ pthread_sigmask failed: ") + std::strerror(rc));
    return false;
  }
  return true;
}

bool CancellationController::startSignalWatcher() {
  if (_watcher.joinable()) return true;

  _watcherStopping = false;
  try {
    _watcher = std::thread(&CancellationController::watchSignals, this);
  } catch (const std::system_error& e) {
    engine->error(std::string("[Cancel] ❌ Cannot start signal watcher: ") + e.what());
    return false;
  }
  engine->debug("[Cancel] Signal watcher started");
  return true;
}

void CancellationController::stopSignalWatcher() {
  if (!_watcher.joinable()) return;

  _watcherStopping = true;
  int rc = pthread_kill(_watcher.native_handle(), SIGUSR1);
  if (rc != 0) {
    engine->error(std::string("[Cancel] ❌ Cannot wake signal watcher: ") + std::strerror(rc));
    // The thread may be gone already; join either way
  }
  _watcher.join();
  engine->debug("[Cancel] Signal watcher stopped");
}

void CancellationController::watchSignals() {
  sigset_t set = watchedSignals();

  while (!_watcherStopping) {
    int signo = 0;
    int rc = sigwait(&set, &signo);
    if (rc != 0) {
      if (rc == EINTR) continue;
      engine->error(std::string("[Cancel] ❌ sigwait failed: ") + std::strerror(rc));
      return;
    }

    switch (signo) {
      case SIGINT:
        requestCancel("SIGINT (Ctrl+C)");
        break;
      case SIGTERM:
        requestCancel("SIGTERM");
        break;
      default:
        // SIGUSR1: shutdown wake-up, loop re-checks _watcherStopping
        break;
    }
  }
}
