// ============================================================================
// OPERATOR_RENDEZVOUS.CPP - Ready / resume handshake implementation
// ============================================================================

#include "movement/OperatorRendezvous.h"
#include "core/CancellationController.h"
#include "core/Config.h"
#include "core/UtilityEngine.h"

OperatorRendezvous::OperatorRendezvous()
    : _awaiting(false),
      _resumed(false) {
}

void OperatorRendezvous::signalReady(const TestProfile& profile) {
    _awaiting = true;
    engine->info("[Rendezvous] ⏸️ Table ready (" + std::string(toString(profile.kind)) + " profile), waiting for operator");

    if (_onReady) {
        _onReady(profile);
    }
}

void OperatorRendezvous::resume() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _resumed = true;
    }
    _cv.notify_all();
}

bool OperatorRendezvous::waitForResume(CancellationController& cancel) {
    std::unique_lock<std::mutex> lock(_mutex);

    // Short waits: cancellation is raised on another condition variable
    while (!_resumed) {
        if (cancel.isCancelled()) {
            _awaiting = false;
            engine->info("[Rendezvous] Cancelled while waiting for operator");
            return false;
        }
        _cv.wait_for(lock, std::chrono::milliseconds(RENDEZVOUS_POLL_MS));
    }

    _resumed = false;
    _awaiting = false;
    engine->info("[Rendezvous] ▶️ Operator start received");
    return true;
}
