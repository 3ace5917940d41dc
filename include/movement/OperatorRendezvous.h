// ============================================================================
// OPERATOR_RENDEZVOUS.H - Ready / resume handshake with the operator
// ============================================================================
// The sequencer signals "ready" once the table is configured, then blocks
// (cancellably) until someone calls resume(). The console thread in main()
// calls resume() on ENTER; tests call it from the onReady callback.
//
// resume() is latched: a resume that arrives before the wait is not lost.
// ============================================================================

#ifndef OPERATOR_RENDEZVOUS_H
#define OPERATOR_RENDEZVOUS_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include "core/Types.h"

class CancellationController;

class OperatorRendezvous {
public:
    using ReadyCallback = std::function<void(const TestProfile&)>;

    OperatorRendezvous();

    /** Called (from the sequencer thread) when the run is ready to start */
    void setOnReady(ReadyCallback callback) { _onReady = std::move(callback); }

    /** Enter the awaiting state and notify the ready callback */
    void signalReady(const TestProfile& profile);

    /** Release the waiting sequencer. Safe from any thread */
    void resume();

    /**
     * Block until resume() or cancellation
     * @return true if resumed, false if cancelled
     */
    bool waitForResume(CancellationController& cancel);

    bool isAwaiting() const { return _awaiting.load(); }

private:
    ReadyCallback _onReady;
    std::atomic<bool> _awaiting;
    bool _resumed;

    std::mutex _mutex;
    std::condition_variable _cv;
};

#endif // OPERATOR_RENDEZVOUS_H
