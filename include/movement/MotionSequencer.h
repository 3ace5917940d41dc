// ============================================================================
// MOTION_SEQUENCER.H - Run lifecycle state machine
// ============================================================================
// Drives one test run from a cold table to a stopped table:
//
//   IDLE → HOMING → READY → POSITIONING | CONFIGURING → AWAITING_OPERATOR
//        → RUNNING → STOPPING → COMPLETED | ABORTED | FAILED
//
// - Every exit, including validation failures and cancellation, goes through
//   STOPPING, which sends exactly one STOP (claimed from the
//   CancellationController) and records whether the table acknowledged it.
// - MOVE_TO and START_OSCILLATION are not idempotent: after an unanswered
//   attempt the table state is confirmed with queries before re-issuing.
// - Samples are produced only in RUNNING (AcquisitionLoop).
// ============================================================================

#ifndef MOTION_SEQUENCER_H
#define MOTION_SEQUENCER_H

#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "core/Types.h"

class CommandProtocol;
class Clock;
class CancellationController;
class OperatorRendezvous;
class RecordSink;

class MotionSequencer {
public:
    using StateObserver = std::function<void(RunState from, RunState to)>;

    MotionSequencer(CommandProtocol& protocol, Clock& clock, CancellationController& cancel,
                    OperatorRendezvous& rendezvous, const SequencerTiming& timing);

    /**
     * Execute one complete run (blocking)
     * The sink is sealed before returning, whatever the outcome
     * @param profile Test profile (validated here, before any motion)
     * @param sink Destination for acquired samples
     * @return terminal outcome, failure kind, STOP outcome and acquisition stats
     */
    RunReport run(const TestProfile& profile, RecordSink& sink);

    RunState getState() const { return _state.load(); }

    /** Every state entered by the last run, in order */
    const std::vector<RunState>& getStateHistory() const { return _history; }

    /** Called on every transition (sequencer thread) */
    void setStateObserver(StateObserver observer) { _observer = std::move(observer); }

private:
    CommandProtocol& _protocol;
    Clock& _clock;
    CancellationController& _cancel;
    OperatorRendezvous& _rendezvous;
    const SequencerTiming& _timing;

    std::atomic<RunState> _state;
    std::vector<RunState> _history;
    StateObserver _observer;

    void transition(RunState next);

    // Phases: ERR_NONE = continue, ERR_ABORTED_BY_OPERATOR = cancelled,
    // anything else = run-level failure (message in report)
    ErrorKind doHoming(RunReport& report);
    ErrorKind doPositioning(const TestProfile& profile, RunReport& report);
    ErrorKind doConfiguring(const TestProfile& profile, RunReport& report);
    ErrorKind doAwaitOperator(const TestProfile& profile);
    ErrorKind doRunning(const TestProfile& profile, RecordSink& sink, RunReport& report);
    void doStopping(RunReport& report);

    // Helpers
    ErrorKind waitSettledHome(RunReport& report);
    ErrorKind waitArrival(float targetDeg, RunReport& report);
    bool confirmAt(float targetDeg);
    bool motionDetected();
    bool pause(uint32_t ms);
};

#endif // MOTION_SEQUENCER_H
