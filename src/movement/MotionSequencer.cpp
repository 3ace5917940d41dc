// ============================================================================
// MOTION_SEQUENCER.CPP - Run lifecycle state machine implementation
// ============================================================================

#include "movement/MotionSequencer.h"
#include "communication/CommandProtocol.h"
#include "core/CancellationController.h"
#include "core/Clock.h"
#include "core/Format.h"
#include "core/UtilityEngine.h"
#include "core/Validators.h"
#include "core/recording/RecordSink.h"
#include "movement/AcquisitionLoop.h"
#include "movement/OperatorRendezvous.h"

#include <cmath>

namespace {

std::string describe(const CommandResult& r) {
    std::string text = toString(r.error);
    if (r.error == ErrorKind::ERR_DEVICE_ERROR) {
        text += " (code " + std::to_string(r.response.errorCode) + ")";
    }
    return text;
}

} // namespace

MotionSequencer::MotionSequencer(CommandProtocol& protocol, Clock& clock, CancellationController& cancel,
                                 OperatorRendezvous& rendezvous, const SequencerTiming& timing)
    : _protocol(protocol),
      _clock(clock),
      _cancel(cancel),
      _rendezvous(rendezvous),
      _timing(timing),
      _state(RunState::STATE_IDLE) {
}

// ============================================================================
// RUN
// ============================================================================

RunReport MotionSequencer::run(const TestProfile& profile, RecordSink& sink) {
    RunReport report;
    _history.clear();
    _state = RunState::STATE_IDLE;
    _history.push_back(RunState::STATE_IDLE);

    engine->info("[Sequencer] 🚀 Run start: " + std::string(toString(profile.kind)) + " profile, " +
                 toFixed(1.0 / profile.samplePeriodSec, 1) + " Hz for " +
                 toFixed(profile.effectiveDurationSec(), 1) + " s");

    ErrorKind outcome = ErrorKind::ERR_NONE;
    std::string err;

    if (!Validators::testProfile(profile, err) || !Validators::sequencerTiming(_timing, err)) {
        outcome = ErrorKind::ERR_INVALID_PROFILE;
        report.message = "Invalid run parameters: " + err;
        engine->error("[Sequencer] ❌ " + report.message);
    } else if (_cancel.isCancelled()) {
        outcome = ErrorKind::ERR_ABORTED_BY_OPERATOR;
    }

    if (outcome == ErrorKind::ERR_NONE) {
        outcome = doHoming(report);
    }

    if (outcome == ErrorKind::ERR_NONE) {
        transition(RunState::STATE_READY);
        outcome = profile.isSinusoid() ? doConfiguring(profile, report) : doPositioning(profile, report);
    }

    if (outcome == ErrorKind::ERR_NONE) {
        outcome = doAwaitOperator(profile);
    }

    if (outcome == ErrorKind::ERR_NONE) {
        outcome = doRunning(profile, sink, report);
    }

    report.lastActiveState = _state.load();
    doStopping(report);

    if (outcome == ErrorKind::ERR_NONE) {
        report.outcome = TerminalOutcome::OUTCOME_COMPLETED;
        report.message = "Completed: " + std::to_string(report.acquisition.samplesRecorded) + " samples, " +
                         std::to_string(report.acquisition.gaps) + " gaps";
        transition(RunState::STATE_COMPLETED);
    } else if (outcome == ErrorKind::ERR_ABORTED_BY_OPERATOR) {
        report.outcome = TerminalOutcome::OUTCOME_ABORTED;
        report.failure = ErrorKind::ERR_ABORTED_BY_OPERATOR;
        report.message = "Aborted during " + std::string(toString(report.lastActiveState)) +
                         (_cancel.getReason().empty() ? "" : ": " + _cancel.getReason());
        transition(RunState::STATE_ABORTED);
    } else {
        report.outcome = TerminalOutcome::OUTCOME_FAILED;
        report.failure = outcome;
        transition(RunState::STATE_FAILED);
    }

    sink.seal();
    return report;
}

// ============================================================================
// STATE TRANSITIONS
// ============================================================================

void MotionSequencer::transition(RunState next) {
    RunState previous = _state.exchange(next);
    _history.push_back(next);
    engine->info(std::string("[Sequencer] ") + toString(previous) + " → " + toString(next));

    if (_observer) {
        _observer(previous, next);
    }
}

// ============================================================================
// HOMING
// ============================================================================

ErrorKind MotionSequencer::doHoming(RunReport& report) {
    transition(RunState::STATE_HOMING);

    // Table may still be moving from a previous session
    if (_timing.stopBeforeHoming) {
        if (_cancel.isCancelled()) return ErrorKind::ERR_ABORTED_BY_OPERATOR;

        CommandResult stop = _protocol.stop();
        if (!stop.ok()) {
            engine->warn("[Sequencer] ⚠️ Pre-homing STOP: " + describe(stop));
        }
        if (!pause(_timing.preHomingSettleMs)) return ErrorKind::ERR_ABORTED_BY_OPERATOR;
    }

    bool acked = false;
    for (int attempt = 1; attempt <= _timing.homingMaxAttempts; attempt++) {
        if (_cancel.isCancelled()) return ErrorKind::ERR_ABORTED_BY_OPERATOR;

        engine->info("[Sequencer] 🏠 HOME (attempt " + std::to_string(attempt) + "/" +
                     std::to_string(_timing.homingMaxAttempts) + ")");
        CommandResult r = _protocol.home();
        if (r.ok()) {
            acked = true;
            break;
        }

        engine->warn("[Sequencer] ⚠️ HOME failed: " + describe(r));
        if (r.error == ErrorKind::ERR_TRANSPORT_CLOSED) {
            report.message = "Link lost during homing";
            return ErrorKind::ERR_TRANSPORT_CLOSED;
        }

        if (r.error == ErrorKind::ERR_PROTOCOL_DESYNC) {
            // Resynchronize on an idempotent query before re-issuing
            CommandResult confirm = _protocol.queryPosition();
            engine->debug("[Sequencer] Confirmatory query after desync: " +
                          (confirm.ok() ? toFixed(confirm.response.positionDeg, 3) + "°" : describe(confirm)));
        }

        if (!pause(_timing.retryBackoffMs)) return ErrorKind::ERR_ABORTED_BY_OPERATOR;
    }

    if (!acked) {
        report.message = "HOME not acknowledged after " + std::to_string(_timing.homingMaxAttempts) + " attempts";
        engine->error("[Sequencer] ❌ " + report.message);
        return ErrorKind::ERR_HOMING_FAILED;
    }

    ErrorKind settled = waitSettledHome(report);
    if (settled != ErrorKind::ERR_NONE) return settled;

    if (_timing.zeroAfterHoming) {
        CommandResult zero = _protocol.zeroPosition();
        if (!zero.ok()) {
            engine->warn("[Sequencer] ⚠️ Zero position not applied: " + describe(zero));
        }
    }

    return ErrorKind::ERR_NONE;
}

ErrorKind MotionSequencer::waitSettledHome(RunReport& report) {
    const MonoTime acked = _clock.now();
    const MonoTime deadline = acked + std::chrono::milliseconds(_timing.homingTimeoutMs);
    const MonoTime settleFrom = acked + std::chrono::milliseconds(_timing.homingMinSettleMs);
    bool haveFirst = false;
    bool moved = false;
    bool haveLast = false;
    float first = 0.0f;
    float last = 0.0f;

    while (_clock.now() < deadline) {
        if (!pause(_timing.homingPollIntervalMs)) return ErrorKind::ERR_ABORTED_BY_OPERATOR;

        CommandResult r = _protocol.queryPosition();
        if (!r.ok()) {
            if (r.error == ErrorKind::ERR_TRANSPORT_CLOSED) {
                report.message = "Link lost during homing";
                return ErrorKind::ERR_TRANSPORT_CLOSED;
            }
            // Stability needs two consecutive good readings
            haveLast = false;
            continue;
        }

        float pos = r.response.positionDeg;
        if (!haveFirst) {
            first = pos;
            haveFirst = true;
        } else if (std::fabs(pos - first) > _timing.homingStableToleranceDeg) {
            moved = true;
        }

        // Still at the start reading: may not have begun moving yet
        const bool settleAllowed = moved || r.sentAt >= settleFrom;
        if (settleAllowed && haveLast && std::fabs(pos - last) <= _timing.homingStableToleranceDeg) {
            engine->info("[Sequencer] ✅ Homed, reference reading " + toFixed(pos, 3) + "°");
            return ErrorKind::ERR_NONE;
        }
        last = pos;
        haveLast = true;
    }

    report.message = "Table not settled within " + std::to_string(_timing.homingTimeoutMs) + " ms of HOME";
    engine->error("[Sequencer] ❌ " + report.message);
    return ErrorKind::ERR_HOMING_FAILED;
}

// ============================================================================
// POSITIONING (stationary profile)
// ============================================================================

ErrorKind MotionSequencer::doPositioning(const TestProfile& profile, RunReport& report) {
    transition(RunState::STATE_POSITIONING);
    const float target = profile.targetPositionDeg;

    for (int attempt = 1; attempt <= _timing.positioningMaxAttempts; attempt++) {
        if (_cancel.isCancelled()) return ErrorKind::ERR_ABORTED_BY_OPERATOR;

        // MOVE_TO is not idempotent: check where the last one left us first
        if (attempt > 1 && confirmAt(target)) {
            engine->info("[Sequencer] ✅ Already at " + toFixed(target, 3) + "°, not re-issuing MOVE_TO");
            return ErrorKind::ERR_NONE;
        }
        if (_cancel.isCancelled()) return ErrorKind::ERR_ABORTED_BY_OPERATOR;

        engine->info("[Sequencer] 🎯 MOVE_TO " + toFixed(target, 3) + "° (attempt " + std::to_string(attempt) + ")");
        CommandResult r = _protocol.moveTo(target);
        if (r.ok()) {
            return waitArrival(target, report);
        }

        engine->warn("[Sequencer] ⚠️ MOVE_TO failed: " + describe(r));
        if (r.error == ErrorKind::ERR_DEVICE_ERROR) {
            report.message = "Table rejected MOVE_TO " + toFixed(target, 3) + "°: " + describe(r);
            engine->error("[Sequencer] ❌ " + report.message);
            return ErrorKind::ERR_POSITIONING_FAILED;
        }
        if (r.error == ErrorKind::ERR_TRANSPORT_CLOSED) {
            report.message = "Link lost during positioning";
            return ErrorKind::ERR_TRANSPORT_CLOSED;
        }

        if (!pause(_timing.retryBackoffMs)) return ErrorKind::ERR_ABORTED_BY_OPERATOR;
    }

    report.message = "MOVE_TO not acknowledged after " + std::to_string(_timing.positioningMaxAttempts) + " attempts";
    engine->error("[Sequencer] ❌ " + report.message);
    return ErrorKind::ERR_POSITIONING_FAILED;
}

ErrorKind MotionSequencer::waitArrival(float targetDeg, RunReport& report) {
    const MonoTime deadline = _clock.now() + std::chrono::milliseconds(_timing.positioningTimeoutMs);
    float lastPos = NAN;

    while (true) {
        CommandResult r = _protocol.queryPosition();
        if (r.ok()) {
            lastPos = r.response.positionDeg;
            if (std::fabs(lastPos - targetDeg) <= _timing.positionToleranceDeg) {
                engine->info("[Sequencer] ✅ Positioned at " + toFixed(lastPos, 3) + "°");
                return ErrorKind::ERR_NONE;
            }
        } else if (r.error == ErrorKind::ERR_TRANSPORT_CLOSED) {
            report.message = "Link lost during positioning";
            return ErrorKind::ERR_TRANSPORT_CLOSED;
        }

        if (_clock.now() >= deadline) {
            report.message = "Target " + toFixed(targetDeg, 3) + "° not reached within " +
                             std::to_string(_timing.positioningTimeoutMs) + " ms (last " +
                             (std::isnan(lastPos) ? std::string("unknown") : toFixed(lastPos, 3) + "°") + ")";
            engine->error("[Sequencer] ❌ " + report.message);
            return ErrorKind::ERR_POSITIONING_FAILED;
        }

        if (!pause(_timing.positioningPollIntervalMs)) return ErrorKind::ERR_ABORTED_BY_OPERATOR;
    }
}

bool MotionSequencer::confirmAt(float targetDeg) {
    CommandResult r = _protocol.queryPosition();
    return r.ok() && std::fabs(r.response.positionDeg - targetDeg) <= _timing.positionToleranceDeg;
}

// ============================================================================
// CONFIGURING (sinusoid profile)
// ============================================================================

ErrorKind MotionSequencer::doConfiguring(const TestProfile& profile, RunReport& report) {
    transition(RunState::STATE_CONFIGURING);

    // Order matters: amplitude, frequency, cycles, each acknowledged first
    const Command setters[] = {
        Command(CommandVerb::CMD_SET_AMPLITUDE, profile.amplitudeDeg),
        Command(CommandVerb::CMD_SET_FREQUENCY, profile.frequencyHz),
        Command(CommandVerb::CMD_SET_CYCLES, static_cast<double>(profile.cycleCount))
    };

    for (const Command& setter : setters) {
        const std::string wire = CommandProtocol::encode(setter);
        bool acked = false;

        for (int attempt = 1; attempt <= _timing.configurationMaxAttempts; attempt++) {
            if (_cancel.isCancelled()) return ErrorKind::ERR_ABORTED_BY_OPERATOR;

            CommandResult r = _protocol.execute(setter);
            if (r.ok()) {
                acked = true;
                break;
            }

            engine->warn("[Sequencer] ⚠️ " + wire + " failed: " + describe(r));
            if (r.error == ErrorKind::ERR_DEVICE_ERROR) {
                report.message = "Table rejected " + wire + ": " + describe(r);
                engine->error("[Sequencer] ❌ " + report.message);
                return ErrorKind::ERR_CONFIGURATION_FAILED;
            }
            if (r.error == ErrorKind::ERR_TRANSPORT_CLOSED) {
                report.message = "Link lost during configuration";
                return ErrorKind::ERR_TRANSPORT_CLOSED;
            }

            if (!pause(_timing.retryBackoffMs)) return ErrorKind::ERR_ABORTED_BY_OPERATOR;
        }

        if (!acked) {
            report.message = wire + " not acknowledged after " +
                             std::to_string(_timing.configurationMaxAttempts) + " attempts";
            engine->error("[Sequencer] ❌ " + report.message);
            return ErrorKind::ERR_CONFIGURATION_FAILED;
        }
    }

    engine->info("[Sequencer] ⚙️ Configured: ±" + toFixed(profile.amplitudeDeg, 2) + "° @ " +
                 toFixed(profile.frequencyHz, 3) + " Hz × " + std::to_string(profile.cycleCount) +
                 " cycles (" + toFixed(profile.expectedMotionSec(), 1) + " s)");
    return ErrorKind::ERR_NONE;
}

// ============================================================================
// OPERATOR RENDEZVOUS
// ============================================================================

ErrorKind MotionSequencer::doAwaitOperator(const TestProfile& profile) {
    transition(RunState::STATE_AWAITING_OPERATOR);

    _rendezvous.signalReady(profile);
    if (!_rendezvous.waitForResume(_cancel) || _cancel.isCancelled()) {
        return ErrorKind::ERR_ABORTED_BY_OPERATOR;
    }
    return ErrorKind::ERR_NONE;
}

// ============================================================================
// RUNNING
// ============================================================================

ErrorKind MotionSequencer::doRunning(const TestProfile& profile, RecordSink& sink, RunReport& report) {
    transition(RunState::STATE_RUNNING);

    if (profile.isSinusoid()) {
        bool started = false;

        for (int attempt = 1; attempt <= _timing.startMaxAttempts; attempt++) {
            if (_cancel.isCancelled()) return ErrorKind::ERR_ABORTED_BY_OPERATOR;

            CommandResult r = _protocol.startOscillation();
            if (r.ok()) {
                started = true;
                break;
            }

            engine->warn("[Sequencer] ⚠️ START_OSCILLATION failed: " + describe(r));
            if (r.error == ErrorKind::ERR_DEVICE_ERROR) {
                report.message = "Table rejected START_OSCILLATION: " + describe(r);
                engine->error("[Sequencer] ❌ " + report.message);
                return ErrorKind::ERR_START_FAILED;
            }
            if (r.error == ErrorKind::ERR_TRANSPORT_CLOSED) {
                report.message = "Link lost while starting oscillation";
                return ErrorKind::ERR_TRANSPORT_CLOSED;
            }

            // Unanswered: the table may already be oscillating
            if (motionDetected()) {
                engine->info("[Sequencer] Motion detected, START_OSCILLATION took effect");
                started = true;
                break;
            }
        }

        if (_cancel.isCancelled()) return ErrorKind::ERR_ABORTED_BY_OPERATOR;
        if (!started) {
            report.message = "Oscillation did not start after " + std::to_string(_timing.startMaxAttempts) + " attempts";
            engine->error("[Sequencer] ❌ " + report.message);
            return ErrorKind::ERR_START_FAILED;
        }
    }

    AcquisitionLoop acquisition(_protocol, _clock, _cancel, _timing);
    report.acquisition = acquisition.run(profile.samplePeriodSec, profile.effectiveDurationSec(), sink);

    if (report.acquisition.failure != ErrorKind::ERR_NONE) {
        report.message = "Acquisition stopped: " + std::string(toString(report.acquisition.failure));
        return report.acquisition.failure;
    }
    if (report.acquisition.cancelled) {
        return ErrorKind::ERR_ABORTED_BY_OPERATOR;
    }
    return ErrorKind::ERR_NONE;
}

bool MotionSequencer::motionDetected() {
    CommandResult first = _protocol.queryPosition();
    if (!pause(_timing.startConfirmIntervalMs)) return false;
    CommandResult second = _protocol.queryPosition();

    if (!first.ok() || !second.ok()) return false;
    return std::fabs(second.response.positionDeg - first.response.positionDeg) > _timing.startMotionThresholdDeg;
}

// ============================================================================
// STOPPING
// ============================================================================

void MotionSequencer::doStopping(RunReport& report) {
    transition(RunState::STATE_STOPPING);

    if (!_cancel.claimFinalStop()) {
        engine->warn("[Sequencer] ⚠️ Final STOP already issued elsewhere");
        return;
    }

    CommandResult r = _protocol.stop();
    if (r.ok()) {
        report.stop = StopOutcome::STOP_ACKNOWLEDGED;
        engine->info("[Sequencer] 🛑 STOP acknowledged");
    } else {
        report.stop = StopOutcome::STOP_FAILED;
        engine->error("[Sequencer] ❌ STOP NOT ACKNOWLEDGED (" + describe(r) + "): table may still be moving");
    }
}

// ============================================================================
// HELPERS
// ============================================================================

bool MotionSequencer::pause(uint32_t ms) {
    if (ms == 0) return !_cancel.isCancelled();
    return _clock.sleepFor(std::chrono::milliseconds(ms), _cancel);
}
