// ============================================================================
// ACQUISITION_LOOP.CPP - Fixed-rate position sampling implementation
// ============================================================================

#include "movement/AcquisitionLoop.h"
#include "communication/CommandProtocol.h"
#include "core/CancellationController.h"
#include "core/Clock.h"
#include "core/Format.h"
#include "core/UtilityEngine.h"
#include "core/recording/RecordSink.h"

#include <cmath>

namespace {

double toSeconds(MonoTime t) {
    return std::chrono::duration<double>(t).count();
}

} // namespace

AcquisitionLoop::AcquisitionLoop(CommandProtocol& protocol, Clock& clock,
                                 CancellationController& cancel, const SequencerTiming& timing)
    : _protocol(protocol),
      _clock(clock),
      _cancel(cancel),
      _timing(timing) {
}

uint64_t AcquisitionLoop::plannedTicks(double periodSec, double durationSec) {
    if (!(periodSec > 0.0) || !(durationSec >= 0.0)) return 0;

    // Integer nanoseconds: 660 s / 8 ms must divide exactly
    const int64_t periodNs = std::llround(periodSec * 1e9);
    const int64_t durationNs = std::llround(durationSec * 1e9);
    if (periodNs <= 0) return 0;

    return static_cast<uint64_t>(durationNs / periodNs) + 1;
}

// ============================================================================
// MAIN LOOP
// ============================================================================

AcquisitionStats AcquisitionLoop::run(double periodSec, double durationSec, RecordSink& sink) {
    AcquisitionStats stats;
    stats.plannedTicks = plannedTicks(periodSec, durationSec);

    const MonoTime period(std::llround(periodSec * 1e9));
    const MonoTime start = _clock.now();
    const uint32_t progressEvery = _timing.progressLogInterval > 0 ? _timing.progressLogInterval : 1;

    engine->info("[Acquisition] ▶️ Sampling every " + toFixed(periodSec * 1000.0, 1) + " ms for " +
                 toFixed(durationSec, 1) + " s (" + std::to_string(stats.plannedTicks) + " ticks)");

    for (uint64_t tick = 0; tick < stats.plannedTicks; tick++) {
        const MonoTime scheduled = start + period * static_cast<int64_t>(tick);

        if (!_clock.sleepUntil(scheduled, _cancel)) {
            stats.cancelled = true;
            break;
        }

        if (_clock.now() - scheduled >= period) {
            stats.lateTicks++;
        }
        stats.ticksAttempted++;

        std::optional<CommandResult> result = sampleTick(stats);

        if (result.has_value()) {
            SampleRecord record;
            record.timeSec = toSeconds(result->sentAt - start);
            record.positionDeg = result->response.positionDeg;

            if (sink.append(record)) {
                stats.samplesRecorded++;
            } else if (sink.hasWriteFailed()) {
                stats.failure = ErrorKind::ERR_RECORDING_FAILED;
                break;
            } else {
                // Not written = not a sample
                stats.gaps++;
                sink.recordGap(tick, record.timeSec);
            }

            if (result->response.latency > stats.maxLatency) {
                stats.maxLatency = result->response.latency;
            }

            if (stats.samplesRecorded > 0 && stats.samplesRecorded % progressEvery == 0) {
                engine->info("[Acquisition] 📊 " + std::to_string(stats.samplesRecorded) + " samples, t=" +
                             toFixed(record.timeSec, 1) + " s, pos=" + toFixed(record.positionDeg, 3) + "°");
            }
        } else if (stats.failure != ErrorKind::ERR_NONE) {
            break;
        } else if (_cancel.isCancelled()) {
            stats.cancelled = true;
            break;
        } else {
            stats.gaps++;
            sink.recordGap(tick, toSeconds(_clock.now() - start));
        }

        engine->flushLogBuffer();
    }

    stats.elapsedSec = toSeconds(_clock.now() - start);

    if (stats.failure != ErrorKind::ERR_NONE) {
        engine->error("[Acquisition] ❌ Stopped after " + std::to_string(stats.ticksAttempted) + " ticks: " +
                      toString(stats.failure));
    } else if (stats.cancelled) {
        engine->warn("[Acquisition] ⏹️ Cancelled after " + std::to_string(stats.ticksAttempted) + "/" +
                     std::to_string(stats.plannedTicks) + " ticks");
    } else {
        engine->info("[Acquisition] ✅ Done: " + std::to_string(stats.samplesRecorded) + " samples, " +
                     std::to_string(stats.gaps) + " gaps, " + std::to_string(stats.retries) + " retries, " +
                     std::to_string(stats.lateTicks) + " late, max latency " +
                     std::to_string(stats.maxLatency.count() / 1000) + " ms");
    }

    return stats;
}

// ============================================================================
// TICK
// ============================================================================

std::optional<CommandResult> AcquisitionLoop::sampleTick(AcquisitionStats& stats) {
    uint32_t timeoutRetries = 0;
    bool desyncConfirmed = false;

    while (true) {
        CommandResult result = _protocol.queryPosition();
        if (result.ok()) return result;

        switch (result.error) {
            case ErrorKind::ERR_COMMUNICATION_TIMEOUT:
                if (timeoutRetries >= _timing.acquisitionMaxRetries) return std::nullopt;
                timeoutRetries++;
                break;

            case ErrorKind::ERR_PROTOCOL_DESYNC:
                // Unknown device state: one confirmatory query only
                if (desyncConfirmed) return std::nullopt;
                desyncConfirmed = true;
                break;

            case ErrorKind::ERR_TRANSPORT_CLOSED:
                stats.failure = ErrorKind::ERR_TRANSPORT_CLOSED;
                return std::nullopt;

            default:
                return std::nullopt;
        }

        if (_cancel.isCancelled()) return std::nullopt;
        stats.retries++;
    }
}
