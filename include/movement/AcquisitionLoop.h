// ============================================================================
// ACQUISITION_LOOP.H - Fixed-rate position sampling
// ============================================================================
// Samples the table position every P seconds for D seconds:
//   - floor(D/P) + 1 ticks (computed in integer nanoseconds)
//   - tick k scheduled at start + k·P (no cumulative drift)
//   - a late tick is delayed, never dropped, never overlapped
//   - each sample stamped with the send time of its successful query
//
// Per-tick failure policy:
//   ERR_COMMUNICATION_TIMEOUT  → retry, up to acquisitionMaxRetries
//   ERR_PROTOCOL_DESYNC        → one confirmatory query, then give up
//   ERR_DEVICE_ERROR           → give up
//   ERR_TRANSPORT_CLOSED       → stop acquiring (stats.failure set)
// A given-up tick is a gap: no row is written and no value is invented.
// A sample the sink cannot write stops the run (ERR_RECORDING_FAILED).
// ============================================================================

#ifndef ACQUISITION_LOOP_H
#define ACQUISITION_LOOP_H

#include <cstdint>
#include <optional>
#include "core/Types.h"

class CommandProtocol;
class Clock;
class CancellationController;
class RecordSink;

class AcquisitionLoop {
public:
    AcquisitionLoop(CommandProtocol& protocol, Clock& clock,
                    CancellationController& cancel, const SequencerTiming& timing);

    /** Number of ticks a full run attempts: floor(D/P) + 1 (0 if P <= 0) */
    static uint64_t plannedTicks(double periodSec, double durationSec);

    /**
     * Sample until the last tick or cancellation
     * @param periodSec Sample period P
     * @param durationSec Acquisition duration D
     * @param sink Destination for every successful sample
     */
    AcquisitionStats run(double periodSec, double durationSec, RecordSink& sink);

private:
    CommandProtocol& _protocol;
    Clock& _clock;
    CancellationController& _cancel;
    const SequencerTiming& _timing;

    /**
     * One tick with its retries
     * @return the successful query, or nullopt for a gap / cancellation
     */
    std::optional<CommandResult> sampleTick(AcquisitionStats& stats);
};

#endif // ACQUISITION_LOOP_H
