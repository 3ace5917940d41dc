// ============================================================================
// COMMAND_PROTOCOL.H - Rate table command set (encode / exchange / decode)
// ============================================================================
// ASCII request/response protocol, one command in flight at a time:
//
//   Verb                   Wire       Reply
//   CMD_HOME               HOM        ack
//   CMD_STOP               STO        ack
//   CMD_QUERY_POSITION     PPO        position (deg)
//   CMD_MOVE_TO            POS<deg>   ack
//   CMD_SET_AMPLITUDE      AMP<deg>   ack
//   CMD_SET_FREQUENCY      FRQ<hz>    ack
//   CMD_SET_CYCLES         CYC<n>     ack
//   CMD_START_OSCILLATION  SGO        ack
//   CMD_ZERO_POSITION      PZR        ack
//
// Commands end with '\r', replies end with the '>' prompt, '?' = device error.
// No retries here: retry policy belongs to the sequencer / acquisition loop.
// ============================================================================

#ifndef COMMAND_PROTOCOL_H
#define COMMAND_PROTOCOL_H

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include "core/Types.h"

class Transport;
class Clock;

class CommandProtocol {
public:
    /**
     * @param transport Link to the table (not owned)
     * @param clock Timestamp source for sentAt / receivedAt (not owned)
     * @param commandTimeout Reply timeout for every command except queries
     * @param queryTimeout Reply timeout for CMD_QUERY_POSITION
     */
    CommandProtocol(Transport& transport, Clock& clock,
                    std::chrono::milliseconds commandTimeout,
                    std::chrono::milliseconds queryTimeout);

    // ========================================================================
    // CODEC (pure)
    // ========================================================================

    /** Wire text for a command, without terminator ("POS12.5", "CYC54", "SGO") */
    static std::string encode(const Command& command);

    /**
     * Classify a raw reply for the command that produced it
     * Sets error ERR_DEVICE_ERROR ('?'), ERR_PROTOCOL_DESYNC (not what this
     * command can answer) or ERR_NONE with response.kind ACK / POSITION
     */
    static CommandResult decode(const Command& command, const std::string& raw);

    /**
     * True when the wire argument reads back as the requested value
     * (at float precision). Arguments are sent with 4 decimals
     */
    static bool encodesExactly(const Command& command);

    // ========================================================================
    // EXCHANGE
    // ========================================================================

    /**
     * Send one command and wait for its reply (exclusive for the whole exchange)
     * Never retries. Transport errors are reported as-is
     */
    CommandResult execute(const Command& command);

    // Convenience wrappers
    CommandResult home()                          { return execute(Command(CommandVerb::CMD_HOME)); }
    CommandResult stop()                          { return execute(Command(CommandVerb::CMD_STOP)); }
    CommandResult queryPosition()                 { return execute(Command(CommandVerb::CMD_QUERY_POSITION)); }
    CommandResult moveTo(double deg)              { return execute(Command(CommandVerb::CMD_MOVE_TO, deg)); }
    CommandResult setAmplitude(double deg)        { return execute(Command(CommandVerb::CMD_SET_AMPLITUDE, deg)); }
    CommandResult setFrequency(double hz)         { return execute(Command(CommandVerb::CMD_SET_FREQUENCY, hz)); }
    CommandResult setCycles(uint32_t cycles)      { return execute(Command(CommandVerb::CMD_SET_CYCLES, static_cast<double>(cycles))); }
    CommandResult startOscillation()              { return execute(Command(CommandVerb::CMD_START_OSCILLATION)); }
    CommandResult zeroPosition()                  { return execute(Command(CommandVerb::CMD_ZERO_POSITION)); }

    // Stats
    uint64_t commandsSent() const { return _commandsSent.load(); }
    uint64_t failures() const { return _failures.load(); }

private:
    Transport& _transport;
    Clock& _clock;
    std::chrono::milliseconds _commandTimeout;
    std::chrono::milliseconds _queryTimeout;

    std::mutex _exchangeMutex;
    std::atomic<uint64_t> _commandsSent;
    std::atomic<uint64_t> _failures;
};

#endif // COMMAND_PROTOCOL_H
