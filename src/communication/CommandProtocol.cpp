// ============================================================================
// COMMAND_PROTOCOL.CPP - Rate table command set implementation
// ============================================================================

#include "communication/CommandProtocol.h"
#include "core/Clock.h"
#include "core/Config.h"
#include "core/Format.h"
#include "core/UtilityEngine.h"
#include "hardware/Transport.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace {

const char* verbToken(CommandVerb verb) {
    using enum CommandVerb;
    switch (verb) {
        case CMD_HOME:              return "HOM";
        case CMD_STOP:              return "STO";
        case CMD_QUERY_POSITION:    return "PPO";
        case CMD_MOVE_TO:           return "POS";
        case CMD_SET_AMPLITUDE:     return "AMP";
        case CMD_SET_FREQUENCY:     return "FRQ";
        case CMD_SET_CYCLES:        return "CYC";
        case CMD_START_OSCILLATION: return "SGO";
        case CMD_ZERO_POSITION:     return "PZR";
    }
    return "";
}

// Prompt, CR and LF removed, surrounding blanks trimmed
std::string cleanReply(const std::string& raw) {
    std::string text;
    text.reserve(raw.size());
    for (char c : raw) {
        if (c == RESPONSE_PROMPT || c == '\r' || c == '\n') continue;
        text.push_back(c);
    }

    size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) first++;
    size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) last--;
    return text.substr(first, last - first);
}

// Strict numeric parse: the whole text must be one finite number
bool parseNumber(const std::string& text, double& value) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') return false;
    return std::isfinite(value);
}

} // namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

CommandProtocol::CommandProtocol(Transport& transport, Clock& clock,
                                 std::chrono::milliseconds commandTimeout,
                                 std::chrono::milliseconds queryTimeout)
    : _transport(transport),
      _clock(clock),
      _commandTimeout(commandTimeout),
      _queryTimeout(queryTimeout),
      _commandsSent(0),
      _failures(0) {
}

// ============================================================================
// CODEC
// ============================================================================

std::string CommandProtocol::encode(const Command& command) {
    std::string wire = verbToken(command.verb);
    if (!command.argument.has_value()) return wire;

    if (command.verb == CommandVerb::CMD_SET_CYCLES) {
        wire += std::to_string(static_cast<long long>(std::llround(*command.argument)));
    } else {
        wire += toCompact(*command.argument);
    }
    return wire;
}

bool CommandProtocol::encodesExactly(const Command& command) {
    if (!command.argument.has_value()) return true;

    const std::string wire = encode(command);
    const double sent = std::strtod(wire.c_str() + std::string(verbToken(command.verb)).size(), nullptr);
    if (command.verb == CommandVerb::CMD_SET_CYCLES) {
        return sent == *command.argument;
    }
    // Profile values are floats: compare at the precision they were given in
    return static_cast<float>(sent) == static_cast<float>(*command.argument);
}

CommandResult CommandProtocol::decode(const Command& command, const std::string& raw) {
    CommandResult result;
    result.response.raw = raw;

    std::string text = cleanReply(raw);

    // Device error: '?' optionally followed by a numeric code
    size_t marker = text.find(RESPONSE_ERROR_MARKER);
    if (marker != std::string::npos) {
        result.error = ErrorKind::ERR_DEVICE_ERROR;
        result.response.kind = ResponseKind::RESP_ERROR;
        result.response.errorCode = std::atoi(text.c_str() + marker + 1);
        return result;
    }

    if (command.verb == CommandVerb::CMD_QUERY_POSITION) {
        // Echoed query token before the value is tolerated
        const std::string token = verbToken(CommandVerb::CMD_QUERY_POSITION);
        if (text.compare(0, token.size(), token) == 0) {
            text = cleanReply(text.substr(token.size()));
        }

        double value = 0.0;
        if (!parseNumber(text, value)) {
            result.error = ErrorKind::ERR_PROTOCOL_DESYNC;
            return result;
        }
        result.response.kind = ResponseKind::RESP_POSITION;
        result.response.positionDeg = static_cast<float>(value);
        return result;
    }

    // Every other command answers with a bare prompt (or an echo of itself)
    if (text.empty() || text == encode(command)) {
        result.response.kind = ResponseKind::RESP_ACK;
        return result;
    }

    result.error = ErrorKind::ERR_PROTOCOL_DESYNC;
    return result;
}

// ============================================================================
// EXCHANGE
// ============================================================================

CommandResult CommandProtocol::execute(const Command& command) {
    std::lock_guard<std::mutex> lock(_exchangeMutex);

    const std::string wire = encode(command);
    if (!encodesExactly(command)) {
        engine->warn("[Protocol] ⚠️ " + std::string(toString(command.verb)) + " " + toFixed(*command.argument, 6) +
                     " sent as " + wire);
    }
    const auto timeout = (command.verb == CommandVerb::CMD_QUERY_POSITION) ? _queryTimeout : _commandTimeout;

    MonoTime sentAt = _clock.now();
    TransportReply reply = _transport.send(wire, timeout);
    MonoTime receivedAt = _clock.now();
    _commandsSent++;

    CommandResult result;
    if (reply.error != ErrorKind::ERR_NONE) {
        result.error = reply.error;
        result.response.raw = reply.raw;
    } else {
        result = decode(command, reply.raw);
    }

    result.sentAt = sentAt;
    result.receivedAt = receivedAt;
    result.response.latency = std::chrono::duration_cast<std::chrono::microseconds>(receivedAt - sentAt);

    if (!result.ok()) {
        _failures++;
        engine->debug("[Protocol] " + wire + " → " + toString(result.error) +
                      (result.response.raw.empty() ? "" : " (raw: '" + cleanReply(result.response.raw) + "')"));
    } else if (engine->isDebugEnabled() && command.verb != CommandVerb::CMD_QUERY_POSITION) {
        engine->debug("[Protocol] " + wire + " → OK (" + std::to_string(result.response.latency.count() / 1000) + " ms)");
    }

    return result;
}
