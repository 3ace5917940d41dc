// ============================================================================
// TRANSPORT.H - Request/response link to the rate table
// ============================================================================
// Abstract byte link used by CommandProtocol. One exchange = one line out,
// one prompt-terminated reply back. Implementations:
// - SerialTransport      (hardware/SerialTransport.h): POSIX tty
// - SimulatedRateTable   (test/test_native): in-process table model
// ============================================================================

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <chrono>
#include <string>
#include "core/Types.h"

class Transport {
public:
    virtual ~Transport() = default;

    virtual bool isOpen() const = 0;

    /**
     * Send one command line and wait for the prompt-terminated reply
     * Stale input is discarded before sending; the terminator is appended here
     *
     * @param line Encoded command without terminator (e.g. "POS12.5")
     * @param timeout Maximum wait for the complete reply
     * @return raw reply text (prompt included) or the link error:
     *         ERR_COMMUNICATION_TIMEOUT  nothing received in time
     *         ERR_PROTOCOL_DESYNC        partial, oversized or garbled reply
     *         ERR_TRANSPORT_CLOSED       link not open or I/O failure
     */
    virtual TransportReply send(const std::string& line, std::chrono::milliseconds timeout) = 0;

    /** Release the link. Idempotent */
    virtual void close() = 0;
};

#endif // TRANSPORT_H
