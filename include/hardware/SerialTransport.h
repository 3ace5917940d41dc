// ============================================================================
// SERIAL_TRANSPORT.H - POSIX serial link (termios)
// ============================================================================
// Raw 8N1 tty, no flow control. Writes and reads are poll()-driven against
// one deadline, so a silent table or a wedged line costs at most the timeout.
// ============================================================================

#ifndef SERIAL_TRANSPORT_H
#define SERIAL_TRANSPORT_H

#include <chrono>
#include <mutex>
#include <string>
#include "core/Config.h"
#include "hardware/Transport.h"

/**
 * Serial link parameters (JSON "serial" section)
 */
struct SerialSettings {
    std::string port = DEFAULT_SERIAL_PORT;
    uint32_t baudRate = DEFAULT_BAUD_RATE;
    uint32_t responseTimeoutMs = DEFAULT_RESPONSE_TIMEOUT_MS;  // Commands
    uint32_t queryTimeoutMs = DEFAULT_QUERY_TIMEOUT_MS;        // Position queries
    uint32_t settleDelayMs = SERIAL_SETTLE_DELAY_MS;           // After open, before first command
};

class SerialTransport : public Transport {
public:
    explicit SerialTransport(const SerialSettings& settings);
    ~SerialTransport() override;

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    /**
     * Open and configure the tty, wait for the controller to settle,
     * then discard whatever it printed on reset
     * @param errorMsg Output error message on failure
     * @return true if the port is ready for commands
     */
    bool open(std::string& errorMsg);

    bool isOpen() const override;
    TransportReply send(const std::string& line, std::chrono::milliseconds timeout) override;
    void close() override;

    const SerialSettings& getSettings() const { return _settings; }

private:
    SerialSettings _settings;
    int _fd;
    mutable std::mutex _fdMutex;   // close() may race a send() from the stop path

    /**
     * Write every byte before the deadline
     * @return ERR_NONE, ERR_COMMUNICATION_TIMEOUT (output stalled) or ERR_TRANSPORT_CLOSED
     */
    ErrorKind writeAll(const std::string& data, std::chrono::steady_clock::time_point deadline);

    /** Map a numeric baud rate to its termios constant (0 if unsupported) */
    static unsigned int baudConstant(uint32_t baud);
};

#endif // SERIAL_TRANSPORT_H
