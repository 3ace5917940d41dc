// ============================================================================
// SERIAL_TRANSPORT.CPP - POSIX serial link implementation
// ============================================================================

#include "hardware/SerialTransport.h"
#include "core/UtilityEngine.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

SerialTransport::SerialTransport(const SerialSettings& settings)
    : _settings(settings),
      _fd(-1) {
}

SerialTransport::~SerialTransport() {
    close();
}

// ============================================================================
// OPEN / CLOSE
// ============================================================================

bool SerialTransport::open(std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(_fdMutex);
    if (_fd >= 0) return true;

    unsigned int speed = baudConstant(_settings.baudRate);
    if (speed == 0) {
        errorMsg = "Unsupported baud rate: " + std::to_string(_settings.baudRate);
        return false;
    }

    int fd = ::open(_settings.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        errorMsg = "Cannot open " + _settings.port + ": " + std::strerror(errno);
        return false;
    }

    struct termios tio;
    if (tcgetattr(fd, &tio) != 0) {
        errorMsg = "tcgetattr failed on " + _settings.port + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }

    // Raw 8N1, no flow control, reads driven by poll()
    cfmakeraw(&tio);
    tio.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    cfsetispeed(&tio, static_cast<speed_t>(speed));
    cfsetospeed(&tio, static_cast<speed_t>(speed));

    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        errorMsg = "tcsetattr failed on " + _settings.port + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }

    engine->info("[Serial] 🔌 Opened " + _settings.port + " @ " + std::to_string(_settings.baudRate) + " baud");

    // Controller resets its UART on open and prints a banner
    if (_settings.settleDelayMs > 0) {
        engine->debug("[Serial] Settling " + std::to_string(_settings.settleDelayMs) + " ms");
        std::this_thread::sleep_for(std::chrono::milliseconds(_settings.settleDelayMs));
    }
    tcflush(fd, TCIOFLUSH);

    _fd = fd;
    return true;
}

bool SerialTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(_fdMutex);
    return _fd >= 0;
}

void SerialTransport::close() {
    std::lock_guard<std::mutex> lock(_fdMutex);
    if (_fd < 0) return;

    // Pending output is dropped: a wedged line must not block close()
    tcflush(_fd, TCIOFLUSH);
    ::close(_fd);
    _fd = -1;
    engine->info("[Serial] Port closed: " + _settings.port);
}

// ============================================================================
// EXCHANGE
// ============================================================================

TransportReply SerialTransport::send(const std::string& line, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(_fdMutex);
    TransportReply reply;

    if (_fd < 0) {
        reply.error = ErrorKind::ERR_TRANSPORT_CLOSED;
        return reply;
    }

    // Drop stale bytes (late reply to a previous timed-out command)
    tcflush(_fd, TCIFLUSH);

    // One budget for the whole exchange, write included
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    reply.error = writeAll(line + COMMAND_TERMINATOR, deadline);
    if (reply.error != ErrorKind::ERR_NONE) {
        if (reply.error == ErrorKind::ERR_TRANSPORT_CLOSED) {
            engine->error("[Serial] ❌ Write failed: " + std::string(std::strerror(errno)));
        } else {
            engine->warn("[Serial] ⚠️ Output stalled, " + line.substr(0, 3) + " not sent within " +
                         std::to_string(timeout.count()) + " ms");
        }
        return reply;
    }

    char buf[64];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            // Silence = timeout, half a reply = lost framing
            reply.error = reply.raw.empty() ? ErrorKind::ERR_COMMUNICATION_TIMEOUT
                                            : ErrorKind::ERR_PROTOCOL_DESYNC;
            return reply;
        }

        struct pollfd pfd;
        pfd.fd = _fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            engine->error("[Serial] ❌ poll failed: " + std::string(std::strerror(errno)));
            reply.error = ErrorKind::ERR_TRANSPORT_CLOSED;
            return reply;
        }
        if (rc == 0) continue;  // Deadline re-checked at loop top

        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            engine->error("[Serial] ❌ Link lost on " + _settings.port);
            reply.error = ErrorKind::ERR_TRANSPORT_CLOSED;
            return reply;
        }

        ssize_t n = ::read(_fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            engine->error("[Serial] ❌ Read failed: " + std::string(std::strerror(errno)));
            reply.error = ErrorKind::ERR_TRANSPORT_CLOSED;
            return reply;
        }
        if (n == 0) continue;

        for (ssize_t i = 0; i < n; i++) {
            unsigned char c = static_cast<unsigned char>(buf[i]);

            // Line noise or a baud mismatch shows up as non-ASCII bytes
            if (c >= 0x80 || (c < 0x20 && c != '\r' && c != '\n')) {
                reply.raw.push_back(static_cast<char>(c));
                reply.error = ErrorKind::ERR_PROTOCOL_DESYNC;
                return reply;
            }

            reply.raw.push_back(static_cast<char>(c));
            if (c == static_cast<unsigned char>(RESPONSE_PROMPT)) {
                return reply;
            }
            if (reply.raw.size() >= MAX_RESPONSE_BYTES) {
                reply.error = ErrorKind::ERR_PROTOCOL_DESYNC;
                return reply;
            }
        }
    }
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

ErrorKind SerialTransport::writeAll(const std::string& data, std::chrono::steady_clock::time_point deadline) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(_fd, data.data() + written, data.size() - written);
        if (n >= 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) return ErrorKind::ERR_TRANSPORT_CLOSED;

        // Output queue full: wait for room, never past the exchange deadline
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return ErrorKind::ERR_COMMUNICATION_TIMEOUT;

        struct pollfd pfd;
        pfd.fd = _fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (::poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR) {
            return ErrorKind::ERR_TRANSPORT_CLOSED;
        }
    }
    return ErrorKind::ERR_NONE;
}

unsigned int SerialTransport::baudConstant(uint32_t baud) {
    switch (baud) {
        case 1200:   return B1200;
        case 2400:   return B2400;
        case 4800:   return B4800;
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default:     return 0;
    }
}
