#ifndef PARKGATE_SERIAL_CHANNEL_H
#define PARKGATE_SERIAL_CHANNEL_H

#include "ActuatorChannel.h"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace parkgate {
namespace gate {

// Newline framing of the inbound byte stream. Complete lines are trimmed and
// queued; a partial line longer than max_pending bytes is line noise and is
// dropped with a warning.
class LineBuffer {
public:
    static constexpr std::size_t kDefaultMaxPending = 4096;

    explicit LineBuffer(std::size_t max_pending = kDefaultMaxPending) : max_pending_(max_pending) {}

    void append(const char* data, std::size_t n);
    std::vector<std::string> takeLines();
    void clear();

    std::size_t pending() const { return partial_.size(); }

private:
    std::size_t max_pending_;
    std::string partial_;
    std::vector<std::string> lines_;
};

// UART link to the gate controller (termios, 8N1, raw mode).
class SerialChannel : public ActuatorChannel {
public:
    // settle_ms: wait after open, the controller resets when the port opens
    SerialChannel(const std::string& port, int baud_rate, int timeout_ms, int settle_ms = 2000);
    ~SerialChannel() override;

    SerialChannel(const SerialChannel&) = delete;
    SerialChannel& operator=(const SerialChannel&) = delete;

    // empty port -> scan the usual USB serial device names
    bool connect();
    void disconnect();
    bool isConnected() const;
    const std::string& port() const { return port_; }

    bool send(const std::string& command) override;
    std::vector<std::string> pollMessages() override;

    static std::vector<std::string> candidatePorts();

private:
    bool openPort(const std::string& path);
    bool writeAll(const std::string& data);

    std::string port_;
    std::string configured_port_;
    int baud_rate_;
    int timeout_ms_;
    int settle_ms_;
    int fd_ = -1;
    LineBuffer rx_buffer_;    // partial line carried between polls
    mutable std::mutex io_mutex_;
};

} // namespace gate
} // namespace parkgate

#endif // PARKGATE_SERIAL_CHANNEL_H
