#include "parkgate/gate/SerialChannel.h"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <thread>

namespace parkgate {
namespace gate {

SlotMessage parseSlotMessage(const std::string& message) {
    const char* ws = " \t\r\n";
    auto first = message.find_first_not_of(ws);
    if (first == std::string::npos) return SlotMessage::UNKNOWN;
    auto last = message.find_last_not_of(ws);
    std::string m = message.substr(first, last - first + 1);

    if (m == ActuatorCommands::SLOT_OCCUPIED) return SlotMessage::OCCUPIED;
    if (m == ActuatorCommands::SLOT_FREE)     return SlotMessage::FREE;
    return SlotMessage::UNKNOWN;
}

void LineBuffer::append(const char* data, std::size_t n) {
    partial_.append(data, n);

    std::size_t pos;
    while ((pos = partial_.find('\n')) != std::string::npos) {
        std::string line = partial_.substr(0, pos);
        partial_.erase(0, pos + 1);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) line.pop_back();
        std::size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        lines_.push_back(line.substr(first));
    }

    if (partial_.size() > max_pending_) {
        std::cerr << "[Serial] Warning: dropping " << partial_.size()
                  << " bytes received without a newline\n";
        partial_.clear();
    }
}

std::vector<std::string> LineBuffer::takeLines() {
    std::vector<std::string> out;
    out.swap(lines_);
    return out;
}

void LineBuffer::clear() {
    partial_.clear();
    lines_.clear();
}

static speed_t toSpeed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default:     return 0;
    }
}

SerialChannel::SerialChannel(const std::string& port, int baud_rate, int timeout_ms, int settle_ms)
    : port_(port), configured_port_(port), baud_rate_(baud_rate),
      timeout_ms_(timeout_ms), settle_ms_(settle_ms) {}

SerialChannel::~SerialChannel() {
    disconnect();
}

std::vector<std::string> SerialChannel::candidatePorts() {
    return {"/dev/ttyUSB0", "/dev/ttyACM0", "/dev/ttyUSB1", "/dev/ttyACM1"};
}

bool SerialChannel::openPort(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd == -1) return false;

    struct termios options;
    if (tcgetattr(fd, &options) != 0) {
        std::cerr << "[Serial] tcgetattr failed on " << path << ": " << std::strerror(errno) << "\n";
        ::close(fd);
        return false;
    }
    cfmakeraw(&options);
    options.c_cflag |= (CLOCAL | CREAD);
    options.c_cflag &= ~CSTOPB;
    options.c_cc[VMIN] = 0;
    options.c_cc[VTIME] = 0;
    speed_t speed = toSpeed(baud_rate_);
    if (speed == 0) {
        std::cerr << "[Serial] Warning: unsupported baud rate " << baud_rate_ << ", using 115200\n";
        speed = B115200;
    }
    cfsetispeed(&options, speed);
    cfsetospeed(&options, speed);
    if (tcsetattr(fd, TCSANOW, &options) != 0) {
        std::cerr << "[Serial] tcsetattr failed on " << path << ": " << std::strerror(errno) << "\n";
        ::close(fd);
        return false;
    }

    fd_ = fd;
    port_ = path;
    return true;
}

bool SerialChannel::connect() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (fd_ != -1) return true;

    bool opened = false;
    if (!configured_port_.empty()) {
        opened = openPort(configured_port_);
        if (!opened) {
            std::cerr << "[Serial] Serial connection error on " << configured_port_ << ": "
                      << std::strerror(errno) << "\n";
        }
    } else {
        for (const auto& candidate : candidatePorts()) {
            if (openPort(candidate)) {
                std::cout << "[Serial] Auto-detected controller on port: " << candidate << "\n";
                opened = true;
                break;
            }
        }
        if (!opened) std::cerr << "[Serial] Could not auto-detect controller serial port\n";
    }
    if (!opened) return false;

    if (settle_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(settle_ms_));
    tcflush(fd_, TCIOFLUSH);
    rx_buffer_.clear();

    std::cout << "[Serial] Serial connection established on " << port_ << " at " << baud_rate_ << " baud\n";
    return true;
}

void SerialChannel::disconnect() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
        std::cout << "[Serial] Serial connection closed\n";
    }
}

bool SerialChannel::isConnected() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return fd_ != -1;
}

bool SerialChannel::writeAll(const std::string& data) {
    std::size_t written = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    while (written < data.size()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            std::cerr << "[Serial] Error: serial write timeout\n";
            return false;
        }
        struct pollfd pfd{fd_, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[Serial] Error: poll failed: " << std::strerror(errno) << "\n";
            return false;
        }
        if (ready == 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            std::cerr << "[Serial] Error: serial line hung up\n";
            ::close(fd_);
            fd_ = -1;
            return false;
        }
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            std::cerr << "[Serial] Error: serial write error: " << std::strerror(errno) << "\n";
            ::close(fd_);
            fd_ = -1;
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

bool SerialChannel::send(const std::string& command) {
    if (!isConnected()) {
        std::cerr << "[Serial] Warning: serial connection not established. Attempting to reconnect...\n";
        if (!connect()) {
            std::cerr << "[Serial] Error: command dropped: " << command << "\n";
            return false;
        }
    }
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (fd_ == -1) return false;
    if (!writeAll(command + "\n")) return false;
    std::cout << "[Serial] Sent command: " << command << "\n";
    return true;
}

std::vector<std::string> SerialChannel::pollMessages() {
    std::vector<std::string> messages;
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (fd_ == -1) return messages;

    char buf[256];
    while (true) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
            rx_buffer_.append(buf, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::cerr << "[Serial] Error: serial read error: " << std::strerror(errno) << "\n";
            ::close(fd_);
            fd_ = -1;
        }
        break;
    }

    return rx_buffer_.takeLines();
}

} // namespace gate
} // namespace parkgate
