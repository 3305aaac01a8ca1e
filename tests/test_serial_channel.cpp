#include <gtest/gtest.h>

#include "parkgate/gate/SerialChannel.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

using namespace parkgate::gate;

namespace {

// 伪终端: master 端模拟控制器, slave 路径交给 SerialChannel
class PtyPair {
public:
    PtyPair() {
        master_ = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ < 0) return;
        if (::grantpt(master_) != 0 || ::unlockpt(master_) != 0) {
            ::close(master_);
            master_ = -1;
            return;
        }
        const char* name = ::ptsname(master_);
        if (name) slave_path_ = name;
    }
    ~PtyPair() {
        if (master_ >= 0) ::close(master_);
    }

    bool ok() const { return master_ >= 0 && !slave_path_.empty(); }
    const std::string& slavePath() const { return slave_path_; }

    void write(const std::string& data) {
        ASSERT_EQ(::write(master_, data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    // reads until a newline or the timeout
    std::string readLine(int timeout_ms = 1000) {
        std::string out;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            struct pollfd pfd{master_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            char c;
            if (::read(master_, &c, 1) == 1) {
                out.push_back(c);
                if (c == '\n') break;
            }
        }
        return out;
    }

private:
    int master_ = -1;
    std::string slave_path_;
};

std::vector<std::string> pollUntil(SerialChannel& ch, std::size_t n, int timeout_ms = 1000) {
    std::vector<std::string> all;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (all.size() < n && std::chrono::steady_clock::now() < deadline) {
        for (auto& m : ch.pollMessages()) all.push_back(m);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return all;
}

} // namespace

TEST(ParseSlotMessageTest, RecognisesSensorMessages) {
    EXPECT_EQ(parseSlotMessage("SLOT_OCCUPIED"), SlotMessage::OCCUPIED);
    EXPECT_EQ(parseSlotMessage("  SLOT_FREE\r\n"), SlotMessage::FREE);
    EXPECT_EQ(parseSlotMessage("slot_free"), SlotMessage::UNKNOWN);
    EXPECT_EQ(parseSlotMessage("READY"), SlotMessage::UNKNOWN);
    EXPECT_EQ(parseSlotMessage(""), SlotMessage::UNKNOWN);
}

TEST(LineBufferTest, LinesSplitAcrossChunksAreJoined) {
    LineBuffer rx;
    rx.append("SLOT_OC", 7);
    EXPECT_TRUE(rx.takeLines().empty());
    EXPECT_EQ(rx.pending(), 7u);

    const std::string rest = "CUPIED\r\n  \n SLOT_FREE \nREA";
    rx.append(rest.data(), rest.size());
    auto lines = rx.takeLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "SLOT_OCCUPIED");
    EXPECT_EQ(lines[1], "SLOT_FREE");
    EXPECT_EQ(rx.pending(), 3u);
}

TEST(LineBufferTest, UnterminatedNoiseIsDroppedPastLimit) {
    LineBuffer rx;
    const std::string noise(LineBuffer::kDefaultMaxPending + 1, 'x');
    rx.append(noise.data(), noise.size());
    EXPECT_EQ(rx.pending(), 0u);
    EXPECT_TRUE(rx.takeLines().empty());

    const std::string line = "SLOT_FREE\n";
    rx.append(line.data(), line.size());
    auto lines = rx.takeLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "SLOT_FREE");
}

TEST(LineBufferTest, PendingNeverExceedsLimit) {
    LineBuffer rx(64);
    const std::string chunk(40, 'z');
    for (int i = 0; i < 10; ++i) {
        rx.append(chunk.data(), chunk.size());
        EXPECT_LE(rx.pending(), 64u);
    }
    const std::string full = std::string(64, 'a') + "\n";
    rx.append(full.data(), full.size());
    EXPECT_EQ(rx.takeLines().size(), 1u);
}

TEST(SerialChannelTest, CommandsAreNewlineFramed) {
    PtyPair pty;
    ASSERT_TRUE(pty.ok());
    SerialChannel ch(pty.slavePath(), 115200, 500, 0);
    ASSERT_TRUE(ch.connect());
    EXPECT_TRUE(ch.isConnected());
    EXPECT_EQ(ch.port(), pty.slavePath());

    EXPECT_TRUE(ch.send("OPEN_ENTRY_GATE"));
    EXPECT_EQ(pty.readLine(), "OPEN_ENTRY_GATE\n");
    EXPECT_TRUE(ch.send("BUZZER_OFF"));
    EXPECT_EQ(pty.readLine(), "BUZZER_OFF\n");
}

TEST(SerialChannelTest, InboundLinesAreBufferedAndTrimmed) {
    PtyPair pty;
    ASSERT_TRUE(pty.ok());
    SerialChannel ch(pty.slavePath(), 115200, 500, 0);
    ASSERT_TRUE(ch.connect());

    pty.write("SLOT_OCC");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(ch.pollMessages().empty());

    pty.write("UPIED\r\n  \nSLOT_FREE\nHEL");
    auto messages = pollUntil(ch, 2);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "SLOT_OCCUPIED");
    EXPECT_EQ(messages[1], "SLOT_FREE");

    pty.write("LO\n");
    messages = pollUntil(ch, 1);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "HELLO");
}

TEST(SerialChannelTest, SendReconnectsAfterDisconnect) {
    PtyPair pty;
    ASSERT_TRUE(pty.ok());
    SerialChannel ch(pty.slavePath(), 115200, 500, 0);
    ASSERT_TRUE(ch.connect());
    ch.disconnect();
    EXPECT_FALSE(ch.isConnected());

    EXPECT_TRUE(ch.send("CLOSE_EXIT_GATE"));
    EXPECT_TRUE(ch.isConnected());
    EXPECT_EQ(pty.readLine(), "CLOSE_EXIT_GATE\n");
}

TEST(SerialChannelTest, MissingPortFailsWithoutThrowing) {
    SerialChannel ch("/dev/parkgate-no-such-port", 115200, 100, 0);
    EXPECT_FALSE(ch.connect());
    EXPECT_FALSE(ch.isConnected());
    EXPECT_FALSE(ch.send("OPEN_EXIT_GATE"));
    EXPECT_TRUE(ch.pollMessages().empty());
}

TEST(SerialChannelTest, CandidatePortsInScanOrder) {
    auto ports = SerialChannel::candidatePorts();
    ASSERT_EQ(ports.size(), 4u);
    EXPECT_EQ(ports[0], "/dev/ttyUSB0");
    EXPECT_EQ(ports[1], "/dev/ttyACM0");
    EXPECT_EQ(ports[2], "/dev/ttyUSB1");
    EXPECT_EQ(ports[3], "/dev/ttyACM1");
}
