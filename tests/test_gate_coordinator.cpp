#include <gtest/gtest.h>

#include "parkgate/gate/GateCoordinator.h"
#include "support/TestSupport.h"

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

using namespace parkgate;
using namespace parkgate::gate;
using parkgate::vision::ZoneId;
using namespace std::chrono_literals;

namespace {

class GateCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        layout.resolve(cv::Size(1280, 720));
        settings.total_slots = 1;
        settings.hourly_rate = 10.0;
        build();
    }

    void build() {
        coordinator = std::make_unique<GateCoordinator>(settings, repo, channel, reader, layout, scheduler, clock);
    }

    vision::CrossingEvent event(ZoneId zone) {
        vision::CrossingEvent ev;
        ev.zone = zone;
        ev.frame = test::blankFrame();
        ev.zone_image = layout.crop(ev.frame, zone).clone();
        ev.detected_at = clock.wallNow();
        return ev;
    }

    test::ManualClock clock;
    test::ManualScheduler scheduler{clock};
    test::FakeChannel channel;
    test::StubPlateReader reader;
    test::MemoryRepository repo;
    vision::ZoneLayout layout;
    GateSettings settings;
    std::unique_ptr<GateCoordinator> coordinator;
};

TEST_F(GateCoordinatorTest, EntryOpensGateAndClosesAfterGrace) {
    reader.fallback = std::string("ABC123");

    coordinator->handle(event(ZoneId::ENTRY));

    ASSERT_EQ(repo.active.size(), 1u);
    EXPECT_EQ(repo.active.at("ABC123").slot, 1);
    EXPECT_EQ(repo.active.at("ABC123").entry_time, clock.wallNow());
    ASSERT_EQ(channel.sent.size(), 1u);
    EXPECT_EQ(channel.sent[0], ActuatorCommands::OPEN_ENTRY_GATE);
    EXPECT_TRUE(coordinator->isProcessing(ZoneId::ENTRY));

    scheduler.advance(4999ms);
    EXPECT_EQ(channel.count(ActuatorCommands::CLOSE_ENTRY_GATE), 0u);
    EXPECT_TRUE(coordinator->isProcessing(ZoneId::ENTRY));

    scheduler.advance(1ms);
    EXPECT_EQ(channel.count(ActuatorCommands::CLOSE_ENTRY_GATE), 1u);
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::ENTRY));
}

TEST_F(GateCoordinatorTest, FullLotSoundsBuzzerWithoutReadingPlate) {
    reader.fallback = std::string("ABC123");
    coordinator->handle(event(ZoneId::ENTRY));
    scheduler.advance(5s);
    channel.sent.clear();
    const int calls_before = reader.calls;
    const auto slept_before = clock.slept();

    reader.fallback = std::string("XYZ999");
    coordinator->handle(event(ZoneId::ENTRY));

    ASSERT_EQ(channel.sent.size(), 2u);
    EXPECT_EQ(channel.sent[0], ActuatorCommands::BUZZER_ON);
    EXPECT_EQ(channel.sent[1], ActuatorCommands::BUZZER_OFF);
    EXPECT_EQ(clock.slept() - slept_before, 3000ms);
    EXPECT_EQ(reader.calls, calls_before);
    EXPECT_EQ(repo.active.size(), 1u);
    EXPECT_EQ(repo.active.count("XYZ999"), 0u);
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::ENTRY));
}

TEST_F(GateCoordinatorTest, DuplicatePlateIsDenied) {
    settings.total_slots = 2;
    build();
    repo.active["ABC123"] = ActiveVehicle{"ABC123", clock.wallNow() - 1h, 1};
    reader.fallback = std::string("ABC123");

    coordinator->handle(event(ZoneId::ENTRY));

    EXPECT_EQ(repo.active.size(), 1u);
    EXPECT_TRUE(channel.sent.empty());
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::ENTRY));
}

TEST_F(GateCoordinatorTest, SecondCrossingWhileProcessingIsDropped) {
    settings.total_slots = 3;
    build();
    reader.queued = {std::string("ABC123"), std::string("DEF456")};

    coordinator->handle(event(ZoneId::ENTRY));
    ASSERT_TRUE(coordinator->isProcessing(ZoneId::ENTRY));

    coordinator->handle(event(ZoneId::ENTRY));

    EXPECT_EQ(reader.calls, 1);
    EXPECT_EQ(repo.active.size(), 1u);
    EXPECT_EQ(channel.count(ActuatorCommands::OPEN_ENTRY_GATE), 1u);
    EXPECT_EQ(scheduler.pending(), 1u);
}

TEST_F(GateCoordinatorTest, ZonesAreIndependent) {
    reader.queued = {std::string("ABC123"), std::string("OLD999")};
    repo.active["OLD999"] = ActiveVehicle{"OLD999", clock.wallNow() - 30min, 1};
    settings.total_slots = 2;
    build();

    coordinator->handle(event(ZoneId::ENTRY));
    coordinator->handle(event(ZoneId::EXIT));

    EXPECT_EQ(channel.count(ActuatorCommands::OPEN_ENTRY_GATE), 1u);
    EXPECT_EQ(channel.count(ActuatorCommands::OPEN_EXIT_GATE), 1u);
    EXPECT_TRUE(coordinator->isProcessing(ZoneId::ENTRY));
    EXPECT_TRUE(coordinator->isProcessing(ZoneId::EXIT));
}

TEST_F(GateCoordinatorTest, RetryReadsFreshZoneCropAfterDelay) {
    reader.queued = {std::nullopt, std::string("ABC123")};

    coordinator->handle(event(ZoneId::ENTRY));

    EXPECT_EQ(reader.calls, 2);
    EXPECT_EQ(clock.slept(), 500ms);
    EXPECT_EQ(reader.last_image_size, cv::Size(640, 480));
    EXPECT_EQ(repo.active.count("ABC123"), 1u);
    EXPECT_EQ(channel.count(ActuatorCommands::OPEN_ENTRY_GATE), 1u);
}

TEST_F(GateCoordinatorTest, UnreadablePlateAbandonsEntry) {
    coordinator->handle(event(ZoneId::ENTRY));

    EXPECT_EQ(reader.calls, 2);
    EXPECT_TRUE(repo.active.empty());
    EXPECT_TRUE(channel.sent.empty());
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::ENTRY));
}

TEST_F(GateCoordinatorTest, PersistenceFailureKeepsGateClosed) {
    reader.fallback = std::string("ABC123");
    repo.fail_add_active = true;

    coordinator->handle(event(ZoneId::ENTRY));

    EXPECT_TRUE(channel.sent.empty());
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::ENTRY));
}

TEST_F(GateCoordinatorTest, LowestFreeSlotIsAssigned) {
    settings.total_slots = 3;
    build();
    repo.active["AAA111"] = ActiveVehicle{"AAA111", clock.wallNow(), 1};
    repo.active["CCC333"] = ActiveVehicle{"CCC333", clock.wallNow(), 3};
    reader.fallback = std::string("BBB222");

    coordinator->handle(event(ZoneId::ENTRY));

    ASSERT_EQ(repo.active.count("BBB222"), 1u);
    EXPECT_EQ(repo.active.at("BBB222").slot, 2);
}

TEST_F(GateCoordinatorTest, FailedOpenCommandStillReleasesZone) {
    reader.fallback = std::string("ABC123");
    channel.send_ok = false;

    coordinator->handle(event(ZoneId::ENTRY));

    EXPECT_EQ(repo.active.count("ABC123"), 1u);
    EXPECT_TRUE(coordinator->isProcessing(ZoneId::ENTRY));
    scheduler.advance(5s);
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::ENTRY));
}

TEST_F(GateCoordinatorTest, ExitChargesStartedHoursAndOpensGate) {
    const auto entry_time = clock.wallNow() - (2h + 30min);
    repo.active["ABC123"] = ActiveVehicle{"ABC123", entry_time, 1};
    reader.fallback = std::string("ABC123");

    coordinator->handle(event(ZoneId::EXIT));

    ASSERT_EQ(repo.history.size(), 1u);
    EXPECT_EQ(repo.history[0].number_plate, "ABC123");
    EXPECT_EQ(repo.history[0].entry_time, entry_time);
    EXPECT_EQ(repo.history[0].exit_time, clock.wallNow());
    EXPECT_DOUBLE_EQ(repo.history[0].fee, 30.0);
    EXPECT_EQ(repo.history[0].slot, 1);
    EXPECT_TRUE(repo.active.empty());
    EXPECT_EQ(channel.count(ActuatorCommands::OPEN_EXIT_GATE), 1u);

    scheduler.advance(5s);
    EXPECT_EQ(channel.count(ActuatorCommands::CLOSE_EXIT_GATE), 1u);
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::EXIT));
}

TEST_F(GateCoordinatorTest, ExitOfUnknownPlateIsIgnored) {
    reader.fallback = std::string("NOPE42");

    coordinator->handle(event(ZoneId::EXIT));

    EXPECT_TRUE(repo.history.empty());
    EXPECT_TRUE(channel.sent.empty());
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::EXIT));
}

TEST_F(GateCoordinatorTest, ExitAbortsWhenHistoryCannotBeWritten) {
    repo.active["ABC123"] = ActiveVehicle{"ABC123", clock.wallNow() - 1h, 1};
    repo.fail_add_history = true;
    reader.fallback = std::string("ABC123");

    coordinator->handle(event(ZoneId::EXIT));

    EXPECT_EQ(repo.active.count("ABC123"), 1u);
    EXPECT_TRUE(channel.sent.empty());
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::EXIT));
}

TEST_F(GateCoordinatorTest, ExitRetryAfterFailedRemovalDoesNotDuplicateHistory) {
    const auto entry_time = clock.wallNow() - 1h;
    repo.active["ABC123"] = ActiveVehicle{"ABC123", entry_time, 1};
    repo.fail_remove_active = true;
    reader.fallback = std::string("ABC123");

    coordinator->handle(event(ZoneId::EXIT));

    EXPECT_EQ(repo.history.size(), 1u);
    EXPECT_EQ(repo.active.count("ABC123"), 1u);
    EXPECT_TRUE(channel.sent.empty());
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::EXIT));

    repo.fail_remove_active = false;
    clock.advance(1min);
    coordinator->handle(event(ZoneId::EXIT));

    ASSERT_EQ(repo.history.size(), 1u);
    EXPECT_EQ(repo.history[0].entry_time, entry_time);
    EXPECT_TRUE(repo.active.empty());
    EXPECT_EQ(channel.count(ActuatorCommands::OPEN_EXIT_GATE), 1u);
}

TEST_F(GateCoordinatorTest, LaterStayOfSamePlateIsRecordedAgain) {
    repo.history.push_back(HistoryRecord{"ABC123", clock.wallNow() - 1h, clock.wallNow() - 50min, 10.0, 1});
    repo.active["ABC123"] = ActiveVehicle{"ABC123", clock.wallNow() - 10min, 1};
    reader.fallback = std::string("ABC123");

    coordinator->handle(event(ZoneId::EXIT));

    EXPECT_EQ(repo.history.size(), 2u);
    EXPECT_TRUE(repo.active.empty());
}

TEST_F(GateCoordinatorTest, ExitBeforeEntryIsNotCharged) {
    repo.active["ABC123"] = ActiveVehicle{"ABC123", clock.wallNow() + 1h, 1};
    reader.fallback = std::string("ABC123");

    coordinator->handle(event(ZoneId::EXIT));

    ASSERT_EQ(repo.history.size(), 1u);
    EXPECT_DOUBLE_EQ(repo.history[0].fee, 0.0);
}

TEST_F(GateCoordinatorTest, SensorOccupancyForcesFullUntilFree) {
    settings.total_slots = 2;
    build();
    reader.fallback = std::string("ABC123");

    coordinator->handleMessage("SLOT_OCCUPIED");
    EXPECT_TRUE(coordinator->ledger().hardwareOccupied());
    coordinator->handle(event(ZoneId::ENTRY));
    EXPECT_EQ(channel.count(ActuatorCommands::BUZZER_ON), 1u);
    EXPECT_TRUE(repo.active.empty());

    coordinator->handleMessage("SLOT_FREE");
    coordinator->handle(event(ZoneId::ENTRY));
    EXPECT_EQ(repo.active.count("ABC123"), 1u);
}

TEST_F(GateCoordinatorTest, DrainMessagesIgnoresUnknownLines) {
    channel.inbound = {"HELLO", "SLOT_OCCUPIED", "  "};

    EXPECT_EQ(coordinator->drainMessages(), 3u);
    EXPECT_TRUE(coordinator->ledger().hardwareOccupied());
    EXPECT_EQ(coordinator->drainMessages(), 0u);
}

TEST_F(GateCoordinatorTest, ShutdownClosesGatesAndCancelsPendingClose) {
    reader.fallback = std::string("ABC123");
    coordinator->handle(event(ZoneId::ENTRY));
    channel.sent.clear();

    coordinator->shutdown();

    ASSERT_EQ(channel.sent.size(), 3u);
    EXPECT_EQ(channel.sent[0], ActuatorCommands::CLOSE_ENTRY_GATE);
    EXPECT_EQ(channel.sent[1], ActuatorCommands::CLOSE_EXIT_GATE);
    EXPECT_EQ(channel.sent[2], ActuatorCommands::BUZZER_OFF);
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_FALSE(coordinator->isProcessing(ZoneId::ENTRY));
    EXPECT_FALSE(coordinator->running());

    // after shutdown: no deferred close, crossings ignored
    scheduler.advance(10s);
    reader.fallback = std::string("DEF456");
    coordinator->handle(event(ZoneId::EXIT));
    EXPECT_EQ(channel.sent.size(), 3u);

    coordinator->shutdown();
    EXPECT_EQ(channel.sent.size(), 3u);
}

// Simulates shutdown arriving while the plate is being read.
class ShutdownDuringReadReader : public vision::PlateReader {
public:
    std::optional<std::string> extract(const cv::Mat&) override {
        if (target) target->shutdown();
        return std::string("ABC123");
    }
    GateCoordinator* target = nullptr;
};

TEST_F(GateCoordinatorTest, ShutdownDuringEntryReadOpensNothing) {
    ShutdownDuringReadReader stopping;
    GateCoordinator c(settings, repo, channel, stopping, layout, scheduler, clock);
    stopping.target = &c;

    c.handle(event(ZoneId::ENTRY));

    EXPECT_TRUE(repo.active.empty());
    EXPECT_EQ(channel.count(ActuatorCommands::OPEN_ENTRY_GATE), 0u);
    ASSERT_EQ(channel.sent.size(), 3u);
    EXPECT_EQ(channel.sent[2], ActuatorCommands::BUZZER_OFF);
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_FALSE(c.isProcessing(ZoneId::ENTRY));
}

TEST_F(GateCoordinatorTest, ShutdownDuringExitReadKeepsVehicleActive) {
    repo.active["ABC123"] = ActiveVehicle{"ABC123", clock.wallNow() - 1h, 1};
    ShutdownDuringReadReader stopping;
    GateCoordinator c(settings, repo, channel, stopping, layout, scheduler, clock);
    stopping.target = &c;

    c.handle(event(ZoneId::EXIT));

    EXPECT_EQ(repo.active.count("ABC123"), 1u);
    EXPECT_TRUE(repo.history.empty());
    EXPECT_EQ(channel.count(ActuatorCommands::OPEN_EXIT_GATE), 0u);
    EXPECT_FALSE(c.isProcessing(ZoneId::EXIT));
}

// Runs a hook before recording each command.
class HookChannel : public test::FakeChannel {
public:
    bool send(const std::string& command) override {
        if (on_send) on_send(command);
        return FakeChannel::send(command);
    }
    std::function<void(const std::string&)> on_send;
};

TEST_F(GateCoordinatorTest, DeferredCloseIsSentAfterZoneIsReleased) {
    HookChannel hooked;
    GateCoordinator c(settings, repo, hooked, reader, layout, scheduler, clock);
    reader.fallback = std::string("ABC123");

    bool entry_busy_at_close = true;
    hooked.on_send = [&](const std::string& command) {
        if (command == ActuatorCommands::CLOSE_ENTRY_GATE) {
            entry_busy_at_close = c.isProcessing(ZoneId::ENTRY);
        }
    };

    c.handle(event(ZoneId::ENTRY));
    scheduler.advance(5s);

    EXPECT_EQ(hooked.count(ActuatorCommands::CLOSE_ENTRY_GATE), 1u);
    EXPECT_FALSE(entry_busy_at_close);
}

class ThrowingReader : public vision::PlateReader {
public:
    std::optional<std::string> extract(const cv::Mat&) override {
        throw std::runtime_error("ocr engine crashed");
    }
};

TEST_F(GateCoordinatorTest, UnexpectedExceptionReleasesZone) {
    ThrowingReader throwing;
    GateCoordinator c(settings, repo, channel, throwing, layout, scheduler, clock);

    EXPECT_NO_THROW(c.handle(event(ZoneId::EXIT)));
    EXPECT_FALSE(c.isProcessing(ZoneId::EXIT));
}

// Real clock and a second thread: shutdown must end the coordinator's waits early.
class GateCoordinatorShutdownTest : public ::testing::Test {
protected:
    void SetUp() override {
        layout.resolve(cv::Size(1280, 720));
        settings.total_slots = 1;
        settings.buzzer = std::chrono::milliseconds(30000);
        settings.ocr_retry_delay = std::chrono::milliseconds(30000);
    }

    vision::CrossingEvent event(ZoneId zone) {
        vision::CrossingEvent ev;
        ev.zone = zone;
        ev.frame = test::blankFrame();
        ev.zone_image = layout.crop(ev.frame, zone).clone();
        ev.detected_at = clock.wallNow();
        return ev;
    }

    template <typename Pred>
    static bool waitUntil(Pred pred) {
        for (int i = 0; i < 1000; ++i) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return pred();
    }

    SystemClock clock;
    test::ManualClock virtual_time;
    test::ManualScheduler scheduler{virtual_time};
    test::FakeChannel channel;
    test::MemoryRepository repo;
    vision::ZoneLayout layout;
    GateSettings settings;
};

class CountingReader : public vision::PlateReader {
public:
    std::optional<std::string> extract(const cv::Mat&) override {
        ++calls;
        return std::nullopt;
    }
    std::atomic<int> calls{0};
};

TEST_F(GateCoordinatorShutdownTest, ShutdownCutsBuzzerAlertShort) {
    repo.active["ABC123"] = ActiveVehicle{"ABC123", clock.wallNow(), 1};
    CountingReader reader;
    GateCoordinator c(settings, repo, channel, reader, layout, scheduler, clock);

    const auto started = std::chrono::steady_clock::now();
    std::thread detection([&]() { c.handle(event(ZoneId::ENTRY)); });
    EXPECT_TRUE(waitUntil([&]() { return channel.count(ActuatorCommands::BUZZER_ON) == 1; }));

    c.shutdown();
    detection.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_EQ(channel.count(ActuatorCommands::BUZZER_OFF), 1u);
    ASSERT_FALSE(channel.sent.empty());
    EXPECT_EQ(channel.sent.back(), ActuatorCommands::BUZZER_OFF);
    EXPECT_EQ(reader.calls.load(), 0);
    EXPECT_FALSE(c.isProcessing(ZoneId::ENTRY));
}

TEST_F(GateCoordinatorShutdownTest, ShutdownCutsPlateRetryWaitShort) {
    CountingReader reader;
    GateCoordinator c(settings, repo, channel, reader, layout, scheduler, clock);

    const auto started = std::chrono::steady_clock::now();
    std::thread detection([&]() { c.handle(event(ZoneId::ENTRY)); });
    EXPECT_TRUE(waitUntil([&]() { return reader.calls.load() == 1; }));

    c.shutdown();
    detection.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_EQ(reader.calls.load(), 1);
    EXPECT_TRUE(repo.active.empty());
    EXPECT_EQ(channel.count(ActuatorCommands::OPEN_ENTRY_GATE), 0u);
    EXPECT_EQ(channel.sent.size(), 3u);
    EXPECT_FALSE(c.isProcessing(ZoneId::ENTRY));
}

} // namespace
