#ifndef PARKGATE_GATE_COORDINATOR_H
#define PARKGATE_GATE_COORDINATOR_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include "parkgate/Clock.h"
#include "parkgate/gate/ActuatorChannel.h"
#include "parkgate/gate/FeeCalculator.h"
#include "parkgate/gate/RecordRepository.h"
#include "parkgate/gate/Scheduler.h"
#include "parkgate/gate/SlotLedger.h"
#include "parkgate/vision/PlateReader.h"
#include "parkgate/vision/Publish.h"
#include "parkgate/vision/Zone.h"

namespace parkgate {
namespace gate {

struct GateSettings {
    int    total_slots = 1;
    double hourly_rate = 10.0;
    std::chrono::milliseconds gate_grace{5000};       // 开闸后自动关闸
    std::chrono::milliseconds buzzer{3000};           // 满位报警时长
    std::chrono::milliseconds ocr_retry_delay{500};   // 车牌重试前等待
};

// Mutable state shared by the detection thread, the message loop and the
// deferred close tasks. Every flag is guarded by mutex; wakeup is notified
// by shutdown so in-flight waits end early.
//
// actuator_mutex orders gate commands against each other: an OPEN that
// passed its running check is always sent before shutdown's CLOSEs, and a
// deferred CLOSE is sent before the next OPEN of the same zone. It is
// never taken while mutex is held by the same thread.
struct GateContext {
    std::mutex mutex;
    std::condition_variable wakeup;
    bool entry_processing = false;
    bool exit_processing  = false;
    bool running          = true;

    std::mutex actuator_mutex;
};

// Per-zone Idle -> Processing -> Idle state machine driven by crossing events.
//
// A crossing moves its zone to Processing only if the zone is idle; the check
// and the set happen under GateContext::mutex, shared by both zones. The
// flag goes back to false on every abort path, or from the scheduled
// close task once the gate has been opened.
class GateCoordinator : public vision::CrossingSink {
public:
    GateCoordinator(const GateSettings& settings,
                    RecordRepository& repo,
                    ActuatorChannel& channel,
                    vision::PlateReader& reader,
                    const vision::ZoneLayout& layout,
                    TaskScheduler& scheduler,
                    Clock& clock);

    GateCoordinator(const GateCoordinator&) = delete;
    GateCoordinator& operator=(const GateCoordinator&) = delete;

    // CrossingSink: runs the whole sequence on the caller's thread
    void handle(const vision::CrossingEvent& event) override;

    void onEntryCrossing(const vision::CrossingEvent& event);
    void onExitCrossing(const vision::CrossingEvent& event);

    // Reads buffered actuator messages and applies them; returns how many were read.
    std::size_t drainMessages();
    void handleMessage(const std::string& message);

    // Marks the coordinator stopped, wakes any in-flight wait, cancels pending
    // closes and sends CLOSE_ENTRY_GATE, CLOSE_EXIT_GATE, BUZZER_OFF.
    // A sequence still running on another thread finishes without further
    // gate commands or record writes.
    void shutdown();

    bool isProcessing(vision::ZoneId zone);
    bool running();

    SlotLedger& ledger() { return ledger_; }
    const FeeCalculator& fees() const { return fees_; }

private:
    bool& flagFor(vision::ZoneId zone);   // caller holds ctx_.mutex
    bool tryBegin(vision::ZoneId zone);
    void finish(vision::ZoneId zone);
    // finish() and true when shutdown has begun
    bool abandonIfStopping(vision::ZoneId zone);

    // 可被 shutdown 打断的等待; false 表示已停止
    bool pause(std::chrono::milliseconds d);

    std::optional<std::string> readPlate(const vision::CrossingEvent& event);
    void soundFullAlert();

    void processEntry(const vision::CrossingEvent& event);
    void processExit(const vision::CrossingEvent& event);

    void openGate(vision::ZoneId zone);
    void closeGateAfterGrace(vision::ZoneId zone);

    GateSettings settings_;
    RecordRepository& repo_;
    ActuatorChannel& channel_;
    vision::PlateReader& reader_;
    const vision::ZoneLayout& layout_;
    TaskScheduler& scheduler_;
    Clock& clock_;

    SlotLedger ledger_;
    FeeCalculator fees_;
    GateContext ctx_;
};

} // namespace gate
} // namespace parkgate

#endif // PARKGATE_GATE_COORDINATOR_H
