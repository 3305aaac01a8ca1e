#include "parkgate/gate/GateCoordinator.h"
#include "TimeUtils.h"
#include <iostream>

namespace parkgate {
namespace gate {

using vision::ZoneId;

GateCoordinator::GateCoordinator(const GateSettings& settings,
                                 RecordRepository& repo,
                                 ActuatorChannel& channel,
                                 vision::PlateReader& reader,
                                 const vision::ZoneLayout& layout,
                                 TaskScheduler& scheduler,
                                 Clock& clock)
    : settings_(settings),
      repo_(repo),
      channel_(channel),
      reader_(reader),
      layout_(layout),
      scheduler_(scheduler),
      clock_(clock),
      ledger_(repo, settings.total_slots),
      fees_(settings.hourly_rate) {}

bool& GateCoordinator::flagFor(ZoneId zone) {
    return zone == ZoneId::ENTRY ? ctx_.entry_processing : ctx_.exit_processing;
}

bool GateCoordinator::tryBegin(ZoneId zone) {
    std::lock_guard<std::mutex> lock(ctx_.mutex);
    if (!ctx_.running) {
        std::cerr << "[Gate] Warning: system stopping, ignoring " << vision::toString(zone)
                  << " virtual line trigger\n";
        return false;
    }
    bool& flag = flagFor(zone);
    if (flag) {
        std::cerr << "[Gate] Warning: " << vision::toString(zone)
                  << " gate already processing, ignoring virtual line trigger\n";
        return false;
    }
    flag = true;
    std::cout << "[Gate] Vehicle detected crossing " << vision::toString(zone) << " virtual line\n";
    return true;
}

void GateCoordinator::finish(ZoneId zone) {
    std::lock_guard<std::mutex> lock(ctx_.mutex);
    flagFor(zone) = false;
}

bool GateCoordinator::abandonIfStopping(ZoneId zone) {
    std::lock_guard<std::mutex> lock(ctx_.mutex);
    if (ctx_.running) return false;
    flagFor(zone) = false;
    std::cerr << "[Gate] Warning: shutdown in progress, abandoning " << vision::toString(zone)
              << " processing\n";
    return true;
}

bool GateCoordinator::pause(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(ctx_.mutex);
    return !clock_.waitFor(lock, ctx_.wakeup, d, [this]() { return !ctx_.running; });
}

bool GateCoordinator::isProcessing(ZoneId zone) {
    std::lock_guard<std::mutex> lock(ctx_.mutex);
    return flagFor(zone);
}

bool GateCoordinator::running() {
    std::lock_guard<std::mutex> lock(ctx_.mutex);
    return ctx_.running;
}

void GateCoordinator::handle(const vision::CrossingEvent& event) {
    if (event.zone == ZoneId::ENTRY) onEntryCrossing(event);
    else onExitCrossing(event);
}

void GateCoordinator::onEntryCrossing(const vision::CrossingEvent& event) {
    if (!tryBegin(ZoneId::ENTRY)) return;
    try {
        processEntry(event);
    } catch (const std::exception& e) {
        std::cerr << "[Gate] Error: entry processing failed: " << e.what() << "\n";
        finish(ZoneId::ENTRY);
    }
}

void GateCoordinator::onExitCrossing(const vision::CrossingEvent& event) {
    if (!tryBegin(ZoneId::EXIT)) return;
    try {
        processExit(event);
    } catch (const std::exception& e) {
        std::cerr << "[Gate] Error: exit processing failed: " << e.what() << "\n";
        finish(ZoneId::EXIT);
    }
}

std::optional<std::string> GateCoordinator::readPlate(const vision::CrossingEvent& event) {
    std::cout << "[Gate] Extracting number plate from " << vision::toString(event.zone) << " zone...\n";
    auto plate = reader_.extract(event.zone_image);
    if (plate) return plate;

    std::cerr << "[Gate] Warning: failed to extract number plate. Retrying...\n";
    if (!pause(settings_.ocr_retry_delay)) return std::nullopt;

    // 重试: 从完整帧重新裁剪区域
    cv::Mat fresh = layout_.crop(event.frame, event.zone);
    if (fresh.empty()) {
        std::cerr << "[Gate] Warning: " << vision::toString(event.zone) << " zone is outside the frame\n";
        return std::nullopt;
    }
    return reader_.extract(fresh.clone());
}

void GateCoordinator::soundFullAlert() {
    std::cerr << "[Gate] Warning: parking is full! Activating buzzer...\n";
    {
        std::lock_guard<std::mutex> act(ctx_.actuator_mutex);
        if (!running()) return;
        if (!channel_.send(ActuatorCommands::BUZZER_ON)) {
            std::cerr << "[Gate] Error: failed to send " << ActuatorCommands::BUZZER_ON << "\n";
        }
    }
    if (!pause(settings_.buzzer)) {
        // shutdown 已发送 BUZZER_OFF
        std::cerr << "[Gate] Warning: buzzer alert cut short by shutdown\n";
        return;
    }
    if (!channel_.send(ActuatorCommands::BUZZER_OFF)) {
        std::cerr << "[Gate] Error: failed to send " << ActuatorCommands::BUZZER_OFF << "\n";
    }
}

void GateCoordinator::processEntry(const vision::CrossingEvent& event) {
    // 1. 满位 (记录或传感器) -> 报警, 不读车牌
    if (ledger_.isFull()) {
        soundFullAlert();
        finish(ZoneId::ENTRY);
        return;
    }

    // 2~4. 车牌识别 + 一次重试
    auto plate = readPlate(event);
    if (!plate) {
        if (abandonIfStopping(ZoneId::ENTRY)) return;
        std::cerr << "[Gate] Error: failed to extract number plate after retry. Entry denied.\n";
        finish(ZoneId::ENTRY);
        return;
    }
    std::cout << "[Gate] Number plate extracted: " << *plate << "\n";

    // 5. 重复入场
    if (repo_.getActive(*plate)) {
        std::cerr << "[Gate] Warning: vehicle " << *plate << " is already in the system! Entry denied.\n";
        finish(ZoneId::ENTRY);
        return;
    }

    // 6. 最小编号空车位
    auto slot = ledger_.nextFreeSlot();
    if (!slot) {
        std::cerr << "[Gate] Error: no available slots for " << *plate << "\n";
        finish(ZoneId::ENTRY);
        return;
    }

    // 7. 先落盘, 失败则不开闸
    if (abandonIfStopping(ZoneId::ENTRY)) return;
    const auto entry_time = clock_.wallNow();
    if (!repo_.addActive(*plate, entry_time, *slot)) {
        std::cerr << "[Gate] Error: failed to add vehicle entry record for " << *plate << "\n";
        finish(ZoneId::ENTRY);
        return;
    }
    std::cout << "[Gate] Vehicle " << *plate << " entered at " << TimeUtils::formatTimestamp(entry_time)
              << ", assigned to slot " << *slot << "\n";

    // 8~9.
    openGate(ZoneId::ENTRY);
}

void GateCoordinator::processExit(const vision::CrossingEvent& event) {
    auto plate = readPlate(event);
    if (!plate) {
        if (abandonIfStopping(ZoneId::EXIT)) return;
        std::cerr << "[Gate] Error: failed to extract number plate after retry. Exit denied.\n";
        finish(ZoneId::EXIT);
        return;
    }
    std::cout << "[Gate] Number plate extracted: " << *plate << "\n";

    auto vehicle = repo_.getActive(*plate);
    if (!vehicle) {
        std::cerr << "[Gate] Warning: vehicle " << *plate << " not found in system. Entry may have failed.\n";
        finish(ZoneId::EXIT);
        return;
    }

    if (abandonIfStopping(ZoneId::EXIT)) return;
    const auto exit_time = clock_.wallNow();
    const double fee = fees_.calculateFee(vehicle->entry_time, exit_time);
    std::cout << "[Gate] Vehicle " << *plate << " - Duration: "
              << FeeCalculator::durationString(vehicle->entry_time, exit_time)
              << ", Fee: " << FeeCalculator::formatFee(fee) << "\n";
    fees_.printReceipt(std::cout, *plate, vehicle->entry_time, exit_time, fee);

    // 上次出场若已写历史但未删除在场记录, 不重复写入
    auto last = repo_.lastHistoryFor(*plate);
    if (last && last->entry_time == vehicle->entry_time) {
        std::cerr << "[Gate] Warning: history for " << *plate
                  << " already recorded for this stay, not appending again\n";
    } else if (!repo_.addHistory(*plate, vehicle->entry_time, exit_time, fee, vehicle->slot)) {
        std::cerr << "[Gate] Error: failed to add history record for " << *plate << ". Exit aborted.\n";
        finish(ZoneId::EXIT);
        return;
    }
    if (!repo_.removeActive(*plate)) {
        std::cerr << "[Gate] Error: failed to remove active record for " << *plate
                  << ". Exit aborted with history already written, manual recovery needed.\n";
        finish(ZoneId::EXIT);
        return;
    }
    std::cout << "[Gate] Vehicle " << *plate << " removed from active records\n";

    openGate(ZoneId::EXIT);
}

void GateCoordinator::openGate(ZoneId zone) {
    const std::string& cmd = zone == ZoneId::ENTRY ? ActuatorCommands::OPEN_ENTRY_GATE
                                                   : ActuatorCommands::OPEN_EXIT_GATE;
    std::lock_guard<std::mutex> act(ctx_.actuator_mutex);
    {
        std::lock_guard<std::mutex> lock(ctx_.mutex);
        if (!ctx_.running) {
            flagFor(zone) = false;
            std::cerr << "[Gate] Error: shutdown in progress, " << cmd
                      << " not sent, record kept, manual recovery needed\n";
            return;
        }
    }
    if (!channel_.send(cmd)) {
        // 记录已写入但闸门未打开, 需人工处理
        std::cerr << "[Gate] Error: failed to send " << cmd << ", record kept, manual recovery needed\n";
    }
    scheduler_.schedule(settings_.gate_grace, [this, zone]() { closeGateAfterGrace(zone); });
}

void GateCoordinator::closeGateAfterGrace(ZoneId zone) {
    const std::string& cmd = zone == ZoneId::ENTRY ? ActuatorCommands::CLOSE_ENTRY_GATE
                                                   : ActuatorCommands::CLOSE_EXIT_GATE;
    // 标志在 ctx_.mutex 内判定并清除, 发送在其外进行
    std::lock_guard<std::mutex> act(ctx_.actuator_mutex);
    bool close_now = false;
    {
        std::lock_guard<std::mutex> lock(ctx_.mutex);
        bool& flag = flagFor(zone);
        close_now = flag && ctx_.running;
        flag = false;
    }
    if (!close_now) return;

    if (channel_.send(cmd)) {
        std::cout << "[Gate] " << (zone == ZoneId::ENTRY ? "Entry" : "Exit")
                  << " gate closed after timeout\n";
    } else {
        std::cerr << "[Gate] Error: failed to send " << cmd << "\n";
    }
}

std::size_t GateCoordinator::drainMessages() {
    auto messages = channel_.pollMessages();
    for (const auto& message : messages) {
        handleMessage(message);
    }
    return messages.size();
}

void GateCoordinator::handleMessage(const std::string& message) {
    switch (parseSlotMessage(message)) {
        case SlotMessage::OCCUPIED:
            ledger_.setHardwareOccupied(true);
            break;
        case SlotMessage::FREE:
            ledger_.setHardwareOccupied(false);
            break;
        default:
            std::cerr << "[Gate] Warning: unknown message: " << message << "\n";
            break;
    }
}

void GateCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(ctx_.mutex);
        if (!ctx_.running) return;
        ctx_.running = false;
        ctx_.entry_processing = false;
        ctx_.exit_processing = false;
    }
    ctx_.wakeup.notify_all();
    scheduler_.cancelAll();

    std::lock_guard<std::mutex> act(ctx_.actuator_mutex);
    for (const auto* cmd : {&ActuatorCommands::CLOSE_ENTRY_GATE,
                            &ActuatorCommands::CLOSE_EXIT_GATE,
                            &ActuatorCommands::BUZZER_OFF}) {
        if (!channel_.send(*cmd)) {
            std::cerr << "[Gate] Error: failed to send " << *cmd << " during shutdown\n";
        }
    }
    std::cout << "[Gate] Coordinator stopped\n";
}

} // namespace gate
} // namespace parkgate
