#pragma once
#include <atomic>
#include <memory>

#include "parkgate/Clock.h"
#include "parkgate/Config.h"
#include "parkgate/gate/GateCoordinator.h"
#include "parkgate/gate/RecordRepository.h"
#include "parkgate/gate/Scheduler.h"
#include "parkgate/gate/SerialChannel.h"
#include "parkgate/vision/CameraLoop.h"
#include "parkgate/vision/LineCrossing.h"
#include "parkgate/vision/Mog2.h"
#include "parkgate/vision/PlateReader.h"
#include "parkgate/vision/Zone.h"

namespace parkgate {

// Builds the record store selected by storage_backend. A SQLite store that
// cannot be opened falls back to the JSON store.
std::unique_ptr<gate::RecordRepository> makeRecordRepository(const ParkingConfig& cfg);

// Owns every runtime component: camera loop (detection thread), message
// loop (caller's thread) and deferred gate closes (scheduler thread).
class ParkingSystem {
public:
    explicit ParkingSystem(const ParkingConfig& cfg);
    ~ParkingSystem();

    ParkingSystem(const ParkingSystem&) = delete;
    ParkingSystem& operator=(const ParkingSystem&) = delete;

    // 连接串口 -> 打开相机 -> 背景学习 -> 启动检测线程; false 为启动失败
    bool start();

    // 主循环: 每 poll_interval_ms 读取一次控制器消息, 直到 interrupted 或 requestStop()
    void run(const std::atomic<bool>& interrupted);

    void requestStop() { stop_requested_.store(true); }

    // Idempotent.
    void stop();

    gate::GateCoordinator& coordinator() { return *coordinator_; }

private:
    ParkingConfig cfg_;
    SystemClock clock_;

    std::unique_ptr<gate::RecordRepository> repo_;
    std::unique_ptr<gate::SerialChannel> channel_;
    std::unique_ptr<vision::PlateReader> reader_;
    vision::ZoneLayout layout_;
    std::unique_ptr<vision::VideoCaptureSource> source_;
    std::unique_ptr<vision::Mog2Manager> mog2_;
    std::unique_ptr<vision::LineCrossingDetector> crossing_;
    std::unique_ptr<vision::CameraLoop> camera_loop_;
    gate::ThreadScheduler scheduler_;
    std::unique_ptr<gate::GateCoordinator> coordinator_;

    std::atomic<bool> stop_requested_{false};
    bool started_ = false;
    bool stopped_ = false;
};

} // namespace parkgate
