#include "parkgate/ParkingSystem.h"
#include "JsonRecordRepository.h"
#include "SqliteRecordRepository.h"

#include <filesystem>
#include <iostream>

namespace parkgate {

std::unique_ptr<gate::RecordRepository> makeRecordRepository(const ParkingConfig& cfg) {
    if (cfg.storage_backend == "sqlite") {
        try {
            auto parent = std::filesystem::path(cfg.sqlite_path).parent_path();
            if (!parent.empty()) std::filesystem::create_directories(parent);
            auto db = std::make_unique<SqliteRecordRepository>(cfg.sqlite_path);
            if (db->initialize()) return db;
            std::cerr << "[Store] Error: SQLite store not usable, falling back to JSON store\n";
        } catch (const std::exception& e) {
            std::cerr << "[Store] Error: " << e.what() << ", falling back to JSON store\n";
        }
    }
    return std::make_unique<JsonRecordRepository>(cfg.data_dir);
}

ParkingSystem::ParkingSystem(const ParkingConfig& cfg)
    : cfg_(cfg), layout_(cfg.zoneLayout()) {
    std::cout << "[ParkGate] Initializing parking system components...\n";

    repo_ = makeRecordRepository(cfg_);
    channel_ = std::make_unique<gate::SerialChannel>(cfg_.serial_port, cfg_.baud_rate, cfg_.serial_timeout_ms);

    vision::TesseractOptions ocr;
    ocr.tessdata_prefix = cfg_.tessdata_prefix;
    ocr.language = cfg_.ocr_language;
    ocr.timeout_ms = cfg_.ocr_timeout_ms;
    auto tess = std::make_unique<vision::TesseractPlateReader>(ocr);
    if (!tess->ready()) {
        std::cerr << "[ParkGate] Error: OCR engine not ready, every plate read will fail\n";
    }
    reader_ = std::move(tess);

    vision::Mog2Config mog;
    mog.history = cfg_.mog2_history;
    mog.var_threshold = cfg_.mog2_var_threshold;
    mog.detect_shadows = cfg_.mog2_detect_shadows;
    mog2_ = std::make_unique<vision::Mog2Manager>(mog);

    vision::CrossingConfig crossing;
    crossing.motion_threshold = cfg_.motion_threshold;
    crossing.cooldown = std::chrono::milliseconds(cfg_.crossing_cooldown_ms);
    crossing_ = std::make_unique<vision::LineCrossingDetector>(layout_, crossing, clock_);

    gate::GateSettings gs;
    gs.total_slots = cfg_.total_slots;
    gs.hourly_rate = cfg_.hourly_rate;
    gs.gate_grace = std::chrono::milliseconds(cfg_.gate_grace_ms);
    gs.buzzer = std::chrono::milliseconds(cfg_.buzzer_ms);
    gs.ocr_retry_delay = std::chrono::milliseconds(cfg_.ocr_retry_delay_ms);
    coordinator_ = std::make_unique<gate::GateCoordinator>(gs, *repo_, *channel_, *reader_, layout_,
                                                           scheduler_, clock_);

    crossing_->setSink(vision::ZoneId::ENTRY, coordinator_.get());
    crossing_->setSink(vision::ZoneId::EXIT, coordinator_.get());

    std::cout << "[ParkGate] Parking system initialized (" << cfg_.total_slots << " slot(s), "
              << gate::FeeCalculator::formatFee(cfg_.hourly_rate) << "/hour, "
              << cfg_.storage_backend << " store)\n";
}

ParkingSystem::~ParkingSystem() {
    stop();
}

bool ParkingSystem::start() {
    std::cout << "[ParkGate] Starting parking system...\n";

    if (!channel_->connect()) {
        std::cerr << "[ParkGate] Error: failed to connect to the gate controller. Please check connections.\n";
        return false;
    }

    if (!cfg_.video_source.empty()) {
        source_ = std::make_unique<vision::VideoCaptureSource>(cfg_.video_source, cfg_.frame_interval_ms * 10);
    } else {
        source_ = std::make_unique<vision::VideoCaptureSource>(cfg_.camera_index, cfg_.frame_width,
                                                               cfg_.frame_height, cfg_.frame_interval_ms * 10);
    }
    if (!source_->isOpened()) {
        std::cerr << "[ParkGate] Error: failed to initialize camera. Please check camera connection.\n";
        return false;
    }

    vision::CameraLoopConfig loop_cfg;
    loop_cfg.warmup_frames = cfg_.warmup_frames;
    loop_cfg.frame_interval = std::chrono::milliseconds(cfg_.frame_interval_ms);
    loop_cfg.join_timeout = std::chrono::milliseconds(cfg_.shutdown_timeout_ms);
    camera_loop_ = std::make_unique<vision::CameraLoop>(*source_, *mog2_, layout_, *crossing_, loop_cfg, clock_);

    if (!camera_loop_->initialize() || !camera_loop_->start()) {
        std::cerr << "[ParkGate] Error: failed to start camera processing.\n";
        return false;
    }

    started_ = true;
    std::cout << "[ParkGate] Parking system started successfully\n";
    return true;
}

void ParkingSystem::run(const std::atomic<bool>& interrupted) {
    std::cout << "[ParkGate] Entering main event loop...\n";
    const auto interval = std::chrono::milliseconds(cfg_.poll_interval_ms);
    while (!interrupted.load() && !stop_requested_.load()) {
        try {
            coordinator_->drainMessages();
        } catch (const std::exception& e) {
            std::cerr << "[ParkGate] Error: unexpected error in main loop: " << e.what() << "\n";
        }
        clock_.sleepFor(interval);
    }
    std::cout << "[ParkGate] Leaving main event loop\n";
}

void ParkingSystem::stop() {
    if (stopped_) return;
    stopped_ = true;
    std::cout << "[ParkGate] Stopping parking system...\n";

    // 1. 先停协调器: 打断检测线程中的等待, 取消待关闸任务, 关闭两侧闸门, 关蜂鸣器
    if (started_ || channel_->isConnected()) {
        coordinator_->shutdown();
    }

    // 2. 停止检测线程; 在它退出前不释放任何组件
    if (camera_loop_) camera_loop_->stop();
    scheduler_.shutdown();

    // 3. 释放相机和串口
    if (source_) source_->release();
    channel_->disconnect();

    std::cout << "[ParkGate] Parking system stopped\n";
}

} // namespace parkgate
