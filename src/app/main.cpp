/*
*   Name:  main.cpp
*   Usage: parkgate [--config config/parking.json] [--serial-port /dev/ttyUSB0] [--camera 0]
*                   [--video clip.mp4] [--hourly-rate 10.0] [--slots 1] [--no-config]
*   ==========================================================================================
*   Parking gate controller: camera crossing detection + plate reading + gate control over UART
*/
#include "parkgate/Config.h"
#include "parkgate/ParkingSystem.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

namespace {
std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
}

void printUsage() {
    std::cout << "\n"
              << "Usage: parkgate [--config path] [--serial-port dev] [--camera N] [--video file]\n"
              << "                [--hourly-rate R] [--slots N] [--no-config]\n"
              << "Or:    parkgate -h | --help\n\n"
              << "--config       configuration file (.json, .yml or .yaml), default config/parking.json\n"
              << "--serial-port  gate controller port, auto-detected when omitted\n"
              << "--camera       camera index (default 0)\n"
              << "--video        video file used instead of the camera\n"
              << "--hourly-rate  parking fee per started hour (default 10.0)\n"
              << "--slots        total number of parking slots (default 1)\n"
              << "--no-config    ignore the configuration file, use built-in zones\n\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/parking.json";
    bool use_config = true;

    // 命令行覆盖项, 在读取配置文件之后应用
    std::string serial_port;     bool has_serial_port = false;
    int camera_index = 0;        bool has_camera = false;
    std::string video;           bool has_video = false;
    double hourly_rate = 0.0;    bool has_hourly_rate = false;
    int slots = 0;               bool has_slots = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if        (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--serial-port" && i + 1 < argc) {
                serial_port = argv[++i]; has_serial_port = true;
            } else if (arg == "--camera" && i + 1 < argc) {
                camera_index = std::stoi(argv[++i]); has_camera = true;
            } else if (arg == "--video" && i + 1 < argc) {
                video = argv[++i]; has_video = true;
            } else if (arg == "--hourly-rate" && i + 1 < argc) {
                hourly_rate = std::stod(argv[++i]); has_hourly_rate = true;
            } else if (arg == "--slots" && i + 1 < argc) {
                slots = std::stoi(argv[++i]); has_slots = true;
            } else if (arg == "--no-config") {
                use_config = false;
            } else if (arg == "-h" || arg == "--help") {
                printUsage();
                return 0;
            } else {
                std::cerr << "[Main] Unknown option: " << arg << "\n";
                printUsage();
                return 2;
            }
        } catch (const std::exception& e) {
            std::cerr << "[Main] Error in arg " << arg << ": " << e.what() << "\n";
            return 2;
        }
    }

    std::cout << "[Main] parkgate starting...\n";
    std::cout << "[Main] CWD: " << std::filesystem::current_path().string() << "\n";

    parkgate::ParkingConfig cfg;
    if (use_config) {
        cfg = parkgate::ParkingConfig::load(config_path);
    } else {
        std::cout << "[Main] --no-config: using built-in defaults\n";
    }
    if (has_serial_port) cfg.serial_port = serial_port;
    if (has_camera) cfg.camera_index = camera_index;
    if (has_video) cfg.video_source = video;
    if (has_hourly_rate) cfg.hourly_rate = hourly_rate;
    if (has_slots) cfg.total_slots = slots;
    cfg.sanitize();

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    parkgate::ParkingSystem system(cfg);
    if (!system.start()) {
        system.stop();
        return 1;
    }
    system.run(g_interrupted);
    if (g_interrupted.load()) std::cout << "[Main] Received interrupt signal, shutting down...\n";
    system.stop();
    return 0;
}
