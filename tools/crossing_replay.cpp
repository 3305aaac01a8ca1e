/*
*   Name:  crossing_replay.cpp
*   Usage: crossing_replay <video.mp4> [--config config/parking.json] [--max N] [--fps F]
*   ==========================================================================================
*   Runs motion + virtual line detection over a recorded clip and prints every declared
*   crossing, for tuning zones, line positions and motion_threshold offline.
*/
#include "parkgate/Clock.h"
#include "parkgate/Config.h"
#include "parkgate/vision/CameraLoop.h"
#include "parkgate/vision/LineCrossing.h"
#include "parkgate/vision/Mog2.h"
#include "parkgate/vision/Publish.h"
#include "parkgate/vision/Zone.h"

#include <climits>
#include <iostream>
#include <string>

using namespace parkgate;

namespace {
// 视频时间: 每帧前进 1/fps, 冷却按视频时间计算
class VideoClock : public Clock {
public:
    explicit VideoClock(double fps)
        : frame_step_(std::chrono::microseconds(static_cast<long long>(1e6 / fps))) {}

    steady_point now() const override { return steady_point{} + elapsed_; }
    wall_point wallNow() const override { return wall_point{} + elapsed_; }
    void sleepFor(std::chrono::milliseconds) override {}
    bool waitFor(std::unique_lock<std::mutex>&, std::condition_variable&,
                 std::chrono::milliseconds, const std::function<bool()>& stop) override {
        return stop();
    }

    void tick() { elapsed_ += frame_step_; }
    double seconds() const { return elapsed_.count() / 1e6; }

private:
    std::chrono::microseconds frame_step_;
    std::chrono::microseconds elapsed_{0};
};
} // namespace

int main(int argc, char** argv) {
    std::string video;
    std::string config_path;
    long long max_frames = LLONG_MAX;
    double fps = 30.0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if      (arg == "--config" && i + 1 < argc) config_path = argv[++i];
            else if (arg == "--max" && i + 1 < argc)    max_frames = std::stoll(argv[++i]);
            else if (arg == "--fps" && i + 1 < argc)    fps = std::stod(argv[++i]);
            else if (arg == "-h" || arg == "--help") {
                std::cout << "Usage: crossing_replay <video> [--config path] [--max N] [--fps F]\n";
                return 0;
            }
            else if (arg.rfind("--", 0) == 0) {
                std::cerr << "[Main] Unknown option: " << arg << "\n";
                return 2;
            }
            else video = arg;
        } catch (const std::exception& e) {
            std::cerr << "[Main] Error in arg " << arg << ": " << e.what() << "\n";
            return 2;
        }
    }
    if (video.empty() || fps <= 0.0) {
        std::cerr << "Usage: crossing_replay <video> [--config path] [--max N] [--fps F]\n";
        return 2;
    }

    ParkingConfig cfg = config_path.empty() ? ParkingConfig() : ParkingConfig::load(config_path);
    cfg.sanitize();

    VideoClock clock(fps);
    vision::ZoneLayout layout = cfg.zoneLayout();

    vision::Mog2Config mog;
    mog.history = cfg.mog2_history;
    mog.var_threshold = cfg.mog2_var_threshold;
    mog.detect_shadows = cfg.mog2_detect_shadows;
    vision::Mog2Manager mog2(mog);

    vision::CrossingConfig cc;
    cc.motion_threshold = cfg.motion_threshold;
    cc.cooldown = std::chrono::milliseconds(cfg.crossing_cooldown_ms);
    vision::LineCrossingDetector crossing(layout, cc, clock);

    int crossings = 0;
    vision::CallbackSink printer([&](const vision::CrossingEvent& ev) {
        ++crossings;
        std::cout << "[Replay] t=" << clock.seconds() << "s " << vision::toString(ev.zone)
                  << " crossing, zone image " << ev.zone_image.cols << "x" << ev.zone_image.rows << "\n";
    });
    crossing.setSink(vision::ZoneId::ENTRY, &printer);
    crossing.setSink(vision::ZoneId::EXIT, &printer);

    vision::VideoCaptureSource source(video, 0);
    vision::CameraLoopConfig loop_cfg;
    loop_cfg.warmup_frames = cfg.warmup_frames;
    vision::CameraLoop loop(source, mog2, layout, crossing, loop_cfg, clock);
    if (!loop.initialize()) return 1;

    while (loop.framesProcessed() < max_frames) {
        clock.tick();
        if (!loop.step()) break;   // 视频结束
    }

    std::cout << "[Replay] " << loop.framesProcessed() << " frames, " << crossings << " crossing(s)\n";
    return 0;
}
