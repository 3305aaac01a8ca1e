#include "parkgate/vision/CameraLoop.h"
#include <iostream>

namespace parkgate {
namespace vision {

// ==================== Frame sources ===========================

VideoCaptureSource::VideoCaptureSource(int index, int width, int height, int read_timeout_ms)
    : description_("camera " + std::to_string(index)) {
    cap_.open(index);
    if (!cap_.isOpened()) {
        std::cerr << "[Camera] Failed to open camera at index " << index << "\n";
        return;
    }
    cap_.set(cv::CAP_PROP_FRAME_WIDTH, width);
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, height);
    cap_.set(cv::CAP_PROP_AUTOFOCUS, 1);
    cap_.set(cv::CAP_PROP_READ_TIMEOUT_MSEC, read_timeout_ms);
    std::cout << "[Camera] Camera initialized at index " << index << "\n";
}

VideoCaptureSource::VideoCaptureSource(const std::string& path, int read_timeout_ms)
    : description_(path) {
    cap_.open(path);
    if (!cap_.isOpened()) {
        std::cerr << "[Camera] Failed to open video: " << path << "\n";
        return;
    }
    if (read_timeout_ms > 0) cap_.set(cv::CAP_PROP_READ_TIMEOUT_MSEC, read_timeout_ms);
    std::cout << "[Camera] Video source opened: " << path << "\n";
}

VideoCaptureSource::~VideoCaptureSource() {
    release();
}

bool VideoCaptureSource::read(cv::Mat& frame) {
    if (!cap_.isOpened()) return false;
    try {
        return cap_.read(frame) && !frame.empty();
    } catch (const cv::Exception& ex) {
        std::cerr << "[Camera] Error capturing frame: " << ex.what() << "\n";
        return false;
    }
}

void VideoCaptureSource::release() {
    if (cap_.isOpened()) {
        cap_.release();
        std::cout << "[Camera] Released " << description_ << "\n";
    }
}

// ==================== Detection loop ===========================

CameraLoop::CameraLoop(FrameSource& source, Mog2Manager& mog2, ZoneLayout& layout,
                       LineCrossingDetector& crossing, const CameraLoopConfig& cfg, Clock& clock)
    : source_(source), mog2_(mog2), layout_(layout), crossing_(crossing), cfg_(cfg), clock_(clock) {}

CameraLoop::~CameraLoop() {
    stop();
}

bool CameraLoop::initialize() {
    if (!source_.isOpened()) {
        std::cerr << "[Camera] Error: frame source not opened\n";
        return false;
    }

    cv::Mat first;
    if (!source_.read(first)) {
        std::cerr << "[Camera] Error: could not read an initial frame\n";
        return false;
    }
    layout_.resolve(first.size());

    // 背景学习, 避免启动时场景噪声触发误报
    std::cout << "[Motion] Learning background (" << cfg_.warmup_frames << " frames)...\n";
    mog2_.learn(first);
    cv::Mat frame;
    for (int i = 1; i < cfg_.warmup_frames; ++i) {
        if (source_.read(frame)) mog2_.learn(frame);
    }
    std::cout << "[Motion] Background learning complete (" << mog2_.framesSeen() << " frames)\n";
    return true;
}

bool CameraLoop::step() {
    cv::Mat frame;
    if (!source_.read(frame)) {
        ++read_failures_;
        std::cerr << "[Camera] Warning: failed to read frame\n";
        return false;
    }
    cv::Mat fg_mask = mog2_.apply(frame);
    crossing_.process(frame, fg_mask);
    ++frames_processed_;
    return true;
}

bool CameraLoop::start() {
    if (running_.load()) return true;
    if (!layout_.resolved()) {
        std::cerr << "[Camera] Error: camera loop started before initialize()\n";
        return false;
    }
    running_.store(true);
    std::promise<void> done;
    finished_ = done.get_future();
    worker_ = std::thread([this, p = std::move(done)]() mutable {
        run();
        p.set_value();
    });
    std::cout << "[Camera] Frame processing started\n";
    return true;
}

void CameraLoop::run() {
    auto next_tick = clock_.now();
    while (running_.load()) {
        if (!step()) {
            clock_.sleepFor(cfg_.read_retry_delay);
            next_tick = clock_.now();
            continue;
        }

        // 固定节拍: 与单帧处理耗时无关
        next_tick += cfg_.frame_interval;
        auto now = clock_.now();
        if (next_tick > now) {
            clock_.sleepFor(std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - now));
        } else {
            next_tick = now;
        }
    }
}

void CameraLoop::stop() {
    if (!worker_.joinable()) {
        running_.store(false);
        return;
    }
    running_.store(false);
    if (finished_.valid() &&
        finished_.wait_for(cfg_.join_timeout) != std::future_status::ready) {
        // 线程仍在使用 source_/crossing_, 不能 detach
        std::cerr << "[Camera] Error: detection loop did not exit within "
                  << cfg_.join_timeout.count() << " ms, still waiting for it\n";
    }
    worker_.join();
    std::cout << "[Camera] Frame processing stopped\n";
}

} // namespace vision
} // namespace parkgate
