#pragma once
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "parkgate/Clock.h"
#include "LineCrossing.h"
#include "Mog2.h"
#include "Zone.h"

namespace parkgate {
namespace vision {

// Where frames come from: a camera, a video file, or a test fixture.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual bool isOpened() const = 0;
    virtual bool read(cv::Mat& frame) = 0;
    virtual void release() = 0;
};

class VideoCaptureSource : public FrameSource {
public:
    // camera device index
    VideoCaptureSource(int index, int width, int height, int read_timeout_ms);
    // video file (offline replay)
    VideoCaptureSource(const std::string& path, int read_timeout_ms);
    ~VideoCaptureSource() override;

    bool isOpened() const override { return cap_.isOpened(); }
    bool read(cv::Mat& frame) override;
    void release() override;

private:
    cv::VideoCapture cap_;
    std::string description_;
};

struct CameraLoopConfig {
    int warmup_frames = 150;
    std::chrono::milliseconds frame_interval{33};
    std::chrono::milliseconds read_retry_delay{100};
    std::chrono::milliseconds join_timeout{2000};
};

// Frame acquisition + motion detection + crossing detection, run on one
// dedicated background thread at a fixed cadence.
class CameraLoop {
public:
    CameraLoop(FrameSource& source, Mog2Manager& mog2, ZoneLayout& layout,
               LineCrossingDetector& crossing, const CameraLoopConfig& cfg, Clock& clock);
    ~CameraLoop();

    CameraLoop(const CameraLoop&) = delete;
    CameraLoop& operator=(const CameraLoop&) = delete;

    // 读首帧确定实际尺寸并解析触发线, 然后学习背景
    bool initialize();

    // single iteration: read -> mask -> crossing check; false on read failure
    bool step();

    bool start();
    // 协作式停止. join_timeout 内未退出时记录错误并继续等待,
    // 返回后线程已结束
    void stop();
    bool running() const { return running_.load(); }

    long long framesProcessed() const { return frames_processed_.load(); }
    long long readFailures() const { return read_failures_.load(); }

private:
    void run();

    FrameSource& source_;
    Mog2Manager& mog2_;
    ZoneLayout& layout_;
    LineCrossingDetector& crossing_;
    CameraLoopConfig cfg_;
    Clock& clock_;

    std::atomic<bool> running_{false};
    std::atomic<long long> frames_processed_{0};
    std::atomic<long long> read_failures_{0};
    std::thread worker_;
    std::future<void> finished_;
};

} // namespace vision
} // namespace parkgate
