#pragma once
#include "Enums.h"
#include <opencv2/core.hpp>
#include <chrono>
#include <functional>

namespace parkgate {
namespace vision {

// A detected line crossing. Carries deep copies of the frame and of the
// zone sub-image taken at detection time.
struct CrossingEvent {
    ZoneId  zone = ZoneId::ENTRY;
    cv::Mat frame;
    cv::Mat zone_image;
    std::chrono::system_clock::time_point detected_at;
};

// Receiver of crossing events (gate coordinator, replay printer, test fakes).
class CrossingSink {
public:
    virtual ~CrossingSink() = default;
    virtual void handle(const CrossingEvent& event) = 0;
};

using CrossingCallback = std::function<void(const CrossingEvent&)>;

// Adapts a plain callback to the sink interface.
class CallbackSink : public CrossingSink {
public:
    CallbackSink() = default;
    explicit CallbackSink(CrossingCallback cb) : cb_(std::move(cb)) {}
    void setCallback(CrossingCallback cb) { cb_ = std::move(cb); }
    void handle(const CrossingEvent& event) override {
        if (cb_) cb_(event);
    }
private:
    CrossingCallback cb_;
};

} // namespace vision
} // namespace parkgate
