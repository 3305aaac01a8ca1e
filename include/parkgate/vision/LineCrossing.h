#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <chrono>
#include <mutex>
#include <optional>
#include "parkgate/Clock.h"
#include "Enums.h"
#include "Publish.h"
#include "Zone.h"

namespace parkgate {
namespace vision {

// Connected foreground region inside one zone for one frame.
// top/bottom are zone-relative rows.
struct MotionBlob {
    int    top = 0;
    int    bottom = 0;
    double area = 0.0;
};

struct CrossingConfig {
    int motion_threshold = 500;                      // 最小轮廓面积
    std::chrono::milliseconds cooldown{3000};        // 同区域两次触发最小间隔
};

// Finds the first external contour in a binary zone mask whose area reaches
// min_area and whose vertical extent straddles trigger_row
// (top <= trigger_row <= bottom). Enumeration order is the one
// cv::findContours produces.
std::optional<MotionBlob> findCrossingBlob(const cv::Mat& zone_mask,
                                           int trigger_row,
                                           int min_area);

// Per-zone virtual line crossing detector with cooldown.
class LineCrossingDetector {
public:
    LineCrossingDetector(const ZoneLayout& layout, const CrossingConfig& cfg, const Clock& clock);

    // 不持有 sink
    void setSink(ZoneId zone, CrossingSink* sink);

    // 检查单个区域; 触发时返回 true 并回调该区域 sink
    bool check(const cv::Mat& frame, const cv::Mat& fg_mask, ZoneId zone);

    // entry 然后 exit
    int process(const cv::Mat& frame, const cv::Mat& fg_mask);

    bool inCooldown(ZoneId zone) const;

private:
    static std::size_t slot(ZoneId z) { return static_cast<std::size_t>(z); }

    const ZoneLayout& layout_;
    CrossingConfig cfg_;
    const Clock& clock_;
    std::array<CrossingSink*, 2> sinks_{{nullptr, nullptr}};
    mutable std::mutex mutex_;  // guards last_crossing_
    std::array<std::optional<Clock::steady_point>, 2> last_crossing_;
};

} // namespace vision
} // namespace parkgate
