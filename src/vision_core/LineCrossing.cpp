#include "parkgate/vision/LineCrossing.h"
#include "parkgate/vision/Mog2.h"
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <vector>

namespace parkgate {
namespace vision {

std::optional<MotionBlob> findCrossingBlob(const cv::Mat& zone_mask,
                                           int trigger_row,
                                           int min_area) {
    if (zone_mask.empty()) return std::nullopt;
    // bottom 为开区间, 触发线可位于区域下边缘 (rows)
    if (trigger_row < 0 || trigger_row > zone_mask.rows) return std::nullopt;

    // findContours 会修改输入, 且只统计前景类像素
    cv::Mat bin = Mog2Manager::foregroundOnly(zone_mask);
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(bin, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    for (const auto& contour : contours) {
        double area = cv::contourArea(contour);
        if (area < min_area) continue;

        cv::Rect box = cv::boundingRect(contour);
        MotionBlob blob;
        blob.top = box.y;
        blob.bottom = box.y + box.height;
        blob.area = area;
        if (blob.top <= trigger_row && trigger_row <= blob.bottom) {
            return blob;
        }
    }
    return std::nullopt;
}

LineCrossingDetector::LineCrossingDetector(const ZoneLayout& layout,
                                           const CrossingConfig& cfg,
                                           const Clock& clock)
    : layout_(layout), cfg_(cfg), clock_(clock) {}

void LineCrossingDetector::setSink(ZoneId zone, CrossingSink* sink) {
    sinks_[slot(zone)] = sink;
}

bool LineCrossingDetector::inCooldown(ZoneId zone) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& last = last_crossing_[slot(zone)];
    return last.has_value() && (clock_.now() - *last) < cfg_.cooldown;
}

bool LineCrossingDetector::check(const cv::Mat& frame, const cv::Mat& fg_mask, ZoneId zone) {
    if (frame.empty() || fg_mask.empty() || !layout_.resolved()) return false;
    if (inCooldown(zone)) return false;

    // 1. 裁剪到区域
    cv::Mat zone_frame = layout_.crop(frame, zone);
    cv::Mat zone_mask  = layout_.crop(fg_mask, zone);
    if (zone_frame.empty() || zone_mask.empty()) return false;

    // 2. 触发线转换为区域内坐标
    int zone_line_row = layout_.zone(zone).zoneRelativeTriggerRow();

    // 3~6. 轮廓 + 面积过滤 + 跨线判定
    auto blob = findCrossingBlob(zone_mask, zone_line_row, cfg_.motion_threshold);
    if (!blob) return false;

    // 7. 冷却计时从声明时刻开始
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_crossing_[slot(zone)] = clock_.now();
    }
    std::cout << "[Crossing] Vehicle detected crossing " << toString(zone)
              << " virtual line (blob rows " << blob->top << "-" << blob->bottom
              << ", area " << blob->area << ")\n";

    CrossingSink* sink = sinks_[slot(zone)];
    if (sink) {
        CrossingEvent event;
        event.zone = zone;
        event.frame = frame.clone();
        event.zone_image = zone_frame.clone();
        event.detected_at = clock_.wallNow();
        try {
            sink->handle(event);
        } catch (const std::exception& ex) {
            std::cerr << "[Crossing] Error in " << toString(zone) << " callback: " << ex.what() << "\n";
        }
    }
    return true;
}

int LineCrossingDetector::process(const cv::Mat& frame, const cv::Mat& fg_mask) {
    int declared = 0;
    if (check(frame, fg_mask, ZoneId::ENTRY)) ++declared;
    if (check(frame, fg_mask, ZoneId::EXIT))  ++declared;
    return declared;
}

} // namespace vision
} // namespace parkgate
