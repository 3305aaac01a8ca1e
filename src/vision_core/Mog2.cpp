#include "parkgate/vision/Mog2.h"
#include "parkgate/vision/Enums.h"

namespace parkgate {
namespace vision {

Mog2Manager::Mog2Manager(const Mog2Config& cfg) {
    mog2_ = cv::createBackgroundSubtractorMOG2(cfg.history,
                                               cfg.var_threshold,
                                               cfg.detect_shadows);
}

cv::Mat Mog2Manager::apply(const cv::Mat& bgr) {
    cv::Mat fg;
    if (bgr.empty()) return fg;
    mog2_->apply(bgr, fg);
    ++frames_seen_;
    return fg;
}

void Mog2Manager::learn(const cv::Mat& bgr) {
    if (bgr.empty()) return;
    cv::Mat discard;
    mog2_->apply(bgr, discard);
    ++frames_seen_;
}

cv::Mat Mog2Manager::foregroundOnly(const cv::Mat& fg) {
    cv::Mat bin;
    if (fg.empty()) return bin;
    // 阴影 127 低于阈值被清零, 仅 255 保留
    cv::threshold(fg, bin, MASK_SHADOW, MASK_FOREGROUND, cv::THRESH_BINARY);
    return bin;
}

} // namespace vision
} // namespace parkgate
