#pragma once
#include <opencv2/core.hpp>
#include <opencv2/video/background_segm.hpp>
#include <opencv2/imgproc.hpp>

namespace parkgate {
namespace vision {

struct Mog2Config {
    int history = 500;          // bg model 历史帧数, ↑: 稳定性↑ 适应性↓
    int var_threshold = 50;     // ↓: 更多像素被判为前景
    bool detect_shadows = true; // 阴影像素标记为 127
};

// Adaptive per-pixel Gaussian mixture background model.
class Mog2Manager {
public:
    explicit Mog2Manager(const Mog2Config& cfg);
    ~Mog2Manager() = default;

    cv::Mat apply(const cv::Mat& bgr); // 返回前景掩码 {0,127,255}

    // feed a frame into the model without keeping the mask (warm-up)
    void learn(const cv::Mat& bgr);
    int framesSeen() const { return frames_seen_; }

    // 仅保留前景类像素 (去掉阴影), 输出 0/255 二值图
    static cv::Mat foregroundOnly(const cv::Mat& fg);

private:
    cv::Ptr<cv::BackgroundSubtractorMOG2> mog2_;
    int frames_seen_ = 0;
};

} // namespace vision
} // namespace parkgate
