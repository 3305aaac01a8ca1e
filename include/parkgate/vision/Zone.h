#pragma once
#include <opencv2/core.hpp>
#include "Enums.h"

namespace parkgate {
namespace vision {

// 区域矩形, 像素坐标 (x1,y1) 左上, (x2,y2) 右下
struct ZoneRect {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    bool valid() const { return x1 >= 0 && y1 >= 0 && x1 < x2 && y1 < y2; }
    cv::Rect toRect() const { return cv::Rect(x1, y1, x2 - x1, y2 - y1); }
};

// Virtual trigger line, stored as a fraction of frame height so it
// survives camera resolution changes.
struct VirtualLine {
    double position = 0.5;     // 0.0 ~ 1.0

    bool valid() const { return position >= 0.0 && position <= 1.0; }
    int resolve(int frame_height) const { return static_cast<int>(frame_height * position); }
};

struct Zone {
    ZoneId      id = ZoneId::ENTRY;
    ZoneRect    rect;
    VirtualLine line;
    int         trigger_row = -1;  // 绝对行号, resolve() 之后有效

    // 触发线相对于区域上边缘的行号
    int zoneRelativeTriggerRow() const { return trigger_row - rect.y1; }
};

// Entry + exit zone pair. Geometry is fixed after configuration load;
// only the trigger rows are filled in once the real frame size is known.
class ZoneLayout {
public:
    ZoneLayout();
    ZoneLayout(const ZoneRect& entry, double entry_line,
               const ZoneRect& exit,  double exit_line);

    // 按实际帧尺寸计算触发线绝对行号
    void resolve(const cv::Size& frame_size);
    bool resolved() const { return resolved_; }

    const Zone& zone(ZoneId id) const;

    // Zone rectangle clipped to the frame bounds (may be empty).
    cv::Rect clippedRect(ZoneId id, const cv::Size& frame_size) const;

    // Crop view (no copy) of an image to the zone; empty Mat if the zone lies outside.
    cv::Mat crop(const cv::Mat& image, ZoneId id) const;

private:
    Zone entry_;
    Zone exit_;
    bool resolved_ = false;
};

} // namespace vision
} // namespace parkgate
