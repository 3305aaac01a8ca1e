#include "parkgate/vision/Zone.h"
#include <iostream>

namespace parkgate {
namespace vision {

ZoneLayout::ZoneLayout()
    : ZoneLayout(ZoneRect{0, 0, 640, 480}, 0.5, ZoneRect{640, 0, 1280, 480}, 0.5) {}

ZoneLayout::ZoneLayout(const ZoneRect& entry, double entry_line,
                       const ZoneRect& exit,  double exit_line) {
    entry_.id = ZoneId::ENTRY;
    entry_.rect = entry;
    entry_.line.position = entry_line;
    exit_.id = ZoneId::EXIT;
    exit_.rect = exit;
    exit_.line.position = exit_line;
}

void ZoneLayout::resolve(const cv::Size& frame_size) {
    entry_.trigger_row = entry_.line.resolve(frame_size.height);
    exit_.trigger_row  = exit_.line.resolve(frame_size.height);
    resolved_ = true;

    std::cout << "[Zone] Frame dimensions: " << frame_size.width << "x" << frame_size.height << "\n";
    for (const Zone* z : {&entry_, &exit_}) {
        std::cout << "[Zone] " << toString(z->id) << " zone: (" << z->rect.x1 << ", " << z->rect.y1
                  << ") to (" << z->rect.x2 << ", " << z->rect.y2 << "), virtual line at y="
                  << z->trigger_row << " (ratio=" << z->line.position << ")\n";
        if (z->trigger_row < z->rect.y1 || z->trigger_row > z->rect.y2) {
            std::cerr << "[Zone] Warning: " << toString(z->id)
                      << " virtual line lies outside its zone, no crossing can be declared\n";
        }
    }
}

const Zone& ZoneLayout::zone(ZoneId id) const {
    return id == ZoneId::ENTRY ? entry_ : exit_;
}

cv::Rect ZoneLayout::clippedRect(ZoneId id, const cv::Size& frame_size) const {
    return zone(id).rect.toRect() & cv::Rect(0, 0, frame_size.width, frame_size.height);
}

cv::Mat ZoneLayout::crop(const cv::Mat& image, ZoneId id) const {
    if (image.empty()) return cv::Mat();
    cv::Rect bounded = clippedRect(id, image.size());
    if (bounded.width <= 0 || bounded.height <= 0) return cv::Mat();
    return image(bounded);
}

} // namespace vision
} // namespace parkgate
