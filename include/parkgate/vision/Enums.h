#pragma once
#include <string>

namespace parkgate {
namespace vision {

// Enumeration: camera frame zones.
enum class ZoneId {
    ENTRY = 0,
    EXIT
};

inline std::string toString(ZoneId z) {
    switch (z) {
        case ZoneId::ENTRY: return "entry";
        case ZoneId::EXIT:  return "exit";
        default:            return "unknown";
    }
}

// Foreground mask byte classes produced by MOG2
enum MaskClass : unsigned char {
    MASK_BACKGROUND = 0,
    MASK_SHADOW     = 127,
    MASK_FOREGROUND = 255
};

} // namespace vision
} // namespace parkgate
