#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <optional>
#include <string>

namespace parkgate {

class TimeUtils {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // local time, ISO-8601 with microseconds: 2024-05-01T10:00:00.000000
    static std::string toIsoString(TimePoint tp);
    // accepts with or without the fractional part
    static std::optional<TimePoint> fromIsoString(const std::string& iso);

    static std::string formatTimestamp(TimePoint tp, const std::string& format = "%Y-%m-%d %H:%M:%S");

    // local calendar time -> time point (tests, fixtures)
    static TimePoint makeLocal(int year, int month, int day, int hour, int minute, int second);
};

} // namespace parkgate

#endif // TIME_UTILS_H
