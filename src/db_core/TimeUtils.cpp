#include "TimeUtils.h"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace parkgate {

static std::tm toLocalTm(std::time_t t) {
    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &t);
#else
    localtime_r(&t, &local_tm);
#endif
    return local_tm;
}

std::string TimeUtils::toIsoString(TimePoint tp) {
    using namespace std::chrono;
    auto secs = time_point_cast<seconds>(tp);
    auto micros = duration_cast<microseconds>(tp - secs).count();
    if (micros < 0) {   // pre-epoch values
        secs -= seconds(1);
        micros += 1000000;
    }
    std::tm local_tm = toLocalTm(system_clock::to_time_t(secs));

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

std::optional<TimeUtils::TimePoint> TimeUtils::fromIsoString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;

    long long micros = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek()) && digits.size() < 6) digits.push_back(static_cast<char>(ss.get()));
        if (digits.empty()) return std::nullopt;
        while (digits.size() < 6) digits.push_back('0');
        micros = std::stoll(digits);
    }

    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t) + std::chrono::microseconds(micros);
}

std::string TimeUtils::formatTimestamp(TimePoint tp, const std::string& format) {
    std::tm local_tm = toLocalTm(std::chrono::system_clock::to_time_t(tp));
    std::stringstream result;
    result << std::put_time(&local_tm, format.c_str());
    return result.str();
}

TimeUtils::TimePoint TimeUtils::makeLocal(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

} // namespace parkgate
