#include "parkgate/gate/FeeCalculator.h"
#include "TimeUtils.h"

#include <cstdio>
#include <iostream>
#include <sstream>

namespace parkgate {
namespace gate {

namespace {

std::string plural(long long n, const char* unit) {
    std::ostringstream ss;
    ss << n << ' ' << unit << (n != 1 ? "s" : "");
    return ss.str();
}
} // namespace

FeeCalculator::FeeCalculator(double hourly_rate) : hourly_rate_(hourly_rate) {
    std::cout << "[Fee] Hourly rate: " << formatFee(hourly_rate_) << "\n";
}

long long FeeCalculator::billableHours(TimePoint entry_time, TimePoint exit_time) {
    // 按时钟原生精度向上取整, 不先截断到微秒
    const auto stay = exit_time - entry_time;
    if (stay <= TimePoint::duration::zero()) return 0;
    return std::chrono::ceil<std::chrono::hours>(stay).count();
}

double FeeCalculator::calculateFee(TimePoint entry_time, TimePoint exit_time) const {
    if (exit_time <= entry_time) {
        std::cerr << "[Fee] Error: exit time " << TimeUtils::toIsoString(exit_time)
                  << " is not after entry time " << TimeUtils::toIsoString(entry_time) << "\n";
        return 0.0;
    }
    const long long hours = billableHours(entry_time, exit_time);
    const double fee = static_cast<double>(hours) * hourly_rate_;
    std::cout << "[Fee] Parking duration: " << durationString(entry_time, exit_time)
              << ", Hours billed: " << hours << ", Fee: " << formatFee(fee) << "\n";
    return fee;
}

std::string FeeCalculator::durationString(TimePoint entry_time, TimePoint exit_time) {
    long long total_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(exit_time - entry_time).count();
    if (total_seconds < 0) total_seconds = 0;

    const long long hours = total_seconds / 3600;
    const long long minutes = (total_seconds % 3600) / 60;
    const long long seconds = total_seconds % 60;

    if (hours > 0) {
        if (minutes > 0) return plural(hours, "hour") + " " + plural(minutes, "minute");
        return plural(hours, "hour");
    }
    if (minutes > 0) return plural(minutes, "minute");
    return plural(seconds, "second");
}

std::string FeeCalculator::formatFee(double fee) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "$%.2f", fee);
    return buf;
}

void FeeCalculator::printReceipt(std::ostream& os, const std::string& plate,
                                 TimePoint entry_time, TimePoint exit_time, double fee) const {
    const std::string rule(50, '=');
    os << "\n" << rule << "\n"
       << "Parking Fee Receipt\n"
       << rule << "\n"
       << "Number Plate: " << plate << "\n"
       << "Entry Time: " << TimeUtils::formatTimestamp(entry_time) << "\n"
       << "Exit Time: " << TimeUtils::formatTimestamp(exit_time) << "\n"
       << "Duration: " << durationString(entry_time, exit_time) << "\n"
       << "Fee: " << formatFee(fee) << "\n"
       << rule << "\n\n";
}

} // namespace gate
} // namespace parkgate
