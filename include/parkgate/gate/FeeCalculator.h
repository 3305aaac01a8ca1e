#ifndef PARKGATE_FEE_CALCULATOR_H
#define PARKGATE_FEE_CALCULATOR_H

#include <chrono>
#include <ostream>
#include <string>

namespace parkgate {
namespace gate {

// Started hours are billed as full hours. A zero or negative stay is an
// error and costs nothing.
class FeeCalculator {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit FeeCalculator(double hourly_rate = 10.0);

    double hourlyRate() const { return hourly_rate_; }

    // ceil(duration / 1h); 0 when exit <= entry
    static long long billableHours(TimePoint entry_time, TimePoint exit_time);

    double calculateFee(TimePoint entry_time, TimePoint exit_time) const;

    // "2 hours 30 minutes", "1 hour", "45 seconds"
    static std::string durationString(TimePoint entry_time, TimePoint exit_time);

    // "$10.00"
    static std::string formatFee(double fee);

    void printReceipt(std::ostream& os, const std::string& plate,
                      TimePoint entry_time, TimePoint exit_time, double fee) const;

private:
    double hourly_rate_;
};

} // namespace gate
} // namespace parkgate

#endif // PARKGATE_FEE_CALCULATOR_H
