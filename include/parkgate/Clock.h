#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace parkgate {

// Time source shared by the detection loop and the gate coordinator.
// Production code uses SystemClock; tests drive a manual one.
class Clock {
public:
    using steady_point = std::chrono::steady_clock::time_point;
    using wall_point   = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    virtual steady_point now() const = 0;      // 单调时钟 (冷却/超时)
    virtual wall_point   wallNow() const = 0;  // 墙上时间 (入场/出场记录)
    virtual void sleepFor(std::chrono::milliseconds d) = 0;

    // Waits up to d on cv (lock held on entry and exit), returning early once
    // stop() holds. Returns stop() at the end of the wait.
    virtual bool waitFor(std::unique_lock<std::mutex>& lock, std::condition_variable& cv,
                         std::chrono::milliseconds d, const std::function<bool()>& stop) = 0;
};

class SystemClock : public Clock {
public:
    steady_point now() const override { return std::chrono::steady_clock::now(); }
    wall_point wallNow() const override { return std::chrono::system_clock::now(); }
    void sleepFor(std::chrono::milliseconds d) override { std::this_thread::sleep_for(d); }
    bool waitFor(std::unique_lock<std::mutex>& lock, std::condition_variable& cv,
                 std::chrono::milliseconds d, const std::function<bool()>& stop) override {
        return cv.wait_for(lock, d, stop);
    }
};

} // namespace parkgate
