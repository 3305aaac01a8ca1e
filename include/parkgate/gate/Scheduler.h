#ifndef PARKGATE_SCHEDULER_H
#define PARKGATE_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace parkgate {
namespace gate {

// Cancellation token shared between the scheduler and the caller.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
private:
    std::atomic<bool> cancelled_{false};
};

using TaskHandle = std::shared_ptr<CancelToken>;

// Single-shot deferred tasks (deadline + action + cancellation token).
class TaskScheduler {
public:
    using Task = std::function<void()>;

    virtual ~TaskScheduler() = default;
    virtual TaskHandle schedule(std::chrono::milliseconds delay, Task task) = 0;
    virtual void cancelAll() = 0;
};

// Runs due tasks on one worker thread, in deadline order.
class ThreadScheduler : public TaskScheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TaskHandle schedule(std::chrono::milliseconds delay, Task task) override;
    void cancelAll() override;

    // 取消全部待执行任务并结束工作线程
    void shutdown();

    std::size_t pending() const;

private:
    struct Entry {
        std::chrono::steady_clock::time_point deadline;
        std::uint64_t seq;
        Task task;
        TaskHandle token;
    };
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.seq > b.seq;
        }
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    std::uint64_t next_seq_ = 0;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace gate
} // namespace parkgate

#endif // PARKGATE_SCHEDULER_H
