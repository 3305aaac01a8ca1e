#include "parkgate/gate/Scheduler.h"
#include <iostream>

namespace parkgate {
namespace gate {

ThreadScheduler::ThreadScheduler() : worker_([this] { run(); }) {}

ThreadScheduler::~ThreadScheduler() {
    shutdown();
}

TaskHandle ThreadScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    auto token = std::make_shared<CancelToken>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            std::cerr << "[Scheduler] Warning: schedule() after shutdown, task dropped\n";
            token->cancel();
            return token;
        }
        queue_.push(Entry{std::chrono::steady_clock::now() + delay, next_seq_++, std::move(task), token});
    }
    cv_.notify_one();
    return token;
}

void ThreadScheduler::cancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!queue_.empty()) {
        queue_.top().token->cancel();
        queue_.pop();
    }
}

void ThreadScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
        while (!queue_.empty()) {
            queue_.top().token->cancel();
            queue_.pop();
        }
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

std::size_t ThreadScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ThreadScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }
        auto deadline = queue_.top().deadline;
        if (std::chrono::steady_clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }
        Entry entry = queue_.top();
        queue_.pop();
        if (entry.token->cancelled()) continue;

        // 执行任务时不持锁, 任务内部可以再次 schedule
        lock.unlock();
        try {
            entry.task();
        } catch (const std::exception& ex) {
            std::cerr << "[Scheduler] Error in scheduled task: " << ex.what() << "\n";
        }
        lock.lock();
    }
}

} // namespace gate
} // namespace parkgate
