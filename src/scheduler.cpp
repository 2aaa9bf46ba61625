// ═══════════════════════════════════════════════════════════════════
//  src/scheduler.cpp — TaskQueue
// ═══════════════════════════════════════════════════════════════════

#include "batchql/scheduler.h"

namespace batchql::scheduler {

void TaskQueue::defer(Task task) {
    post(std::move(task));
}

void TaskQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    ready_.notify_one();
}

bool TaskQueue::popFront(Task& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.empty()) return false;
    out = std::move(tasks_.front());
    tasks_.pop_front();
    return true;
}

std::size_t TaskQueue::drain() {
    std::size_t ran = 0;
    Task task;
    // Tasks run outside the lock so they may queue more work.
    while (popFront(task)) {
        task();
        ++ran;
    }
    return ran;
}

bool TaskQueue::runUntil(const std::function<bool()>& done,
                         std::chrono::milliseconds timeout) {
    return runUntil(done, std::chrono::steady_clock::now() + timeout);
}

bool TaskQueue::runUntil(const std::function<bool()>& done,
                         std::chrono::steady_clock::time_point deadline) {
    while (true) {
        drain();
        if (done()) return true;

        std::unique_lock<std::mutex> lock(mutex_);
        if (!ready_.wait_until(lock, deadline, [this] { return !tasks_.empty(); })) {
            return done();
        }
    }
}

std::size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace batchql::scheduler
