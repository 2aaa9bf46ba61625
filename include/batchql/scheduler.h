#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/scheduler.h — Deferred-execution queue for one operation
// ═══════════════════════════════════════════════════════════════════
//
//  The execution engine resolves a whole level of the response in one
//  synchronous pass. Anything deferred during that pass (batch flushes
//  in particular) runs only when the engine drains the queue, so every
//  registration of the pass lands in the same batch.
//
//    TaskQueue tasks;
//    tasks.defer([] { flush(); });   // queued, not run
//    tasks.drain();                  // runs flush()
//
// ═══════════════════════════════════════════════════════════════════

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace batchql::scheduler {

class TaskQueue {
public:
    using Task = std::function<void()>;

    TaskQueue() = default;
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // ── Queue a task behind the current synchronous pass ──
    void defer(Task task);

    // ── Same as defer(); callable from any thread ──
    void post(Task task);

    // ── Run tasks until none are left, including ones queued meanwhile ──
    std::size_t drain();

    // ── Run tasks, waiting for posted ones, until done() holds ──
    //    Returns false if the timeout passes first.
    bool runUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout);
    bool runUntil(const std::function<bool()>& done,
                  std::chrono::steady_clock::time_point deadline);

    std::size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Task> tasks_;

    bool popFront(Task& out);
};

} // namespace batchql::scheduler
