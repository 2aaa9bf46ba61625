#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/context.h — Per-operation scope and ambient resolver context
// ═══════════════════════════════════════════════════════════════════

#include "batch_scheduler.h"
#include "dedup_cache.h"
#include "scheduler.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>

namespace batchql::http {
class Request;
class Response;
} // namespace batchql::http

namespace batchql::graphql {

class Graphql;

// ═══════════════════════════════════════════
//  OperationContext
//  Created once per top-level operation by the request-scoped entry
//  point. Owns the loader cache and the pending batches; nothing in it
//  outlives the operation or is shared with another one.
// ═══════════════════════════════════════════
class OperationContext {
public:
    explicit OperationContext(std::chrono::milliseconds timeout = std::chrono::seconds(30))
        : id_(nextId())
        , timeout_(timeout)
        , deadline_(std::chrono::steady_clock::now() + timeout)
        , scheduler_(tasks_, cache_) {}

    OperationContext(const OperationContext&) = delete;
    OperationContext& operator=(const OperationContext&) = delete;

    scheduler::TaskQueue& tasks() { return tasks_; }
    DedupCache& cache() { return cache_; }
    BatchScheduler& scheduler() { return scheduler_; }

    // ── Queue work from any thread, e.g. to settle a Deferred ──
    void post(std::function<void()> task) { tasks_.post(std::move(task)); }

    std::uint64_t id() const { return id_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    // Shared by every await in the operation; set once at construction.
    std::chrono::steady_clock::time_point deadline() const { return deadline_; }

private:
    std::uint64_t id_;
    std::chrono::milliseconds timeout_;
    std::chrono::steady_clock::time_point deadline_;
    scheduler::TaskQueue tasks_;
    DedupCache cache_;
    BatchScheduler scheduler_;

    static std::uint64_t nextId() {
        static std::atomic<std::uint64_t> counter{0};
        return ++counter;
    }
};

// ═══════════════════════════════════════════
//  Context
//  Passed by reference to every resolver and batch function.
// ═══════════════════════════════════════════
struct Context {
    Graphql* app = nullptr;
    http::Request* request = nullptr;
    http::Response* reply = nullptr;
    std::shared_ptr<OperationContext> operation;  // null outside Graphql::reply()
    nlohmann::json variables = nlohmann::json::object();
};

} // namespace batchql::graphql
