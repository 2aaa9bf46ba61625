#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/batch_scheduler.h — Coalesces field requests into batches
// ═══════════════════════════════════════════════════════════════════
//
//  enqueue() only records the request. The first request of a wave
//  defers a flush on the operation's TaskQueue; the flush calls the
//  batch function once with every input registered before the queue
//  was drained, then settles each request by position.
//
//  Used from the thread executing the operation only.
//
// ═══════════════════════════════════════════════════════════════════

#include "dedup_cache.h"
#include "loader.h"
#include "scheduler.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace batchql::graphql {

class BatchScheduler {
public:
    BatchScheduler(scheduler::TaskQueue& tasks, DedupCache& cache)
        : tasks_(tasks), cache_(cache) {}

    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    // ── Register one request; the Deferred settles after the flush ──
    DeferredPtr enqueue(const LoaderDeclarationPtr& loader, LoaderQuery query, Context& ctx);

    std::size_t openWaves() const { return waves_.size(); }
    std::size_t batchesDispatched() const { return batches_; }

private:
    struct Wave {
        LoaderDeclarationPtr loader;
        std::vector<LoaderQuery> inputs;
        std::vector<DeferredPtr> slots;  // parallel to inputs
        std::size_t requests = 0;        // including cache hits
    };

    scheduler::TaskQueue& tasks_;
    DedupCache& cache_;
    std::unordered_map<std::string, std::shared_ptr<Wave>> waves_;
    std::size_t batches_ = 0;

    Wave& openWave(const LoaderDeclarationPtr& loader, Context& ctx);
    void flush(const std::string& fieldKey, Context& ctx);

    static void settle(const Wave& wave, const Deferred& result);
    static void rejectAll(const Wave& wave, const std::string& message);
};

} // namespace batchql::graphql
