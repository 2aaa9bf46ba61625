// ═══════════════════════════════════════════════════════════════════
//  src/batch_scheduler.cpp — Wave bookkeeping and fan-out
// ═══════════════════════════════════════════════════════════════════

#include "batchql/batch_scheduler.h"
#include "batchql/console.h"
#include "batchql/context.h"

namespace batchql::graphql {

BatchScheduler::Wave& BatchScheduler::openWave(const LoaderDeclarationPtr& loader, Context& ctx) {
    auto fieldKey = loader->fieldKey();
    auto it = waves_.find(fieldKey);
    if (it != waves_.end()) return *it->second;

    auto wave = std::make_shared<Wave>();
    wave->loader = loader;
    waves_.emplace(fieldKey, wave);

    // One flush per wave, run once the current resolution pass yields.
    tasks_.defer([this, fieldKey, &ctx] { flush(fieldKey, ctx); });
    return *wave;
}

DeferredPtr BatchScheduler::enqueue(const LoaderDeclarationPtr& loader, LoaderQuery query,
                                    Context& ctx) {
    if (loader->options.cache) {
        auto key = loader->options.key ? loader->options.key(query) : defaultLoaderKey(query);
        auto acquired = cache_.acquire(loader->fieldKey(), key);
        if (!acquired.inserted) {
            // Pending or settled, the request shares the earlier result.
            auto it = waves_.find(loader->fieldKey());
            if (it != waves_.end()) it->second->requests++;
            return acquired.cell;
        }
        auto& wave = openWave(loader, ctx);
        wave.inputs.push_back(std::move(query));
        wave.slots.push_back(acquired.cell);
        wave.requests++;
        return acquired.cell;
    }

    auto slot = std::make_shared<Deferred>();
    auto& wave = openWave(loader, ctx);
    wave.inputs.push_back(std::move(query));
    wave.slots.push_back(slot);
    wave.requests++;
    return slot;
}

void BatchScheduler::flush(const std::string& fieldKey, Context& ctx) {
    auto it = waves_.find(fieldKey);
    if (it == waves_.end()) return;
    auto wave = std::move(it->second);
    waves_.erase(it);
    batches_++;

    console::debug("batch", fieldKey, "op", ctx.operation ? ctx.operation->id() : 0,
                   ":", wave->inputs.size(), "queries for", wave->requests, "requests");

    FieldValue result;
    try {
        result = wave->loader->batch(wave->inputs, ctx);
    } catch (const std::exception& e) {
        rejectAll(*wave, e.what());
        return;
    }

    if (!result.isDeferred()) {
        Deferred settled;
        settled.resolve(result.value());
        settle(*wave, settled);
        return;
    }

    // The wave stays alive until the batch settles.
    result.deferred()->then([wave](const Deferred& outcome) { settle(*wave, outcome); });
}

void BatchScheduler::settle(const Wave& wave, const Deferred& result) {
    if (result.rejected()) {
        rejectAll(wave, result.error());
        return;
    }

    const auto& values = result.value();
    const auto fieldKey = wave.loader->fieldKey();
    if (!values.is_array()) {
        rejectAll(wave, "Loader for " + fieldKey + " must return an array");
        return;
    }
    if (values.size() != wave.slots.size()) {
        rejectAll(wave, "Loader for " + fieldKey + " returned " + std::to_string(values.size()) +
                        " results for " + std::to_string(wave.slots.size()) + " queries");
        return;
    }

    for (std::size_t i = 0; i < wave.slots.size(); ++i) {
        wave.slots[i]->resolve(values[i]);
    }
}

void BatchScheduler::rejectAll(const Wave& wave, const std::string& message) {
    console::warn("batch", wave.loader->fieldKey(), "failed:", message);
    for (auto& slot : wave.slots) {
        slot->reject(message);
    }
}

} // namespace batchql::graphql
