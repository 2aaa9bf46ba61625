#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/dedup_cache.h — Per-operation loader result cache
// ═══════════════════════════════════════════════════════════════════
//
//  Maps (type.field, key) to the Deferred shared by every request with
//  that key. Owned by one OperationContext and dropped with it.
//
// ═══════════════════════════════════════════════════════════════════

#include "deferred.h"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace batchql::graphql {

// ── Hash that agrees with json operator== ──
// operator== compares numbers by value across integer, unsigned and float
// storage, so 1, 1u and 1.0 must land in the same bucket.
struct JsonKeyHash {
    std::size_t operator()(const nlohmann::json& j) const { return hashValue(j); }

private:
    static std::size_t mix(std::size_t seed, std::size_t h) {
        return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
    }

    static std::size_t hashValue(const nlohmann::json& j) {
        using value_t = nlohmann::json::value_t;
        switch (j.type()) {
            case value_t::number_integer:
            case value_t::number_unsigned:
            case value_t::number_float: {
                double d = j.get<double>();
                if (d == 0) d = 0;  // -0.0 == 0.0
                return mix(1, std::hash<double>{}(d));
            }
            case value_t::string:
                return mix(2, std::hash<std::string>{}(j.get_ref<const std::string&>()));
            case value_t::boolean:
                return mix(3, j.get<bool>() ? 1 : 0);
            case value_t::array: {
                std::size_t seed = 4;
                for (const auto& item : j) seed = mix(seed, hashValue(item));
                return seed;
            }
            case value_t::object: {
                std::size_t seed = 5;
                for (auto it = j.begin(); it != j.end(); ++it) {
                    seed = mix(seed, std::hash<std::string>{}(it.key()));
                    seed = mix(seed, hashValue(it.value()));
                }
                return seed;
            }
            default:
                return std::hash<nlohmann::json>{}(j);
        }
    }
};

class DedupCache {
public:
    struct Acquired {
        DeferredPtr cell;
        bool inserted;
    };

    // ── Existing cell for the key, or a new pending one ──
    Acquired acquire(const std::string& fieldKey, const nlohmann::json& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& cells = cells_[fieldKey];
        auto it = cells.find(key);
        if (it != cells.end()) return {it->second, false};
        auto cell = std::make_shared<Deferred>();
        cells.emplace(key, cell);
        return {cell, true};
    }

    DeferredPtr find(const std::string& fieldKey, const nlohmann::json& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto f = cells_.find(fieldKey);
        if (f == cells_.end()) return nullptr;
        auto it = f->second.find(key);
        return it != f->second.end() ? it->second : nullptr;
    }

    std::size_t size(const std::string& fieldKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto f = cells_.find(fieldKey);
        return f != cells_.end() ? f->second.size() : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unordered_map<nlohmann::json, DeferredPtr, JsonKeyHash>> cells_;
};

} // namespace batchql::graphql
