// ═══════════════════════════════════════════════════════════════════
//  src/options.cpp — Option validation
// ═══════════════════════════════════════════════════════════════════

#include "batchql/options.h"
#include "batchql/console.h"
#include <cmath>
#include <cstdint>
#include <limits>

namespace batchql::graphql {

namespace {

std::size_t validateCache(const nlohmann::json& cache) {
    if (cache.is_null()) return kDefaultQueryCacheSize;
    if (cache.is_boolean() && !cache.get<bool>()) return 0;

    if (cache.is_number_unsigned()) {
        return static_cast<std::size_t>(cache.get<std::uint64_t>());
    } else if (cache.is_number_integer()) {
        auto size = cache.get<long long>();
        if (size >= 0) return static_cast<std::size_t>(size);
    } else if (cache.is_number_float()) {
        // The max size_t rounds up to 2^N as a double, so the bound is exclusive.
        constexpr double kLimit = static_cast<double>(std::numeric_limits<std::size_t>::max());
        double size = cache.get<double>();
        if (size >= 0 && size < kLimit && std::floor(size) == size) {
            return static_cast<std::size_t>(size);
        }
    }
    throw ConfigError("Cache type is not supported");
}

double validateJit(const nlohmann::json& jit) {
    if (jit.is_null()) return 0;
    if (!jit.is_number()) throw ConfigError("the jit option must be a number");
    return jit.get<double>();
}

} // namespace

Settings validateOptions(const Options& options) {
    Settings settings;
    try {
        settings.cacheSize = validateCache(options.cache);
        settings.jit = validateJit(options.jit);

        if (options.onlyPersisted && options.persistedQueries.empty()) {
            throw ConfigError("onlyPersisted is true but there are no persistedQueries");
        }
        if (options.operationTimeoutMs <= 0) {
            throw ConfigError("operationTimeoutMs must be positive");
        }
        if (!options.logLevel.empty()) {
            try {
                console::parseLevel(options.logLevel);
            } catch (const std::invalid_argument& e) {
                throw ConfigError(e.what());
            }
        }
    } catch (const ConfigError& e) {
        console::error("Invalid graphql options:", e.what());
        throw;
    }
    return settings;
}

} // namespace batchql::graphql
