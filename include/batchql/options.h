#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/options.h — Plugin options and their validation
// ═══════════════════════════════════════════════════════════════════
//
//    graphql::Options opts;
//    opts.schema    = sdl;
//    opts.resolvers = resolvers;
//    opts.loaders   = loaders;
//    opts.cache     = 256;      // LRU size; false or 0 disables
//    auto gql = std::make_shared<graphql::Graphql>(std::move(opts));
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "loader.h"
#include "schema.h"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace batchql::graphql {

inline constexpr std::size_t kDefaultQueryCacheSize = 1024;

struct Options {
    std::string schema;              // SDL; may be empty
    Resolvers resolvers;
    Loaders loaders;

    // Query document cache. null: default size; false or 0: disabled;
    // positive integer: size. Anything else is rejected.
    nlohmann::json cache;

    // Execution count before a query would be compiled. Must be a number.
    nlohmann::json jit;

    bool onlyPersisted = false;
    std::unordered_map<std::string, std::string> persistedQueries; // hash -> query

    std::string path = "/graphql";
    int operationTimeoutMs = 30000;
    std::string logLevel;            // empty: leave the process level alone
};

// ── Result of validating the dynamically typed options ──
struct Settings {
    std::size_t cacheSize = kDefaultQueryCacheSize;  // 0: disabled
    double jit = 0;
};

// Throws ConfigError.
Settings validateOptions(const Options& options);

} // namespace batchql::graphql
