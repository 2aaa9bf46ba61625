#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/graphql.h — GraphQL endpoint with batched field loaders
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    graphql::Options opts;
//    opts.schema    = "type Dog { name: String! owner: Human } ...";
//    opts.resolvers = {{"Query", {{"dogs", dogsResolver}}}};
//    opts.loaders   = {{"Dog", {{"owner", ownersBatch}}}};
//    auto gql = std::make_shared<graphql::Graphql>(std::move(opts));
//
//    http::Server app;
//    graphql::mount(app, gql);            // POST/GET /graphql
//
//  Entry points:
//    gql->reply(req, res, query)   one OperationContext per call; loaders work
//    (*gql)(query)                 no operation scope; loader fields fail and
//                                  any error is thrown as ExecutionError
//
// ═══════════════════════════════════════════════════════════════════

#include "cache.h"
#include "context.h"
#include "errors.h"
#include "executor.h"
#include "http.h"
#include "json_utils.h"
#include "loader.h"
#include "options.h"
#include "parser.h"
#include "schema.h"
#include <cstdint>
#include <memory>
#include <string>

namespace batchql::graphql {

class Graphql {
public:
    // Validates options; throws ConfigError or SchemaError.
    explicit Graphql(Options options);

    Graphql(const Graphql&) = delete;
    Graphql& operator=(const Graphql&) = delete;

    // ── Unscoped entry point ──
    //    Returns {data}; throws ExecutionError carrying every error.
    nlohmann::json operator()(const std::string& query,
                              const nlohmann::json& variables = nlohmann::json::object());

    // ── Request-scoped entry point ──
    //    Returns {data, errors?}. Sets status 400 on res for queries that
    //    do not parse or validate.
    nlohmann::json reply(http::Request& req, http::Response& res,
                         const std::string& query,
                         const nlohmann::json& variables = nlohmann::json::object());

    // ── Registration after construction ──
    void defineResolvers(const Resolvers& resolvers);
    void defineLoaders(const Loaders& loaders);
    void extendSchema(const std::string& sdl);

    // ── HTTP route handler for GET and POST ──
    http::RouteHandler handler();

    Schema& schema() { return schema_; }
    const LoaderRegistry& loaders() const { return loaders_; }
    const Options& options() const { return options_; }
    const Settings& settings() const { return settings_; }
    std::size_t cachedQueries() const { return documents_ ? documents_->size() : 0; }

private:
    // A parsed query and its validation errors for one schema version.
    struct Prepared {
        std::shared_ptr<const ParsedQuery> document;
        nlohmann::json errors = nlohmann::json::array();
        std::uint64_t typesVersion = 0;
    };

    Options options_;
    Settings settings_;
    Schema schema_;
    LoaderRegistry loaders_;
    std::unique_ptr<cache::LRUCache<std::string, Prepared>> documents_;

    Prepared prepare(const std::string& query, const SchemaState& state);

    // Shared by both entry points. Returns the result; `badRequest` is set
    // when the query never reached execution.
    ExecutionResult run(const std::string& query, Context& ctx, bool& badRequest);
};

// ── Register GET and POST routes for options().path ──
void mount(http::Server& server, const std::shared_ptr<Graphql>& graphql);

} // namespace batchql::graphql
