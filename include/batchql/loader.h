#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/loader.h — Batch loaders: declarations, registry, adapter
// ═══════════════════════════════════════════════════════════════════
//
//  A loader resolves one field for many parent objects at once:
//
//    graphql::Loaders loaders = {
//        {"Dog", {
//            {"owner", [](const std::vector<graphql::LoaderQuery>& queries,
//                         graphql::Context&) -> graphql::FieldValue {
//                nlohmann::json out = nlohmann::json::array();
//                for (auto& q : queries) out.push_back(lookupOwner(q.obj));
//                return out;
//            }},
//        }},
//    };
//
//  The batch function returns an array with one result per query, in
//  query order, either directly or through a Deferred.
//
// ═══════════════════════════════════════════════════════════════════

#include "deferred.h"
#include "json_utils.h"
#include "schema.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace batchql::graphql {

// ── One pending request handed to a batch function ──
struct LoaderQuery {
    JsonValue obj;      // parent object
    JsonValue params;   // field arguments
    BATCHQL_SERIALIZE(LoaderQuery, obj, params)
};

using BatchFunction = std::function<FieldValue(const std::vector<LoaderQuery>& queries,
                                               Context& ctx)>;

// Dedup key of a query. Two queries with equal keys share one result.
using KeyFunction = std::function<nlohmann::json(const LoaderQuery& query)>;

// Structural key over the parent object and the arguments.
nlohmann::json defaultLoaderKey(const LoaderQuery& query);

struct LoaderOptions {
    bool cache = true;
    KeyFunction key;    // empty: defaultLoaderKey
};

// ── Registration entry: a bare batch function or {loader, opts} ──
struct LoaderSpec {
    BatchFunction loader;
    LoaderOptions opts;

    LoaderSpec(BatchFunction fn, LoaderOptions options = {})
        : loader(std::move(fn)), opts(std::move(options)) {}

    template <typename F>
        requires std::is_invocable_r_v<FieldValue, F&, const std::vector<LoaderQuery>&, Context&>
              && (!std::is_same_v<std::decay_t<F>, BatchFunction>)
              && (!std::is_same_v<std::decay_t<F>, LoaderSpec>)
    LoaderSpec(F&& fn) : loader(std::forward<F>(fn)) {}
};

// type name -> field name -> loader
using Loaders = std::unordered_map<std::string, std::unordered_map<std::string, LoaderSpec>>;

struct LoaderDeclaration {
    std::string typeName;
    std::string fieldName;
    BatchFunction batch;
    LoaderOptions options;

    std::string fieldKey() const { return typeName + "." + fieldName; }
};

using LoaderDeclarationPtr = std::shared_ptr<const LoaderDeclaration>;

// ═══════════════════════════════════════════
//  Resolver Adapter
//  A resolver with the ordinary signature that hands the request to the
//  operation's batch scheduler. Outside a request-scoped operation it
//  fails the field with kLoadersRequireReply.
// ═══════════════════════════════════════════
Resolver makeLoaderResolver(LoaderDeclarationPtr declaration);

// ═══════════════════════════════════════════
//  class LoaderRegistry
//  (type, field) -> declaration. Defining a loader installs its adapter
//  resolver into the schema, replacing whatever resolver was there, so
//  defining the same loaders again leaves exactly one resolver behind.
// ═══════════════════════════════════════════
class LoaderRegistry {
public:
    void define(Schema& schema, const Loaders& loaders);

    void define(Schema& schema, const std::string& typeName, const std::string& fieldName,
                BatchFunction batch, LoaderOptions options = {});

    LoaderDeclarationPtr find(const std::string& typeName, const std::string& fieldName) const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LoaderDeclarationPtr> declarations_;
};

} // namespace batchql::graphql
