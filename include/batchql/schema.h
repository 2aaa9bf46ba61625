#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/schema.h — Type table and resolver table
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    graphql::Schema schema(R"(
//        type Dog   { name: String! owner: Human }
//        type Human { name: String! }
//        type Query { dogs: [Dog] }
//    )");
//    schema.query("dogs", [](const JsonValue& args, graphql::Context& ctx) {
//        return nlohmann::json::array({{{"name", "Max"}}});
//    });
//
//  Every mutation copies the current state and swaps the copy in, so an
//  operation that took a snapshot keeps seeing the resolvers it started
//  with.
//
// ═══════════════════════════════════════════════════════════════════

#include "deferred.h"
#include "errors.h"
#include "json_utils.h"
#include "parser.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace batchql::graphql {

struct Context;

// ── Resolver signatures ──
using Resolver = std::function<FieldValue(const JsonValue& source,
                                          const JsonValue& args,
                                          Context& ctx)>;
using RootResolver = std::function<FieldValue(const JsonValue& args, Context& ctx)>;

// type name -> field name -> resolver
using Resolvers = std::unordered_map<std::string, std::unordered_map<std::string, Resolver>>;

// ═══════════════════════════════════════════
//  SchemaState — one immutable snapshot
// ═══════════════════════════════════════════
struct SchemaState {
    std::unordered_map<std::string, TypeDef> types;
    // Types created on demand by query()/mutation() without SDL. Fields
    // are added to them as resolvers are registered.
    std::unordered_set<std::string> implicitTypes;
    Resolvers resolvers;
    std::string queryType = "Query";
    std::string mutationType = "Mutation";
    std::uint64_t typesVersion = 0;

    const TypeDef* findType(const std::string& name) const;
    const Resolver* findResolver(const std::string& type, const std::string& field) const;

    // Check a parsed operation against the type table. Returns a JSON
    // array of {message, path} errors; empty when valid.
    nlohmann::json validate(const ParsedQuery& query) const;
};

// ═══════════════════════════════════════════
//  class Schema
// ═══════════════════════════════════════════
class Schema {
public:
    Schema();
    explicit Schema(const std::string& sdl);

    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;

    // ── Add type definitions and `extend type` blocks ──
    void extend(const std::string& sdl);

    // ── Register a root resolver ──
    Schema& query(const std::string& name, RootResolver resolver);
    Schema& mutation(const std::string& name, RootResolver resolver);

    // ── Install or replace the resolver for type.field ──
    //    Throws SchemaError for a missing type, or a field missing from
    //    a type declared in SDL.
    Schema& field(const std::string& type, const std::string& name, Resolver resolver);

    void defineResolvers(const Resolvers& resolvers);

    std::shared_ptr<const SchemaState> snapshot() const;

    bool hasType(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const SchemaState> state_;

    void update(const std::function<void(SchemaState&)>& change);
    void ensureRootType(const std::string& rootName);
    Schema& root(const std::string& operation, const std::string& name, RootResolver resolver);
};

// Built-in scalars every schema knows.
bool isBuiltinScalar(const std::string& name);

} // namespace batchql::graphql
