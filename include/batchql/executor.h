#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/executor.h — Level-by-level query execution
// ═══════════════════════════════════════════════════════════════════
//
//  The response tree is resolved one depth at a time. Every field of
//  every object on a level is resolved in one synchronous pass, then
//  the operation's TaskQueue is drained, which flushes every batch
//  that pass opened. Children of all objects on the level form the next
//  level, so a loader field below a list is batched across the list.
//
// ═══════════════════════════════════════════════════════════════════

#include "context.h"
#include "parser.h"
#include "schema.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace batchql::graphql {

struct ExecutionResult {
    nlohmann::json data = nlohmann::json::object();
    nlohmann::json errors = nlohmann::json::array();

    // {data} or {data, errors}
    nlohmann::json toJson() const;
};

class Executor {
public:
    Executor(std::shared_ptr<const SchemaState> schema, Context& ctx)
        : schema_(std::move(schema)), ctx_(ctx) {}

    ExecutionResult execute(const ParsedQuery& query,
                            const nlohmann::json& rootValue = nlohmann::json::object());

private:
    // One object whose selections are resolved on the current level.
    struct Job {
        nlohmann::json source;
        std::string typeName;
        const TypeDef* type;
        const std::vector<FieldSelection>* selections;
        nlohmann::json* out;
        nlohmann::json path;
    };

    // One field of one job, between resolution and completion.
    struct Pending {
        const FieldSelection* selection;
        const FieldDef* def;
        std::string typeName;
        nlohmann::json path;
        nlohmann::json* slot;
        FieldValue value;
        bool failed = false;
        std::string error;
    };

    std::shared_ptr<const SchemaState> schema_;
    Context& ctx_;

    std::vector<Job> runLevel(const std::vector<Job>& level, const ParsedQuery& query,
                              nlohmann::json& errors);
    void await(Pending& pending);
    void complete(const nlohmann::json& value, const Pending& pending,
                  std::vector<Job>& next);
    void completeInto(const nlohmann::json& value, const FieldSelection& selection,
                      const FieldDef* def, nlohmann::json* slot, const nlohmann::json& path,
                      std::vector<Job>& next);
    const TypeDef* concreteType(const TypeDef* declared, const nlohmann::json& value,
                                std::string& typeName) const;
};

} // namespace batchql::graphql
