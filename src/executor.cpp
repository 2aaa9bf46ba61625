// ═══════════════════════════════════════════════════════════════════
//  src/executor.cpp — Level-by-level query execution
// ═══════════════════════════════════════════════════════════════════

#include "batchql/executor.h"

namespace batchql::graphql {

nlohmann::json ExecutionResult::toJson() const {
    nlohmann::json response = {{"data", data}};
    if (!errors.empty()) {
        response["errors"] = errors;
    }
    return response;
}

ExecutionResult Executor::execute(const ParsedQuery& query, const nlohmann::json& rootValue) {
    ExecutionResult result;

    const auto& rootName = query.operationType == "mutation"
        ? schema_->mutationType
        : schema_->queryType;

    std::vector<Job> level;
    level.push_back(Job{rootValue, rootName, schema_->findType(rootName),
                        &query.selections, &result.data, nlohmann::json::array()});

    while (!level.empty()) {
        level = runLevel(level, query, result.errors);
    }
    return result;
}

std::vector<Executor::Job> Executor::runLevel(const std::vector<Job>& level,
                                              const ParsedQuery& query,
                                              nlohmann::json& errors) {
    std::vector<Pending> pending;

    // ── Pass 1: call every resolver of the level ──
    for (auto& job : level) {
        JsonValue source(job.source);
        for (auto& sel : *job.selections) {
            const auto& key = sel.responseKey();
            // Object members are map nodes; the pointer survives later inserts.
            nlohmann::json* slot = &(*job.out)[key];
            auto path = job.path;
            path.push_back(key);

            if (sel.name == "__typename") {
                *slot = job.typeName;
                continue;
            }

            Pending p{&sel, job.type ? job.type->findField(sel.name) : nullptr,
                      job.typeName, std::move(path), slot, FieldValue()};
            try {
                auto args = substituteVariables(sel.arguments, ctx_.variables, query.variables);
                if (auto* resolver = schema_->findResolver(job.typeName, sel.name)) {
                    p.value = (*resolver)(source, JsonValue(std::move(args)), ctx_);
                } else if (job.source.is_object() && job.source.contains(sel.name)) {
                    p.value = FieldValue(job.source[sel.name]);
                } else {
                    p.value = FieldValue(nlohmann::json(nullptr));
                }
            } catch (const std::exception& e) {
                p.failed = true;
                p.error = e.what();
            }
            pending.push_back(std::move(p));
        }
    }

    // ── Pass 2: flush the batches opened above ──
    if (ctx_.operation) {
        ctx_.operation->tasks().drain();
    }

    // ── Pass 3: collect results, queue the next level ──
    std::vector<Job> next;
    for (auto& p : pending) {
        if (!p.failed && p.value.isDeferred()) {
            await(p);
        }
        if (p.failed) {
            *p.slot = nullptr;
            errors.push_back(nlohmann::json{{"message", p.error}, {"path", p.path}});
            continue;
        }
        const auto& value = p.value.isDeferred() ? p.value.deferred()->value() : p.value.value();
        complete(value, p, next);
    }
    return next;
}

void Executor::await(Pending& p) {
    const auto& deferred = p.value.deferred();
    if (!deferred->settled()) {
        bool settled = ctx_.operation &&
            ctx_.operation->tasks().runUntil([&deferred] { return deferred->settled(); },
                                             ctx_.operation->deadline());
        if (!settled) {
            p.failed = true;
            p.error = "Timed out waiting for " + p.typeName + "." + p.selection->name;
            return;
        }
    }
    if (deferred->rejected()) {
        p.failed = true;
        p.error = deferred->error();
    }
}

void Executor::complete(const nlohmann::json& value, const Pending& p,
                        std::vector<Job>& next) {
    completeInto(value, *p.selection, p.def, p.slot, p.path, next);
}

const TypeDef* Executor::concreteType(const TypeDef* declared, const nlohmann::json& value,
                                      std::string& typeName) const {
    // Abstract types resolve through the object's own __typename.
    if (declared && (declared->kind == TypeKind::Interface || declared->kind == TypeKind::Union) &&
        value.is_object() && value.contains("__typename") && value["__typename"].is_string()) {
        const auto& concrete = value["__typename"].get_ref<const std::string&>();
        if (const TypeDef* def = schema_->findType(concrete)) {
            typeName = concrete;
            return def;
        }
    }
    return declared;
}

void Executor::completeInto(const nlohmann::json& value, const FieldSelection& selection,
                            const FieldDef* def, nlohmann::json* slot,
                            const nlohmann::json& path, std::vector<Job>& next) {
    if (value.is_null() || selection.selections.empty()) {
        *slot = value;
        return;
    }

    if (value.is_array()) {
        *slot = nlohmann::json::array();
        for (std::size_t i = 0; i < value.size(); ++i) slot->push_back(nullptr);
        // The array is not resized again, so element pointers stay valid.
        for (std::size_t i = 0; i < value.size(); ++i) {
            auto itemPath = path;
            itemPath.push_back(i);
            completeInto(value[i], selection, def, &(*slot)[i], itemPath, next);
        }
        return;
    }

    if (!value.is_object()) {
        *slot = value;
        return;
    }

    std::string typeName = def ? def->type.name : "";
    const TypeDef* type = concreteType(typeName.empty() ? nullptr : schema_->findType(typeName),
                                       value, typeName);

    *slot = nlohmann::json::object();
    next.push_back(Job{value, typeName, type, &selection.selections, slot, path});
}

} // namespace batchql::graphql
