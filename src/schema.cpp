// ═══════════════════════════════════════════════════════════════════
//  src/schema.cpp — Schema construction, resolver table, validation
// ═══════════════════════════════════════════════════════════════════

#include "batchql/schema.h"

namespace batchql::graphql {

bool isBuiltinScalar(const std::string& name) {
    return name == "Int" || name == "Float" || name == "String" ||
           name == "Boolean" || name == "ID";
}

// ═══════════════════════════════════════════
//  SchemaState
// ═══════════════════════════════════════════

const TypeDef* SchemaState::findType(const std::string& name) const {
    auto it = types.find(name);
    return it != types.end() ? &it->second : nullptr;
}

const Resolver* SchemaState::findResolver(const std::string& type,
                                          const std::string& field) const {
    auto t = resolvers.find(type);
    if (t == resolvers.end()) return nullptr;
    auto f = t->second.find(field);
    return f != t->second.end() ? &f->second : nullptr;
}

namespace {

nlohmann::json validationError(const std::string& message, const nlohmann::json& path) {
    return nlohmann::json{{"message", message}, {"path", path}};
}

void validateSelections(const SchemaState& state,
                        const TypeDef& parent,
                        const std::vector<FieldSelection>& selections,
                        const nlohmann::json& path,
                        nlohmann::json& errors) {
    for (auto& sel : selections) {
        auto fieldPath = path;
        fieldPath.push_back(sel.responseKey());

        if (sel.name == "__typename") {
            if (!sel.selections.empty()) {
                errors.push_back(validationError(
                    "Field \"__typename\" must not have a selection since type \"String!\" has no subfields.",
                    fieldPath));
            }
            continue;
        }

        const FieldDef* def = parent.findField(sel.name);
        if (!def) {
            errors.push_back(validationError(
                "Cannot query field \"" + sel.name + "\" on type \"" + parent.name + "\".",
                fieldPath));
            continue;
        }

        // Fields registered without SDL carry no type; nothing to check below them.
        if (def->type.name.empty()) continue;

        const TypeDef* fieldType = state.findType(def->type.name);
        if (!fieldType) continue;

        if (fieldType->isLeaf()) {
            if (!sel.selections.empty()) {
                errors.push_back(validationError(
                    "Field \"" + sel.name + "\" must not have a selection since type \"" +
                    def->type.display + "\" has no subfields.",
                    fieldPath));
            }
        } else if (sel.selections.empty()) {
            errors.push_back(validationError(
                "Field \"" + sel.name + "\" of type \"" + def->type.display +
                "\" must have a selection of subfields. Did you mean \"" + sel.name + " { ... }\"?",
                fieldPath));
        } else if (fieldType->kind != TypeKind::Union) {
            validateSelections(state, *fieldType, sel.selections, fieldPath, errors);
        }
    }
}

void checkTypeReferences(const SchemaState& state) {
    for (auto& [name, def] : state.types) {
        for (auto& field : def.fields) {
            if (!field.type.name.empty() && !state.findType(field.type.name)) {
                throw SchemaError("Unknown type \"" + field.type.name + "\".");
            }
        }
        if (def.kind == TypeKind::Union) {
            for (auto& member : def.values) {
                if (!state.findType(member)) {
                    throw SchemaError("Unknown type \"" + member + "\".");
                }
            }
        }
    }
}

} // namespace

nlohmann::json SchemaState::validate(const ParsedQuery& query) const {
    nlohmann::json errors = nlohmann::json::array();
    const auto& rootName = query.operationType == "mutation" ? mutationType : queryType;
    const TypeDef* root = findType(rootName);
    if (!root) {
        errors.push_back(nlohmann::json{
            {"message", query.operationType == "mutation"
                            ? "Schema is not configured for mutations."
                            : "Schema does not define the required query root type."}
        });
        return errors;
    }
    validateSelections(*this, *root, query.selections, nlohmann::json::array(), errors);
    return errors;
}

// ═══════════════════════════════════════════
//  Schema
// ═══════════════════════════════════════════

Schema::Schema() {
    auto state = std::make_shared<SchemaState>();
    for (const char* scalar : {"Int", "Float", "String", "Boolean", "ID"}) {
        TypeDef def;
        def.name = scalar;
        def.kind = TypeKind::Scalar;
        state->types.emplace(def.name, std::move(def));
    }
    state_ = std::move(state);
}

Schema::Schema(const std::string& sdl) : Schema() {
    extend(sdl);
}

std::shared_ptr<const SchemaState> Schema::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Schema::hasType(const std::string& name) const {
    return snapshot()->findType(name) != nullptr;
}

void Schema::update(const std::function<void(SchemaState&)>& change) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<SchemaState>(*state_);
    change(*next);
    state_ = std::move(next);
}

void Schema::extend(const std::string& sdl) {
    auto doc = parseSchema(sdl);

    update([&doc](SchemaState& state) {
        if (!doc.queryType.empty()) state.queryType = doc.queryType;
        if (!doc.mutationType.empty()) state.mutationType = doc.mutationType;

        for (auto& def : doc.definitions) {
            auto it = state.types.find(def.name);
            if (it == state.types.end()) {
                state.types.emplace(def.name, def);
                continue;
            }
            if (!state.implicitTypes.count(def.name)) {
                throw SchemaError("There can be only one type named \"" + def.name + "\".");
            }
            // Declared fields take over; fields only known through
            // resolvers registered earlier are kept.
            TypeDef merged = def;
            for (auto& existing : it->second.fields) {
                if (!merged.findField(existing.name)) merged.fields.push_back(existing);
            }
            it->second = std::move(merged);
            state.implicitTypes.erase(def.name);
        }

        for (auto& ext : doc.extensions) {
            auto it = state.types.find(ext.name);
            if (it == state.types.end()) {
                throw SchemaError("Cannot extend type \"" + ext.name + "\" because it is not defined.");
            }
            for (auto& field : ext.fields) {
                if (it->second.findField(field.name)) {
                    throw SchemaError("Field \"" + ext.name + "." + field.name +
                                      "\" already exists in the schema.");
                }
                it->second.fields.push_back(field);
            }
            for (auto& value : ext.values) it->second.values.push_back(value);
        }

        checkTypeReferences(state);
        state.typesVersion++;
    });
}

Schema& Schema::field(const std::string& type, const std::string& name, Resolver resolver) {
    update([&](SchemaState& state) {
        auto it = state.types.find(type);
        if (it == state.types.end()) {
            throw SchemaError("Cannot find type " + type);
        }
        if (!it->second.findField(name)) {
            if (!state.implicitTypes.count(type)) {
                throw SchemaError("Cannot find field " + name + " of type " + type);
            }
            it->second.fields.push_back(FieldDef{name, TypeRef{}});
            state.typesVersion++;
        }
        state.resolvers[type][name] = std::move(resolver);
    });
    return *this;
}

void Schema::ensureRootType(const std::string& rootName) {
    update([&](SchemaState& state) {
        if (state.findType(rootName)) return;
        TypeDef def;
        def.name = rootName;
        def.kind = TypeKind::Object;
        state.types.emplace(rootName, std::move(def));
        state.implicitTypes.insert(rootName);
        state.typesVersion++;
    });
}

Schema& Schema::root(const std::string& operation, const std::string& name, RootResolver resolver) {
    auto current = snapshot();
    auto rootName = operation == "mutation" ? current->mutationType : current->queryType;
    ensureRootType(rootName);
    return field(rootName, name,
        [resolver = std::move(resolver)](const JsonValue&, const JsonValue& args, Context& ctx) {
            return resolver(args, ctx);
        });
}

Schema& Schema::query(const std::string& name, RootResolver resolver) {
    return root("query", name, std::move(resolver));
}

Schema& Schema::mutation(const std::string& name, RootResolver resolver) {
    return root("mutation", name, std::move(resolver));
}

void Schema::defineResolvers(const Resolvers& resolvers) {
    auto current = snapshot();
    for (auto& [type, fields] : resolvers) {
        if (type == current->queryType || type == current->mutationType) {
            ensureRootType(type);
        } else if (!current->findType(type)) {
            throw SchemaError("Cannot find type " + type);
        }
    }
    for (auto& [type, fields] : resolvers) {
        for (auto& [name, resolver] : fields) {
            field(type, name, resolver);
        }
    }
}

} // namespace batchql::graphql
