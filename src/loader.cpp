// ═══════════════════════════════════════════════════════════════════
//  src/loader.cpp — Loader registry and resolver adapter
// ═══════════════════════════════════════════════════════════════════

#include "batchql/loader.h"
#include "batchql/console.h"
#include "batchql/context.h"

namespace batchql::graphql {

nlohmann::json defaultLoaderKey(const LoaderQuery& query) {
    return nlohmann::json{{"obj", query.obj.raw()}, {"params", query.params.raw()}};
}

Resolver makeLoaderResolver(LoaderDeclarationPtr declaration) {
    return [declaration = std::move(declaration)](const JsonValue& source,
                                                  const JsonValue& args,
                                                  Context& ctx) -> FieldValue {
        if (!ctx.operation) {
            throw FieldError(kLoadersRequireReply);
        }
        return ctx.operation->scheduler().enqueue(declaration, LoaderQuery{source, args}, ctx);
    };
}

// ═══════════════════════════════════════════
//  LoaderRegistry
// ═══════════════════════════════════════════

void LoaderRegistry::define(Schema& schema, const Loaders& loaders) {
    for (auto& [typeName, fields] : loaders) {
        if (!schema.hasType(typeName)) {
            throw SchemaError("Cannot find type " + typeName);
        }
        for (auto& [fieldName, spec] : fields) {
            define(schema, typeName, fieldName, spec.loader, spec.opts);
        }
    }
}

void LoaderRegistry::define(Schema& schema, const std::string& typeName,
                            const std::string& fieldName, BatchFunction batch,
                            LoaderOptions options) {
    if (!batch) {
        throw SchemaError("Loader for " + typeName + "." + fieldName + " has no batch function");
    }

    auto declaration = std::make_shared<const LoaderDeclaration>(LoaderDeclaration{
        typeName, fieldName, std::move(batch), std::move(options)});

    // Schema first: it rejects unknown types/fields before the registry changes.
    schema.field(typeName, fieldName, makeLoaderResolver(declaration));

    std::lock_guard<std::mutex> lock(mutex_);
    declarations_[declaration->fieldKey()] = declaration;
    console::debug("loader defined:", declaration->fieldKey(),
                   declaration->options.cache ? "(cached)" : "(uncached)");
}

LoaderDeclarationPtr LoaderRegistry::find(const std::string& typeName,
                                          const std::string& fieldName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = declarations_.find(typeName + "." + fieldName);
    return it != declarations_.end() ? it->second : nullptr;
}

std::size_t LoaderRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return declarations_.size();
}

} // namespace batchql::graphql
