// ═══════════════════════════════════════════════════════════════════
//  src/graphql.cpp — Entry points, query cache, HTTP handler
// ═══════════════════════════════════════════════════════════════════

#include "batchql/graphql.h"
#include "batchql/console.h"

namespace batchql::graphql {

Graphql::Graphql(Options options)
    : options_(std::move(options))
    , settings_(validateOptions(options_)) {
    if (!options_.logLevel.empty()) {
        console::setLevel(console::parseLevel(options_.logLevel));
    }
    if (settings_.cacheSize > 0) {
        documents_ = std::make_unique<cache::LRUCache<std::string, Prepared>>(settings_.cacheSize);
    }
    if (!options_.schema.empty()) {
        schema_.extend(options_.schema);
    }
    schema_.defineResolvers(options_.resolvers);
    loaders_.define(schema_, options_.loaders);
}

void Graphql::defineResolvers(const Resolvers& resolvers) {
    schema_.defineResolvers(resolvers);
}

void Graphql::defineLoaders(const Loaders& loaders) {
    loaders_.define(schema_, loaders);
}

void Graphql::extendSchema(const std::string& sdl) {
    schema_.extend(sdl);
}

Graphql::Prepared Graphql::prepare(const std::string& query, const SchemaState& state) {
    if (documents_) {
        auto cached = documents_->get(query);
        if (cached && cached->typesVersion == state.typesVersion) return *cached;
    }

    Prepared prepared;
    prepared.typesVersion = state.typesVersion;
    try {
        auto parsed = std::make_shared<ParsedQuery>(parseQuery(query));
        prepared.errors = state.validate(*parsed);
        prepared.document = std::move(parsed);
    } catch (const SyntaxError& e) {
        prepared.errors.push_back(nlohmann::json{{"message", std::string("Syntax Error: ") + e.what()}});
    }

    if (documents_) documents_->set(query, prepared);
    return prepared;
}

ExecutionResult Graphql::run(const std::string& query, Context& ctx, bool& badRequest) {
    auto state = schema_.snapshot();
    auto prepared = prepare(query, *state);

    if (!prepared.errors.empty()) {
        badRequest = true;
        ExecutionResult result;
        result.data = nullptr;
        result.errors = prepared.errors;
        return result;
    }

    badRequest = false;
    Executor executor(state, ctx);
    return executor.execute(*prepared.document);
}

nlohmann::json Graphql::operator()(const std::string& query, const nlohmann::json& variables) {
    Context ctx;
    ctx.app = this;
    ctx.variables = variables.is_object() ? variables : nlohmann::json::object();

    bool badRequest = false;
    auto result = run(query, ctx, badRequest);

    if (badRequest) {
        throw ExecutionError("Bad Request", 400, result.errors);
    }
    if (!result.errors.empty()) {
        throw ExecutionError("Internal Server Error", 500, result.errors, result.data);
    }
    return result.toJson();
}

nlohmann::json Graphql::reply(http::Request& req, http::Response& res,
                              const std::string& query, const nlohmann::json& variables) {
    Context ctx;
    ctx.app = this;
    ctx.request = &req;
    ctx.reply = &res;
    ctx.operation = std::make_shared<OperationContext>(
        std::chrono::milliseconds(options_.operationTimeoutMs));
    ctx.variables = variables.is_object() ? variables : nlohmann::json::object();

    bool badRequest = false;
    auto result = run(query, ctx, badRequest);
    if (badRequest) res.status(400);
    return result.toJson();
}

namespace {

void sendError(http::Response& res, int status, const std::string& message) {
    res.status(status).json(nlohmann::json{
        {"data", nullptr},
        {"errors", nlohmann::json::array({nlohmann::json{{"message", message}}})}
    });
}

} // namespace

http::RouteHandler Graphql::handler() {
    return [this](http::Request& req, http::Response& res) {
        nlohmann::json body = nlohmann::json::object();

        if (req.method == "GET") {
            auto q = req.query.find("query");
            if (q != req.query.end()) body["query"] = q->second;
            auto v = req.query.find("variables");
            if (v != req.query.end()) {
                body["variables"] = nlohmann::json::parse(v->second, nullptr, false);
                if (body["variables"].is_discarded()) {
                    sendError(res, 400, "Invalid JSON in variables");
                    return;
                }
            }
            if (req.query.count("persisted")) body["persisted"] = req.query["persisted"] == "true";
        } else {
            body = nlohmann::json::parse(req.rawBody, nullptr, false);
            if (body.is_discarded() || !body.is_object()) {
                sendError(res, 400, "Invalid JSON in request body");
                return;
            }
        }

        if (!body.contains("query") || !body["query"].is_string() ||
            body["query"].get_ref<const std::string&>().empty()) {
            sendError(res, 400, "Missing GraphQL query");
            return;
        }

        auto query = body["query"].get<std::string>();
        bool persisted = body.value("persisted", false);

        if (persisted) {
            auto it = options_.persistedQueries.find(query);
            if (it == options_.persistedQueries.end()) {
                sendError(res, 400, "Persisted query not found");
                return;
            }
            query = it->second;
        } else if (options_.onlyPersisted) {
            sendError(res, 400, "Only persisted queries are allowed");
            return;
        }

        auto variables = body.value("variables", nlohmann::json::object());
        res.json(reply(req, res, query, variables));
    };
}

void mount(http::Server& server, const std::shared_ptr<Graphql>& graphql) {
    auto handle = graphql->handler();
    // The routes keep the endpoint alive.
    auto routed = [graphql, handle](http::Request& req, http::Response& res) { handle(req, res); };
    server.get(graphql->options().path, routed);
    server.post(graphql->options().path, routed);
}

} // namespace batchql::graphql
