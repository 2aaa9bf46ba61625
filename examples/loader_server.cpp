// ═══════════════════════════════════════════════════════════════════
//  loader_server.cpp — Batched field loaders behind an HTTP endpoint
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • A schema with a list field whose items need a second lookup
//    • A loader that resolves every Dog.owner of a request in one call
//    • Turning the per-request cache off for one loader
//    • Mounting the endpoint on the HTTP server
//
// ═══════════════════════════════════════════════════════════════════

#include "batchql/batchql.h"
#include <map>
#include <vector>

using namespace batchql;

struct Dog {
    std::string name;
    BATCHQL_SERIALIZE(Dog, name)
};

static const std::vector<Dog> dogs = {{"Max"}, {"Charlie"}, {"Buddy"}, {"Max"}};

static const std::map<std::string, std::string> owners = {
    {"Max", "Jennifer"},
    {"Charlie", "Sarah"},
    {"Buddy", "Tracy"},
};

static const char* schema = R"(
    type Human {
        name: String!
    }

    type Dog {
        name: String!
        owner: Human
        walker: Human
    }

    type Query {
        dogs: [Dog]
    }
)";

int main() {
    graphql::Options opts;
    opts.schema = schema;
    opts.logLevel = "debug";

    opts.resolvers = {
        {"Query", {
            {"dogs", [](const JsonValue&, const JsonValue&, graphql::Context&) -> graphql::FieldValue {
                return nlohmann::json(dogs);
            }},
        }},
    };

    auto lookup = [](const std::vector<graphql::LoaderQuery>& queries,
                     graphql::Context&) -> graphql::FieldValue {
        nlohmann::json result = nlohmann::json::array();
        for (auto& q : queries) {
            auto it = owners.find(q.obj["name"].get<std::string>());
            result.push_back(it != owners.end()
                ? nlohmann::json{{"name", it->second}}
                : nlohmann::json(nullptr));
        }
        return result;
    };

    opts.loaders = {
        {"Dog", {
            {"owner", lookup},
            {"walker", graphql::LoaderSpec(lookup, graphql::LoaderOptions{.cache = false})},
        }},
    };

    auto gql = std::make_shared<graphql::Graphql>(std::move(opts));

    http::Server app;
    graphql::mount(app, gql);

    app.get("/", [](http::Request&, http::Response& res) {
        res.json(nlohmann::json{
            {"service", "batchql"},
            {"endpoint", "/graphql"},
        });
    });

    app.listen(4000, [] {
        console::log("GraphQL server running on http://localhost:4000/graphql");
        console::info("Try:");
        console::info("  curl -X POST http://localhost:4000/graphql \\");
        console::info("    -H 'Content-Type: application/json' \\");
        console::info("    -d '{\"query\": \"{ dogs { name owner { name } } }\"}'");
    });
}
