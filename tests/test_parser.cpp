// ═══════════════════════════════════════════════════════════════════
//  test_parser.cpp — Query and schema-definition parsing
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "batchql/errors.h"
#include "batchql/parser.h"

using namespace batchql;
using namespace batchql::graphql;

// ═══════════════════════════════════════════
//  Query Parser Tests
// ═══════════════════════════════════════════

TEST(GraphQLParserTest, SimpleQuery) {
    detail::GraphQLParser parser("{ dogs }");
    auto parsed = parser.parse();

    EXPECT_EQ(parsed.operationType, "query");
    ASSERT_EQ(parsed.selections.size(), 1u);
    EXPECT_EQ(parsed.selections[0].name, "dogs");
}

TEST(GraphQLParserTest, ExplicitQueryKeyword) {
    detail::GraphQLParser parser("query Dogs { dogs owners }");
    auto parsed = parser.parse();

    EXPECT_EQ(parsed.operationType, "query");
    EXPECT_EQ(parsed.operationName, "Dogs");
    ASSERT_EQ(parsed.selections.size(), 2u);
    EXPECT_EQ(parsed.selections[1].name, "owners");
}

TEST(GraphQLParserTest, MutationKeyword) {
    detail::GraphQLParser parser("mutation { adopt(name: \"Max\") }");
    auto parsed = parser.parse();

    EXPECT_EQ(parsed.operationType, "mutation");
    EXPECT_EQ(parsed.selections[0].arguments["name"], "Max");
}

TEST(GraphQLParserTest, CommasSeparateFields) {
    auto parsed = parseQuery(R"({
        dogs {
            name,
            owner {
                name
            }
        }
    })");

    ASSERT_EQ(parsed.selections.size(), 1u);
    auto& dogs = parsed.selections[0];
    ASSERT_EQ(dogs.selections.size(), 2u);
    EXPECT_EQ(dogs.selections[0].name, "name");
    EXPECT_EQ(dogs.selections[1].name, "owner");
    ASSERT_EQ(dogs.selections[1].selections.size(), 1u);
}

TEST(GraphQLParserTest, LiteralArguments) {
    auto parsed = parseQuery(R"({ dog(id: 42, tags: ["a", "b"], filter: {old: true, weight: 1.5}) { name } })");

    auto& args = parsed.selections[0].arguments;
    EXPECT_EQ(args["id"], 42);
    EXPECT_EQ(args["tags"], (nlohmann::json{"a", "b"}));
    EXPECT_EQ(args["filter"]["old"], true);
    EXPECT_DOUBLE_EQ(args["filter"]["weight"].get<double>(), 1.5);
}

TEST(GraphQLParserTest, AliasSupport) {
    auto parsed = parseQuery("{ first: dog(id: 1) { name } second: dog(id: 2) { name } }");

    ASSERT_EQ(parsed.selections.size(), 2u);
    EXPECT_EQ(parsed.selections[0].name, "dog");
    EXPECT_EQ(parsed.selections[0].responseKey(), "first");
    EXPECT_EQ(parsed.selections[1].responseKey(), "second");
}

TEST(GraphQLParserTest, CommentsIgnored) {
    auto parsed = parseQuery("# all dogs\n{ dogs # the list\n { name } }");
    EXPECT_EQ(parsed.selections[0].selections[0].name, "name");
}

// ═══════════════════════════════════════════
//  Variables
// ═══════════════════════════════════════════

TEST(GraphQLVariablesTest, DefinitionsWithDefaults) {
    auto parsed = parseQuery("query ($id: ID!, $limit: Int = 10, $tags: [String]) { dogs { name } }");

    ASSERT_EQ(parsed.variables.size(), 3u);
    EXPECT_EQ(parsed.variables[0].name, "id");
    EXPECT_EQ(parsed.variables[0].type, "ID!");
    EXPECT_FALSE(parsed.variables[0].hasDefault);
    EXPECT_TRUE(parsed.variables[1].hasDefault);
    EXPECT_EQ(parsed.variables[1].defaultValue, 10);
    EXPECT_EQ(parsed.variables[2].type, "[String]");
}

TEST(GraphQLVariablesTest, SubstitutionUsesValuesThenDefaults) {
    auto parsed = parseQuery("query ($id: ID, $limit: Int = 10) { dog(id: $id, limit: $limit, missing: $none) { name } }");
    auto& args = parsed.selections[0].arguments;
    EXPECT_EQ(args["id"], (nlohmann::json{{"$var", "id"}}));

    auto resolved = substituteVariables(args, nlohmann::json{{"id", "7"}}, parsed.variables);
    EXPECT_EQ(resolved["id"], "7");
    EXPECT_EQ(resolved["limit"], 10);
    EXPECT_TRUE(resolved["missing"].is_null());
}

TEST(GraphQLVariablesTest, SubstitutionReachesNestedValues) {
    auto parsed = parseQuery("query ($n: String) { dogs(where: {names: [$n, \"Max\"]}) { name } }");

    auto resolved = substituteVariables(parsed.selections[0].arguments,
                                        nlohmann::json{{"n", "Buddy"}}, parsed.variables);
    EXPECT_EQ(resolved["where"]["names"], (nlohmann::json{"Buddy", "Max"}));
}

// ═══════════════════════════════════════════
//  Syntax Errors
// ═══════════════════════════════════════════

TEST(GraphQLSyntaxTest, UnterminatedSelectionReportsPosition) {
    try {
        parseQuery("{ dogs { name }");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_NE(std::string(e.what()).find("at position"), std::string::npos);
        EXPECT_GT(e.position(), 0u);
    }
}

TEST(GraphQLSyntaxTest, RejectsEmptySelectionAndTrailingContent) {
    EXPECT_THROW(parseQuery("{ }"), SyntaxError);
    EXPECT_THROW(parseQuery("{ dogs } }"), SyntaxError);
    EXPECT_THROW(parseQuery("subscription { dogs }"), SyntaxError);
}

TEST(GraphQLSyntaxTest, OutOfRangeOrMalformedNumbersAreSyntaxErrors) {
    try {
        parseQuery("{ dog(id: 99999999999999999999) { name } }");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_NE(std::string(e.what()).find("Invalid number"), std::string::npos);
    }
    EXPECT_THROW(parseQuery("{ dog(id: -.) { name } }"), SyntaxError);
    EXPECT_THROW(parseQuery("{ dog(weight: 1e999) { name } }"), SyntaxError);
    EXPECT_THROW(parseQuery("{ dog(weight: 1e) { name } }"), SyntaxError);
    EXPECT_THROW(parseQuery(R"({ dog(name: "\uZZZZ") { name } })"), SyntaxError);
}

// ═══════════════════════════════════════════
//  Schema Definition Parser Tests
// ═══════════════════════════════════════════

TEST(SchemaParserTest, ObjectTypesAndTypeRefs) {
    auto doc = parseSchema(R"(
        type Human {
            name: String!
        }

        type Dog {
            name: String!
            owner: Human
            friends(first: Int = 3): [Dog!]!
        }
    )");

    ASSERT_EQ(doc.definitions.size(), 2u);
    auto& dog = doc.definitions[1];
    EXPECT_EQ(dog.name, "Dog");
    EXPECT_EQ(dog.kind, TypeKind::Object);
    ASSERT_EQ(dog.fields.size(), 3u);

    EXPECT_TRUE(dog.fields[0].type.nonNull);
    EXPECT_EQ(dog.fields[1].type.name, "Human");

    auto* friends = dog.findField("friends");
    ASSERT_NE(friends, nullptr);
    EXPECT_EQ(friends->type.name, "Dog");
    EXPECT_EQ(friends->type.display, "[Dog!]!");
    EXPECT_TRUE(friends->type.list);
}

TEST(SchemaParserTest, OtherDefinitionKinds) {
    auto doc = parseSchema(R"(
        "A pet"
        interface Pet { name: String! }
        type Cat implements Pet & Node @key(fields: "name") { name: String! id: ID! }
        enum Size { SMALL LARGE }
        union Animal = Cat | Dog
        scalar Date
        input DogFilter { name: String = "Max" }
        schema { query: Root mutation: Changes }
    )");

    ASSERT_EQ(doc.definitions.size(), 6u);
    EXPECT_EQ(doc.definitions[0].kind, TypeKind::Interface);
    EXPECT_EQ(doc.definitions[1].fields.size(), 2u);
    EXPECT_EQ(doc.definitions[2].values, (std::vector<std::string>{"SMALL", "LARGE"}));
    EXPECT_EQ(doc.definitions[3].values, (std::vector<std::string>{"Cat", "Dog"}));
    EXPECT_EQ(doc.definitions[4].kind, TypeKind::Scalar);
    EXPECT_EQ(doc.definitions[5].kind, TypeKind::Input);
    EXPECT_EQ(doc.queryType, "Root");
    EXPECT_EQ(doc.mutationType, "Changes");
}

TEST(SchemaParserTest, ExtendBlocksAreSeparate) {
    auto doc = parseSchema("type Dog { name: String } extend type Dog { age: Int }");

    ASSERT_EQ(doc.definitions.size(), 1u);
    ASSERT_EQ(doc.extensions.size(), 1u);
    EXPECT_EQ(doc.extensions[0].fields[0].name, "age");
}

TEST(SchemaParserTest, UnsupportedDefinitionThrows) {
    EXPECT_THROW(parseSchema("directive @auth on FIELD"), SyntaxError);
}
