// ═══════════════════════════════════════════════════════════════════
//  test_batch_scheduler.cpp — Waves, dedup cache, registry, adapter
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "batchql/context.h"
#include "batchql/loader.h"
#include <string>
#include <vector>

using namespace batchql;
using namespace batchql::graphql;

namespace {

LoaderQuery dog(const std::string& name, nlohmann::json params = nlohmann::json::object()) {
    return LoaderQuery{nlohmann::json{{"name", name}}, std::move(params)};
}

// Echoes each parent name back with a suffix and counts calls.
struct EchoLoader {
    int calls = 0;
    std::vector<std::vector<LoaderQuery>> seen;

    LoaderDeclarationPtr declare(LoaderOptions options = {}, std::string field = "owner") {
        return std::make_shared<const LoaderDeclaration>(LoaderDeclaration{
            "Dog", std::move(field),
            [this](const std::vector<LoaderQuery>& queries, Context&) -> FieldValue {
                calls++;
                seen.push_back(queries);
                nlohmann::json out = nlohmann::json::array();
                for (auto& q : queries) out.push_back(q.obj["name"].get<std::string>() + "'s owner");
                return out;
            },
            std::move(options)});
    }
};

class BatchSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        operation = std::make_shared<OperationContext>();
        ctx.operation = operation;
    }

    std::shared_ptr<OperationContext> operation;
    Context ctx;
};

LoaderDeclarationPtr declareWith(BatchFunction batch) {
    return std::make_shared<const LoaderDeclaration>(
        LoaderDeclaration{"Dog", "owner", std::move(batch), LoaderOptions{}});
}

} // namespace

// ═══════════════════════════════════════════
//  Waves
// ═══════════════════════════════════════════

TEST_F(BatchSchedulerTest, RegistrationsBeforeDrainShareOneBatch) {
    EchoLoader loader;
    auto decl = loader.declare();

    auto a = operation->scheduler().enqueue(decl, dog("Max"), ctx);
    auto b = operation->scheduler().enqueue(decl, dog("Charlie"), ctx);

    EXPECT_EQ(loader.calls, 0);
    EXPECT_FALSE(a->settled());
    EXPECT_EQ(operation->scheduler().openWaves(), 1u);
    EXPECT_EQ(operation->tasks().pending(), 1u);

    operation->tasks().drain();

    EXPECT_EQ(loader.calls, 1);
    ASSERT_EQ(loader.seen[0].size(), 2u);
    EXPECT_EQ(a->value(), "Max's owner");
    EXPECT_EQ(b->value(), "Charlie's owner");
    EXPECT_EQ(operation->scheduler().openWaves(), 0u);
    EXPECT_EQ(operation->scheduler().batchesDispatched(), 1u);
}

TEST_F(BatchSchedulerTest, EachFieldGetsItsOwnWave) {
    EchoLoader owners;
    EchoLoader walkers;
    auto ownerDecl = owners.declare();
    auto walkerDecl = walkers.declare({}, "walker");

    operation->scheduler().enqueue(ownerDecl, dog("Max"), ctx);
    operation->scheduler().enqueue(walkerDecl, dog("Max"), ctx);
    operation->tasks().drain();

    EXPECT_EQ(owners.calls, 1);
    EXPECT_EQ(walkers.calls, 1);
    EXPECT_EQ(operation->scheduler().batchesDispatched(), 2u);
}

TEST_F(BatchSchedulerTest, LaterRegistrationsOpenANewWave) {
    EchoLoader loader;
    auto decl = loader.declare();

    operation->scheduler().enqueue(decl, dog("Max"), ctx);
    operation->tasks().drain();
    auto late = operation->scheduler().enqueue(decl, dog("Buddy"), ctx);
    operation->tasks().drain();

    EXPECT_EQ(loader.calls, 2);
    EXPECT_EQ(late->value(), "Buddy's owner");
}

// ═══════════════════════════════════════════
//  Dedup cache
// ═══════════════════════════════════════════

TEST_F(BatchSchedulerTest, EqualKeysShareOneCell) {
    EchoLoader loader;
    auto decl = loader.declare();

    auto first = operation->scheduler().enqueue(decl, dog("Max"), ctx);
    auto second = operation->scheduler().enqueue(decl, dog("Max"), ctx);

    EXPECT_EQ(first, second);
    EXPECT_EQ(operation->cache().size("Dog.owner"), 1u);

    operation->tasks().drain();
    ASSERT_EQ(loader.seen[0].size(), 1u);
    EXPECT_EQ(second->value(), "Max's owner");
}

TEST_F(BatchSchedulerTest, SettledCellAnswersLaterRequests) {
    EchoLoader loader;
    auto decl = loader.declare();

    operation->scheduler().enqueue(decl, dog("Max"), ctx);
    operation->tasks().drain();

    auto again = operation->scheduler().enqueue(decl, dog("Max"), ctx);
    EXPECT_TRUE(again->fulfilled());
    EXPECT_EQ(operation->tasks().pending(), 0u);
    EXPECT_EQ(loader.calls, 1);
}

TEST_F(BatchSchedulerTest, ParamsArePartOfTheDefaultKey) {
    EchoLoader loader;
    auto decl = loader.declare();

    auto a = operation->scheduler().enqueue(decl, dog("Max", {{"since", 2019}}), ctx);
    auto b = operation->scheduler().enqueue(decl, dog("Max", {{"since", 2020}}), ctx);

    EXPECT_NE(a, b);
    operation->tasks().drain();
    EXPECT_EQ(loader.seen[0].size(), 2u);
}

TEST_F(BatchSchedulerTest, CustomKeyFunction) {
    EchoLoader loader;
    LoaderOptions opts;
    opts.key = [](const LoaderQuery& q) { return q.obj["name"].raw(); };
    auto decl = loader.declare(opts);

    auto a = operation->scheduler().enqueue(decl, dog("Max", {{"since", 2019}}), ctx);
    auto b = operation->scheduler().enqueue(decl, dog("Max", {{"since", 2020}}), ctx);

    EXPECT_EQ(a, b);
    EXPECT_NE(operation->cache().find("Dog.owner", "Max"), nullptr);
}

TEST_F(BatchSchedulerTest, NumericallyEqualParamsShareOneCell) {
    EchoLoader loader;
    auto decl = loader.declare();

    auto asInt = operation->scheduler().enqueue(decl, dog("Max", {{"id", 1}}), ctx);
    auto asUnsigned = operation->scheduler().enqueue(decl, dog("Max", {{"id", 1u}}), ctx);
    auto asFloat = operation->scheduler().enqueue(decl, dog("Max", {{"id", 1.0}}), ctx);

    EXPECT_EQ(asInt, asUnsigned);
    EXPECT_EQ(asInt, asFloat);
    EXPECT_EQ(operation->cache().size("Dog.owner"), 1u);
    EXPECT_NE(operation->cache().find("Dog.owner",
                  nlohmann::json{{"obj", {{"name", "Max"}}}, {"params", {{"id", 1.0}}}}),
              nullptr);

    operation->tasks().drain();
    ASSERT_EQ(loader.seen.size(), 1u);
    EXPECT_EQ(loader.seen[0].size(), 1u);
}

TEST_F(BatchSchedulerTest, ParsedAndBuiltParentsShareOneCell) {
    EchoLoader loader;
    auto decl = loader.declare();

    nlohmann::json built;
    built["name"] = "Max";
    built["age"] = 3;
    built["tags"] = {"good", "boy"};
    auto parsed = nlohmann::json::parse(R"({"tags": ["good", "boy"], "age": 3.0, "name": "Max"})");

    auto a = operation->scheduler().enqueue(decl, LoaderQuery{built, nlohmann::json::object()}, ctx);
    auto b = operation->scheduler().enqueue(decl, LoaderQuery{parsed, nlohmann::json::object()}, ctx);

    EXPECT_EQ(a, b);
    EXPECT_EQ(operation->cache().size("Dog.owner"), 1u);
}

TEST_F(BatchSchedulerTest, DisabledCacheKeepsDuplicatesInOrder) {
    EchoLoader loader;
    auto decl = loader.declare(LoaderOptions{.cache = false});

    auto a = operation->scheduler().enqueue(decl, dog("Max"), ctx);
    auto b = operation->scheduler().enqueue(decl, dog("Max"), ctx);
    operation->tasks().drain();

    EXPECT_NE(a, b);
    ASSERT_EQ(loader.seen[0].size(), 2u);
    EXPECT_EQ(a->value(), b->value());
    EXPECT_EQ(operation->cache().size("Dog.owner"), 0u);
}

TEST_F(BatchSchedulerTest, OperationsDoNotShareCells) {
    EchoLoader loader;
    auto decl = loader.declare();

    auto other = std::make_shared<OperationContext>();
    Context otherCtx;
    otherCtx.operation = other;

    auto mine = operation->scheduler().enqueue(decl, dog("Max"), ctx);
    auto theirs = other->scheduler().enqueue(decl, dog("Max"), otherCtx);

    EXPECT_NE(mine, theirs);
    EXPECT_NE(operation->id(), other->id());

    operation->tasks().drain();
    EXPECT_TRUE(mine->settled());
    EXPECT_FALSE(theirs->settled());
}

// ═══════════════════════════════════════════
//  Failures and asynchronous results
// ═══════════════════════════════════════════

TEST_F(BatchSchedulerTest, ThrowRejectsEveryEntry) {
    auto decl = declareWith([](const std::vector<LoaderQuery>&, Context&) -> FieldValue {
        throw std::runtime_error("no owners today");
    });

    auto a = operation->scheduler().enqueue(decl, dog("Max"), ctx);
    auto b = operation->scheduler().enqueue(decl, dog("Buddy"), ctx);
    operation->tasks().drain();

    EXPECT_TRUE(a->rejected());
    EXPECT_EQ(a->error(), "no owners today");
    EXPECT_EQ(b->error(), "no owners today");
}

TEST_F(BatchSchedulerTest, WrongResultShapeRejects) {
    auto notArray = declareWith([](const std::vector<LoaderQuery>&, Context&) -> FieldValue {
        return nlohmann::json{{"name", "Jennifer"}};
    });
    auto a = operation->scheduler().enqueue(notArray, dog("Max"), ctx);
    operation->tasks().drain();
    EXPECT_EQ(a->error(), "Loader for Dog.owner must return an array");

    auto other = std::make_shared<OperationContext>();
    Context otherCtx;
    otherCtx.operation = other;
    auto tooMany = declareWith([](const std::vector<LoaderQuery>&, Context&) -> FieldValue {
        return nlohmann::json::array({1, 2});
    });
    auto b = other->scheduler().enqueue(tooMany, dog("Max"), otherCtx);
    other->tasks().drain();
    EXPECT_EQ(b->error(), "Loader for Dog.owner returned 2 results for 1 queries");
}

TEST_F(BatchSchedulerTest, DeferredBatchSettlesEntriesLater) {
    auto pending = std::make_shared<Deferred>();
    auto decl = declareWith([pending](const std::vector<LoaderQuery>&, Context&) -> FieldValue {
        return pending;
    });

    auto a = operation->scheduler().enqueue(decl, dog("Max"), ctx);
    auto b = operation->scheduler().enqueue(decl, dog("Buddy"), ctx);
    operation->tasks().drain();
    EXPECT_FALSE(a->settled());

    pending->resolve(nlohmann::json::array({"Jennifer", "Tracy"}));

    EXPECT_EQ(a->value(), "Jennifer");
    EXPECT_EQ(b->value(), "Tracy");
}

TEST_F(BatchSchedulerTest, RejectedDeferredBatchRejectsEntries) {
    auto pending = std::make_shared<Deferred>();
    auto decl = declareWith([pending](const std::vector<LoaderQuery>&, Context&) -> FieldValue {
        return pending;
    });

    auto a = operation->scheduler().enqueue(decl, dog("Max"), ctx);
    operation->tasks().drain();
    pending->reject("timeout talking to kennel");

    EXPECT_EQ(a->error(), "timeout talking to kennel");
}

// ═══════════════════════════════════════════
//  Registry and resolver adapter
// ═══════════════════════════════════════════

TEST(LoaderRegistryTest, DefineInstallsAdapterOnce) {
    Schema schema("type Human { name: String } type Dog { name: String owner: Human } type Query { dogs: [Dog] }");
    LoaderRegistry registry;
    EchoLoader loader;
    auto decl = loader.declare();

    Loaders loaders = {{"Dog", {{"owner", LoaderSpec(decl->batch)}}}};
    registry.define(schema, loaders);
    registry.define(schema, loaders);

    EXPECT_EQ(registry.size(), 1u);
    ASSERT_NE(registry.find("Dog", "owner"), nullptr);
    EXPECT_TRUE(registry.find("Dog", "owner")->options.cache);
    EXPECT_NE(schema.snapshot()->findResolver("Dog", "owner"), nullptr);
    EXPECT_EQ(registry.find("Dog", "walker"), nullptr);
}

TEST(LoaderRegistryTest, UnknownTypeOrFieldRejected) {
    Schema schema("type Dog { name: String }");
    LoaderRegistry registry;
    EchoLoader loader;
    auto batch = loader.declare()->batch;

    try {
        registry.define(schema, Loaders{{"Cat", {{"owner", LoaderSpec(batch)}}}});
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_STREQ(e.what(), "Cannot find type Cat");
    }
    EXPECT_THROW(registry.define(schema, "Dog", "owner", batch), SchemaError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(LoaderAdapterTest, WithoutOperationFailsTheField) {
    EchoLoader loader;
    auto resolver = makeLoaderResolver(loader.declare());
    Context ctx;

    try {
        resolver(JsonValue(nlohmann::json{{"name", "Max"}}), JsonValue(), ctx);
        FAIL() << "expected FieldError";
    } catch (const FieldError& e) {
        EXPECT_STREQ(e.what(), kLoadersRequireReply);
    }
    EXPECT_EQ(loader.calls, 0);
}

TEST(LoaderAdapterTest, WithOperationEnqueues) {
    EchoLoader loader;
    auto resolver = makeLoaderResolver(loader.declare());
    Context ctx;
    ctx.operation = std::make_shared<OperationContext>();

    auto value = resolver(JsonValue(nlohmann::json{{"name", "Max"}}), JsonValue(), ctx);
    ASSERT_TRUE(value.isDeferred());
    ctx.operation->tasks().drain();

    EXPECT_EQ(value.deferred()->value(), "Max's owner");
    EXPECT_EQ(loader.seen[0][0].params.raw(), nlohmann::json::object());
}
