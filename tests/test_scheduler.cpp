// ═══════════════════════════════════════════════════════════════════
//  test_scheduler.cpp — Tests for the task queue and deferred cells
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <batchql/deferred.h>
#include <batchql/scheduler.h>
#include <chrono>
#include <thread>
#include <vector>

using namespace batchql::scheduler;
using batchql::graphql::Deferred;
using batchql::graphql::FieldValue;

// ═══════════════════════════════════════════
//  TaskQueue
// ═══════════════════════════════════════════

TEST(TaskQueueTest, DeferDoesNotRunImmediately) {
    TaskQueue tasks;
    bool ran = false;
    tasks.defer([&] { ran = true; });

    EXPECT_FALSE(ran);
    EXPECT_EQ(tasks.pending(), 1u);
}

TEST(TaskQueueTest, DrainRunsTasksInOrder) {
    TaskQueue tasks;
    std::vector<int> order;
    tasks.defer([&] { order.push_back(1); });
    tasks.defer([&] { order.push_back(2); });
    tasks.defer([&] { order.push_back(3); });

    EXPECT_EQ(tasks.drain(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(tasks.pending(), 0u);
}

TEST(TaskQueueTest, DrainRunsTasksQueuedWhileDraining) {
    TaskQueue tasks;
    std::vector<int> order;
    tasks.defer([&] {
        order.push_back(1);
        tasks.defer([&] { order.push_back(3); });
    });
    tasks.defer([&] { order.push_back(2); });

    EXPECT_EQ(tasks.drain(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(TaskQueueTest, RunUntilWaitsForPostedTask) {
    TaskQueue tasks;
    bool done = false;

    std::thread worker([&tasks, &done] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        tasks.post([&done] { done = true; });
    });

    bool ok = tasks.runUntil([&done] { return done; }, std::chrono::seconds(5));
    worker.join();

    EXPECT_TRUE(ok);
    EXPECT_TRUE(done);
}

TEST(TaskQueueTest, RunUntilTimesOut) {
    TaskQueue tasks;
    auto start = std::chrono::steady_clock::now();

    bool ok = tasks.runUntil([] { return false; }, std::chrono::milliseconds(50));

    EXPECT_FALSE(ok);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST(TaskQueueTest, RunUntilReturnsAtOnceWhenDone) {
    TaskQueue tasks;
    EXPECT_TRUE(tasks.runUntil([] { return true; }, std::chrono::milliseconds(0)));
}

// ═══════════════════════════════════════════
//  Deferred
// ═══════════════════════════════════════════

TEST(DeferredTest, SettlesOnlyOnce) {
    Deferred d;
    EXPECT_FALSE(d.settled());

    EXPECT_TRUE(d.resolve(42));
    EXPECT_FALSE(d.resolve(7));
    EXPECT_FALSE(d.reject("late"));

    EXPECT_TRUE(d.fulfilled());
    EXPECT_EQ(d.value(), 42);
}

TEST(DeferredTest, CallbacksRunOnSettle) {
    Deferred d;
    std::vector<std::string> seen;
    d.then([&](const Deferred& r) { seen.push_back("a:" + r.error()); });
    d.then([&](const Deferred& r) { seen.push_back("b:" + r.error()); });

    EXPECT_TRUE(seen.empty());
    d.reject("boom");

    EXPECT_TRUE(d.rejected());
    EXPECT_EQ(seen, (std::vector<std::string>{"a:boom", "b:boom"}));
}

TEST(DeferredTest, ThenOnSettledRunsImmediately) {
    auto d = Deferred::resolved("x");
    bool ran = false;
    d->then([&](const Deferred& r) { ran = r.value() == "x"; });
    EXPECT_TRUE(ran);
}

TEST(DeferredTest, FieldValueWrapsEitherForm) {
    FieldValue now(nlohmann::json{{"name", "Max"}});
    EXPECT_FALSE(now.isDeferred());
    EXPECT_TRUE(now.toDeferred()->fulfilled());
    EXPECT_EQ(now.toDeferred()->value()["name"], "Max");

    auto cell = std::make_shared<Deferred>();
    FieldValue later(cell);
    EXPECT_TRUE(later.isDeferred());
    EXPECT_EQ(later.toDeferred(), cell);
}
