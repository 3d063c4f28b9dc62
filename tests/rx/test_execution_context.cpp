/// @file test_execution_context.cpp
/// @brief Tests for execution contexts

#include <catch2/catch.hpp>
#include <bindery/rx/execution_context.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace bindery_rx;

TEST_CASE("InlineExecutionContext: runs immediately", "[rx][context]") {
    InlineExecutionContext context;
    int ran = 0;
    context.post([&ran]() { ++ran; });
    REQUIRE(ran == 1);
}

TEST_CASE("QueuedExecutionContext: FIFO", "[rx][context]") {
    QueuedExecutionContext context;
    std::vector<int> order;

    context.post([&order]() { order.push_back(1); });
    context.post([&order]() { order.push_back(2); });
    context.post([&order]() { order.push_back(3); });
    REQUIRE(context.pending_count() == 3);

    SECTION("run_pending drains in posting order") {
        REQUIRE(context.run_pending() == 3);
        REQUIRE(order == std::vector<int>{1, 2, 3});
        REQUIRE_FALSE(context.has_pending());
        REQUIRE(context.owner_thread() == std::this_thread::get_id());
    }

    SECTION("run_pending respects the item bound") {
        REQUIRE(context.run_pending(2) == 2);
        REQUIRE(order == std::vector<int>{1, 2});
        REQUIRE(context.run_one());
        REQUIRE_FALSE(context.run_one());
    }

    SECTION("clear drops work") {
        context.clear();
        REQUIRE(context.run_pending() == 0);
        REQUIRE(order.empty());
    }
}

TEST_CASE("QueuedExecutionContext: work posted while draining", "[rx][context]") {
    QueuedExecutionContext context;
    std::vector<int> order;

    context.post([&context, &order]() {
        order.push_back(1);
        context.post([&order]() { order.push_back(2); });
    });

    REQUIRE(context.run_pending() == 2);
    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("QueuedExecutionContext: concurrent posting", "[rx][context]") {
    QueuedExecutionContext context;
    std::atomic<int> ran{0};

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&context, &ran]() {
            for (int i = 0; i < 250; ++i) {
                context.post([&ran]() { ran.fetch_add(1); });
            }
        });
    }
    for (auto& producer : producers) producer.join();

    REQUIRE(context.run_pending() == 1000);
    REQUIRE(ran.load() == 1000);
}

TEST_CASE("ExecutionContext: current nomination", "[rx][context]") {
    REQUIRE(ExecutionContext::current() == nullptr);

    auto outer = std::make_shared<QueuedExecutionContext>();
    {
        ScopedExecutionContext scope(outer);
        REQUIRE(ExecutionContext::current() == outer);

        auto inner = std::make_shared<InlineExecutionContext>();
        {
            ScopedExecutionContext nested(inner);
            REQUIRE(ExecutionContext::current() == inner);
        }
        REQUIRE(ExecutionContext::current() == outer);

        ExecutionContextPtr seen_elsewhere = outer;
        std::thread other([&seen_elsewhere]() { seen_elsewhere = ExecutionContext::current(); });
        other.join();
        REQUIRE(seen_elsewhere == nullptr);
    }
    REQUIRE(ExecutionContext::current() == nullptr);
}
