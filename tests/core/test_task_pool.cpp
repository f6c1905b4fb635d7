// relic_core TaskPool and CancellationToken tests

#include <catch2/catch.hpp>
#include <relic/core/task_pool.hpp>
#include <atomic>
#include <vector>

using namespace relic_core;

TEST_CASE("CancellationToken: copies share state", "[core][task_pool]") {
    CancellationToken token;
    CancellationToken copy = token;

    REQUIRE_FALSE(token.is_cancelled());
    copy.cancel();
    REQUIRE(token.is_cancelled());
    REQUIRE(copy.is_cancelled());

    CancellationToken fresh;
    REQUIRE_FALSE(fresh.is_cancelled());
}

TEST_CASE("TaskPool: inline mode runs on run_pending", "[core][task_pool]") {
    TaskPool pool(0);
    REQUIRE(pool.thread_count() == 0);

    std::vector<int> order;
    pool.submit([&order] { order.push_back(1); });
    pool.submit([&order] { order.push_back(2); });

    REQUIRE(order.empty());
    REQUIRE(pool.pending_count() == 2);

    REQUIRE(pool.run_pending() == 2);
    REQUIRE(order == std::vector<int>{1, 2});
    REQUIRE(pool.pending_count() == 0);
}

TEST_CASE("TaskPool: inline wait_all runs follow-up tasks", "[core][task_pool]") {
    TaskPool pool(0);
    int runs = 0;

    pool.submit([&pool, &runs] {
        ++runs;
        pool.submit([&runs] { ++runs; });
    });

    pool.wait_all();
    REQUIRE(runs == 2);
    REQUIRE(pool.pending_count() == 0);
}

TEST_CASE("TaskPool: worker threads", "[core][task_pool]") {
    TaskPool pool(4);
    REQUIRE(pool.thread_count() == 4);

    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        pool.submit([&counter] { counter.fetch_add(1); });
    }

    pool.wait_all();
    REQUIRE(counter.load() == 100);
    REQUIRE(pool.pending_count() == 0);
}

TEST_CASE("TaskPool: submit_with_result", "[core][task_pool]") {
    SECTION("value") {
        TaskPool pool(2);
        auto future = pool.submit_with_result([] { return 6 * 7; });
        REQUIRE(future.get() == 42);
    }

    SECTION("exception is forwarded") {
        TaskPool pool(0);
        auto future = pool.submit_with_result([]() -> int { throw std::runtime_error("boom"); });
        pool.run_pending();
        REQUIRE_THROWS_AS(future.get(), std::runtime_error);
    }
}

TEST_CASE("TaskPool: destructor drains inline queue", "[core][task_pool]") {
    int runs = 0;
    {
        TaskPool pool(0);
        pool.submit([&runs] { ++runs; });
    }
    REQUIRE(runs == 1);
}
