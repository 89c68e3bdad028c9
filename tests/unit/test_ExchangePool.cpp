#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ExchangePool.hpp"

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace snmpwire::infra;

TEST_CASE("ExchangePool", "[ExchangePool]") {
    SECTION("Worker count is at least one") {
        REQUIRE(ExchangePool(0).workerCount() == 1);
        REQUIRE(ExchangePool(3).workerCount() == 3);
    }

    SECTION("Runs submitted work and reports results") {
        ExchangePool pool(2);
        pool.start();
        REQUIRE(pool.isRunning());

        auto answer = pool.submit([]() { return 42; });
        REQUIRE(answer.get() == 42);

        pool.shutdown();
        REQUIRE_FALSE(pool.isRunning());
    }

    SECTION("Exceptions surface through the future") {
        ExchangePool pool(1);
        pool.start();

        auto failed = pool.submit([]() -> int { throw std::runtime_error("no route"); });
        REQUIRE_THROWS_AS(failed.get(), std::runtime_error);
    }

    SECTION("Shutdown finishes queued work") {
        ExchangePool pool(1);
        pool.start();

        std::vector<std::future<int>> results;
        for (int i = 0; i < 5; ++i) {
            results.push_back(pool.submit([i]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                return i;
            }));
        }
        pool.shutdown();

        REQUIRE(pool.pending() == 0);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(results[i].wait_for(std::chrono::seconds(0)) == std::future_status::ready);
            REQUIRE(results[i].get() == i);
        }
    }

    SECTION("Work queued before start runs after start") {
        ExchangePool pool(1);
        auto early = pool.submit([]() { return 7; });
        REQUIRE(pool.pending() == 1);

        pool.start();
        REQUIRE(early.get() == 7);
    }

    SECTION("Can be restarted") {
        ExchangePool pool(2);
        pool.start();
        REQUIRE(pool.submit([]() { return 1; }).get() == 1);
        pool.shutdown();

        pool.start();
        REQUIRE(pool.submit([]() { return 2; }).get() == 2);
    }
}
