#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/RequestIdGenerator.hpp"

#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace snmpwire::infra;

TEST_CASE("RequestIdGenerator values", "[RequestIdGenerator]") {
    SECTION("Ids are never negative") {
        RequestIdGenerator ids;
        for (int i = 0; i < 10000; ++i) {
            REQUIRE(ids.next() >= 0);
        }
    }

    SECTION("Fixed seeds are reproducible") {
        RequestIdGenerator a(42);
        RequestIdGenerator b(42);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(a.next() == b.next());
        }
    }

    SECTION("Ids are spread over the whole range") {
        RequestIdGenerator ids(1);
        std::set<int32_t> seen;
        bool large = false;
        for (int i = 0; i < 1000; ++i) {
            auto id = ids.next();
            seen.insert(id);
            large = large || id > (1 << 30);
        }
        REQUIRE(seen.size() > 990);
        REQUIRE(large);
    }

    SECTION("Process-wide instance") {
        REQUIRE(&RequestIdGenerator::instance() == &RequestIdGenerator::instance());
        REQUIRE(RequestIdGenerator::instance().next() >= 0);
    }
}

TEST_CASE("RequestIdGenerator concurrent use", "[RequestIdGenerator]") {
    RequestIdGenerator ids;
    std::mutex mutex;
    std::vector<int32_t> all;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            std::vector<int32_t> local;
            for (int i = 0; i < 1000; ++i) {
                local.push_back(ids.next());
            }
            std::lock_guard<std::mutex> lock(mutex);
            all.insert(all.end(), local.begin(), local.end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(all.size() == 4000);
    std::set<int32_t> unique(all.begin(), all.end());
    REQUIRE(unique.size() > 3990);
    for (auto id : all) {
        REQUIRE(id >= 0);
    }
}
