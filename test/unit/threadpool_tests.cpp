// Copyright (c) 2024 LunaChain
// Tests for the signature-check worker pool

#include "util/threadpool.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <functional>
#include <vector>

using namespace lunachain::util;

TEST_CASE("ThreadPool - enqueue", "[threadpool]") {
    SECTION("Returns results through futures") {
        ThreadPool pool(2);
        REQUIRE(pool.size() == 2);

        auto a = pool.enqueue([]() { return 42; });
        auto b = pool.enqueue([x = 6, y = 7]() { return x * y; });
        REQUIRE(a.get() == 42);
        REQUIRE(b.get() == 42);
    }

    SECTION("Zero threads uses hardware concurrency") {
        ThreadPool pool(0);
        REQUIRE(pool.size() >= 1);
    }

    SECTION("Destructor drains the queue") {
        std::atomic<int> done{0};
        {
            ThreadPool pool(1);
            for (int i = 0; i < 50; ++i) {
                (void)pool.enqueue([&done]() {
                    std::this_thread::sleep_for(std::chrono::microseconds(50));
                    done.fetch_add(1);
                });
            }
        }
        REQUIRE(done.load() == 50);
    }
}

TEST_CASE("ThreadPool - RunChecks", "[threadpool]") {
    ThreadPool pool(4);

    SECTION("All checks pass") {
        std::vector<std::function<bool()>> checks(100, []() { return true; });
        REQUIRE_FALSE(pool.RunChecks(checks).has_value());
    }

    SECTION("Empty batch passes") {
        REQUIRE_FALSE(pool.RunChecks({}).has_value());
    }

    SECTION("Lowest failing index is reported") {
        std::vector<std::function<bool()>> checks;
        for (size_t i = 0; i < 64; ++i) {
            checks.emplace_back([i]() { return i != 17 && i != 40; });
        }
        auto failed = pool.RunChecks(checks);
        REQUIRE(failed.has_value());
        REQUIRE(*failed == 17);
    }

    SECTION("Every check runs even after a failure") {
        std::atomic<int> ran{0};
        std::vector<std::function<bool()>> checks;
        for (int i = 0; i < 32; ++i) {
            checks.emplace_back([&ran, i]() {
                ran.fetch_add(1);
                return i != 0;
            });
        }
        REQUIRE(pool.RunChecks(checks) == std::optional<size_t>(0));
        REQUIRE(ran.load() == 32);
    }
}
