#include <catch2/catch.hpp>
#include "util/threadpool.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>

using namespace offsync::util;

TEST_CASE("ThreadPool - basic execution", "[util][threadpool]") {
    SECTION("enqueue returns result") {
        ThreadPool pool(2, "test");
        auto future = pool.enqueue([] { return 42; });
        REQUIRE(future.get() == 42);
    }

    SECTION("enqueue with arguments") {
        ThreadPool pool(1, "test");
        auto future = pool.enqueue([](int a, int b) { return a + b; }, 2, 3);
        REQUIRE(future.get() == 5);
    }

    SECTION("zero threads uses hardware concurrency") {
        ThreadPool pool(0, "test");
        REQUIRE(pool.size() >= 1);
    }
}

TEST_CASE("ThreadPool - single worker runs tasks in order", "[util][threadpool]") {
    ThreadPool pool(1, "sync");
    std::mutex mutex;
    std::vector<int> order;

    for (int i = 0; i < 20; ++i) {
        REQUIRE(pool.try_post([&, i] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        }));
    }

    pool.shutdown();
    pool.wait_for_completion();

    REQUIRE(order.size() == 20);
    for (int i = 0; i < 20; ++i) {
        REQUIRE(order[i] == i);
    }
    REQUIRE(pool.tasks_completed() == 20);
}

TEST_CASE("ThreadPool - exceptions do not kill the worker", "[util][threadpool]") {
    ThreadPool pool(1, "test");
    std::atomic<bool> ran{false};

    REQUIRE(pool.try_post([] { throw std::runtime_error("boom"); }));
    REQUIRE(pool.try_post([&] { ran = true; }));

    pool.shutdown();
    pool.wait_for_completion();

    REQUIRE(ran);
    REQUIRE(pool.task_exceptions() == 1);
}

TEST_CASE("ThreadPool - enqueue propagates exception through future", "[util][threadpool]") {
    ThreadPool pool(1, "test");
    auto future = pool.enqueue([]() -> int { throw std::runtime_error("fail"); });
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
}

TEST_CASE("ThreadPool - shutdown rejects new work", "[util][threadpool]") {
    ThreadPool pool(1, "test");
    pool.shutdown();
    REQUIRE(pool.is_stopped());
    REQUIRE_FALSE(pool.try_post([] {}));
    REQUIRE_THROWS_AS(pool.enqueue([] { return 1; }), std::runtime_error);
    pool.wait_for_completion();
}

TEST_CASE("ThreadPool - bounded queue", "[util][threadpool]") {
    ThreadPool pool(1, "test", 1);
    std::atomic<bool> release{false};
    std::atomic<bool> started{false};

    REQUIRE(pool.try_post([&] {
        started = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }));

    // Wait until the worker picked up the blocking task
    for (int i = 0; i < 1000 && !started; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE(started);

    REQUIRE(pool.try_post([] {}));        // fills the queue
    REQUIRE_FALSE(pool.try_post([] {}));  // over capacity
    REQUIRE(pool.pending_tasks() == 1);

    release = true;
    pool.shutdown();
    pool.wait_for_completion();
}
