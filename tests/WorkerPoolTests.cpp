// tests/WorkerPoolTests.cpp
#include <doctest/doctest.h>

#include <Kiln/Errors.hpp>
#include <Kiln/Utils/WorkerPool.hpp>

#include <atomic>
#include <chrono>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Kiln::Utils;
using namespace std::chrono_literals;

TEST_CASE("submit returns the task result") {
    WorkerPool pool(2);
    CHECK(pool.threadCount() == 2);
    auto future = pool.submit([]() { return 6 * 7; });
    CHECK(future.get() == 42);

    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    CHECK_THROWS_AS(failing.get(), std::runtime_error);
}

TEST_CASE("default pool has at least four threads") {
    WorkerPool pool;
    CHECK(pool.threadCount() >= 4);
}

TEST_CASE("parallelForEach visits every item within the bound") {
    WorkerPool pool(4);
    std::vector<int> items(100);
    std::iota(items.begin(), items.end(), 1);

    std::atomic<int> sum{0};
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};
    pool.parallelForEach(items, 3, [&](int value) {
        int now = ++inside;
        int previous = peak.load();
        while (now > previous && !peak.compare_exchange_weak(previous, now)) {
        }
        sum += value;
        std::this_thread::sleep_for(1ms);
        --inside;
    });

    CHECK(sum.load() == 5050);
    CHECK(peak.load() <= 3);
}

TEST_CASE("parallelForEach rethrows the first failure") {
    WorkerPool pool(4);
    std::vector<int> items(50);
    std::iota(items.begin(), items.end(), 0);
    std::atomic<int> processed{0};

    CHECK_THROWS_WITH_AS(pool.parallelForEach(items, 4, [&](int value) {
        if (value == 5)
            throw std::runtime_error("item 5 failed");
        ++processed;
        std::this_thread::sleep_for(1ms);
    }), "item 5 failed", std::runtime_error);
    CHECK(processed.load() < 50);
}

TEST_CASE("parallelForEach stops on cancellation") {
    WorkerPool pool(2);
    std::vector<int> items(1000, 1);
    CancellationSource source;
    std::atomic<int> processed{0};

    CHECK_THROWS_AS(pool.parallelForEach(items, 2, [&](int) {
        if (++processed == 10)
            source.cancel();
    }, source.token()), Kiln::OperationCancelledError);
    CHECK(processed.load() < 1000);
}

TEST_CASE("nested parallelForEach on a single thread pool completes") {
    WorkerPool pool(1);
    std::vector<int> outer{1, 2, 3};
    std::vector<int> inner{1, 2, 3, 4};
    std::atomic<int> count{0};

    auto future = pool.submit([&]() {
        pool.parallelForEach(outer, 4, [&](int) {
            pool.parallelForEach(inner, 4, [&](int) { ++count; });
        });
    });
    REQUIRE(future.wait_for(10s) == std::future_status::ready);
    future.get();
    CHECK(count.load() == 12);
}
