#include <paneltree/task/WorkerPool.hpp>

#include <doctest/doctest.h>

#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace PT;

TEST_SUITE("task.workerpool") {
TEST_CASE("join runs both sides") {
    WorkerPool pool(2);
    std::atomic<int> left{0};
    std::atomic<int> right{0};
    pool.join([&] { left = 1; }, [&] { right = 2; });
    CHECK(left == 1);
    CHECK(right == 2);
}

TEST_CASE("nested joins complete with a single worker") {
    WorkerPool pool(1);
    std::atomic<int> leaves{0};

    std::function<void(int)> recurse = [&](int depth) {
        if (depth == 0) {
            ++leaves;
            return;
        }
        pool.join([&] { recurse(depth - 1); }, [&] { recurse(depth - 1); });
    };
    recurse(6);
    CHECK(leaves == 64);
}

TEST_CASE("exceptions are rethrown after both sides finish") {
    WorkerPool pool(2);
    std::atomic<bool> otherRan{false};

    CHECK_THROWS_AS(pool.join([] { throw std::runtime_error("left"); }, [&] { otherRan = true; }),
                    std::runtime_error);
    CHECK(otherRan);

    otherRan = false;
    CHECK_THROWS_WITH(pool.join([&] { otherRan = true; }, [] { throw std::runtime_error("right"); }), "right");
    CHECK(otherRan);
}

TEST_CASE("left exception wins when both sides throw") {
    WorkerPool pool(2);
    CHECK_THROWS_WITH(pool.join([] { throw std::runtime_error("a"); }, [] { throw std::runtime_error("b"); }), "a");
}

TEST_CASE("for_range visits every index once") {
    WorkerPool pool(4);
    std::vector<std::atomic<int>> hits(257);
    pool.for_range(0, hits.size(), [&](std::size_t i) { ++hits[i]; }, 3);
    for (auto& hit : hits) {
        CHECK(hit == 1);
    }
}

TEST_CASE("fold_range keeps order for non commutative reduce") {
    WorkerPool pool(4);
    auto const joined = pool.fold_range<std::string>(
        0,
        20,
        [] { return std::string{}; },
        [](std::string acc, std::size_t i) { return acc + static_cast<char>('a' + i); },
        [](std::string left, std::string right) { return left + right; },
        2);
    CHECK(joined == "abcdefghijklmnopqrst");
}

TEST_CASE("shutdown makes join run inline") {
    WorkerPool pool(2);
    pool.shutdown();
    CHECK(pool.size() == 0);
    int order = 0;
    int a     = 0;
    int b     = 0;
    pool.join([&] { a = ++order; }, [&] { b = ++order; });
    CHECK(a == 1);
    CHECK(b == 2);
}

TEST_CASE("Instance is a process wide pool") {
    auto& first  = WorkerPool::Instance();
    auto& second = WorkerPool::Instance();
    CHECK(&first == &second);
    CHECK(first.size() > 0);
}
}
