// ZKCOMPLY - Thread Pool Tests
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include <gtest/gtest.h>

#include "zkcomply/util/threadpool.h"

#include <atomic>
#include <stdexcept>
#include <vector>

namespace zkcomply {
namespace util {
namespace test {

TEST(ThreadPoolTest, RunsTasksAndReturnsResults) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.ThreadCount(), 4u);
    
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.Submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(2);
    auto f = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
    
    // The worker survives
    auto g = pool.Submit([]() { return 7; });
    EXPECT_EQ(g.get(), 7);
}

TEST(ThreadPoolTest, WaitDrainsQueue) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};
    for (int i = 0; i < 50; ++i) {
        pool.Submit([&counter]() { counter.fetch_add(1); });
    }
    pool.Wait();
    EXPECT_EQ(counter.load(), 50);
    EXPECT_EQ(pool.PendingTasks(), 0u);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.Shutdown();
    EXPECT_FALSE(pool.IsRunning());
    EXPECT_THROW(pool.Submit([]() { return 1; }), std::runtime_error);
}

TEST(ThreadPoolTest, ArgumentsAreForwarded) {
    ThreadPool pool(1);
    auto f = pool.Submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(f.get(), 5);
}

} // namespace test
} // namespace util
} // namespace zkcomply
