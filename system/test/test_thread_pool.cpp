// ============= test/test_thread_pool.cpp =============
#include "database/thread_pool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

TEST(ThreadPool, ReturnsResultsThroughFutures) {
    ThreadPool pool(2);
    auto sum = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(sum.get(), 5);
}

TEST(ThreadPool, ExceptionsSurfaceFromGet) {
    ThreadPool pool(1);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    // Worker survives the failed task
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(ThreadPool, WaitAllDrainsQueue) {
    ThreadPool pool(3);
    std::atomic<int> done{0};
    for (int i = 0; i < 100; ++i) {
        pool.submit([&done] { done++; });
    }
    pool.wait_all();
    EXPECT_EQ(done.load(), 100);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST(ThreadPool, SubmitAfterStopThrows) {
    ThreadPool pool(1);
    pool.stop();
    EXPECT_THROW(pool.submit([] { return 1; }), std::runtime_error);
    EXPECT_EQ(pool.active_threads(), 0u);
}
