// =============================================================================
// Thread Pool Tests
// =============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <vector>

#include "shortkey/thread_pool.hpp"

using namespace shortkey;

class ThreadPoolTest : public ::testing::Test {};

TEST_F(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);
    auto f = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(f.get(), 5);
}

TEST_F(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.num_threads(), 1u);
}

TEST_F(ThreadPoolTest, ParallelForVisitsEveryIndexOnce) {
    ThreadPool pool(4);
    std::vector<std::atomic<int>> hits(10000);
    pool.parallel_for(0, hits.size(), [&](size_t i) { hits[i]++; });

    for (size_t i = 0; i < hits.size(); ++i) {
        ASSERT_EQ(hits[i].load(), 1) << "index " << i;
    }
}

TEST_F(ThreadPoolTest, ParallelForRethrowsAfterAllTasksRan) {
    ThreadPool pool(3);
    std::atomic<int> ran{0};
    EXPECT_THROW(pool.parallel_for(0, 50, [&](size_t i) {
                     ++ran;
                     if (i == 7) throw std::runtime_error("boom");
                 }),
                 std::runtime_error);
    EXPECT_EQ(ran.load(), 50);
}

TEST_F(ThreadPoolTest, DestructorDrainsQueue) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 100; ++i) {
            pool.submit([&done] { ++done; });
        }
    }
    EXPECT_EQ(done.load(), 100);
}
