#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <latch>
#include "infra/thread_pool/thread_pool.hpp"

using fdup::infra::ThreadPool;

TEST(ThreadPoolTest, RunsEveryTask)
{
    std::atomic<int> counter{0};
    {
        ThreadPool pool{4};
        EXPECT_EQ(pool.size(), 4u);
        for (int i = 0; i < 1000; ++i) {
            pool.enqueue([&counter] { counter.fetch_add(1); });
        }
        pool.wait();
        EXPECT_EQ(counter.load(), 1000);
    }
}

TEST(ThreadPoolTest, FutureCarriesResult)
{
    ThreadPool pool{2};
    auto f = pool.enqueue_with_future([](int a, int b) { return a * b; }, 6, 7);
    EXPECT_EQ(f.get(), 42);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne)
{
    ThreadPool pool{0};
    EXPECT_EQ(pool.size(), 1u);
}

TEST(ThreadPoolTest, CancelPendingDropsQueuedTasks)
{
    ThreadPool pool{1};
    std::latch started{1};
    std::atomic<bool> release{false};
    std::atomic<int> ran{0};

    pool.enqueue([&] {
        started.count_down();
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        ran.fetch_add(1);
    });
    started.wait();

    for (int i = 0; i < 10; ++i) {
        pool.enqueue([&ran] { ran.fetch_add(1); });
    }

    EXPECT_EQ(pool.cancel_pending(), 10u);
    release.store(true);
    pool.wait();
    EXPECT_EQ(ran.load(), 1);
}

TEST(ThreadPoolTest, DestructorDrainsQueue)
{
    std::atomic<int> counter{0};
    {
        ThreadPool pool{2};
        for (int i = 0; i < 100; ++i) {
            pool.enqueue([&counter] { counter.fetch_add(1); });
        }
    }
    EXPECT_EQ(counter.load(), 100);
}
