#include "cotel/coro/latch.hpp"
#include "cotel/coro/sync_wait.hpp"
#include "cotel/coro/task.hpp"
#include "cotel/coro/thread_pool.hpp"
#include "cotel/coro/when_all.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <vector>

using namespace cotel;

class Latch : public ::testing::Test
{};

TEST_F(Latch, ZeroCountNeverSuspends)
{
    coro::Latch l{0};

    auto make_task = [&]() -> coro::Task<uint64_t> {
        co_await l;
        co_return 42;
    };

    auto task = make_task();
    task.resume();

    EXPECT_TRUE(l.is_ready());
    EXPECT_TRUE(task.is_ready());
    EXPECT_EQ(task.promise().result(), 42);
}

TEST_F(Latch, OverCountDownReleases)
{
    coro::Latch l{1};

    auto make_task = [&]() -> coro::Task<uint64_t> {
        auto workers = l.remaining();
        co_await l;
        co_return workers;
    };

    auto task = make_task();
    task.resume();
    EXPECT_FALSE(task.is_ready());

    l.count_down(5);
    EXPECT_TRUE(task.is_ready());
    EXPECT_EQ(task.promise().result(), 1);
}

TEST_F(Latch, CountDownOneAtATime)
{
    coro::Latch l{5};

    auto make_task = [&]() -> coro::Task<uint64_t> {
        auto workers = l.remaining();
        co_await l;
        co_return workers;
    };

    auto task = make_task();
    task.resume();

    for (int i = 0; i < 4; ++i)
    {
        l.count_down();
        EXPECT_FALSE(task.is_ready());
    }

    EXPECT_EQ(l.remaining(), 1U);
    l.count_down();
    EXPECT_TRUE(task.is_ready());
    EXPECT_EQ(task.promise().result(), 5);
}

TEST_F(Latch, WorkersOnThreadPool)
{
    constexpr std::size_t kWorkers = 16;

    coro::ThreadPool tp{coro::ThreadPool::Options{.thread_count = 4}};
    coro::Latch l{kWorkers};
    std::atomic<std::size_t> completed{0};

    auto worker = [&]() -> coro::Task<void> {
        co_await tp.schedule();
        completed++;
        l.count_down(tp);
    };

    auto waiter = [&]() -> coro::Task<std::size_t> {
        co_await l;
        co_return completed.load();
    };

    auto run = [&]() -> coro::Task<std::size_t> {
        std::vector<coro::Task<void>> workers;
        for (std::size_t i = 0; i < kWorkers; ++i)
        {
            workers.push_back(worker());
        }
        co_await coro::when_all(std::move(workers));
        co_return co_await waiter();
    };

    EXPECT_EQ(coro::sync_wait(run()), kWorkers);
    EXPECT_TRUE(l.is_ready());
}
