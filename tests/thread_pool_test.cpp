#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include "infra/thread_pool/thread_pool.hpp"

using rmirror::infra::ThreadPool;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsAllTasksAndReturnsValues)
{
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.enqueue_with_future([](int x) { return x * x; }, i));
    }
    pool.wait();
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, NeverExceedsWorkerCount)
{
    constexpr std::size_t kWorkers = 3;
    ThreadPool pool(kWorkers);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 12; ++i) {
        pool.enqueue([&] {
            const int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(10ms);
            --active;
        });
    }
    pool.wait();

    EXPECT_LE(peak.load(), static_cast<int>(kWorkers));
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(pool.size(), kWorkers);
}

TEST(ThreadPoolTest, ExceptionStaysInFuture)
{
    ThreadPool pool(2);
    auto bad = pool.enqueue_with_future([]() -> int { throw std::runtime_error("boom"); });
    auto good = pool.enqueue_with_future([] { return 7; });
    pool.wait();

    EXPECT_THROW(bad.get(), std::runtime_error);
    EXPECT_EQ(good.get(), 7);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne)
{
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    auto f = pool.enqueue_with_future([] { return 1; });
    EXPECT_EQ(f.get(), 1);
}
