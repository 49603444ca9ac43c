#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include "utils/worker_pool.hpp"

namespace codebox::utils {
namespace {

TEST(WorkerPoolTest, RunsSubmittedTasks) {
    WorkerPool pool(2, 8);
    std::atomic<int> counter{0};
    std::promise<void> done;
    auto finished = done.get_future();
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(pool.TrySubmit([&counter, &done] {
            if (++counter == 4) {
                done.set_value();
            }
        }));
    }
    ASSERT_EQ(finished.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(counter.load(), 4);
}

TEST(WorkerPoolTest, RefusesWorkBeyondPendingLimit) {
    WorkerPool pool(1, 1);
    std::promise<void> release;
    auto gate = release.get_future().share();
    std::promise<void> started;

    ASSERT_TRUE(pool.TrySubmit([gate, &started] {
        started.set_value();
        gate.wait();
    }));
    started.get_future().wait();

    EXPECT_TRUE(pool.TrySubmit([] {}));
    EXPECT_EQ(pool.Pending(), 1u);
    EXPECT_FALSE(pool.TrySubmit([] {}));

    release.set_value();
}

TEST(WorkerPoolTest, DrainsQueueOnStopAndRefusesAfterwards) {
    WorkerPool pool(1, 16);
    std::atomic<int> counter{0};
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(pool.TrySubmit([&counter] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++counter;
        }));
    }
    pool.Stop();
    EXPECT_EQ(counter.load(), 5);
    EXPECT_FALSE(pool.TrySubmit([] {}));
}

TEST(WorkerPoolTest, SurvivesThrowingTask) {
    WorkerPool pool(1, 4);
    std::promise<void> done;
    auto finished = done.get_future();
    ASSERT_TRUE(pool.TrySubmit([] { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(pool.TrySubmit([&done] { done.set_value(); }));
    EXPECT_EQ(finished.wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST(WorkerPoolTest, ZeroThreadsStillGetsOneWorker) {
    WorkerPool pool(0, 1);
    EXPECT_EQ(pool.ThreadCount(), 1u);
}

}  // namespace
}  // namespace codebox::utils
