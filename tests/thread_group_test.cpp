#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include "utils/thread_group.hpp"

namespace codebox::utils {
namespace {

bool WaitForSize(ThreadGroup& group, std::size_t expected) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (group.Size() == expected) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

TEST(ThreadGroupTest, RefusesTasksBeyondLimitUntilOneFinishes) {
    ThreadGroup group(2);
    std::promise<void> release;
    auto gate = release.get_future().share();

    ASSERT_TRUE(group.TryLaunch([gate] { gate.wait(); }));
    ASSERT_TRUE(group.TryLaunch([gate] { gate.wait(); }));
    EXPECT_FALSE(group.TryLaunch([] {}));
    EXPECT_EQ(group.Size(), 2u);

    release.set_value();
    ASSERT_TRUE(WaitForSize(group, 0));
    EXPECT_TRUE(group.TryLaunch([] {}));
}

TEST(ThreadGroupTest, FinishedThreadsAreReapedWithoutJoinAll) {
    ThreadGroup group(4);
    std::atomic<int> ran{0};
    for (int round = 0; round < 50; ++round) {
        ASSERT_TRUE(WaitForSize(group, 0));
        ASSERT_TRUE(group.TryLaunch([&ran] { ++ran; }));
    }
    ASSERT_TRUE(WaitForSize(group, 0));
    EXPECT_EQ(ran.load(), 50);
}

TEST(ThreadGroupTest, JoinAllWaitsForRunningTasks) {
    std::atomic<int> ran{0};
    {
        ThreadGroup group(3);
        for (int i = 0; i < 3; ++i) {
            ASSERT_TRUE(group.TryLaunch([&ran] {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                ++ran;
            }));
        }
        group.JoinAll();
        EXPECT_EQ(ran.load(), 3);
        EXPECT_EQ(group.Size(), 0u);
    }
    EXPECT_EQ(ran.load(), 3);
}

TEST(ThreadGroupTest, ThrowingTaskStillFreesItsPlace) {
    ThreadGroup group(1);
    ASSERT_TRUE(group.TryLaunch([] { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(WaitForSize(group, 0));
    EXPECT_TRUE(group.TryLaunch([] {}));
}

}  // namespace
}  // namespace codebox::utils
