/**
 * @file test_timed_call.cpp
 * @brief Unit tests for conduit::utils::run_with_timeout.
 */
#include "cdt_base.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <thread>

using conduit::utils::run_with_timeout;
using namespace std::chrono_literals;

TEST(TimedCallTest, CompletesWithinTimeout)
{
    std::atomic<int> calls{0};
    const auto outcome = run_with_timeout([&calls]() { ++calls; }, 1000ms);
    EXPECT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_TRUE(outcome.exception_msg.empty());
    EXPECT_EQ(calls.load(), 1);
}

TEST(TimedCallTest, EmptyCallbackCountsAsSuccess)
{
    const auto outcome = run_with_timeout({}, 10ms);
    EXPECT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.timed_out);
}

TEST(TimedCallTest, ExceptionIsReportedNotPropagated)
{
    const auto outcome =
        run_with_timeout([]() { throw std::runtime_error("detach refused"); }, 1000ms);
    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.exception_msg, "detach refused");
}

TEST(TimedCallTest, TimeoutDetachesTheCallback)
{
    // The flag outlives this test: the detached callback still holds it.
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto finished = std::make_shared<std::atomic<bool>>(false);

    const auto start = std::chrono::steady_clock::now();
    const auto outcome = run_with_timeout(
        [release, finished]()
        {
            while (!release->load())
            {
                std::this_thread::sleep_for(1ms);
            }
            finished->store(true);
        },
        50ms);
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_GE(waited, 50ms);
    EXPECT_LT(waited, 2s);
    EXPECT_FALSE(finished->load());

    release->store(true);
    for (int i = 0; i < 200 && !finished->load(); ++i)
    {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(finished->load());
}

TEST(TimedCallTest, ZeroTimeoutWaitsForCompletion)
{
    std::atomic<bool> done{false};
    const auto outcome = run_with_timeout(
        [&done]()
        {
            std::this_thread::sleep_for(30ms);
            done.store(true);
        },
        0ms);
    EXPECT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_TRUE(done.load());
}
