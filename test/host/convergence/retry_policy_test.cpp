#include <gtest/gtest.h>

#include "convergence/retry_policy.hpp"
#include "host/fakes.hpp"

namespace convergence
{
    using testing_fakes::EventLog;
    using testing_fakes::FakeSleeper;

    TEST(RetryPolicyTest, SucceedsImmediatelyWithoutSleeping)
    {
        EventLog log;
        FakeSleeper sleeper(log);
        RetryPolicy policy(sleeper);

        int polls = 0;
        auto outcome = policy.waitUntil([&polls] { ++polls; return true; }, 3, 1);

        EXPECT_EQ(outcome, WaitOutcome::Success);
        EXPECT_EQ(polls, 1);
        EXPECT_TRUE(sleeper.sleeps.empty());
    }

    TEST(RetryPolicyTest, ExhaustsAfterExactlyMaxRetriesSleeps)
    {
        EventLog log;
        FakeSleeper sleeper(log);
        RetryPolicy policy(sleeper);

        int polls = 0;
        auto outcome = policy.waitUntil([&polls] { ++polls; return false; }, 3, 1);

        EXPECT_EQ(outcome, WaitOutcome::Exhausted);
        EXPECT_EQ(polls, 4);
        ASSERT_EQ(sleeper.sleeps.size(), 3u);
        for (const auto& s : sleeper.sleeps)
            EXPECT_EQ(s, std::chrono::seconds(1));
    }

    TEST(RetryPolicyTest, SucceedsOnLaterAttempt)
    {
        EventLog log;
        FakeSleeper sleeper(log);
        RetryPolicy policy(sleeper);

        int polls = 0;
        auto outcome = policy.waitUntil([&polls] { return ++polls == 3; }, 20, 20);

        EXPECT_EQ(outcome, WaitOutcome::Success);
        EXPECT_EQ(polls, 3);
        EXPECT_EQ(sleeper.sleeps.size(), 2u);
        EXPECT_EQ(sleeper.sleeps.front(), std::chrono::seconds(20));
    }

    TEST(RetryPolicyTest, ZeroRetriesPollsOnce)
    {
        EventLog log;
        FakeSleeper sleeper(log);
        RetryPolicy policy(sleeper);

        int polls = 0;
        auto outcome = policy.waitUntil([&polls] { ++polls; return false; }, 0, 5);

        EXPECT_EQ(outcome, WaitOutcome::Exhausted);
        EXPECT_EQ(polls, 1);
        EXPECT_TRUE(sleeper.sleeps.empty());
    }

    TEST(RetryPolicyTest, SleepsAlternateWithPolls)
    {
        EventLog log;
        FakeSleeper sleeper(log);
        RetryPolicy policy(sleeper);

        policy.waitUntil([&log] { log.push_back("poll"); return false; }, 2, 7);

        EventLog expected{"poll", "sleep:7", "poll", "sleep:7", "poll"};
        EXPECT_EQ(log, expected);
    }

    TEST(RetryPolicyTest, RealSleeperHonoursInterval)
    {
        ThreadSleeper sleeper;
        RetryPolicy policy(sleeper);

        auto begin = std::chrono::steady_clock::now();
        auto outcome = policy.waitUntil([] { return false; }, 1, 1);
        auto elapsed = std::chrono::steady_clock::now() - begin;

        EXPECT_EQ(outcome, WaitOutcome::Exhausted);
        EXPECT_GE(elapsed, std::chrono::milliseconds(1000));
        EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
    }
}
