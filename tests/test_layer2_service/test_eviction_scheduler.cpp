// tests/test_layer2_service/test_eviction_scheduler.cpp
/**
 * @file test_eviction_scheduler.cpp
 * @brief Keyed one-shot timers: ordering, replacement, cancellation and stop.
 */
#include "rsd_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace residency::utils;
using namespace residency::tests::helper;
using namespace std::chrono_literals;

class EvictionSchedulerTest : public residency::tests::PureApiTest
{
  protected:
    void Record(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fired_.push_back(key);
    }

    std::vector<std::string> Fired()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return fired_;
    }

    std::mutex mutex_;
    std::vector<std::string> fired_;
};

TEST_F(EvictionSchedulerTest, FiresInDeadlineOrder)
{
    EvictionScheduler scheduler;
    ASSERT_TRUE(scheduler.schedule("late", 120ms, [this] { Record("late"); }));
    ASSERT_TRUE(scheduler.schedule("early", 20ms, [this] { Record("early"); }));
    ASSERT_TRUE(scheduler.schedule("middle", 70ms, [this] { Record("middle"); }));
    EXPECT_EQ(scheduler.pending_count(), 3u);

    ASSERT_TRUE(wait_until([this] { return Fired().size() == 3; }));
    EXPECT_EQ(Fired(), (std::vector<std::string>{"early", "middle", "late"}));
    EXPECT_EQ(scheduler.pending_count(), 0u);
}

TEST_F(EvictionSchedulerTest, SchedulingSameKeyReplacesTimer)
{
    EvictionScheduler scheduler;
    std::atomic<int> first{0};
    std::atomic<int> second{0};
    scheduler.schedule("k", 30ms, [&first] { ++first; });
    scheduler.schedule("k", 60ms, [&second] { ++second; });
    EXPECT_EQ(scheduler.pending_count(), 1u);

    ASSERT_TRUE(wait_until([&second] { return second.load() == 1; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(first.load(), 0);
    EXPECT_EQ(second.load(), 1);
}

TEST_F(EvictionSchedulerTest, CancelPreventsCallback)
{
    EvictionScheduler scheduler;
    std::atomic<bool> fired{false};
    scheduler.schedule("k", 40ms, [&fired] { fired = true; });
    EXPECT_TRUE(scheduler.pending("k"));
    EXPECT_TRUE(scheduler.cancel("k"));
    EXPECT_FALSE(scheduler.pending("k"));
    EXPECT_FALSE(scheduler.cancel("k"));

    std::this_thread::sleep_for(120ms);
    EXPECT_FALSE(fired);
}

TEST_F(EvictionSchedulerTest, CancelAllClearsEveryKey)
{
    EvictionScheduler scheduler;
    std::atomic<int> fired{0};
    for (const char *key : {"a", "b", "c"})
        scheduler.schedule(key, 40ms, [&fired] { ++fired; });
    EXPECT_EQ(scheduler.pending_count(), 3u);
    scheduler.cancel_all();
    EXPECT_EQ(scheduler.pending_count(), 0u);

    std::this_thread::sleep_for(120ms);
    EXPECT_EQ(fired.load(), 0);
}

TEST_F(EvictionSchedulerTest, KeyIsNotPendingOnceFired)
{
    EvictionScheduler scheduler;
    std::atomic<bool> fired{false};
    scheduler.schedule("k", 10ms, [&fired] { fired = true; });
    ASSERT_TRUE(wait_until([&fired] { return fired.load(); }));
    EXPECT_FALSE(scheduler.pending("k"));
}

TEST_F(EvictionSchedulerTest, CallbackMayRescheduleItself)
{
    EvictionScheduler scheduler;
    std::atomic<int> runs{0};
    std::function<void()> tick = [&]
    {
        if (++runs < 3)
            scheduler.schedule("tick", 10ms, tick);
    };
    scheduler.schedule("tick", 10ms, tick);
    ASSERT_TRUE(wait_until([&runs] { return runs.load() == 3; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(runs.load(), 3);
}

TEST_F(EvictionSchedulerTest, ThrowingCallbackDoesNotStopWorker)
{
    EvictionScheduler scheduler;
    scheduler.schedule("bad", 10ms, [] { throw std::runtime_error("timer boom"); });
    scheduler.schedule("good", 40ms, [this] { Record("good"); });
    ASSERT_TRUE(wait_until([this] { return Fired().size() == 1; }));
    EXPECT_EQ(Fired().front(), "good");
}

TEST_F(EvictionSchedulerTest, NonStandardThrowDoesNotStopWorker)
{
    EvictionScheduler scheduler;
    scheduler.schedule("bad", 10ms, [] { throw 42; });
    scheduler.schedule("good", 40ms, [this] { Record("good"); });
    ASSERT_TRUE(wait_until([this] { return Fired().size() == 1; }));
    EXPECT_EQ(Fired().front(), "good");
}

TEST_F(EvictionSchedulerTest, HugeDelayStaysPending)
{
    EvictionScheduler scheduler;
    std::atomic<bool> fired{false};
    scheduler.schedule("far", std::chrono::hours(24 * 365 * 400), [&fired] { fired = true; });
    scheduler.schedule("max", std::chrono::milliseconds::max(), [&fired] { fired = true; });
    scheduler.schedule("near", 20ms, [this] { Record("near"); });

    ASSERT_TRUE(wait_until([this] { return Fired().size() == 1; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(fired);
    EXPECT_TRUE(scheduler.pending("far"));
    EXPECT_TRUE(scheduler.pending("max"));
}

TEST_F(EvictionSchedulerTest, DeadlineAfterSaturates)
{
    using Clock = EvictionScheduler::Clock;
    EXPECT_EQ(EvictionScheduler::deadline_after(std::chrono::milliseconds::max()),
              Clock::time_point::max());
    EXPECT_EQ(EvictionScheduler::deadline_after(std::chrono::hours(24 * 365 * 400)),
              Clock::time_point::max());

    const auto before = Clock::now();
    const auto soon = EvictionScheduler::deadline_after(50ms);
    EXPECT_GE(soon, before + 50ms);
    EXPECT_LE(EvictionScheduler::deadline_after(-5ms), Clock::now());
}

TEST_F(EvictionSchedulerTest, StopDiscardsPendingAndRejectsNewTimers)
{
    EvictionScheduler scheduler;
    std::atomic<bool> fired{false};
    scheduler.schedule("k", 30ms, [&fired] { fired = true; });
    scheduler.stop();
    EXPECT_EQ(scheduler.pending_count(), 0u);
    EXPECT_FALSE(scheduler.schedule("k2", 1ms, [&fired] { fired = true; }));

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(fired);
    scheduler.stop(); // idempotent
}

TEST_F(EvictionSchedulerTest, StopWaitsForRunningCallback)
{
    EvictionScheduler scheduler;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    scheduler.schedule("slow", 1ms,
                       [&]
                       {
                           started = true;
                           std::this_thread::sleep_for(150ms);
                           finished = true;
                       });
    ASSERT_TRUE(wait_until([&started] { return started.load(); }));
    scheduler.stop();
    EXPECT_TRUE(finished);
}

TEST_F(EvictionSchedulerTest, ManyKeysAllFire)
{
    EvictionScheduler scheduler;
    const int n = scaled_value(200, 40);
    std::atomic<int> fired{0};
    for (int i = 0; i < n; ++i)
    {
        scheduler.schedule(fmt::format("key-{}", i), std::chrono::milliseconds(i % 20),
                           [&fired] { ++fired; });
    }
    ASSERT_TRUE(wait_until([&] { return fired.load() == n; }));
    EXPECT_EQ(scheduler.pending_count(), 0u);
}
