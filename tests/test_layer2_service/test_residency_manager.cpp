// tests/test_layer2_service/test_residency_manager.cpp
/**
 * @file test_residency_manager.cpp
 * @brief In-process tests of the ResidencyManager state machine.
 *
 * The Logger is not started here; events that matter to a test are captured through
 * ResidencyManager::set_log_sink().
 */
#include "rsd_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace residency::utils;
using namespace residency::tests::helper;
using namespace std::chrono_literals;
using ::testing::HasSubstr;

namespace
{

/// Component used throughout: remembers which load produced it and whether it was closed.
struct Counter
{
    explicit Counter(int generation_) : generation(generation_) {}
    int generation;
    std::atomic<bool> closed{false};
};

/// Collects the manager's events for later inspection.
struct CapturedLog
{
    std::mutex mutex;
    std::vector<std::pair<ResidencyLogLevel, std::string>> entries;

    void add(ResidencyLogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex);
        entries.emplace_back(level, msg);
    }

    bool contains(ResidencyLogLevel level, std::string_view needle)
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto &[lvl, msg] : entries)
        {
            if (lvl == level && msg.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }
};

} // namespace

class ResidencyManagerTest : public residency::tests::PureApiTest
{
  protected:
    void SetUp() override
    {
        options_.default_idle_timeout = 10s;
        options_.load_wait_timeout = 5s;
        log_ = std::make_shared<CapturedLog>();
    }

    std::unique_ptr<ResidencyManager> MakeManager()
    {
        auto manager = std::make_unique<ResidencyManager>(options_);
        manager->set_log_sink([log = log_](ResidencyLogLevel level, const std::string &msg)
                              { log->add(level, msg); });
        return manager;
    }

    /// Registers "counter": each load yields the next generation; unloads close it.
    void RegisterCounter(ResidencyManager &manager, const std::string &name = "counter",
                         double memory_mb = 100.0)
    {
        ComponentDef def(name);
        def.set_loader<Counter>(
            [this]
            {
                const int generation = loads_.fetch_add(1) + 1;
                return std::make_shared<Counter>(generation);
            });
        def.set_unloader<Counter>(
            [this](Counter &c)
            {
                c.closed = true;
                unloads_.fetch_add(1);
            });
        def.set_estimated_memory_mb(memory_mb);
        manager.register_component(std::move(def));
    }

    static ResidencyErrc CodeOf(const std::function<void()> &fn)
    {
        try
        {
            fn();
        }
        catch (const ResidencyError &e)
        {
            return e.code();
        }
        ADD_FAILURE() << "expected a ResidencyError";
        return ResidencyErrc::UnknownComponent;
    }

    ResidencyOptions options_;
    std::shared_ptr<CapturedLog> log_;
    std::atomic<int> loads_{0};
    std::atomic<int> unloads_{0};
};

// ============================================================================
// Loading and sharing
// ============================================================================

TEST_F(ResidencyManagerTest, FirstAcquireLoadsLaterAcquiresShare)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    EXPECT_EQ(manager->component_state("counter"), ComponentState::NotLoaded);
    EXPECT_EQ(loads_.load(), 0);

    auto first = manager->acquire<Counter>("counter");
    auto second = manager->acquire<Counter>("counter");
    ASSERT_TRUE(first);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->generation, 1);
    EXPECT_EQ(loads_.load(), 1);
    EXPECT_EQ(manager->component_state("counter"), ComponentState::Loaded);

    manager->evict_component("counter");
    EXPECT_EQ(manager->component_state("counter"), ComponentState::NotLoaded);
    EXPECT_EQ(unloads_.load(), 1);
    EXPECT_TRUE(first->closed);

    auto third = manager->acquire<Counter>("counter");
    EXPECT_EQ(third->generation, 2);
    EXPECT_NE(third, first);
    EXPECT_EQ(loads_.load(), 2);
}

TEST_F(ResidencyManagerTest, CallerKeepsInstanceAliveAfterEviction)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    auto held = manager->acquire<Counter>("counter");
    manager->evict_component("counter");
    // The unloader ran, but the caller's reference keeps the object valid.
    EXPECT_TRUE(held->closed);
    EXPECT_EQ(held->generation, 1);
    EXPECT_EQ(held.use_count(), 1);
}

TEST_F(ResidencyManagerTest, ConvenienceRegistrationOverload)
{
    auto manager = MakeManager();
    std::atomic<bool> unloaded{false};
    manager->register_component<std::string>(
        "greeting", [] { return std::make_shared<std::string>("hello"); },
        [&unloaded](std::string &) { unloaded = true; }, 12.5);

    EXPECT_EQ(*manager->acquire<std::string>("greeting"), "hello");
    EXPECT_DOUBLE_EQ(manager->status().at("greeting").estimated_memory_mb, 12.5);
    manager->evict_component("greeting");
    EXPECT_TRUE(unloaded);
}

TEST_F(ResidencyManagerTest, ComponentWithoutUnloaderCanBeEvicted)
{
    auto manager = MakeManager();
    manager->register_component<int>("plain", [] { return std::make_shared<int>(7); });
    EXPECT_EQ(*manager->acquire<int>("plain"), 7);
    manager->evict_component("plain");
    EXPECT_EQ(manager->component_state("plain"), ComponentState::NotLoaded);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ResidencyManagerTest, FailedLoadReportsCauseAndRetries)
{
    auto manager = MakeManager();
    std::atomic<int> attempts{0};
    ComponentDef def("flaky");
    def.set_loader<Counter>(
        [&attempts]
        {
            if (attempts.fetch_add(1) == 0)
                throw std::runtime_error("model file missing");
            return std::make_shared<Counter>(attempts.load());
        });
    manager->register_component(std::move(def));

    try
    {
        (void)manager->acquire<Counter>("flaky");
        FAIL() << "expected LoadFailed";
    }
    catch (const ResidencyError &e)
    {
        EXPECT_EQ(e.code(), ResidencyErrc::LoadFailed);
        EXPECT_EQ(e.component(), "flaky");
        EXPECT_THAT(e.what(), HasSubstr("LoadFailed [flaky]"));
        EXPECT_THAT(e.what(), HasSubstr("model file missing"));
        ASSERT_TRUE(e.cause());
        EXPECT_THROW(std::rethrow_exception(e.cause()), std::runtime_error);
    }
    EXPECT_EQ(manager->component_state("flaky"), ComponentState::Error);
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Error, "Failed to load component 'flaky'"));

    // Error is not sticky.
    auto instance = manager->acquire<Counter>("flaky");
    EXPECT_EQ(instance->generation, 2);
    EXPECT_EQ(manager->component_state("flaky"), ComponentState::Loaded);
}

TEST_F(ResidencyManagerTest, LoaderReturningNullIsLoadFailed)
{
    auto manager = MakeManager();
    manager->register_component<Counter>("empty", [] { return std::shared_ptr<Counter>(); });
    EXPECT_EQ(CodeOf([&] { (void)manager->acquire<Counter>("empty"); }),
              ResidencyErrc::LoadFailed);
    EXPECT_EQ(manager->component_state("empty"), ComponentState::Error);
}

TEST_F(ResidencyManagerTest, WrongTypeIsTypeMismatch)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    EXPECT_EQ(CodeOf([&] { (void)manager->acquire<std::string>("counter"); }),
              ResidencyErrc::TypeMismatch);
    EXPECT_EQ(loads_.load(), 0);
    EXPECT_EQ(manager->component_state("counter"), ComponentState::NotLoaded);
}

TEST_F(ResidencyManagerTest, UnknownNameIsRejectedEverywhere)
{
    auto manager = MakeManager();
    EXPECT_EQ(CodeOf([&] { (void)manager->acquire<Counter>("ghost"); }),
              ResidencyErrc::UnknownComponent);
    EXPECT_EQ(CodeOf([&] { manager->evict_component("ghost"); }),
              ResidencyErrc::UnknownComponent);
    EXPECT_EQ(CodeOf([&] { manager->schedule_eviction("ghost"); }),
              ResidencyErrc::UnknownComponent);
    EXPECT_EQ(CodeOf([&] { (void)manager->component_state("ghost"); }),
              ResidencyErrc::UnknownComponent);
    EXPECT_FALSE(manager->is_registered("ghost"));
    EXPECT_FALSE(manager->eviction_pending("ghost"));
}

TEST_F(ResidencyManagerTest, RegistrationWithoutLoaderIsRejected)
{
    auto manager = MakeManager();
    ComponentDef def("no_loader");
    EXPECT_THROW(manager->register_component(std::move(def)), std::invalid_argument);
    EXPECT_FALSE(manager->is_registered("no_loader"));
}

TEST_F(ResidencyManagerTest, InvalidOptionsAreRejected)
{
    ResidencyOptions bad;
    bad.default_idle_timeout = 0ms;
    EXPECT_THROW(ResidencyManager{bad}, std::invalid_argument);

    bad = {};
    bad.load_wait_timeout = -1ms;
    EXPECT_THROW(ResidencyManager{bad}, std::invalid_argument);

    bad = {};
    bad.memory_budget_mb = -1.0;
    EXPECT_THROW(ResidencyManager{bad}, std::invalid_argument);

    bad = {};
    bad.component_overrides["chat"].idle_timeout = 0ms;
    EXPECT_THROW(ResidencyManager{bad}, std::invalid_argument);
}

TEST_F(ResidencyManagerTest, NonPositiveIdleTimeoutIsRejected)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    EXPECT_THROW(manager->schedule_eviction("counter", 0ms), std::invalid_argument);
    EXPECT_FALSE(manager->eviction_pending("counter"));
}

// ============================================================================
// Eviction
// ============================================================================

TEST_F(ResidencyManagerTest, EvictIsIdempotent)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    manager->evict_component("counter"); // never loaded
    (void)manager->acquire<Counter>("counter");
    manager->evict_component("counter");
    manager->evict_component("counter");
    EXPECT_EQ(unloads_.load(), 1);
    EXPECT_EQ(manager->component_state("counter"), ComponentState::NotLoaded);
}

TEST_F(ResidencyManagerTest, ThrowingUnloaderStillFreesTheSlot)
{
    auto manager = MakeManager();
    ComponentDef def("brittle");
    def.set_loader<Counter>([] { return std::make_shared<Counter>(1); });
    def.set_unloader<Counter>([](Counter &) { throw std::runtime_error("close failed"); });
    manager->register_component(std::move(def));

    (void)manager->acquire<Counter>("brittle");
    EXPECT_NO_THROW(manager->evict_component("brittle"));
    EXPECT_EQ(manager->component_state("brittle"), ComponentState::NotLoaded);
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Error, "close failed"));
}

TEST_F(ResidencyManagerTest, HangingUnloaderIsAbandonedAfterItsTimeout)
{
    auto manager = MakeManager();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    ComponentDef def("stuck");
    def.set_loader<Counter>([] { return std::make_shared<Counter>(1); });
    def.set_unloader<Counter>([released](Counter &) { released.wait(); }, 100ms);
    manager->register_component(std::move(def));

    (void)manager->acquire<Counter>("stuck");
    const auto start = std::chrono::steady_clock::now();
    manager->evict_component("stuck");
    const auto took = std::chrono::steady_clock::now() - start;

    EXPECT_LT(took, 3s);
    EXPECT_EQ(manager->component_state("stuck"), ComponentState::NotLoaded);
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Error, "did not finish within 100ms"));

    release.set_value(); // lets the abandoned helper thread finish
}

TEST_F(ResidencyManagerTest, TimedUnloaderThatFinishesInTimeIsJoined)
{
    auto manager = MakeManager();
    std::atomic<bool> ran{false};
    ComponentDef def("timed");
    def.set_loader<Counter>([] { return std::make_shared<Counter>(1); });
    def.set_unloader<Counter>([&ran](Counter &) { ran = true; }, 2s);
    manager->register_component(std::move(def));

    (void)manager->acquire<Counter>("timed");
    manager->evict_component("timed");
    EXPECT_TRUE(ran);
    EXPECT_FALSE(log_->contains(ResidencyLogLevel::Error, "timed"));
}

TEST_F(ResidencyManagerTest, EvictAllReleasesEverythingAndCancelsTimers)
{
    auto manager = MakeManager();
    RegisterCounter(*manager, "a");
    RegisterCounter(*manager, "b");
    RegisterCounter(*manager, "c");
    (void)manager->acquire<Counter>("a");
    (void)manager->acquire<Counter>("b");
    manager->schedule_eviction("a", 10s);

    manager->evict_all();
    EXPECT_EQ(unloads_.load(), 2);
    for (const auto &name : {"a", "b", "c"})
        EXPECT_EQ(manager->component_state(name), ComponentState::NotLoaded) << name;
    EXPECT_FALSE(manager->eviction_pending("a"));
    EXPECT_DOUBLE_EQ(manager->resident_memory_mb(), 0.0);

    manager->evict_all();
    EXPECT_EQ(unloads_.load(), 2);
}

TEST_F(ResidencyManagerTest, ForceReloadReplacesTheInstance)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    auto old_instance = manager->acquire<Counter>("counter");
    auto fresh = manager->acquire<Counter>("counter", /*force_reload=*/true);

    EXPECT_NE(old_instance, fresh);
    EXPECT_TRUE(old_instance->closed);
    EXPECT_FALSE(fresh->closed);
    EXPECT_EQ(loads_.load(), 2);
    EXPECT_EQ(unloads_.load(), 1);
    EXPECT_EQ(manager->acquire<Counter>("counter"), fresh);
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Info, "Force-reloading component 'counter'"));
}

// ============================================================================
// Idle timers
// ============================================================================

TEST_F(ResidencyManagerTest, IdleComponentIsEvictedAfterTimeout)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    (void)manager->acquire<Counter>("counter");
    manager->schedule_eviction("counter", 50ms);
    EXPECT_TRUE(manager->eviction_pending("counter"));

    ASSERT_TRUE(wait_until([&]
                           { return manager->component_state("counter") ==
                                    ComponentState::NotLoaded; }));
    EXPECT_EQ(unloads_.load(), 1);
    EXPECT_FALSE(manager->eviction_pending("counter"));
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Info, "evicted (idle timeout)"));
}

TEST_F(ResidencyManagerTest, AcquireCancelsPendingEviction)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    (void)manager->acquire<Counter>("counter");
    manager->schedule_eviction("counter", 100ms);
    (void)manager->acquire<Counter>("counter");
    EXPECT_FALSE(manager->eviction_pending("counter"));

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(manager->component_state("counter"), ComponentState::Loaded);
    EXPECT_EQ(unloads_.load(), 0);
}

TEST_F(ResidencyManagerTest, RescheduleReplacesEarlierTimer)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    (void)manager->acquire<Counter>("counter");
    manager->schedule_eviction("counter", 30s);
    manager->schedule_eviction("counter", 50ms);

    ASSERT_TRUE(wait_until([&]
                           { return manager->component_state("counter") ==
                                    ComponentState::NotLoaded; }));
    EXPECT_EQ(unloads_.load(), 1);
}

TEST_F(ResidencyManagerTest, LaterLongerScheduleOverridesShorterOne)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    (void)manager->acquire<Counter>("counter");
    manager->schedule_eviction("counter", 50ms);
    manager->schedule_eviction("counter", 1s);

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(manager->component_state("counter"), ComponentState::Loaded);
    EXPECT_EQ(unloads_.load(), 0);
    EXPECT_TRUE(manager->eviction_pending("counter"));
}

TEST_F(ResidencyManagerTest, CenturiesLongIdleTimeoutNeverFires)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    (void)manager->acquire<Counter>("counter");
    manager->schedule_eviction("counter", std::chrono::hours(24 * 365 * 400));

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(manager->component_state("counter"), ComponentState::Loaded);
    EXPECT_TRUE(manager->eviction_pending("counter"));
    EXPECT_EQ(unloads_.load(), 0);
}

TEST_F(ResidencyManagerTest, ExplicitEvictCancelsTimer)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    (void)manager->acquire<Counter>("counter");
    manager->schedule_eviction("counter", 10s);
    manager->evict_component("counter");
    EXPECT_FALSE(manager->eviction_pending("counter"));
}

TEST_F(ResidencyManagerTest, TimerOnUnloadedComponentIsHarmless)
{
    auto manager = MakeManager();
    RegisterCounter(*manager);
    manager->schedule_eviction("counter", 20ms);
    ASSERT_TRUE(wait_until([&] { return !manager->eviction_pending("counter"); }));
    EXPECT_EQ(manager->component_state("counter"), ComponentState::NotLoaded);
    EXPECT_EQ(unloads_.load(), 0);
}

TEST_F(ResidencyManagerTest, DefinitionIdleTimeoutIsUsedByDefault)
{
    auto manager = MakeManager();
    ComponentDef def("quick");
    def.set_loader<Counter>([] { return std::make_shared<Counter>(1); });
    def.set_idle_timeout(50ms);
    manager->register_component(std::move(def));

    (void)manager->acquire<Counter>("quick");
    manager->schedule_eviction("quick");
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Debug, "scheduled in 50ms"));
    ASSERT_TRUE(wait_until([&]
                           { return manager->component_state("quick") ==
                                    ComponentState::NotLoaded; }));
}

TEST_F(ResidencyManagerTest, ManagerDefaultIdleTimeoutApplies)
{
    options_.default_idle_timeout = 40ms;
    auto manager = MakeManager();
    RegisterCounter(*manager);
    (void)manager->acquire<Counter>("counter");
    manager->schedule_eviction("counter");
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Debug, "scheduled in 40ms"));
    ASSERT_TRUE(wait_until([&]
                           { return manager->component_state("counter") ==
                                    ComponentState::NotLoaded; }));
}

TEST_F(ResidencyManagerTest, ConfiguredOverridesWinOverDefinition)
{
    options_.component_overrides["counter"] = ComponentOverrides{60ms, 321.0};
    auto manager = MakeManager();
    ComponentDef def("counter");
    def.set_loader<Counter>([] { return std::make_shared<Counter>(1); });
    def.set_idle_timeout(30s);
    def.set_estimated_memory_mb(10.0);
    manager->register_component(std::move(def));

    EXPECT_DOUBLE_EQ(manager->status().at("counter").estimated_memory_mb, 321.0);
    (void)manager->acquire<Counter>("counter");
    EXPECT_DOUBLE_EQ(manager->resident_memory_mb(), 321.0);
    manager->schedule_eviction("counter");
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Debug, "scheduled in 60ms"));
}

// ============================================================================
// Re-registration
// ============================================================================

TEST_F(ResidencyManagerTest, ReRegistrationReleasesLoadedInstanceAndResetsCounters)
{
    auto manager = MakeManager();
    RegisterCounter(*manager, "counter", 100.0);
    auto held = manager->acquire<Counter>("counter");
    (void)manager->acquire<Counter>("counter");
    manager->schedule_eviction("counter", 10s);

    RegisterCounter(*manager, "counter", 250.0);
    EXPECT_TRUE(held->closed);
    EXPECT_EQ(unloads_.load(), 1);
    EXPECT_FALSE(manager->eviction_pending("counter"));

    const auto st = manager->status().at("counter");
    EXPECT_EQ(st.state, ComponentState::NotLoaded);
    EXPECT_EQ(st.access_count, 0u);
    EXPECT_DOUBLE_EQ(st.estimated_memory_mb, 250.0);
    EXPECT_EQ(manager->component_names().size(), 1u);
}

TEST_F(ResidencyManagerTest, ReRegistrationDuringLoadFailsThatLoad)
{
    auto manager = MakeManager();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> stale_unloaded{false};

    ComponentDef def("slow");
    def.set_loader<Counter>(
        [released]
        {
            released.wait();
            return std::make_shared<Counter>(1);
        });
    def.set_unloader<Counter>([&stale_unloaded](Counter &) { stale_unloaded = true; });
    manager->register_component(std::move(def));

    auto pending = std::async(std::launch::async,
                              [&] { return manager->acquire<Counter>("slow"); });
    ASSERT_TRUE(wait_until([&]
                           { return manager->component_state("slow") ==
                                    ComponentState::Loading; }));

    manager->register_component<Counter>("slow", [] { return std::make_shared<Counter>(2); });
    release.set_value();

    try
    {
        (void)pending.get();
        FAIL() << "expected LoadFailed";
    }
    catch (const ResidencyError &e)
    {
        EXPECT_EQ(e.code(), ResidencyErrc::LoadFailed);
        EXPECT_THAT(e.what(), HasSubstr("re-registered"));
    }
    EXPECT_TRUE(stale_unloaded);
    EXPECT_EQ(manager->acquire<Counter>("slow")->generation, 2);
}

// ============================================================================
// Waiting for another caller's load
// ============================================================================

TEST_F(ResidencyManagerTest, WaiterTimesOutWhileLoadIsStuck)
{
    options_.load_wait_timeout = 1s;
    auto manager = MakeManager();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    manager->register_component<Counter>("slow",
                                         [released]
                                         {
                                             released.wait();
                                             return std::make_shared<Counter>(1);
                                         });

    auto loader_call = std::async(std::launch::async,
                                  [&] { return manager->acquire<Counter>("slow"); });
    ASSERT_TRUE(wait_until([&]
                           { return manager->component_state("slow") ==
                                    ComponentState::Loading; }));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(CodeOf([&] { (void)manager->acquire<Counter>("slow"); }),
              ResidencyErrc::LoadTimeout);
    const auto waited = std::chrono::steady_clock::now() - start;
    EXPECT_GE(waited, 1s);
    EXPECT_LT(waited, 3s);
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Warn, "Timed out after 1000ms"));

    // The original load is unaffected and completes once released.
    release.set_value();
    auto instance = loader_call.get();
    ASSERT_TRUE(instance);
    EXPECT_EQ(manager->acquire<Counter>("slow"), instance);
}

TEST_F(ResidencyManagerTest, WaiterWithCenturiesLongCeilingGetsInstance)
{
    options_.load_wait_timeout = std::chrono::hours(24 * 365 * 400);
    auto manager = MakeManager();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    manager->register_component<Counter>("slow",
                                         [released]
                                         {
                                             released.wait();
                                             return std::make_shared<Counter>(1);
                                         });

    auto loader_call = std::async(std::launch::async,
                                  [&] { return manager->acquire<Counter>("slow"); });
    ASSERT_TRUE(wait_until([&]
                           { return manager->component_state("slow") ==
                                    ComponentState::Loading; }));
    auto waiter_call = std::async(std::launch::async,
                                  [&] { return manager->acquire<Counter>("slow"); });

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(waiter_call.wait_for(0ms), std::future_status::timeout);
    release.set_value();

    auto instance = loader_call.get();
    ASSERT_TRUE(instance);
    EXPECT_EQ(waiter_call.get(), instance);
    EXPECT_EQ(instance->generation, 1);
    EXPECT_FALSE(log_->contains(ResidencyLogLevel::Warn, "Timed out"));
}

TEST_F(ResidencyManagerTest, SlowLoadDoesNotBlockOtherComponents)
{
    auto manager = MakeManager();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    manager->register_component<Counter>("slow",
                                         [released]
                                         {
                                             released.wait();
                                             return std::make_shared<Counter>(1);
                                         });
    RegisterCounter(*manager, "fast");

    auto slow_call = std::async(std::launch::async,
                                [&] { return manager->acquire<Counter>("slow"); });
    ASSERT_TRUE(wait_until([&]
                           { return manager->component_state("slow") ==
                                    ComponentState::Loading; }));

    EXPECT_TRUE(manager->acquire<Counter>("fast"));
    const auto st = manager->status();
    EXPECT_EQ(st.at("slow").state, ComponentState::Loading);
    EXPECT_EQ(st.at("fast").state, ComponentState::Loaded);

    release.set_value();
    EXPECT_TRUE(slow_call.get());
}

// ============================================================================
// Status and queries
// ============================================================================

TEST_F(ResidencyManagerTest, StatusReportsUsageAndMemory)
{
    auto manager = MakeManager();
    RegisterCounter(*manager, "big", 1600.0);
    RegisterCounter(*manager, "small", 50.0);

    auto st = manager->status();
    ASSERT_EQ(st.size(), 2u);
    EXPECT_EQ(st.at("big").state, ComponentState::NotLoaded);
    EXPECT_EQ(st.at("big").access_count, 0u);
    EXPECT_DOUBLE_EQ(st.at("big").idle_seconds, 0.0);

    (void)manager->acquire<Counter>("big");
    (void)manager->acquire<Counter>("big");
    (void)manager->acquire<Counter>("big");
    (void)manager->acquire<Counter>("small");
    std::this_thread::sleep_for(20ms);

    st = manager->status();
    EXPECT_EQ(st.at("big").access_count, 3u);
    EXPECT_EQ(st.at("small").access_count, 1u);
    EXPECT_GT(st.at("big").idle_seconds, 0.0);
    EXPECT_DOUBLE_EQ(manager->resident_memory_mb(), 1650.0);

    manager->evict_component("big");
    EXPECT_DOUBLE_EQ(manager->resident_memory_mb(), 50.0);
    // Usage counters survive eviction.
    EXPECT_EQ(manager->status().at("big").access_count, 3u);
}

TEST_F(ResidencyManagerTest, ComponentNamesAreSorted)
{
    auto manager = MakeManager();
    RegisterCounter(*manager, "vision_model");
    RegisterCounter(*manager, "chat_model");
    RegisterCounter(*manager, "ocr_engine");
    EXPECT_THAT(manager->component_names(),
                ::testing::ElementsAre("chat_model", "ocr_engine", "vision_model"));
    EXPECT_TRUE(manager->is_registered("ocr_engine"));
}

TEST_F(ResidencyManagerTest, StateAndErrorCodeNames)
{
    EXPECT_STREQ(to_string(ComponentState::NotLoaded), "not_loaded");
    EXPECT_STREQ(to_string(ComponentState::Loading), "loading");
    EXPECT_STREQ(to_string(ComponentState::Loaded), "loaded");
    EXPECT_STREQ(to_string(ComponentState::Unloading), "unloading");
    EXPECT_STREQ(to_string(ComponentState::Error), "error");
    EXPECT_STREQ(to_string(ResidencyErrc::LoadTimeout), "LoadTimeout");
    EXPECT_STREQ(to_string(ResidencyErrc::TypeMismatch), "TypeMismatch");
}

// ============================================================================
// Log sink
// ============================================================================

TEST_F(ResidencyManagerTest, LifecycleEventsReachTheSink)
{
    auto manager = MakeManager();
    RegisterCounter(*manager, "counter", 64.0);
    (void)manager->acquire<Counter>("counter");
    manager->evict_component("counter");

    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Debug, "Registered component 'counter'"));
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Info, "Loading component 'counter' (~64 MB)"));
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Info, "Component 'counter' loaded in"));
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Info, "evicted (explicit)"));
}

TEST_F(ResidencyManagerTest, BudgetOverrunIsWarned)
{
    options_.memory_budget_mb = 100.0;
    auto manager = MakeManager();
    RegisterCounter(*manager, "a", 60.0);
    RegisterCounter(*manager, "b", 60.0);
    (void)manager->acquire<Counter>("a");
    EXPECT_FALSE(log_->contains(ResidencyLogLevel::Warn, "exceeds the budget"));
    (void)manager->acquire<Counter>("b");
    EXPECT_TRUE(log_->contains(ResidencyLogLevel::Warn, "exceeds the budget of 100 MB"));
}

TEST_F(ResidencyManagerTest, ThrowingSinkDoesNotBreakOperations)
{
    auto manager = MakeManager();
    manager->set_log_sink([](ResidencyLogLevel, const std::string &)
                          { throw std::runtime_error("sink broken"); });
    RegisterCounter(*manager);
    EXPECT_NO_THROW((void)manager->acquire<Counter>("counter"));
    EXPECT_NO_THROW(manager->evict_component("counter"));
}

TEST_F(ResidencyManagerTest, ClearedSinkReceivesNothing)
{
    auto manager = MakeManager();
    manager->clear_log_sink();
    RegisterCounter(*manager);
    (void)manager->acquire<Counter>("counter");
    std::lock_guard<std::mutex> lock(log_->mutex);
    EXPECT_TRUE(log_->entries.empty());
}

// ============================================================================
// Teardown
// ============================================================================

TEST_F(ResidencyManagerTest, DestructionUnloadsAndSilencesTimers)
{
    {
        auto manager = MakeManager();
        RegisterCounter(*manager, "a");
        RegisterCounter(*manager, "b");
        (void)manager->acquire<Counter>("a");
        (void)manager->acquire<Counter>("b");
        manager->schedule_eviction("a", 100ms);
    }
    EXPECT_EQ(unloads_.load(), 2);
    // The timer scheduled before destruction must not fire afterwards.
    std::this_thread::sleep_for(250ms);
    EXPECT_EQ(unloads_.load(), 2);
}
