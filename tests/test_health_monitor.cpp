#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "breachlab/core/health_monitor.hpp"
#include "breachlab/core/session_registry.hpp"
#include "fake_container_engine.hpp"

namespace breachlab {
namespace {

using namespace std::chrono_literals;
using core::HealthMonitor;
using core::ObservedHealth;
using core::SessionRegistry;
using core::SessionStatus;

bool WaitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 3s)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

HealthMonitor::Config FastConfig()
{
    HealthMonitor::Config config;
    config.check_interval = 20ms;
    config.failure_threshold = 3;
    config.backoff_base = 10ms;
    config.backoff_max = 40ms;
    return config;
}

class HealthMonitorTest : public ::testing::Test {
  protected:
    void SetUp() override
    {
        monitor_.SetFailureHandler([this](const std::string& session_id, const std::string& reason) {
            std::lock_guard<std::mutex> lock(mutex_);
            failures_.push_back(session_id);
            last_reason_ = reason;
        });
    }

    void TearDown() override { monitor_.Stop(); }

    // Running session backed by a started fake container
    std::string Launch(const std::string& session_id)
    {
        utils::ContainerConfig config;
        config.image = "breachlab/test";
        auto container_id = engine_.CreateContainer(config);
        engine_.StartContainer(container_id);

        auto now = std::chrono::system_clock::now();
        core::ChallengeSession session;
        session.session_id = session_id;
        session.challenge_id = "challenge-" + session_id;
        session.user_id = "alice";
        session.created_at = now;
        session.expires_at = now + 1h;
        registry_.Insert(session);
        registry_.AttachContainer(session_id, container_id);
        registry_.MarkRunning(session_id, "");
        return container_id;
    }

    std::size_t FailureCount()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures_.size();
    }

    test::FakeContainerEngine engine_;
    SessionRegistry registry_;
    HealthMonitor monitor_{engine_, registry_, FastConfig()};

    std::mutex mutex_;
    std::vector<std::string> failures_;
    std::string last_reason_;
};

TEST(HealthClassificationTest, MapsInspectionToHealth)
{
    utils::ContainerInspection inspection;
    inspection.running = false;
    EXPECT_EQ(core::ClassifyInspection(inspection), ObservedHealth::UNHEALTHY);

    inspection.running = true;
    EXPECT_EQ(core::ClassifyInspection(inspection), ObservedHealth::NONE);

    inspection.health = "healthy";
    EXPECT_EQ(core::ClassifyInspection(inspection), ObservedHealth::HEALTHY);
    inspection.health = "starting";
    EXPECT_EQ(core::ClassifyInspection(inspection), ObservedHealth::STARTING);
    inspection.health = "unhealthy";
    EXPECT_EQ(core::ClassifyInspection(inspection), ObservedHealth::UNHEALTHY);

    inspection.health.clear();
    inspection.exit_code = 137;
    EXPECT_EQ(core::ClassifyInspection(inspection), ObservedHealth::UNHEALTHY);

    EXPECT_EQ(core::ToSessionHealth(ObservedHealth::NONE), core::HealthStatus::HEALTHY);
}

TEST(HealthBackoffTest, DoublesAndCaps)
{
    test::FakeContainerEngine engine;
    SessionRegistry registry;
    HealthMonitor monitor(engine, registry);

    EXPECT_EQ(monitor.BackoffFor(1), 5s);
    EXPECT_EQ(monitor.BackoffFor(2), 10s);
    EXPECT_EQ(monitor.BackoffFor(3), 20s);
    EXPECT_EQ(monitor.BackoffFor(10), 300s);
}

TEST_F(HealthMonitorTest, HealthyContainerStaysTracked)
{
    engine_.SetDefaultHealth("healthy");
    auto container_id = Launch("s1");
    monitor_.Start();
    monitor_.Track("s1", container_id);

    ASSERT_TRUE(WaitFor([&] { return engine_.Inspects() >= 3; }));
    EXPECT_TRUE(monitor_.IsTracked(container_id));
    EXPECT_EQ(registry_.Get("s1")->health, core::HealthStatus::HEALTHY);
    EXPECT_EQ(engine_.Restarts(), 0);
    EXPECT_EQ(FailureCount(), 0u);

    auto summary = monitor_.GetSummary();
    EXPECT_EQ(summary.tracked, 1u);
    EXPECT_TRUE(summary.is_monitoring);
}

TEST_F(HealthMonitorTest, PersistentlyUnhealthyContainerIsReportedOnce)
{
    engine_.SetDefaultHealth("unhealthy");
    auto container_id = Launch("s1");
    monitor_.Start();
    monitor_.Track("s1", container_id);

    ASSERT_TRUE(WaitFor([&] { return FailureCount() == 1; }));
    std::this_thread::sleep_for(100ms);

    EXPECT_EQ(FailureCount(), 1u);
    EXPECT_LT(engine_.Restarts(), 3);
    EXPECT_FALSE(monitor_.IsTracked(container_id));

    auto session = registry_.Get("s1");
    EXPECT_EQ(session->health, core::HealthStatus::UNHEALTHY);
    EXPECT_NE(session->last_error.find("unhealthy"), std::string::npos);
}

TEST_F(HealthMonitorTest, RestartThatRecoversResetsFailures)
{
    engine_.SetDefaultHealth("unhealthy");
    engine_.SetHealthAfterRestart("healthy");
    auto container_id = Launch("s1");
    monitor_.Start();
    monitor_.Track("s1", container_id);

    ASSERT_TRUE(WaitFor([&] {
        auto record = monitor_.GetRecord(container_id);
        return record && record->restart_attempts == 1 && record->last_status == ObservedHealth::HEALTHY;
    }));

    auto record = monitor_.GetRecord(container_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->consecutive_failures, 0);
    EXPECT_EQ(FailureCount(), 0u);
}

TEST_F(HealthMonitorTest, RestartBudgetSpansTheWholeSession)
{
    engine_.SetHealthAfterRestart("healthy");
    engine_.SetDefaultHealth("healthy");
    auto container_id = Launch("s1");
    monitor_.Start();
    monitor_.Track("s1", container_id);

    // Three separate flare-ups, each fixed by one restart
    for (int flare = 1; flare <= 3; ++flare) {
        engine_.SetHealth(container_id, "unhealthy");
        ASSERT_TRUE(WaitFor([&] {
            auto record = monitor_.GetRecord(container_id);
            return record && record->restart_attempts == flare &&
                   record->last_status == ObservedHealth::HEALTHY;
        })) << "flare " << flare;
        EXPECT_EQ(monitor_.GetRecord(container_id)->consecutive_failures, 0);
        EXPECT_EQ(FailureCount(), 0u);
    }

    // Recovery does not refill the budget: the next single failure is final
    engine_.SetHealth(container_id, "unhealthy");
    ASSERT_TRUE(WaitFor([&] { return FailureCount() == 1; }));
    EXPECT_EQ(engine_.Restarts(), 3);
    EXPECT_FALSE(monitor_.IsTracked(container_id));
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_NE(last_reason_.find("after 1 consecutive"), std::string::npos);
}

TEST_F(HealthMonitorTest, CrashedContainerCountsAsUnhealthy)
{
    auto container_id = Launch("s1");
    engine_.Crash(container_id, 1);
    monitor_.Start();
    monitor_.Track("s1", container_id);

    ASSERT_TRUE(WaitFor([&] { return engine_.Restarts() >= 1; }));
}

TEST_F(HealthMonitorTest, UnhealthyDuringGraceIsReportedWithoutRestart)
{
    engine_.SetDefaultHealth("unhealthy");
    auto container_id = Launch("s1");
    ASSERT_TRUE(registry_.BeginGrace("s1", std::chrono::system_clock::now() + 1h));
    ASSERT_EQ(registry_.Get("s1")->status, SessionStatus::STOPPING);

    monitor_.Start();
    monitor_.Track("s1", container_id);

    ASSERT_TRUE(WaitFor([&] { return FailureCount() == 1; }));
    EXPECT_EQ(engine_.Restarts(), 0);
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_NE(last_reason_.find("grace"), std::string::npos);
}

TEST_F(HealthMonitorTest, VanishedContainerIsDroppedSilently)
{
    auto container_id = Launch("s1");
    engine_.Vanish(container_id);
    monitor_.Start();
    monitor_.Track("s1", container_id);

    ASSERT_TRUE(WaitFor([&] { return !monitor_.IsTracked(container_id); }));
    EXPECT_EQ(FailureCount(), 0u);
}

TEST_F(HealthMonitorTest, EngineErrorsLeaveHealthUnknown)
{
    auto container_id = Launch("s1");
    engine_.FailInspect(true);
    monitor_.Start();
    monitor_.Track("s1", container_id);

    ASSERT_TRUE(WaitFor([&] {
        auto record = monitor_.GetRecord(container_id);
        return record && record->transient_errors >= 2;
    }));
    EXPECT_TRUE(monitor_.IsTracked(container_id));
    EXPECT_EQ(registry_.Get("s1")->health, core::HealthStatus::UNKNOWN);
    EXPECT_EQ(FailureCount(), 0u);
}

TEST_F(HealthMonitorTest, EndedSessionIsUntracked)
{
    auto container_id = Launch("s1");
    ASSERT_TRUE(registry_.ClaimTeardown("s1", core::TeardownReason::MANUAL).has_value());
    ASSERT_TRUE(registry_.Finalize("s1", SessionStatus::STOPPED, "stopped"));

    monitor_.Start();
    monitor_.Track("s1", container_id);

    ASSERT_TRUE(WaitFor([&] { return !monitor_.IsTracked(container_id); }));
    EXPECT_EQ(engine_.Inspects(), 0);
}

}  // namespace
}  // namespace breachlab
