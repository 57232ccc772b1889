#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "breachlab/core/challenge_catalog.hpp"
#include "breachlab/core/errors.hpp"
#include "breachlab/core/flag_system.hpp"
#include "breachlab/core/orchestrator.hpp"
#include "breachlab/core/security_profiles.hpp"
#include "fake_container_engine.hpp"

namespace breachlab {
namespace {

using namespace std::chrono_literals;
using core::Orchestrator;
using core::SessionInfo;
using core::SessionStatus;

const char* kCatalog = R"({
  "challenges": [
    {
      "id": "web-xss-01",
      "name": "Reflected XSS Playground",
      "description": "Steal the admin cookie",
      "category": "web",
      "difficulty": "beginner",
      "points": 100,
      "container_spec": {
        "image": "breachlab/web-xss-01:latest",
        "ports": {"80/tcp": null},
        "environment": {"SESSION_TAG": "{{CHALLENGE_ID}}-{{USER_ID}}-{{SESSION_ID}}"},
        "resources": {"memory": "2g", "cpus": 0.5}
      }
    },
    {
      "id": "crypto-01",
      "name": "Weak RSA",
      "description": "Small exponent",
      "category": "crypto",
      "difficulty": "intermediate",
      "container_spec": {"image": "breachlab/crypto-01:latest", "ports": {"3000/tcp": null, "22/tcp": null}}
    }
  ]
})";

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

Orchestrator::Config FastConfig()
{
    Orchestrator::Config config;
    config.session_timeout = 1h;
    config.grace_period = 100ms;
    config.teardown_retry = 20ms;
    config.stop_timeout = 1s;
    config.health.check_interval = 20ms;
    config.health.backoff_base = 10ms;
    config.health.backoff_max = 40ms;
    config.health.failure_threshold = 3;
    return config;
}

class OrchestratorTest : public ::testing::Test {
  protected:
    void SetUp() override { catalog_.LoadFromString(kCatalog); }

    void TearDown() override
    {
        if (orchestrator_) {
            orchestrator_->Shutdown();
        }
    }

    Orchestrator& Start(const Orchestrator::Config& config = FastConfig())
    {
        orchestrator_ = std::make_unique<Orchestrator>(catalog_, profiles_, flags_, engine_, config);
        orchestrator_->SetNoticeCallback([this](const SessionInfo& session, const std::string& message) {
            std::lock_guard<std::mutex> lock(notices_mutex_);
            notices_.push_back(session.session_id + ": " + message);
        });
        orchestrator_->Start();
        return *orchestrator_;
    }

    SessionInfo SpawnRunning(const std::string& challenge_id, const std::string& user_id)
    {
        auto session = orchestrator_->Spawn(challenge_id, user_id);
        return orchestrator_->WaitForRunning(session.session_id, 2s);
    }

    std::string FlagOf(const SessionInfo& session)
    {
        auto config = engine_.ConfigOf(session.container_id);
        return config ? config->environment_vars.at("FLAG") : std::string();
    }

    SessionStatus StatusOf(const std::string& session_id)
    {
        return orchestrator_->GetSession(session_id).status;
    }

    std::size_t NoticeCount()
    {
        std::lock_guard<std::mutex> lock(notices_mutex_);
        return notices_.size();
    }

    core::ChallengeCatalog catalog_;
    core::SecurityProfileResolver profiles_;
    core::FlagSystem flags_{"orchestrator-test-secret"};
    test::FakeContainerEngine engine_;
    std::unique_ptr<Orchestrator> orchestrator_;

    std::mutex notices_mutex_;
    std::vector<std::string> notices_;
};

// ============================================================================
// Spawn
// ============================================================================

TEST_F(OrchestratorTest, SpawnReturnsStartingThenRuns)
{
    auto& orchestrator = Start();
    auto session = orchestrator.Spawn("web-xss-01", "alice");

    EXPECT_EQ(session.status, SessionStatus::STARTING);
    EXPECT_EQ(session.session_id.size(), 16u);
    EXPECT_EQ(session.challenge_id, "web-xss-01");

    auto running = orchestrator.WaitForRunning(session.session_id, 2s);
    EXPECT_EQ(running.status, SessionStatus::RUNNING);
    EXPECT_FALSE(running.container_id.empty());
    EXPECT_EQ(running.access_url, "http://localhost:32768");
    EXPECT_EQ(engine_.Creates(), 1);
    EXPECT_EQ(engine_.Starts(), 1);
}

TEST_F(OrchestratorTest, ContainerIsCreatedWithSessionIdentity)
{
    Start();
    auto session = SpawnRunning("web-xss-01", "alice");

    auto config = engine_.ConfigOf(session.container_id);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->name, "challenge-web-xss-01-" + session.session_id);
    EXPECT_EQ(config->image, "breachlab/web-xss-01:latest");

    const auto& env = config->environment_vars;
    EXPECT_EQ(env.at("CHALLENGE_ID"), "web-xss-01");
    EXPECT_EQ(env.at("USER_ID"), "alice");
    EXPECT_EQ(env.at("SESSION_ID"), session.session_id);
    EXPECT_EQ(env.at("SESSION_TIMEOUT"), "3600");
    EXPECT_EQ(env.at("SESSION_TAG"), "web-xss-01-alice-" + session.session_id);
    EXPECT_TRUE(core::FlagSystem::IsWellFormed(env.at("FLAG")));
    EXPECT_EQ(env.at("CHALLENGE_FLAG"), env.at("FLAG"));

    EXPECT_EQ(config->labels.at("breachlab.challenge.id"), "web-xss-01");
    EXPECT_EQ(config->labels.at("breachlab.challenge.user"), "alice");
    EXPECT_EQ(config->labels.at("breachlab.challenge.session"), session.session_id);
    EXPECT_EQ(config->labels.at("breachlab.challenge.category"), "web");

    // Default profile: caps dropped, memory clamped to the 512 MB ceiling
    EXPECT_EQ(config->capabilities_drop, std::vector<std::string>{"ALL"});
    EXPECT_TRUE(config->capabilities_add.empty());
    EXPECT_EQ(config->memory_limit_mb, 512u);
    EXPECT_EQ(config->user, "1000:1000");
}

TEST_F(OrchestratorTest, AccessUrlPrefersWebPorts)
{
    Start();
    auto session = SpawnRunning("crypto-01", "alice");

    auto config = engine_.ConfigOf(session.container_id);
    ASSERT_TRUE(config.has_value());
    // Fake engine publishes in port order: 22 -> 32768, 3000 -> 32769
    EXPECT_EQ(session.access_url, "http://localhost:32769");
}

TEST_F(OrchestratorTest, FlagsDifferBetweenSessions)
{
    Start();
    auto alice = SpawnRunning("web-xss-01", "alice");
    auto bob = SpawnRunning("web-xss-01", "bob");

    EXPECT_NE(FlagOf(alice), FlagOf(bob));
    EXPECT_FALSE(orchestrator_->ValidateFlagSubmission(alice.session_id, FlagOf(bob)).valid);
}

TEST_F(OrchestratorTest, DuplicateSpawnIsRejectedUntilStopped)
{
    auto& orchestrator = Start();
    auto first = SpawnRunning("web-xss-01", "alice");

    EXPECT_THROW(orchestrator.Spawn("web-xss-01", "alice"), core::DuplicateSessionError);
    EXPECT_EQ(engine_.Creates(), 1);

    ASSERT_TRUE(orchestrator.Stop(first.session_id).success);
    auto second = SpawnRunning("web-xss-01", "alice");
    EXPECT_NE(second.session_id, first.session_id);
    EXPECT_EQ(second.status, SessionStatus::RUNNING);
}

TEST_F(OrchestratorTest, ConcurrencyLimitRejectsWithoutCreatingContainer)
{
    auto config = FastConfig();
    config.max_concurrent_sessions = 1;
    auto& orchestrator = Start(config);

    SpawnRunning("web-xss-01", "alice");
    EXPECT_THROW(orchestrator.Spawn("crypto-01", "bob"), core::ConcurrencyLimitError);
    EXPECT_EQ(engine_.Creates(), 1);
    EXPECT_EQ(orchestrator.GetRunningSessions().size(), 1u);
}

TEST_F(OrchestratorTest, PerUserLimitApplies)
{
    auto config = FastConfig();
    config.max_sessions_per_user = 1;
    auto& orchestrator = Start(config);

    SpawnRunning("web-xss-01", "alice");
    EXPECT_THROW(orchestrator.Spawn("crypto-01", "alice"), core::ConcurrencyLimitError);
    EXPECT_NO_THROW(SpawnRunning("crypto-01", "bob"));
}

TEST_F(OrchestratorTest, InvalidSpawnRequestsHaveNoSideEffects)
{
    auto& orchestrator = Start();

    EXPECT_THROW(orchestrator.Spawn("no-such-challenge", "alice"), core::UnknownChallengeError);
    EXPECT_THROW(orchestrator.Spawn("web-xss-01", "  "), core::ValidationError);
    EXPECT_THROW(orchestrator.Spawn("", "alice"), core::ValidationError);
    EXPECT_THROW(orchestrator.Spawn("web-xss-01", "alice", 30s), core::ValidationError);
    EXPECT_THROW(orchestrator.Spawn("web-xss-01", "alice", 7201s), core::ValidationError);

    EXPECT_EQ(engine_.Creates(), 0);
    EXPECT_EQ(orchestrator.GetStats().active, 0u);
}

TEST_F(OrchestratorTest, CustomTimeoutIsApplied)
{
    auto& orchestrator = Start();
    auto session = orchestrator.Spawn("web-xss-01", "alice", 120s);
    auto running = orchestrator.WaitForRunning(session.session_id, 2s);

    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(running.expires_at - running.created_at), 120s);
    EXPECT_EQ(engine_.ConfigOf(running.container_id)->environment_vars.at("SESSION_TIMEOUT"), "120");
}

// ============================================================================
// Provisioning failures
// ============================================================================

TEST_F(OrchestratorTest, CreateFailureEndsInError)
{
    auto& orchestrator = Start();
    engine_.FailCreate(true);

    auto session = orchestrator.Spawn("web-xss-01", "alice");
    EXPECT_THROW(orchestrator.WaitForRunning(session.session_id, 2s), core::ProvisionError);

    auto ended = orchestrator.GetSession(session.session_id);
    EXPECT_EQ(ended.status, SessionStatus::ERROR);
    EXPECT_NE(ended.last_error.find("Provisioning failed"), std::string::npos);

    engine_.FailCreate(false);
    EXPECT_NO_THROW(SpawnRunning("web-xss-01", "alice"));
}

TEST_F(OrchestratorTest, StartFailureRemovesPartialContainer)
{
    auto& orchestrator = Start();
    engine_.FailStart(true);

    auto session = orchestrator.Spawn("web-xss-01", "alice");
    EXPECT_THROW(orchestrator.WaitForRunning(session.session_id, 2s), core::ProvisionError);

    EXPECT_EQ(engine_.Creates(), 1);
    EXPECT_EQ(engine_.Removes(), 1);
    EXPECT_EQ(engine_.LiveCount(), 0u);
}

// ============================================================================
// Flags and grace period
// ============================================================================

TEST_F(OrchestratorTest, XssChallengeSolvedEndToEnd)
{
    auto& orchestrator = Start();
    auto session = SpawnRunning("web-xss-01", "alice");
    auto flag = FlagOf(session);
    ASSERT_FALSE(flag.empty());

    auto wrong = orchestrator.ValidateFlagSubmission(session.session_id, "flag{0000000000000000}");
    EXPECT_FALSE(wrong.valid);
    EXPECT_EQ(wrong.message, "Incorrect flag. Try again!");
    EXPECT_EQ(StatusOf(session.session_id), SessionStatus::RUNNING);

    auto right = orchestrator.ValidateFlagSubmission(session.session_id, "  " + flag + "\n");
    EXPECT_TRUE(right.valid);

    auto in_grace = orchestrator.GetSession(session.session_id);
    EXPECT_EQ(in_grace.status, SessionStatus::STOPPING);
    EXPECT_TRUE(in_grace.solved);
    EXPECT_TRUE(in_grace.grace_ends_at.has_value());
    EXPECT_EQ(in_grace.flag_attempts, 2);
    EXPECT_EQ(NoticeCount(), 1u);

    ASSERT_TRUE(WaitFor([&] { return StatusOf(session.session_id) == SessionStatus::STOPPED; }));
    EXPECT_FALSE(engine_.Exists(session.container_id));
    EXPECT_TRUE(orchestrator.GetSession(session.session_id).solved);
    EXPECT_EQ(orchestrator.GetStats().solved, 1u);
}

TEST_F(OrchestratorTest, ResubmittingDuringGraceIsAcknowledged)
{
    auto config = FastConfig();
    config.grace_period = 10s;
    auto& orchestrator = Start(config);
    auto session = SpawnRunning("web-xss-01", "alice");
    auto flag = FlagOf(session);

    ASSERT_TRUE(orchestrator.ValidateFlagSubmission(session.session_id, flag).valid);
    auto again = orchestrator.ValidateFlagSubmission(session.session_id, flag);
    EXPECT_TRUE(again.valid);
    EXPECT_NE(again.message.find("already"), std::string::npos);
    EXPECT_EQ(NoticeCount(), 1u);
}

TEST_F(OrchestratorTest, StopDuringGraceTearsDownImmediately)
{
    auto config = FastConfig();
    config.grace_period = 10s;
    auto& orchestrator = Start(config);
    auto session = SpawnRunning("web-xss-01", "alice");

    ASSERT_TRUE(orchestrator.ValidateFlagSubmission(session.session_id, FlagOf(session)).valid);
    auto result = orchestrator.Stop(session.session_id);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(StatusOf(session.session_id), SessionStatus::STOPPED);
    EXPECT_FALSE(engine_.Exists(session.container_id));
}

TEST_F(OrchestratorTest, FlagSubmissionValidatesInput)
{
    auto& orchestrator = Start();
    auto session = SpawnRunning("web-xss-01", "alice");
    const auto flag = FlagOf(session);
    ASSERT_FALSE(flag.empty());

    EXPECT_THROW(orchestrator.ValidateFlagSubmission(session.session_id, "   "), core::ValidationError);
    EXPECT_THROW(orchestrator.ValidateFlagSubmission("unknown", "flag{0000000000000000}"),
                 core::InvalidSessionError);

    // The correct flag no longer counts once the session has been stopped
    ASSERT_TRUE(orchestrator.Stop(session.session_id).success);
    EXPECT_THROW(orchestrator.ValidateFlagSubmission(session.session_id, flag), core::InvalidSessionError);
    EXPECT_FALSE(orchestrator.GetSession(session.session_id).solved);
}

// ============================================================================
// Stop / expiry
// ============================================================================

TEST_F(OrchestratorTest, ManualStopIsImmediateAndIdempotent)
{
    auto& orchestrator = Start();
    auto session = SpawnRunning("web-xss-01", "alice");

    auto result = orchestrator.Stop(session.session_id);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(StatusOf(session.session_id), SessionStatus::STOPPED);
    EXPECT_EQ(engine_.LiveCount(), 0u);
    EXPECT_EQ(engine_.Stops(), 1);

    auto again = orchestrator.Stop(session.session_id);
    EXPECT_TRUE(again.success);
    EXPECT_EQ(engine_.Removes(), 1);

    EXPECT_THROW(orchestrator.Stop("unknown"), core::InvalidSessionError);
}

TEST_F(OrchestratorTest, StopWhileStartingIsDeferred)
{
    auto& orchestrator = Start();
    engine_.HoldCreates();

    auto session = orchestrator.Spawn("web-xss-01", "alice");
    ASSERT_TRUE(WaitFor([&] { return engine_.Creates() == 1; }));

    auto result = orchestrator.Stop(session.session_id);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(StatusOf(session.session_id), SessionStatus::STARTING);

    engine_.ReleaseCreates();
    ASSERT_TRUE(WaitFor([&] { return StatusOf(session.session_id) == SessionStatus::STOPPED; }));
    EXPECT_EQ(engine_.LiveCount(), 0u);
}

TEST_F(OrchestratorTest, ExpiredSessionIsTornDown)
{
    auto config = FastConfig();
    config.session_timeout = 150ms;
    auto& orchestrator = Start(config);
    auto session = SpawnRunning("web-xss-01", "alice");

    ASSERT_TRUE(WaitFor([&] { return StatusOf(session.session_id) == SessionStatus::STOPPED; }));
    EXPECT_FALSE(engine_.Exists(session.container_id));
    EXPECT_FALSE(orchestrator.GetSession(session.session_id).solved);
}

TEST_F(OrchestratorTest, FailedRemovalIsRetried)
{
    auto& orchestrator = Start();
    auto session = SpawnRunning("web-xss-01", "alice");
    engine_.FailNextRemovals(1);

    auto result = orchestrator.Stop(session.session_id);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("retry"), std::string::npos);

    ASSERT_TRUE(WaitFor([&] { return StatusOf(session.session_id) == SessionStatus::STOPPED; }));
    EXPECT_EQ(engine_.Removes(), 2);
    EXPECT_EQ(engine_.LiveCount(), 0u);
}

// ============================================================================
// Health
// ============================================================================

TEST_F(OrchestratorTest, UnrecoverableContainerEndsInError)
{
    engine_.SetDefaultHealth("unhealthy");
    auto& orchestrator = Start();
    auto session = SpawnRunning("web-xss-01", "alice");

    ASSERT_TRUE(WaitFor([&] { return StatusOf(session.session_id) == SessionStatus::ERROR; }));
    EXPECT_LT(engine_.Restarts(), 3);
    EXPECT_EQ(engine_.LiveCount(), 0u);

    auto ended = orchestrator.GetSession(session.session_id);
    EXPECT_EQ(ended.health, core::HealthStatus::UNHEALTHY);
    EXPECT_FALSE(ended.last_error.empty());
}

TEST_F(OrchestratorTest, UnhealthyDuringGraceEndsInErrorButStaysSolved)
{
    engine_.SetDefaultHealth("healthy");
    auto config = FastConfig();
    config.grace_period = 10s;
    auto& orchestrator = Start(config);
    auto session = SpawnRunning("web-xss-01", "alice");

    ASSERT_TRUE(orchestrator.ValidateFlagSubmission(session.session_id, FlagOf(session)).valid);
    engine_.SetHealth(session.container_id, "unhealthy");

    ASSERT_TRUE(WaitFor([&] { return StatusOf(session.session_id) == SessionStatus::ERROR; }));
    auto ended = orchestrator.GetSession(session.session_id);
    EXPECT_TRUE(ended.solved);
    EXPECT_EQ(engine_.Restarts(), 0);
    EXPECT_FALSE(engine_.Exists(session.container_id));
}

TEST_F(OrchestratorTest, SessionHealthIsReported)
{
    engine_.SetDefaultHealth("healthy");
    auto& orchestrator = Start();
    auto session = SpawnRunning("web-xss-01", "alice");

    ASSERT_TRUE(WaitFor([&] {
        return orchestrator.GetSessionHealth(session.session_id) == core::HealthStatus::HEALTHY;
    }));
    EXPECT_THROW(orchestrator.GetSessionHealth("unknown"), core::InvalidSessionError);
}

// ============================================================================
// Queries / shutdown
// ============================================================================

TEST_F(OrchestratorTest, QueriesReflectActiveSessions)
{
    auto& orchestrator = Start();
    SpawnRunning("web-xss-01", "alice");
    SpawnRunning("crypto-01", "bob");

    EXPECT_EQ(orchestrator.ListChallenges().size(), 2u);
    EXPECT_EQ(orchestrator.ListRunning().size(), 2u);
    EXPECT_EQ(orchestrator.GetRunningSessions().size(), 2u);

    auto stats = orchestrator.GetStats();
    EXPECT_EQ(stats.running, 2u);
    EXPECT_EQ(stats.unique_users, 2u);
}

TEST_F(OrchestratorTest, SessionListsCanBeFilteredByUser)
{
    auto& orchestrator = Start();
    auto alice_xss = SpawnRunning("web-xss-01", "alice");
    auto alice_crypto = SpawnRunning("crypto-01", "alice");
    auto bob = SpawnRunning("crypto-01", "bob");

    auto alice_running = orchestrator.ListRunning("alice");
    ASSERT_EQ(alice_running.size(), 2u);
    for (const auto& session : alice_running) {
        EXPECT_EQ(session.user_id, "alice");
    }

    auto bob_active = orchestrator.GetRunningSessions(" bob ");
    ASSERT_EQ(bob_active.size(), 1u);
    EXPECT_EQ(bob_active[0].session_id, bob.session_id);

    EXPECT_TRUE(orchestrator.ListRunning("carol").empty());
    EXPECT_EQ(orchestrator.ListRunning().size(), 3u);

    ASSERT_TRUE(orchestrator.Stop(alice_xss.session_id).success);
    auto remaining = orchestrator.GetRunningSessions("alice");
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].session_id, alice_crypto.session_id);
}

TEST_F(OrchestratorTest, DefaultConfigurationIsUsedWithoutExplicitConfig)
{
    Orchestrator orchestrator(catalog_, profiles_, flags_, engine_);

    auto session = orchestrator.Spawn("web-xss-01", "alice");
    EXPECT_EQ(session.expires_at - session.created_at, std::chrono::hours(1));

    session = orchestrator.WaitForRunning(session.session_id, 2s);
    EXPECT_EQ(session.status, SessionStatus::RUNNING);
    EXPECT_EQ(session.access_url, "http://localhost:32768");

    orchestrator.Shutdown();
    EXPECT_EQ(engine_.LiveCount(), 0u);
}

TEST_F(OrchestratorTest, ShutdownRemovesEveryContainer)
{
    auto& orchestrator = Start();
    auto alice = SpawnRunning("web-xss-01", "alice");
    auto bob = SpawnRunning("crypto-01", "bob");

    orchestrator.Shutdown();

    EXPECT_EQ(engine_.LiveCount(), 0u);
    EXPECT_EQ(StatusOf(alice.session_id), SessionStatus::STOPPED);
    EXPECT_EQ(StatusOf(bob.session_id), SessionStatus::STOPPED);
    EXPECT_THROW(orchestrator.Spawn("web-xss-01", "carol"), core::ProvisionError);
    EXPECT_NO_THROW(orchestrator.Shutdown());
}

}  // namespace
}  // namespace breachlab
