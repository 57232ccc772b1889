/**
 * @file orchestrator.hpp
 * @brief Challenge session orchestration (spawn, stop, flags, timeouts)
 *
 * The Orchestrator turns catalog entries into running, isolated containers
 * and owns the session lifecycle protocol:
 *
 * - **Spawn**: validate input, reserve a session (duplicate and concurrency
 *   checks), then provision the container asynchronously. The call returns
 *   as soon as the session is reserved, with status "starting".
 * - **Flag submission**: constant-time verification; a correct flag starts a
 *   grace period, after which the container is removed.
 * - **Stop**: immediate, idempotent teardown; cancels a grace period.
 * - **Timeouts**: one deadline thread tears down expired sessions and
 *   finished grace periods.
 * - **Health**: an embedded HealthMonitor restarts flaky containers and
 *   reports unrecoverable ones, which are torn down with status "error".
 *
 * Engine calls never run under the session registry lock.
 *
 * @date 2025
 */

#pragma once

#include "breachlab/core/challenge_catalog.hpp"
#include "breachlab/core/flag_system.hpp"
#include "breachlab/core/health_monitor.hpp"
#include "breachlab/core/security_profiles.hpp"
#include "breachlab/core/session_registry.hpp"
#include "breachlab/utils/container_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace breachlab {
namespace core {

/**
 * @struct SessionInfo
 * @brief Client-facing view of a session (never contains the flag)
 */
struct SessionInfo {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string session_id;                     ///< Session token
    std::string challenge_id;                   ///< Catalog id
    std::string user_id;                        ///< Owner
    std::string container_id;                   ///< Engine container id (may be empty while starting)
    std::string access_url;                     ///< Challenge URL once running
    SessionStatus status{SessionStatus::STARTING};  ///< Lifecycle state
    HealthStatus health{HealthStatus::UNKNOWN};     ///< Last health observation
    TimePoint created_at;                       ///< Spawn time
    TimePoint expires_at;                       ///< Hard timeout
    std::optional<TimePoint> grace_ends_at;     ///< Set while in grace after a solve
    bool solved{false};                         ///< Correct flag submitted
    int flag_attempts{0};                       ///< Submissions so far
    std::string last_error;                     ///< Failure detail, if any
};

/**
 * @struct StopResult
 * @brief Outcome of Stop()
 */
struct StopResult {
    bool success{false};
    std::string message;
};

/**
 * @struct FlagValidationResult
 * @brief Outcome of ValidateFlagSubmission()
 */
struct FlagValidationResult {
    bool valid{false};
    std::string message;
};

/**
 * @class Orchestrator
 * @brief Session lifecycle owner
 *
 * **Usage Example**:
 * @code
 * utils::DockerEngine docker;
 * Orchestrator orchestrator(catalog, profiles, flags, docker);
 * orchestrator.Start();
 *
 * auto info = orchestrator.Spawn("web-xss-01", "alice");
 * info = orchestrator.WaitForRunning(info.session_id, std::chrono::seconds(60));
 * spdlog::info("Challenge ready at {}", info.access_url);
 *
 * auto result = orchestrator.ValidateFlagSubmission(info.session_id, "flag{...}");
 * orchestrator.Shutdown();
 * @endcode
 */
class Orchestrator {
public:
    /**
     * @struct Config
     * @brief Orchestration limits and timings
     */
    struct Config {
        std::size_t max_concurrent_sessions{10};                               ///< STARTING + RUNNING ceiling
        std::size_t max_sessions_per_user{5};                                  ///< Per-user ceiling
        std::size_t history_size{100};                                         ///< Retained terminal sessions
        std::chrono::milliseconds session_timeout{std::chrono::hours(1)};      ///< Default session lifetime
        std::chrono::milliseconds grace_period{std::chrono::seconds(30)};      ///< Delay after a correct flag
        std::chrono::milliseconds teardown_retry{std::chrono::seconds(5)};     ///< Delay before retrying a failed removal
        std::chrono::seconds stop_timeout{10};                                 ///< Engine stop timeout
        std::string host{"localhost"};                                         ///< Host name used in access URLs
        HealthMonitor::Config health;                                          ///< Health monitor settings
    };

    /// One user-visible notice (e.g. grace period started)
    using NoticeCallback = std::function<void(const SessionInfo& session, const std::string& message)>;

    static constexpr std::chrono::seconds kMinSessionTimeout{60};
    static constexpr std::chrono::seconds kMaxSessionTimeout{7200};

    Orchestrator(const ChallengeCatalog& catalog,
                 const SecurityProfileResolver& profiles,
                 const FlagSystem& flags,
                 utils::ContainerEngine& engine);
    Orchestrator(const ChallengeCatalog& catalog,
                 const SecurityProfileResolver& profiles,
                 const FlagSystem& flags,
                 utils::ContainerEngine& engine,
                 const Config& config);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Start the health monitor and the deadline thread
     */
    void Start();

    /**
     * @brief Stop background threads and tear down every active session
     *
     * Idempotent. Spawn() fails with ProvisionError afterwards.
     */
    void Shutdown();

    /**
     * @brief Reserve a session and provision its container asynchronously
     *
     * All validation happens before any engine call; a rejected request has
     * no side effects.
     *
     * @return Session in status "starting"
     * @throws ValidationError, UnknownChallengeError, DuplicateSessionError,
     *         ConcurrencyLimitError
     */
    SessionInfo Spawn(const std::string& challenge_id, const std::string& user_id);

    /**
     * @brief Spawn with an explicit session timeout (60 to 7200 seconds)
     */
    SessionInfo Spawn(const std::string& challenge_id, const std::string& user_id,
                      std::chrono::seconds session_timeout);

    /**
     * @brief Block until a session leaves "starting"
     * @return Latest session view (may still be starting on timeout)
     * @throws InvalidSessionError if unknown, ProvisionError if provisioning failed
     */
    SessionInfo WaitForRunning(const std::string& session_id, std::chrono::milliseconds timeout);

    /**
     * @brief Tear a session down immediately (idempotent)
     * @throws InvalidSessionError for unknown ids
     */
    StopResult Stop(const std::string& session_id);

    /**
     * @brief Check a submitted flag; start the grace period on success
     * @throws ValidationError on empty submission, InvalidSessionError if
     *         the session is not active
     */
    FlagValidationResult ValidateFlagSubmission(const std::string& session_id,
                                                const std::string& submitted_flag);

    /**
     * @brief Session by id (active or recently ended)
     * @throws InvalidSessionError if unknown
     */
    SessionInfo GetSession(const std::string& session_id) const;

    /**
     * @brief Snapshot of sessions in status "running"
     * @param user_id Only this user's sessions; empty for all users
     */
    std::vector<SessionInfo> ListRunning(const std::string& user_id = "") const;

    /**
     * @brief Snapshot of every active session (starting, running, stopping)
     * @param user_id Only this user's sessions; empty for all users
     */
    std::vector<SessionInfo> GetRunningSessions(const std::string& user_id = "") const;

    /**
     * @throws InvalidSessionError if unknown
     */
    HealthStatus GetSessionHealth(const std::string& session_id) const;

    std::vector<ChallengeDefinition> ListChallenges() const;

    SessionStats GetStats() const;

    HealthSummary GetHealthSummary() const;

    void SetNoticeCallback(NoticeCallback callback);

private:
    SessionInfo SpawnSession(const std::string& challenge_id, const std::string& user_id,
                             std::chrono::milliseconds session_timeout);

    void Provision(const ChallengeSession& session, const ChallengeDefinition& challenge);

    utils::ContainerConfig BuildContainerConfig(const ChallengeSession& session,
                                                const ChallengeDefinition& challenge) const;

    std::string DeriveAccessUrl(const utils::ContainerInspection& inspection,
                                const ContainerSpec& spec) const;

    /// Claim and execute a teardown; false if someone else owns it or removal failed
    bool Teardown(const std::string& session_id, TeardownReason reason);

    /// Stop and remove the container of an already-claimed session
    bool ExecuteTeardown(const ChallengeSession& claimed, TeardownReason reason);

    void HandleHealthFailure(const std::string& session_id, const std::string& reason);

    void DeadlineLoop();
    void WakeDeadlineThread();

    void LaunchTask(std::function<void()> task);
    void PruneTasks();
    void WaitForTasks();

    std::int64_t NextFlagTimestamp();

    std::vector<SessionInfo> SnapshotFor(const std::string& user_id,
                                         std::optional<SessionStatus> status) const;

    SessionInfo ToInfo(const ChallengeSession& session) const;

    void EmitNotice(const SessionInfo& session, const std::string& message);

    const ChallengeCatalog& catalog_;
    const SecurityProfileResolver& profiles_;
    const FlagSystem& flags_;
    utils::ContainerEngine& engine_;
    Config config_;

    SessionRegistry registry_;
    HealthMonitor monitor_;

    std::atomic<bool> started_{false};
    std::atomic<bool> shutting_down_{false};
    std::atomic<std::int64_t> last_flag_timestamp_{0};

    std::thread deadline_thread_;
    std::mutex deadline_mutex_;
    std::condition_variable deadline_cv_;
    bool deadline_dirty_{false};

    std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;   ///< Provisioning and teardown tasks

    std::mutex notice_mutex_;
    NoticeCallback notice_callback_;
};

} // namespace core
} // namespace breachlab
