/**
 * @file session_registry.hpp
 * @brief Thread-safe in-memory store of challenge sessions
 *
 * The registry owns every ChallengeSession and is the only place session
 * state changes. All mutations and snapshot reads are serialized under one
 * mutex, and every status change is checked against the lifecycle:
 *
 * @code
 *   STARTING ──► RUNNING ──► STOPPING ──► STOPPED
 *      │            │            │
 *      └────────────┴────────────┴──────► ERROR
 * @endcode
 *
 * Terminal sessions (STOPPED, ERROR) are evicted from the active map into a
 * bounded history so their final state stays queryable. History entries never
 * count towards duplicate or concurrency checks.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace breachlab {
namespace core {

/**
 * @enum SessionStatus
 * @brief Session lifecycle states
 */
enum class SessionStatus {
    STARTING,   ///< Allocated, container being provisioned
    RUNNING,    ///< Container up and reachable
    STOPPING,   ///< Grace period or teardown in progress
    STOPPED,    ///< Container removed (terminal)
    ERROR       ///< Provisioning or health failure (terminal)
};

/**
 * @enum HealthStatus
 * @brief Last health observation for a session's container
 */
enum class HealthStatus {
    UNKNOWN,    ///< Not checked yet or engine unreachable
    STARTING,   ///< Health check still warming up
    HEALTHY,    ///< Passing
    UNHEALTHY   ///< Failing
};

/**
 * @enum TeardownReason
 * @brief Why a session is being torn down
 */
enum class TeardownReason {
    NONE,
    SOLVED,      ///< Grace period after a correct flag elapsed
    MANUAL,      ///< Explicit Stop()
    EXPIRED,     ///< expires_at passed
    UNHEALTHY,   ///< Health monitor gave up (final status ERROR)
    CANCELLED,   ///< Stop() arrived while starting
    SHUTDOWN     ///< Engine shutting down
};

std::string SessionStatusToString(SessionStatus status);
std::string HealthStatusToString(HealthStatus status);
std::string TeardownReasonToString(TeardownReason reason);

inline bool IsTerminal(SessionStatus status) {
    return status == SessionStatus::STOPPED || status == SessionStatus::ERROR;
}

/**
 * @struct ChallengeSession
 * @brief One user's live attempt at one challenge
 */
struct ChallengeSession {
    using TimePoint = std::chrono::system_clock::time_point;

    // Identity
    std::string session_id;       ///< Opaque random token
    std::string challenge_id;     ///< Catalog id
    std::string user_id;          ///< Requesting user
    std::string container_id;     ///< Set once the engine created the container
    std::string container_name;   ///< challenge-<challenge>-<session>
    std::string access_url;       ///< Where the user reaches the challenge

    // State
    SessionStatus status{SessionStatus::STARTING};   ///< Lifecycle state
    HealthStatus health{HealthStatus::UNKNOWN};      ///< Last health observation
    std::int64_t flag_timestamp{0};                  ///< Flag input (microseconds since epoch)

    // Timing
    TimePoint created_at;                        ///< Spawn time
    TimePoint expires_at;                        ///< Hard session timeout
    std::optional<TimePoint> teardown_deadline;  ///< Grace end or removal retry
    std::optional<TimePoint> ended_at;           ///< Time of eviction

    // Bookkeeping
    bool solved{false};                                 ///< Correct flag submitted
    bool cancel_requested{false};                       ///< Stop() arrived while starting
    bool teardown_claimed{false};                       ///< A teardown is executing
    TeardownReason pending_reason{TeardownReason::NONE};  ///< Reason to use for a retried teardown
    int flag_attempts{0};                               ///< Submissions so far
    std::string last_error;                             ///< Most recent failure
};

/**
 * @struct SessionStats
 * @brief Counts over active sessions and history
 */
struct SessionStats {
    std::size_t active{0};
    std::size_t starting{0};
    std::size_t running{0};
    std::size_t stopping{0};
    std::size_t stopped{0};       ///< In history
    std::size_t errored{0};       ///< In history
    std::size_t solved{0};        ///< Active + history
    std::size_t unique_users{0};  ///< Users with an active session
};

/**
 * @struct DueTeardown
 * @brief A session whose deadline passed and whose teardown was just claimed
 */
struct DueTeardown {
    ChallengeSession session;
    TeardownReason reason{TeardownReason::NONE};
};

/**
 * @class SessionRegistry
 * @brief Single-mutex session store with validated transitions
 *
 * **Usage Example**:
 * @code
 * SessionRegistry registry({10, 5, 100});
 * registry.Insert(session);                 // duplicate + limit checks
 * registry.AttachContainer(id, container);
 * registry.MarkRunning(id, "http://localhost:32768");
 * ...
 * if (auto claimed = registry.ClaimTeardown(id, TeardownReason::MANUAL)) {
 *     // stop + remove container, then:
 *     registry.Finalize(id, SessionStatus::STOPPED, "stopped by user");
 * }
 * @endcode
 */
class SessionRegistry {
public:
    using TimePoint = ChallengeSession::TimePoint;

    /**
     * @struct Config
     * @brief Registry limits
     */
    struct Config {
        std::size_t max_active_sessions{10};    ///< STARTING + RUNNING ceiling
        std::size_t max_sessions_per_user{5};   ///< Non-terminal sessions per user
        std::size_t history_size{100};          ///< Retained terminal sessions
    };

    /// Called after every status change, outside the registry lock
    using TransitionObserver = std::function<void(const ChallengeSession& session,
                                                  SessionStatus from, SessionStatus to)>;

    SessionRegistry();
    explicit SessionRegistry(const Config& config);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Add a new STARTING session
     *
     * Duplicate (challenge, user), global concurrency and per-user limits
     * are checked atomically with the insertion.
     *
     * @throws DuplicateSessionError, ConcurrencyLimitError, ValidationError
     */
    void Insert(const ChallengeSession& session);

    /**
     * @brief Active session or, failing that, the most recent history entry
     */
    std::optional<ChallengeSession> Get(const std::string& session_id) const;

    /**
     * @brief Active (non-evicted) session only
     */
    std::optional<ChallengeSession> GetActive(const std::string& session_id) const;

    bool IsActive(const std::string& session_id) const;

    /**
     * @brief Copy of active sessions, optionally filtered by status
     */
    std::vector<ChallengeSession> Snapshot(std::optional<SessionStatus> filter = std::nullopt) const;

    /**
     * @brief Record the engine container id (STARTING only)
     * @return false if the session is not starting
     */
    bool AttachContainer(const std::string& session_id, const std::string& container_id);

    /**
     * @brief STARTING -> RUNNING; requires an attached container
     * @return false if the transition is not allowed
     */
    bool MarkRunning(const std::string& session_id, const std::string& access_url);

    /**
     * @brief RUNNING -> STOPPING with a grace deadline; marks the session solved
     * @return false unless the session was running and unclaimed
     */
    bool BeginGrace(const std::string& session_id, TimePoint deadline);

    /**
     * @brief Ask a STARTING session to stop once provisioning completes
     * @return false if the session is no longer starting
     */
    bool RequestCancel(const std::string& session_id);

    /**
     * @brief Claim the exclusive right to tear a session down
     *
     * Sessions in RUNNING move to STOPPING, except for UNHEALTHY teardowns,
     * which keep their status so the session goes straight to ERROR.
     * STARTING sessions cannot be claimed.
     *
     * @return Snapshot of the claimed session, or std::nullopt if it is not
     *         active, still starting, or already claimed
     */
    std::optional<ChallengeSession> ClaimTeardown(const std::string& session_id, TeardownReason reason);

    /**
     * @brief Give up a claim after a failed removal and schedule a retry
     */
    void ReleaseTeardown(const std::string& session_id, TimePoint retry_at,
                         TeardownReason reason, const std::string& error);

    /**
     * @brief Claim every unclaimed session whose deadline has passed
     *
     * Grace and retry deadlines (teardown_deadline) and expires_at are both
     * considered. STARTING sessions are skipped.
     */
    std::vector<DueTeardown> ClaimDue(TimePoint now);

    /**
     * @brief Earliest pending deadline among unclaimed, non-starting sessions
     */
    std::optional<TimePoint> NextDeadline() const;

    /**
     * @brief Move a session to STOPPED or ERROR and evict it to history
     * @param reason Logged and stored as last_error for ERROR
     * @return false if the session is not active or the transition is invalid
     */
    bool Finalize(const std::string& session_id, SessionStatus final_status,
                  const std::string& reason);

    bool UpdateHealth(const std::string& session_id, HealthStatus health);

    /**
     * @brief Store a failure message without changing status
     */
    void RecordError(const std::string& session_id, const std::string& error);

    /**
     * @brief Count a flag submission
     * @return Attempts so far, or 0 if the session is not active
     */
    int RecordFlagAttempt(const std::string& session_id);

    /**
     * @brief Block until the session leaves STARTING or the timeout elapses
     * @return Latest snapshot (active or history), std::nullopt if unknown
     */
    std::optional<ChallengeSession> WaitWhileStarting(const std::string& session_id,
                                                      std::chrono::milliseconds timeout) const;

    SessionStats Stats() const;

    std::size_t ActiveCount() const;

    void SetTransitionObserver(TransitionObserver observer);

    /**
     * @brief Check a transition against the lifecycle graph
     */
    static bool IsValidTransition(SessionStatus from, SessionStatus to);

private:
    /// Apply a status change under the lock; returns false if not allowed
    bool TransitionLocked(ChallengeSession& session, SessionStatus to);

    void Notify(const ChallengeSession& session, SessionStatus from, SessionStatus to) const;

    Config config_;

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::map<std::string, ChallengeSession> sessions_;   ///< Active sessions by id
    std::deque<ChallengeSession> history_;               ///< Terminal sessions, newest last

    mutable std::mutex observer_mutex_;
    TransitionObserver observer_;
};

} // namespace core
} // namespace breachlab
