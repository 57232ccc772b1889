/**
 * @file session_registry.cpp
 * @brief Session store, lifecycle validation and audit logging
 *
 * Every transition produces one audit line:
 * @code
 * [AUDIT] session=4f2a.. challenge=web-xss-01 user=alice running -> stopping at 2025-01-31T12:00:00Z
 * @endcode
 *
 * @date 2025
 */

#include "breachlab/core/session_registry.hpp"
#include "breachlab/core/errors.hpp"
#include "breachlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace breachlab {
namespace core {

using utils::StringUtils;

// ============================================================================
// ENUM CONVERSION
// ============================================================================

std::string SessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::STARTING: return "starting";
        case SessionStatus::RUNNING:  return "running";
        case SessionStatus::STOPPING: return "stopping";
        case SessionStatus::STOPPED:  return "stopped";
        case SessionStatus::ERROR:    return "error";
    }
    return "unknown";
}

std::string HealthStatusToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::UNKNOWN:   return "unknown";
        case HealthStatus::STARTING:  return "starting";
        case HealthStatus::HEALTHY:   return "healthy";
        case HealthStatus::UNHEALTHY: return "unhealthy";
    }
    return "unknown";
}

std::string TeardownReasonToString(TeardownReason reason) {
    switch (reason) {
        case TeardownReason::NONE:      return "none";
        case TeardownReason::SOLVED:    return "solved";
        case TeardownReason::MANUAL:    return "manual";
        case TeardownReason::EXPIRED:   return "expired";
        case TeardownReason::UNHEALTHY: return "unhealthy";
        case TeardownReason::CANCELLED: return "cancelled";
        case TeardownReason::SHUTDOWN:  return "shutdown";
    }
    return "unknown";
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

SessionRegistry::SessionRegistry()
    : SessionRegistry(Config{}) {}

SessionRegistry::SessionRegistry(const Config& config)
    : config_(config) {
    if (config_.history_size == 0) {
        config_.history_size = 1;
    }
}

void SessionRegistry::SetTransitionObserver(TransitionObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

bool SessionRegistry::IsValidTransition(SessionStatus from, SessionStatus to) {
    switch (from) {
        case SessionStatus::STARTING:
            return to == SessionStatus::RUNNING || to == SessionStatus::ERROR;
        case SessionStatus::RUNNING:
            return to == SessionStatus::STOPPING || to == SessionStatus::ERROR;
        case SessionStatus::STOPPING:
            return to == SessionStatus::STOPPED || to == SessionStatus::ERROR;
        case SessionStatus::STOPPED:
        case SessionStatus::ERROR:
            return false;
    }
    return false;
}

// ============================================================================
// INSERTION
// ============================================================================

void SessionRegistry::Insert(const ChallengeSession& session) {
    if (session.session_id.empty() || session.challenge_id.empty() || session.user_id.empty()) {
        throw ValidationError("Session requires session, challenge and user ids");
    }
    if (session.status != SessionStatus::STARTING) {
        throw ValidationError("New sessions must start in 'starting'");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (sessions_.count(session.session_id) > 0) {
            throw ValidationError("Session id collision: " + session.session_id);
        }

        std::size_t live = 0;
        std::size_t per_user = 0;
        for (const auto& [id, existing] : sessions_) {
            if (existing.challenge_id == session.challenge_id &&
                existing.user_id == session.user_id) {
                throw DuplicateSessionError(session.challenge_id, session.user_id, id);
            }
            if (existing.status == SessionStatus::STARTING ||
                existing.status == SessionStatus::RUNNING) {
                ++live;
            }
            if (existing.user_id == session.user_id) {
                ++per_user;
            }
        }

        if (live >= config_.max_active_sessions) {
            throw ConcurrencyLimitError("Maximum concurrent sessions reached (" +
                                        std::to_string(config_.max_active_sessions) + ")");
        }
        if (per_user >= config_.max_sessions_per_user) {
            throw ConcurrencyLimitError("User " + session.user_id + " already has " +
                                        std::to_string(per_user) + " active sessions");
        }

        sessions_[session.session_id] = session;
    }

    spdlog::info("[AUDIT] session={} challenge={} user={} created as starting at {}",
                 session.session_id, session.challenge_id, session.user_id,
                 StringUtils::FormatTimestamp(session.created_at));
    changed_.notify_all();
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<ChallengeSession> SessionRegistry::Get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    for (auto hit = history_.rbegin(); hit != history_.rend(); ++hit) {
        if (hit->session_id == session_id) {
            return *hit;
        }
    }
    return std::nullopt;
}

std::optional<ChallengeSession> SessionRegistry::GetActive(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SessionRegistry::IsActive(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

std::vector<ChallengeSession> SessionRegistry::Snapshot(std::optional<SessionStatus> filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChallengeSession> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        if (!filter || session.status == *filter) {
            result.push_back(session);
        }
    }
    return result;
}

std::size_t SessionRegistry::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

SessionStats SessionRegistry::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SessionStats stats;
    std::set<std::string> users;
    stats.active = sessions_.size();
    for (const auto& [id, session] : sessions_) {
        switch (session.status) {
            case SessionStatus::STARTING: ++stats.starting; break;
            case SessionStatus::RUNNING:  ++stats.running;  break;
            case SessionStatus::STOPPING: ++stats.stopping; break;
            default: break;
        }
        if (session.solved) {
            ++stats.solved;
        }
        users.insert(session.user_id);
    }
    for (const auto& session : history_) {
        if (session.status == SessionStatus::STOPPED) {
            ++stats.stopped;
        } else {
            ++stats.errored;
        }
        if (session.solved) {
            ++stats.solved;
        }
    }
    stats.unique_users = users.size();
    return stats;
}

// ============================================================================
// TRANSITIONS
// ============================================================================

bool SessionRegistry::TransitionLocked(ChallengeSession& session, SessionStatus to) {
    if (!IsValidTransition(session.status, to)) {
        spdlog::warn("Rejected transition for session {}: {} -> {}",
                     session.session_id, SessionStatusToString(session.status),
                     SessionStatusToString(to));
        return false;
    }
    if (to == SessionStatus::RUNNING && session.container_id.empty()) {
        spdlog::warn("Rejected transition for session {}: running without container",
                     session.session_id);
        return false;
    }

    SessionStatus from = session.status;
    session.status = to;

    spdlog::info("[AUDIT] session={} challenge={} user={} {} -> {} at {}",
                 session.session_id, session.challenge_id, session.user_id,
                 SessionStatusToString(from), SessionStatusToString(to),
                 StringUtils::FormatTimestamp(std::chrono::system_clock::now()));
    return true;
}

void SessionRegistry::Notify(const ChallengeSession& session, SessionStatus from,
                             SessionStatus to) const {
    changed_.notify_all();

    TransitionObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (!observer) {
        return;
    }
    try {
        observer(session, from, to);
    } catch (const std::exception& e) {
        spdlog::error("Transition observer failed: {}", e.what());
    }
}

bool SessionRegistry::AttachContainer(const std::string& session_id,
                                      const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.status != SessionStatus::STARTING) {
        return false;
    }
    it->second.container_id = container_id;
    return true;
}

bool SessionRegistry::MarkRunning(const std::string& session_id, const std::string& access_url) {
    ChallengeSession snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        if (!TransitionLocked(it->second, SessionStatus::RUNNING)) {
            return false;
        }
        it->second.access_url = access_url;
        it->second.health = HealthStatus::STARTING;
        snapshot = it->second;
    }
    Notify(snapshot, SessionStatus::STARTING, SessionStatus::RUNNING);
    return true;
}

bool SessionRegistry::BeginGrace(const std::string& session_id, TimePoint deadline) {
    ChallengeSession snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end() || it->second.teardown_claimed ||
            it->second.status != SessionStatus::RUNNING) {
            return false;
        }
        if (!TransitionLocked(it->second, SessionStatus::STOPPING)) {
            return false;
        }
        it->second.solved = true;
        it->second.teardown_deadline = deadline;
        snapshot = it->second;
    }
    Notify(snapshot, SessionStatus::RUNNING, SessionStatus::STOPPING);
    return true;
}

bool SessionRegistry::RequestCancel(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end() || it->second.status != SessionStatus::STARTING) {
            return false;
        }
        it->second.cancel_requested = true;
    }
    spdlog::info("Stop requested for starting session {}; deferred until provisioning ends",
                 session_id);
    return true;
}

std::optional<ChallengeSession> SessionRegistry::ClaimTeardown(const std::string& session_id,
                                                               TeardownReason reason) {
    ChallengeSession snapshot;
    bool transitioned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        auto& session = it->second;
        if (session.teardown_claimed || session.status == SessionStatus::STARTING ||
            IsTerminal(session.status)) {
            return std::nullopt;
        }

        if (session.status == SessionStatus::RUNNING && reason != TeardownReason::UNHEALTHY) {
            transitioned = TransitionLocked(session, SessionStatus::STOPPING);
        }
        session.teardown_claimed = true;
        session.pending_reason = reason;
        session.teardown_deadline.reset();
        snapshot = session;
    }
    if (transitioned) {
        Notify(snapshot, SessionStatus::RUNNING, SessionStatus::STOPPING);
    }
    return snapshot;
}

void SessionRegistry::ReleaseTeardown(const std::string& session_id, TimePoint retry_at,
                                      TeardownReason reason, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }
        it->second.teardown_claimed = false;
        it->second.teardown_deadline = retry_at;
        it->second.pending_reason = reason;
        it->second.last_error = error;
    }
    spdlog::warn("Teardown of session {} failed, retry at {}: {}",
                 session_id, StringUtils::FormatTimestamp(retry_at), error);
    changed_.notify_all();
}

std::vector<DueTeardown> SessionRegistry::ClaimDue(TimePoint now) {
    std::vector<DueTeardown> due;
    std::vector<ChallengeSession> moved_to_stopping;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, session] : sessions_) {
            if (session.teardown_claimed || session.status == SessionStatus::STARTING ||
                IsTerminal(session.status)) {
                continue;
            }

            TeardownReason reason = TeardownReason::NONE;
            if (session.teardown_deadline && *session.teardown_deadline <= now) {
                if (session.pending_reason != TeardownReason::NONE) {
                    reason = session.pending_reason;
                } else {
                    reason = session.solved ? TeardownReason::SOLVED : TeardownReason::EXPIRED;
                }
            } else if (session.expires_at <= now) {
                reason = TeardownReason::EXPIRED;
            }
            if (reason == TeardownReason::NONE) {
                continue;
            }

            if (session.status == SessionStatus::RUNNING && reason != TeardownReason::UNHEALTHY) {
                if (TransitionLocked(session, SessionStatus::STOPPING)) {
                    moved_to_stopping.push_back(session);
                }
            }
            session.teardown_claimed = true;
            session.pending_reason = reason;
            session.teardown_deadline.reset();
            due.push_back({session, reason});
        }
    }
    for (const auto& session : moved_to_stopping) {
        Notify(session, SessionStatus::RUNNING, SessionStatus::STOPPING);
    }
    return due;
}

std::optional<SessionRegistry::TimePoint> SessionRegistry::NextDeadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<TimePoint> next;
    for (const auto& [id, session] : sessions_) {
        if (session.teardown_claimed || session.status == SessionStatus::STARTING) {
            continue;
        }
        TimePoint candidate = session.expires_at;
        if (session.teardown_deadline && *session.teardown_deadline < candidate) {
            candidate = *session.teardown_deadline;
        }
        if (!next || candidate < *next) {
            next = candidate;
        }
    }
    return next;
}

bool SessionRegistry::Finalize(const std::string& session_id, SessionStatus final_status,
                               const std::string& reason) {
    if (!IsTerminal(final_status)) {
        return false;
    }

    ChallengeSession snapshot;
    SessionStatus from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        from = it->second.status;
        if (!TransitionLocked(it->second, final_status)) {
            return false;
        }

        auto& session = it->second;
        session.ended_at = std::chrono::system_clock::now();
        session.teardown_claimed = false;
        session.teardown_deadline.reset();
        if (final_status == SessionStatus::ERROR) {
            session.last_error = reason;
        }

        snapshot = session;
        history_.push_back(std::move(session));
        sessions_.erase(it);
        while (history_.size() > config_.history_size) {
            history_.pop_front();
        }
    }

    if (final_status == SessionStatus::ERROR) {
        spdlog::error("Session {} ended in error: {}", session_id, reason);
    } else {
        spdlog::info("Session {} evicted: {}", session_id, reason);
    }
    Notify(snapshot, from, final_status);
    return true;
}

// ============================================================================
// FIELD UPDATES
// ============================================================================

bool SessionRegistry::UpdateHealth(const std::string& session_id, HealthStatus health) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }
    if (it->second.health != health) {
        spdlog::debug("Session {} health: {} -> {}", session_id,
                      HealthStatusToString(it->second.health), HealthStatusToString(health));
        it->second.health = health;
    }
    return true;
}

void SessionRegistry::RecordError(const std::string& session_id, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second.last_error = error;
    }
}

int SessionRegistry::RecordFlagAttempt(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return 0;
    }
    return ++it->second.flag_attempts;
}

std::optional<ChallengeSession> SessionRegistry::WaitWhileStarting(
    const std::string& session_id, std::chrono::milliseconds timeout) const {

    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait_for(lock, timeout, [&] {
        auto it = sessions_.find(session_id);
        return it == sessions_.end() || it->second.status != SessionStatus::STARTING;
    });

    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    for (auto hit = history_.rbegin(); hit != history_.rend(); ++hit) {
        if (hit->session_id == session_id) {
            return *hit;
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace breachlab
