/**
 * @file orchestrator.cpp
 * @brief Session lifecycle: provisioning, grace period, expiry and teardown
 *
 * **Threads**:
 * - caller threads: Spawn / Stop / ValidateFlagSubmission / queries
 * - provisioning and teardown tasks (std::async, tracked in tasks_)
 * - one deadline thread waiting for the earliest grace or expiry deadline
 * - the health monitor worker and its check tasks
 *
 * A teardown runs exactly once per session: it starts with a claim in the
 * session registry and ends with Finalize(), which evicts the session. A
 * failed container removal releases the claim and schedules a retry.
 *
 * @date 2025
 */

#include "breachlab/core/orchestrator.hpp"
#include "breachlab/core/errors.hpp"
#include "breachlab/utils/hash_utils.hpp"
#include "breachlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <system_error>

namespace breachlab {
namespace core {

using utils::HashUtils;
using utils::StringUtils;

namespace {

std::chrono::system_clock::duration ToClock(std::chrono::milliseconds duration) {
    return std::chrono::duration_cast<std::chrono::system_clock::duration>(duration);
}

// Ports tried in order when choosing the access URL
const int kPreferredPorts[] = {80, 8080, 3000, 5000};

} // anonymous namespace

// ============================================================================
// CONSTRUCTION / LIFECYCLE
// ============================================================================

Orchestrator::Orchestrator(const ChallengeCatalog& catalog,
                           const SecurityProfileResolver& profiles,
                           const FlagSystem& flags,
                           utils::ContainerEngine& engine)
    : Orchestrator(catalog, profiles, flags, engine, Config{}) {}

Orchestrator::Orchestrator(const ChallengeCatalog& catalog,
                           const SecurityProfileResolver& profiles,
                           const FlagSystem& flags,
                           utils::ContainerEngine& engine,
                           const Config& config)
    : catalog_(catalog),
      profiles_(profiles),
      flags_(flags),
      engine_(engine),
      config_(config),
      registry_(SessionRegistry::Config{config.max_concurrent_sessions,
                                        config.max_sessions_per_user,
                                        config.history_size}),
      monitor_(engine, registry_, config.health) {

    monitor_.SetFailureHandler([this](const std::string& session_id, const std::string& reason) {
        HandleHealthFailure(session_id, reason);
    });
}

Orchestrator::~Orchestrator() {
    Shutdown();
}

void Orchestrator::Start() {
    if (started_.exchange(true)) {
        return;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("  Challenge orchestrator starting");
    spdlog::info("  Max sessions: {} ({} per user)", config_.max_concurrent_sessions,
                 config_.max_sessions_per_user);
    spdlog::info("  Session timeout: {}s, grace period: {}s",
                 std::chrono::duration_cast<std::chrono::seconds>(config_.session_timeout).count(),
                 std::chrono::duration_cast<std::chrono::seconds>(config_.grace_period).count());
    spdlog::info("═══════════════════════════════════════════════════════════════");

    monitor_.Start();
    deadline_thread_ = std::thread(&Orchestrator::DeadlineLoop, this);
}

void Orchestrator::Shutdown() {
    if (shutting_down_.exchange(true)) {
        return;
    }

    spdlog::info("Shutting down orchestrator...");

    WakeDeadlineThread();
    if (deadline_thread_.joinable()) {
        deadline_thread_.join();
    }
    monitor_.Stop();

    // Starting sessions tear themselves down when provisioning returns
    for (const auto& session : registry_.Snapshot(SessionStatus::STARTING)) {
        registry_.RequestCancel(session.session_id);
    }
    WaitForTasks();

    for (const auto& session : registry_.Snapshot()) {
        Teardown(session.session_id, TeardownReason::SHUTDOWN);
    }
    WaitForTasks();

    auto remaining = registry_.ActiveCount();
    if (remaining > 0) {
        spdlog::error("✗ {} session(s) could not be cleaned up; remove their containers manually",
                      remaining);
    } else {
        spdlog::info("✓ Orchestrator shut down, all challenge containers removed");
    }
}

// ============================================================================
// SPAWN
// ============================================================================

SessionInfo Orchestrator::Spawn(const std::string& challenge_id, const std::string& user_id) {
    return SpawnSession(challenge_id, user_id, config_.session_timeout);
}

SessionInfo Orchestrator::Spawn(const std::string& challenge_id, const std::string& user_id,
                                std::chrono::seconds session_timeout) {
    if (session_timeout < kMinSessionTimeout || session_timeout > kMaxSessionTimeout) {
        throw ValidationError("session_timeout must be between " +
                              std::to_string(kMinSessionTimeout.count()) + " and " +
                              std::to_string(kMaxSessionTimeout.count()) + " seconds");
    }
    return SpawnSession(challenge_id, user_id, session_timeout);
}

SessionInfo Orchestrator::SpawnSession(const std::string& challenge_id, const std::string& user_id,
                                       std::chrono::milliseconds session_timeout) {
    if (shutting_down_.load()) {
        throw ProvisionError("Orchestrator is shutting down");
    }

    std::string challenge_key = StringUtils::Trim(challenge_id);
    std::string user_key = StringUtils::Trim(user_id);
    if (challenge_key.empty()) {
        throw ValidationError("challenge_id is required");
    }
    if (user_key.empty()) {
        throw ValidationError("user_id is required");
    }

    auto challenge = catalog_.Find(challenge_key);
    if (!challenge) {
        throw UnknownChallengeError(challenge_key);
    }

    auto now = std::chrono::system_clock::now();

    ChallengeSession session;
    session.session_id = HashUtils::RandomHex(8);
    session.challenge_id = challenge_key;
    session.user_id = user_key;
    session.container_name = "challenge-" + challenge_key + "-" + session.session_id;
    session.flag_timestamp = NextFlagTimestamp();
    session.created_at = now;
    session.expires_at = now + ToClock(session_timeout);

    registry_.Insert(session);

    spdlog::info("Spawning '{}' for user {} (session {})", challenge->name, user_key, session.session_id);

    ChallengeDefinition definition = *challenge;
    LaunchTask([this, session, definition] { Provision(session, definition); });

    return ToInfo(session);
}

std::int64_t Orchestrator::NextFlagTimestamp() {
    auto now_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    // Strictly increasing so two sessions never share flag inputs
    std::int64_t last = last_flag_timestamp_.load();
    std::int64_t next;
    do {
        next = std::max<std::int64_t>(now_us, last + 1);
    } while (!last_flag_timestamp_.compare_exchange_weak(last, next));
    return next;
}

// ============================================================================
// PROVISIONING
// ============================================================================

void Orchestrator::Provision(const ChallengeSession& session, const ChallengeDefinition& challenge) {
    const std::string& session_id = session.session_id;
    std::string container_id;

    try {
        auto config = BuildContainerConfig(session, challenge);

        container_id = engine_.CreateContainer(config);
        if (!registry_.AttachContainer(session_id, container_id)) {
            throw ProvisionError("session left 'starting' during provisioning");
        }

        engine_.StartContainer(container_id);

        auto inspection = engine_.InspectContainer(container_id);
        auto access_url = DeriveAccessUrl(inspection, challenge.container_spec);

        if (!registry_.MarkRunning(session_id, access_url)) {
            throw ProvisionError("session could not enter 'running'");
        }
    } catch (const std::exception& e) {
        std::string reason = std::string("Provisioning failed: ") + e.what();

        if (!container_id.empty()) {
            try {
                engine_.RemoveContainer(container_id, true);
            } catch (const utils::ContainerNotFoundError&) {
                // already gone
            } catch (const std::exception& cleanup_error) {
                spdlog::error("Could not remove partially created container {}: {}",
                              container_id.substr(0, 12), cleanup_error.what());
            }
        }

        registry_.Finalize(session_id, SessionStatus::ERROR, reason);
        return;
    }

    monitor_.Track(session_id, container_id);
    WakeDeadlineThread();

    auto current = registry_.GetActive(session_id);
    if (current) {
        spdlog::info("✓ Session {} running at {}", session_id,
                     current->access_url.empty() ? "(no published port)" : current->access_url);
        if (current->cancel_requested) {
            Teardown(session_id, TeardownReason::CANCELLED);
        }
    }
}

utils::ContainerConfig Orchestrator::BuildContainerConfig(const ChallengeSession& session,
                                                          const ChallengeDefinition& challenge) const {
    auto profile = profiles_.Resolve(challenge.container_spec.security_profile);
    auto config = SecurityProfileResolver::Apply(profile, challenge.container_spec);

    config.name = session.container_name;

    auto expand = [&session](std::string value) {
        value = StringUtils::ReplaceAll(value, "{{SESSION_ID}}", session.session_id);
        value = StringUtils::ReplaceAll(value, "{{USER_ID}}", session.user_id);
        value = StringUtils::ReplaceAll(value, "{{CHALLENGE_ID}}", session.challenge_id);
        return value;
    };
    for (const auto& [key, value] : challenge.container_spec.environment) {
        config.environment_vars[key] = expand(value);
    }

    std::string started = StringUtils::FormatTimestamp(session.created_at);
    std::string timeout = std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(session.expires_at - session.created_at).count());

    config.environment_vars["CHALLENGE_ID"] = session.challenge_id;
    config.environment_vars["USER_ID"] = session.user_id;
    config.environment_vars["SESSION_ID"] = session.session_id;
    config.environment_vars["SESSION_START"] = started;
    config.environment_vars["SESSION_TIMEOUT"] = timeout;
    auto flag = flags_.GenerateFlag(session.challenge_id, session.user_id, session.flag_timestamp);
    config.environment_vars["FLAG"] = flag;
    config.environment_vars["CHALLENGE_FLAG"] = flag;

    config.labels["breachlab.managed"] = "true";
    config.labels["breachlab.challenge.id"] = session.challenge_id;
    config.labels["breachlab.challenge.user"] = session.user_id;
    config.labels["breachlab.challenge.session"] = session.session_id;
    config.labels["breachlab.challenge.started"] = started;
    config.labels["breachlab.challenge.timeout"] = timeout;
    config.labels["breachlab.challenge.name"] = challenge.name;
    config.labels["breachlab.challenge.category"] = challenge.category;

    return config;
}

std::string Orchestrator::DeriveAccessUrl(const utils::ContainerInspection& inspection,
                                          const ContainerSpec& spec) const {
    std::map<int, int> published = inspection.published_ports;
    for (const auto& [container_port, host_port] : spec.ports) {
        if (host_port > 0 && published.count(container_port) == 0) {
            published[container_port] = host_port;
        }
    }
    if (published.empty()) {
        return "";
    }

    int host_port = published.begin()->second;
    for (int preferred : kPreferredPorts) {
        auto it = published.find(preferred);
        if (it != published.end()) {
            host_port = it->second;
            break;
        }
    }
    return "http://" + config_.host + ":" + std::to_string(host_port);
}

// ============================================================================
// SESSION QUERIES
// ============================================================================

SessionInfo Orchestrator::WaitForRunning(const std::string& session_id,
                                         std::chrono::milliseconds timeout) {
    auto session = registry_.WaitWhileStarting(session_id, timeout);
    if (!session) {
        throw InvalidSessionError("Unknown session: " + session_id);
    }
    if (session->status == SessionStatus::ERROR) {
        throw ProvisionError(session->last_error.empty() ? "Session ended in error"
                                                         : session->last_error);
    }
    return ToInfo(*session);
}

SessionInfo Orchestrator::GetSession(const std::string& session_id) const {
    auto session = registry_.Get(session_id);
    if (!session) {
        throw InvalidSessionError("Unknown session: " + session_id);
    }
    return ToInfo(*session);
}

std::vector<SessionInfo> Orchestrator::ListRunning(const std::string& user_id) const {
    return SnapshotFor(user_id, SessionStatus::RUNNING);
}

std::vector<SessionInfo> Orchestrator::GetRunningSessions(const std::string& user_id) const {
    return SnapshotFor(user_id, std::nullopt);
}

std::vector<SessionInfo> Orchestrator::SnapshotFor(const std::string& user_id,
                                                   std::optional<SessionStatus> status) const {
    // User ids are stored trimmed by Spawn
    std::string user_key = StringUtils::Trim(user_id);

    std::vector<SessionInfo> result;
    for (const auto& session : registry_.Snapshot(status)) {
        if (!user_key.empty() && session.user_id != user_key) {
            continue;
        }
        result.push_back(ToInfo(session));
    }
    return result;
}

HealthStatus Orchestrator::GetSessionHealth(const std::string& session_id) const {
    return GetSession(session_id).health;
}

std::vector<ChallengeDefinition> Orchestrator::ListChallenges() const {
    return catalog_.List();
}

SessionStats Orchestrator::GetStats() const {
    return registry_.Stats();
}

HealthSummary Orchestrator::GetHealthSummary() const {
    return monitor_.GetSummary();
}

SessionInfo Orchestrator::ToInfo(const ChallengeSession& session) const {
    SessionInfo info;
    info.session_id = session.session_id;
    info.challenge_id = session.challenge_id;
    info.user_id = session.user_id;
    info.container_id = session.container_id;
    info.access_url = session.access_url;
    info.status = session.status;
    info.health = session.health;
    info.created_at = session.created_at;
    info.expires_at = session.expires_at;
    if (session.solved && session.teardown_deadline && !IsTerminal(session.status)) {
        info.grace_ends_at = session.teardown_deadline;
    }
    info.solved = session.solved;
    info.flag_attempts = session.flag_attempts;
    info.last_error = session.last_error;
    return info;
}

// ============================================================================
// STOP
// ============================================================================

StopResult Orchestrator::Stop(const std::string& session_id) {
    auto session = registry_.Get(session_id);
    if (!session) {
        throw InvalidSessionError("Unknown session: " + session_id);
    }
    if (IsTerminal(session->status)) {
        return {true, "Session already " + SessionStatusToString(session->status)};
    }

    if (session->status == SessionStatus::STARTING) {
        if (registry_.RequestCancel(session_id)) {
            return {true, "Session is still starting; it will be stopped once provisioning completes"};
        }
    }

    if (Teardown(session_id, TeardownReason::MANUAL)) {
        return {true, "Session stopped"};
    }

    auto after = registry_.Get(session_id);
    if (!after || IsTerminal(after->status)) {
        return {true, "Session already stopped"};
    }
    if (after->teardown_claimed) {
        return {true, "Session is already stopping"};
    }
    return {false, "Container removal failed, retry scheduled: " + after->last_error};
}

// ============================================================================
// FLAG SUBMISSION
// ============================================================================

FlagValidationResult Orchestrator::ValidateFlagSubmission(const std::string& session_id,
                                                          const std::string& submitted_flag) {
    std::string flag = StringUtils::Trim(submitted_flag);
    if (flag.empty()) {
        throw ValidationError("Flag must not be empty");
    }

    auto session = registry_.GetActive(session_id);
    if (!session) {
        throw InvalidSessionError("Session not active: " + session_id);
    }
    if (!session->solved && session->status != SessionStatus::RUNNING) {
        return {false, "Session is " + SessionStatusToString(session->status) + ", not running"};
    }

    int attempt = registry_.RecordFlagAttempt(session_id);

    if (!flags_.ValidateFlag(flag, session->challenge_id, session->user_id, session->flag_timestamp)) {
        spdlog::info("Incorrect flag for session {} (attempt {})", session_id, attempt);
        return {false, "Incorrect flag. Try again!"};
    }

    if (session->solved) {
        return {true, "Flag already accepted. Environment is shutting down."};
    }

    auto deadline = std::chrono::system_clock::now() + ToClock(config_.grace_period);
    if (!registry_.BeginGrace(session_id, deadline)) {
        return {true, "Correct flag! The session ended before the grace period could start."};
    }
    WakeDeadlineThread();

    auto grace_seconds = std::chrono::duration_cast<std::chrono::seconds>(config_.grace_period).count();
    std::string message = "Correct flag! Challenge solved. The environment shuts down in " +
                          std::to_string(grace_seconds) + " seconds.";

    spdlog::info("✓ Session {} solved on attempt {}", session_id, attempt);

    auto updated = registry_.GetActive(session_id);
    EmitNotice(ToInfo(updated ? *updated : *session), message);

    return {true, message};
}

void Orchestrator::SetNoticeCallback(NoticeCallback callback) {
    std::lock_guard<std::mutex> lock(notice_mutex_);
    notice_callback_ = std::move(callback);
}

void Orchestrator::EmitNotice(const SessionInfo& session, const std::string& message) {
    NoticeCallback callback;
    {
        std::lock_guard<std::mutex> lock(notice_mutex_);
        callback = notice_callback_;
    }
    if (!callback) {
        spdlog::info("[NOTICE] session {}: {}", session.session_id, message);
        return;
    }
    try {
        callback(session, message);
    } catch (const std::exception& e) {
        spdlog::error("Notice callback failed: {}", e.what());
    }
}

// ============================================================================
// TEARDOWN
// ============================================================================

bool Orchestrator::Teardown(const std::string& session_id, TeardownReason reason) {
    auto claimed = registry_.ClaimTeardown(session_id, reason);
    if (!claimed) {
        return false;
    }
    return ExecuteTeardown(*claimed, reason);
}

bool Orchestrator::ExecuteTeardown(const ChallengeSession& claimed, TeardownReason reason) {
    const std::string& session_id = claimed.session_id;
    const std::string& container_id = claimed.container_id;

    spdlog::info("Tearing down session {} ({})", session_id, TeardownReasonToString(reason));

    if (!container_id.empty()) {
        monitor_.Untrack(container_id);

        try {
            engine_.StopContainer(container_id, config_.stop_timeout);
        } catch (const utils::ContainerNotFoundError&) {
            spdlog::debug("Container {} already gone before stop", container_id.substr(0, 12));
        } catch (const std::exception& e) {
            spdlog::warn("Stop of {} failed, forcing removal: {}", container_id.substr(0, 12), e.what());
        }

        try {
            engine_.RemoveContainer(container_id, true);
        } catch (const utils::ContainerNotFoundError&) {
            spdlog::debug("Container {} already removed", container_id.substr(0, 12));
        } catch (const std::exception& e) {
            registry_.ReleaseTeardown(session_id,
                                      std::chrono::system_clock::now() + ToClock(config_.teardown_retry),
                                      reason, std::string("Container removal failed: ") + e.what());
            WakeDeadlineThread();
            return false;
        }
    }

    if (reason == TeardownReason::UNHEALTHY) {
        registry_.Finalize(session_id, SessionStatus::ERROR,
                           claimed.last_error.empty() ? "Container failed health checks"
                                                      : claimed.last_error);
    } else {
        registry_.Finalize(session_id, SessionStatus::STOPPED,
                           "container removed (" + TeardownReasonToString(reason) + ")");
    }
    return true;
}

void Orchestrator::HandleHealthFailure(const std::string& session_id, const std::string& reason) {
    spdlog::warn("⚠ Tearing down session {} after health failure: {}", session_id, reason);
    Teardown(session_id, TeardownReason::UNHEALTHY);
}

// ============================================================================
// DEADLINES
// ============================================================================

void Orchestrator::DeadlineLoop() {
    spdlog::debug("Deadline thread started");

    while (!shutting_down_.load()) {
        std::optional<SessionRegistry::TimePoint> next;
        try {
            PruneTasks();
            for (auto& item : registry_.ClaimDue(std::chrono::system_clock::now())) {
                spdlog::info("Session {} reached its {} deadline", item.session.session_id,
                             TeardownReasonToString(item.reason));
                LaunchTask([this, item] { ExecuteTeardown(item.session, item.reason); });
            }
            next = registry_.NextDeadline();
        } catch (const std::exception& e) {
            spdlog::error("Deadline cycle failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(deadline_mutex_);
        auto woken = [this] { return shutting_down_.load() || deadline_dirty_; };
        if (next) {
            deadline_cv_.wait_until(lock, *next, woken);
        } else {
            deadline_cv_.wait(lock, woken);
        }
        deadline_dirty_ = false;
    }

    spdlog::debug("Deadline thread stopped");
}

void Orchestrator::WakeDeadlineThread() {
    {
        std::lock_guard<std::mutex> lock(deadline_mutex_);
        deadline_dirty_ = true;
    }
    deadline_cv_.notify_all();
}

// ============================================================================
// TASKS
// ============================================================================

void Orchestrator::LaunchTask(std::function<void()> task) {
    auto guarded = [task = std::move(task)] {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Background task failed: {}", e.what());
        }
    };

    try {
        auto future = std::async(std::launch::async, guarded);
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks_.push_back(std::move(future));
    } catch (const std::system_error& e) {
        spdlog::warn("Could not start background task ({}), running inline", e.what());
        guarded();
    }
}

void Orchestrator::PruneTasks() {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    tasks_.erase(
        std::remove_if(tasks_.begin(), tasks_.end(), [](std::future<void>& task) {
            return !task.valid() ||
                   task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }),
        tasks_.end());
}

void Orchestrator::WaitForTasks() {
    while (true) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            pending.swap(tasks_);
        }
        if (pending.empty()) {
            return;
        }
        for (auto& task : pending) {
            if (task.valid()) {
                task.wait();
            }
        }
    }
}

} // namespace core
} // namespace breachlab
