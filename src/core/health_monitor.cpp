/**
 * @file health_monitor.cpp
 * @brief Health polling worker, restart backoff and failure reporting
 *
 * The worker never calls the engine itself. It only decides which containers
 * are due and launches one std::async task per due container. Tasks write
 * their outcome back into the record and wake the worker so the next
 * deadline is recomputed.
 *
 * @date 2025
 */

#include "breachlab/core/health_monitor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace breachlab {
namespace core {

// ============================================================================
// HEALTH CLASSIFICATION
// ============================================================================

std::string ObservedHealthToString(ObservedHealth health) {
    switch (health) {
        case ObservedHealth::HEALTHY:   return "healthy";
        case ObservedHealth::UNHEALTHY: return "unhealthy";
        case ObservedHealth::STARTING:  return "starting";
        case ObservedHealth::NONE:      return "none";
        case ObservedHealth::UNKNOWN:   return "unknown";
    }
    return "unknown";
}

ObservedHealth ClassifyInspection(const utils::ContainerInspection& inspection) {
    if (!inspection.running) {
        return ObservedHealth::UNHEALTHY;
    }
    if (inspection.health == "healthy") {
        return ObservedHealth::HEALTHY;
    }
    if (inspection.health == "unhealthy") {
        return ObservedHealth::UNHEALTHY;
    }
    if (inspection.health == "starting") {
        return ObservedHealth::STARTING;
    }
    if (inspection.exit_code != 0) {
        return ObservedHealth::UNHEALTHY;
    }
    return ObservedHealth::NONE;
}

HealthStatus ToSessionHealth(ObservedHealth health) {
    switch (health) {
        case ObservedHealth::HEALTHY:
        case ObservedHealth::NONE:
            return HealthStatus::HEALTHY;
        case ObservedHealth::UNHEALTHY:
            return HealthStatus::UNHEALTHY;
        case ObservedHealth::STARTING:
            return HealthStatus::STARTING;
        case ObservedHealth::UNKNOWN:
            return HealthStatus::UNKNOWN;
    }
    return HealthStatus::UNKNOWN;
}

// ============================================================================
// CONSTRUCTION / LIFECYCLE
// ============================================================================

HealthMonitor::HealthMonitor(utils::ContainerEngine& engine, SessionRegistry& registry)
    : HealthMonitor(engine, registry, Config{}) {}

HealthMonitor::HealthMonitor(utils::ContainerEngine& engine, SessionRegistry& registry,
                             const Config& config)
    : engine_(engine), registry_(registry), config_(config) {
    if (config_.failure_threshold < 1) {
        config_.failure_threshold = 1;
    }
}

HealthMonitor::~HealthMonitor() {
    Stop();
}

void HealthMonitor::Start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&HealthMonitor::WorkerLoop, this);
    spdlog::info("✓ Health monitor started (interval {}ms, threshold {})",
                 config_.check_interval.count(), config_.failure_threshold);
}

void HealthMonitor::Stop() {
    if (running_.exchange(false)) {
        Wake();
        if (worker_.joinable()) {
            worker_.join();
        }
        spdlog::info("Health monitor stopped");
    }

    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(checks_mutex_);
        pending.swap(checks_);
    }
    for (auto& check : pending) {
        if (check.valid()) {
            check.wait();
        }
    }
}

void HealthMonitor::Wake() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_one();
}

// ============================================================================
// TRACKING
// ============================================================================

void HealthMonitor::Track(const std::string& session_id, const std::string& container_id) {
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        HealthRecord record;
        record.container_id = container_id;
        record.session_id = session_id;
        record.next_check_at = std::chrono::system_clock::now() + config_.check_interval;
        records_[container_id] = record;
    }
    spdlog::debug("Tracking health of container {} (session {})",
                  container_id.substr(0, 12), session_id);
    Wake();
}

void HealthMonitor::Untrack(const std::string& container_id) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        removed = records_.erase(container_id) > 0;
    }
    if (removed) {
        spdlog::debug("Stopped tracking container {}", container_id.substr(0, 12));
    }
}

bool HealthMonitor::IsTracked(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return records_.count(container_id) > 0;
}

std::optional<HealthRecord> HealthMonitor::GetRecord(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(container_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

HealthSummary HealthMonitor::GetSummary() const {
    std::lock_guard<std::mutex> lock(records_mutex_);

    HealthSummary summary;
    summary.tracked = records_.size();
    summary.is_monitoring = running_.load();
    for (const auto& [id, record] : records_) {
        switch (record.last_status) {
            case ObservedHealth::HEALTHY:
            case ObservedHealth::NONE:      ++summary.healthy;   break;
            case ObservedHealth::UNHEALTHY: ++summary.unhealthy; break;
            case ObservedHealth::STARTING:  ++summary.starting;  break;
            case ObservedHealth::UNKNOWN:   ++summary.unknown;   break;
        }
        summary.total_restart_attempts += record.restart_attempts;
    }
    return summary;
}

void HealthMonitor::SetFailureHandler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    failure_handler_ = std::move(handler);
}

std::chrono::milliseconds HealthMonitor::BackoffFor(int attempt) const {
    auto backoff = config_.backoff_base;
    for (int i = 1; i < attempt && backoff < config_.backoff_max; ++i) {
        backoff *= 2;
    }
    return std::min(backoff, config_.backoff_max);
}

// ============================================================================
// WORKER LOOP
// ============================================================================

void HealthMonitor::WorkerLoop() {
    while (running_.load()) {
        std::optional<TimePoint> next;
        try {
            PruneFinishedChecks();
            next = DispatchDueChecks();
        } catch (const std::exception& e) {
            spdlog::error("Health monitor cycle failed: {}", e.what());
        }

        auto deadline = next ? *next
                             : std::chrono::system_clock::now() + config_.check_interval;

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_until(lock, deadline, [this] {
            return !running_.load() || wake_requested_;
        });
        wake_requested_ = false;
    }
}

std::optional<HealthMonitor::TimePoint> HealthMonitor::DispatchDueChecks() {
    auto now = std::chrono::system_clock::now();
    std::vector<std::string> due;
    std::optional<TimePoint> next;

    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        for (auto& [container_id, record] : records_) {
            if (record.check_in_flight) {
                continue;
            }
            if (record.next_check_at <= now) {
                record.check_in_flight = true;
                due.push_back(container_id);
            } else if (!next || record.next_check_at < *next) {
                next = record.next_check_at;
            }
        }
    }

    for (const auto& container_id : due) {
        auto check = std::async(std::launch::async, [this, container_id] {
            try {
                CheckContainer(container_id);
            } catch (const std::exception& e) {
                spdlog::error("Health check of {} failed: {}", container_id.substr(0, 12), e.what());
                std::lock_guard<std::mutex> lock(records_mutex_);
                auto it = records_.find(container_id);
                if (it != records_.end()) {
                    it->second.check_in_flight = false;
                    it->second.next_check_at = std::chrono::system_clock::now() + config_.check_interval;
                }
            }
        });
        std::lock_guard<std::mutex> lock(checks_mutex_);
        checks_.push_back(std::move(check));
    }

    return next;
}

void HealthMonitor::PruneFinishedChecks() {
    std::lock_guard<std::mutex> lock(checks_mutex_);
    checks_.erase(
        std::remove_if(checks_.begin(), checks_.end(), [](std::future<void>& check) {
            return !check.valid() ||
                   check.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }),
        checks_.end());
}

// ============================================================================
// SINGLE CHECK
// ============================================================================

void HealthMonitor::CheckContainer(const std::string& container_id) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto it = records_.find(container_id);
        if (it == records_.end()) {
            return;
        }
        session_id = it->second.session_id;
    }

    auto session = registry_.GetActive(session_id);
    if (!session) {
        spdlog::debug("Session {} no longer active; dropping health record", session_id);
        Untrack(container_id);
        return;
    }

    utils::ContainerInspection inspection;
    try {
        inspection = engine_.InspectContainer(container_id);
    } catch (const utils::ContainerNotFoundError&) {
        spdlog::info("Container {} no longer exists; stopped tracking", container_id.substr(0, 12));
        Untrack(container_id);
        return;
    } catch (const std::exception& e) {
        registry_.UpdateHealth(session_id, HealthStatus::UNKNOWN);
        int errors = 0;
        {
            std::lock_guard<std::mutex> lock(records_mutex_);
            auto it = records_.find(container_id);
            if (it == records_.end()) {
                return;
            }
            auto& record = it->second;
            errors = ++record.transient_errors;
            record.last_status = ObservedHealth::UNKNOWN;
            record.last_checked = std::chrono::system_clock::now();
            record.next_check_at = *record.last_checked + BackoffFor(errors);
            record.check_in_flight = false;
        }
        spdlog::warn("Health check of {} failed (attempt {}): {}",
                     container_id.substr(0, 12), errors, e.what());
        Wake();
        return;
    }

    auto observed = ClassifyInspection(inspection);
    registry_.UpdateHealth(session_id, ToSessionHealth(observed));

    if (observed == ObservedHealth::UNHEALTHY) {
        std::string detail = inspection.running
            ? "health check reports unhealthy"
            : "container is " + (inspection.state.empty() ? std::string("not running") : inspection.state) +
              " (exit code " + std::to_string(inspection.exit_code) + ")";

        if (session->status == SessionStatus::STOPPING) {
            ReportFailure(container_id, session_id, "Container unhealthy during grace period: " + detail);
            return;
        }
        HandleUnhealthy(container_id, session_id, detail);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto it = records_.find(container_id);
        if (it == records_.end()) {
            return;
        }
        auto& record = it->second;
        if (observed == ObservedHealth::HEALTHY || observed == ObservedHealth::NONE) {
            if (record.consecutive_failures > 0) {
                spdlog::info("Container {} recovered after {} failed checks",
                             container_id.substr(0, 12), record.consecutive_failures);
            }
            record.consecutive_failures = 0;
        }
        record.transient_errors = 0;
        record.last_status = observed;
        record.last_checked = std::chrono::system_clock::now();
        record.next_check_at = *record.last_checked + config_.check_interval;
        record.check_in_flight = false;
    }
    Wake();
}

void HealthMonitor::HandleUnhealthy(const std::string& container_id, const std::string& session_id,
                                    const std::string& detail) {
    int failures = 0;
    int restart_attempt = 0;
    bool give_up = false;
    std::chrono::milliseconds backoff{0};

    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto it = records_.find(container_id);
        if (it == records_.end()) {
            return;
        }
        auto& record = it->second;
        record.last_status = ObservedHealth::UNHEALTHY;
        record.last_checked = std::chrono::system_clock::now();
        record.transient_errors = 0;
        failures = ++record.consecutive_failures;

        if (failures >= config_.failure_threshold ||
            record.restart_attempts >= config_.failure_threshold) {
            give_up = true;
        } else {
            restart_attempt = ++record.restart_attempts;
            backoff = BackoffFor(restart_attempt);
            record.next_check_at = *record.last_checked + backoff;
        }
    }

    if (give_up) {
        ReportFailure(container_id, session_id,
                      "Container unhealthy after " + std::to_string(failures) +
                      " consecutive checks: " + detail);
        return;
    }

    spdlog::warn("⚠ Container {} unhealthy ({}); restart {}/{} with {}ms backoff",
                 container_id.substr(0, 12), detail, restart_attempt,
                 config_.failure_threshold - 1, backoff.count());

    try {
        engine_.RestartContainer(container_id);
    } catch (const utils::ContainerNotFoundError&) {
        spdlog::info("Container {} vanished before restart; stopped tracking",
                     container_id.substr(0, 12));
        Untrack(container_id);
        return;
    } catch (const std::exception& e) {
        spdlog::warn("Restart of {} failed: {}", container_id.substr(0, 12), e.what());
    }

    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto it = records_.find(container_id);
        if (it != records_.end()) {
            it->second.check_in_flight = false;
        }
    }
    Wake();
}

void HealthMonitor::ReportFailure(const std::string& container_id, const std::string& session_id,
                                  const std::string& reason) {
    Untrack(container_id);
    registry_.UpdateHealth(session_id, HealthStatus::UNHEALTHY);
    registry_.RecordError(session_id, reason);

    spdlog::error("✗ Session {} failed health monitoring: {}", session_id, reason);

    FailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = failure_handler_;
    }
    if (!handler) {
        return;
    }
    try {
        handler(session_id, reason);
    } catch (const std::exception& e) {
        spdlog::error("Failure handler for session {} threw: {}", session_id, e.what());
    }
}

} // namespace core
} // namespace breachlab
