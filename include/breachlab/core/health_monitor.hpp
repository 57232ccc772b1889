/**
 * @file health_monitor.hpp
 * @brief Background container health polling with bounded auto-recovery
 *
 * One worker thread wakes up whenever a tracked container is due for a check
 * and hands the check to an asynchronous task, so a hung engine call delays
 * only its own container. A container with a check already in flight is
 * skipped until that check returns.
 *
 * **Recovery policy**:
 * - healthy: reset the consecutive-failure counter
 * - unhealthy: restart with exponential backoff (base * 2^(n-1), capped),
 *   until the failure threshold is reached; then report the session as
 *   failed and stop tracking it
 * - unhealthy during a grace period: report immediately, no restart
 * - container gone: stop tracking silently
 * - other engine errors: health "unknown", retry with backoff
 *
 * @date 2025
 */

#pragma once

#include "breachlab/core/session_registry.hpp"
#include "breachlab/utils/container_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace breachlab {
namespace core {

/**
 * @enum ObservedHealth
 * @brief Health as derived from one engine inspection
 */
enum class ObservedHealth {
    HEALTHY,     ///< Running and health check passing
    UNHEALTHY,   ///< Not running, failing check or non-zero exit
    STARTING,    ///< Health check warming up
    NONE,        ///< Running without a health check
    UNKNOWN      ///< Engine could not be asked
};

std::string ObservedHealthToString(ObservedHealth health);

/**
 * @brief Derive observed health from an inspection
 *
 * Not running is unhealthy; otherwise the health-check status wins; a
 * non-zero exit code is unhealthy; running without a check is NONE.
 */
ObservedHealth ClassifyInspection(const utils::ContainerInspection& inspection);

/**
 * @brief Map observed health onto the session-level status
 */
HealthStatus ToSessionHealth(ObservedHealth health);

/**
 * @struct HealthRecord
 * @brief Per-container monitoring state
 */
struct HealthRecord {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string container_id;                           ///< Engine container id
    std::string session_id;                             ///< Owning session
    ObservedHealth last_status{ObservedHealth::UNKNOWN};  ///< Last observation
    int consecutive_failures{0};                        ///< Unhealthy checks in a row
    int restart_attempts{0};                            ///< Restarts issued
    int transient_errors{0};                            ///< Engine errors in a row
    std::optional<TimePoint> last_checked;              ///< Last completed check
    TimePoint next_check_at;                            ///< Interval or backoff deadline
    bool check_in_flight{false};                        ///< A check task is running
};

/**
 * @struct HealthSummary
 * @brief Aggregate view over tracked containers
 */
struct HealthSummary {
    std::size_t tracked{0};
    std::size_t healthy{0};
    std::size_t unhealthy{0};
    std::size_t starting{0};
    std::size_t unknown{0};
    int total_restart_attempts{0};
    bool is_monitoring{false};
};

/**
 * @class HealthMonitor
 * @brief Single-worker health poller
 *
 * **Usage Example**:
 * @code
 * HealthMonitor monitor(engine, registry);
 * monitor.SetFailureHandler([&](const std::string& session_id, const std::string& reason) {
 *     spdlog::error("session {} failed: {}", session_id, reason);
 * });
 * monitor.Start();
 * monitor.Track(session_id, container_id);
 * ...
 * monitor.Stop();
 * @endcode
 */
class HealthMonitor {
public:
    using TimePoint = HealthRecord::TimePoint;

    /**
     * @struct Config
     * @brief Polling and recovery parameters
     */
    struct Config {
        std::chrono::milliseconds check_interval{std::chrono::seconds(30)};  ///< Poll period
        int failure_threshold{3};                                            ///< Failures before giving up
        std::chrono::milliseconds backoff_base{std::chrono::seconds(5)};     ///< First restart backoff
        std::chrono::milliseconds backoff_max{std::chrono::seconds(300)};    ///< Backoff cap
    };

    /// Invoked (from a check task) when a session must be torn down as failed
    using FailureHandler = std::function<void(const std::string& session_id,
                                              const std::string& reason)>;

    HealthMonitor(utils::ContainerEngine& engine, SessionRegistry& registry);
    HealthMonitor(utils::ContainerEngine& engine, SessionRegistry& registry,
                  const Config& config);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * @brief Start the worker thread (no-op if already running)
     */
    void Start();

    /**
     * @brief Stop the worker and wait for in-flight checks
     */
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /**
     * @brief Begin monitoring a container; first check after one interval
     */
    void Track(const std::string& session_id, const std::string& container_id);

    /**
     * @brief Stop monitoring a container (idempotent)
     */
    void Untrack(const std::string& container_id);

    bool IsTracked(const std::string& container_id) const;

    std::optional<HealthRecord> GetRecord(const std::string& container_id) const;

    HealthSummary GetSummary() const;

    void SetFailureHandler(FailureHandler handler);

    /**
     * @brief Backoff before the next check after @p attempt restarts or errors
     */
    std::chrono::milliseconds BackoffFor(int attempt) const;

private:
    void WorkerLoop();

    /// Launch checks for every due record; returns the earliest next deadline
    std::optional<TimePoint> DispatchDueChecks();

    void CheckContainer(const std::string& container_id);

    void HandleUnhealthy(const std::string& container_id, const std::string& session_id,
                         const std::string& detail);

    void ReportFailure(const std::string& container_id, const std::string& session_id,
                       const std::string& reason);

    void PruneFinishedChecks();

    void Wake();

    utils::ContainerEngine& engine_;
    SessionRegistry& registry_;
    Config config_;

    mutable std::mutex records_mutex_;
    std::map<std::string, HealthRecord> records_;   ///< Keyed by container id

    std::mutex handler_mutex_;
    FailureHandler failure_handler_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_requested_{false};

    std::mutex checks_mutex_;
    std::vector<std::future<void>> checks_;   ///< In-flight check tasks
};

} // namespace core
} // namespace breachlab
