/**
 * @file container_engine.hpp
 * @brief Container engine abstraction and Docker CLI implementation
 *
 * The orchestrator never talks to a container runtime directly. It consumes
 * the narrow ContainerEngine interface (create, start, stop, restart, remove,
 * inspect). DockerEngine implements it by driving the `docker` command-line
 * client, which keeps the engine free of a Docker SDK dependency.
 *
 * Errors are reported as exceptions: ContainerNotFoundError when the runtime
 * no longer knows the container, ContainerEngineError for everything else.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace breachlab {
namespace utils {

/**
 * @struct ContainerConfig
 * @brief Fully resolved container creation request
 *
 * Produced by the security profile resolver; every field is already clamped
 * to the profile ceilings. There is no "privileged" switch.
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                              ///< Container name
    std::string image;                             ///< Image reference

    // Resource Limits
    std::size_t memory_limit_mb{256};              ///< Memory limit
    double cpu_limit{0.5};                         ///< CPU limit (cores)
    int pids_limit{128};                           ///< Process limit

    // Network Settings
    std::string network{"bridge"};                 ///< Network mode
    std::string bind_address{"127.0.0.1"};         ///< Host interface for published ports
    std::map<int, int> port_mappings;              ///< Container port -> host port (0 = engine-assigned)

    // Security Settings
    bool read_only_rootfs{true};                        ///< Read-only root filesystem
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Dropped capabilities
    std::vector<std::string> capabilities_add;          ///< Re-added capabilities
    std::vector<std::string> security_opts;             ///< --security-opt values
    std::map<std::string, std::string> tmpfs;           ///< Mount point -> tmpfs options
    std::string user{"1000:1000"};                      ///< uid:gid
    std::string ipc_mode{"none"};                       ///< IPC namespace mode

    // Metadata
    std::map<std::string, std::string> environment_vars;  ///< Environment variables
    std::map<std::string, std::string> labels;            ///< Container labels
};

/**
 * @struct ContainerInspection
 * @brief Subset of runtime state the orchestrator cares about
 */
struct ContainerInspection {
    std::string id;                    ///< Container ID
    std::string state;                 ///< Runtime state string (running, exited, ...)
    bool running{false};               ///< State.Running
    int exit_code{0};                  ///< State.ExitCode
    std::string health;                ///< Health check status, empty if none configured
    std::map<int, int> published_ports;  ///< Container port -> host port
};

/**
 * @class ContainerEngineError
 * @brief Engine call failed (daemon error, bad image, port clash, ...)
 */
class ContainerEngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ContainerNotFoundError
 * @brief The referenced container does not exist (anymore)
 */
class ContainerNotFoundError : public ContainerEngineError {
public:
    explicit ContainerNotFoundError(const std::string& container_id)
        : ContainerEngineError("No such container: " + container_id),
          container_id_(container_id) {}

    const std::string& ContainerId() const noexcept { return container_id_; }

private:
    std::string container_id_;
};

/**
 * @class ContainerEngine
 * @brief Abstract container runtime used by the orchestrator and health monitor
 *
 * Implementations must be safe to call from several threads at once.
 */
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    /**
     * @brief Create (but do not start) a container
     * @param config Resolved container configuration
     * @return Container ID
     * @throws ContainerEngineError on failure
     */
    virtual std::string CreateContainer(const ContainerConfig& config) = 0;

    /**
     * @brief Start a created container
     */
    virtual void StartContainer(const std::string& container_id) = 0;

    /**
     * @brief Stop a running container gracefully
     * @param container_id Container ID
     * @param timeout Grace time before the runtime kills it
     */
    virtual void StopContainer(const std::string& container_id,
                               std::chrono::seconds timeout) = 0;

    virtual void RestartContainer(const std::string& container_id) = 0;

    /**
     * @brief Remove a container
     * @param container_id Container ID
     * @param force Kill first if still running
     */
    virtual void RemoveContainer(const std::string& container_id, bool force) = 0;

    /**
     * @brief Query runtime state, health and published ports
     * @throws ContainerNotFoundError if the container is gone
     */
    virtual ContainerInspection InspectContainer(const std::string& container_id) = 0;
};

/**
 * @class DockerEngine
 * @brief ContainerEngine backed by the docker CLI
 *
 * **Usage Example**:
 * @code
 * DockerEngine docker;
 * ContainerConfig config;
 * config.name = "challenge-web-xss-01-4f2a";
 * config.image = "breachlab/web-xss-01:latest";
 * config.port_mappings[80] = 0;
 *
 * auto id = docker.CreateContainer(config);
 * docker.StartContainer(id);
 * auto inspection = docker.InspectContainer(id);
 * docker.RemoveContainer(id, true);
 * @endcode
 */
class DockerEngine : public ContainerEngine {
public:
    /**
     * @brief Construct engine for a docker-compatible binary
     * @param binary Client executable (docker, podman)
     */
    explicit DockerEngine(std::string binary = "docker");

    DockerEngine(const DockerEngine&) = delete;
    DockerEngine& operator=(const DockerEngine&) = delete;

    /**
     * @brief Check if the client binary answers `--version`
     */
    static bool IsRuntimeAvailable(const std::string& binary = "docker");

    /**
     * @brief Extract x.y.z from `--version` output, "unknown" on failure
     */
    static std::string GetRuntimeVersion(const std::string& binary = "docker");

    std::string CreateContainer(const ContainerConfig& config) override;
    void StartContainer(const std::string& container_id) override;
    void StopContainer(const std::string& container_id,
                       std::chrono::seconds timeout) override;
    void RestartContainer(const std::string& container_id) override;
    void RemoveContainer(const std::string& container_id, bool force) override;
    ContainerInspection InspectContainer(const std::string& container_id) override;

    /**
     * @brief Translate a ContainerConfig into `docker create` arguments
     *
     * Always emits --cap-drop ALL, --security-opt no-new-privileges:true and
     * never --privileged.
     */
    static std::vector<std::string> BuildCreateArgs(const ContainerConfig& config);

    /**
     * @brief Parse `docker inspect` JSON output
     * @throws ContainerEngineError on malformed output
     */
    static ContainerInspection ParseInspectOutput(const std::string& json_str);

    /**
     * @brief Quote one argument for /bin/sh
     */
    static std::string QuoteArgument(const std::string& arg);

private:
    struct CommandResult {
        int exit_code{0};
        std::string output;
    };

    /**
     * @brief Run the client with arguments; throws on non-zero exit
     * @param args Arguments after the binary name
     * @param container_id Subject of the call (for not-found detection)
     */
    CommandResult RunDocker(const std::vector<std::string>& args,
                            const std::string& container_id = "") const;

    std::string binary_;
};

} // namespace utils
} // namespace breachlab
