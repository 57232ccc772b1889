/**
 * @file container_engine.cpp
 * @brief Docker CLI implementation of the container engine interface
 *
 * Every operation shells out to the docker client through popen and turns a
 * non-zero exit status into an exception. Output of `docker inspect` is
 * parsed with nlohmann/json.
 *
 * **Hardening applied at creation**:
 * 1. Capability dropping (--cap-drop ALL, allow-listed --cap-add only)
 * 2. No new privileges (--security-opt no-new-privileges:true)
 * 3. Read-only rootfs with scoped tmpfs scratch space
 * 4. Non-root user, private IPC namespace
 * 5. Memory, CPU and pids limits
 * 6. Ports published on the loopback interface only
 *
 * @date 2025
 */

#include "breachlab/utils/container_engine.hpp"
#include "breachlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstdio>
#include <iomanip>
#include <regex>
#include <sstream>

#include <sys/wait.h>

using json = nlohmann::json;

namespace breachlab {
namespace utils {

namespace {

// ============================================================================
// COMMAND EXECUTION
// ============================================================================
// popen with stderr folded into stdout; exit status decoded from pclose

struct ShellResult {
    int exit_code{0};
    std::string output;
};

ShellResult ExecuteShell(const std::string& command) {
    ShellResult result;

    std::array<char, 256> buffer;
    std::string cmd = command + " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "Failed to execute command";
        return result;
    }

    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128;
    }
    return result;
}

bool LooksLikeNotFound(const std::string& output) {
    return StringUtils::Contains(output, "No such container") ||
           StringUtils::Contains(output, "No such object");
}

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << cpus;
    return oss.str();
}

// "80/tcp" -> 80
int ParsePortKey(const std::string& key) {
    auto slash = key.find('/');
    return std::stoi(key.substr(0, slash));
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION / RUNTIME DETECTION
// ============================================================================

DockerEngine::DockerEngine(std::string binary)
    : binary_(std::move(binary)) {
    spdlog::debug("Docker engine bound to client binary: {}", binary_);
}

bool DockerEngine::IsRuntimeAvailable(const std::string& binary) {
    auto result = ExecuteShell(QuoteArgument(binary) + " --version");
    return result.exit_code == 0;
}

std::string DockerEngine::GetRuntimeVersion(const std::string& binary) {
    auto result = ExecuteShell(QuoteArgument(binary) + " --version");
    if (result.exit_code != 0) {
        return "unknown";
    }

    std::regex version_regex(R"((\d+\.\d+\.\d+))");
    std::smatch match;
    if (std::regex_search(result.output, match, version_regex)) {
        return match[1].str();
    }
    return StringUtils::Trim(result.output);
}

// ============================================================================
// LIFECYCLE OPERATIONS
// ============================================================================

std::string DockerEngine::CreateContainer(const ContainerConfig& config) {
    if (config.image.empty()) {
        throw ContainerEngineError("Container image not specified");
    }

    spdlog::debug("Creating container {} from {}", config.name, config.image);

    auto result = RunDocker(BuildCreateArgs(config));

    // docker create may print pull progress before the ID; the ID is the last line
    std::string output = StringUtils::Trim(result.output);
    auto last_newline = output.find_last_of('\n');
    std::string container_id = last_newline == std::string::npos
        ? output
        : StringUtils::Trim(output.substr(last_newline + 1));

    if (container_id.empty()) {
        throw ContainerEngineError("docker create returned no container ID");
    }

    spdlog::info("Container created: {} ({})", config.name, container_id.substr(0, 12));
    return container_id;
}

void DockerEngine::StartContainer(const std::string& container_id) {
    RunDocker({"start", container_id}, container_id);
    spdlog::debug("Container started: {}", container_id.substr(0, 12));
}

void DockerEngine::StopContainer(const std::string& container_id,
                                 std::chrono::seconds timeout) {
    RunDocker({"stop", "-t", std::to_string(timeout.count()), container_id}, container_id);
    spdlog::debug("Container stopped: {}", container_id.substr(0, 12));
}

void DockerEngine::RestartContainer(const std::string& container_id) {
    RunDocker({"restart", container_id}, container_id);
    spdlog::info("Container restarted: {}", container_id.substr(0, 12));
}

void DockerEngine::RemoveContainer(const std::string& container_id, bool force) {
    std::vector<std::string> args{"rm"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(container_id);
    RunDocker(args, container_id);
    spdlog::debug("Container removed: {}", container_id.substr(0, 12));
}

ContainerInspection DockerEngine::InspectContainer(const std::string& container_id) {
    auto result = RunDocker({"inspect", "--type", "container", container_id}, container_id);
    return ParseInspectOutput(result.output);
}

// ============================================================================
// ARGUMENT BUILDING
// ============================================================================

std::vector<std::string> DockerEngine::BuildCreateArgs(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Resource limits
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }
    if (config.cpu_limit > 0) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(config.cpu_limit));
    }
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    // Network
    if (!config.network.empty()) {
        args.push_back("--network");
        args.push_back(config.network);
    }
    for (const auto& [container_port, host_port] : config.port_mappings) {
        // ip:host:container, ip::container, host:container or container
        std::string host_part = host_port > 0 ? std::to_string(host_port) : "";
        std::string binding;
        if (!config.bind_address.empty()) {
            binding = config.bind_address + ":" + host_part + ":";
        } else if (!host_part.empty()) {
            binding = host_part + ":";
        }
        args.push_back("-p");
        args.push_back(binding + std::to_string(container_port));
    }

    // Capabilities: always start from nothing
    std::vector<std::string> drops = config.capabilities_drop;
    if (std::find(drops.begin(), drops.end(), "ALL") == drops.end()) {
        drops.insert(drops.begin(), "ALL");
    }
    for (const auto& cap : drops) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }
    for (const auto& cap : config.capabilities_add) {
        args.push_back("--cap-add");
        args.push_back(cap);
    }

    std::vector<std::string> security_opts = config.security_opts;
    if (std::find(security_opts.begin(), security_opts.end(),
                  "no-new-privileges:true") == security_opts.end()) {
        security_opts.push_back("no-new-privileges:true");
    }
    for (const auto& opt : security_opts) {
        args.push_back("--security-opt");
        args.push_back(opt);
    }

    if (config.read_only_rootfs) {
        args.push_back("--read-only");
    }
    for (const auto& [mount_point, options] : config.tmpfs) {
        args.push_back("--tmpfs");
        args.push_back(options.empty() ? mount_point : mount_point + ":" + options);
    }

    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }
    if (!config.ipc_mode.empty()) {
        args.push_back("--ipc");
        args.push_back(config.ipc_mode);
    }

    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Image must be last
    args.push_back(config.image);

    return args;
}

// ============================================================================
// INSPECT PARSING
// ============================================================================

ContainerInspection DockerEngine::ParseInspectOutput(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ContainerEngineError(std::string("Malformed inspect output: ") + e.what());
    }

    // docker inspect returns an array with a single object
    if (j.is_array()) {
        if (j.empty()) {
            throw ContainerEngineError("Empty inspect output");
        }
        j = j[0];
    }
    if (!j.is_object()) {
        throw ContainerEngineError("Unexpected inspect output");
    }

    ContainerInspection inspection;
    inspection.id = j.value("Id", "");

    if (j.contains("State") && j["State"].is_object()) {
        const auto& state = j["State"];
        inspection.state = state.value("Status", "");
        inspection.running = state.value("Running", false);
        inspection.exit_code = state.value("ExitCode", 0);
        if (state.contains("Health") && state.at("Health").is_object()) {
            inspection.health = state.at("Health").value("Status", "");
        }
    }

    if (j.contains("NetworkSettings") && j["NetworkSettings"].is_object()) {
        const auto& settings = j["NetworkSettings"];
        if (settings.contains("Ports") && settings.at("Ports").is_object()) {
            for (const auto& item : settings.at("Ports").items()) {
                const std::string& key = item.key();
                const auto& bindings = item.value();
                if (!bindings.is_array() || bindings.empty()) {
                    continue;
                }
                try {
                    int container_port = ParsePortKey(key);
                    int host_port = std::stoi(bindings[0].value("HostPort", "0"));
                    if (host_port > 0) {
                        inspection.published_ports[container_port] = host_port;
                    }
                } catch (const std::exception& e) {
                    spdlog::debug("Skipping unparseable port binding {}: {}", key, e.what());
                }
            }
        }
    }

    return inspection;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

std::string DockerEngine::QuoteArgument(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

DockerEngine::CommandResult DockerEngine::RunDocker(const std::vector<std::string>& args,
                                                    const std::string& container_id) const {
    std::ostringstream cmd;
    cmd << QuoteArgument(binary_);
    for (const auto& arg : args) {
        cmd << " " << QuoteArgument(arg);
    }

    spdlog::debug("Executing: {}", cmd.str());

    auto shell = ExecuteShell(cmd.str());

    CommandResult result;
    result.exit_code = shell.exit_code;
    result.output = shell.output;

    if (result.exit_code != 0) {
        std::string message = StringUtils::Trim(result.output);
        if (!container_id.empty() && LooksLikeNotFound(message)) {
            throw ContainerNotFoundError(container_id);
        }
        std::string verb = args.empty() ? "" : args.front();
        throw ContainerEngineError("docker " + verb + " failed (exit " +
                                   std::to_string(result.exit_code) + "): " + message);
    }

    return result;
}

} // namespace utils
} // namespace breachlab
