/**
 * @file engine_config.cpp
 * @brief EngineConfig JSON loading
 * @date 2025
 */

#include "breachlab/core/engine_config.hpp"
#include "breachlab/core/errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace breachlab {
namespace core {

using json = nlohmann::json;

namespace {

std::chrono::seconds PositiveSeconds(const json& section, const char* key,
                                     std::chrono::seconds fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    auto value = section.at(key).get<long long>();
    if (value <= 0) {
        throw ConfigurationError(std::string(key) + " must be positive");
    }
    return std::chrono::seconds(value);
}

std::size_t PositiveCount(const json& section, const char* key, std::size_t fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    auto value = section.at(key).get<long long>();
    if (value <= 0) {
        throw ConfigurationError(std::string(key) + " must be positive");
    }
    return static_cast<std::size_t>(value);
}

void ApplyOrchestrator(const json& section, Orchestrator::Config& config,
                       std::chrono::seconds& startup_timeout) {
    config.max_concurrent_sessions =
        PositiveCount(section, "max_concurrent_sessions", config.max_concurrent_sessions);
    config.max_sessions_per_user =
        PositiveCount(section, "max_sessions_per_user", config.max_sessions_per_user);
    config.history_size = PositiveCount(section, "history_size", config.history_size);

    auto timeout = PositiveSeconds(section, "session_timeout_seconds",
        std::chrono::duration_cast<std::chrono::seconds>(config.session_timeout));
    if (timeout < Orchestrator::kMinSessionTimeout || timeout > Orchestrator::kMaxSessionTimeout) {
        throw ConfigurationError("session_timeout_seconds must be between 60 and 7200");
    }
    config.session_timeout = timeout;

    config.grace_period = PositiveSeconds(section, "grace_period_seconds",
        std::chrono::duration_cast<std::chrono::seconds>(config.grace_period));
    config.stop_timeout = PositiveSeconds(section, "stop_timeout_seconds", config.stop_timeout);
    startup_timeout = PositiveSeconds(section, "startup_timeout_seconds", startup_timeout);

    if (section.contains("host")) {
        config.host = section.at("host").get<std::string>();
        if (config.host.empty()) {
            throw ConfigurationError("host must not be empty");
        }
    }
}

void ApplyHealth(const json& section, HealthMonitor::Config& config) {
    config.check_interval = PositiveSeconds(section, "check_interval_seconds",
        std::chrono::duration_cast<std::chrono::seconds>(config.check_interval));
    config.backoff_base = PositiveSeconds(section, "backoff_base_seconds",
        std::chrono::duration_cast<std::chrono::seconds>(config.backoff_base));
    config.backoff_max = PositiveSeconds(section, "backoff_max_seconds",
        std::chrono::duration_cast<std::chrono::seconds>(config.backoff_max));
    config.failure_threshold = static_cast<int>(
        PositiveCount(section, "failure_threshold", static_cast<std::size_t>(config.failure_threshold)));

    if (config.backoff_max < config.backoff_base) {
        throw ConfigurationError("backoff_max_seconds must not be below backoff_base_seconds");
    }
}

} // anonymous namespace

EngineConfig EngineConfig::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("⚠ Config file {} not found, using defaults", path.string());
        return EngineConfig{};
    }

    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("Cannot open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = LoadFromString(buffer.str());
    spdlog::info("✓ Configuration loaded from {}", path.string());
    return config;
}

EngineConfig EngineConfig::LoadFromString(const std::string& text) {
    EngineConfig config;

    try {
        auto root = json::parse(text);
        if (!root.is_object()) {
            throw ConfigurationError("Configuration root must be an object");
        }

        if (root.contains("catalog_path")) {
            config.catalog_path = root.at("catalog_path").get<std::string>();
        }
        if (root.contains("imported_catalog_path")) {
            config.imported_catalog_path = root.at("imported_catalog_path").get<std::string>();
        }
        if (root.contains("security_profiles_path")) {
            config.security_profiles_path = root.at("security_profiles_path").get<std::string>();
        }
        if (root.contains("flag_secret")) {
            config.flag_secret = root.at("flag_secret").get<std::string>();
        }
        if (root.contains("log_level")) {
            config.log_level = root.at("log_level").get<std::string>();
        }

        if (root.contains("orchestrator")) {
            ApplyOrchestrator(root.at("orchestrator"), config.orchestrator, config.startup_timeout);
        }
        if (root.contains("health")) {
            ApplyHealth(root.at("health"), config.orchestrator.health);
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

} // namespace core
} // namespace breachlab
