/**
 * @file engine_config.hpp
 * @brief JSON configuration for the challenge engine
 *
 * Layout of `breachlab.json` (every key optional):
 * @code
 * {
 *   "catalog_path": "challenges/challenges.json",
 *   "imported_catalog_path": "challenges/imported.json",
 *   "security_profiles_path": "config/security-profiles.json",
 *   "flag_secret": "",
 *   "log_level": "info",
 *   "orchestrator": { "max_concurrent_sessions": 10, "session_timeout_seconds": 3600, ... },
 *   "health": { "check_interval_seconds": 30, "failure_threshold": 3, ... }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "breachlab/core/orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace breachlab {
namespace core {

/**
 * @struct EngineConfig
 * @brief Everything the console front-end needs to assemble an engine
 */
struct EngineConfig {
    std::filesystem::path catalog_path{"challenges/challenges.json"};      ///< Master catalog
    std::filesystem::path imported_catalog_path;                          ///< Optional overlay
    std::filesystem::path security_profiles_path;                         ///< Optional profile file
    std::string flag_secret;                                              ///< Empty: env var or random
    std::string log_level{"info"};                                        ///< spdlog level name
    std::chrono::seconds startup_timeout{60};                             ///< Console wait for "running"
    Orchestrator::Config orchestrator;                                    ///< Limits and timings

    /**
     * @brief Load from a file; a missing file yields the defaults
     * @throws ConfigurationError on unreadable or malformed content
     */
    static EngineConfig LoadFromFile(const std::filesystem::path& path);

    /**
     * @throws ConfigurationError on malformed content
     */
    static EngineConfig LoadFromString(const std::string& text);
};

} // namespace core
} // namespace breachlab
