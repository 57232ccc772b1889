/**
 * @file flag_system.cpp
 * @brief HMAC-SHA256 flag generation and verification
 *
 * @date 2025
 */

#include "breachlab/core/flag_system.hpp"
#include "breachlab/core/errors.hpp"
#include "breachlab/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <regex>

namespace breachlab {
namespace core {

using utils::HashUtils;

FlagSystem::FlagSystem(std::string secret)
    : secret_(std::move(secret)) {
    if (secret_.empty()) {
        throw ConfigurationError("Flag secret must not be empty");
    }
    // Fingerprint only; the secret itself never reaches the log
    spdlog::debug("Flag system initialized (key fingerprint {})",
                  HashUtils::ComputeSHA256(secret_).substr(0, 12));
}

std::string FlagSystem::ResolveSecret(const std::string& configured) {
    const char* env_secret = std::getenv(kSecretEnvVar);
    if (env_secret != nullptr && env_secret[0] != '\0') {
        spdlog::info("Flag secret loaded from {}", kSecretEnvVar);
        return env_secret;
    }

    if (!configured.empty()) {
        return configured;
    }

    spdlog::warn("⚠ No flag secret configured; generated a per-process secret");
    spdlog::warn("  Flags will not verify after a restart. Set {} to persist them.", kSecretEnvVar);
    return HashUtils::RandomHex(32);
}

std::string FlagSystem::GenerateFlag(const std::string& challenge_id,
                                     const std::string& user_id,
                                     std::int64_t timestamp) const {
    std::string message = challenge_id + ":" + user_id + ":" + std::to_string(timestamp);
    std::string digest = HashUtils::ComputeHmacSHA256(secret_, message);
    return "flag{" + digest.substr(0, kFlagHexLength) + "}";
}

bool FlagSystem::ValidateFlag(const std::string& submitted,
                              const std::string& challenge_id,
                              const std::string& user_id,
                              std::int64_t timestamp) const {
    if (!IsWellFormed(submitted)) {
        return false;
    }
    std::string expected = GenerateFlag(challenge_id, user_id, timestamp);
    return HashUtils::ConstantTimeEquals(expected, submitted);
}

bool FlagSystem::IsWellFormed(const std::string& flag) {
    static const std::regex pattern(R"(^flag\{[0-9a-f]{16}\}$)");
    return std::regex_match(flag, pattern);
}

} // namespace core
} // namespace breachlab
