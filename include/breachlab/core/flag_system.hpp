/**
 * @file flag_system.hpp
 * @brief Per-session flag generation and constant-time verification
 *
 * A flag is HMAC-SHA256(secret, "challenge_id:user_id:timestamp") truncated
 * to 16 hex characters and wrapped as `flag{...}`. Flags are never stored;
 * validation recomputes the expected value from the session inputs.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace breachlab {
namespace core {

/**
 * @class FlagSystem
 * @brief Deterministic keyed flag generator
 *
 * Same (challenge, user, timestamp) always yields the same flag; a different
 * timestamp yields a different flag. The secret is process-wide and is never
 * logged.
 *
 * **Usage Example**:
 * @code
 * FlagSystem flags(FlagSystem::ResolveSecret(config.flag_secret));
 * auto flag = flags.GenerateFlag("web-xss-01", "alice", session.flag_timestamp);
 * bool ok = flags.ValidateFlag(submitted, "web-xss-01", "alice", session.flag_timestamp);
 * @endcode
 */
class FlagSystem {
public:
    static constexpr const char* kSecretEnvVar = "BREACHLAB_FLAG_SECRET";
    static constexpr std::size_t kFlagHexLength = 16;

    /**
     * @brief Construct with a signing secret
     * @param secret HMAC key (must be non-empty)
     * @throws ConfigurationError if secret is empty
     */
    explicit FlagSystem(std::string secret);

    FlagSystem(const FlagSystem&) = delete;
    FlagSystem& operator=(const FlagSystem&) = delete;

    /**
     * @brief Pick the signing secret for this process
     *
     * Order: BREACHLAB_FLAG_SECRET environment variable, then @p configured,
     * then 32 random bytes (flags then only verify within this process).
     *
     * @param configured Secret from the configuration file (may be empty)
     * @return Secret to pass to the constructor
     */
    static std::string ResolveSecret(const std::string& configured);

    /**
     * @brief Generate the flag for a session
     * @param challenge_id Challenge identifier
     * @param user_id User identifier
     * @param timestamp Session spawn timestamp (microseconds since epoch)
     * @return Flag of the form flag{<16 lowercase hex>}
     */
    std::string GenerateFlag(const std::string& challenge_id,
                             const std::string& user_id,
                             std::int64_t timestamp) const;

    /**
     * @brief Verify a submitted flag in constant time
     *
     * Malformed submissions are rejected before any comparison.
     *
     * @return true if the submission equals the expected flag
     */
    bool ValidateFlag(const std::string& submitted,
                      const std::string& challenge_id,
                      const std::string& user_id,
                      std::int64_t timestamp) const;

    /**
     * @brief Check the flag{[0-9a-f]{16}} shape
     */
    static bool IsWellFormed(const std::string& flag);

private:
    std::string secret_;
};

} // namespace core
} // namespace breachlab
