/**
 * @file security_profiles.hpp
 * @brief Named container security profiles and their application
 *
 * A security profile is the set of isolation restrictions applied when a
 * challenge container is created: capabilities (drop ALL, re-add only from a
 * small allow-list), read-only rootfs with tmpfs scratch space, non-root
 * user, no-new-privileges, and resource ceilings.
 *
 * Profiles are validated when loaded. A profile asking for privileged mode,
 * or for a capability outside NET_ADMIN / NET_RAW / SYS_TIME, is rejected
 * with ConfigurationError and the engine refuses to start.
 *
 * **Profiles file format**:
 * @code
 * {
 *   "profiles": {
 *     "network-lab": {
 *       "cap_add": ["NET_RAW"],
 *       "read_only_rootfs": true,
 *       "user": "1000:1000",
 *       "tmpfs": {"/tmp": "rw,noexec,nosuid,size=100m"},
 *       "max_memory": "512m",
 *       "max_cpus": 1.0,
 *       "max_pids": 256
 *     }
 *   }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "breachlab/core/challenge_catalog.hpp"
#include "breachlab/utils/container_engine.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace breachlab {
namespace core {

/**
 * @struct SecurityProfile
 * @brief Isolation restrictions for one class of challenge
 */
struct SecurityProfile {
    std::string name;                                  ///< Profile name
    std::vector<std::string> capabilities_add;         ///< Re-added capabilities (after drop ALL)
    bool read_only_rootfs{true};                       ///< Read-only root filesystem
    std::map<std::string, std::string> tmpfs{
        {"/tmp", "rw,noexec,nosuid,size=100m"}};       ///< Writable scratch mounts
    std::string user{"1000:1000"};                     ///< uid:gid
    std::vector<std::string> security_opts{
        "no-new-privileges:true"};                     ///< --security-opt values
    std::string network{"bridge"};                     ///< Network mode
    std::string ipc_mode{"none"};                      ///< IPC namespace mode

    // Ceilings
    std::size_t max_memory_mb{512};                    ///< Memory ceiling
    double max_cpus{1.0};                              ///< CPU ceiling
    int max_pids{256};                                 ///< Process ceiling
};

/**
 * @class SecurityProfileResolver
 * @brief Registry of validated security profiles
 *
 * Ships with two built-in profiles: "default" (no capabilities) and
 * "network-lab" (NET_ADMIN, NET_RAW). Files loaded later may override them.
 *
 * **Usage Example**:
 * @code
 * SecurityProfileResolver profiles;
 * profiles.LoadFromFile("config/security-profiles.json");
 *
 * auto profile = profiles.Resolve(challenge.container_spec.security_profile);
 * auto config = SecurityProfileResolver::Apply(profile, challenge.container_spec);
 * @endcode
 */
class SecurityProfileResolver {
public:
    static constexpr const char* kDefaultProfile = "default";
    static constexpr std::size_t kMaxAddedCapabilities = 3;

    /**
     * @brief Construct with the built-in profiles installed
     */
    SecurityProfileResolver();

    /**
     * @brief Load and validate profiles from a JSON file
     * @throws ConfigurationError on I/O, parse or validation failure
     */
    void LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Load and validate profiles from a JSON document
     * @throws ConfigurationError on parse or validation failure
     */
    void LoadFromString(const std::string& text);

    /**
     * @brief Validate and register (or replace) a profile
     * @throws ConfigurationError if the profile is not acceptable
     */
    void AddProfile(SecurityProfile profile);

    /**
     * @brief Reject profiles outside the allowed envelope
     *
     * Checks the capability allow-list and count, a non-root user, the
     * resource ceilings and the no-new-privileges option.
     *
     * @throws ConfigurationError describing the first violation
     */
    static void Validate(const SecurityProfile& profile);

    /**
     * @brief Look up a profile by name
     *
     * Unknown names fall back to "default" with a warning.
     */
    SecurityProfile Resolve(const std::string& name) const;

    bool HasProfile(const std::string& name) const;

    std::vector<std::string> ProfileNames() const;

    /**
     * @brief Combine a profile and a challenge spec into a container config
     *
     * Resource limits are the minimum of what the challenge requests and the
     * profile ceiling. Name, environment and labels are left for the caller.
     */
    static utils::ContainerConfig Apply(const SecurityProfile& profile, const ContainerSpec& spec);

    /**
     * @brief Capabilities a profile may add
     */
    static const std::set<std::string>& AllowedCapabilities();

private:
    std::map<std::string, SecurityProfile> profiles_;
};

} // namespace core
} // namespace breachlab
