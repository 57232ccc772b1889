/**
 * @file challenge_catalog.hpp
 * @brief Static challenge catalog loaded from JSON
 *
 * The catalog is read once at startup from a master file and an optional
 * imported-challenges overlay. Imported entries replace master entries with
 * the same id. After loading, the catalog is read-only and safe to share
 * between threads without locking.
 *
 * **Catalog format**:
 * @code
 * {
 *   "challenges": [
 *     {
 *       "id": "web-xss-01",
 *       "name": "Reflected XSS",
 *       "description": "...",
 *       "difficulty": "beginner",
 *       "category": "web",
 *       "points": 100,
 *       "tags": ["xss", "owasp"],
 *       "estimated_time": "30m",
 *       "hints": ["Look at the search box"],
 *       "container_spec": {
 *         "image": "breachlab/web-xss-01:latest",
 *         "ports": {"80/tcp": null},
 *         "environment": {"APP_MODE": "challenge"},
 *         "resources": {"memory": "256m", "cpus": 0.5, "pids_limit": 128},
 *         "security_profile": "default"
 *       }
 *     }
 *   ]
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace breachlab {
namespace core {

/**
 * @enum Difficulty
 * @brief Challenge difficulty tiers
 */
enum class Difficulty {
    BEGINNER,
    INTERMEDIATE,
    ADVANCED,
    EXPERT
};

std::string DifficultyToString(Difficulty difficulty);

/**
 * @brief Parse a difficulty name (case-insensitive)
 * @return Difficulty, or std::nullopt if unrecognized
 */
std::optional<Difficulty> ParseDifficulty(const std::string& value);

/**
 * @struct ResourceLimits
 * @brief Resources a challenge asks for (clamped later by its profile)
 */
struct ResourceLimits {
    std::size_t memory_mb{256};   ///< Memory in MB
    double cpus{0.5};             ///< CPU cores
    int pids{128};                ///< Max processes
};

/**
 * @struct ContainerSpec
 * @brief How to run a challenge
 */
struct ContainerSpec {
    std::string image;                                 ///< Image reference
    std::map<int, int> ports;                          ///< Container port -> host port (0 = engine-assigned)
    std::map<std::string, std::string> environment;    ///< Env template ({{SESSION_ID}}, {{USER_ID}}, {{CHALLENGE_ID}})
    ResourceLimits resources;                          ///< Requested limits
    std::string security_profile{"default"};           ///< Named security profile
};

/**
 * @struct ChallengeDefinition
 * @brief Immutable catalog entry
 */
struct ChallengeDefinition {
    std::string id;                                  ///< Unique identifier
    std::string name;                                ///< Display name
    std::string description;                         ///< Short description
    Difficulty difficulty{Difficulty::BEGINNER};     ///< Difficulty tier
    std::string category;                            ///< Category (web, crypto, ...)
    int points{0};                                   ///< Score value
    std::set<std::string> tags;                      ///< Free-form tags
    ContainerSpec container_spec;                    ///< Runtime spec
    std::vector<std::string> hints;                  ///< Ordered hints
    std::string estimated_time;                      ///< e.g. "30m"
    std::vector<std::string> learning_objectives;    ///< Optional objectives
    std::string source{"master"};                    ///< "master" or "imported"
};

/**
 * @class ChallengeCatalog
 * @brief Challenge lookup by id
 *
 * **Usage Example**:
 * @code
 * ChallengeCatalog catalog;
 * catalog.LoadFromFile("challenges/challenges.json");
 * catalog.LoadOverlayFromFile("challenges/imported-challenges.json");
 *
 * if (auto challenge = catalog.Find("web-xss-01")) {
 *     spdlog::info("{} ({})", challenge->name, DifficultyToString(challenge->difficulty));
 * }
 * @endcode
 */
class ChallengeCatalog {
public:
    ChallengeCatalog() = default;

    /**
     * @brief Load the master catalog
     * @param path JSON catalog file
     * @throws ConfigurationError if the file is missing, malformed, has an
     *         invalid entry or repeats an id
     */
    void LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Load the imported-challenges overlay
     *
     * A missing overlay file is not an error. Entries replace catalog entries
     * with the same id.
     *
     * @param path JSON catalog file
     * @throws ConfigurationError if the file exists but is invalid
     */
    void LoadOverlayFromFile(const std::filesystem::path& path);

    /**
     * @brief Load from an in-memory JSON document
     * @param text Catalog JSON
     * @param overlay true to replace existing ids instead of rejecting them
     * @param source Label used for error messages and ChallengeDefinition::source
     */
    void LoadFromString(const std::string& text, bool overlay = false,
                        const std::string& source = "master");

    /**
     * @brief Add a single validated definition
     * @throws ConfigurationError on duplicate id when overwrite is false
     */
    void AddChallenge(ChallengeDefinition challenge, bool overwrite = false);

    /**
     * @brief Look up a challenge by id
     */
    std::optional<ChallengeDefinition> Find(const std::string& challenge_id) const;

    bool Contains(const std::string& challenge_id) const;

    /**
     * @brief All challenges, ordered by id
     */
    std::vector<ChallengeDefinition> List() const;

    std::size_t Size() const { return challenges_.size(); }

private:
    std::map<std::string, ChallengeDefinition> challenges_;
};

} // namespace core
} // namespace breachlab
