/**
 * @file challenge_catalog.cpp
 * @brief JSON catalog loading and structural validation
 *
 * Required per entry: id, name, description, difficulty, category and
 * container_spec.image. Optional fields fall back to defaults. A bad entry
 * rejects the whole file so the engine never starts with a half-loaded
 * catalog.
 *
 * @date 2025
 */

#include "breachlab/core/challenge_catalog.hpp"
#include "breachlab/core/errors.hpp"
#include "breachlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace breachlab {
namespace core {

using utils::StringUtils;

// ============================================================================
// DIFFICULTY CONVERSION
// ============================================================================

std::string DifficultyToString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::BEGINNER:     return "beginner";
        case Difficulty::INTERMEDIATE: return "intermediate";
        case Difficulty::ADVANCED:     return "advanced";
        case Difficulty::EXPERT:       return "expert";
    }
    return "unknown";
}

std::optional<Difficulty> ParseDifficulty(const std::string& value) {
    std::string lower = StringUtils::ToLower(StringUtils::Trim(value));
    if (lower == "beginner" || lower == "easy") return Difficulty::BEGINNER;
    if (lower == "intermediate" || lower == "medium") return Difficulty::INTERMEDIATE;
    if (lower == "advanced" || lower == "hard") return Difficulty::ADVANCED;
    if (lower == "expert") return Difficulty::EXPERT;
    return std::nullopt;
}

namespace {

// ============================================================================
// FIELD PARSING HELPERS
// ============================================================================

std::string RequireString(const json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key) || !j.at(key).is_string() ||
        StringUtils::Trim(j.at(key).get<std::string>()).empty()) {
        throw ConfigurationError(where + ": missing required field '" + key + "'");
    }
    return j.at(key).get<std::string>();
}

std::vector<std::string> StringList(const json& j, const std::string& key, const std::string& where) {
    std::vector<std::string> values;
    if (!j.contains(key) || j.at(key).is_null()) {
        return values;
    }
    if (!j.at(key).is_array()) {
        throw ConfigurationError(where + ": '" + key + "' must be a list");
    }
    for (const auto& item : j.at(key)) {
        if (!item.is_string()) {
            throw ConfigurationError(where + ": '" + key + "' must contain only strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

// "256m", "1g", "512k", 256 -> megabytes
std::size_t ParseMemoryMb(const json& value, const std::string& where) {
    if (value.is_number_unsigned() || value.is_number_integer()) {
        auto mb = value.get<long long>();
        if (mb <= 0) {
            throw ConfigurationError(where + ": memory must be positive");
        }
        return static_cast<std::size_t>(mb);
    }
    if (!value.is_string()) {
        throw ConfigurationError(where + ": memory must be a number or a size string");
    }

    std::string text = StringUtils::ToLower(StringUtils::Trim(value.get<std::string>()));
    if (text.empty()) {
        throw ConfigurationError(where + ": memory must not be empty");
    }
    if (text.size() > 1 && text.back() == 'b') {
        text.pop_back();
    }

    char unit = text.back();
    double multiplier = 1.0;
    if (unit == 'k') {
        multiplier = 1.0 / 1024.0;
        text.pop_back();
    } else if (unit == 'm') {
        text.pop_back();
    } else if (unit == 'g') {
        multiplier = 1024.0;
        text.pop_back();
    }

    try {
        double amount = std::stod(text) * multiplier;
        if (amount < 1.0) {
            throw ConfigurationError(where + ": memory below 1 MB");
        }
        return static_cast<std::size_t>(amount);
    } catch (const std::invalid_argument&) {
        throw ConfigurationError(where + ": invalid memory value '" + value.get<std::string>() + "'");
    } catch (const std::out_of_range&) {
        throw ConfigurationError(where + ": memory value out of range");
    }
}

double ParseCpus(const json& value, const std::string& where) {
    try {
        double cpus = value.is_string() ? std::stod(value.get<std::string>()) : value.get<double>();
        if (cpus <= 0.0) {
            throw ConfigurationError(where + ": cpus must be positive");
        }
        return cpus;
    } catch (const json::exception&) {
        throw ConfigurationError(where + ": cpus must be a number");
    } catch (const std::logic_error&) {
        throw ConfigurationError(where + ": cpus must be a number");
    }
}

// "80/tcp" or "80" -> 80
int ParseContainerPort(const std::string& key, const std::string& where) {
    try {
        int port = std::stoi(key.substr(0, key.find('/')));
        if (port <= 0 || port > 65535) {
            throw ConfigurationError(where + ": port out of range: " + key);
        }
        return port;
    } catch (const std::logic_error&) {
        throw ConfigurationError(where + ": invalid port '" + key + "'");
    }
}

ContainerSpec ParseContainerSpec(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw ConfigurationError(where + ": missing required field 'container_spec'");
    }

    ContainerSpec spec;
    spec.image = RequireString(j, "image", where + ".container_spec");

    if (j.contains("ports") && !j.at("ports").is_null()) {
        const auto& ports = j.at("ports");
        if (ports.is_object()) {
            for (const auto& item : ports.items()) {
                int container_port = ParseContainerPort(item.key(), where);
                int host_port = item.value().is_number_integer() ? item.value().get<int>() : 0;
                if (host_port < 0 || host_port > 65535) {
                    throw ConfigurationError(where + ": host port out of range for " + item.key());
                }
                spec.ports[container_port] = host_port;
            }
        } else if (ports.is_array()) {
            for (const auto& port : ports) {
                std::string key = port.is_string() ? port.get<std::string>() : port.dump();
                spec.ports[ParseContainerPort(key, where)] = 0;
            }
        } else {
            throw ConfigurationError(where + ": 'ports' must be an object or list");
        }
    }

    if (j.contains("environment") && j.at("environment").is_object()) {
        for (const auto& item : j.at("environment").items()) {
            spec.environment[item.key()] = item.value().is_string()
                ? item.value().get<std::string>()
                : item.value().dump();
        }
    }

    if (j.contains("resources") && j.at("resources").is_object()) {
        const auto& resources = j.at("resources");
        if (resources.contains("memory")) {
            spec.resources.memory_mb = ParseMemoryMb(resources.at("memory"), where);
        }
        if (resources.contains("cpus")) {
            spec.resources.cpus = ParseCpus(resources.at("cpus"), where);
        }
        if (resources.contains("pids_limit")) {
            spec.resources.pids = resources.at("pids_limit").get<int>();
            if (spec.resources.pids <= 0) {
                throw ConfigurationError(where + ": pids_limit must be positive");
            }
        }
    }

    if (j.contains("security_profile") && j.at("security_profile").is_string()) {
        spec.security_profile = j.at("security_profile").get<std::string>();
    }

    return spec;
}

ChallengeDefinition ParseChallenge(const json& j, const std::string& source, std::size_t index) {
    std::string where = source + " challenge #" + std::to_string(index);
    if (!j.is_object()) {
        throw ConfigurationError(where + ": entry must be an object");
    }

    ChallengeDefinition challenge;
    challenge.id = RequireString(j, "id", where);
    where = source + " challenge '" + challenge.id + "'";

    challenge.name = RequireString(j, "name", where);
    challenge.description = RequireString(j, "description", where);
    challenge.category = RequireString(j, "category", where);

    auto difficulty = ParseDifficulty(RequireString(j, "difficulty", where));
    if (!difficulty) {
        throw ConfigurationError(where + ": invalid difficulty '" +
                                 j.at("difficulty").get<std::string>() + "'");
    }
    challenge.difficulty = *difficulty;

    if (j.contains("points") && j.at("points").is_number_integer()) {
        challenge.points = j.at("points").get<int>();
    }
    for (const auto& tag : StringList(j, "tags", where)) {
        challenge.tags.insert(tag);
    }
    challenge.hints = StringList(j, "hints", where);
    challenge.learning_objectives = StringList(j, "learning_objectives", where);

    if (j.contains("estimated_time")) {
        const auto& estimated = j.at("estimated_time");
        challenge.estimated_time = estimated.is_string() ? estimated.get<std::string>() : estimated.dump();
    }

    challenge.container_spec = ParseContainerSpec(
        j.contains("container_spec") ? j.at("container_spec") : json(), where);
    challenge.source = source;

    return challenge;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open catalog: " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

void ChallengeCatalog::LoadFromFile(const std::filesystem::path& path) {
    spdlog::info("Loading challenge catalog: {}", path.string());
    LoadFromString(ReadFile(path), false, "master");
    spdlog::info("✓ Catalog loaded: {} challenges", challenges_.size());
}

void ChallengeCatalog::LoadOverlayFromFile(const std::filesystem::path& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        spdlog::debug("No imported challenges at {}", path.string());
        return;
    }
    spdlog::info("Loading imported challenges: {}", path.string());
    LoadFromString(ReadFile(path), true, "imported");
}

void ChallengeCatalog::LoadFromString(const std::string& text, bool overlay,
                                      const std::string& source) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(source + " catalog is not valid JSON: " + e.what());
    }

    const json* entries = &document;
    if (document.is_object()) {
        if (!document.contains("challenges")) {
            throw ConfigurationError(source + " catalog has no 'challenges' list");
        }
        entries = &document.at("challenges");
    }
    if (!entries->is_array()) {
        throw ConfigurationError(source + " catalog 'challenges' must be a list");
    }

    // Parse everything first so a bad entry leaves the catalog untouched
    std::vector<ChallengeDefinition> parsed;
    std::set<std::string> seen;
    std::size_t index = 0;
    for (const auto& entry : *entries) {
        try {
            auto challenge = ParseChallenge(entry, source, index++);
            if (!seen.insert(challenge.id).second) {
                throw ConfigurationError(source + " catalog repeats challenge id '" + challenge.id + "'");
            }
            parsed.push_back(std::move(challenge));
        } catch (const json::exception& e) {
            throw ConfigurationError(source + " challenge #" + std::to_string(index - 1) +
                                     ": " + e.what());
        }
    }

    if (!overlay) {
        for (const auto& challenge : parsed) {
            if (challenges_.count(challenge.id) > 0) {
                throw ConfigurationError("Duplicate challenge id '" + challenge.id + "'");
            }
        }
    }

    for (auto& challenge : parsed) {
        if (overlay && challenges_.count(challenge.id) > 0) {
            spdlog::info("Imported challenge overrides catalog entry: {}", challenge.id);
        }
        AddChallenge(std::move(challenge), overlay);
    }
}

void ChallengeCatalog::AddChallenge(ChallengeDefinition challenge, bool overwrite) {
    if (challenge.id.empty()) {
        throw ConfigurationError("Challenge id must not be empty");
    }
    if (challenge.container_spec.image.empty()) {
        throw ConfigurationError("Challenge '" + challenge.id + "' has no container image");
    }
    if (!overwrite && challenges_.count(challenge.id) > 0) {
        throw ConfigurationError("Duplicate challenge id '" + challenge.id + "'");
    }
    std::string id = challenge.id;
    challenges_[id] = std::move(challenge);
}

// ============================================================================
// LOOKUP
// ============================================================================

std::optional<ChallengeDefinition> ChallengeCatalog::Find(const std::string& challenge_id) const {
    auto it = challenges_.find(challenge_id);
    if (it == challenges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ChallengeCatalog::Contains(const std::string& challenge_id) const {
    return challenges_.count(challenge_id) > 0;
}

std::vector<ChallengeDefinition> ChallengeCatalog::List() const {
    std::vector<ChallengeDefinition> result;
    result.reserve(challenges_.size());
    for (const auto& [id, challenge] : challenges_) {
        result.push_back(challenge);
    }
    return result;
}

} // namespace core
} // namespace breachlab
