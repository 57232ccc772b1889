/**
 * @file security_profiles.cpp
 * @brief Security profile loading, validation and application
 *
 * @date 2025
 */

#include "breachlab/core/security_profiles.hpp"
#include "breachlab/core/errors.hpp"
#include "breachlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace breachlab {
namespace core {

using utils::StringUtils;

namespace {

// "cap_net_raw" / "CAP_NET_RAW" / "net_raw" -> "NET_RAW"
std::string NormalizeCapability(const std::string& capability) {
    std::string upper = StringUtils::ToUpper(StringUtils::Trim(capability));
    if (upper.rfind("CAP_", 0) == 0) {
        upper = upper.substr(4);
    }
    return upper;
}

std::size_t ParseCeilingMb(const json& value, const std::string& where) {
    if (value.is_number_integer()) {
        return static_cast<std::size_t>(std::max<long long>(0, value.get<long long>()));
    }
    if (!value.is_string()) {
        throw ConfigurationError(where + ": max_memory must be a number or size string");
    }
    std::string text = StringUtils::ToLower(StringUtils::Trim(value.get<std::string>()));
    if (text.empty()) {
        throw ConfigurationError(where + ": max_memory must not be empty");
    }
    double multiplier = 1.0;
    if (text.back() == 'g') {
        multiplier = 1024.0;
        text.pop_back();
    } else if (text.back() == 'm') {
        text.pop_back();
    }
    try {
        return static_cast<std::size_t>(std::stod(text) * multiplier);
    } catch (const std::logic_error&) {
        throw ConfigurationError(where + ": invalid max_memory '" + value.get<std::string>() + "'");
    }
}

SecurityProfile ParseProfile(const std::string& name, const json& j) {
    std::string where = "security profile '" + name + "'";
    if (!j.is_object()) {
        throw ConfigurationError(where + ": must be an object");
    }

    if (j.value("privileged", false)) {
        throw ConfigurationError(where + ": privileged containers are not allowed");
    }

    SecurityProfile profile;
    profile.name = name;

    auto read_list = [&](const char* key) {
        std::vector<std::string> values;
        if (!j.contains(key)) {
            return values;
        }
        if (!j.at(key).is_array()) {
            throw ConfigurationError(where + ": '" + key + "' must be a list");
        }
        for (const auto& item : j.at(key)) {
            values.push_back(item.get<std::string>());
        }
        return values;
    };

    for (const auto& cap : read_list("cap_add")) {
        profile.capabilities_add.push_back(NormalizeCapability(cap));
    }
    if (j.contains("security_opts")) {
        profile.security_opts = read_list("security_opts");
    }

    profile.read_only_rootfs = j.value("read_only_rootfs", profile.read_only_rootfs);
    profile.user = j.value("user", profile.user);
    profile.network = j.value("network", profile.network);
    profile.ipc_mode = j.value("ipc", profile.ipc_mode);

    if (j.contains("tmpfs")) {
        if (!j.at("tmpfs").is_object()) {
            throw ConfigurationError(where + ": 'tmpfs' must be an object");
        }
        profile.tmpfs.clear();
        for (const auto& item : j.at("tmpfs").items()) {
            profile.tmpfs[item.key()] = item.value().get<std::string>();
        }
    }

    if (j.contains("max_memory")) {
        profile.max_memory_mb = ParseCeilingMb(j.at("max_memory"), where);
    }
    profile.max_cpus = j.value("max_cpus", profile.max_cpus);
    profile.max_pids = j.value("max_pids", profile.max_pids);

    return profile;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

SecurityProfileResolver::SecurityProfileResolver() {
    SecurityProfile base;
    base.name = kDefaultProfile;
    profiles_[base.name] = base;

    SecurityProfile network_lab;
    network_lab.name = "network-lab";
    network_lab.capabilities_add = {"NET_ADMIN", "NET_RAW"};
    profiles_[network_lab.name] = network_lab;
}

const std::set<std::string>& SecurityProfileResolver::AllowedCapabilities() {
    static const std::set<std::string> allowed{"NET_ADMIN", "NET_RAW", "SYS_TIME"};
    return allowed;
}

// ============================================================================
// LOADING
// ============================================================================

void SecurityProfileResolver::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open security profiles: " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    spdlog::info("Loading security profiles: {}", path.string());
    LoadFromString(buffer.str());
}

void SecurityProfileResolver::LoadFromString(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("Security profiles are not valid JSON: ") + e.what());
    }

    const json& profiles = document.contains("profiles") ? document.at("profiles") : document;
    if (!profiles.is_object()) {
        throw ConfigurationError("Security profiles must be an object keyed by profile name");
    }

    // Validate all before installing any
    std::vector<SecurityProfile> parsed;
    for (const auto& item : profiles.items()) {
        try {
            auto profile = ParseProfile(item.key(), item.value());
            Validate(profile);
            parsed.push_back(std::move(profile));
        } catch (const json::exception& e) {
            throw ConfigurationError("security profile '" + item.key() + "': " + e.what());
        }
    }

    for (auto& profile : parsed) {
        AddProfile(std::move(profile));
    }
    spdlog::info("✓ {} security profiles available", profiles_.size());
}

void SecurityProfileResolver::AddProfile(SecurityProfile profile) {
    Validate(profile);
    spdlog::debug("Registered security profile '{}' (caps: {})",
                  profile.name, profile.capabilities_add.size());
    std::string name = profile.name;
    profiles_[name] = std::move(profile);
}

// ============================================================================
// VALIDATION
// ============================================================================

void SecurityProfileResolver::Validate(const SecurityProfile& profile) {
    std::string where = "security profile '" + profile.name + "'";

    if (profile.name.empty()) {
        throw ConfigurationError("Security profile name must not be empty");
    }

    if (profile.capabilities_add.size() > kMaxAddedCapabilities) {
        throw ConfigurationError(where + ": at most " + std::to_string(kMaxAddedCapabilities) +
                                 " capabilities may be added");
    }
    for (const auto& cap : profile.capabilities_add) {
        if (AllowedCapabilities().count(cap) == 0) {
            throw ConfigurationError(where + ": capability " + cap + " is not allowed");
        }
    }

    std::string user = StringUtils::Trim(profile.user);
    if (user.empty() || user == "root" || user == "0" || user.rfind("0:", 0) == 0) {
        throw ConfigurationError(where + ": containers must not run as root");
    }

    if (profile.network == "host") {
        throw ConfigurationError(where + ": host networking is not allowed");
    }

    if (std::find(profile.security_opts.begin(), profile.security_opts.end(),
                  "no-new-privileges:true") == profile.security_opts.end()) {
        throw ConfigurationError(where + ": no-new-privileges:true is required");
    }

    if (profile.max_memory_mb == 0 || profile.max_cpus <= 0.0 || profile.max_pids <= 0) {
        throw ConfigurationError(where + ": resource ceilings must be positive");
    }
}

// ============================================================================
// RESOLUTION / APPLICATION
// ============================================================================

SecurityProfile SecurityProfileResolver::Resolve(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it != profiles_.end()) {
        return it->second;
    }
    spdlog::warn("⚠ Unknown security profile '{}', falling back to '{}'", name, kDefaultProfile);
    return profiles_.at(kDefaultProfile);
}

bool SecurityProfileResolver::HasProfile(const std::string& name) const {
    return profiles_.count(name) > 0;
}

std::vector<std::string> SecurityProfileResolver::ProfileNames() const {
    std::vector<std::string> names;
    for (const auto& [name, profile] : profiles_) {
        names.push_back(name);
    }
    return names;
}

utils::ContainerConfig SecurityProfileResolver::Apply(const SecurityProfile& profile,
                                                      const ContainerSpec& spec) {
    utils::ContainerConfig config;
    config.image = spec.image;
    config.port_mappings = spec.ports;

    const auto& requested = spec.resources;
    config.memory_limit_mb = requested.memory_mb > 0
        ? std::min(requested.memory_mb, profile.max_memory_mb)
        : profile.max_memory_mb;
    config.cpu_limit = requested.cpus > 0.0
        ? std::min(requested.cpus, profile.max_cpus)
        : profile.max_cpus;
    config.pids_limit = requested.pids > 0
        ? std::min(requested.pids, profile.max_pids)
        : profile.max_pids;

    config.network = profile.network;
    config.ipc_mode = profile.ipc_mode;
    config.read_only_rootfs = profile.read_only_rootfs;
    config.capabilities_drop = {"ALL"};
    config.capabilities_add = profile.capabilities_add;
    config.security_opts = profile.security_opts;
    config.tmpfs = profile.tmpfs;
    config.user = profile.user;

    return config;
}

} // namespace core
} // namespace breachlab
