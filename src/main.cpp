/**
 * @file main.cpp
 * @brief BreachLab challenge engine - interactive console
 *
 * Loads the configuration, challenge catalog and security profiles, starts
 * the orchestrator against the local Docker daemon and reads commands from
 * stdin. Every command answers with a single JSON object on stdout; logs go
 * to stderr.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "breachlab/core/challenge_catalog.hpp"
#include "breachlab/core/engine_config.hpp"
#include "breachlab/core/errors.hpp"
#include "breachlab/core/flag_system.hpp"
#include "breachlab/core/orchestrator.hpp"
#include "breachlab/core/security_profiles.hpp"
#include "breachlab/utils/container_engine.hpp"
#include "breachlab/utils/signal_watcher.hpp"
#include "breachlab/utils/string_utils.hpp"

#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace breachlab;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║   ██████╗ ██████╗ ███████╗ █████╗  ██████╗██╗  ██╗            ║
║   ██╔══██╗██╔══██╗██╔════╝██╔══██╗██╔════╝██║  ██║            ║
║   ██████╔╝██████╔╝█████╗  ███████║██║     ███████║  LAB       ║
║   ██╔══██╗██╔══██╗██╔══╝  ██╔══██║██║     ██╔══██║            ║
║   ██████╔╝██║  ██║███████╗██║  ██║╚██████╗██║  ██║            ║
║   ╚═════╝ ╚═╝  ╚═╝╚══════╝╚═╝  ╚═╝ ╚═════╝╚═╝  ╚═╝            ║
║                                                               ║
║            Isolated Security Challenge Environments           ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

json SessionToJson(const core::SessionInfo& session) {
    json j = {
        {"session_id", session.session_id},
        {"challenge_id", session.challenge_id},
        {"user_id", session.user_id},
        {"status", core::SessionStatusToString(session.status)},
        {"health", core::HealthStatusToString(session.health)},
        {"access_url", session.access_url},
        {"created_at", utils::StringUtils::FormatTimestamp(session.created_at)},
        {"expires_at", utils::StringUtils::FormatTimestamp(session.expires_at)},
        {"solved", session.solved},
        {"flag_attempts", session.flag_attempts}
    };
    if (!session.container_id.empty()) {
        j["container_id"] = session.container_id.substr(0, 12);
    }
    if (session.grace_ends_at) {
        j["grace_ends_at"] = utils::StringUtils::FormatTimestamp(*session.grace_ends_at);
    }
    if (!session.last_error.empty()) {
        j["last_error"] = session.last_error;
    }
    return j;
}

json ChallengeToJson(const core::ChallengeDefinition& challenge) {
    return {
        {"id", challenge.id},
        {"name", challenge.name},
        {"description", challenge.description},
        {"category", challenge.category},
        {"difficulty", core::DifficultyToString(challenge.difficulty)},
        {"points", challenge.points},
        {"tags", challenge.tags},
        {"hint_count", challenge.hints.size()},
        {"estimated_time", challenge.estimated_time},
        {"source", challenge.source}
    };
}

json HelpJson() {
    return {
        {"commands", {
            "challenges",
            "spawn <challenge_id> <user_id> [timeout_seconds]",
            "stop <session_id>",
            "submit <session_id> <flag>",
            "session <session_id>",
            "health <session_id>",
            "list [user_id]",
            "stats",
            "help",
            "quit"
        }}
    };
}

/*******************************************************************************
 * Command Dispatch
 ******************************************************************************/

json ExecuteCommand(core::Orchestrator& orchestrator, const core::EngineConfig& config,
                    const std::vector<std::string>& args) {
    const std::string command = utils::StringUtils::ToLower(args[0]);

    auto require = [&args](std::size_t count, const char* usage) {
        if (args.size() < count) {
            throw core::ValidationError(std::string("usage: ") + usage);
        }
    };

    if (command == "help") {
        return HelpJson();
    }

    if (command == "challenges") {
        json list = json::array();
        for (const auto& challenge : orchestrator.ListChallenges()) {
            list.push_back(ChallengeToJson(challenge));
        }
        return {{"challenges", list}};
    }

    if (command == "spawn") {
        require(3, "spawn <challenge_id> <user_id> [timeout_seconds]");

        core::SessionInfo session;
        if (args.size() >= 4) {
            long long seconds = 0;
            try {
                seconds = std::stoll(args[3]);
            } catch (const std::exception&) {
                throw core::ValidationError("timeout_seconds must be an integer");
            }
            session = orchestrator.Spawn(args[1], args[2], std::chrono::seconds(seconds));
        } else {
            session = orchestrator.Spawn(args[1], args[2]);
        }

        session = orchestrator.WaitForRunning(session.session_id, config.startup_timeout);
        return SessionToJson(session);
    }

    if (command == "stop") {
        require(2, "stop <session_id>");
        auto result = orchestrator.Stop(args[1]);
        return {{"success", result.success}, {"message", result.message}};
    }

    if (command == "submit") {
        require(3, "submit <session_id> <flag>");
        auto result = orchestrator.ValidateFlagSubmission(args[1], args[2]);
        return {{"valid", result.valid}, {"message", result.message}};
    }

    if (command == "session") {
        require(2, "session <session_id>");
        return SessionToJson(orchestrator.GetSession(args[1]));
    }

    if (command == "health") {
        require(2, "health <session_id>");
        return {
            {"session_id", args[1]},
            {"health", core::HealthStatusToString(orchestrator.GetSessionHealth(args[1]))}
        };
    }

    if (command == "list") {
        json list = json::array();
        const std::string user_id = args.size() >= 2 ? args[1] : std::string();
        for (const auto& session : orchestrator.GetRunningSessions(user_id)) {
            list.push_back(SessionToJson(session));
        }
        json response = {{"sessions", list}};
        if (!user_id.empty()) {
            response["user_id"] = user_id;
        }
        return response;
    }

    if (command == "stats") {
        auto stats = orchestrator.GetStats();
        auto health = orchestrator.GetHealthSummary();
        return {
            {"sessions", {
                {"active", stats.active},
                {"starting", stats.starting},
                {"running", stats.running},
                {"stopping", stats.stopping},
                {"stopped", stats.stopped},
                {"errored", stats.errored},
                {"solved", stats.solved},
                {"unique_users", stats.unique_users}
            }},
            {"health", {
                {"tracked", health.tracked},
                {"healthy", health.healthy},
                {"unhealthy", health.unhealthy},
                {"starting", health.starting},
                {"unknown", health.unknown},
                {"restart_attempts", health.total_restart_attempts},
                {"monitoring", health.is_monitoring}
            }}
        };
    }

    throw core::ValidationError("Unknown command '" + args[0] + "' (try 'help')");
}

void RunConsole(core::Orchestrator& orchestrator, const core::EngineConfig& config,
                const utils::SignalWatcher& signals) {
    std::string line;
    while (!signals.StopRequested() && std::getline(std::cin, line)) {
        auto args = utils::StringUtils::SplitWhitespace(line);
        if (args.empty()) {
            continue;
        }
        if (args[0] == "quit" || args[0] == "exit") {
            break;
        }

        json response;
        try {
            response = ExecuteCommand(orchestrator, config, args);
        } catch (const core::OrchestratorError& e) {
            response = {{"error", core::ErrorKindToString(e.Kind())}, {"message", e.what()}};
        } catch (const std::exception& e) {
            response = {{"error", "internal_error"}, {"message", e.what()}};
        }
        std::cout << response.dump() << std::endl;
    }
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    PrintBanner();

    CLI::App app{"BreachLab Challenge Engine"};
    app.footer("\nCommands are read from stdin, one per line. Type 'help' for the list.");

    std::string config_path = "breachlab.json";
    std::string catalog_path;
    std::string profiles_path;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "Path to engine configuration (JSON)")
        ->default_val("breachlab.json");
    app.add_option("--catalog", catalog_path, "Challenge catalog (overrides config)")
        ->check(CLI::ExistingFile);
    app.add_option("--profiles", profiles_path, "Security profiles file (overrides config)")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    // stdout carries command responses only
    spdlog::set_default_logger(spdlog::stderr_color_mt("breachlab"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    // Before any worker thread starts
    utils::SignalWatcher signals;

    try {
        auto config = core::EngineConfig::LoadFromFile(config_path);

        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
            spdlog::debug("Verbose logging enabled");
        } else {
            spdlog::set_level(spdlog::level::from_str(config.log_level));
        }

        if (!catalog_path.empty()) {
            config.catalog_path = catalog_path;
        }
        if (!profiles_path.empty()) {
            config.security_profiles_path = profiles_path;
        }

        spdlog::info("[INIT] Initializing BreachLab engine...");

        core::ChallengeCatalog catalog;
        catalog.LoadFromFile(config.catalog_path);
        if (!config.imported_catalog_path.empty()) {
            catalog.LoadOverlayFromFile(config.imported_catalog_path);
        }

        core::SecurityProfileResolver profiles;
        if (!config.security_profiles_path.empty()) {
            profiles.LoadFromFile(config.security_profiles_path);
        }

        core::FlagSystem flags(core::FlagSystem::ResolveSecret(config.flag_secret));

        if (!utils::DockerEngine::IsRuntimeAvailable()) {
            spdlog::error("[ERROR] Docker is not available. Install Docker and make sure the daemon is running.");
            return 1;
        }
        spdlog::info("✓ Docker {} detected", utils::DockerEngine::GetRuntimeVersion());

        utils::DockerEngine docker;
        core::Orchestrator orchestrator(catalog, profiles, flags, docker, config.orchestrator);
        orchestrator.SetNoticeCallback([](const core::SessionInfo& session, const std::string& message) {
            json notice = {{"notice", message}, {"session_id", session.session_id}};
            std::cout << notice.dump() << std::endl;
        });

        orchestrator.Start();

        spdlog::info("✓ Ready: {} challenge(s) available. Type 'help' for commands.", catalog.Size());
        RunConsole(orchestrator, config, signals);
        signals.ConsoleFinished();

        orchestrator.Shutdown();
        return 0;

    } catch (const core::ConfigurationError& e) {
        spdlog::error("[ERROR] Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
