/**
 * @file errors.hpp
 * @brief Exception hierarchy for user-facing orchestrator operations
 *
 * Every synchronous failure of Spawn, Stop, ValidateFlagSubmission and the
 * session queries is an OrchestratorError subclass. Callers can either catch
 * the concrete type or switch on Kind().
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace breachlab {
namespace core {

/**
 * @enum ErrorKind
 * @brief Machine-readable error category
 */
enum class ErrorKind {
    UNKNOWN_CHALLENGE,   ///< Challenge id not in catalog
    DUPLICATE_SESSION,   ///< (challenge, user) already has a live session
    CONCURRENCY_LIMIT,   ///< Too many starting/running sessions
    PROVISION,           ///< Container engine could not bring the challenge up
    INVALID_SESSION,     ///< Session id unknown or no longer active
    VALIDATION,          ///< Malformed caller input
    CONFIGURATION        ///< Catalog, profile or engine config rejected at load
};

inline const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNKNOWN_CHALLENGE: return "unknown_challenge";
        case ErrorKind::DUPLICATE_SESSION: return "duplicate_session";
        case ErrorKind::CONCURRENCY_LIMIT: return "concurrency_limit";
        case ErrorKind::PROVISION:         return "provision_error";
        case ErrorKind::INVALID_SESSION:   return "invalid_session";
        case ErrorKind::VALIDATION:        return "validation_error";
        case ErrorKind::CONFIGURATION:     return "configuration_error";
    }
    return "unknown";
}

/**
 * @class OrchestratorError
 * @brief Base class of all orchestrator exceptions
 */
class OrchestratorError : public std::runtime_error {
public:
    OrchestratorError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class UnknownChallengeError : public OrchestratorError {
public:
    explicit UnknownChallengeError(const std::string& challenge_id)
        : OrchestratorError(ErrorKind::UNKNOWN_CHALLENGE,
                            "Unknown challenge: " + challenge_id) {}
};

class DuplicateSessionError : public OrchestratorError {
public:
    DuplicateSessionError(const std::string& challenge_id, const std::string& user_id,
                          const std::string& existing_session_id)
        : OrchestratorError(ErrorKind::DUPLICATE_SESSION,
                            "User " + user_id + " already has session " + existing_session_id +
                            " for challenge " + challenge_id),
          existing_session_id_(existing_session_id) {}

    const std::string& ExistingSessionId() const noexcept { return existing_session_id_; }

private:
    std::string existing_session_id_;
};

class ConcurrencyLimitError : public OrchestratorError {
public:
    explicit ConcurrencyLimitError(const std::string& message)
        : OrchestratorError(ErrorKind::CONCURRENCY_LIMIT, message) {}
};

class ProvisionError : public OrchestratorError {
public:
    explicit ProvisionError(const std::string& message)
        : OrchestratorError(ErrorKind::PROVISION, message) {}
};

class InvalidSessionError : public OrchestratorError {
public:
    explicit InvalidSessionError(const std::string& message)
        : OrchestratorError(ErrorKind::INVALID_SESSION, message) {}
};

class ValidationError : public OrchestratorError {
public:
    explicit ValidationError(const std::string& message)
        : OrchestratorError(ErrorKind::VALIDATION, message) {}
};

/**
 * @class ConfigurationError
 * @brief Raised only while loading catalog, profiles or engine config
 */
class ConfigurationError : public OrchestratorError {
public:
    explicit ConfigurationError(const std::string& message)
        : OrchestratorError(ErrorKind::CONFIGURATION, message) {}
};

} // namespace core
} // namespace breachlab
