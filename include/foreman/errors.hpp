#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/types.h>

namespace foreman {

enum class ErrorCode {
    LOCK_TIMEOUT,                  // Lock not acquired within the timeout (retryable)
    LOCK_HELD,                     // Lock held by a live process (busy, retryable)
    STATE_CORRUPTION,              // State file unreadable and no valid backup
    INVARIANT_VIOLATION,
    MANUAL_INTERVENTION_REQUIRED,  // Unresolved violations block the commit
    DUPLICATE_ID,
    UNKNOWN_DEPENDENCY,
    CYCLE_DETECTED,
    CAPACITY_EXCEEDED,             // Normal "no free slot" signal from claim
    NO_ELIGIBLE_WORK,
    NOT_FOUND,
    INVALID_STATE,
    INVALID_INPUT,
    IO_ERROR
};

/**
 * Convert ErrorCode to string for logging and JSON output
 */
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::LOCK_TIMEOUT: return "LockTimeout";
        case ErrorCode::LOCK_HELD: return "LockHeld";
        case ErrorCode::STATE_CORRUPTION: return "StateCorruption";
        case ErrorCode::INVARIANT_VIOLATION: return "InvariantViolation";
        case ErrorCode::MANUAL_INTERVENTION_REQUIRED: return "ManualInterventionRequired";
        case ErrorCode::DUPLICATE_ID: return "DuplicateID";
        case ErrorCode::UNKNOWN_DEPENDENCY: return "UnknownDependency";
        case ErrorCode::CYCLE_DETECTED: return "CycleDetected";
        case ErrorCode::CAPACITY_EXCEEDED: return "CapacityExceeded";
        case ErrorCode::NO_ELIGIBLE_WORK: return "NoEligibleWork";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::INVALID_STATE: return "InvalidState";
        case ErrorCode::INVALID_INPUT: return "InvalidInput";
        case ErrorCode::IO_ERROR: return "IoError";
        default: return "Unknown";
    }
}

/**
 * Error raised for infrastructure failures (locking, persistence, invariants)
 * and for operations on unknown ids or items in the wrong state.
 *
 * Expected outcomes of AddWork and ClaimWork are returned in their result
 * structs instead.
 */
class CoordinatorError : public std::runtime_error {
public:
    CoordinatorError(ErrorCode code, const std::string& message,
                     nlohmann::json details = nlohmann::json::object())
        : std::runtime_error(message), code_(code), details_(std::move(details)) {}

    static CoordinatorError lock_held(pid_t pid, const std::string& lock_file) {
        CoordinatorError error(ErrorCode::LOCK_HELD,
                               "Lock " + lock_file + " held by active process " + std::to_string(pid),
                               {{"pid", pid}, {"lock_file", lock_file}});
        error.holder_pid_ = pid;
        return error;
    }

    ErrorCode code() const { return code_; }
    std::optional<pid_t> holder_pid() const { return holder_pid_; }
    const nlohmann::json& details() const { return details_; }

    bool is_retryable() const {
        return code_ == ErrorCode::LOCK_TIMEOUT || code_ == ErrorCode::LOCK_HELD;
    }

private:
    ErrorCode code_;
    std::optional<pid_t> holder_pid_;
    nlohmann::json details_;
};

} // namespace foreman
