// result.hpp - Typed outcomes for coordinator operations
// Failures are values at the API boundary; inside a store transaction they are
// raised as CoordinatorError so the transaction rolls back.

#pragma once

#include <string>
#include <optional>
#include <stdexcept>
#include <utility>

namespace hashfleet {

enum class ErrorCode {
    NONE = 0,
    NOT_FOUND,
    INVALID_ARGUMENT,
    INVALID_TRANSITION,     // Guard failed; never retried automatically
    INELIGIBLE_AGENT,       // Capability mismatch
    LEASE_EXPIRED,
    STALE_CLAIM,            // Caller no longer owns the claim
    DUPLICATE_SUBMISSION,
    FATAL_AGENT_FAULT,
    UNAUTHORIZED,           // Unknown or revoked credential
    STORE_FAILURE,
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                 return "none";
        case ErrorCode::NOT_FOUND:            return "not_found";
        case ErrorCode::INVALID_ARGUMENT:     return "invalid_argument";
        case ErrorCode::INVALID_TRANSITION:   return "invalid_transition";
        case ErrorCode::INELIGIBLE_AGENT:     return "ineligible_agent";
        case ErrorCode::LEASE_EXPIRED:        return "lease_expired";
        case ErrorCode::STALE_CLAIM:          return "stale_claim";
        case ErrorCode::DUPLICATE_SUBMISSION: return "duplicate_submission";
        case ErrorCode::FATAL_AGENT_FAULT:    return "fatal_agent_fault";
        case ErrorCode::UNAUTHORIZED:         return "unauthorized";
        case ErrorCode::STORE_FAILURE:        return "store_failure";
    }
    return "unknown";
}

struct Error {
    ErrorCode code = ErrorCode::NONE;
    std::string message;

    std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }
};

/**
 * Exception used inside store transactions. Throwing it aborts and rolls
 * back the surrounding Store::atomically() call.
 */
class CoordinatorError : public std::runtime_error {
public:
    CoordinatorError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }
    Error error() const { return Error{code_, what()}; }

private:
    ErrorCode code_;
};

[[noreturn]] inline void fail(ErrorCode code, const std::string& message) {
    throw CoordinatorError(code, message);
}

/**
 * Value or Error.
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return *value_; }
    T& value() & { return *value_; }
    T&& value() && { return std::move(*value_); }

    const T* operator->() const { return &*value_; }
    T* operator->() { return &*value_; }

    const Error& error() const { return error_; }
    ErrorCode code() const { return ok() ? ErrorCode::NONE : error_.code; }

private:
    std::optional<T> value_;
    Error error_;
};

/**
 * Result without a value.
 */
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status success() { return Status(); }

    bool ok() const { return error_.code == ErrorCode::NONE; }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    Error error_;
};

}  // namespace hashfleet
