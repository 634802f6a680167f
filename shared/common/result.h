// ============================================================================
// File: shared/common/result.h
// Description: Result / ResultCode returned by every fallible tierwatch call
// ============================================================================

#pragma once
#include <string>
#include <utility>
#include <optional>
#include <cstdint>


// Grouped by origin. Append new codes at the end of their group.
enum class ResultCode : int32_t {
    OK                  = 0,

    // configuration & arguments
    InvalidArgument     = 100,
    AlreadyExists       = 101,
    DuplicateIgnored    = 102,
    NotFound            = 103,

    // host resources
    PermissionDenied    = 200,
    Timeout             = 201,
    InvalidState        = 204,

    // tierwatch itself
    InternalError       = 300,
    NotSupported        = 301,

    // external collaborators (systemctl, database control, unit registration)
    CommandFailed       = 500,
    InstallFailed       = 501,

    Unknown
};

// DuplicateIgnored is a success: the requested state already holds.
inline constexpr bool isSuccess(ResultCode code) noexcept {
    return code == ResultCode::OK || code == ResultCode::DuplicateIgnored;
}

inline constexpr bool isFailure(ResultCode code) noexcept {
    return !isSuccess(code);
}

constexpr const char* to_string(ResultCode code) {
    switch (code) {
        case ResultCode::OK:               return "OK";
        case ResultCode::InvalidArgument:  return "InvalidArgument";
        case ResultCode::AlreadyExists:    return "AlreadyExists";
        case ResultCode::DuplicateIgnored: return "DuplicateIgnored";
        case ResultCode::NotFound:         return "NotFound";
        case ResultCode::PermissionDenied: return "PermissionDenied";
        case ResultCode::Timeout:          return "Timeout";
        case ResultCode::InvalidState:     return "InvalidState";
        case ResultCode::InternalError:    return "InternalError";
        case ResultCode::NotSupported:     return "NotSupported";
        case ResultCode::CommandFailed:    return "CommandFailed";
        case ResultCode::InstallFailed:    return "InstallFailed";
        default:                           return "Unknown";
    }
}

// ----------------------------------------------------------------------------
// Result<T, E>
// ----------------------------------------------------------------------------

template <typename T, typename E = std::optional<std::string>>
class Result {
public:
    Result() : code_(ResultCode::OK), error_(std::nullopt) {}

    static Result OK(T value) { return Result(std::move(value)); }
    static Result Error(ResultCode code, E error = std::nullopt) { return Result(code, std::move(error)); }

    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] ResultCode code() const noexcept { return code_; }
    [[nodiscard]] const T& value() const noexcept { return value_; }
    [[nodiscard]] T& value() noexcept  { return value_; }
    [[nodiscard]] const E& error() const noexcept  { return error_; }

    // error text, or the code name when none was given
    [[nodiscard]] std::string message() const {
        return error_.has_value() ? *error_ : std::string(to_string(code_));
    }

private:
    ResultCode code_;
    T value_{};
    E error_;

    explicit Result(T val)
        : code_(ResultCode::OK), value_(std::move(val)), error_(std::nullopt) {}

    Result(ResultCode code, E err)
        : code_(code), error_(std::move(err)) {}
};

// ----------------------------------------------------------------------------
// Result<void>
// ----------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    Result() : code_(ResultCode::OK), error_(std::nullopt) {}
    static Result OK() { return Result(ResultCode::OK, std::nullopt); }
    static Result Error(ResultCode code, E error = std::nullopt) { return Result(code, std::move(error)); }

    // Drops the value of any other Result, keeping code and text.
    template <typename U>
    static Result from(const Result<U, E>& other) { return Result(other.code(), other.error()); }

    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] const E& error() const noexcept  { return error_; }
    [[nodiscard]] ResultCode code() const noexcept  { return code_; }

    [[nodiscard]] std::string message() const {
        return error_.has_value() ? *error_ : std::string(to_string(code_));
    }

    // for status lines; empty on success
    [[nodiscard]] const char* c_str() const noexcept  {
        return error_.has_value() ? error_->c_str() : "";
    }

private:
    ResultCode code_;
    E error_;

    Result(ResultCode code, E e)
        : code_(code), error_(std::move(e)) {}
};

// "Timeout: database not online after 21 attempts"
inline std::string to_string(const Result<void>& r) {
    return std::string(to_string(r.code())) +
           (r.error().has_value() ? (": " + *r.error()) : "");
}

inline Result<void> OK() noexcept { return Result<void>::OK(); }
inline Result<void> Error(ResultCode code, std::optional<std::string> msg = std::nullopt) noexcept  {
    return Result<void>::Error(code, std::move(msg));
}

// Accepted duplicate, e.g. removing a unit file that is already gone
inline Result<void> DuplicateIgnored(std::optional<std::string> msg = std::nullopt) noexcept  {
    return Result<void>::Error(ResultCode::DuplicateIgnored, std::move(msg));
}
