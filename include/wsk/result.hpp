#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types used across the wsk library
 *
 * Fallible operations return Result<T>. Configuration problems (cycles,
 * unknown names, missing environment roots) are reported here and stop a run
 * before anything executes. Subprocess failures are not errors; they are
 * recorded as ExecutionOutcome values in the RunSummary.
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wsk {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Configuration (fatal, reported before execution)
    CYCLE_DETECTED,
    UNKNOWN_PACKAGE,
    DUPLICATE_PACKAGE,
    UNKNOWN_SKILL,
    DUPLICATE_SKILL,
    INVALID_SKILL,
    MISSING_ROOT,
    INVALID_MANIFEST,
    INVALID_CONFIG,
    FILE_NOT_FOUND,

    // System / lifecycle
    IO_ERROR,
    INVALID_STATE,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::CYCLE_DETECTED: return "CYCLE_DETECTED";
        case ErrorCode::UNKNOWN_PACKAGE: return "UNKNOWN_PACKAGE";
        case ErrorCode::DUPLICATE_PACKAGE: return "DUPLICATE_PACKAGE";
        case ErrorCode::UNKNOWN_SKILL: return "UNKNOWN_SKILL";
        case ErrorCode::DUPLICATE_SKILL: return "DUPLICATE_SKILL";
        case ErrorCode::INVALID_SKILL: return "INVALID_SKILL";
        case ErrorCode::MISSING_ROOT: return "MISSING_ROOT";
        case ErrorCode::INVALID_MANIFEST: return "INVALID_MANIFEST";
        case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::INVALID_STATE: return "INVALID_STATE";
    }
    return "UNKNOWN";
}

// Configuration errors abort a run before Executing begins
inline bool is_config_error(ErrorCode code) {
    return code != ErrorCode::IO_ERROR && code != ErrorCode::INVALID_STATE;
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    bool isConfigError() const { return is_config_error(code_); }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

// ============================================================================
// Parse Results
// ============================================================================

// Document parsers report soft problems as warnings and keep going
template<typename T>
struct ParseResult {
    bool ok = false;
    std::string error;
    T value;
    std::vector<std::string> warnings;
};

} // namespace wsk
