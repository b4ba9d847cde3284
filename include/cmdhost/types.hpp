#pragma once

/**
 * @file types.hpp
 * @brief Error and Result types shared by every cmdhost module
 *
 * Fallible operations return Result<T>. Check isOk() before accessing
 * value(), or isErr() before error().
 */

#include <optional>
#include <string>
#include <utility>

namespace cmdhost {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for cmdhost operations
 */
enum class ErrorCode {
    // Registry / dispatch
    COMMAND_NOT_FOUND,
    DUPLICATE_COMMAND,
    INVALID_COMMAND,

    // Pipeline stages
    PARSE_ERROR,
    VALIDATION_ERROR,
    EXECUTION_ERROR,

    // Exclusive execution
    LOCK_CONTENTION,
    LOCK_IO_ERROR,

    // System / IO
    IO_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::COMMAND_NOT_FOUND: return "command_not_found";
        case ErrorCode::DUPLICATE_COMMAND: return "duplicate_command";
        case ErrorCode::INVALID_COMMAND: return "invalid_command";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::VALIDATION_ERROR: return "validation_error";
        case ErrorCode::EXECUTION_ERROR: return "execution_error";
        case ErrorCode::LOCK_CONTENTION: return "lock_contention";
        case ErrorCode::LOCK_IO_ERROR: return "lock_io_error";
        case ErrorCode::IO_ERROR: return "io_error";
        default: return "unknown";
    }
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
    std::string toString() const { return message_; }

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

} // namespace cmdhost
