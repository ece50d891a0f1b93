#pragma once

/**
 * @file types.hpp
 * @brief Error handling types shared by the runfiles library
 */

#include <optional>
#include <string>
#include <utility>

namespace runfiles {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for runfiles operations
 */
enum class ErrorCode {
    // Construction
    CONFIG_MISSING,
    MANIFEST_UNREADABLE,
    MANIFEST_MALFORMED,

    // Lookup
    INVALID_ARGUMENT,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONFIG_MISSING: return "CONFIG_MISSING";
        case ErrorCode::MANIFEST_UNREADABLE: return "MANIFEST_UNREADABLE";
        case ErrorCode::MANIFEST_MALFORMED: return "MANIFEST_MALFORMED";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        default: return "UNKNOWN";
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

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

} // namespace runfiles
