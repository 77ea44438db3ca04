#pragma once

/**
 * @file result.hpp
 * @brief Error taxonomy and Result type shared by every stackreg module
 *
 * Fallible operations return Result<T>. Callers check isOk() before
 * value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * auto output = loader.load("myapp-api-stack");
 * if (output.isErr()) {
 *     std::cerr << output.error().describe() << "\n";
 * }
 * ```
 */

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace stackreg {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Driver start-up
    CONFIGURATION_ERROR,

    // Registry integrity
    INVALID_REGISTRY,

    // Output consumer
    UNKNOWN_STACK,
    MISSING_OUTPUT,
    VALIDATION_ERROR,

    // Causes attached to VALIDATION_ERROR
    JSON_PARSE_ERROR,
    SCHEMA_VIOLATION,

    // System / IO
    IO_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
        case ErrorCode::INVALID_REGISTRY: return "INVALID_REGISTRY";
        case ErrorCode::UNKNOWN_STACK: return "UNKNOWN_STACK";
        case ErrorCode::MISSING_OUTPUT: return "MISSING_OUTPUT";
        case ErrorCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
        case ErrorCode::JSON_PARSE_ERROR: return "JSON_PARSE_ERROR";
        case ErrorCode::SCHEMA_VIOLATION: return "SCHEMA_VIOLATION";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
    }
    return "UNKNOWN";
}

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error with a code, a message and an optional underlying cause
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    Error& withCause(Error cause) {
        cause_ = std::make_shared<const Error>(std::move(cause));
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

    /// Underlying error, or nullptr when this error is the root
    const Error* cause() const { return cause_.get(); }

    /// True when this error or any error in its cause chain has the code
    bool hasCause(ErrorCode code) const {
        for (const Error* e = this; e != nullptr; e = e->cause()) {
            if (e->code() == code) return true;
        }
        return false;
    }

    /// Message followed by each cause, one "caused by" per level
    std::string describe() const {
        std::string out = message_;
        for (const Error* e = cause(); e != nullptr; e = e->cause()) {
            out += "\n  caused by: ";
            out += e->message();
        }
        return out;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::shared_ptr<const Error> cause_;
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

    template<typename F>
    auto map(F func) const -> Result<decltype(func(std::declval<const T&>())), E> {
        using U = decltype(func(std::declval<const T&>()));
        if (has_value_) {
            return Result<U, E>::ok(func(value_.value()));
        }
        return Result<U, E>::err(error_.value());
    }

    template<typename F>
    auto flatMap(F func) const -> decltype(func(std::declval<const T&>())) {
        using R = decltype(func(std::declval<const T&>()));
        if (has_value_) {
            return func(value_.value());
        }
        return R::err(error_.value());
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

} // namespace stackreg
