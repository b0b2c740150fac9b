#pragma once

/// @file error.hpp
/// @brief Error handling types for nitro_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace nitro_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    IncompatibleVersion,
    DependencyMissing,
    PermissionDenied,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Configuration errors (instance/profile package configuration)
struct ConfigError {
    enum class Kind : std::uint8_t {
        MissingField,     // Required field absent
        InvalidField,     // Field has the wrong type or an unknown value
        UnknownFeature,   // Configured feature not offered by the package
        InvalidPackageId, // Package ID fails validation
    };

    Kind kind;
    std::string message;
    std::string field;
    std::string package_id;

    [[nodiscard]] static ConfigError missing_field(const std::string& name) {
        return ConfigError{Kind::MissingField, "Missing field '" + name + "'", name, {}};
    }

    [[nodiscard]] static ConfigError invalid_field(const std::string& name, const std::string& reason) {
        return ConfigError{Kind::InvalidField, "Invalid field '" + name + "': " + reason, name, {}};
    }

    [[nodiscard]] static ConfigError unknown_feature(const std::string& pkg, const std::string& feature) {
        return ConfigError{Kind::UnknownFeature,
            "Configured feature '" + feature + "' does not exist", "features", pkg};
    }

    [[nodiscard]] static ConfigError invalid_package_id(const std::string& id) {
        return ConfigError{Kind::InvalidPackageId, "Invalid package ID '" + id + "'", "id", id};
    }
};

/// Package evaluation errors reported by evaluators
struct PackageError {
    enum class Kind : std::uint8_t {
        NotFound,               // Package does not exist in any repository
        PreloadFailed,          // Batch retrieval failed
        PropertiesUnavailable,  // Properties could not be read
        EvalFailed,             // Relations could not be evaluated
    };

    Kind kind;
    std::string message;
    std::string package_id;
    std::string reason;

    [[nodiscard]] static PackageError not_found(const std::string& id) {
        return PackageError{Kind::NotFound, "Package '" + id + "' does not exist", id, {}};
    }

    [[nodiscard]] static PackageError preload_failed(const std::string& reason) {
        return PackageError{Kind::PreloadFailed, "Failed to preload packages: " + reason, {}, reason};
    }

    [[nodiscard]] static PackageError properties_unavailable(const std::string& id, const std::string& reason) {
        return PackageError{Kind::PropertiesUnavailable,
            "Properties of package '" + id + "' unavailable: " + reason, id, reason};
    }

    [[nodiscard]] static PackageError eval_failed(const std::string& id, const std::string& reason) {
        return PackageError{Kind::EvalFailed, "Package '" + id + "' failed to evaluate: " + reason, id, reason};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ConfigError,
        PackageError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(PackageError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::MissingField: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidField: return ErrorCode::ParseError;
            case ConfigError::Kind::UnknownFeature: return ErrorCode::ValidationError;
            case ConfigError::Kind::InvalidPackageId: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(PackageError::Kind kind) {
        switch (kind) {
            case PackageError::Kind::NotFound: return ErrorCode::NotFound;
            case PackageError::Kind::PreloadFailed: return ErrorCode::IOError;
            case PackageError::Kind::PropertiesUnavailable: return ErrorCode::InvalidState;
            case PackageError::Kind::EvalFailed: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

} // namespace nitro_core
