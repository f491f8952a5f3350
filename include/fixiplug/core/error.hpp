#pragma once

/// @file error.hpp
/// @brief Error handling types for fixi_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace fixi_core {

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
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Plugin lifecycle errors
struct PluginError {
    enum class Kind : std::uint8_t {
        NotFound,           // Plugin not found by name
        AlreadyRegistered,  // Plugin name already in use
        SetupFailed,        // Plugin setup threw
        Invalid,            // Null plugin or empty name
    };

    Kind kind;
    std::string message;
    std::string plugin_id;
    std::string reason;

    [[nodiscard]] static PluginError not_found(const std::string& id) {
        return PluginError{Kind::NotFound, "Plugin not found: " + id, id, {}};
    }

    [[nodiscard]] static PluginError already_registered(const std::string& id) {
        return PluginError{Kind::AlreadyRegistered, "Plugin already registered: " + id, id, {}};
    }

    [[nodiscard]] static PluginError setup_failed(const std::string& id, const std::string& why) {
        return PluginError{Kind::SetupFailed, "Plugin '" + id + "' setup failed: " + why, id, why};
    }

    [[nodiscard]] static PluginError invalid(const std::string& why) {
        return PluginError{Kind::Invalid, "Invalid plugin: " + why, {}, why};
    }
};

/// Skill registry errors
struct SkillError {
    enum class Kind : std::uint8_t {
        Invalid,   // Missing plugin id or skill name
        NotFound,  // No skill under that name
    };

    Kind kind;
    std::string message;
    std::string skill_name;

    [[nodiscard]] static SkillError invalid(const std::string& why) {
        return SkillError{Kind::Invalid, "Invalid skill: " + why, {}};
    }

    [[nodiscard]] static SkillError not_found(const std::string& name) {
        return SkillError{Kind::NotFound, "Skill not found: " + name, name};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        Parse,         // Malformed JSON
        InvalidValue,  // Field present but out of range or wrong type
        Io,            // File could not be read
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static ConfigError parse(const std::string& why) {
        return ConfigError{Kind::Parse, "Config parse error: " + why, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& field_name, const std::string& why) {
        return ConfigError{Kind::InvalidValue, "Invalid config value '" + field_name + "': " + why, field_name};
    }

    [[nodiscard]] static ConfigError io(const std::string& path) {
        return ConfigError{Kind::Io, "Cannot read config file: " + path, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        PluginError,
        SkillError,
        ConfigError,
        std::string  // Generic message
    >;

    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(PluginError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(SkillError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

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

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(PluginError::Kind kind) {
        switch (kind) {
            case PluginError::Kind::NotFound: return ErrorCode::NotFound;
            case PluginError::Kind::AlreadyRegistered: return ErrorCode::AlreadyExists;
            case PluginError::Kind::SetupFailed: return ErrorCode::InvalidState;
            case PluginError::Kind::Invalid: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(SkillError::Kind kind) {
        switch (kind) {
            case SkillError::Kind::Invalid: return ErrorCode::InvalidArgument;
            case SkillError::Kind::NotFound: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::Parse: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::ValidationError;
            case ConfigError::Kind::Io: return ErrorCode::IOError;
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

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + error_text());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + error_text());
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

private:
    std::string error_text() const {
        if constexpr (std::is_same_v<E, Error>) {
            return m_error.message();
        } else {
            return "error";
        }
    }

    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

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

/// Build a full error message with kind details and context
std::string build_error_chain(const Error& error);

} // namespace fixi_core
