#pragma once

/// @file error.hpp
/// @brief Error handling types for stockpile_core

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>
#include <type_traits>

namespace stockpile_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
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

/// Errors raised while reading catalog and request files
struct InputError {
    enum class Kind : std::uint8_t {
        OpenFailed,     // File could not be opened
        ReadFailed,     // Stream went bad mid-read
        MalformedLine,  // Line does not match the expected layout
    };

    Kind kind;
    std::string message;
    std::string path;
    std::size_t line{0};    // 1-based, 0 when not line related

    /// Factory methods
    [[nodiscard]] static InputError open_failed(const std::string& file) {
        return InputError{Kind::OpenFailed, "Unable to open file: " + file, file, 0};
    }

    /// Stream readers do not know their source; leave `file` empty and let the
    /// caller attach a "path" context instead
    [[nodiscard]] static InputError read_failed(const std::string& file = {}) {
        return InputError{Kind::ReadFailed, file.empty() ? "Read failed" : "Read failed: " + file, file, 0};
    }

    [[nodiscard]] static InputError malformed_line(std::size_t line_no, const std::string& text) {
        return InputError{Kind::MalformedLine,
            "Malformed line " + std::to_string(line_no) + ": '" + text + "'", {}, line_no};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        ParseFailed,    // Config file is not valid JSON
        InvalidValue,   // Key holds a value of the wrong type or range
        UnknownOption,  // Enumerated option name not recognized
    };

    Kind kind;
    std::string message;
    std::string key;
    std::string value;

    [[nodiscard]] static ConfigError parse_failed(const std::string& file, const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Config parse error in " + file + ": " + reason, {}, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& k, const std::string& v) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + k + "': " + v, k, v};
    }

    [[nodiscard]] static ConfigError unknown_option(const std::string& k, const std::string& v) {
        return ConfigError{Kind::UnknownOption, "Unknown option for '" + k + "': " + v, k, v};
    }
};

// =============================================================================
// Error
// =============================================================================

/// ErrorCode reported for each input error kind
[[nodiscard]] constexpr ErrorCode code_of(InputError::Kind kind) noexcept {
    return kind == InputError::Kind::MalformedLine ? ErrorCode::ParseError : ErrorCode::IOError;
}

/// ErrorCode reported for each configuration error kind
[[nodiscard]] constexpr ErrorCode code_of(ConfigError::Kind kind) noexcept {
    switch (kind) {
        case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
        case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
        case ConfigError::Kind::UnknownOption: return ErrorCode::ValidationError;
    }
    return ErrorCode::Unknown;
}

/// An error code, the domain error that caused it, and key/value context
/// attached while the error travels outward (e.g. the file being read).
class Error {
public:
    /// Plain strings carry errors that have no structured kind
    using Variant = std::variant<InputError, ConfigError, std::string>;

    Error(InputError err) : m_code(code_of(err.kind)), m_kind(std::move(err)) {}
    Error(ConfigError err) : m_code(code_of(err.kind)), m_kind(std::move(err)) {}
    Error(std::string msg) : m_code(ErrorCode::Unknown), m_kind(std::move(msg)) {}
    Error(const char* msg) : Error(std::string(msg)) {}
    Error(ErrorCode code, std::string msg) : m_code(code), m_kind(std::move(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Human readable message of the underlying kind
    [[nodiscard]] std::string message() const {
        if (const auto* text = std::get_if<std::string>(&m_kind)) {
            return *text;
        }
        if (const auto* input = std::get_if<InputError>(&m_kind)) {
            return input->message;
        }
        return std::get<ConfigError>(m_kind).message;
    }

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(m_kind); }

    /// The underlying kind, or nullptr when it is another one
    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&m_kind); }

    [[nodiscard]] const Variant& variant() const noexcept { return m_kind; }

    /// Attach context; an existing key is overwritten
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it == m_context.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Variant m_kind;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Either a value or an error, never both
template<typename T, typename E>
class Result {
    static constexpr std::size_t value_index = 0;
    static constexpr std::size_t error_index = 1;

public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_storage(std::in_place_index<value_index>, std::move(value)) {}
    Result(E error) : m_storage(std::in_place_index<error_index>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_storage.index() == value_index; }
    [[nodiscard]] bool is_err() const noexcept { return m_storage.index() == error_index; }
    explicit operator bool() const noexcept { return is_ok(); }

    /// Value access; only valid when is_ok()
    [[nodiscard]] T& value() & { return *std::get_if<value_index>(&m_storage); }
    [[nodiscard]] const T& value() const& { return *std::get_if<value_index>(&m_storage); }
    [[nodiscard]] T&& value() && { return std::move(*std::get_if<value_index>(&m_storage)); }

    /// Error access; only valid when is_err()
    [[nodiscard]] E& error() & { return *std::get_if<error_index>(&m_storage); }
    [[nodiscard]] const E& error() const& { return *std::get_if<error_index>(&m_storage); }

    [[nodiscard]] T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    /// Value access that throws std::runtime_error on an error result
    [[nodiscard]] T& unwrap() & {
        require_value();
        return value();
    }

    [[nodiscard]] T&& unwrap() && {
        require_value();
        return std::move(*this).value();
    }

    /// Transform the value, passing an error through untouched
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using Mapped = Result<decltype(func(std::declval<T>())), E>;
        if (is_err()) {
            return Mapped(std::move(error()));
        }
        return Mapped(func(std::move(value())));
    }

    /// Continue with a function that itself returns a Result
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        using Next = decltype(func(std::declval<T>()));
        if (is_err()) {
            return Next(std::move(error()));
        }
        return func(std::move(value()));
    }

    /// Recover from an error
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (is_ok()) {
            return Result<T, E>(std::move(value()));
        }
        return func(error());
    }

private:
    void require_value() const {
        if (is_err()) {
            throw std::runtime_error("unwrap() called on an error Result");
        }
    }

    std::variant<T, E> m_storage;
};

/// Result carrying no value
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    /// Only valid when is_err()
    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

    void unwrap() const {
        if (is_err()) {
            throw std::runtime_error("unwrap() called on an error Result");
        }
    }

private:
    std::optional<E> m_error;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

/// "[Code] kind details [key=value]..." for error log lines
std::string build_error_chain(const Error& error);

} // namespace stockpile_core
