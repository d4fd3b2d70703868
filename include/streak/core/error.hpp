#pragma once

/// @file error.hpp
/// @brief Error handling types for streak_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace streak_core {

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
    OutOfMemory,
    NotSupported,
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
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Image and scratch-storage errors
struct ImageError {
    enum class Kind : std::uint8_t {
        ResourceExhausted,  // Allocator could not provide an image
        SizeMismatch,       // Image dimensions differ from what the operation requires
        FormatMismatch,     // Pixel format differs from what the operation requires
        EmptyImage,         // Zero width or height
    };

    Kind kind;
    std::string message;
    std::uint32_t width = 0;
    std::uint32_t height = 0;

    [[nodiscard]] static ImageError resource_exhausted(std::uint32_t w, std::uint32_t h, const std::string& reason) {
        return ImageError{Kind::ResourceExhausted,
            "Scratch image " + std::to_string(w) + "x" + std::to_string(h) + " unavailable: " + reason, w, h};
    }

    [[nodiscard]] static ImageError size_mismatch(std::uint32_t expected_w, std::uint32_t expected_h,
                                                  std::uint32_t found_w, std::uint32_t found_h) {
        return ImageError{Kind::SizeMismatch,
            "Image size mismatch: expected " + std::to_string(expected_w) + "x" + std::to_string(expected_h) +
            ", found " + std::to_string(found_w) + "x" + std::to_string(found_h), found_w, found_h};
    }

    [[nodiscard]] static ImageError format_mismatch(const std::string& expected, const std::string& found) {
        return ImageError{Kind::FormatMismatch, "Pixel format mismatch: expected " + expected + ", found " + found};
    }

    [[nodiscard]] static ImageError empty(const std::string& what) {
        return ImageError{Kind::EmptyImage, "Image is empty: " + what};
    }
};

/// Handle errors
struct HandleError {
    enum class Kind : std::uint8_t {
        Null,         // Handle is null
        Stale,        // Handle generation mismatch (already freed)
        OutOfBounds,  // Handle index out of bounds
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static HandleError null() {
        return HandleError{Kind::Null, "Handle is null"};
    }

    [[nodiscard]] static HandleError stale() {
        return HandleError{Kind::Stale, "Handle is stale (generation mismatch)"};
    }

    [[nodiscard]] static HandleError out_of_bounds() {
        return HandleError{Kind::OutOfBounds, "Handle index out of bounds"};
    }
};

/// Settings document errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        UnknownValue,  // Enumerated field holds an unrecognized string
        TypeMismatch,  // Field holds the wrong JSON type
        Unreadable,    // Document could not be opened or parsed
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static ConfigError unknown_value(const std::string& field_name, const std::string& value) {
        return ConfigError{Kind::UnknownValue, "Unknown value '" + value + "' for '" + field_name + "'", field_name};
    }

    [[nodiscard]] static ConfigError type_mismatch(const std::string& field_name, const std::string& expected) {
        return ConfigError{Kind::TypeMismatch, "Field '" + field_name + "' must be " + expected, field_name};
    }

    [[nodiscard]] static ConfigError unreadable(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::Unreadable, "Cannot read '" + path + "': " + reason, {}};
    }
};

/// Errors in the inputs handed over by the host for a frame
struct InputError {
    enum class Kind : std::uint8_t {
        MissingDepth,     // Host supplied no depth image
        SizeMismatch,     // Depth or motion vectors do not cover the source frame
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static InputError missing_depth() {
        return InputError{Kind::MissingDepth, "Frame source provides no depth image"};
    }

    [[nodiscard]] static InputError size_mismatch(const std::string& what) {
        return InputError{Kind::SizeMismatch, what + " does not match the source frame size"};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ImageError,
        HandleError,
        ConfigError,
        InputError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ImageError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(HandleError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(InputError err) : m_code(ErrorCode::InvalidArgument), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

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

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ImageError::Kind kind) {
        switch (kind) {
            case ImageError::Kind::ResourceExhausted: return ErrorCode::OutOfMemory;
            case ImageError::Kind::SizeMismatch: return ErrorCode::InvalidArgument;
            case ImageError::Kind::FormatMismatch: return ErrorCode::InvalidArgument;
            case ImageError::Kind::EmptyImage: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(HandleError::Kind kind) {
        switch (kind) {
            case HandleError::Kind::Null: return ErrorCode::InvalidArgument;
            case HandleError::Kind::Stale: return ErrorCode::InvalidState;
            case HandleError::Kind::OutOfBounds: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::UnknownValue: return ErrorCode::ParseError;
            case ConfigError::Kind::TypeMismatch: return ErrorCode::ParseError;
            case ConfigError::Kind::Unreadable: return ErrorCode::IOError;
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

/// Result type carrying either a value or an error
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
            throw std::runtime_error("Result contains error: " + describe(m_error));
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + describe(m_error));
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
    static std::string describe(const E& err) {
        if constexpr (std::is_same_v<E, Error>) {
            return err.message();
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

/// Build a single-line description: "[Code] message (key=value, ...)"
[[nodiscard]] std::string build_error_chain(const Error& error);

} // namespace streak_core
