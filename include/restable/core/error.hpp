#pragma once

/// @file error.hpp
/// @brief Error handling types for restable_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace restable_core {

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
    DependencyMissing,
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
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Resource table errors
struct TableError {
    enum class Kind : std::uint8_t {
        DuplicateId,        // Package id already registered
        DuplicateName,      // Package name already registered
        UndefinedPackage,   // Package not found by id or name
        UndefinedType,      // Type not found in package
        UndefinedResource,  // Named resource not found in type
        UndefinedResObject, // Resource id not defined by its package
    };

    Kind kind;
    std::string message;
    std::string package;         // Package name, or decimal id for id lookups
    std::string type;            // For UndefinedType / UndefinedResource
    std::string resource;        // For UndefinedResource
    std::uint32_t resource_id = 0;  // For UndefinedResObject

    /// Factory methods
    [[nodiscard]] static TableError duplicate_id(std::uint8_t id) {
        auto id_str = std::to_string(static_cast<unsigned>(id));
        return TableError{Kind::DuplicateId, "Multiple packages: id=" + id_str, id_str, {}, {}, 0};
    }

    [[nodiscard]] static TableError duplicate_name(const std::string& name) {
        return TableError{Kind::DuplicateName, "Multiple packages: name=" + name, name, {}, {}, 0};
    }

    [[nodiscard]] static TableError undefined_package_id(std::uint8_t id) {
        auto id_str = std::to_string(static_cast<unsigned>(id));
        return TableError{Kind::UndefinedPackage, "Undefined package: id=" + id_str, id_str, {}, {}, 0};
    }

    [[nodiscard]] static TableError undefined_package_name(const std::string& name) {
        return TableError{Kind::UndefinedPackage, "Undefined package: name=" + name, name, {}, {}, 0};
    }

    [[nodiscard]] static TableError undefined_type(const std::string& package, const std::string& type) {
        return TableError{Kind::UndefinedType,
            "Undefined type: " + type + " (package " + package + ")", package, type, {}, 0};
    }

    [[nodiscard]] static TableError undefined_resource(
        const std::string& package, const std::string& type, const std::string& name) {
        return TableError{Kind::UndefinedResource,
            "Undefined resource: " + type + "/" + name + " (package " + package + ")",
            package, type, name, 0};
    }

    /// Resource id lookup miss; message carries the id in hex (implemented in error.cpp)
    [[nodiscard]] static TableError undefined_res_object(std::uint32_t resource_id);

    /// Resource id lookup miss within a named package
    [[nodiscard]] static TableError undefined_res_object(
        const std::string& package, std::uint32_t resource_id);
};

/// Get table error kind name
[[nodiscard]] const char* table_error_kind_name(TableError::Kind kind);

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        TableError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(TableError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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

    /// Check for a specific table error kind
    [[nodiscard]] bool is_table_error(TableError::Kind kind) const {
        const auto* err = as<TableError>();
        return err != nullptr && err->kind == kind;
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

    /// Get all context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(TableError::Kind kind) {
        switch (kind) {
            case TableError::Kind::DuplicateId: return ErrorCode::AlreadyExists;
            case TableError::Kind::DuplicateName: return ErrorCode::AlreadyExists;
            case TableError::Kind::UndefinedPackage: return ErrorCode::NotFound;
            case TableError::Kind::UndefinedType: return ErrorCode::NotFound;
            case TableError::Kind::UndefinedResource: return ErrorCode::NotFound;
            case TableError::Kind::UndefinedResObject: return ErrorCode::NotFound;
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

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

} // namespace restable_core
