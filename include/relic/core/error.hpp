#pragma once

/// @file error.hpp
/// @brief Error handling types for relic_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>
#include <type_traits>

namespace relic_core {

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
    CyclicDependency,
    IncompatibleVersion,
    Cancelled,
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
        case ErrorCode::CyclicDependency: return "CyclicDependency";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Asset load, import and save errors
struct AssetError {
    enum class Kind : std::uint8_t {
        IoError,             // Source bytes unreadable or unwritable
        LoaderNotFound,      // No loader registered for the extension
        DeserializeError,    // Bytes malformed for the matched loader
        DependencyFailed,    // A required dependency did not reach Loaded
        CyclicDependency,    // Dependency chain returns to its origin
        DuplicateAssetId,    // Id collision in a store or a single import
        Cancelled,           // Load cancelled before completion
        SerializerNotFound,  // No serializer registered for the type
        NotFound,            // Unknown path or id
        TypeMismatch,        // Handle type differs from the produced value
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static AssetError io(const std::string& p, const std::string& reason) {
        return AssetError{Kind::IoError, "I/O error for '" + p + "': " + reason, p};
    }

    [[nodiscard]] static AssetError loader_not_found(const std::string& p, const std::string& ext) {
        return AssetError{Kind::LoaderNotFound,
            "No loader registered for extension '" + ext + "' (" + p + ")", p};
    }

    [[nodiscard]] static AssetError deserialize(const std::string& p, const std::string& reason) {
        return AssetError{Kind::DeserializeError, "Failed to parse '" + p + "': " + reason, p};
    }

    [[nodiscard]] static AssetError dependency_failed(const std::string& p, const std::string& dep) {
        return AssetError{Kind::DependencyFailed,
            "Asset '" + p + "' failed to load dependency: " + dep, p};
    }

    [[nodiscard]] static AssetError cyclic_dependency(const std::string& p, const std::string& dep) {
        return AssetError{Kind::CyclicDependency,
            "Dependency '" + dep + "' of '" + p + "' closes a cycle", p};
    }

    [[nodiscard]] static AssetError duplicate_id(const std::string& p, std::uint64_t id) {
        return AssetError{Kind::DuplicateAssetId,
            "Duplicate asset id " + std::to_string(id) + " (" + p + ")", p};
    }

    [[nodiscard]] static AssetError cancelled(const std::string& p) {
        return AssetError{Kind::Cancelled, "Load cancelled: " + p, p};
    }

    [[nodiscard]] static AssetError serializer_not_found(const std::string& type_name) {
        return AssetError{Kind::SerializerNotFound,
            "No serializer registered for type: " + type_name, {}};
    }

    [[nodiscard]] static AssetError not_found(const std::string& p) {
        return AssetError{Kind::NotFound, "Asset not found: " + p, p};
    }

    [[nodiscard]] static AssetError type_mismatch(const std::string& p, const std::string& expected,
                                                  const std::string& found) {
        return AssetError{Kind::TypeMismatch,
            "Type mismatch for '" + p + "': expected " + expected + ", found " + found, p};
    }
};

/// Get asset error kind name
[[nodiscard]] inline const char* asset_error_kind_name(AssetError::Kind kind) {
    switch (kind) {
        case AssetError::Kind::IoError: return "IoError";
        case AssetError::Kind::LoaderNotFound: return "LoaderNotFound";
        case AssetError::Kind::DeserializeError: return "DeserializeError";
        case AssetError::Kind::DependencyFailed: return "DependencyFailed";
        case AssetError::Kind::CyclicDependency: return "CyclicDependency";
        case AssetError::Kind::DuplicateAssetId: return "DuplicateAssetId";
        case AssetError::Kind::Cancelled: return "Cancelled";
        case AssetError::Kind::SerializerNotFound: return "SerializerNotFound";
        case AssetError::Kind::NotFound: return "NotFound";
        case AssetError::Kind::TypeMismatch: return "TypeMismatch";
        default: return "Unknown";
    }
}

/// Metadata record errors
struct MetaError {
    enum class Kind : std::uint8_t {
        Malformed,          // Record is not valid JSON or misses fields
        UnsupportedVersion, // Record written by an incompatible format version
        WriteFailed,        // Atomic replace of the record failed
    };

    Kind kind;
    std::string message;
    std::string meta_path;

    [[nodiscard]] static MetaError malformed(const std::string& p, const std::string& reason) {
        return MetaError{Kind::Malformed, "Malformed metadata '" + p + "': " + reason, p};
    }

    [[nodiscard]] static MetaError unsupported_version(const std::string& p, std::uint32_t found) {
        return MetaError{Kind::UnsupportedVersion,
            "Unsupported metadata version " + std::to_string(found) + " in '" + p + "'", p};
    }

    [[nodiscard]] static MetaError write_failed(const std::string& p, const std::string& reason) {
        return MetaError{Kind::WriteFailed, "Failed to write metadata '" + p + "': " + reason, p};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        AssetError,
        MetaError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error(std::string("Unknown error")) {}
    Error(AssetError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(MetaError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

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

    /// Asset error kind, if this is an asset error
    [[nodiscard]] std::optional<AssetError::Kind> asset_kind() const {
        if (const auto* err = as<AssetError>()) {
            return err->kind;
        }
        return std::nullopt;
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
    static ErrorCode to_error_code(AssetError::Kind kind) {
        switch (kind) {
            case AssetError::Kind::IoError: return ErrorCode::IOError;
            case AssetError::Kind::LoaderNotFound: return ErrorCode::NotSupported;
            case AssetError::Kind::DeserializeError: return ErrorCode::ParseError;
            case AssetError::Kind::DependencyFailed: return ErrorCode::DependencyMissing;
            case AssetError::Kind::CyclicDependency: return ErrorCode::CyclicDependency;
            case AssetError::Kind::DuplicateAssetId: return ErrorCode::AlreadyExists;
            case AssetError::Kind::Cancelled: return ErrorCode::Cancelled;
            case AssetError::Kind::SerializerNotFound: return ErrorCode::NotSupported;
            case AssetError::Kind::NotFound: return ErrorCode::NotFound;
            case AssetError::Kind::TypeMismatch: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(MetaError::Kind kind) {
        switch (kind) {
            case MetaError::Kind::Malformed: return ErrorCode::ParseError;
            case MetaError::Kind::UnsupportedVersion: return ErrorCode::IncompatibleVersion;
            case MetaError::Kind::WriteFailed: return ErrorCode::IOError;
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

/// Result type holding either a value or an error
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

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace relic_core
