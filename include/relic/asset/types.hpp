#pragma once

/// @file types.hpp
/// @brief Core types for relic_asset module

#include "fwd.hpp"
#include <relic/core/error.hpp>
#include <relic/core/id.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <typeindex>
#include <functional>

namespace relic_asset {

using relic_core::AssetError;
using relic_core::Error;
using relic_core::MetaError;
using relic_core::Result;

// =============================================================================
// LoadState
// =============================================================================

/// Externally visible asset loading state
enum class LoadState : std::uint8_t {
    Requested,              // Request accepted, work not started
    Loading,                // Reading or parsing source bytes
    WaitingOnDependencies,  // Parsed, required dependencies not yet terminal
    Loaded,                 // Value present in its store
    Failed,                 // Terminal failure, see LoadStatus::error
    Unloaded,               // Removed, or never known to the server
};

/// Get load state name
[[nodiscard]] inline const char* load_state_name(LoadState state) {
    switch (state) {
        case LoadState::Requested: return "Requested";
        case LoadState::Loading: return "Loading";
        case LoadState::WaitingOnDependencies: return "WaitingOnDependencies";
        case LoadState::Loaded: return "Loaded";
        case LoadState::Failed: return "Failed";
        case LoadState::Unloaded: return "Unloaded";
        default: return "Unknown";
    }
}

/// Check if a state is terminal for a load
[[nodiscard]] inline bool is_terminal(LoadState state) noexcept {
    return state == LoadState::Loaded || state == LoadState::Failed ||
           state == LoadState::Unloaded;
}

// =============================================================================
// DependencyPolicy / LoadOptions
// =============================================================================

/// How a load reacts to a failed required dependency
enum class DependencyPolicy : std::uint8_t {
    FailFast,    // Dependent fails with DependencyFailed
    BestEffort,  // Dependent is Loaded and flagged degraded
};

/// Get dependency policy name
[[nodiscard]] inline const char* dependency_policy_name(DependencyPolicy policy) {
    switch (policy) {
        case DependencyPolicy::FailFast: return "fail_fast";
        case DependencyPolicy::BestEffort: return "best_effort";
        default: return "unknown";
    }
}

/// Per-request load options
struct LoadOptions {
    std::optional<DependencyPolicy> policy;  // Server default when unset

    LoadOptions() = default;

    [[nodiscard]] static LoadOptions best_effort() {
        LoadOptions opts;
        opts.policy = DependencyPolicy::BestEffort;
        return opts;
    }

    [[nodiscard]] static LoadOptions fail_fast() {
        LoadOptions opts;
        opts.policy = DependencyPolicy::FailFast;
        return opts;
    }
};

// =============================================================================
// SourceId
// =============================================================================

/// Named byte source. The empty name is the default source.
struct SourceId {
    std::string name;

    SourceId() = default;
    explicit SourceId(std::string n) : name(std::move(n)) {}

    [[nodiscard]] bool is_default() const noexcept { return name.empty(); }

    /// Textual prefix ("" for the default source, "name://" otherwise)
    [[nodiscard]] std::string prefix() const {
        return name.empty() ? std::string() : name + "://";
    }

    bool operator==(const SourceId& other) const noexcept { return name == other.name; }
    bool operator!=(const SourceId& other) const noexcept { return name != other.name; }
    bool operator<(const SourceId& other) const noexcept { return name < other.name; }
};

// =============================================================================
// AssetPath
// =============================================================================

/// Source + normalized relative path + optional label.
///
/// Textual form is `[source://]path[#label]`. Paths use forward slashes,
/// never start with '/', and have "." and ".." segments folded.
class AssetPath {
public:
    AssetPath() = default;

    /// Parse textual form
    AssetPath(const std::string& text);
    AssetPath(const char* text) : AssetPath(std::string(text)) {}

    /// Construct from components
    AssetPath(SourceId source, std::string path, std::optional<std::string> label = std::nullopt);

    [[nodiscard]] const SourceId& source() const noexcept { return m_source; }
    [[nodiscard]] const std::string& path() const noexcept { return m_path; }
    [[nodiscard]] const std::optional<std::string>& label() const noexcept { return m_label; }
    [[nodiscard]] bool has_label() const noexcept { return m_label.has_value(); }
    [[nodiscard]] bool empty() const noexcept { return m_path.empty(); }

    /// Path identifying the source file (label dropped)
    [[nodiscard]] AssetPath source_path() const {
        return AssetPath(m_source, m_path, std::nullopt);
    }

    /// Same source file with a different label
    [[nodiscard]] AssetPath with_label(std::string label) const {
        return AssetPath(m_source, m_path, std::move(label));
    }

    /// Lower-cased extension without the dot
    [[nodiscard]] std::string extension() const;

    /// Filename (without directory)
    [[nodiscard]] std::string filename() const;

    /// Directory part of the path ("" at the source root)
    [[nodiscard]] std::string directory() const;

    /// Filename without extension
    [[nodiscard]] std::string stem() const;

    /// Resolve a reference found inside this asset.
    /// "#label" stays in this file, "src://p" is absolute, "/p" is rooted in
    /// this source, anything else is relative to this file's directory.
    [[nodiscard]] AssetPath resolve(const std::string& reference) const;

    /// Textual form
    [[nodiscard]] std::string to_string() const;

    /// Stable 64-bit hash of all three components
    [[nodiscard]] std::uint64_t hash() const noexcept { return m_hash; }

    bool operator==(const AssetPath& other) const noexcept {
        return m_hash == other.m_hash && m_path == other.m_path &&
               m_source == other.m_source && m_label == other.m_label;
    }

    bool operator!=(const AssetPath& other) const noexcept { return !(*this == other); }

    bool operator<(const AssetPath& other) const noexcept {
        if (m_source != other.m_source) return m_source < other.m_source;
        if (m_path != other.m_path) return m_path < other.m_path;
        return m_label < other.m_label;
    }

    /// Fold separators and dot segments
    [[nodiscard]] static std::string normalize(const std::string& path);

private:
    void rehash() noexcept;

    SourceId m_source;
    std::string m_path;
    std::optional<std::string> m_label;
    std::uint64_t m_hash = 0;
};

// =============================================================================
// AssetId
// =============================================================================

/// Identifier of a value inside its typed store.
///
/// Ids of path-loaded assets are derived from the AssetPath hash and have
/// the high bit clear; generated ids have it set, so the two never collide.
struct AssetId {
    static constexpr std::uint64_t GENERATED_BIT = 1ULL << 63;

    std::uint64_t value = 0;
    std::type_index type{typeid(void)};

    /// Default constructor (invalid ID)
    AssetId() = default;

    AssetId(std::uint64_t raw, std::type_index t) noexcept : value(raw), type(t) {}

    /// Construct from raw ID for type T
    template<typename T>
    [[nodiscard]] static AssetId of(std::uint64_t raw) {
        return AssetId{raw, std::type_index(typeid(T))};
    }

    /// Deterministic id for a path-loaded asset
    [[nodiscard]] static AssetId from_path(const AssetPath& path, std::type_index t) noexcept;

    template<typename T>
    [[nodiscard]] static AssetId from_path(const AssetPath& path) noexcept {
        return from_path(path, std::type_index(typeid(T)));
    }

    /// Fresh id from the process-wide counter (never reused)
    [[nodiscard]] static AssetId generate(std::type_index t) noexcept;

    template<typename T>
    [[nodiscard]] static AssetId generate() noexcept {
        return generate(std::type_index(typeid(T)));
    }

    /// Check if valid
    [[nodiscard]] bool is_valid() const noexcept { return value != 0; }

    /// Check if produced by generate()
    [[nodiscard]] bool is_generated() const noexcept { return (value & GENERATED_BIT) != 0; }

    /// Get raw value
    [[nodiscard]] std::uint64_t raw() const noexcept { return value; }

    /// Check value type
    template<typename T>
    [[nodiscard]] bool is() const noexcept { return type == std::type_index(typeid(T)); }

    bool operator==(const AssetId& other) const noexcept {
        return value == other.value && type == other.type;
    }

    bool operator!=(const AssetId& other) const noexcept { return !(*this == other); }

    bool operator<(const AssetId& other) const noexcept {
        if (type != other.type) return type < other.type;
        return value < other.value;
    }

    /// Create invalid ID
    [[nodiscard]] static AssetId invalid() noexcept { return AssetId{}; }
};

// =============================================================================
// LoadStatus
// =============================================================================

/// Detailed load state of one asset
struct LoadStatus {
    LoadState state = LoadState::Unloaded;
    std::optional<AssetError::Kind> error;
    std::string error_message;
    bool degraded = false;
    std::uint32_t generation = 0;

    [[nodiscard]] bool is_loaded() const noexcept { return state == LoadState::Loaded; }
    [[nodiscard]] bool is_failed() const noexcept { return state == LoadState::Failed; }
};

// =============================================================================
// AssetEvent
// =============================================================================

/// Type of asset event
enum class AssetEventKind : std::uint8_t {
    Added,
    Modified,
    Removed,
    LoadFailed,
};

/// Get event kind name
[[nodiscard]] inline const char* asset_event_kind_name(AssetEventKind kind) {
    switch (kind) {
        case AssetEventKind::Added: return "Added";
        case AssetEventKind::Modified: return "Modified";
        case AssetEventKind::Removed: return "Removed";
        case AssetEventKind::LoadFailed: return "LoadFailed";
        default: return "Unknown";
    }
}

/// Asset lifecycle event
struct AssetEvent {
    AssetEventKind kind = AssetEventKind::Added;
    AssetId id;
    AssetPath path;
    std::uint32_t generation = 0;
    std::optional<AssetError::Kind> error_kind;
    std::string error;

    [[nodiscard]] static AssetEvent added(AssetId id, const AssetPath& path, std::uint32_t gen) {
        return AssetEvent{AssetEventKind::Added, id, path, gen, std::nullopt, {}};
    }

    [[nodiscard]] static AssetEvent modified(AssetId id, const AssetPath& path, std::uint32_t gen) {
        return AssetEvent{AssetEventKind::Modified, id, path, gen, std::nullopt, {}};
    }

    [[nodiscard]] static AssetEvent removed(AssetId id, const AssetPath& path) {
        return AssetEvent{AssetEventKind::Removed, id, path, 0, std::nullopt, {}};
    }

    [[nodiscard]] static AssetEvent load_failed(AssetId id, const AssetPath& path,
                                                AssetError::Kind kind, const std::string& err) {
        return AssetEvent{AssetEventKind::LoadFailed, id, path, 0, kind, err};
    }
};

} // namespace relic_asset

/// Hash specializations
template<>
struct std::hash<relic_asset::AssetId> {
    std::size_t operator()(const relic_asset::AssetId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value) ^ (id.type.hash_code() << 1);
    }
};

template<>
struct std::hash<relic_asset::AssetPath> {
    std::size_t operator()(const relic_asset::AssetPath& path) const noexcept {
        return static_cast<std::size_t>(path.hash());
    }
};
