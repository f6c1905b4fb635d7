#pragma once

/// @file config.hpp
/// @brief AssetServer configuration

#include "fwd.hpp"
#include "types.hpp"
#include <relic/core/error.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace relic_asset {

// =============================================================================
// AssetServerConfig
// =============================================================================

/// Configuration for asset server
struct AssetServerConfig {
    std::string asset_dir = "assets";
    bool hot_reload = true;
    std::size_t worker_threads = 4;  // 0 = loads run inside process()
    DependencyPolicy dependency_policy = DependencyPolicy::FailFast;
    bool metadata = true;            // Persist <source>.meta after each load
    std::optional<std::string> log_level;

    /// Default constructor
    AssetServerConfig() = default;

    /// Builder pattern
    AssetServerConfig& with_asset_dir(const std::string& dir) {
        asset_dir = dir;
        return *this;
    }

    AssetServerConfig& with_hot_reload(bool enable) {
        hot_reload = enable;
        return *this;
    }

    AssetServerConfig& with_worker_threads(std::size_t count) {
        worker_threads = count;
        return *this;
    }

    AssetServerConfig& with_dependency_policy(DependencyPolicy policy) {
        dependency_policy = policy;
        return *this;
    }

    AssetServerConfig& with_metadata(bool enable) {
        metadata = enable;
        return *this;
    }

    AssetServerConfig& with_log_level(const std::string& level) {
        log_level = level;
        return *this;
    }

    /// Parse from JSON. Missing keys keep their defaults.
    [[nodiscard]] static Result<AssetServerConfig> from_json(const nlohmann::json& j);

    /// Serialize to JSON
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Load an AssetServerConfig from a JSON file
[[nodiscard]] Result<AssetServerConfig> load_server_config(const std::filesystem::path& path);

/// Parse dependency policy name ("fail_fast" / "best_effort")
[[nodiscard]] std::optional<DependencyPolicy> parse_dependency_policy(const std::string& name);

} // namespace relic_asset
