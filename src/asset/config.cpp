/// @file config.cpp
/// @brief AssetServerConfig parsing

#include <relic/asset/config.hpp>
#include <relic/core/log.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace relic_asset {

namespace {

Error config_error(const std::string& source, const std::string& reason) {
    return Error(relic_core::ErrorCode::ParseError, "Invalid server config " + source + ": " + reason);
}

} // anonymous namespace

std::optional<DependencyPolicy> parse_dependency_policy(const std::string& name) {
    if (name == "fail_fast") return DependencyPolicy::FailFast;
    if (name == "best_effort") return DependencyPolicy::BestEffort;
    return std::nullopt;
}

Result<AssetServerConfig> AssetServerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return relic_core::Err<AssetServerConfig>(config_error("<json>", "expected an object"));
    }

    AssetServerConfig config;

    if (j.contains("asset_dir")) {
        if (!j["asset_dir"].is_string()) {
            return relic_core::Err<AssetServerConfig>(config_error("<json>", "'asset_dir' must be a string"));
        }
        config.asset_dir = j["asset_dir"].get<std::string>();
    }

    if (j.contains("hot_reload")) {
        if (!j["hot_reload"].is_boolean()) {
            return relic_core::Err<AssetServerConfig>(config_error("<json>", "'hot_reload' must be a boolean"));
        }
        config.hot_reload = j["hot_reload"].get<bool>();
    }

    if (j.contains("worker_threads")) {
        if (!j["worker_threads"].is_number_integer() || j["worker_threads"].get<std::int64_t>() < 0) {
            return relic_core::Err<AssetServerConfig>(
                config_error("<json>", "'worker_threads' must be a non-negative integer"));
        }
        config.worker_threads = j["worker_threads"].get<std::size_t>();
    }

    if (j.contains("dependency_policy")) {
        if (!j["dependency_policy"].is_string()) {
            return relic_core::Err<AssetServerConfig>(
                config_error("<json>", "'dependency_policy' must be a string"));
        }
        auto name = j["dependency_policy"].get<std::string>();
        auto policy = parse_dependency_policy(name);
        if (!policy) {
            return relic_core::Err<AssetServerConfig>(
                config_error("<json>", "unknown dependency policy '" + name + "'"));
        }
        config.dependency_policy = *policy;
    }

    if (j.contains("metadata")) {
        if (!j["metadata"].is_boolean()) {
            return relic_core::Err<AssetServerConfig>(config_error("<json>", "'metadata' must be a boolean"));
        }
        config.metadata = j["metadata"].get<bool>();
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            return relic_core::Err<AssetServerConfig>(config_error("<json>", "'log_level' must be a string"));
        }
        auto level = j["log_level"].get<std::string>();
        if (!relic_core::parse_log_level(level)) {
            return relic_core::Err<AssetServerConfig>(
                config_error("<json>", "unknown log level '" + level + "'"));
        }
        config.log_level = level;
    }

    return relic_core::Ok(std::move(config));
}

nlohmann::json AssetServerConfig::to_json() const {
    nlohmann::json j = {
        {"asset_dir", asset_dir},
        {"hot_reload", hot_reload},
        {"worker_threads", worker_threads},
        {"dependency_policy", dependency_policy_name(dependency_policy)},
        {"metadata", metadata}
    };
    if (log_level) {
        j["log_level"] = *log_level;
    }
    return j;
}

Result<AssetServerConfig> load_server_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return relic_core::Err<AssetServerConfig>(
            Error(relic_core::ErrorCode::NotFound, "Server config not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return relic_core::Err<AssetServerConfig>(
            Error(relic_core::ErrorCode::IOError, "Failed to open server config: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return relic_core::Err<AssetServerConfig>(
            config_error(path.string(), std::string("JSON parse error: ") + e.what()));
    }

    auto config = AssetServerConfig::from_json(j);
    if (config) {
        relic_core::asset_logger()->debug("Loaded server config from '{}'", path.string());
    }
    return config;
}

} // namespace relic_asset
