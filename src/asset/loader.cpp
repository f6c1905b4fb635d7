/// @file loader.cpp
/// @brief relic_asset loader implementation
///
/// Provides non-template parts of the loader, serializer and deriver
/// registries. Typed adapters are template-based in the header.

#include <relic/asset/loader.hpp>
#include <relic/core/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <sstream>

namespace relic_asset {

// =============================================================================
// Extension Utilities
// =============================================================================

std::string normalize_extension(const std::string& ext) {
    std::string result = ext;

    // Remove leading dot if present
    if (!result.empty() && result[0] == '.') {
        result = result.substr(1);
    }

    // Convert to lowercase
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return result;
}

std::vector<std::string> get_extensions_for_type(const LoaderRegistry& registry, std::type_index type) {
    std::vector<std::string> extensions;

    auto loaders = registry.find_by_type(type);
    for (const auto* loader : loaders) {
        auto exts = loader->extensions();
        extensions.insert(extensions.end(), exts.begin(), exts.end());
    }

    // Remove duplicates
    std::sort(extensions.begin(), extensions.end());
    extensions.erase(std::unique(extensions.begin(), extensions.end()), extensions.end());

    return extensions;
}

// =============================================================================
// LoadContext
// =============================================================================

PendingDependency LoadContext::make_dependency(const AssetPath& dep_path,
                                               std::type_index type, bool required) {
    PendingDependency dep;
    dep.path = dep_path;
    dep.required = required;
    if (m_nested) {
        dep.handle = m_nested->request_nested(dep_path, type);
    }
    return dep;
}

void LoadContext::add_dependency(const AssetPath& dep_path, bool required) {
    m_dependencies.push_back(make_dependency(dep_path, std::type_index(typeid(void)), required));
}

Result<Bytes> LoadContext::read_asset_bytes(const AssetPath& other) {
    if (!m_nested) {
        return relic_core::Err<Bytes>(AssetError::io(other.to_string(), "no byte source available"));
    }
    return m_nested->read_nested(other.source_path());
}

// =============================================================================
// LoaderRegistry
// =============================================================================

void LoaderRegistry::register_erased(std::unique_ptr<ErasedLoader> loader) {
    std::unique_lock lock(m_mutex);

    for (const auto& ext : loader->extensions()) {
        m_by_extension[normalize_extension(ext)].push_back(loader.get());
    }
    m_by_type[loader->type_id()].push_back(loader.get());

    relic_core::asset_logger()->debug("Registered loader '{}'", loader->type_name());
    m_loaders.push_back(std::move(loader));
}

ErasedLoader* LoaderRegistry::find(const std::string& ext, std::type_index type) const {
    std::shared_lock lock(m_mutex);

    auto it = m_by_extension.find(normalize_extension(ext));
    if (it == m_by_extension.end() || it->second.empty()) {
        return nullptr;
    }

    const auto& loaders = it->second;
    if (type != std::type_index(typeid(void))) {
        for (auto rit = loaders.rbegin(); rit != loaders.rend(); ++rit) {
            if ((*rit)->type_id() == type) {
                return *rit;
            }
        }
    }
    return loaders.back();
}

ErasedLoader* LoaderRegistry::find_first(const std::string& ext) const {
    return find(ext, std::type_index(typeid(void)));
}

std::vector<ErasedLoader*> LoaderRegistry::find_by_extension(const std::string& ext) const {
    std::shared_lock lock(m_mutex);
    auto it = m_by_extension.find(normalize_extension(ext));
    if (it == m_by_extension.end()) {
        return {};
    }
    return std::vector<ErasedLoader*>(it->second.rbegin(), it->second.rend());
}

std::vector<ErasedLoader*> LoaderRegistry::find_by_type(std::type_index type) const {
    std::shared_lock lock(m_mutex);
    auto it = m_by_type.find(type);
    if (it == m_by_type.end()) {
        return {};
    }
    return std::vector<ErasedLoader*>(it->second.rbegin(), it->second.rend());
}

bool LoaderRegistry::supports_extension(const std::string& ext) const {
    std::shared_lock lock(m_mutex);
    return m_by_extension.find(normalize_extension(ext)) != m_by_extension.end();
}

std::vector<std::string> LoaderRegistry::supported_extensions() const {
    std::shared_lock lock(m_mutex);
    std::vector<std::string> exts;
    exts.reserve(m_by_extension.size());
    for (const auto& [ext, loaders] : m_by_extension) {
        exts.push_back(ext);
    }
    return exts;
}

std::size_t LoaderRegistry::len() const {
    std::shared_lock lock(m_mutex);
    return m_loaders.size();
}

// =============================================================================
// SerializerRegistry
// =============================================================================

void SerializerRegistry::register_erased(std::unique_ptr<ErasedSerializer> serializer) {
    std::unique_lock lock(m_mutex);
    m_by_type[serializer->type_id()] = serializer.get();
    m_by_tag[serializer->type_tag()] = serializer.get();
    relic_core::asset_logger()->debug("Registered serializer '{}'", serializer->type_tag());
    m_serializers.push_back(std::move(serializer));
}

ErasedSerializer* SerializerRegistry::find(std::type_index type) const {
    std::shared_lock lock(m_mutex);
    auto it = m_by_type.find(type);
    return it != m_by_type.end() ? it->second : nullptr;
}

ErasedSerializer* SerializerRegistry::find_by_tag(const std::string& tag) const {
    std::shared_lock lock(m_mutex);
    auto it = m_by_tag.find(tag);
    return it != m_by_tag.end() ? it->second : nullptr;
}

std::size_t SerializerRegistry::len() const {
    std::shared_lock lock(m_mutex);
    return m_by_type.size();
}

// =============================================================================
// DeriverRegistry
// =============================================================================

void DeriverRegistry::register_erased(std::unique_ptr<ErasedDeriver> deriver) {
    std::unique_lock lock(m_mutex);
    relic_core::asset_logger()->debug("Registered deriver '{}'", deriver->name());
    m_derivers[deriver->type_id()] = std::move(deriver);
}

ErasedDeriver* DeriverRegistry::find(std::type_index type) const {
    std::shared_lock lock(m_mutex);
    auto it = m_derivers.find(type);
    return it != m_derivers.end() ? it->second.get() : nullptr;
}

Result<ErasedAsset> DeriverRegistry::apply(ErasedAsset value, const AssetPath& path) const {
    ErasedDeriver* deriver = find(value.type);
    if (!deriver) {
        return relic_core::Ok(std::move(value));
    }
    return deriver->derive_erased(std::move(value), path);
}

std::size_t DeriverRegistry::len() const {
    std::shared_lock lock(m_mutex);
    return m_derivers.size();
}

// =============================================================================
// Loader Statistics
// =============================================================================

namespace {

struct LoaderStatistics {
    std::atomic<std::uint64_t> total_loads{0};
    std::atomic<std::uint64_t> successful_loads{0};
    std::atomic<std::uint64_t> failed_loads{0};
    std::atomic<std::uint64_t> total_bytes_processed{0};
};

LoaderStatistics s_loader_stats;

} // anonymous namespace

void record_loader_operation(bool success, std::size_t bytes) {
    s_loader_stats.total_loads.fetch_add(1, std::memory_order_relaxed);
    if (success) {
        s_loader_stats.successful_loads.fetch_add(1, std::memory_order_relaxed);
        s_loader_stats.total_bytes_processed.fetch_add(bytes, std::memory_order_relaxed);
    } else {
        s_loader_stats.failed_loads.fetch_add(1, std::memory_order_relaxed);
    }
}

std::string format_loader_statistics() {
    std::ostringstream oss;
    oss << "Loader Statistics:\n";
    oss << "  Total loads: " << s_loader_stats.total_loads.load() << "\n";
    oss << "  Successful: " << s_loader_stats.successful_loads.load() << "\n";
    oss << "  Failed: " << s_loader_stats.failed_loads.load() << "\n";
    oss << "  Bytes processed: " << s_loader_stats.total_bytes_processed.load() << "\n";
    return oss.str();
}

void reset_loader_statistics() {
    s_loader_stats.total_loads.store(0);
    s_loader_stats.successful_loads.store(0);
    s_loader_stats.failed_loads.store(0);
    s_loader_stats.total_bytes_processed.store(0);
}

} // namespace relic_asset
