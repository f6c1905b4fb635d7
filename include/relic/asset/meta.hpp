#pragma once

/// @file meta.hpp
/// @brief Per-source metadata records for import and change detection

#include "fwd.hpp"
#include "types.hpp"
#include "io.hpp"
#include <relic/core/error.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace relic_asset {

// =============================================================================
// AssetSourceMeta
// =============================================================================

/// One asset produced by importing a source
struct ProducedAsset {
    std::uint64_t asset_id = 0;
    std::optional<std::string> label;
    std::string type;
    std::vector<std::string> dependencies;
};

/// Precomputed artifact derived from a source
struct DerivedArtifact {
    std::optional<std::string> label;
    std::string artifact;
    std::string serializer;
};

/// Persisted record of one source
struct AssetSourceMeta {
    static constexpr std::uint32_t FORMAT_VERSION = 1;

    std::uint32_t version = FORMAT_VERSION;
    std::string source;
    std::uint64_t fingerprint = 0;
    std::string loader;
    std::vector<ProducedAsset> produced;
    std::vector<DerivedArtifact> derived;

    /// Serialize to the persisted JSON layout
    [[nodiscard]] nlohmann::json to_json() const;

    /// Parse the persisted JSON layout
    [[nodiscard]] static Result<AssetSourceMeta> from_json(const nlohmann::json& j,
                                                           const std::string& meta_path);

    /// Parse persisted bytes
    [[nodiscard]] static Result<AssetSourceMeta> parse(const Bytes& bytes,
                                                       const std::string& meta_path);

    /// Produced entry by label (nullopt = default asset)
    [[nodiscard]] const ProducedAsset* find_produced(const std::optional<std::string>& label) const;
};

/// Result of MetadataStore::get_or_import
struct ImportOutcome {
    AssetSourceMeta meta;
    bool imported = false;  // false when the stored record was reused
};

// =============================================================================
// MetadataStore
// =============================================================================

/// Reads and atomically writes `<source>.meta` records through an AssetIo.
/// Records are cached after the first read. Internally synchronized.
class MetadataStore {
public:
    /// Produces a record for source bytes; the store stamps the fingerprint
    using Importer = std::function<Result<AssetSourceMeta>(const Bytes& source_bytes)>;

    explicit MetadataStore(std::shared_ptr<AssetIo> io);

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    /// Record location for a source (file.png -> file.png.meta)
    [[nodiscard]] static std::string meta_path(const AssetPath& source);

    /// Content fingerprint of source bytes
    [[nodiscard]] static std::uint64_t fingerprint(const Bytes& bytes);

    /// Stored record, or nullopt when none exists
    [[nodiscard]] Result<std::optional<AssetSourceMeta>> read(const AssetPath& source);

    /// Replace a record atomically. A failed write leaves the old record intact.
    [[nodiscard]] Result<void> write(const AssetSourceMeta& meta);

    /// Reuse the stored record when the fingerprint matches, else import and persist
    [[nodiscard]] Result<ImportOutcome> get_or_import(const AssetPath& source, AssetIo& source_io,
                                                      const Importer& importer);

    /// Check if the stored record matches a fingerprint
    [[nodiscard]] bool is_up_to_date(const AssetPath& source, std::uint64_t fingerprint);

    /// Delete a record
    [[nodiscard]] Result<void> remove(const AssetPath& source);

    /// Read every record under a directory into the cache; returns the count
    [[nodiscard]] Result<std::size_t> load_folder(const std::string& dir);

    /// Number of cached records
    [[nodiscard]] std::size_t cached_count() const;

    /// Drop cached records (next read goes to the AssetIo)
    void clear_cache();

private:
    void load_folder_recursive(const std::string& dir, std::size_t& count);

    std::shared_ptr<AssetIo> m_io;
    std::map<AssetPath, AssetSourceMeta> m_cache;
    mutable std::shared_mutex m_mutex;
};

} // namespace relic_asset
