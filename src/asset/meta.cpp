/// @file meta.cpp
/// @brief MetadataStore and record (de)serialization

#include <relic/asset/meta.hpp>
#include <relic/core/id.hpp>
#include <relic/core/log.hpp>

#include <mutex>

namespace relic_asset {

namespace {

constexpr const char* META_EXTENSION = ".meta";
constexpr const char* TMP_EXTENSION = ".tmp";

nlohmann::json optional_string(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

Result<std::optional<std::string>> read_optional_string(const nlohmann::json& j, const char* key,
                                                        const std::string& meta_path) {
    if (!j.contains(key) || j[key].is_null()) {
        return relic_core::Ok(std::optional<std::string>{});
    }
    if (!j[key].is_string()) {
        return relic_core::Err<std::optional<std::string>>(
            MetaError::malformed(meta_path, std::string("'") + key + "' must be a string or null"));
    }
    return relic_core::Ok(std::optional<std::string>(j[key].get<std::string>()));
}

Result<std::uint64_t> read_hex(const nlohmann::json& j, const char* key, const std::string& meta_path) {
    if (!j.contains(key) || !j[key].is_string()) {
        return relic_core::Err<std::uint64_t>(
            MetaError::malformed(meta_path, std::string("missing hex field '") + key + "'"));
    }
    auto value = relic_core::from_hex(j[key].get<std::string>());
    if (!value) {
        return relic_core::Err<std::uint64_t>(MetaError::malformed(meta_path, value.error().message()));
    }
    return value;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

// =============================================================================
// AssetSourceMeta
// =============================================================================

nlohmann::json AssetSourceMeta::to_json() const {
    nlohmann::json produced_json = nlohmann::json::array();
    for (const auto& asset : produced) {
        produced_json.push_back({
            {"asset_id", relic_core::to_hex(asset.asset_id)},
            {"label", optional_string(asset.label)},
            {"type", asset.type},
            {"dependencies", asset.dependencies}
        });
    }

    nlohmann::json derived_json = nlohmann::json::array();
    for (const auto& artifact : derived) {
        derived_json.push_back({
            {"label", optional_string(artifact.label)},
            {"artifact", artifact.artifact},
            {"serializer", artifact.serializer}
        });
    }

    return nlohmann::json{
        {"version", version},
        {"source", source},
        {"fingerprint", relic_core::to_hex(fingerprint)},
        {"loader", loader},
        {"produced", produced_json},
        {"derived", derived_json}
    };
}

Result<AssetSourceMeta> AssetSourceMeta::from_json(const nlohmann::json& j, const std::string& meta_path) {
    if (!j.is_object()) {
        return relic_core::Err<AssetSourceMeta>(MetaError::malformed(meta_path, "record is not an object"));
    }
    if (!j.contains("version") || !j["version"].is_number_integer() ||
        j["version"].get<std::int64_t>() < 0) {
        return relic_core::Err<AssetSourceMeta>(MetaError::malformed(meta_path, "missing 'version'"));
    }

    AssetSourceMeta meta;
    meta.version = j["version"].get<std::uint32_t>();
    if (meta.version != FORMAT_VERSION) {
        return relic_core::Err<AssetSourceMeta>(MetaError::unsupported_version(meta_path, meta.version));
    }

    if (!j.contains("source") || !j["source"].is_string()) {
        return relic_core::Err<AssetSourceMeta>(MetaError::malformed(meta_path, "missing 'source'"));
    }
    meta.source = j["source"].get<std::string>();

    auto fp = read_hex(j, "fingerprint", meta_path);
    if (!fp) {
        return relic_core::Err<AssetSourceMeta>(fp.error());
    }
    meta.fingerprint = fp.value();

    if (j.contains("loader") && j["loader"].is_string()) {
        meta.loader = j["loader"].get<std::string>();
    }

    if (j.contains("produced")) {
        if (!j["produced"].is_array()) {
            return relic_core::Err<AssetSourceMeta>(MetaError::malformed(meta_path, "'produced' must be an array"));
        }
        for (const auto& entry : j["produced"]) {
            ProducedAsset asset;

            auto id = read_hex(entry, "asset_id", meta_path);
            if (!id) {
                return relic_core::Err<AssetSourceMeta>(id.error());
            }
            asset.asset_id = id.value();

            auto label = read_optional_string(entry, "label", meta_path);
            if (!label) {
                return relic_core::Err<AssetSourceMeta>(label.error());
            }
            asset.label = label.value();

            if (entry.contains("type") && entry["type"].is_string()) {
                asset.type = entry["type"].get<std::string>();
            }

            if (entry.contains("dependencies") && entry["dependencies"].is_array()) {
                for (const auto& dep : entry["dependencies"]) {
                    if (!dep.is_string()) {
                        return relic_core::Err<AssetSourceMeta>(
                            MetaError::malformed(meta_path, "dependency must be a string"));
                    }
                    asset.dependencies.push_back(dep.get<std::string>());
                }
            }
            meta.produced.push_back(std::move(asset));
        }
    }

    if (j.contains("derived") && j["derived"].is_array()) {
        for (const auto& entry : j["derived"]) {
            DerivedArtifact artifact;
            auto label = read_optional_string(entry, "label", meta_path);
            if (!label) {
                return relic_core::Err<AssetSourceMeta>(label.error());
            }
            artifact.label = label.value();

            if (!entry.contains("artifact") || !entry["artifact"].is_string()) {
                return relic_core::Err<AssetSourceMeta>(MetaError::malformed(meta_path, "missing 'artifact'"));
            }
            artifact.artifact = entry["artifact"].get<std::string>();
            if (entry.contains("serializer") && entry["serializer"].is_string()) {
                artifact.serializer = entry["serializer"].get<std::string>();
            }
            meta.derived.push_back(std::move(artifact));
        }
    }

    return relic_core::Ok(std::move(meta));
}

Result<AssetSourceMeta> AssetSourceMeta::parse(const Bytes& bytes, const std::string& meta_path) {
    try {
        nlohmann::json j = nlohmann::json::parse(bytes.begin(), bytes.end());
        return from_json(j, meta_path);
    } catch (const nlohmann::json::exception& e) {
        return relic_core::Err<AssetSourceMeta>(
            MetaError::malformed(meta_path, std::string("JSON parse error: ") + e.what()));
    }
}

const ProducedAsset* AssetSourceMeta::find_produced(const std::optional<std::string>& label) const {
    for (const auto& asset : produced) {
        if (asset.label == label) {
            return &asset;
        }
    }
    return nullptr;
}

// =============================================================================
// MetadataStore
// =============================================================================

MetadataStore::MetadataStore(std::shared_ptr<AssetIo> io)
    : m_io(std::move(io)) {}

std::string MetadataStore::meta_path(const AssetPath& source) {
    std::string base = source.path() + META_EXTENSION;
    if (source.source().is_default()) {
        return base;
    }
    return source.source().name + "/" + base;
}

std::uint64_t MetadataStore::fingerprint(const Bytes& bytes) {
    return relic_core::detail::fnv1a_hash(bytes);
}

Result<std::optional<AssetSourceMeta>> MetadataStore::read(const AssetPath& source) {
    AssetPath key = source.source_path();
    {
        std::shared_lock lock(m_mutex);
        auto it = m_cache.find(key);
        if (it != m_cache.end()) {
            return relic_core::Ok(std::optional<AssetSourceMeta>(it->second));
        }
    }

    std::string path = meta_path(key);
    if (!m_io->exists(path)) {
        return relic_core::Ok(std::optional<AssetSourceMeta>{});
    }

    auto bytes = m_io->read(path);
    if (!bytes) {
        return relic_core::Err<std::optional<AssetSourceMeta>>(bytes.error());
    }

    auto meta = AssetSourceMeta::parse(bytes.value(), path);
    if (!meta) {
        return relic_core::Err<std::optional<AssetSourceMeta>>(meta.error());
    }

    std::unique_lock lock(m_mutex);
    m_cache[key] = meta.value();
    return relic_core::Ok(std::optional<AssetSourceMeta>(std::move(meta).value()));
}

Result<void> MetadataStore::write(const AssetSourceMeta& meta) {
    AssetPath key = AssetPath(meta.source).source_path();
    std::string path = meta_path(key);
    std::string tmp = path + TMP_EXTENSION;

    std::string text = meta.to_json().dump(2);
    auto written = m_io->write(tmp, to_bytes(text));
    if (!written) {
        relic_core::meta_logger()->warn("Metadata write failed for '{}': {}",
            path, written.error().message());
        return relic_core::Err(MetaError::write_failed(path, written.error().message()));
    }

    auto renamed = m_io->rename(tmp, path);
    if (!renamed) {
        relic_core::meta_logger()->warn("Metadata replace failed for '{}': {}",
            path, renamed.error().message());
        auto cleaned = m_io->remove(tmp);
        if (!cleaned) {
            relic_core::meta_logger()->debug("Stale temporary record '{}' left behind", tmp);
        }
        return relic_core::Err(MetaError::write_failed(path, renamed.error().message()));
    }

    std::unique_lock lock(m_mutex);
    m_cache[key] = meta;
    relic_core::meta_logger()->debug("Wrote metadata '{}'", path);
    return relic_core::Ok();
}

Result<ImportOutcome> MetadataStore::get_or_import(const AssetPath& source, AssetIo& source_io,
                                                   const Importer& importer) {
    AssetPath key = source.source_path();

    auto bytes = source_io.read(key.path());
    if (!bytes) {
        return relic_core::Err<ImportOutcome>(bytes.error());
    }
    std::uint64_t fp = fingerprint(bytes.value());

    auto existing = read(key);
    if (!existing) {
        relic_core::meta_logger()->warn("Ignoring unreadable metadata for '{}': {}",
            key.to_string(), existing.error().message());
    } else if (existing.value() && existing.value()->fingerprint == fp) {
        return relic_core::Ok(ImportOutcome{std::move(*existing.value()), false});
    }

    auto imported = importer(bytes.value());
    if (!imported) {
        return relic_core::Err<ImportOutcome>(imported.error());
    }

    AssetSourceMeta meta = std::move(imported).value();
    meta.version = AssetSourceMeta::FORMAT_VERSION;
    meta.source = key.to_string();
    meta.fingerprint = fp;

    auto written = write(meta);
    if (!written) {
        return relic_core::Err<ImportOutcome>(written.error());
    }

    relic_core::meta_logger()->info("Imported '{}' ({} asset(s))", meta.source, meta.produced.size());
    return relic_core::Ok(ImportOutcome{std::move(meta), true});
}

bool MetadataStore::is_up_to_date(const AssetPath& source, std::uint64_t fp) {
    auto existing = read(source);
    return existing && existing.value() && existing.value()->fingerprint == fp;
}

Result<void> MetadataStore::remove(const AssetPath& source) {
    AssetPath key = source.source_path();
    {
        std::unique_lock lock(m_mutex);
        m_cache.erase(key);
    }

    std::string path = meta_path(key);
    if (!m_io->exists(path)) {
        return relic_core::Ok();
    }
    return m_io->remove(path);
}

Result<std::size_t> MetadataStore::load_folder(const std::string& dir) {
    RELIC_LOG_SCOPE("load_folder " + dir, "relic_meta");
    if (!m_io->is_directory(dir)) {
        return relic_core::Err<std::size_t>(AssetError::not_found(dir));
    }
    std::size_t count = 0;
    load_folder_recursive(dir, count);
    return relic_core::Ok(count);
}

void MetadataStore::load_folder_recursive(const std::string& dir, std::size_t& count) {
    auto entries = m_io->read_directory(dir);
    if (!entries) {
        relic_core::meta_logger()->warn("Cannot list '{}': {}", dir, entries.error().message());
        return;
    }

    for (const auto& entry : entries.value()) {
        if (m_io->is_directory(entry)) {
            load_folder_recursive(entry, count);
            continue;
        }
        if (!ends_with(entry, META_EXTENSION)) {
            continue;
        }

        auto bytes = m_io->read(entry);
        if (!bytes) {
            relic_core::meta_logger()->warn("Cannot read '{}': {}", entry, bytes.error().message());
            continue;
        }
        auto meta = AssetSourceMeta::parse(bytes.value(), entry);
        if (!meta) {
            relic_core::meta_logger()->warn("Skipping metadata '{}': {}", entry, meta.error().message());
            continue;
        }

        AssetPath key = AssetPath(meta.value().source).source_path();
        std::unique_lock lock(m_mutex);
        m_cache[key] = std::move(meta).value();
        ++count;
    }
}

std::size_t MetadataStore::cached_count() const {
    std::shared_lock lock(m_mutex);
    return m_cache.size();
}

void MetadataStore::clear_cache() {
    std::unique_lock lock(m_mutex);
    m_cache.clear();
}

} // namespace relic_asset
