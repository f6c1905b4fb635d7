#pragma once

/// @file loader.hpp
/// @brief Loader, serializer and deriver capabilities for relic_asset

#include "fwd.hpp"
#include "types.hpp"
#include "handle.hpp"
#include "assets.hpp"
#include "io.hpp"
#include <relic/core/error.hpp>
#include <relic/core/task_pool.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

namespace relic_asset {

// =============================================================================
// NestedLoader
// =============================================================================

/// Facility a running loader uses to reach back into its server
class NestedLoader {
public:
    virtual ~NestedLoader() = default;

    /// Request a load without blocking. A void type resolves by extension.
    [[nodiscard]] virtual UntypedHandle request_nested(const AssetPath& path, std::type_index type) = 0;

    /// Read raw bytes of another source
    [[nodiscard]] virtual Result<Bytes> read_nested(const AssetPath& path) = 0;
};

// =============================================================================
// LoadContext
// =============================================================================

/// Dependency reported by a loader
struct PendingDependency {
    AssetPath path;
    bool required = true;
    UntypedHandle handle;  // Null when loading outside a server
};

/// Sub-asset produced next to the default asset
struct LabeledAsset {
    std::string label;
    ErasedAsset value;
    std::vector<PendingDependency> dependencies;
};

/// Context passed to asset loaders during loading
class LoadContext {
public:
    /// Constructor
    LoadContext(
        const Bytes& data,
        const AssetPath& path,
        NestedLoader* nested = nullptr,
        relic_core::CancellationToken token = {})
        : m_data(data)
        , m_path(path)
        , m_nested(nested)
        , m_token(std::move(token)) {}

    /// Get raw data
    [[nodiscard]] const Bytes& data() const noexcept {
        return m_data;
    }

    /// Get data as string
    [[nodiscard]] std::string data_as_string() const {
        return std::string(m_data.begin(), m_data.end());
    }

    /// Get asset path (label dropped)
    [[nodiscard]] const AssetPath& path() const noexcept {
        return m_path;
    }

    /// Get file extension
    [[nodiscard]] std::string extension() const {
        return m_path.extension();
    }

    /// Get data size
    [[nodiscard]] std::size_t size() const noexcept {
        return m_data.size();
    }

    /// Check if the load was cancelled
    [[nodiscard]] bool is_cancelled() const noexcept {
        return m_token.is_cancelled();
    }

    /// Report a dependency of the default asset and start loading it
    void add_dependency(const AssetPath& dep_path, bool required = true);

    /// Start a typed nested load; the result is a dependency of the default asset
    template<typename U>
    [[nodiscard]] Handle<U> load(const AssetPath& dep_path, bool required = true) {
        auto dep = make_dependency(dep_path, std::type_index(typeid(U)), required);
        Handle<U> handle = dep.handle.template typed<U>();
        m_dependencies.push_back(std::move(dep));
        return handle;
    }

    /// Add a labeled sub-asset. Fails with DuplicateAssetId if the label was
    /// already produced by this load.
    template<typename U>
    Result<void> add_labeled_asset(const std::string& label, U value,
                                   const std::vector<AssetPath>& deps = {}) {
        for (const auto& existing : m_labeled) {
            if (existing.label == label) {
                Error err = AssetError::duplicate_id(
                    m_path.with_label(label).to_string(),
                    AssetId::from_path<U>(m_path.with_label(label)).raw());
                m_error = err;
                return relic_core::Err(std::move(err));
            }
        }

        LabeledAsset labeled;
        labeled.label = label;
        labeled.value = ErasedAsset::from(std::make_unique<U>(std::move(value)));
        for (const auto& dep : deps) {
            labeled.dependencies.push_back(make_dependency(dep, std::type_index(typeid(void)), true));
        }
        m_labeled.push_back(std::move(labeled));
        return relic_core::Ok();
    }

    /// Read another source's bytes without loading it as an asset
    [[nodiscard]] Result<Bytes> read_asset_bytes(const AssetPath& other);

    /// Dependencies of the default asset
    [[nodiscard]] std::vector<PendingDependency>& dependencies() noexcept {
        return m_dependencies;
    }

    /// Labeled sub-assets
    [[nodiscard]] std::vector<LabeledAsset>& labeled_assets() noexcept {
        return m_labeled;
    }

    /// First error recorded by a context operation
    [[nodiscard]] const std::optional<Error>& error() const noexcept {
        return m_error;
    }

private:
    [[nodiscard]] PendingDependency make_dependency(const AssetPath& dep_path,
                                                    std::type_index type, bool required);

    const Bytes& m_data;
    const AssetPath& m_path;
    NestedLoader* m_nested;
    relic_core::CancellationToken m_token;
    std::vector<PendingDependency> m_dependencies;
    std::vector<LabeledAsset> m_labeled;
    std::optional<Error> m_error;
};

// =============================================================================
// LoadResult<T>
// =============================================================================

/// Result of loading an asset
template<typename T>
using LoadResult = Result<std::unique_ptr<T>>;

// =============================================================================
// AssetLoader<T>
// =============================================================================

/// Interface for loading specific asset types
template<typename T>
class AssetLoader {
public:
    /// Asset type alias (for type deduction)
    using asset_type = T;

    virtual ~AssetLoader() = default;

    /// Get supported file extensions (lower case, no dot)
    [[nodiscard]] virtual std::vector<std::string> extensions() const = 0;

    /// Load asset from context
    [[nodiscard]] virtual LoadResult<T> load(LoadContext& ctx) = 0;

    /// Get asset type ID
    [[nodiscard]] std::type_index type_id() const {
        return std::type_index(typeid(T));
    }

    /// Get loader name (recorded in metadata)
    [[nodiscard]] virtual std::string type_name() const {
        return typeid(T).name();
    }
};

// =============================================================================
// ErasedLoader
// =============================================================================

/// Type-erased loader interface
class ErasedLoader {
public:
    virtual ~ErasedLoader() = default;

    /// Get supported extensions
    [[nodiscard]] virtual std::vector<std::string> extensions() const = 0;

    /// Get asset type ID
    [[nodiscard]] virtual std::type_index type_id() const = 0;

    /// Get loader name
    [[nodiscard]] virtual std::string type_name() const = 0;

    /// Load the default asset
    [[nodiscard]] virtual Result<ErasedAsset> load_erased(LoadContext& ctx) = 0;
};

/// Wrapper to create ErasedLoader from AssetLoader<T>
template<typename T>
class TypedErasedLoader : public ErasedLoader {
public:
    explicit TypedErasedLoader(std::unique_ptr<AssetLoader<T>> loader)
        : m_loader(std::move(loader)) {}

    [[nodiscard]] std::vector<std::string> extensions() const override {
        return m_loader->extensions();
    }

    [[nodiscard]] std::type_index type_id() const override {
        return m_loader->type_id();
    }

    [[nodiscard]] std::string type_name() const override {
        return m_loader->type_name();
    }

    [[nodiscard]] Result<ErasedAsset> load_erased(LoadContext& ctx) override {
        auto result = m_loader->load(ctx);
        if (!result) {
            return relic_core::Err<ErasedAsset>(result.error());
        }
        if (!result.value()) {
            return relic_core::Err<ErasedAsset>(
                AssetError::deserialize(ctx.path().to_string(), "loader produced no value"));
        }
        return relic_core::Ok(ErasedAsset::from(std::move(result).value()));
    }

private:
    std::unique_ptr<AssetLoader<T>> m_loader;
};

// =============================================================================
// LoaderRegistry
// =============================================================================

/// Registry for all asset loaders.
///
/// Loaders are never unregistered, so returned pointers stay valid for the
/// registry's lifetime. The most recently registered loader wins.
class LoaderRegistry {
public:
    /// Default constructor
    LoaderRegistry() = default;

    /// Register typed loader (base type)
    template<typename T>
    void register_loader(std::unique_ptr<AssetLoader<T>> loader) {
        register_erased(std::make_unique<TypedErasedLoader<T>>(std::move(loader)));
    }

    /// Register derived loader type (automatically extracts asset type from loader)
    /// Requires Derived to inherit from AssetLoader<T> and have asset_type typedef
    template<typename Derived,
             typename T = typename Derived::asset_type,
             typename = std::enable_if_t<std::is_base_of_v<AssetLoader<T>, Derived>>>
    void register_loader(std::unique_ptr<Derived> loader) {
        // Convert derived to base and delegate
        register_loader<T>(std::unique_ptr<AssetLoader<T>>(std::move(loader)));
    }

    /// Register erased loader
    void register_erased(std::unique_ptr<ErasedLoader> loader);

    /// Loader for an extension, preferring one producing `type`.
    /// A void type takes the newest loader for the extension.
    [[nodiscard]] ErasedLoader* find(const std::string& ext, std::type_index type) const;

    /// Newest loader for an extension
    [[nodiscard]] ErasedLoader* find_first(const std::string& ext) const;

    /// Find loaders for extension (newest first)
    [[nodiscard]] std::vector<ErasedLoader*> find_by_extension(const std::string& ext) const;

    /// Find loaders for type (newest first)
    [[nodiscard]] std::vector<ErasedLoader*> find_by_type(std::type_index type) const;

    /// Check if extension is supported
    [[nodiscard]] bool supports_extension(const std::string& ext) const;

    /// Get all supported extensions
    [[nodiscard]] std::vector<std::string> supported_extensions() const;

    /// Get loader count
    [[nodiscard]] std::size_t len() const;

private:
    std::vector<std::unique_ptr<ErasedLoader>> m_loaders;
    std::map<std::string, std::vector<ErasedLoader*>> m_by_extension;
    std::map<std::type_index, std::vector<ErasedLoader*>> m_by_type;
    mutable std::shared_mutex m_mutex;
};

// =============================================================================
// AssetSerializer<T>
// =============================================================================

/// Interface for writing values of a type back to bytes
template<typename T>
class AssetSerializer {
public:
    using asset_type = T;

    virtual ~AssetSerializer() = default;

    /// Stable tag identifying the format across runs
    [[nodiscard]] virtual std::string type_tag() const = 0;

    /// Extension of written artifacts (no dot)
    [[nodiscard]] virtual std::string extension() const = 0;

    /// Serialize a value
    [[nodiscard]] virtual Result<Bytes> serialize(const T& value) const = 0;
};

/// Type-erased serializer interface
class ErasedSerializer {
public:
    virtual ~ErasedSerializer() = default;

    [[nodiscard]] virtual std::type_index type_id() const = 0;
    [[nodiscard]] virtual std::string type_tag() const = 0;
    [[nodiscard]] virtual std::string extension() const = 0;

    /// Serialize a value known to be of type_id()
    [[nodiscard]] virtual Result<Bytes> serialize_erased(const void* value) const = 0;
};

template<typename T>
class TypedErasedSerializer : public ErasedSerializer {
public:
    explicit TypedErasedSerializer(std::unique_ptr<AssetSerializer<T>> serializer)
        : m_serializer(std::move(serializer)) {}

    [[nodiscard]] std::type_index type_id() const override {
        return std::type_index(typeid(T));
    }

    [[nodiscard]] std::string type_tag() const override {
        return m_serializer->type_tag();
    }

    [[nodiscard]] std::string extension() const override {
        return m_serializer->extension();
    }

    [[nodiscard]] Result<Bytes> serialize_erased(const void* value) const override {
        return m_serializer->serialize(*static_cast<const T*>(value));
    }

private:
    std::unique_ptr<AssetSerializer<T>> m_serializer;
};

// =============================================================================
// SerializerRegistry
// =============================================================================

/// Registry of serializers keyed by value type and stable tag
class SerializerRegistry {
public:
    template<typename T>
    void register_serializer(std::unique_ptr<AssetSerializer<T>> serializer) {
        register_erased(std::make_unique<TypedErasedSerializer<T>>(std::move(serializer)));
    }

    template<typename Derived,
             typename T = typename Derived::asset_type,
             typename = std::enable_if_t<std::is_base_of_v<AssetSerializer<T>, Derived>>>
    void register_serializer(std::unique_ptr<Derived> serializer) {
        register_serializer<T>(std::unique_ptr<AssetSerializer<T>>(std::move(serializer)));
    }

    /// Register erased serializer (replaces one for the same type)
    void register_erased(std::unique_ptr<ErasedSerializer> serializer);

    /// Serializer for a value type
    [[nodiscard]] ErasedSerializer* find(std::type_index type) const;

    /// Serializer by stable tag
    [[nodiscard]] ErasedSerializer* find_by_tag(const std::string& tag) const;

    [[nodiscard]] std::size_t len() const;

private:
    std::vector<std::unique_ptr<ErasedSerializer>> m_serializers;
    std::map<std::type_index, ErasedSerializer*> m_by_type;
    std::map<std::string, ErasedSerializer*> m_by_tag;
    mutable std::shared_mutex m_mutex;
};

// =============================================================================
// Deriver<T>
// =============================================================================

/// Transforms a parsed value into its derived form before consumers see it
template<typename T>
class Deriver {
public:
    using asset_type = T;

    virtual ~Deriver() = default;

    /// Name recorded in metadata
    [[nodiscard]] virtual std::string name() const = 0;

    /// Derive a value from the parsed source value
    [[nodiscard]] virtual Result<std::unique_ptr<T>> derive(
        std::unique_ptr<T> source, const AssetPath& path) = 0;
};

/// Type-erased deriver interface
class ErasedDeriver {
public:
    virtual ~ErasedDeriver() = default;

    [[nodiscard]] virtual std::type_index type_id() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual Result<ErasedAsset> derive_erased(ErasedAsset source, const AssetPath& path) = 0;
};

template<typename T>
class TypedErasedDeriver : public ErasedDeriver {
public:
    explicit TypedErasedDeriver(std::unique_ptr<Deriver<T>> deriver)
        : m_deriver(std::move(deriver)) {}

    [[nodiscard]] std::type_index type_id() const override {
        return std::type_index(typeid(T));
    }

    [[nodiscard]] std::string name() const override {
        return m_deriver->name();
    }

    [[nodiscard]] Result<ErasedAsset> derive_erased(ErasedAsset source, const AssetPath& path) override {
        auto typed = source.take<T>();
        if (!typed) {
            return relic_core::Err<ErasedAsset>(AssetError::type_mismatch(
                path.to_string(), typeid(T).name(), source.type.name()));
        }
        auto derived = m_deriver->derive(std::move(typed), path);
        if (!derived) {
            return relic_core::Err<ErasedAsset>(derived.error());
        }
        return relic_core::Ok(ErasedAsset::from(std::move(derived).value()));
    }

private:
    std::unique_ptr<Deriver<T>> m_deriver;
};

// =============================================================================
// DeriverRegistry
// =============================================================================

/// Registry of derivers keyed by value type
class DeriverRegistry {
public:
    template<typename T>
    void register_deriver(std::unique_ptr<Deriver<T>> deriver) {
        register_erased(std::make_unique<TypedErasedDeriver<T>>(std::move(deriver)));
    }

    template<typename Derived,
             typename T = typename Derived::asset_type,
             typename = std::enable_if_t<std::is_base_of_v<Deriver<T>, Derived>>>
    void register_deriver(std::unique_ptr<Derived> deriver) {
        register_deriver<T>(std::unique_ptr<Deriver<T>>(std::move(deriver)));
    }

    /// Register erased deriver (replaces one for the same type)
    void register_erased(std::unique_ptr<ErasedDeriver> deriver);

    /// Deriver for a value type
    [[nodiscard]] ErasedDeriver* find(std::type_index type) const;

    /// Apply the deriver for the value's type; values without one pass through
    [[nodiscard]] Result<ErasedAsset> apply(ErasedAsset value, const AssetPath& path) const;

    [[nodiscard]] std::size_t len() const;

private:
    std::map<std::type_index, std::unique_ptr<ErasedDeriver>> m_derivers;
    mutable std::shared_mutex m_mutex;
};

// =============================================================================
// Built-in Loaders
// =============================================================================

/// Raw bytes asset
struct BytesAsset {
    Bytes data;
};

/// Bytes loader
class BytesLoader : public AssetLoader<BytesAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {"bin", "dat", "bytes"};
    }

    [[nodiscard]] LoadResult<BytesAsset> load(LoadContext& ctx) override {
        auto asset = std::make_unique<BytesAsset>();
        asset->data = ctx.data();
        return relic_core::Ok(std::move(asset));
    }

    [[nodiscard]] std::string type_name() const override {
        return "BytesAsset";
    }
};

/// Text asset
struct TextAsset {
    std::string text;
};

/// Text loader
class TextLoader : public AssetLoader<TextAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {"txt", "text", "md"};
    }

    [[nodiscard]] LoadResult<TextAsset> load(LoadContext& ctx) override {
        auto asset = std::make_unique<TextAsset>();
        asset->text = ctx.data_as_string();
        return relic_core::Ok(std::move(asset));
    }

    [[nodiscard]] std::string type_name() const override {
        return "TextAsset";
    }
};

/// Bytes serializer
class BytesSerializer : public AssetSerializer<BytesAsset> {
public:
    [[nodiscard]] std::string type_tag() const override { return "relic.bytes"; }
    [[nodiscard]] std::string extension() const override { return "bin"; }

    [[nodiscard]] Result<Bytes> serialize(const BytesAsset& value) const override {
        return relic_core::Ok(value.data);
    }
};

/// Text serializer
class TextSerializer : public AssetSerializer<TextAsset> {
public:
    [[nodiscard]] std::string type_tag() const override { return "relic.text"; }
    [[nodiscard]] std::string extension() const override { return "txt"; }

    [[nodiscard]] Result<Bytes> serialize(const TextAsset& value) const override {
        return relic_core::Ok(to_bytes(value.text));
    }
};

// =============================================================================
// Loader Utilities (Implemented in loader.cpp)
// =============================================================================

/// Normalize extension (lowercase, no leading dot)
std::string normalize_extension(const std::string& ext);

/// Get all extensions for a type
std::vector<std::string> get_extensions_for_type(const LoaderRegistry& registry, std::type_index type);

// =============================================================================
// Loader Statistics (Implemented in loader.cpp)
// =============================================================================

/// Record a loader operation
void record_loader_operation(bool success, std::size_t bytes = 0);

/// Format loader statistics
std::string format_loader_statistics();

/// Reset loader statistics
void reset_loader_statistics();

} // namespace relic_asset
