#pragma once

/// @file server.hpp
/// @brief Asset server for relic_asset
///
/// The server resolves load requests into dependency-complete values held in
/// typed Assets<T> stores. Loads run on a TaskPool; every state change that
/// consumers can observe is committed on the thread calling process().

#include "fwd.hpp"
#include "types.hpp"
#include "handle.hpp"
#include "assets.hpp"
#include "io.hpp"
#include "loader.hpp"
#include "meta.hpp"
#include "dependency_graph.hpp"
#include "config.hpp"
#include <relic/core/error.hpp>
#include <relic/core/task_pool.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace relic_asset {

// =============================================================================
// AssetServer
// =============================================================================

/// Main asset management system
class AssetServer final : public NestedLoader {
public:
    /// Constructor with config. The default source reads from config.asset_dir.
    explicit AssetServer(AssetServerConfig config = {});

    /// Constructor with an explicit default source
    AssetServer(AssetServerConfig config, std::shared_ptr<AssetIo> default_source);

    /// Destructor - cancels in-flight loads and joins the pool
    ~AssetServer() override;

    AssetServer(const AssetServer&) = delete;
    AssetServer& operator=(const AssetServer&) = delete;

    // -------------------------------------------------------------------------
    // Registration
    // -------------------------------------------------------------------------

    /// Register typed loader (base type)
    template<typename T>
    void register_loader(std::unique_ptr<AssetLoader<T>> loader) {
        register_asset_type<T>();
        m_loaders.register_loader<T>(std::move(loader));
    }

    /// Register derived loader type (automatically extracts asset type from loader)
    template<typename Derived,
             typename T = typename Derived::asset_type,
             typename = std::enable_if_t<std::is_base_of_v<AssetLoader<T>, Derived>>>
    void register_loader(std::unique_ptr<Derived> loader) {
        register_loader<T>(std::unique_ptr<AssetLoader<T>>(std::move(loader)));
    }

    template<typename T>
    void register_serializer(std::unique_ptr<AssetSerializer<T>> serializer) {
        m_serializers.register_serializer<T>(std::move(serializer));
    }

    template<typename Derived,
             typename T = typename Derived::asset_type,
             typename = std::enable_if_t<std::is_base_of_v<AssetSerializer<T>, Derived>>>
    void register_serializer(std::unique_ptr<Derived> serializer) {
        register_serializer<T>(std::unique_ptr<AssetSerializer<T>>(std::move(serializer)));
    }

    template<typename T>
    void register_deriver(std::unique_ptr<Deriver<T>> deriver) {
        m_derivers.register_deriver<T>(std::move(deriver));
    }

    template<typename Derived,
             typename T = typename Derived::asset_type,
             typename = std::enable_if_t<std::is_base_of_v<Deriver<T>, Derived>>>
    void register_deriver(std::unique_ptr<Derived> deriver) {
        register_deriver<T>(std::unique_ptr<Deriver<T>>(std::move(deriver)));
    }

    /// Create the store for T ahead of the first load
    template<typename T>
    Assets<T>& register_asset_type() {
        return assets<T>();
    }

    /// Add a named byte source ("name://path")
    void add_source(const std::string& name, std::shared_ptr<AssetIo> io);

    /// Byte source by id (nullptr if unknown)
    [[nodiscard]] std::shared_ptr<AssetIo> source(const SourceId& id) const;

    /// Byte source receiving derived artifacts written by import()
    void set_import_io(std::shared_ptr<AssetIo> io);

    // -------------------------------------------------------------------------
    // Loading
    // -------------------------------------------------------------------------

    /// Request a typed load. Never blocks; repeated requests share one load.
    template<typename T>
    [[nodiscard]] Handle<T> load(const AssetPath& path, const LoadOptions& options = {}) {
        register_asset_type<T>();
        return request(path, std::type_index(typeid(T)), options).template typed<T>();
    }

    /// Alias of load<T>()
    template<typename T>
    [[nodiscard]] Handle<T> request_load(const AssetPath& path, const LoadOptions& options = {}) {
        return load<T>(path, options);
    }

    /// Request a load whose type is resolved from the loader for the extension
    [[nodiscard]] UntypedHandle load_untyped(const AssetPath& path, const LoadOptions& options = {});

    /// Load every file with a registered loader below a directory
    [[nodiscard]] Result<std::vector<UntypedHandle>> load_folder(const AssetPath& dir);

    /// Schedule a reload of a source. Unchanged bytes make it a no-op.
    Result<void> reload(const AssetPath& path);

    /// Cancel a load in flight and remove every value of the source
    Result<void> unload(const AssetPath& path);

    /// Synchronization point: commits finished loads, reloads and drops
    void process();

    /// Call process() until every id is terminal or the timeout passes
    bool wait_for(const std::vector<AssetId>& ids,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /// Load state of an id (Unloaded for unknown ids)
    [[nodiscard]] LoadState get_load_state(const AssetId& id) const;

    /// Detailed status of an id
    [[nodiscard]] LoadStatus get_load_status(const AssetId& id) const;

    /// Combined state of several ids (Failed dominates, then Unloaded, then progress)
    [[nodiscard]] LoadState get_group_load_state(const std::vector<AssetId>& ids) const;

    /// Path an id was loaded from
    [[nodiscard]] std::optional<AssetPath> get_path(const AssetId& id) const;

    /// Strong handle to a known path (null handle if unknown or of another type)
    template<typename T>
    [[nodiscard]] Handle<T> get_handle(const AssetPath& path) const {
        auto data = find_handle_data(path);
        if (!data || data->id.type != std::type_index(typeid(T))) {
            return Handle<T>{};
        }
        return Handle<T>(std::move(data));
    }

    /// Value behind a handle (nullptr until Loaded)
    template<typename T>
    [[nodiscard]] const T* get(const Handle<T>& handle) {
        return assets<T>().get(handle);
    }

    /// Typed store, created on first use
    template<typename T>
    [[nodiscard]] Assets<T>& assets() {
        auto* store = ensure_store(std::type_index(typeid(T)), [this]() -> std::unique_ptr<ErasedAssets> {
            return std::make_unique<Assets<T>>(m_drops, m_events);
        });
        return *static_cast<Assets<T>*>(store);
    }

    /// Take pending lifecycle events
    [[nodiscard]] std::vector<AssetEvent> drain_events();

    // -------------------------------------------------------------------------
    // Persistence
    // -------------------------------------------------------------------------

    /// Serialize a value and write it through the path's source
    template<typename T>
    Result<void> save(const AssetPath& path, const T& value) {
        return save_erased(path, std::type_index(typeid(T)), &value);
    }

    /// Import a source: parse, derive and write artifacts without inserting values
    [[nodiscard]] Result<AssetSourceMeta> import(const AssetPath& path);

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// Cancel in-flight loads and stop accepting requests
    void shutdown();

    [[nodiscard]] bool is_shutdown() const noexcept { return m_shutdown; }

    /// Number of sources being loaded or reloaded
    [[nodiscard]] std::size_t in_flight_count() const;

    /// Number of ids known to the server
    [[nodiscard]] std::size_t record_count() const;

    [[nodiscard]] LoaderRegistry& loaders() { return m_loaders; }
    [[nodiscard]] SerializerRegistry& serializers() { return m_serializers; }
    [[nodiscard]] DeriverRegistry& derivers() { return m_derivers; }
    [[nodiscard]] const DependencyGraph& graph() const { return m_graph; }
    [[nodiscard]] MetadataStore& metadata() { return *m_meta; }
    [[nodiscard]] const AssetServerConfig& config() const { return m_config; }

    // -------------------------------------------------------------------------
    // NestedLoader
    // -------------------------------------------------------------------------

    [[nodiscard]] UntypedHandle request_nested(const AssetPath& path, std::type_index type) override;
    [[nodiscard]] Result<Bytes> read_nested(const AssetPath& path) override;

private:
    using BatchSet = std::shared_ptr<std::set<AssetPath>>;

    /// Server-side bookkeeping of one id
    struct Record {
        AssetPath path;
        std::shared_ptr<HandleData> data;
        std::vector<PendingDependency> dependencies;  // Retained while the record lives
        std::vector<UntypedHandle> labeled;           // Sub-assets owned by a default asset
        ErasedAsset pending;                          // Value awaiting its dependencies
        LoadOptions options;
        std::string error;
    };

    /// One source being read and parsed
    struct SourceLoad {
        std::uint64_t serial = 0;
        relic_core::CancellationToken token;
        std::set<AssetId> requested;
        std::set<AssetId> committed;
        LoadOptions options;
        bool reload = false;
        bool forced = false;
        bool rerun = false;          // Reload requested while this load was running
        bool rerun_forced = false;
        bool parsed = false;
        bool unchanged = false;
        bool failed = false;
        BatchSet batch;

        // Filled at commit for the metadata record
        std::uint64_t fingerprint = 0;
        std::string loader;
    };

    /// Worker output for one source
    struct ParsedSource {
        AssetPath source;
        std::uint64_t serial = 0;
        bool unchanged = false;
        std::optional<Error> error;
        std::uint64_t fingerprint = 0;
        std::string loader;
        ErasedAsset value;
        std::vector<PendingDependency> dependencies;
        std::vector<LabeledAsset> labeled;
    };

    /// Everything a worker needs, captured at schedule time
    struct SourceTask {
        AssetPath source;
        std::uint64_t serial = 0;
        relic_core::CancellationToken token;
        std::type_index type{typeid(void)};
        std::shared_ptr<AssetIo> io;
        std::optional<std::uint64_t> previous_fingerprint;
        bool check_metadata = false;  // Read the stored fingerprint before comparing
        bool forced = false;
    };

    void initialize();

    [[nodiscard]] UntypedHandle request(const AssetPath& path, std::type_index type,
                                        const LoadOptions& options);
    [[nodiscard]] UntypedHandle request_locked(const AssetPath& path, std::type_index type,
                                               const LoadOptions& options);
    [[nodiscard]] UntypedHandle failed_handle(const AssetPath& path, std::type_index type,
                                              const Error& error);
    Record& create_record_locked(const AssetId& id, const AssetPath& path, const LoadOptions& options);
    SourceLoad& start_load_locked(const AssetPath& source, std::type_index type, const LoadOptions& options,
                                  bool reload, bool forced, BatchSet batch);
    Result<void> schedule_reload_locked(const AssetPath& source, bool forced, BatchSet batch);

    void run_source_load(SourceTask task);
    void mark_loading(const AssetPath& source, std::uint64_t serial);
    [[nodiscard]] Result<ErasedAsset> invoke_loader(ErasedLoader& loader, LoadContext& ctx,
                                                    const AssetPath& source);
    void push_parsed(ParsedSource parsed);

    void poll_sources();
    void commit_parsed_locked();
    void commit_source_locked(ParsedSource& parsed, SourceLoad& load);
    void fail_source_locked(const AssetPath& source, SourceLoad& load, const Error& error);
    [[nodiscard]] Record* bind_produced_locked(const AssetPath& path, const ErasedAsset& value,
                                               SourceLoad& load);
    void attach_dependencies_locked(const AssetId& id, Record& record,
                                    std::vector<PendingDependency> deps);
    void resolve_waiting_locked();
    void commit_value_locked(const AssetId& id, Record& record, bool degraded);
    void fail_record_locked(const AssetId& id, Record& record, const Error& error);
    void finalize_sources_locked(std::vector<AssetSourceMeta>& meta_writes);
    [[nodiscard]] std::optional<AssetSourceMeta> build_metadata_locked(const AssetPath& source,
                                                                       const SourceLoad& load) const;
    void write_metadata(std::vector<AssetSourceMeta> records);
    void process_drops_locked();
    void erase_record_locked(const AssetId& id, std::vector<UntypedHandle>& released);

    [[nodiscard]] const Record* find_record_locked(const AssetId& id) const;
    [[nodiscard]] std::shared_ptr<HandleData> find_handle_data(const AssetPath& path) const;
    [[nodiscard]] std::shared_ptr<AssetIo> source_locked(const SourceId& id) const;
    [[nodiscard]] DependencyPolicy policy_of(const Record& record) const;
    [[nodiscard]] std::string type_label(std::type_index type) const;

    [[nodiscard]] ErasedAssets* ensure_store(std::type_index type,
                                             const std::function<std::unique_ptr<ErasedAssets>()>& factory);
    [[nodiscard]] ErasedAssets* find_store(std::type_index type) const;

    Result<void> save_erased(const AssetPath& path, std::type_index type, const void* value);

    AssetServerConfig m_config;

    LoaderRegistry m_loaders;
    SerializerRegistry m_serializers;
    DeriverRegistry m_derivers;
    DependencyGraph m_graph;

    std::shared_ptr<DropQueue> m_drops;
    std::shared_ptr<AssetEventQueue> m_events;

    std::unordered_map<std::type_index, std::unique_ptr<ErasedAssets>> m_stores;
    mutable std::shared_mutex m_stores_mutex;

    std::map<std::string, std::shared_ptr<AssetIo>> m_sources;
    std::shared_ptr<AssetIo> m_import_io;
    std::unique_ptr<MetadataStore> m_meta;

    // Guarded by m_mutex
    std::unordered_map<AssetId, Record> m_records;
    std::unordered_map<AssetPath, AssetId> m_path_ids;
    std::map<AssetPath, std::set<AssetId>> m_by_source;
    std::map<AssetPath, SourceLoad> m_in_flight;
    std::map<AssetPath, std::uint64_t> m_fingerprints;
    std::set<AssetId> m_waiting;
    std::uint64_t m_next_serial = 1;
    mutable std::mutex m_mutex;

    std::vector<ParsedSource> m_completed;
    std::mutex m_completed_mutex;

    // Serializes metadata writes between process() calls; taken before m_mutex
    std::mutex m_meta_write_mutex;

    std::atomic<bool> m_shutdown{false};

    // Destroyed first: queued tasks still reach the members above
    std::unique_ptr<relic_core::TaskPool> m_pool;
};

/// Process a server until all handles are terminal (test and tool helper)
template<typename... Handles>
bool wait_for_loads(AssetServer& server, const Handles&... handles) {
    return server.wait_for({handles.id()...});
}

// =============================================================================
// Server Utilities (Implemented in server.cpp)
// =============================================================================

namespace debug {

/// Format server state for debugging
std::string format_server_state(const AssetServer& server);

} // namespace debug

} // namespace relic_asset
