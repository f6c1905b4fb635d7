/// @file server.cpp
/// @brief relic_asset server implementation

#include <relic/asset/server.hpp>
#include <relic/core/id.hpp>
#include <relic/core/log.hpp>

#include <algorithm>
#include <exception>
#include <sstream>
#include <thread>

namespace relic_asset {

namespace {

constexpr const char* IMPORT_DIR = ".imported";

/// Keep asset errors as they are, wrap anything else under `fallback`
Error as_asset_error(const Error& error, AssetError::Kind fallback, const AssetPath& path) {
    if (error.asset_kind()) {
        return error;
    }
    return Error(AssetError{fallback, error.message(), path.to_string()});
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_bookkeeping_file(const std::string& path) {
    return ends_with(path, ".meta") || ends_with(path, ".tmp");
}

bool is_hidden(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return !name.empty() && name[0] == '.';
}

void collect_files(const AssetIo& io, const std::string& dir, std::vector<std::string>& out) {
    auto entries = io.read_directory(dir);
    if (!entries) {
        relic_core::io_logger()->warn("Cannot list '{}': {}", dir, entries.error().message());
        return;
    }
    for (const auto& entry : entries.value()) {
        if (is_hidden(entry)) {
            continue;
        }
        if (io.is_directory(entry)) {
            collect_files(io, entry, out);
        } else if (!is_bookkeeping_file(entry)) {
            out.push_back(entry);
        }
    }
}

std::string artifact_path(const AssetPath& path, const ErasedSerializer& serializer) {
    std::uint64_t key = relic_core::detail::hash_combine(
        relic_core::detail::fnv1a_hash(path.to_string()), serializer.type_tag());
    return std::string(IMPORT_DIR) + "/" + relic_core::to_hex(key) + "." + serializer.extension();
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

AssetServer::AssetServer(AssetServerConfig config)
    : AssetServer(config, std::make_shared<FileAssetIo>(config.asset_dir)) {}

AssetServer::AssetServer(AssetServerConfig config, std::shared_ptr<AssetIo> default_source)
    : m_config(std::move(config))
    , m_drops(std::make_shared<DropQueue>())
    , m_events(std::make_shared<AssetEventQueue>())
{
    if (!default_source) {
        default_source = std::make_shared<FileAssetIo>(m_config.asset_dir);
    }
    m_sources[std::string()] = default_source;
    m_import_io = default_source;
    m_meta = std::make_unique<MetadataStore>(default_source);
    m_pool = std::make_unique<relic_core::TaskPool>(m_config.worker_threads);
    initialize();
}

AssetServer::~AssetServer() {
    shutdown();
}

void AssetServer::initialize() {
    if (m_config.log_level) {
        if (auto level = relic_core::parse_log_level(*m_config.log_level)) {
            relic_core::asset_logger()->set_level(*level);
            relic_core::io_logger()->set_level(*level);
            relic_core::meta_logger()->set_level(*level);
        } else {
            relic_core::asset_logger()->warn("Unknown log level '{}'", *m_config.log_level);
        }
    }

    // Built-in loaders and serializers
    register_loader<BytesAsset>(std::make_unique<BytesLoader>());
    register_loader<TextAsset>(std::make_unique<TextLoader>());
    register_serializer<BytesAsset>(std::make_unique<BytesSerializer>());
    register_serializer<TextAsset>(std::make_unique<TextSerializer>());

    if (m_config.hot_reload) {
        m_sources[std::string()]->watch_for_changes();
    }

    relic_core::asset_logger()->debug("AssetServer started ({} worker threads, {} policy, hot reload {})",
        m_config.worker_threads, dependency_policy_name(m_config.dependency_policy),
        m_config.hot_reload ? "on" : "off");
}

void AssetServer::shutdown() {
    if (m_shutdown.exchange(true)) {
        return;
    }

    {
        std::lock_guard lock(m_mutex);
        for (auto& [source, load] : m_in_flight) {
            load.token.cancel();
        }
    }

    // Cancelled tasks return at their next stage boundary
    m_pool->wait_all();

    std::vector<ParsedSource> discarded;
    {
        std::lock_guard lock(m_completed_mutex);
        discarded.swap(m_completed);
    }
    std::size_t cancelled = 0;
    {
        std::lock_guard lock(m_mutex);

        // No further progress is possible: settle every unfinished record
        for (auto& [id, record] : m_records) {
            if (is_terminal(record.data->get_state())) {
                continue;
            }
            fail_record_locked(id, record, AssetError::cancelled(record.path.to_string()));
            ++cancelled;
        }
        m_in_flight.clear();
        m_waiting.clear();
    }

    relic_core::asset_logger()->debug("AssetServer shut down ({} records, {} cancelled)",
        record_count(), cancelled);
}

// =============================================================================
// Sources
// =============================================================================

void AssetServer::add_source(const std::string& name, std::shared_ptr<AssetIo> io) {
    if (m_config.hot_reload && io) {
        io->watch_for_changes();
    }
    std::lock_guard lock(m_mutex);
    m_sources[name] = std::move(io);
    relic_core::asset_logger()->debug("Added source '{}'", name);
}

std::shared_ptr<AssetIo> AssetServer::source(const SourceId& id) const {
    std::lock_guard lock(m_mutex);
    return source_locked(id);
}

std::shared_ptr<AssetIo> AssetServer::source_locked(const SourceId& id) const {
    auto it = m_sources.find(id.name);
    return it != m_sources.end() ? it->second : nullptr;
}

void AssetServer::set_import_io(std::shared_ptr<AssetIo> io) {
    std::lock_guard lock(m_mutex);
    m_import_io = std::move(io);
}

// =============================================================================
// Stores
// =============================================================================

ErasedAssets* AssetServer::ensure_store(std::type_index type,
                                        const std::function<std::unique_ptr<ErasedAssets>()>& factory) {
    {
        std::shared_lock lock(m_stores_mutex);
        auto it = m_stores.find(type);
        if (it != m_stores.end()) {
            return it->second.get();
        }
    }

    std::unique_lock lock(m_stores_mutex);
    auto it = m_stores.find(type);
    if (it != m_stores.end()) {
        return it->second.get();
    }
    if (!factory) {
        return nullptr;
    }
    auto store = factory();
    auto* raw = store.get();
    m_stores.emplace(type, std::move(store));
    return raw;
}

ErasedAssets* AssetServer::find_store(std::type_index type) const {
    std::shared_lock lock(m_stores_mutex);
    auto it = m_stores.find(type);
    return it != m_stores.end() ? it->second.get() : nullptr;
}

// =============================================================================
// Requests
// =============================================================================

UntypedHandle AssetServer::request(const AssetPath& path, std::type_index type,
                                   const LoadOptions& options) {
    std::lock_guard lock(m_mutex);
    return request_locked(path, type, options);
}

UntypedHandle AssetServer::load_untyped(const AssetPath& path, const LoadOptions& options) {
    // Labeled paths resolve through the source extension as well
    std::type_index type(typeid(void));
    if (auto* loader = m_loaders.find_first(path.extension())) {
        type = loader->type_id();
    }

    std::lock_guard lock(m_mutex);
    auto existing = m_path_ids.find(path);
    if (existing != m_path_ids.end()) {
        return UntypedHandle(m_records.at(existing->second).data);
    }
    return request_locked(path, type, options);
}

UntypedHandle AssetServer::request_nested(const AssetPath& path, std::type_index type) {
    if (type == std::type_index(typeid(void))) {
        return load_untyped(path);
    }
    return request(path, type, LoadOptions{});
}

Result<Bytes> AssetServer::read_nested(const AssetPath& path) {
    auto io = source(path.source());
    if (!io) {
        return relic_core::Err<Bytes>(AssetError::io(path.to_string(), "unknown source"));
    }
    return io->read(path.path());
}

UntypedHandle AssetServer::failed_handle(const AssetPath& path, std::type_index type, const Error& error) {
    // Not registered with the drop queue: no record backs it
    auto data = HandleData::create(AssetId::from_path(path, type), path, nullptr);
    data->set_failed(error.asset_kind().value_or(AssetError::Kind::DeserializeError));
    relic_core::asset_logger()->warn("Request for '{}' failed: {}", path.to_string(), error.message());
    return UntypedHandle(std::move(data));
}

UntypedHandle AssetServer::request_locked(const AssetPath& path, std::type_index type,
                                          const LoadOptions& options) {
    if (m_shutdown) {
        return failed_handle(path, type, AssetError::cancelled(path.to_string()));
    }
    if (path.empty()) {
        return failed_handle(path, type, AssetError::not_found("<empty path>"));
    }

    auto existing = m_path_ids.find(path);
    if (existing != m_path_ids.end()) {
        const Record& record = m_records.at(existing->second);
        std::type_index found = record.data->id.type;
        if (type != std::type_index(typeid(void)) && found != type) {
            return failed_handle(path, type,
                AssetError::type_mismatch(path.to_string(), type.name(), found.name()));
        }
        return UntypedHandle(record.data);
    }

    AssetPath source = path.source_path();
    auto in_flight = m_in_flight.find(source);

    if (path.has_label()) {
        // A committed source that did not produce this label never will
        bool committed = in_flight != m_in_flight.end() && in_flight->second.parsed;
        if (in_flight == m_in_flight.end()) {
            auto def = m_path_ids.find(source);
            committed = def != m_path_ids.end() && m_records.at(def->second).data->is_loaded();
        }
        if (committed) {
            return failed_handle(path, type, AssetError::deserialize(
                source.to_string(), "label '" + *path.label() + "' was not produced"));
        }
    } else if (in_flight != m_in_flight.end() && in_flight->second.parsed) {
        return failed_handle(path, type, AssetError::deserialize(
            source.to_string(), "source committed without an asset of this type"));
    }

    AssetId id = AssetId::from_path(path, type);
    Record& record = create_record_locked(id, path, options);
    UntypedHandle handle(record.data);

    if (in_flight != m_in_flight.end()) {
        in_flight->second.requested.insert(id);
        record.data->set_state(LoadState::Loading);
    } else {
        std::type_index preferred = path.has_label() ? std::type_index(typeid(void)) : type;
        SourceLoad& load = start_load_locked(source, preferred, options, false, false, nullptr);
        load.requested.insert(id);
    }

    relic_core::asset_logger()->debug("Requested '{}' ({})", path.to_string(),
        relic_core::to_hex(id.raw()));
    return handle;
}

AssetServer::Record& AssetServer::create_record_locked(const AssetId& id, const AssetPath& path,
                                                       const LoadOptions& options) {
    Record record;
    record.path = path;
    record.data = HandleData::create(id, path, m_drops);
    record.options = options;

    auto [it, inserted] = m_records.insert_or_assign(id, std::move(record));
    m_path_ids[path] = id;
    m_by_source[path.source_path()].insert(id);
    return it->second;
}

AssetServer::SourceLoad& AssetServer::start_load_locked(const AssetPath& source, std::type_index type,
                                                        const LoadOptions& options, bool reload,
                                                        bool forced, BatchSet batch) {
    SourceLoad load;
    load.serial = m_next_serial++;
    load.options = options;
    load.reload = reload;
    load.forced = forced;
    load.batch = std::move(batch);

    SourceTask task;
    task.source = source;
    task.serial = load.serial;
    task.token = load.token;
    task.type = type;
    task.io = source_locked(source.source());
    task.forced = forced;

    if (reload && !forced) {
        auto fp = m_fingerprints.find(source);
        if (fp != m_fingerprints.end()) {
            task.previous_fingerprint = fp->second;
        } else {
            // Looked up by the worker; metadata reads go through the byte source
            task.check_metadata = m_config.metadata;
        }
    }

    auto [it, inserted] = m_in_flight.insert_or_assign(source, std::move(load));

    m_pool->submit([this, task = std::move(task)]() mutable {
        run_source_load(std::move(task));
    });

    relic_core::asset_logger()->debug("{} '{}'", reload ? (forced ? "Forced reload of" : "Reloading")
                                                        : "Loading", source.to_string());
    return it->second;
}

// =============================================================================
// Worker
// =============================================================================

void AssetServer::run_source_load(SourceTask task) {
    ParsedSource out;
    out.source = task.source;
    out.serial = task.serial;

    auto cancelled = [&]() {
        if (!task.token.is_cancelled()) {
            return false;
        }
        out.error = Error(AssetError::cancelled(task.source.to_string()));
        push_parsed(std::move(out));
        return true;
    };

    if (cancelled()) {
        return;
    }
    mark_loading(task.source, task.serial);

    // Reading
    if (!task.io) {
        out.error = Error(AssetError::io(task.source.to_string(),
            "unknown source '" + task.source.source().name + "'"));
        record_loader_operation(false);
        push_parsed(std::move(out));
        return;
    }

    auto bytes = task.io->read(task.source.path());
    if (!bytes) {
        out.error = as_asset_error(bytes.error(), AssetError::Kind::IoError, task.source);
        record_loader_operation(false);
        push_parsed(std::move(out));
        return;
    }

    if (task.check_metadata) {
        auto stored = m_meta->read(task.source);
        if (stored && stored.value()) {
            task.previous_fingerprint = stored.value()->fingerprint;
        }
    }

    out.fingerprint = MetadataStore::fingerprint(bytes.value());
    if (!task.forced && task.previous_fingerprint && *task.previous_fingerprint == out.fingerprint) {
        out.unchanged = true;
        push_parsed(std::move(out));
        return;
    }

    if (cancelled()) {
        return;
    }

    // Parsing
    ErasedLoader* loader = m_loaders.find(task.source.extension(), task.type);
    if (!loader) {
        out.error = Error(AssetError::loader_not_found(task.source.to_string(), task.source.extension()));
        record_loader_operation(false);
        push_parsed(std::move(out));
        return;
    }
    out.loader = loader->type_name();

    LoadContext ctx(bytes.value(), task.source, this, task.token);
    auto value = invoke_loader(*loader, ctx, task.source);
    if (!value || ctx.error()) {
        out.error = value ? *ctx.error() : value.error();
        record_loader_operation(false);
        push_parsed(std::move(out));
        return;
    }

    if (cancelled()) {
        return;
    }

    auto derived = m_derivers.apply(std::move(value).value(), task.source);
    if (!derived) {
        out.error = as_asset_error(derived.error(), AssetError::Kind::DeserializeError, task.source);
        record_loader_operation(false);
        push_parsed(std::move(out));
        return;
    }
    out.value = std::move(derived).value();

    for (auto& labeled : ctx.labeled_assets()) {
        AssetPath labeled_path = task.source.with_label(labeled.label);
        auto derived_label = m_derivers.apply(std::move(labeled.value), labeled_path);
        if (!derived_label) {
            out.error = as_asset_error(derived_label.error(), AssetError::Kind::DeserializeError, labeled_path);
            record_loader_operation(false);
            push_parsed(std::move(out));
            return;
        }
        labeled.value = std::move(derived_label).value();
    }

    out.dependencies = std::move(ctx.dependencies());
    out.labeled = std::move(ctx.labeled_assets());
    record_loader_operation(true, bytes.value().size());
    push_parsed(std::move(out));
}

Result<ErasedAsset> AssetServer::invoke_loader(ErasedLoader& loader, LoadContext& ctx,
                                               const AssetPath& source) {
    try {
        auto result = loader.load_erased(ctx);
        if (!result) {
            return relic_core::Err<ErasedAsset>(
                as_asset_error(result.error(), AssetError::Kind::DeserializeError, source));
        }
        return result;
    } catch (const std::exception& e) {
        return relic_core::Err<ErasedAsset>(AssetError::deserialize(source.to_string(), e.what()));
    }
}

void AssetServer::mark_loading(const AssetPath& source, std::uint64_t serial) {
    std::lock_guard lock(m_mutex);
    auto it = m_in_flight.find(source);
    if (it == m_in_flight.end() || it->second.serial != serial) {
        return;
    }
    for (const auto& id : it->second.requested) {
        auto rec = m_records.find(id);
        if (rec != m_records.end() && rec->second.data->get_state() == LoadState::Requested) {
            rec->second.data->set_state(LoadState::Loading);
        }
    }
}

void AssetServer::push_parsed(ParsedSource parsed) {
    std::lock_guard lock(m_completed_mutex);
    m_completed.push_back(std::move(parsed));
}

// =============================================================================
// Synchronization Point
// =============================================================================

void AssetServer::process() {
    if (m_shutdown) {
        return;
    }

    if (m_config.hot_reload) {
        poll_sources();
    }

    bool inline_mode = m_pool->thread_count() == 0;
    do {
        if (inline_mode) {
            while (m_pool->run_pending() > 0) {}
        }

        // Held across collection and write so records land in commit order
        std::lock_guard meta_lock(m_meta_write_mutex);
        std::vector<AssetSourceMeta> meta_writes;
        {
            std::lock_guard lock(m_mutex);
            commit_parsed_locked();
            resolve_waiting_locked();
            finalize_sources_locked(meta_writes);
            process_drops_locked();
        }
        write_metadata(std::move(meta_writes));
    } while (inline_mode && m_pool->pending_count() > 0);
}

bool AssetServer::wait_for(const std::vector<AssetId>& ids, std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();

    while (true) {
        process();

        bool all_done = std::all_of(ids.begin(), ids.end(), [this](const AssetId& id) {
            return is_terminal(get_load_state(id));
        });
        if (all_done) {
            return true;
        }

        if (std::chrono::steady_clock::now() - start > timeout) {
            relic_core::asset_logger()->warn("Timed out waiting for {} asset(s)", ids.size());
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void AssetServer::poll_sources() {
    std::map<std::string, std::shared_ptr<AssetIo>> sources;
    {
        std::lock_guard lock(m_mutex);
        sources = m_sources;
    }

    std::set<AssetPath> changed;
    for (const auto& [name, io] : sources) {
        if (!io) {
            continue;
        }
        for (const auto& path : io->poll_changes()) {
            if (!is_bookkeeping_file(path) && path.rfind(IMPORT_DIR, 0) != 0) {
                changed.insert(AssetPath(SourceId(name), path));
            }
        }
    }

    for (const auto& path : changed) {
        auto result = reload(path);
        if (result) {
            relic_core::asset_logger()->info("Change detected: '{}'", path.to_string());
        } else {
            relic_core::asset_logger()->trace("Ignoring change of unused '{}'", path.to_string());
        }
    }
}

void AssetServer::commit_parsed_locked() {
    std::vector<ParsedSource> parsed;
    {
        std::lock_guard lock(m_completed_mutex);
        parsed.swap(m_completed);
    }

    for (auto& result : parsed) {
        auto it = m_in_flight.find(result.source);
        if (it == m_in_flight.end() || it->second.serial != result.serial ||
            it->second.token.is_cancelled()) {
            // Superseded or cancelled; dependency handles are released with `result`
            continue;
        }

        SourceLoad& load = it->second;
        load.parsed = true;

        if (result.unchanged) {
            load.unchanged = true;
            relic_core::asset_logger()->debug("Reload of '{}' skipped: content unchanged",
                result.source.to_string());
            continue;
        }

        if (result.error) {
            fail_source_locked(result.source, load, *result.error);
            continue;
        }

        commit_source_locked(result, load);
    }
}

void AssetServer::fail_source_locked(const AssetPath& source, SourceLoad& load, const Error& error) {
    load.failed = true;

    auto ids = m_by_source.find(source);
    if (ids != m_by_source.end()) {
        for (const auto& id : ids->second) {
            auto rec = m_records.find(id);
            if (rec == m_records.end()) {
                continue;
            }
            fail_record_locked(id, rec->second, error);
            load.committed.insert(id);
        }
    }

    relic_core::asset_logger()->warn("Failed to {} '{}': {}",
        load.reload ? "reload" : "load", source.to_string(), error.message());
}

void AssetServer::commit_source_locked(ParsedSource& parsed, SourceLoad& load) {
    load.fingerprint = parsed.fingerprint;
    load.loader = parsed.loader;

    std::vector<UntypedHandle> labeled_handles;
    for (auto& labeled : parsed.labeled) {
        AssetPath path = parsed.source.with_label(labeled.label);
        Record* record = bind_produced_locked(path, labeled.value, load);
        if (!record) {
            continue;
        }
        AssetId id = record->data->id;
        record->pending = std::move(labeled.value);
        attach_dependencies_locked(id, *record, std::move(labeled.dependencies));
        labeled_handles.emplace_back(record->data);
    }

    if (Record* record = bind_produced_locked(parsed.source, parsed.value, load)) {
        AssetId id = record->data->id;
        record->pending = std::move(parsed.value);
        record->labeled = std::move(labeled_handles);
        attach_dependencies_locked(id, *record, std::move(parsed.dependencies));
    }

    // Requested or previously produced assets missing from this parse
    auto ids = m_by_source.find(parsed.source);
    if (ids == m_by_source.end()) {
        return;
    }
    std::vector<AssetId> missing;
    for (const auto& id : ids->second) {
        if (load.committed.count(id) == 0) {
            missing.push_back(id);
        }
    }
    for (const auto& id : missing) {
        auto rec = m_records.find(id);
        if (rec == m_records.end()) {
            continue;
        }
        const AssetPath& path = rec->second.path;
        std::string what = path.has_label() ? "label '" + *path.label() + "' was not produced"
                                            : "default asset was not produced";
        fail_record_locked(id, rec->second, AssetError::deserialize(parsed.source.to_string(), what));
        load.committed.insert(id);
    }
}

AssetServer::Record* AssetServer::bind_produced_locked(const AssetPath& path, const ErasedAsset& value,
                                                       SourceLoad& load) {
    AssetId id = AssetId::from_path(path, value.type);

    auto existing = m_path_ids.find(path);
    if (existing != m_path_ids.end() && existing->second != id) {
        AssetId requested = existing->second;
        Record& other = m_records.at(requested);
        fail_record_locked(requested, other, AssetError::type_mismatch(
            path.to_string(), requested.type.name(), value.type.name()));
        load.committed.insert(requested);
        return nullptr;
    }

    auto it = m_records.find(id);
    Record* record = it != m_records.end() ? &it->second : &create_record_locked(id, path, load.options);

    if (value.make_store) {
        auto make_store = value.make_store;
        (void)ensure_store(value.type, [this, make_store]() {
            return make_store(m_drops, m_events);
        });
    }

    // A reload keeps serving the previous value until the new one commits
    if (record->data->get_state() != LoadState::Loaded) {
        record->data->set_state(LoadState::WaitingOnDependencies);
    }
    m_waiting.insert(id);
    load.committed.insert(id);
    return record;
}

void AssetServer::attach_dependencies_locked(const AssetId& id, Record& record,
                                             std::vector<PendingDependency> deps) {
    m_graph.clear_dependencies(id);

    for (const auto& dep : deps) {
        if (!dep.handle) {
            continue;
        }
        DependencyEdge edge{id, dep.handle.id(), dep.path, dep.required};
        auto added = m_graph.add_edge(edge);
        if (!added) {
            // Keep the previous dependency set; the new one would close a cycle
            m_graph.clear_dependencies(id);
            for (const auto& old : record.dependencies) {
                if (old.handle) {
                    (void)m_graph.add_edge(DependencyEdge{id, old.handle.id(), old.path, old.required});
                }
            }
            fail_record_locked(id, record, added.error());
            return;
        }
    }

    record.dependencies = std::move(deps);
}

void AssetServer::resolve_waiting_locked() {
    bool progress = true;
    while (progress) {
        progress = false;

        for (auto it = m_waiting.begin(); it != m_waiting.end();) {
            AssetId id = *it;
            auto rec = m_records.find(id);
            if (rec == m_records.end()) {
                it = m_waiting.erase(it);
                continue;
            }
            Record& record = rec->second;

            bool blocked = false;
            const PendingDependency* failed = nullptr;
            for (const auto& dep : record.dependencies) {
                if (!dep.required) {
                    continue;
                }
                LoadState state = dep.handle.state();
                if (state == LoadState::Loaded) {
                    continue;
                }
                if (state == LoadState::Failed || state == LoadState::Unloaded) {
                    if (!failed) {
                        failed = &dep;
                    }
                } else {
                    blocked = true;
                }
            }

            if (failed && policy_of(record) == DependencyPolicy::FailFast) {
                it = m_waiting.erase(it);
                fail_record_locked(id, record, AssetError::dependency_failed(
                    record.path.to_string(), failed->path.to_string()));
                progress = true;
                continue;
            }

            if (blocked) {
                ++it;
                continue;
            }

            it = m_waiting.erase(it);
            commit_value_locked(id, record, failed != nullptr);
            progress = true;
        }
    }
}

void AssetServer::commit_value_locked(const AssetId& id, Record& record, bool degraded) {
    if (!record.pending.has_value()) {
        return;
    }

    ErasedAssets* store = find_store(record.pending.type);
    if (!store) {
        fail_record_locked(id, record, AssetError::type_mismatch(
            record.path.to_string(), id.type.name(), "unregistered type"));
        return;
    }

    bool replacing = store->contains(id);
    Result<void> stored = replacing
        ? store->replace_erased(id, std::move(record.pending))
        : store->insert_erased(id, std::move(record.pending), record.data);
    record.pending = ErasedAsset{};

    if (!stored) {
        fail_record_locked(id, record, stored.error());
        return;
    }

    record.data->set_loaded(degraded);
    record.error.clear();

    if (degraded) {
        relic_core::asset_logger()->warn("Loaded '{}' with failed dependencies", record.path.to_string());
    }
    relic_core::asset_logger()->debug("{} '{}' (generation {})", replacing ? "Replaced" : "Loaded",
        record.path.to_string(), record.data->get_generation());
}

void AssetServer::fail_record_locked(const AssetId& id, Record& record, const Error& error) {
    AssetError::Kind kind = error.asset_kind().value_or(AssetError::Kind::DeserializeError);
    record.data->set_failed(kind);
    record.error = error.message();
    record.pending = ErasedAsset{};
    m_waiting.erase(id);

    m_events->push(AssetEvent::load_failed(id, record.path, kind, record.error));
    relic_core::debug::record_error(error);
    relic_core::asset_logger()->debug("'{}' failed: {}", record.path.to_string(), record.error);
}

void AssetServer::finalize_sources_locked(std::vector<AssetSourceMeta>& meta_writes) {
    std::vector<std::pair<AssetPath, SourceLoad>> finished;

    for (auto it = m_in_flight.begin(); it != m_in_flight.end();) {
        const SourceLoad& load = it->second;
        bool done = load.parsed && std::all_of(load.committed.begin(), load.committed.end(),
            [this](const AssetId& id) {
                auto rec = m_records.find(id);
                return rec == m_records.end() ||
                       (m_waiting.count(id) == 0 && is_terminal(rec->second.data->get_state()));
            });
        if (!done) {
            ++it;
            continue;
        }
        finished.emplace_back(it->first, std::move(it->second));
        it = m_in_flight.erase(it);
    }

    for (auto& [source, load] : finished) {
        // Records nobody holds (e.g. orphaned sub-assets) go through the drop queue
        for (const auto& id : load.committed) {
            auto rec = m_records.find(id);
            if (rec != m_records.end() && rec->second.data->use_count() == 0) {
                m_drops->push(id);
            }
        }

        bool replaced = !load.failed && !load.unchanged;
        if (replaced) {
            m_fingerprints[source] = load.fingerprint;
            if (m_config.metadata) {
                if (auto meta = build_metadata_locked(source, load)) {
                    meta_writes.push_back(std::move(*meta));
                }
            }
        }

        if (load.reload && replaced) {
            relic_core::asset_logger()->info("Reloaded '{}'", source.to_string());

            BatchSet batch = load.batch ? load.batch : std::make_shared<std::set<AssetPath>>();
            batch->insert(source);

            std::set<AssetPath> dependent_sources;
            for (const auto& id : load.committed) {
                for (const auto& dependent : m_graph.dependents_of(id)) {
                    auto rec = m_records.find(dependent);
                    if (rec != m_records.end()) {
                        dependent_sources.insert(rec->second.path.source_path());
                    }
                }
            }

            for (const auto& dependent : dependent_sources) {
                if (!batch->insert(dependent).second) {
                    continue;
                }
                auto result = schedule_reload_locked(dependent, true, batch);
                if (!result) {
                    relic_core::asset_logger()->debug("Skipped reload of dependent '{}': {}",
                        dependent.to_string(), result.error().message());
                }
            }
        }

        if (load.rerun) {
            auto result = schedule_reload_locked(source, load.rerun_forced, nullptr);
            if (!result) {
                relic_core::asset_logger()->debug("Dropped queued reload of '{}': {}",
                    source.to_string(), result.error().message());
            }
        }
    }
}

std::optional<AssetSourceMeta> AssetServer::build_metadata_locked(const AssetPath& source,
                                                                 const SourceLoad& load) const {
    AssetSourceMeta meta;
    meta.source = source.to_string();
    meta.fingerprint = load.fingerprint;
    meta.loader = load.loader;

    for (const auto& id : load.committed) {
        auto rec = m_records.find(id);
        if (rec == m_records.end() || !rec->second.data->is_loaded()) {
            // Only fully loaded sources are recorded
            return std::nullopt;
        }
        ProducedAsset produced;
        produced.asset_id = id.raw();
        produced.label = rec->second.path.label();
        produced.type = type_label(id.type);
        for (const auto& dep : rec->second.dependencies) {
            produced.dependencies.push_back(dep.path.to_string());
        }
        meta.produced.push_back(std::move(produced));
    }

    std::sort(meta.produced.begin(), meta.produced.end(),
        [](const ProducedAsset& a, const ProducedAsset& b) { return a.label < b.label; });
    return meta;
}

void AssetServer::write_metadata(std::vector<AssetSourceMeta> records) {
    for (auto& meta : records) {
        // Artifacts written by import() stay valid while the fingerprint matches
        AssetPath source(meta.source);
        auto previous = m_meta->read(source);
        if (previous && previous.value() && previous.value()->fingerprint == meta.fingerprint) {
            meta.derived = previous.value()->derived;
        }

        auto written = m_meta->write(meta);
        if (!written) {
            relic_core::asset_logger()->warn("Metadata for '{}' not updated: {}",
                meta.source, written.error().message());
        }
    }
}

void AssetServer::process_drops_locked() {
    std::vector<UntypedHandle> released;

    while (true) {
        auto ids = m_drops->drain();
        if (ids.empty()) {
            break;
        }

        for (const auto& id : ids) {
            auto rec = m_records.find(id);
            if (rec == m_records.end()) {
                // Values added directly to a server store
                ErasedAssets* store = find_store(id.type);
                if (store && store->contains(id) && store->strong_count(id) == 0) {
                    store->remove(id);
                }
                continue;
            }
            if (rec->second.data->use_count() > 0) {
                continue;
            }
            erase_record_locked(id, released);
        }

        // Releasing retained handles may enqueue further ids
        released.clear();
    }

    for (auto it = m_in_flight.begin(); it != m_in_flight.end();) {
        auto ids = m_by_source.find(it->first);
        if (ids == m_by_source.end() || ids->second.empty()) {
            it->second.token.cancel();
            relic_core::asset_logger()->debug("Cancelled load of '{}': no handles left",
                it->first.to_string());
            it = m_in_flight.erase(it);
        } else {
            ++it;
        }
    }
}

void AssetServer::erase_record_locked(const AssetId& id, std::vector<UntypedHandle>& released) {
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return;
    }
    Record& record = it->second;

    m_waiting.erase(id);
    if (ErasedAssets* store = find_store(id.type)) {
        store->remove(id);
    }
    record.data->set_state(LoadState::Unloaded);

    for (auto& dep : record.dependencies) {
        released.push_back(std::move(dep.handle));
    }
    for (auto& sub : record.labeled) {
        released.push_back(std::move(sub));
    }
    m_graph.remove_node(id);

    auto path_id = m_path_ids.find(record.path);
    if (path_id != m_path_ids.end() && path_id->second == id) {
        m_path_ids.erase(path_id);
    }

    AssetPath source = record.path.source_path();
    auto ids = m_by_source.find(source);
    if (ids != m_by_source.end()) {
        ids->second.erase(id);
        if (ids->second.empty()) {
            m_by_source.erase(ids);
            m_fingerprints.erase(source);
        }
    }

    relic_core::asset_logger()->debug("Removed '{}'", record.path.to_string());
    m_records.erase(it);
}

// =============================================================================
// Reload / Unload
// =============================================================================

Result<void> AssetServer::reload(const AssetPath& path) {
    std::lock_guard lock(m_mutex);
    if (m_shutdown) {
        return relic_core::Err(AssetError::cancelled(path.to_string()));
    }
    return schedule_reload_locked(path.source_path(), false, nullptr);
}

Result<void> AssetServer::schedule_reload_locked(const AssetPath& source, bool forced, BatchSet batch) {
    auto ids = m_by_source.find(source);
    if (ids == m_by_source.end() || ids->second.empty()) {
        return relic_core::Err(AssetError::not_found(source.to_string()));
    }

    auto in_flight = m_in_flight.find(source);
    if (in_flight != m_in_flight.end()) {
        in_flight->second.rerun = true;
        in_flight->second.rerun_forced = in_flight->second.rerun_forced || forced;
        return relic_core::Ok();
    }

    std::type_index type(typeid(void));
    LoadOptions options;
    auto def = m_path_ids.find(source);
    if (def != m_path_ids.end()) {
        type = def->second.type;
        options = m_records.at(def->second).options;
    }

    bool has_value = std::any_of(ids->second.begin(), ids->second.end(), [this](const AssetId& id) {
        ErasedAssets* store = find_store(id.type);
        return store && store->contains(id);
    });

    std::set<AssetId> requested = ids->second;
    if (!has_value) {
        // Nothing was ever committed: retry as a fresh load
        for (const auto& id : requested) {
            m_records.at(id).data->set_state(LoadState::Requested);
        }
        SourceLoad& load = start_load_locked(source, type, options, false, false, nullptr);
        load.requested = std::move(requested);
        return relic_core::Ok();
    }

    if (!batch) {
        batch = std::make_shared<std::set<AssetPath>>();
        batch->insert(source);
    }
    SourceLoad& load = start_load_locked(source, type, options, true, forced, std::move(batch));
    load.requested = std::move(requested);
    return relic_core::Ok();
}

Result<void> AssetServer::unload(const AssetPath& path) {
    std::lock_guard lock(m_mutex);
    AssetPath source = path.source_path();

    bool cancelled = false;
    auto in_flight = m_in_flight.find(source);
    if (in_flight != m_in_flight.end()) {
        in_flight->second.token.cancel();
        m_in_flight.erase(in_flight);
        cancelled = true;
    }

    auto ids = m_by_source.find(source);
    if (ids == m_by_source.end()) {
        if (cancelled) {
            return relic_core::Ok();
        }
        return relic_core::Err(AssetError::not_found(source.to_string()));
    }

    std::vector<AssetId> to_remove(ids->second.begin(), ids->second.end());
    std::vector<UntypedHandle> released;
    for (const auto& id : to_remove) {
        erase_record_locked(id, released);
    }

    relic_core::asset_logger()->info("Unloaded '{}' ({} asset(s))", source.to_string(), to_remove.size());
    return relic_core::Ok();
}

// =============================================================================
// Folders / Persistence
// =============================================================================

Result<std::vector<UntypedHandle>> AssetServer::load_folder(const AssetPath& dir) {
    RELIC_LOG_SCOPE("load_folder " + dir.to_string());
    auto io = source(dir.source());
    if (!io) {
        return relic_core::Err<std::vector<UntypedHandle>>(AssetError::not_found(dir.to_string()));
    }
    if (!io->is_directory(dir.path())) {
        return relic_core::Err<std::vector<UntypedHandle>>(AssetError::not_found(dir.to_string()));
    }

    std::vector<std::string> files;
    collect_files(*io, dir.path(), files);

    std::vector<UntypedHandle> handles;
    for (const auto& file : files) {
        AssetPath path(dir.source(), file);
        if (!m_loaders.supports_extension(path.extension())) {
            continue;
        }
        handles.push_back(load_untyped(path));
    }

    relic_core::asset_logger()->debug("Loading folder '{}' ({} file(s))", dir.to_string(), handles.size());
    return relic_core::Ok(std::move(handles));
}

Result<void> AssetServer::save_erased(const AssetPath& path, std::type_index type, const void* value) {
    ErasedSerializer* serializer = m_serializers.find(type);
    if (!serializer) {
        return relic_core::Err(AssetError::serializer_not_found(type.name()));
    }

    auto bytes = serializer->serialize_erased(value);
    if (!bytes) {
        return relic_core::Err(bytes.error());
    }

    auto io = source(path.source());
    if (!io) {
        return relic_core::Err(AssetError::not_found(path.to_string()));
    }

    auto written = io->write(path.path(), bytes.value());
    if (!written) {
        relic_core::asset_logger()->warn("Failed to save '{}': {}", path.to_string(), written.error().message());
        return written;
    }

    relic_core::asset_logger()->debug("Saved '{}' ({} bytes, {})",
        path.to_string(), bytes.value().size(), serializer->type_tag());
    return relic_core::Ok();
}

Result<AssetSourceMeta> AssetServer::import(const AssetPath& path) {
    AssetPath source = path.source_path();
    RELIC_LOG_SCOPE("import " + source.to_string());

    std::shared_ptr<AssetIo> io;
    std::shared_ptr<AssetIo> import_io;
    {
        std::lock_guard lock(m_mutex);
        io = source_locked(source.source());
        import_io = m_import_io;
    }
    if (!io || !import_io) {
        return relic_core::Err<AssetSourceMeta>(AssetError::not_found(source.to_string()));
    }

    auto importer = [&](const Bytes& bytes) -> Result<AssetSourceMeta> {
        ErasedLoader* loader = m_loaders.find(source.extension(), std::type_index(typeid(void)));
        if (!loader) {
            return relic_core::Err<AssetSourceMeta>(
                AssetError::loader_not_found(source.to_string(), source.extension()));
        }

        LoadContext ctx(bytes, source);
        auto value = invoke_loader(*loader, ctx, source);
        if (!value) {
            return relic_core::Err<AssetSourceMeta>(value.error());
        }
        if (ctx.error()) {
            return relic_core::Err<AssetSourceMeta>(*ctx.error());
        }

        AssetSourceMeta meta;
        meta.loader = loader->type_name();

        auto produce = [&](const AssetPath& asset_path, ErasedAsset erased,
                           const std::vector<PendingDependency>& deps) -> Result<void> {
            ProducedAsset produced;
            produced.asset_id = AssetId::from_path(asset_path, erased.type).raw();
            produced.label = asset_path.label();
            produced.type = type_label(erased.type);
            for (const auto& dep : deps) {
                produced.dependencies.push_back(dep.path.to_string());
            }
            meta.produced.push_back(std::move(produced));

            auto derived = m_derivers.apply(std::move(erased), asset_path);
            if (!derived) {
                return relic_core::Err(derived.error());
            }

            ErasedSerializer* serializer = m_serializers.find(derived.value().type);
            if (!serializer) {
                return relic_core::Ok();
            }
            auto artifact_bytes = serializer->serialize_erased(derived.value().raw());
            if (!artifact_bytes) {
                return relic_core::Err(artifact_bytes.error());
            }

            std::string artifact = artifact_path(asset_path, *serializer);
            auto written = import_io->write(artifact, artifact_bytes.value());
            if (!written) {
                return written;
            }
            meta.derived.push_back(DerivedArtifact{asset_path.label(), artifact, serializer->type_tag()});
            return relic_core::Ok();
        };

        auto produced = produce(source, std::move(value).value(), ctx.dependencies());
        if (!produced) {
            return relic_core::Err<AssetSourceMeta>(produced.error());
        }
        for (auto& labeled : ctx.labeled_assets()) {
            auto sub = produce(source.with_label(labeled.label), std::move(labeled.value), labeled.dependencies);
            if (!sub) {
                return relic_core::Err<AssetSourceMeta>(sub.error());
            }
        }
        return relic_core::Ok(std::move(meta));
    };

    auto outcome = m_meta->get_or_import(source, *io, importer);
    if (!outcome) {
        relic_core::asset_logger()->warn("Import of '{}' failed: {}",
            source.to_string(), outcome.error().message());
        return relic_core::Err<AssetSourceMeta>(outcome.error());
    }

    if (outcome.value().imported) {
        relic_core::asset_logger()->info("Imported '{}'", source.to_string());
    } else {
        relic_core::asset_logger()->debug("Import of '{}' is up to date", source.to_string());
    }
    return relic_core::Ok(std::move(outcome).value().meta);
}

// =============================================================================
// Queries
// =============================================================================

const AssetServer::Record* AssetServer::find_record_locked(const AssetId& id) const {
    auto it = m_records.find(id);
    return it != m_records.end() ? &it->second : nullptr;
}

std::shared_ptr<HandleData> AssetServer::find_handle_data(const AssetPath& path) const {
    std::lock_guard lock(m_mutex);
    auto it = m_path_ids.find(path);
    if (it == m_path_ids.end()) {
        return nullptr;
    }
    return m_records.at(it->second).data;
}

LoadState AssetServer::get_load_state(const AssetId& id) const {
    {
        std::lock_guard lock(m_mutex);
        if (const Record* record = find_record_locked(id)) {
            return record->data->get_state();
        }
    }
    if (ErasedAssets* store = find_store(id.type); store && store->contains(id)) {
        return LoadState::Loaded;
    }
    return LoadState::Unloaded;
}

LoadStatus AssetServer::get_load_status(const AssetId& id) const {
    LoadStatus status;
    {
        std::lock_guard lock(m_mutex);
        if (const Record* record = find_record_locked(id)) {
            status.state = record->data->get_state();
            status.generation = record->data->get_generation();
            status.degraded = record->data->degraded.load(std::memory_order_relaxed);
            if (status.state == LoadState::Failed) {
                status.error = record->data->get_error();
                status.error_message = record->error;
            }
            return status;
        }
    }
    status.state = get_load_state(id);
    return status;
}

LoadState AssetServer::get_group_load_state(const std::vector<AssetId>& ids) const {
    if (ids.empty()) {
        return LoadState::Unloaded;
    }

    bool any_unloaded = false;
    std::optional<LoadState> slowest;
    for (const auto& id : ids) {
        LoadState state = get_load_state(id);
        switch (state) {
            case LoadState::Failed:
                return LoadState::Failed;
            case LoadState::Unloaded:
                any_unloaded = true;
                break;
            case LoadState::Loaded:
                break;
            default:
                if (!slowest || state < *slowest) {
                    slowest = state;
                }
                break;
        }
    }

    if (any_unloaded) return LoadState::Unloaded;
    if (slowest) return *slowest;
    return LoadState::Loaded;
}

std::optional<AssetPath> AssetServer::get_path(const AssetId& id) const {
    std::lock_guard lock(m_mutex);
    const Record* record = find_record_locked(id);
    return record ? std::optional<AssetPath>(record->path) : std::nullopt;
}

std::vector<AssetEvent> AssetServer::drain_events() {
    return m_events->drain();
}

std::size_t AssetServer::in_flight_count() const {
    std::lock_guard lock(m_mutex);
    return m_in_flight.size();
}

std::size_t AssetServer::record_count() const {
    std::lock_guard lock(m_mutex);
    return m_records.size();
}

DependencyPolicy AssetServer::policy_of(const Record& record) const {
    return record.options.policy.value_or(m_config.dependency_policy);
}

std::string AssetServer::type_label(std::type_index type) const {
    if (ErasedSerializer* serializer = m_serializers.find(type)) {
        return serializer->type_tag();
    }
    return type.name();
}

// =============================================================================
// Debug Utilities
// =============================================================================

namespace debug {

std::string format_server_state(const AssetServer& server) {
    std::ostringstream oss;
    oss << "AssetServer {\n";
    oss << "  records: " << server.record_count() << "\n";
    oss << "  in_flight: " << server.in_flight_count() << "\n";
    oss << "  edges: " << server.graph().edge_count() << "\n";
    oss << "  workers: " << server.config().worker_threads << "\n";
    oss << "  policy: " << dependency_policy_name(server.config().dependency_policy) << "\n";
    oss << "  hot_reload: " << (server.config().hot_reload ? "true" : "false") << "\n";
    oss << "}";
    return oss.str();
}

} // namespace debug

} // namespace relic_asset
