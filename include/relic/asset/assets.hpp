#pragma once

/// @file assets.hpp
/// @brief Typed asset stores for relic_asset

#include "fwd.hpp"
#include "types.hpp"
#include "handle.hpp"
#include <relic/core/error.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relic_asset {

// =============================================================================
// AssetEventQueue
// =============================================================================

/// Lifecycle events shared by the stores of one server
class AssetEventQueue {
public:
    void push(AssetEvent event) {
        std::lock_guard lock(m_mutex);
        m_events.push_back(std::move(event));
    }

    [[nodiscard]] std::vector<AssetEvent> drain() {
        std::lock_guard lock(m_mutex);
        std::vector<AssetEvent> out;
        out.swap(m_events);
        return out;
    }

    [[nodiscard]] std::size_t len() const {
        std::lock_guard lock(m_mutex);
        return m_events.size();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<AssetEvent> m_events;
};

// =============================================================================
// ErasedAsset
// =============================================================================

/// Owned value of a type known only at runtime
struct ErasedAsset {
    using Deleter = void (*)(void*);
    using StoreFactory = std::unique_ptr<ErasedAssets> (*)(
        std::shared_ptr<DropQueue>, std::shared_ptr<AssetEventQueue>);

    std::unique_ptr<void, Deleter> value{nullptr, &ErasedAsset::no_delete};
    std::type_index type{typeid(void)};
    StoreFactory make_store = nullptr;

    /// Take ownership of a typed value
    template<typename T>
    [[nodiscard]] static ErasedAsset from(std::unique_ptr<T> asset);

    /// Release the value as T (nullptr on type mismatch)
    template<typename T>
    [[nodiscard]] std::unique_ptr<T> take() {
        if (type != std::type_index(typeid(T)) || !value) {
            return nullptr;
        }
        return std::unique_ptr<T>(static_cast<T*>(value.release()));
    }

    [[nodiscard]] bool has_value() const noexcept { return value != nullptr; }

    /// Borrow the value as T (nullptr on type mismatch)
    template<typename T>
    [[nodiscard]] const T* peek() const noexcept {
        if (type != std::type_index(typeid(T))) {
            return nullptr;
        }
        return static_cast<const T*>(value.get());
    }

    /// Borrow the raw value
    [[nodiscard]] const void* raw() const noexcept { return value.get(); }

private:
    static void no_delete(void*) {}
};

// =============================================================================
// ErasedAssets
// =============================================================================

/// Type-erased view of an Assets<T> store, used by the server
class ErasedAssets {
public:
    virtual ~ErasedAssets() = default;

    /// Value type held by the store
    [[nodiscard]] virtual std::type_index type_id() const = 0;

    /// Insert a new value under bookkeeping created by the caller
    [[nodiscard]] virtual Result<void> insert_erased(
        const AssetId& id, ErasedAsset value, std::shared_ptr<HandleData> data) = 0;

    /// Replace an existing value in place (generation + 1, Modified event)
    [[nodiscard]] virtual Result<void> replace_erased(const AssetId& id, ErasedAsset value) = 0;

    /// Borrow a value without knowing its type
    [[nodiscard]] virtual const void* get_erased(const AssetId& id) const = 0;

    /// Check if a value is present
    [[nodiscard]] virtual bool contains(const AssetId& id) const = 0;

    /// Remove a value (Removed event). Only drop processing and unload call this.
    virtual bool remove(const AssetId& id) = 0;

    /// Strong handle count of a value (0 if absent)
    [[nodiscard]] virtual std::uint32_t strong_count(const AssetId& id) const = 0;

    /// Number of values
    [[nodiscard]] virtual std::size_t len() const = 0;
};

// =============================================================================
// Assets<T>
// =============================================================================

/// Typed table from AssetId to value and bookkeeping.
///
/// A standalone store owns its drop and event queues. A store created by an
/// AssetServer shares the server's queues; its drops are processed by
/// AssetServer::process().
template<typename T>
class Assets final : public ErasedAssets {
public:
    /// Standalone store
    Assets()
        : m_drops(std::make_shared<DropQueue>())
        , m_events(std::make_shared<AssetEventQueue>())
        , m_owns_queues(true) {}

    /// Store sharing queues with a server
    Assets(std::shared_ptr<DropQueue> drops, std::shared_ptr<AssetEventQueue> events)
        : m_drops(std::move(drops))
        , m_events(std::move(events))
        , m_owns_queues(false) {}

    Assets(const Assets&) = delete;
    Assets& operator=(const Assets&) = delete;

    /// Insert a value under a generated id
    [[nodiscard]] Handle<T> add(T value) {
        AssetId id = AssetId::generate<T>();
        auto data = HandleData::create(id, AssetPath{}, m_drops);
        Handle<T> handle(data);
        {
            std::unique_lock lock(m_mutex);
            m_entries.emplace(id, Entry{std::make_unique<T>(std::move(value)), data});
            data->set_loaded(false);
        }
        m_events->push(AssetEvent::added(id, AssetPath{}, 0));
        return handle;
    }

    /// Insert a value under a caller-supplied id
    [[nodiscard]] Result<Handle<T>> insert(const AssetId& id, T value) {
        if (id.type != std::type_index(typeid(T))) {
            return relic_core::Err<Handle<T>>(AssetError::type_mismatch(
                relic_core::to_hex(id.raw()), typeid(T).name(), id.type.name()));
        }

        auto data = HandleData::create(id, AssetPath{}, m_drops);
        Handle<T> handle(data);
        {
            std::unique_lock lock(m_mutex);
            if (m_entries.find(id) != m_entries.end()) {
                return relic_core::Err<Handle<T>>(AssetError::duplicate_id(
                    relic_core::to_hex(id.raw()), id.raw()));
            }
            m_entries.emplace(id, Entry{std::make_unique<T>(std::move(value)), data});
            data->set_loaded(false);
        }
        m_events->push(AssetEvent::added(id, AssetPath{}, 0));
        return relic_core::Ok(std::move(handle));
    }

    /// Get value by ID
    [[nodiscard]] const T* get(const AssetId& id) const {
        std::shared_lock lock(m_mutex);
        auto it = m_entries.find(id);
        return it != m_entries.end() ? it->second.value.get() : nullptr;
    }

    /// Get value by handle
    [[nodiscard]] const T* get(const Handle<T>& handle) const {
        return get(handle.id());
    }

    /// Get mutable value (emits Modified)
    [[nodiscard]] T* get_mut(const AssetId& id) {
        T* value = nullptr;
        AssetPath path;
        std::uint32_t gen = 0;
        {
            std::shared_lock lock(m_mutex);
            auto it = m_entries.find(id);
            if (it == m_entries.end()) {
                return nullptr;
            }
            value = it->second.value.get();
            path = it->second.data->path;
            gen = it->second.data->get_generation();
        }
        m_events->push(AssetEvent::modified(id, path, gen));
        return value;
    }

    [[nodiscard]] T* get_mut(const Handle<T>& handle) {
        return get_mut(handle.id());
    }

    /// Resolve a weak handle; absent once its incarnation is gone
    [[nodiscard]] const T* resolve(const WeakHandle<T>& weak) const {
        std::shared_lock lock(m_mutex);
        auto it = m_entries.find(weak.id());
        if (it == m_entries.end() || it->second.data->incarnation != weak.incarnation()) {
            return nullptr;
        }
        return it->second.value.get();
    }

    /// Strong handle to an existing value (null handle if absent)
    [[nodiscard]] Handle<T> get_handle(const AssetId& id) const {
        std::shared_lock lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return Handle<T>{};
        }
        return Handle<T>(it->second.data);
    }

    /// Check if asset exists
    [[nodiscard]] bool contains(const AssetId& id) const override {
        std::shared_lock lock(m_mutex);
        return m_entries.find(id) != m_entries.end();
    }

    /// Get total count
    [[nodiscard]] std::size_t len() const override {
        std::shared_lock lock(m_mutex);
        return m_entries.size();
    }

    [[nodiscard]] bool empty() const {
        return len() == 0;
    }

    /// Generation of a value (0 if absent)
    [[nodiscard]] std::uint32_t generation(const AssetId& id) const {
        std::shared_lock lock(m_mutex);
        auto it = m_entries.find(id);
        return it != m_entries.end() ? it->second.data->get_generation() : 0;
    }

    /// Load state of a value (Unloaded if absent)
    [[nodiscard]] LoadState state(const AssetId& id) const {
        std::shared_lock lock(m_mutex);
        auto it = m_entries.find(id);
        return it != m_entries.end() ? it->second.data->get_state() : LoadState::Unloaded;
    }

    /// Strong handle count of a value (0 if absent)
    [[nodiscard]] std::uint32_t strong_count(const AssetId& id) const override {
        std::shared_lock lock(m_mutex);
        auto it = m_entries.find(id);
        return it != m_entries.end() ? it->second.data->use_count() : 0;
    }

    /// All ids currently present
    [[nodiscard]] std::vector<AssetId> ids() const {
        std::shared_lock lock(m_mutex);
        std::vector<AssetId> out;
        out.reserve(m_entries.size());
        for (const auto& [id, entry] : m_entries) {
            out.push_back(id);
        }
        return out;
    }

    /// Iterate over all values
    template<typename F>
    void for_each(F&& func) const {
        std::shared_lock lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            func(id, *entry.value);
        }
    }

    /// Remove a value
    bool remove(const AssetId& id) override {
        AssetPath path;
        {
            std::unique_lock lock(m_mutex);
            auto it = m_entries.find(id);
            if (it == m_entries.end()) {
                return false;
            }
            path = it->second.data->path;
            it->second.data->set_state(LoadState::Unloaded);
            m_entries.erase(it);
        }
        m_events->push(AssetEvent::removed(id, path));
        return true;
    }

    /// Remove values whose strong count is still zero.
    /// Only standalone stores process their own queue.
    std::size_t process_drops() {
        if (!m_owns_queues) {
            return 0;
        }

        std::size_t removed = 0;
        for (const auto& id : m_drops->drain()) {
            bool unreferenced = false;
            {
                std::shared_lock lock(m_mutex);
                auto it = m_entries.find(id);
                unreferenced = it != m_entries.end() && it->second.data->use_count() == 0;
            }
            if (unreferenced && remove(id)) {
                ++removed;
            }
        }
        return removed;
    }

    /// Take pending events of a standalone store
    [[nodiscard]] std::vector<AssetEvent> drain_events() {
        return m_events->drain();
    }

    // -------------------------------------------------------------------------
    // ErasedAssets
    // -------------------------------------------------------------------------

    [[nodiscard]] std::type_index type_id() const override {
        return std::type_index(typeid(T));
    }

    [[nodiscard]] Result<void> insert_erased(
        const AssetId& id, ErasedAsset value, std::shared_ptr<HandleData> data) override
    {
        auto typed = value.take<T>();
        if (!typed) {
            return relic_core::Err(AssetError::type_mismatch(
                data->path.to_string(), typeid(T).name(), value.type.name()));
        }

        AssetPath path = data->path;
        std::uint32_t gen = data->get_generation();
        {
            std::unique_lock lock(m_mutex);
            if (m_entries.find(id) != m_entries.end()) {
                return relic_core::Err(AssetError::duplicate_id(path.to_string(), id.raw()));
            }
            m_entries.emplace(id, Entry{std::move(typed), std::move(data)});
        }
        m_events->push(AssetEvent::added(id, path, gen));
        return relic_core::Ok();
    }

    [[nodiscard]] Result<void> replace_erased(const AssetId& id, ErasedAsset value) override {
        auto typed = value.take<T>();
        if (!typed) {
            return relic_core::Err(AssetError::type_mismatch(
                relic_core::to_hex(id.raw()), typeid(T).name(), value.type.name()));
        }

        AssetPath path;
        std::uint32_t gen = 0;
        {
            std::unique_lock lock(m_mutex);
            auto it = m_entries.find(id);
            if (it == m_entries.end()) {
                return relic_core::Err(AssetError::not_found(relic_core::to_hex(id.raw())));
            }
            it->second.value = std::move(typed);
            gen = it->second.data->increment_generation();
            path = it->second.data->path;
        }
        m_events->push(AssetEvent::modified(id, path, gen));
        return relic_core::Ok();
    }

    [[nodiscard]] const void* get_erased(const AssetId& id) const override {
        return get(id);
    }

private:
    struct Entry {
        std::unique_ptr<T> value;
        std::shared_ptr<HandleData> data;
    };

    std::unordered_map<AssetId, Entry> m_entries;
    std::shared_ptr<DropQueue> m_drops;
    std::shared_ptr<AssetEventQueue> m_events;
    bool m_owns_queues;
    mutable std::shared_mutex m_mutex;
};

// =============================================================================
// ErasedAsset (template definitions)
// =============================================================================

template<typename T>
ErasedAsset ErasedAsset::from(std::unique_ptr<T> asset) {
    ErasedAsset erased;
    erased.value = std::unique_ptr<void, Deleter>(
        asset.release(), [](void* ptr) { delete static_cast<T*>(ptr); });
    erased.type = std::type_index(typeid(T));
    erased.make_store = [](std::shared_ptr<DropQueue> drops,
                           std::shared_ptr<AssetEventQueue> events) -> std::unique_ptr<ErasedAssets> {
        return std::make_unique<Assets<T>>(std::move(drops), std::move(events));
    };
    return erased;
}

} // namespace relic_asset
