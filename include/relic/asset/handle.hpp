#pragma once

/// @file handle.hpp
/// @brief Reference-counted asset handles for relic_asset
///
/// Handles carry only an AssetId and shared bookkeeping, never a pointer to
/// the value. Holders resolve values through the owning Assets<T> store.

#include "fwd.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relic_asset {

// =============================================================================
// DropQueue
// =============================================================================

/// Ids whose strong count reached zero, awaiting the next synchronization point
class DropQueue {
public:
    /// Enqueue an id (called from any thread)
    void push(const AssetId& id) {
        std::lock_guard lock(m_mutex);
        m_ids.push_back(id);
    }

    /// Take all queued ids
    [[nodiscard]] std::vector<AssetId> drain() {
        std::lock_guard lock(m_mutex);
        std::vector<AssetId> out;
        out.swap(m_ids);
        return out;
    }

    [[nodiscard]] std::size_t len() const {
        std::lock_guard lock(m_mutex);
        return m_ids.size();
    }

    [[nodiscard]] bool empty() const { return len() == 0; }

private:
    mutable std::mutex m_mutex;
    std::vector<AssetId> m_ids;
};

// =============================================================================
// HandleData
// =============================================================================

/// Shared bookkeeping behind all handles of one asset incarnation
struct HandleData {
    AssetId id;
    AssetPath path;
    std::uint64_t incarnation = 0;
    std::weak_ptr<DropQueue> drop_queue;

    std::atomic<std::uint32_t> strong_count{0};
    std::atomic<std::uint32_t> generation{0};
    std::atomic<LoadState> state{LoadState::Requested};
    std::atomic<int> error_kind{-1};
    std::atomic<bool> degraded{false};

    /// Create bookkeeping for a new incarnation of an id
    [[nodiscard]] static std::shared_ptr<HandleData> create(
        const AssetId& id, const AssetPath& path, const std::shared_ptr<DropQueue>& queue);

    /// Increment strong count
    void add_strong() noexcept {
        strong_count.fetch_add(1, std::memory_order_relaxed);
    }

    /// Decrement strong count; the 1 -> 0 transition enqueues the id
    void release_strong() noexcept;

    /// Try to add a strong reference (fails if strong count is 0)
    bool try_upgrade() noexcept {
        std::uint32_t count = strong_count.load(std::memory_order_relaxed);
        while (count > 0) {
            if (strong_count.compare_exchange_weak(count, count + 1,
                std::memory_order_acq_rel, std::memory_order_relaxed)) {
                return true;
            }
        }
        return false;
    }

    /// Get strong count
    [[nodiscard]] std::uint32_t use_count() const noexcept {
        return strong_count.load(std::memory_order_acquire);
    }

    /// Get current generation
    [[nodiscard]] std::uint32_t get_generation() const noexcept {
        return generation.load(std::memory_order_relaxed);
    }

    /// Increment generation (on value replacement), returns the new value
    std::uint32_t increment_generation() noexcept {
        return generation.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    /// Get load state
    [[nodiscard]] LoadState get_state() const noexcept {
        return state.load(std::memory_order_acquire);
    }

    /// Set load state
    void set_state(LoadState s) noexcept {
        state.store(s, std::memory_order_release);
    }

    /// Mark failed with an error kind
    void set_failed(AssetError::Kind kind) noexcept {
        error_kind.store(static_cast<int>(kind), std::memory_order_relaxed);
        set_state(LoadState::Failed);
    }

    /// Mark loaded, clearing any previous error
    void set_loaded(bool is_degraded) noexcept {
        error_kind.store(-1, std::memory_order_relaxed);
        degraded.store(is_degraded, std::memory_order_relaxed);
        set_state(LoadState::Loaded);
    }

    /// Error kind of the last failure, if any
    [[nodiscard]] std::optional<AssetError::Kind> get_error() const noexcept {
        int kind = error_kind.load(std::memory_order_relaxed);
        if (kind < 0) return std::nullopt;
        return static_cast<AssetError::Kind>(kind);
    }

    /// Check if loaded
    [[nodiscard]] bool is_loaded() const noexcept {
        return get_state() == LoadState::Loaded;
    }
};

// =============================================================================
// Handle<T>
// =============================================================================

/// Strong reference-counted handle to an asset
template<typename T>
class Handle {
public:
    /// Default constructor (null handle)
    Handle() noexcept = default;

    /// Construct from handle data (takes a strong reference)
    explicit Handle(std::shared_ptr<HandleData> data) noexcept
        : m_data(std::move(data))
    {
        if (m_data) {
            m_data->add_strong();
        }
    }

    /// Copy constructor
    Handle(const Handle& other) noexcept
        : m_data(other.m_data)
    {
        if (m_data) {
            m_data->add_strong();
        }
    }

    /// Move constructor
    Handle(Handle&& other) noexcept
        : m_data(std::move(other.m_data)) {}

    /// Destructor
    ~Handle() {
        reset();
    }

    /// Copy assignment
    Handle& operator=(const Handle& other) noexcept {
        if (this != &other) {
            reset();
            m_data = other.m_data;
            if (m_data) {
                m_data->add_strong();
            }
        }
        return *this;
    }

    /// Move assignment
    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            m_data = std::move(other.m_data);
        }
        return *this;
    }

    /// Release the strong reference
    void reset() noexcept {
        if (m_data) {
            m_data->release_strong();
            m_data.reset();
        }
    }

    /// Check if handle is valid
    [[nodiscard]] bool is_valid() const noexcept {
        return m_data != nullptr;
    }

    /// Check if asset is loaded
    [[nodiscard]] bool is_loaded() const noexcept {
        return m_data && m_data->is_loaded();
    }

    /// Check if asset is still being loaded
    [[nodiscard]] bool is_loading() const noexcept {
        return m_data && !is_terminal(m_data->get_state());
    }

    /// Check if asset load failed
    [[nodiscard]] bool is_failed() const noexcept {
        return m_data && m_data->get_state() == LoadState::Failed;
    }

    /// Get load state
    [[nodiscard]] LoadState state() const noexcept {
        return m_data ? m_data->get_state() : LoadState::Unloaded;
    }

    /// Error kind of a failed load
    [[nodiscard]] std::optional<AssetError::Kind> error() const noexcept {
        return m_data ? m_data->get_error() : std::nullopt;
    }

    /// Loaded despite a failed dependency
    [[nodiscard]] bool is_degraded() const noexcept {
        return m_data && m_data->degraded.load(std::memory_order_relaxed);
    }

    /// Get asset ID
    [[nodiscard]] AssetId id() const noexcept {
        return m_data ? m_data->id : AssetId::invalid();
    }

    /// Get asset path (empty for generated assets)
    [[nodiscard]] AssetPath path() const {
        return m_data ? m_data->path : AssetPath{};
    }

    /// Get generation
    [[nodiscard]] std::uint32_t generation() const noexcept {
        return m_data ? m_data->get_generation() : 0;
    }

    /// Get strong reference count
    [[nodiscard]] std::uint32_t use_count() const noexcept {
        return m_data ? m_data->use_count() : 0;
    }

    /// Create a weak handle to the same asset
    [[nodiscard]] WeakHandle<T> downgrade() const noexcept;

    /// Bool conversion (true if valid)
    explicit operator bool() const noexcept {
        return is_valid();
    }

    /// Comparison
    bool operator==(const Handle& other) const noexcept {
        return m_data == other.m_data;
    }

    bool operator!=(const Handle& other) const noexcept {
        return m_data != other.m_data;
    }

    /// Get internal data (for advanced use)
    [[nodiscard]] const std::shared_ptr<HandleData>& data() const noexcept {
        return m_data;
    }

private:
    std::shared_ptr<HandleData> m_data;
};

// =============================================================================
// WeakHandle<T>
// =============================================================================

/// Weak reference to an asset (doesn't prevent removal)
///
/// Records the incarnation it was taken from, so a later value inserted
/// under the same id is never observed through it.
template<typename T>
class WeakHandle {
public:
    /// Default constructor
    WeakHandle() noexcept = default;

    /// Construct from strong handle
    WeakHandle(const Handle<T>& handle) noexcept
        : m_data(handle.data())
        , m_id(handle.id())
        , m_incarnation(handle.data() ? handle.data()->incarnation : 0) {}

    /// Reset handle
    void reset() noexcept {
        m_data.reset();
        m_id = AssetId::invalid();
        m_incarnation = 0;
    }

    /// Try to upgrade to strong handle
    [[nodiscard]] Handle<T> lock() const noexcept {
        auto data = m_data.lock();
        if (data && data->get_state() != LoadState::Unloaded && data->try_upgrade()) {
            Handle<T> handle(data);
            data->release_strong();
            return handle;
        }
        return Handle<T>{};
    }

    /// Check if no strong references remain
    [[nodiscard]] bool expired() const noexcept {
        auto data = m_data.lock();
        return !data || data->use_count() == 0;
    }

    /// Get asset ID
    [[nodiscard]] AssetId id() const noexcept {
        return m_id;
    }

    /// Incarnation this handle observes
    [[nodiscard]] std::uint64_t incarnation() const noexcept {
        return m_incarnation;
    }

private:
    std::weak_ptr<HandleData> m_data;
    AssetId m_id;
    std::uint64_t m_incarnation = 0;
};

template<typename T>
WeakHandle<T> Handle<T>::downgrade() const noexcept {
    return WeakHandle<T>(*this);
}

// =============================================================================
// UntypedHandle
// =============================================================================

/// Type-erased strong handle
class UntypedHandle {
public:
    /// Default constructor
    UntypedHandle() noexcept = default;

    /// Construct from handle data (takes a strong reference)
    explicit UntypedHandle(std::shared_ptr<HandleData> data) noexcept
        : m_data(std::move(data))
    {
        if (m_data) {
            m_data->add_strong();
        }
    }

    /// Construct from typed handle
    template<typename T>
    UntypedHandle(const Handle<T>& handle) noexcept
        : UntypedHandle(handle.data()) {}

    UntypedHandle(const UntypedHandle& other) noexcept
        : UntypedHandle(other.m_data) {}

    UntypedHandle(UntypedHandle&& other) noexcept
        : m_data(std::move(other.m_data)) {}

    ~UntypedHandle() {
        reset();
    }

    UntypedHandle& operator=(const UntypedHandle& other) noexcept {
        if (this != &other) {
            reset();
            m_data = other.m_data;
            if (m_data) {
                m_data->add_strong();
            }
        }
        return *this;
    }

    UntypedHandle& operator=(UntypedHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_data = std::move(other.m_data);
        }
        return *this;
    }

    /// Release the strong reference
    void reset() noexcept {
        if (m_data) {
            m_data->release_strong();
            m_data.reset();
        }
    }

    /// Check if valid
    [[nodiscard]] bool is_valid() const noexcept {
        return m_data != nullptr;
    }

    /// Check if loaded
    [[nodiscard]] bool is_loaded() const noexcept {
        return m_data && m_data->is_loaded();
    }

    /// Get load state
    [[nodiscard]] LoadState state() const noexcept {
        return m_data ? m_data->get_state() : LoadState::Unloaded;
    }

    /// Get asset ID
    [[nodiscard]] AssetId id() const noexcept {
        return m_data ? m_data->id : AssetId::invalid();
    }

    /// Get asset path
    [[nodiscard]] AssetPath path() const {
        return m_data ? m_data->path : AssetPath{};
    }

    /// Get value type
    [[nodiscard]] std::type_index type_id() const noexcept {
        return m_data ? m_data->id.type : std::type_index(typeid(void));
    }

    /// Check if type matches
    template<typename T>
    [[nodiscard]] bool is_type() const noexcept {
        return type_id() == std::type_index(typeid(T));
    }

    /// Typed handle to the same asset (null handle on type mismatch)
    template<typename T>
    [[nodiscard]] Handle<T> typed() const {
        if (is_type<T>()) {
            return Handle<T>(m_data);
        }
        return Handle<T>{};
    }

    explicit operator bool() const noexcept {
        return is_valid();
    }

    bool operator==(const UntypedHandle& other) const noexcept {
        return m_data == other.m_data;
    }

    /// Get internal data
    [[nodiscard]] const std::shared_ptr<HandleData>& data() const noexcept {
        return m_data;
    }

private:
    std::shared_ptr<HandleData> m_data;
};

// =============================================================================
// Debug Utilities (Implemented in handle.cpp)
// =============================================================================

namespace debug {

/// Format handle data for debugging
std::string format_handle_data(const HandleData& data);

} // namespace debug

} // namespace relic_asset
