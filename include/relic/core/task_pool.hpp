#pragma once

/// @file task_pool.hpp
/// @brief Worker pool and cooperative cancellation for background work

#include "fwd.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace relic_core {

// =============================================================================
// CancellationToken
// =============================================================================

/// Shared cancellation flag. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken()
        : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    /// Request cancellation
    void cancel() const noexcept { m_flag->store(true, std::memory_order_release); }

    /// Check if cancellation was requested
    [[nodiscard]] bool is_cancelled() const noexcept {
        return m_flag->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

// =============================================================================
// TaskPool
// =============================================================================

/// Fixed-size worker pool.
///
/// A pool created with zero threads runs nothing on its own: queued tasks
/// execute on the caller thread inside run_pending(). This keeps the same
/// submission path usable for single-threaded hosts and deterministic tests.
class TaskPool {
public:
    using Task = std::function<void()>;

    /// Create pool with specified number of worker threads
    explicit TaskPool(std::size_t num_threads = 4);

    /// Destructor - drains the queue and joins workers
    ~TaskPool();

    // Non-copyable, non-movable
    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /// Submit a task for execution
    void submit(Task task);

    /// Submit a task and get a future for the result
    template<typename F, typename R = std::invoke_result_t<F>>
    [[nodiscard]] std::future<R> submit_with_result(F&& func) {
        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();

        submit([promise, func = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    func();
                    promise->set_value();
                } else {
                    promise->set_value(func());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

        return future;
    }

    /// Run queued tasks on the calling thread until the queue is empty.
    /// Returns the number of tasks executed.
    std::size_t run_pending();

    /// Number of worker threads (0 = inline mode)
    [[nodiscard]] std::size_t thread_count() const noexcept { return m_threads.size(); }

    /// Get number of queued or running tasks
    [[nodiscard]] std::size_t pending_count() const;

    /// Wait for all tasks to complete. In inline mode this runs them.
    void wait_all();

private:
    void worker_thread();
    void finish_one();

    std::vector<std::thread> m_threads;
    std::deque<Task> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_done_condition;
    std::atomic<std::size_t> m_pending{0};
    bool m_stop = false;
};

} // namespace relic_core
