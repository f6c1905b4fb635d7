/// @file task_pool.cpp
/// @brief TaskPool implementation

#include <relic/core/task_pool.hpp>

namespace relic_core {

TaskPool::TaskPool(std::size_t num_threads) {
    m_threads.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        m_threads.emplace_back(&TaskPool::worker_thread, this);
    }
}

TaskPool::~TaskPool() {
    if (m_threads.empty()) {
        run_pending();
        return;
    }

    {
        std::lock_guard lock(m_mutex);
        m_stop = true;
    }
    m_condition.notify_all();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void TaskPool::submit(Task task) {
    {
        std::lock_guard lock(m_mutex);
        m_tasks.push_back(std::move(task));
        ++m_pending;
    }
    m_condition.notify_one();
}

std::size_t TaskPool::run_pending() {
    std::size_t executed = 0;
    while (true) {
        Task task;
        {
            std::lock_guard lock(m_mutex);
            if (m_tasks.empty()) {
                break;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }

        task();
        finish_one();
        ++executed;
    }
    return executed;
}

std::size_t TaskPool::pending_count() const {
    return m_pending.load();
}

void TaskPool::wait_all() {
    if (m_threads.empty()) {
        // Tasks may enqueue follow-up work
        while (run_pending() > 0) {
        }
        return;
    }

    std::unique_lock lock(m_mutex);
    m_done_condition.wait(lock, [this] {
        return m_pending == 0;
    });
}

void TaskPool::finish_one() {
    {
        std::lock_guard lock(m_mutex);
        --m_pending;
    }
    m_done_condition.notify_all();
}

void TaskPool::worker_thread() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(m_mutex);
            m_condition.wait(lock, [this] {
                return m_stop || !m_tasks.empty();
            });

            if (m_stop && m_tasks.empty()) {
                return;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }

        task();
        finish_one();
    }
}

} // namespace relic_core
