#include "filmlist_resolver/utils/threading.hpp"

#include <algorithm>

namespace filmlist_resolver {
namespace utils {

ThreadPool::ThreadPool(size_t num_threads) {
    num_threads = std::max<size_t>(num_threads, 1);
    m_workers.reserve(num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.emplace_back([this](std::stop_token stop_token) {
            worker_thread(stop_token);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(m_queue_mutex);
        m_shutdown = true;
    }

    m_condition.notify_all();

    // Join without requesting stop so queued tasks still run
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

void ThreadPool::worker_thread(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        std::function<void()> task;

        {
            std::unique_lock lock(m_queue_mutex);
            m_condition.wait(lock, [this, &stop_token] {
                return !m_tasks.empty() || m_shutdown || stop_token.stop_requested();
            });

            if (m_tasks.empty()) {
                if (m_shutdown || stop_token.stop_requested()) {
                    break;
                }
                continue;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        // packaged_task stores any exception in its future
        task();
    }
}

// AdmissionGate implementation
AdmissionGate::AdmissionGate(size_t capacity)
    : m_capacity(std::max<size_t>(capacity, 1))
    , m_semaphore(static_cast<std::ptrdiff_t>(m_capacity)) {
}

AdmissionGate::Slot AdmissionGate::acquire() {
    m_semaphore.acquire();

    const size_t now = m_in_flight.fetch_add(1) + 1;
    size_t peak = m_peak.load();
    while (now > peak && !m_peak.compare_exchange_weak(peak, now)) {
    }

    return Slot(this);
}

void AdmissionGate::release() {
    m_in_flight.fetch_sub(1);
    m_semaphore.release();
}

AdmissionGate::Slot::~Slot() {
    if (m_gate) {
        m_gate->release();
    }
}

} // namespace utils
} // namespace filmlist_resolver
