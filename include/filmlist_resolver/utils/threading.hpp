#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <semaphore>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace filmlist_resolver {
namespace utils {

enum class ThreadPoolError {
    Shutdown
};

template<typename F>
concept Callable = std::is_invocable_v<F>;

// Fixed-size worker pool; tasks run in submission order
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Exceptions thrown by the task are stored in the returned future
    template<Callable F>
    auto try_submit(F&& f) -> std::expected<std::future<std::invoke_result_t<F>>, ThreadPoolError>;

    // Runs the queued tasks to completion, then joins the workers
    void shutdown();

    size_t size() const { return m_workers.size(); }

private:
    std::vector<std::jthread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    mutable std::mutex m_queue_mutex;
    std::condition_variable m_condition;
    bool m_shutdown = false;

    void worker_thread(std::stop_token stop_token);
};

template<Callable F>
auto ThreadPool::try_submit(F&& f) -> std::expected<std::future<std::invoke_result_t<F>>, ThreadPoolError> {
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::forward<F>(f)
    );

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(m_queue_mutex);

        if (m_shutdown) {
            return std::unexpected(ThreadPoolError::Shutdown);
        }

        m_tasks.emplace([task]() { (*task)(); });
    }
    m_condition.notify_one();
    return res;
}

/**
 * @brief Counting admission gate bounding the number of concurrent holders
 *
 * acquire() blocks until a slot is free and returns a Slot that gives the
 * slot back when destroyed, so every exit path of the holder releases it.
 */
class AdmissionGate {
public:
    class Slot {
    public:
        Slot(Slot&& other) noexcept : m_gate(std::exchange(other.m_gate, nullptr)) {}
        Slot& operator=(Slot&&) = delete;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot();

    private:
        friend class AdmissionGate;
        explicit Slot(AdmissionGate* gate) : m_gate(gate) {}

        AdmissionGate* m_gate;
    };

    explicit AdmissionGate(size_t capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    [[nodiscard]] Slot acquire();

    size_t capacity() const { return m_capacity; }
    size_t in_flight() const { return m_in_flight.load(); }
    size_t peak_in_flight() const { return m_peak.load(); }

private:
    void release();

    size_t m_capacity;
    std::counting_semaphore<> m_semaphore;
    std::atomic<size_t> m_in_flight{0};
    std::atomic<size_t> m_peak{0};
};

} // namespace utils
} // namespace filmlist_resolver
