#pragma once

#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

namespace filmlist_resolver::utils {

// Append-only multiset shared between worker threads. Items carry no order.
template<typename T>
class ConcurrentBag {
public:
    ConcurrentBag() = default;

    ConcurrentBag(const ConcurrentBag&) = delete;
    ConcurrentBag& operator=(const ConcurrentBag&) = delete;

    void append(T item) {
        std::lock_guard lock(m_mutex);
        m_items.push_back(std::move(item));
    }

    size_t size() const {
        std::lock_guard lock(m_mutex);
        return m_items.size();
    }

    // Moves everything out; call after all writers have joined
    std::vector<T> drain() {
        std::lock_guard lock(m_mutex);
        return std::exchange(m_items, {});
    }

private:
    mutable std::mutex m_mutex;
    std::vector<T> m_items;
};

} // namespace filmlist_resolver::utils
