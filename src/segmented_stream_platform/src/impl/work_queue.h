#pragma once

#include <segmented_stream_platform/ssp_ring_buffer.h>

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace ssp {
namespace impl {

// Bounded FIFO between the worker and the writers.
// push/pop time out so callers can poll for seek events and shutdown.
template<typename T>
class WorkQueue {
public:
    explicit WorkQueue(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // False on timeout or when closed
    bool push(T item, Timeout timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto ready = [this] { return m_closed || m_items.size() < m_capacity; };
        if (timeout) {
            if (!m_not_full.wait_for(lock, *timeout, ready)) return false;
        } else {
            m_not_full.wait(lock, ready);
        }
        if (m_closed) return false;
        m_items.push_back(std::move(item));
        lock.unlock();
        m_not_empty.notify_one();
        return true;
    }

    // nullopt on timeout or when closed. claim runs under the queue lock,
    // so items are claimed in queue order.
    std::optional<T> pop(Timeout timeout, const std::function<void(const T&)>& claim = {}) {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto ready = [this] { return m_closed || !m_items.empty(); };
        if (timeout) {
            if (!m_not_empty.wait_for(lock, *timeout, ready)) return std::nullopt;
        } else {
            m_not_empty.wait(lock, ready);
        }
        if (m_closed || m_items.empty()) return std::nullopt;

        T item = std::move(m_items.front());
        m_items.pop_front();
        if (claim) claim(item);
        lock.unlock();
        m_not_full.notify_one();
        return item;
    }

    // Remove everything queued
    std::vector<T> drain() {
        std::vector<T> out;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto& item : m_items) out.push_back(std::move(item));
            m_items.clear();
        }
        m_not_full.notify_all();
        return out;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_not_full.notify_all();
        m_not_empty.notify_all();
    }

private:
    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_not_full;
    std::condition_variable m_not_empty;
    std::deque<T> m_items;
    bool m_closed = false;
};

} // namespace impl
} // namespace ssp
