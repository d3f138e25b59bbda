#include <segmented_stream_platform/ssp_thread_pool.h>

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(sspPool, "ssp.pool")

namespace {
template<typename F>
struct ScopeExit {
    F fn;
    ~ScopeExit() { fn(); }
};
template<typename F>
ScopeExit<F> make_scope_exit(F fn) { return {std::move(fn)}; }
} // namespace

namespace ssp {

GenerationalThreadPool::GenerationalThreadPool(int threads) {
    int count = std::max(1, threads);
    for (int i = 0; i < count; ++i) {
        m_threads.emplace_back(&GenerationalThreadPool::worker_loop, this);
    }
    qCDebug(sspPool, "Started %d pool threads", count);
}

GenerationalThreadPool::~GenerationalThreadPool() {
    Shutdown();
}

std::shared_ptr<GenerationalThreadPool::GroupCounter>
GenerationalThreadPool::group_counter(int64_t group_id) {
    std::lock_guard<std::mutex> lock(m_groups_mutex);
    auto it = m_groups.find(group_id);
    return it != m_groups.end() ? it->second : nullptr;
}

void GenerationalThreadPool::increment(int64_t group_id) {
    // Lock order: m_groups_mutex, then the counter (same as decrement)
    std::lock_guard<std::mutex> groups_lock(m_groups_mutex);
    auto& counter = m_groups[group_id];
    if (!counter) {
        counter = std::make_shared<GroupCounter>();
    }
    std::lock_guard<std::mutex> lock(counter->mutex);
    ++counter->count;
}

void GenerationalThreadPool::decrement(int64_t group_id) {
    auto counter = group_counter(group_id);
    if (!counter) {
        qCCritical(sspPool, "decrement: group %lld has no counter", static_cast<long long>(group_id));
        return;
    }

    bool retired = false;
    {
        std::lock_guard<std::mutex> lock(counter->mutex);
        if (counter->count <= 0) {
            qCCritical(sspPool, "decrement: group %lld counter already zero", static_cast<long long>(group_id));
            return;
        }
        --counter->count;
        retired = counter->count == 0;
    }

    if (retired) {
        {
            // Keep the entry if new work arrived for the group meanwhile
            std::lock_guard<std::mutex> groups_lock(m_groups_mutex);
            std::lock_guard<std::mutex> lock(counter->mutex);
            auto it = m_groups.find(group_id);
            if (counter->count == 0 && it != m_groups.end() && it->second == counter) {
                m_groups.erase(it);
            }
        }
        counter->drained_cv.notify_all();
    }
}

Result<void> GenerationalThreadPool::Submit(Task fn, int64_t group_id) {
    std::lock_guard<std::mutex> submit_lock(m_submit_mutex);
    if (m_shutdown) {
        return Error::work_rejected("cannot schedule new work after shutdown");
    }
    if (group_id != m_active.load()) {
        return Error::work_rejected("group " + std::to_string(group_id) +
                                    " is not the active generation " +
                                    std::to_string(m_active.load()));
    }

    increment(group_id);
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queue.push_back(WorkItem{group_id, std::move(fn)});
    }
    m_queue_cv.notify_one();
    return Result<void>();
}

bool GenerationalThreadPool::SetActiveGeneration(int64_t new_id, bool wait_drain, Timeout timeout) {
    int64_t prev;
    {
        std::lock_guard<std::mutex> submit_lock(m_submit_mutex);
        if (m_shutdown) {
            return false;
        }
        prev = m_active.load();
        m_previous.store(prev);
        m_active.store(new_id);
    }
    qCDebug(sspPool, "Active generation %lld -> %lld", static_cast<long long>(prev),
            static_cast<long long>(new_id));

    if (!wait_drain) {
        return true;
    }
    return WaitDrained(prev, timeout);
}

bool GenerationalThreadPool::WaitDrained(int64_t group_id, Timeout timeout) {
    auto counter = group_counter(group_id);
    if (!counter) {
        return true;
    }
    std::unique_lock<std::mutex> lock(counter->mutex);
    auto drained = [&counter] { return counter->count == 0; };
    if (timeout) {
        return counter->drained_cv.wait_for(lock, *timeout, drained);
    }
    counter->drained_cv.wait(lock, drained);
    return true;
}

int64_t GenerationalThreadPool::Outstanding(int64_t group_id) const {
    std::shared_ptr<GroupCounter> counter;
    {
        std::lock_guard<std::mutex> lock(m_groups_mutex);
        auto it = m_groups.find(group_id);
        if (it == m_groups.end()) {
            return 0;
        }
        counter = it->second;
    }
    std::lock_guard<std::mutex> lock(counter->mutex);
    return counter->count;
}

void GenerationalThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> submit_lock(m_submit_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        m_previous.store(m_active.load());
        m_active.store(kShutdownGeneration);
    }
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_stop_workers = true;
    }
    m_queue_cv.notify_all();

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    qCDebug(sspPool, "Pool shut down");
}

void GenerationalThreadPool::worker_loop() {
    while (true) {
        WorkItem item;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait(lock, [this] { return m_stop_workers || !m_queue.empty(); });
            // Queued items still run after shutdown so their counters drain
            if (m_queue.empty()) break;
            item = std::move(m_queue.front());
            m_queue.pop_front();
        }

        int64_t group_id = item.group_id;
        auto done = make_scope_exit([this, group_id]() { decrement(group_id); });
        if (item.fn) {
            item.fn();
        }
    }
}

} // namespace ssp
