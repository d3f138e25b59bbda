#pragma once

#include "ssp_errors.h"
#include "ssp_ring_buffer.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ssp {

// Fixed-size thread pool whose work items belong to a "generation" (work
// group). Only the active generation accepts new work. Advancing the
// generation is how in-flight work is cancelled: items check IsCurrent()
// with their own group id and bail out once they are stale.
class GenerationalThreadPool {
public:
    using Task = std::function<void()>;

    // Reserved generation used after Shutdown(); never accepts work
    static constexpr int64_t kShutdownGeneration = -2;

    explicit GenerationalThreadPool(int threads);
    ~GenerationalThreadPool();

    GenerationalThreadPool(const GenerationalThreadPool&) = delete;
    GenerationalThreadPool& operator=(const GenerationalThreadPool&) = delete;

    // WorkRejected unless group_id is the active generation
    Result<void> Submit(Task fn, int64_t group_id);

    // Move the active pointer to new_id. With wait_drain, block until the
    // previous generation has no outstanding items; false on timeout.
    bool SetActiveGeneration(int64_t new_id, bool wait_drain, Timeout timeout = std::nullopt);

    // Block until group_id has no outstanding items; false on timeout
    bool WaitDrained(int64_t group_id, Timeout timeout);

    bool IsCurrent(int64_t group_id) const { return m_active.load() == group_id; }
    int64_t ActiveGeneration() const { return m_active.load(); }
    int64_t PreviousGeneration() const { return m_previous.load(); }

    // Queued plus running items of group_id
    int64_t Outstanding(int64_t group_id) const;

    int ThreadCount() const { return static_cast<int>(m_threads.size()); }

    // Reject new work, let queued items run (they see themselves stale),
    // join all threads. Idempotent.
    void Shutdown();

private:
    // One lock + condition per generation
    struct GroupCounter {
        std::mutex mutex;
        std::condition_variable drained_cv;
        int64_t count = 0;
    };

    struct WorkItem {
        int64_t group_id;
        Task fn;
    };

    std::shared_ptr<GroupCounter> group_counter(int64_t group_id);
    void increment(int64_t group_id);
    void decrement(int64_t group_id);
    void worker_loop();

    std::atomic<int64_t> m_active{0};
    std::atomic<int64_t> m_previous{-1};

    // Serializes Submit against generation changes and shutdown
    std::mutex m_submit_mutex;
    bool m_shutdown = false;

    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::deque<WorkItem> m_queue;
    bool m_stop_workers = false;

    mutable std::mutex m_groups_mutex;
    std::map<int64_t, std::shared_ptr<GroupCounter>> m_groups;

    std::vector<std::thread> m_threads;
};

} // namespace ssp
