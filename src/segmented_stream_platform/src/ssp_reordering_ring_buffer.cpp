#include <segmented_stream_platform/ssp_reordering_ring_buffer.h>

#include <QLoggingCategory>

#include <algorithm>

Q_DECLARE_LOGGING_CATEGORY(sspBuffer)

namespace {
// Stall checks also run on this interval while a reader waits
constexpr std::chrono::milliseconds kStallCheckInterval(200);
} // namespace

namespace ssp {

ReorderingRingBuffer::ReorderingRingBuffer(size_t capacity, const ReorderPolicy& policy)
    : m_policy(policy)
    , m_capacity(capacity) {
}

ReorderingRingBuffer::~ReorderingRingBuffer() {
    Close();
}

size_t ReorderingRingBuffer::free_locked() const {
    return m_length >= m_capacity ? 0 : m_capacity - m_length;
}

std::optional<int64_t> ReorderingRingBuffer::head_sequence_locked() const {
    if (m_current) {
        return m_current->sequence;
    }
    if (m_chunks.empty()) {
        return std::nullopt;
    }
    return m_chunks.begin()->first;
}

bool ReorderingRingBuffer::head_blocked_by_writer_locked() const {
    auto head = head_sequence_locked();
    return head && !m_open_sequences.empty() && *m_open_sequences.begin() < *head;
}

bool ReorderingRingBuffer::may_write_locked(int64_t sequence) const {
    if (free_locked() > 0) {
        return true;
    }
    // Full, but the reader is stuck behind this sequence: let it through
    if (m_open_sequences.empty() || *m_open_sequences.begin() != sequence) {
        return false;
    }
    auto head = head_sequence_locked();
    return !head || *head > sequence;
}

// A hole between two held sequences that no open writer is going to fill
bool ReorderingRingBuffer::has_lost_gap_locked() {
    std::optional<int64_t> prev;
    if (m_current) {
        prev = m_current->sequence;
    }
    for (auto it = m_chunks.begin(); it != m_chunks.end(); it = m_chunks.upper_bound(it->first)) {
        int64_t seq = it->first;
        if (prev && seq > *prev + 1) {
            int64_t missing = seq - *prev - 1;
            if (missing > static_cast<int64_t>(m_open_sequences.size() + m_lost_sequences.size())) {
                return true;
            }
            for (int64_t n = *prev + 1; n < seq; ++n) {
                if (m_open_sequences.count(n) == 0 && m_lost_sequences.count(n) == 0) {
                    return true;
                }
            }
        }
        prev = seq;
    }
    return false;
}

// Head continues the released data, possibly across known lost sequences
bool ReorderingRingBuffer::follows_released_locked(int64_t head) const {
    if (!m_last_released) {
        return false;
    }
    for (int64_t n = *m_last_released + 1; n < head; ++n) {
        if (m_lost_sequences.count(n) == 0) {
            return false;
        }
    }
    return true;
}

void ReorderingRingBuffer::drop_oldest_locked() {
    if (m_chunks.empty()) {
        return;
    }
    int64_t seq = m_chunks.begin()->first;
    if (m_open_sequences.count(seq) > 0) {
        return;
    }

    auto range = m_chunks.equal_range(seq);
    size_t bytes = 0;
    size_t chunks = 0;
    for (auto it = range.first; it != range.second; ++it) {
        bytes += it->second.remaining();
        ++chunks;
    }
    m_chunks.erase(range.first, range.second);
    m_length -= bytes;
    m_chunk_count -= chunks;
    ++m_dropped;

    qCWarning(sspBuffer, "Reorder stall: dropping sequence %lld (%zu chunks, %zu bytes) to resync",
              static_cast<long long>(seq), chunks, bytes);
}

bool ReorderingRingBuffer::releasable_locked() {
    if (!head_sequence_locked()) {
        return false;
    }
    if (m_closed) {
        return true;
    }
    if (head_blocked_by_writer_locked()) {
        return false;
    }
    if (m_current) {
        return true;
    }
    // A full buffer must drain or nobody makes progress
    if (free_locked() == 0) {
        return true;
    }
    if (!has_lost_gap_locked()) {
        if (m_chunk_count < static_cast<size_t>(m_policy.min_segments) &&
            !follows_released_locked(*head_sequence_locked())) {
            return false;
        }
        m_pending_checks = 0;
        return true;
    }
    if (m_chunk_count < static_cast<size_t>(m_policy.min_segments)) {
        return false;
    }

    if (m_chunk_count > static_cast<size_t>(m_policy.stall_segment_threshold) &&
        m_pending_checks > m_policy.stall_check_threshold) {
        drop_oldest_locked();
        m_pending_checks = 0;
        m_free_cv.notify_all();
        return releasable_locked();
    }
    ++m_pending_checks;
    return false;
}

void ReorderingRingBuffer::Write(const uint8_t* data, size_t len) {
    int64_t sequence;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sequence = m_last_sequence;
    }
    Write(data, len, sequence);
}

void ReorderingRingBuffer::Write(const uint8_t* data, size_t len, int64_t sequence) {
    size_t written = 0;
    while (written < len) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_free_cv.wait(lock, [this, sequence] { return m_closed || may_write_locked(sequence); });
        if (m_closed) {
            return;
        }

        size_t free = free_locked();
        size_t piece = free > 0 ? std::min(free, len - written) : len - written;

        Chunk chunk;
        chunk.sequence = sequence;
        chunk.data.assign(data + written, data + written + piece);
        m_chunks.emplace(sequence, std::move(chunk));
        auto open = m_open_bytes.find(sequence);
        if (open != m_open_bytes.end()) {
            open->second += piece;
        }
        m_length += piece;
        ++m_chunk_count;
        m_last_sequence = std::max(m_last_sequence, sequence);
        written += piece;

        lock.unlock();
        m_used_cv.notify_all();
    }
}

Result<Bytes> ReorderingRingBuffer::Read(size_t max_size, bool block, Timeout timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);

    bool ready = releasable_locked();
    if (!ready && block && !m_closed) {
        // Bounded waits so the stall policy advances without writer activity
        auto pred = [this] { return m_closed || releasable_locked(); };
        auto deadline = timeout ? std::chrono::steady_clock::now() + *timeout
                                : std::chrono::steady_clock::time_point::max();
        while (!ready) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return Error::read_timeout();
            }
            auto wait = kStallCheckInterval;
            if (timeout) {
                wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                                          std::chrono::milliseconds(1));
            }
            ready = m_used_cv.wait_for(lock, wait, pred);
        }
    }

    Bytes out;
    if (!ready && !m_closed) {
        return out;
    }

    while (out.size() < max_size) {
        if (!m_current) {
            if (m_chunks.empty()) {
                break;
            }
            auto it = m_chunks.begin();
            if (!m_closed && !m_open_sequences.empty() && it->first > *m_open_sequences.begin()) {
                break;
            }
            m_current = std::move(it->second);
            m_chunks.erase(it);
            m_last_released = m_current->sequence;
            m_lost_sequences.erase(m_lost_sequences.begin(),
                                   m_lost_sequences.upper_bound(*m_last_released));
        }

        size_t take = std::min(m_current->remaining(), max_size - out.size());
        auto begin = m_current->data.begin() + static_cast<std::ptrdiff_t>(m_current->offset);
        out.insert(out.end(), begin, begin + static_cast<std::ptrdiff_t>(take));
        m_current->offset += take;
        m_length -= take;
        if (m_current->remaining() == 0) {
            m_current.reset();
            --m_chunk_count;
        }
    }

    lock.unlock();
    if (!out.empty()) {
        m_free_cv.notify_all();
    }
    return out;
}

void ReorderingRingBuffer::Close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
    }
    m_free_cv.notify_all();
    m_used_cv.notify_all();
}

void ReorderingRingBuffer::BeginSequence(int64_t sequence) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open_sequences.insert(sequence);
    m_open_bytes.emplace(sequence, 0);
}

void ReorderingRingBuffer::EndSequence(int64_t sequence) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_open_sequences.find(sequence);
        if (it != m_open_sequences.end()) {
            m_open_sequences.erase(it);
        }
        if (m_open_sequences.count(sequence) == 0) {
            auto bytes = m_open_bytes.find(sequence);
            if (bytes != m_open_bytes.end()) {
                if (bytes->second == 0 && (!m_last_released || sequence > *m_last_released)) {
                    qCDebug(sspBuffer, "Sequence %lld ended without data", static_cast<long long>(sequence));
                    m_lost_sequences.insert(sequence);
                }
                m_open_bytes.erase(bytes);
            }
        }
    }
    m_used_cv.notify_all();
    m_free_cv.notify_all();
}

size_t ReorderingRingBuffer::Length() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_length;
}

size_t ReorderingRingBuffer::Capacity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capacity;
}

bool ReorderingRingBuffer::IsClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

bool ReorderingRingBuffer::WaitFree(Timeout timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto ready = [this] { return m_closed || free_locked() > 0; };
    if (timeout) {
        return m_free_cv.wait_for(lock, *timeout, ready);
    }
    m_free_cv.wait(lock, ready);
    return true;
}

size_t ReorderingRingBuffer::ChunkCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_chunk_count;
}

int64_t ReorderingRingBuffer::DroppedSequences() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

} // namespace ssp
