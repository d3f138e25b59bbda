#pragma once

#include "ssp_options.h"
#include "ssp_ring_buffer.h"

#include <map>
#include <optional>
#include <set>

namespace ssp {

// Bounded byte buffer that releases data in ascending segment sequence
// order. Used when several writer threads finish segments out of order.
//
// Release gate ("pending"): nothing is readable until policy.min_segments
// chunks are held and the held sequence range has no holes. Holes that
// belong to a sequence still being written, or to one that ended without
// writing anything, do not count. Data that directly continues what the
// reader already got is released without waiting for min_segments. A hole
// that survives too long is treated as a lost segment and the oldest held
// sequence is dropped (see ReorderPolicy). Blocked readers re-check this
// periodically, so a stall resolves even when no writer is active.
class ReorderingRingBuffer : public ByteBuffer {
public:
    ReorderingRingBuffer(size_t capacity, const ReorderPolicy& policy);
    ~ReorderingRingBuffer() override;

    ReorderingRingBuffer(const ReorderingRingBuffer&) = delete;
    ReorderingRingBuffer& operator=(const ReorderingRingBuffer&) = delete;

    // Unsequenced writes are queued behind everything else
    void Write(const uint8_t* data, size_t len) override;
    void Write(const uint8_t* data, size_t len, int64_t sequence) override;
    Result<Bytes> Read(size_t max_size, bool block, Timeout timeout) override;
    void Close() override;

    size_t Length() const override;
    size_t Capacity() const override;
    bool IsClosed() const override;
    bool WaitFree(Timeout timeout) override;

    void BeginSequence(int64_t sequence) override;
    void EndSequence(int64_t sequence) override;

    // Chunks currently held (including a partially consumed one)
    size_t ChunkCount() const;

    // Number of sequences dropped by stall recovery
    int64_t DroppedSequences() const;

private:
    struct Chunk {
        int64_t sequence = 0;
        Bytes data;
        size_t offset = 0;

        size_t remaining() const { return data.size() - offset; }
    };

    // All helpers below require m_mutex
    size_t free_locked() const;
    bool may_write_locked(int64_t sequence) const;
    std::optional<int64_t> head_sequence_locked() const;
    bool head_blocked_by_writer_locked() const;
    bool has_lost_gap_locked();
    bool follows_released_locked(int64_t head) const;
    bool releasable_locked();
    void drop_oldest_locked();

    ReorderPolicy m_policy;

    mutable std::mutex m_mutex;
    std::condition_variable m_free_cv;
    std::condition_variable m_used_cv;

    std::multimap<int64_t, Chunk> m_chunks;   // equal keys keep arrival order
    std::optional<Chunk> m_current;           // partially consumed head chunk
    std::multiset<int64_t> m_open_sequences;  // BeginSequence without EndSequence
    std::map<int64_t, size_t> m_open_bytes;   // bytes written per open sequence
    std::set<int64_t> m_lost_sequences;       // ended without any data
    std::optional<int64_t> m_last_released;   // sequence of the last chunk handed to the reader
    size_t m_length = 0;
    size_t m_capacity;
    size_t m_chunk_count = 0;
    int32_t m_pending_checks = 0;
    int64_t m_dropped = 0;
    int64_t m_last_sequence = 0;             // highest sequence written so far
    bool m_closed = false;
};

} // namespace ssp
