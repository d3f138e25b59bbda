#pragma once

#include "ssp_errors.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ssp {

// std::nullopt = wait indefinitely
using Timeout = std::optional<std::chrono::milliseconds>;

using Bytes = std::vector<uint8_t>;

// Byte sink/source shared by the writer threads and the consumer.
// Both implementations are bounded, block writers while full and
// block readers while empty (or pending, for the reordering variant).
class ByteBuffer {
public:
    virtual ~ByteBuffer() = default;

    // Append data, blocking until capacity frees up. No-op once closed.
    virtual void Write(const uint8_t* data, size_t len) = 0;

    // Append data tagged with a segment sequence number.
    // Plain buffers ignore the sequence.
    virtual void Write(const uint8_t* data, size_t len, int64_t sequence) = 0;

    // Remove up to max_size bytes. With block=true and nothing available,
    // waits up to timeout and fails with ReadTimeout. Returns empty once
    // closed and drained.
    virtual Result<Bytes> Read(size_t max_size, bool block, Timeout timeout) = 0;

    // Idempotent. Wakes every blocked reader and writer.
    virtual void Close() = 0;

    virtual size_t Length() const = 0;
    virtual size_t Capacity() const = 0;
    virtual bool IsClosed() const = 0;

    // Wait until there is free space (or the buffer closed). False on timeout.
    virtual bool WaitFree(Timeout timeout) = 0;

    // Bracket all writes of one segment. Ordered buffers use these to keep
    // the reader from advancing past a segment that is still arriving.
    virtual void BeginSequence(int64_t /*sequence*/) {}
    virtual void EndSequence(int64_t /*sequence*/) {}
};

// Bounded FIFO byte buffer backed by a deque of immutable chunks
class RingBuffer : public ByteBuffer {
public:
    explicit RingBuffer(size_t capacity);
    ~RingBuffer() override;

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    void Write(const uint8_t* data, size_t len) override;
    void Write(const uint8_t* data, size_t len, int64_t sequence) override;
    Result<Bytes> Read(size_t max_size, bool block, Timeout timeout) override;
    void Close() override;

    size_t Length() const override;
    size_t Capacity() const override;
    bool IsClosed() const override;
    bool WaitFree(Timeout timeout) override;

    // Wait until data is buffered (or the buffer closed). False on timeout.
    bool WaitUsed(Timeout timeout);

    size_t Free() const;
    bool IsFull() const;

    // Change capacity; wakes writers if space opened up
    void Resize(size_t capacity);

private:
    struct Chunk {
        Bytes data;
        size_t offset = 0;

        size_t remaining() const { return data.size() - offset; }
    };

    // Caller holds m_mutex
    size_t free_locked() const;
    void write_piece_locked(const uint8_t* data, size_t len);

    mutable std::mutex m_mutex;
    std::condition_variable m_free_cv;
    std::condition_variable m_used_cv;
    std::deque<Chunk> m_chunks;
    size_t m_length = 0;
    size_t m_capacity;
    bool m_closed = false;
};

} // namespace ssp
