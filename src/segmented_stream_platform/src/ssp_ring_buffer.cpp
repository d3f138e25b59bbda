#include <segmented_stream_platform/ssp_ring_buffer.h>

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(sspBuffer, "ssp.buffer")

namespace ssp {

RingBuffer::RingBuffer(size_t capacity)
    : m_capacity(capacity) {
}

RingBuffer::~RingBuffer() {
    Close();
}

size_t RingBuffer::free_locked() const {
    return m_length >= m_capacity ? 0 : m_capacity - m_length;
}

void RingBuffer::write_piece_locked(const uint8_t* data, size_t len) {
    Chunk chunk;
    chunk.data.assign(data, data + len);
    m_chunks.push_back(std::move(chunk));
    m_length += len;
}

void RingBuffer::Write(const uint8_t* data, size_t len) {
    size_t written = 0;
    while (written < len) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_free_cv.wait(lock, [this] { return m_closed || free_locked() > 0; });
        if (m_closed) {
            return;
        }

        size_t piece = std::min(free_locked(), len - written);
        write_piece_locked(data + written, piece);
        written += piece;
        lock.unlock();
        m_used_cv.notify_all();
    }
}

void RingBuffer::Write(const uint8_t* data, size_t len, int64_t /*sequence*/) {
    Write(data, len);
}

Result<Bytes> RingBuffer::Read(size_t max_size, bool block, Timeout timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);

    if (block && !m_closed && m_length == 0) {
        auto ready = [this] { return m_closed || m_length > 0; };
        if (timeout) {
            m_used_cv.wait_for(lock, *timeout, ready);
        } else {
            m_used_cv.wait(lock, ready);
        }
        if (m_length == 0 && !m_closed) {
            return Error::read_timeout();
        }
    }

    Bytes out;
    out.reserve(std::min(max_size, m_length));
    while (out.size() < max_size && !m_chunks.empty()) {
        Chunk& front = m_chunks.front();
        size_t take = std::min(front.remaining(), max_size - out.size());
        auto begin = front.data.begin() + static_cast<std::ptrdiff_t>(front.offset);
        out.insert(out.end(), begin, begin + static_cast<std::ptrdiff_t>(take));
        front.offset += take;
        m_length -= take;
        if (front.remaining() == 0) {
            m_chunks.pop_front();
        }
    }

    lock.unlock();
    if (!out.empty()) {
        m_free_cv.notify_all();
    }
    return out;
}

void RingBuffer::Close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
    }
    qCDebug(sspBuffer, "RingBuffer closed with %zu bytes buffered", Length());
    m_free_cv.notify_all();
    m_used_cv.notify_all();
}

size_t RingBuffer::Length() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_length;
}

size_t RingBuffer::Capacity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capacity;
}

size_t RingBuffer::Free() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return free_locked();
}

bool RingBuffer::IsFull() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return free_locked() == 0;
}

bool RingBuffer::IsClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

bool RingBuffer::WaitFree(Timeout timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto ready = [this] { return m_closed || free_locked() > 0; };
    if (timeout) {
        return m_free_cv.wait_for(lock, *timeout, ready);
    }
    m_free_cv.wait(lock, ready);
    return true;
}

bool RingBuffer::WaitUsed(Timeout timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto ready = [this] { return m_closed || m_length > 0; };
    if (timeout) {
        return m_used_cv.wait_for(lock, *timeout, ready);
    }
    m_used_cv.wait(lock, ready);
    return true;
}

void RingBuffer::Resize(size_t capacity) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_capacity = capacity;
    }
    m_free_cv.notify_all();
}

} // namespace ssp
