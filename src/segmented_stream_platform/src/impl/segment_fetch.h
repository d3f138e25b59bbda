#pragma once

#include <segmented_stream_platform/ssp_http.h>
#include <segmented_stream_platform/ssp_ring_buffer.h>
#include <segmented_stream_platform/ssp_segment.h>
#include <segmented_stream_platform/ssp_thread_pool.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ssp {
namespace impl {

struct FetchSettings {
    int32_t attempts = 3;
    std::chrono::milliseconds timeout{10000};
    std::map<std::string, std::string> headers;
    size_t buffer_size = 2 * 1024 * 1024;
};

// Download of one segment, run on the generational pool and consumed by a
// writer. Bytes stream through a private RingBuffer so the writer can start
// before the transfer ends. The transfer stops as soon as the segment's
// group is no longer the active generation or Cancel() is called.
// Failed attempts are retried from the first byte not yet delivered.
class SegmentFetch {
public:
    SegmentFetch(Segment segment, std::shared_ptr<HttpClient> http,
                 const GenerationalThreadPool& pool, FetchSettings settings);

    SegmentFetch(const SegmentFetch&) = delete;
    SegmentFetch& operator=(const SegmentFetch&) = delete;

    // Pool thread entry point
    void Run();

    // Next downloaded bytes; empty once the download ended (see failure())
    Result<Bytes> Read(size_t max_size, Timeout timeout);

    // Abort the transfer and unblock both sides
    void Cancel();

    bool IsStale() const;
    std::optional<Error> failure() const;

private:
    HttpRequest make_request() const;

    const Segment m_segment;
    std::shared_ptr<HttpClient> m_http;
    const GenerationalThreadPool& m_pool;
    const FetchSettings m_settings;

    RingBuffer m_buffer;
    std::atomic<bool> m_cancelled{false};
    std::atomic<int64_t> m_delivered{0};

    mutable std::mutex m_mutex;
    std::optional<Error> m_error;
};

// AES keys by URI, fetched once per stream
class KeyCache {
public:
    explicit KeyCache(std::shared_ptr<HttpClient> http, FetchSettings settings);

    Result<Bytes> get(const std::string& uri);

private:
    std::shared_ptr<HttpClient> m_http;
    FetchSettings m_settings;

    std::mutex m_mutex;
    std::map<std::string, Bytes> m_keys;
};

} // namespace impl
} // namespace ssp
