#pragma once

#include "ssp_errors.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace ssp {

// Stall-recovery policy for the reordering buffer.
// A gap between the lowest and highest held sequence keeps the buffer
// pending. Once more than stall_segment_threshold chunks are held and the
// gap survived more than stall_check_threshold consecutive checks, the
// oldest chunk is dropped so playback can move on.
struct ReorderPolicy {
    int32_t min_segments;             // chunks required before anything is released (default 3)
    int32_t stall_segment_threshold;  // default 10
    int32_t stall_check_threshold;    // default 2
};

// Options read by every stream component. Built once by the caller and
// passed by const reference; nothing in SSP keeps a global copy.
struct StreamOptions {
    int64_t ringbuffer_size;                       // bytes
    int64_t segment_size;                          // HTTP byte-range slice size
    int32_t segment_attempts;                      // fetch attempts per segment
    std::chrono::milliseconds segment_timeout;     // connect + transfer stall timeout
    int32_t segment_threads;                       // fetch pool threads
    int32_t writer_threads;                        // parallel writer threads
    int32_t work_queue_size;                       // queued segments per stream
    int32_t hls_live_edge;                         // segments from the live edge
    std::chrono::milliseconds hls_timeout;         // HLS buffer read timeout
    std::chrono::milliseconds http_stream_timeout; // HTTP buffer read timeout
    int32_t seek_meta_threads;                     // parallel HEAD requests
    std::chrono::milliseconds seek_meta_timeout;   // per HEAD request
    std::chrono::milliseconds seek_timeout;        // Reader::Seek round trip
    ReorderPolicy reorder;
    std::string user_agent;
    std::map<std::string, std::string> http_headers;
};

StreamOptions default_options();

// Reject option sets the engine cannot run with (non-positive sizes, counts)
Result<void> validate_options(const StreamOptions& options);

// Parse "16M", "512K", "1024" into bytes
Result<int64_t> parse_file_size(const std::string& text);

// Overlay a JSON object onto base. Keys follow the long CLI option names:
// "ringbuffer-size", "stream-segment-size", "stream-segment-attempts",
// "stream-segment-timeout", "stream-segment-threads", "stream-writer-threads",
// "hls-live-edge", "hls-timeout", "http-stream-timeout", "http-header", ...
// Timeouts are given in seconds.
Result<StreamOptions> parse_options_json(const std::string& json_text, const StreamOptions& base);

// Read a JSON options file and overlay it onto base
Result<StreamOptions> load_options_file(const std::string& path, const StreamOptions& base);

} // namespace ssp
