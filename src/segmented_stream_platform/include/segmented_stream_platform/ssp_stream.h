#pragma once

#include "ssp_errors.h"
#include "ssp_ring_buffer.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ssp {

// Closed set of stream variants
enum class StreamType {
    SegmentedHttp,
    Hls,
    Process
};

inline const char* stream_type_to_string(StreamType type) {
    switch (type) {
        case StreamType::SegmentedHttp: return "http";
        case StreamType::Hls:           return "hls";
        case StreamType::Process:       return "process";
    }
    return "unknown";
}

enum class StreamState {
    Running,
    SeekPending,
    PausedForRestart,
    Closed
};

inline const char* stream_state_to_string(StreamState state) {
    switch (state) {
        case StreamState::Running:          return "Running";
        case StreamState::SeekPending:      return "SeekPending";
        case StreamState::PausedForRestart: return "PausedForRestart";
        case StreamState::Closed:           return "Closed";
    }
    return "Unknown";
}

// Consumer side of an open stream
class StreamReader {
public:
    virtual ~StreamReader() = default;

    // Up to n bytes. Empty result means end of stream; a fatal stream
    // error is returned once everything buffered before it was read.
    virtual Result<Bytes> Read(size_t n) = 0;

    // Reposition to byte offset. Unsupported unless SupportsSeek().
    virtual Result<void> Seek(int64_t position) = 0;

    virtual bool SupportsSeek() const = 0;
    virtual std::optional<int64_t> CompleteLength() const = 0;
    virtual StreamState State() const = 0;

    // Stop all threads. Idempotent.
    virtual void Close() = 0;
};

class Stream {
public:
    virtual ~Stream() = default;

    virtual StreamType type() const = 0;

    // Human readable source ("hls https://...")
    virtual std::string describe() const = 0;

    virtual Result<std::unique_ptr<StreamReader>> Open() = 0;
};

} // namespace ssp
