#pragma once

#include "ssp_errors.h"
#include "ssp_http.h"
#include "ssp_options.h"
#include "ssp_segment.h"
#include "ssp_stream.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace ssp {

// Message kinds of the seek protocol
namespace msg {
constexpr const char* kSeekEvent = "seek_event";
constexpr const char* kWaitingOnRestart = "waiting_on_restart";
constexpr const char* kRestart = "restart";
} // namespace msg

// Mailbox names
namespace mailbox {
constexpr const char* kReader = "reader";
constexpr const char* kWorker = "worker";
constexpr const char* kSeekCoordinator = "seek_coordinator";
std::string writer(int index);
} // namespace mailbox

// Produces the segment sequence of one stream. Driven by the worker thread
// only; Prepare() runs before any thread starts.
class SegmentSource {
public:
    struct Next {
        enum class Kind { Segment, Wait, End };

        Kind kind = Kind::End;
        Segment segment;                     // Kind::Segment
        std::chrono::milliseconds wait{0};   // Kind::Wait (reload delay)

        static Next make_segment(Segment s) { Next n; n.kind = Kind::Segment; n.segment = std::move(s); return n; }
        static Next make_wait(std::chrono::milliseconds d) { Next n; n.kind = Kind::Wait; n.wait = d; return n; }
        static Next make_end() { return Next(); }
    };

    virtual ~SegmentSource() = default;

    // Fetch whatever metadata the source needs (HEAD, first playlist)
    virtual Result<void> Prepare() = 0;

    virtual Result<Next> NextSegment() = 0;

    // Continue from byte offset. Only called when SupportsSeek().
    virtual Result<void> SeekTo(int64_t offset) = 0;

    virtual bool SupportsSeek() const = 0;
    virtual std::optional<int64_t> CompleteLength() const = 0;

    // Live sources drop segments that fail; on-demand sources fail the stream
    virtual bool IsLive() const = 0;

    // Consumer read timeout for this kind of stream
    virtual std::chrono::milliseconds ReadTimeout() const = 0;
};

// Reader of a segmented stream: one worker thread producing segments, one or
// more writer threads streaming fetched segments into the buffer and, for
// seekable sources, a seek coordinator.
class SegmentedStreamReader : public StreamReader {
public:
    // Prepares the source and starts all threads
    static Result<std::unique_ptr<SegmentedStreamReader>> Start(std::unique_ptr<SegmentSource> source,
                                                                std::shared_ptr<HttpClient> http,
                                                                const StreamOptions& options,
                                                                const std::string& name);
    ~SegmentedStreamReader() override;

    SegmentedStreamReader(const SegmentedStreamReader&) = delete;
    SegmentedStreamReader& operator=(const SegmentedStreamReader&) = delete;

    Result<Bytes> Read(size_t n) override;
    Result<void> Seek(int64_t position) override;
    bool SupportsSeek() const override;
    std::optional<int64_t> CompleteLength() const override;
    StreamState State() const override;
    void Close() override;

    // Live segments given up after all attempts
    int64_t DroppedSegments() const;

    struct Impl;

private:
    SegmentedStreamReader();

    std::unique_ptr<Impl> m_impl;
};

// Base of the segmented stream variants
class SegmentedStream : public Stream {
public:
    Result<std::unique_ptr<StreamReader>> Open() override;

    const StreamOptions& options() const { return m_options; }

protected:
    SegmentedStream(StreamOptions options, std::shared_ptr<HttpClient> http);

    virtual Result<std::unique_ptr<SegmentSource>> create_source() = 0;

    StreamOptions m_options;
    std::shared_ptr<HttpClient> m_http;
};

} // namespace ssp
