#pragma once

#include "ssp_segmented_stream.h"

#include <map>
#include <optional>
#include <string>

namespace ssp {

// Slices one HTTP resource into fixed-size byte ranges.
// Seekable only when the total length is known.
class ByteRangeSource : public SegmentSource {
public:
    ByteRangeSource(std::string url, std::shared_ptr<HttpClient> http, const StreamOptions& options,
                    std::optional<int64_t> complete_length = std::nullopt);

    Result<void> Prepare() override;
    Result<Next> NextSegment() override;
    Result<void> SeekTo(int64_t offset) override;

    bool SupportsSeek() const override { return m_length.has_value(); }
    std::optional<int64_t> CompleteLength() const override { return m_length; }
    bool IsLive() const override { return false; }
    std::chrono::milliseconds ReadTimeout() const override { return m_read_timeout; }

private:
    const std::string m_url;
    std::shared_ptr<HttpClient> m_http;
    std::map<std::string, std::string> m_headers;
    std::chrono::milliseconds m_request_timeout;
    std::chrono::milliseconds m_read_timeout;
    const int64_t m_segment_size;

    std::optional<int64_t> m_length;
    int64_t m_position = 0;
    int64_t m_sequence = 0;
    bool m_done = false;
};

// HTTP resource downloaded as parallel byte ranges
class SegmentedHttpStream : public SegmentedStream {
public:
    explicit SegmentedHttpStream(std::string url, StreamOptions options = default_options(),
                                 std::shared_ptr<HttpClient> http = nullptr,
                                 std::optional<int64_t> complete_length = std::nullopt);

    StreamType type() const override { return StreamType::SegmentedHttp; }
    std::string describe() const override;

    const std::string& url() const { return m_url; }

protected:
    Result<std::unique_ptr<SegmentSource>> create_source() override;

private:
    std::string m_url;
    std::optional<int64_t> m_complete_length;
};

} // namespace ssp
