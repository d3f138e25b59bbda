#include <segmented_stream_platform/ssp_segmented_http_stream.h>

#include <QLoggingCategory>

#include <algorithm>

Q_DECLARE_LOGGING_CATEGORY(sspHttp)

namespace ssp {

// ============================================================================
// ByteRangeSource
// ============================================================================

ByteRangeSource::ByteRangeSource(std::string url, std::shared_ptr<HttpClient> http,
                                 const StreamOptions& options, std::optional<int64_t> complete_length)
    : m_url(std::move(url))
    , m_http(std::move(http))
    , m_headers(options.http_headers)
    , m_request_timeout(options.segment_timeout)
    , m_read_timeout(options.http_stream_timeout)
    , m_segment_size(options.segment_size)
    , m_length(complete_length) {
}

Result<void> ByteRangeSource::Prepare() {
    if (m_length) {
        return Result<void>();
    }

    HttpRequest request;
    request.url = m_url;
    request.headers = m_headers;
    request.timeout = m_request_timeout;

    auto head = m_http->Head(request);
    if (head.is_error()) {
        qCWarning(sspHttp, "Unable to determine length of %s: %s", m_url.c_str(),
                  head.error().message.c_str());
        return Result<void>();
    }

    auto length = head.value().content_length();
    if (!length || *length <= 0) {
        qCWarning(sspHttp, "No Content-Length for %s, seeking disabled", m_url.c_str());
        return Result<void>();
    }
    m_length = length;
    qCDebug(sspHttp, "%s is %lld bytes", m_url.c_str(), static_cast<long long>(*m_length));
    return Result<void>();
}

Result<SegmentSource::Next> ByteRangeSource::NextSegment() {
    if (m_done) {
        return Next::make_end();
    }

    Segment segment;
    segment.url = m_url;
    segment.sequence = m_sequence++;

    if (!m_length) {
        // Unknown size: one open-ended transfer
        segment.range = ByteRange{m_position, std::nullopt};
        segment.is_last = true;
        m_done = true;
        return Next::make_segment(std::move(segment));
    }

    if (m_position >= *m_length) {
        m_done = true;
        return Next::make_end();
    }

    int64_t last = std::min(m_position + m_segment_size - 1, *m_length - 1);
    segment.range = ByteRange{m_position, last};
    segment.is_last = last >= *m_length - 1;
    m_position = last + 1;
    m_done = segment.is_last;
    return Next::make_segment(std::move(segment));
}

Result<void> ByteRangeSource::SeekTo(int64_t offset) {
    if (!m_length) {
        return Error::unsupported("Seeking requires a known content length");
    }
    if (offset < 0 || offset >= *m_length) {
        return Error::invalid_arg("Seek offset " + std::to_string(offset) + " is outside 0-" +
                                  std::to_string(*m_length - 1));
    }
    m_position = offset;
    m_done = false;
    return Result<void>();
}

// ============================================================================
// SegmentedHttpStream
// ============================================================================

SegmentedHttpStream::SegmentedHttpStream(std::string url, StreamOptions options,
                                         std::shared_ptr<HttpClient> http,
                                         std::optional<int64_t> complete_length)
    : SegmentedStream(std::move(options), std::move(http))
    , m_url(std::move(url))
    , m_complete_length(complete_length) {
}

std::string SegmentedHttpStream::describe() const {
    return "http " + m_url;
}

Result<std::unique_ptr<SegmentSource>> SegmentedHttpStream::create_source() {
    return std::unique_ptr<SegmentSource>(
        std::make_unique<ByteRangeSource>(m_url, m_http, m_options, m_complete_length));
}

} // namespace ssp
