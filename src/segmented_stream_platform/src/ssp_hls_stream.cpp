#include <segmented_stream_platform/ssp_hls_stream.h>
#include <segmented_stream_platform/ssp_thread_pool.h>

#include <QLoggingCategory>

#include <algorithm>
#include <mutex>

Q_LOGGING_CATEGORY(sspHls, "ssp.hls")

namespace {
using std::chrono::milliseconds;

milliseconds seconds_to_ms(double seconds) {
    return milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

// Floor for playlist reload delays
constexpr milliseconds kMinReloadDelay(1000);
} // namespace

namespace ssp {

// ============================================================================
// HlsSource
// ============================================================================

HlsSource::HlsSource(std::string url, std::shared_ptr<HttpClient> http, const StreamOptions& options)
    : m_url(std::move(url))
    , m_http(std::move(http))
    , m_headers(options.http_headers)
    , m_request_timeout(options.segment_timeout)
    , m_read_timeout(options.hls_timeout)
    , m_live_edge(options.hls_live_edge)
    , m_seek_meta_threads(options.seek_meta_threads)
    , m_seek_meta_timeout(options.seek_meta_timeout) {
}

Result<void> HlsSource::Prepare() {
    auto loaded = reload_playlist();
    if (loaded.is_error()) {
        return loaded.error();
    }
    if (m_next_sequence >= 0) {
        qCDebug(sspHls, "First sequence: %lld; %s playlist", static_cast<long long>(m_next_sequence),
                IsLive() ? "live" : "on-demand");
    }
    return Result<void>();
}

Result<void> HlsSource::reload_playlist() {
    m_last_reload = std::chrono::steady_clock::now();
    qCDebug(sspHls, "Reloading playlist");

    HttpRequest request;
    request.url = m_url;
    request.headers = m_headers;
    request.timeout = m_request_timeout;

    auto res = m_http->Get(request);
    if (res.is_error()) {
        return res.error();
    }
    const std::string& base = res.value().effective_url.empty() ? m_url : res.value().effective_url;
    auto playlist = hls::ParseMediaPlaylist(res.value().body_text(), base);
    if (playlist.is_error()) {
        return playlist.error();
    }

    process_playlist(playlist.value());
    return Result<void>();
}

void HlsSource::process_playlist(const hls::MediaPlaylist& playlist) {
    std::vector<Entry> entries;
    entries.reserve(playlist.segments.size());
    for (size_t i = 0; i < playlist.segments.size(); ++i) {
        Entry entry;
        entry.sequence = playlist.media_sequence + static_cast<int64_t>(i);
        entry.segment = playlist.segments[i];
        entries.push_back(std::move(entry));
    }
    if (entries.empty()) {
        m_reload_delay = std::max(seconds_to_ms(playlist.target_duration), kMinReloadDelay);
        return;
    }

    if (entries.front().segment.key) {
        qCDebug(sspHls, "Segments in this playlist are encrypted");
    }

    bool changed = entries.size() != m_entries.size() ||
                   entries.front().sequence != m_entries.front().sequence;

    double reload_seconds = playlist.target_duration > 0 ? playlist.target_duration
                                                         : entries.back().segment.duration;
    m_reload_delay = seconds_to_ms(reload_seconds);
    if (!changed) {
        m_reload_delay = std::max(m_reload_delay / 2, kMinReloadDelay);
    }

    if (playlist.end_list) {
        m_end_sequence = entries.back().sequence;
        if (changed && (playlist.playlist_type == "VOD" || playlist.playlist_type == "EVENT")) {
            m_supports_seek = fetch_seek_meta(entries);
        }
    }
    if (changed) {
        m_entries = std::move(entries);
    }

    if (m_next_sequence < 0) {
        if (!m_end_sequence) {
            size_t edge = std::min(m_entries.size(), static_cast<size_t>(std::max(m_live_edge, 1)));
            m_next_sequence = m_entries[m_entries.size() - edge].sequence;
        } else {
            m_next_sequence = m_entries.front().sequence;
        }
    }
}

// Byte length of every segment, from EXT-X-BYTERANGE or parallel HEAD requests
bool HlsSource::fetch_seek_meta(std::vector<Entry>& entries) {
    // Decrypted lengths differ from the transferred ones by the padding
    for (const auto& entry : entries) {
        if (entry.segment.key && entry.segment.key->method != "NONE") {
            qCDebug(sspHls, "Encrypted playlist, seeking disabled");
            m_complete_length.reset();
            m_duration.reset();
            return false;
        }
    }

    qCDebug(sspHls, "Fetching meta data for seek");

    std::vector<int64_t> lengths(entries.size(), -1);
    std::mutex lengths_mutex;
    std::string failure;

    {
        GenerationalThreadPool pool(m_seek_meta_threads);
        for (size_t i = 0; i < entries.size(); ++i) {
            if (entries[i].segment.byterange) {
                lengths[i] = entries[i].segment.byterange->length;
                continue;
            }

            HttpRequest request;
            request.url = entries[i].segment.uri;
            request.headers = m_headers;
            request.timeout = m_seek_meta_timeout;

            auto submitted = pool.Submit([this, request, i, &lengths, &lengths_mutex, &failure]() {
                auto head = m_http->Head(request);
                std::lock_guard<std::mutex> lock(lengths_mutex);
                if (head.is_error()) {
                    failure = head.error().message;
                    return;
                }
                auto length = head.value().content_length();
                if (!length) {
                    failure = "no Content-Length for " + request.url;
                    return;
                }
                lengths[i] = *length;
            }, 0);
            if (submitted.is_error()) {
                failure = submitted.error().message;
                break;
            }
        }
        pool.WaitDrained(0, std::nullopt);
        pool.Shutdown();
    }

    int64_t offset = 0;
    double duration = 0.0;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (lengths[i] < 0) {
            qCDebug(sspHls, "Unable to get complete VOD metadata for seek: %s", failure.c_str());
            m_complete_length.reset();
            m_duration.reset();
            return false;
        }
        entries[i].offset = offset;
        entries[i].length = lengths[i];
        offset += lengths[i];
        duration += entries[i].segment.duration;
    }

    if (offset <= 0 || duration <= 0.0) {
        qCDebug(sspHls, "Unable to get complete VOD metadata for seek: empty content");
        return false;
    }

    m_complete_length = offset;
    m_duration = duration;
    qCDebug(sspHls, "Complete content length of %lld bytes, duration %.3f s",
            static_cast<long long>(offset), duration);
    return true;
}

Segment HlsSource::make_segment(const Entry& entry) {
    Segment segment;
    segment.url = entry.segment.uri;
    if (entry.segment.byterange) {
        segment.range = entry.segment.byterange->range();
    }
    segment.key = entry.segment.key;
    segment.sequence = entry.sequence;
    segment.duration = entry.segment.duration;
    segment.is_last = m_end_sequence && entry.sequence >= *m_end_sequence;
    segment.skip_bytes = m_pending_skip;
    m_pending_skip = 0;
    return segment;
}

Result<SegmentSource::Next> HlsSource::NextSegment() {
    bool reloaded = false;
    while (true) {
        for (const auto& entry : m_entries) {
            if (entry.sequence >= m_next_sequence) {
                m_next_sequence = entry.sequence + 1;
                return Next::make_segment(make_segment(entry));
            }
        }

        if (m_end_sequence && m_next_sequence > *m_end_sequence) {
            return Next::make_end();
        }
        if (reloaded) {
            return Next::make_wait(m_reload_delay);
        }

        auto since = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - m_last_reload);
        if (since < m_reload_delay) {
            return Next::make_wait(m_reload_delay - since);
        }

        auto loaded = reload_playlist();
        if (loaded.is_error()) {
            qCWarning(sspHls, "Failed to reload playlist: %s", loaded.error().message.c_str());
        }
        reloaded = true;
    }
}

Result<void> HlsSource::SeekTo(int64_t offset) {
    if (!m_supports_seek) {
        return Error::unsupported("Playlist does not support seeking");
    }
    for (const auto& entry : m_entries) {
        if (offset >= entry.offset && offset <= entry.offset + entry.length - 1) {
            m_next_sequence = entry.sequence;
            m_pending_skip = offset - entry.offset;
            qCDebug(sspHls, "Seek to %lld lands in sequence %lld, skipping %lld bytes",
                    static_cast<long long>(offset), static_cast<long long>(entry.sequence),
                    static_cast<long long>(m_pending_skip));
            return Result<void>();
        }
    }
    return Error::invalid_arg("Seek offset " + std::to_string(offset) + " is outside the playlist");
}

// ============================================================================
// HlsStream
// ============================================================================

HlsStream::HlsStream(std::string url, StreamOptions options, std::shared_ptr<HttpClient> http)
    : SegmentedStream(std::move(options), std::move(http))
    , m_url(std::move(url)) {
}

std::string HlsStream::describe() const {
    return "hls " + m_url;
}

Result<std::unique_ptr<SegmentSource>> HlsStream::create_source() {
    return std::unique_ptr<SegmentSource>(std::make_unique<HlsSource>(m_url, m_http, m_options));
}

Result<std::map<std::string, std::shared_ptr<HlsStream>>> HlsStream::FromVariantPlaylist(
        const std::string& url, const StreamOptions& options, std::shared_ptr<HttpClient> http) {
    if (!http) {
        http = create_http_client(options);
    }

    HttpRequest request;
    request.url = url;
    request.headers = options.http_headers;
    request.timeout = options.segment_timeout;

    auto res = http->Get(request);
    if (res.is_error()) {
        return res.error();
    }
    const std::string& base = res.value().effective_url.empty() ? url : res.value().effective_url;
    auto variants = hls::ParseVariantPlaylist(res.value().body_text(), base);
    if (variants.is_error()) {
        return Error::playlist_invalid("Failed to parse playlist: " + variants.error().message);
    }

    std::map<std::string, std::shared_ptr<HlsStream>> streams;
    for (const auto& variant : variants.value()) {
        qCDebug(sspHls, "Variant '%s' -> %s", variant.name.c_str(), variant.uri.c_str());
        streams[variant.name] = std::make_shared<HlsStream>(variant.uri, options, http);
    }
    return streams;
}

} // namespace ssp
