#pragma once

#include "ssp_hls_playlist.h"
#include "ssp_segmented_stream.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ssp {

// Walks an HLS media playlist. Live playlists are reloaded and playback
// starts hls_live_edge segments from the end; on-demand playlists start at
// the first segment. Seeking needs a VOD or EVENT playlist with ENDLIST and
// a byte length for every segment.
class HlsSource : public SegmentSource {
public:
    HlsSource(std::string url, std::shared_ptr<HttpClient> http, const StreamOptions& options);

    Result<void> Prepare() override;
    Result<Next> NextSegment() override;
    Result<void> SeekTo(int64_t offset) override;

    bool SupportsSeek() const override { return m_supports_seek; }
    std::optional<int64_t> CompleteLength() const override { return m_complete_length; }
    bool IsLive() const override { return !m_end_sequence.has_value(); }
    std::chrono::milliseconds ReadTimeout() const override { return m_read_timeout; }

    int64_t NextSequence() const { return m_next_sequence; }
    std::chrono::milliseconds ReloadDelay() const { return m_reload_delay; }
    std::optional<double> Duration() const { return m_duration; }

private:
    struct Entry {
        int64_t sequence = 0;
        hls::MediaSegment segment;
        int64_t offset = -1;   // byte offset in the whole stream, -1 without seek metadata
        int64_t length = -1;
    };

    Result<void> reload_playlist();
    void process_playlist(const hls::MediaPlaylist& playlist);
    bool fetch_seek_meta(std::vector<Entry>& entries);
    Segment make_segment(const Entry& entry);

    const std::string m_url;
    std::shared_ptr<HttpClient> m_http;
    std::map<std::string, std::string> m_headers;
    std::chrono::milliseconds m_request_timeout;
    std::chrono::milliseconds m_read_timeout;
    int32_t m_live_edge;
    int32_t m_seek_meta_threads;
    std::chrono::milliseconds m_seek_meta_timeout;

    std::vector<Entry> m_entries;
    int64_t m_next_sequence = -1;
    std::optional<int64_t> m_end_sequence;
    int64_t m_pending_skip = 0;

    std::chrono::milliseconds m_reload_delay{15000};
    std::chrono::steady_clock::time_point m_last_reload;

    bool m_supports_seek = false;
    std::optional<int64_t> m_complete_length;
    std::optional<double> m_duration;
};

class HlsStream : public SegmentedStream {
public:
    explicit HlsStream(std::string url, StreamOptions options = default_options(),
                       std::shared_ptr<HttpClient> http = nullptr);

    StreamType type() const override { return StreamType::Hls; }
    std::string describe() const override;

    const std::string& url() const { return m_url; }

    // One stream per named variant of a master playlist
    static Result<std::map<std::string, std::shared_ptr<HlsStream>>> FromVariantPlaylist(
        const std::string& url, const StreamOptions& options, std::shared_ptr<HttpClient> http = nullptr);

protected:
    Result<std::unique_ptr<SegmentSource>> create_source() override;

private:
    std::string m_url;
};

} // namespace ssp
