#pragma once

#include "ssp_errors.h"
#include "ssp_segment.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ssp {
namespace hls {

// #EXT-X-BYTERANGE:<length>[@<offset>]. A missing offset is resolved by
// the parser to the end of the previous range of the same URI.
struct ByteRangeTag {
    int64_t length = 0;
    int64_t offset = 0;

    ByteRange range() const { return ByteRange{offset, offset + length - 1}; }
};

struct MediaSegment {
    std::string uri;                     // absolute
    double duration = 0.0;
    std::string title;
    std::optional<ByteRangeTag> byterange;
    std::optional<SegmentKey> key;       // in effect for this segment
    bool discontinuity = false;
};

struct MediaPlaylist {
    std::string url;                     // playlist URL the URIs were resolved against
    double target_duration = 0.0;
    int64_t media_sequence = 0;
    std::string playlist_type;           // "VOD", "EVENT" or empty
    bool end_list = false;
    bool iframes_only = false;
    std::vector<MediaSegment> segments;

    int64_t first_sequence() const { return media_sequence; }
    int64_t last_sequence() const { return media_sequence + static_cast<int64_t>(segments.size()) - 1; }
};

struct Resolution {
    int width = 0;
    int height = 0;
};

struct Variant {
    std::string name;
    std::string uri;                     // absolute
    int64_t bandwidth = 0;
    std::optional<Resolution> resolution;
    std::string codecs;
};

// Attribute list of a tag: KEY=VALUE pairs, quoted values unquoted
std::map<std::string, std::string> parse_attribute_list(const std::string& text);

// Media playlist. Master and I-frame-only playlists are rejected with
// PlaylistInvalid.
Result<MediaPlaylist> ParseMediaPlaylist(const std::string& text, const std::string& base_url);

// Variants of a master playlist, in playlist order. Named after the VIDEO
// rendition NAME, else "<height>p", else "<bandwidth/1000>k". I-frame
// variants are skipped and a repeated name keeps its first variant.
Result<std::vector<Variant>> ParseVariantPlaylist(const std::string& text, const std::string& base_url);

bool IsMasterPlaylist(const std::string& text);

} // namespace hls
} // namespace ssp
