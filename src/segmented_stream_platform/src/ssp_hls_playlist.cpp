#include <segmented_stream_platform/ssp_hls_playlist.h>
#include <segmented_stream_platform/ssp_http.h>

#include <cstdio>
#include <set>
#include <sstream>
#include <stdexcept>

namespace ssp {
namespace hls {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Value after "#TAG:"
std::string tag_value(const std::string& line) {
    size_t colon = line.find(':');
    return colon == std::string::npos ? std::string() : line.substr(colon + 1);
}

std::optional<int64_t> parse_int(const std::string& text) {
    try {
        size_t used = 0;
        int64_t value = std::stoll(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<double> parse_double(const std::string& text) {
    try {
        return std::stod(text);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// "0x..." right-aligned into 16 bytes
std::optional<std::array<uint8_t, 16>> parse_iv(const std::string& text) {
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return std::nullopt;
    }
    std::string digits = text.substr(2);
    if (digits.size() > 32) {
        return std::nullopt;
    }
    if (digits.size() % 2) {
        digits.insert(digits.begin(), '0');
    }

    std::array<uint8_t, 16> iv{};
    size_t out = 16 - digits.size() / 2;
    for (size_t i = 0; i < digits.size(); i += 2, ++out) {
        int hi = hex_digit(digits[i]);
        int lo = hex_digit(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        iv[out] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return iv;
}

Result<void> check_header(const std::vector<std::string>& lines) {
    if (lines.empty() || !starts_with(lines.front(), "#EXTM3U")) {
        return Error::playlist_invalid("Missing #EXTM3U header");
    }
    return Result<void>();
}

} // namespace

std::map<std::string, std::string> parse_attribute_list(const std::string& text) {
    std::map<std::string, std::string> attributes;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t eq = text.find('=', pos);
        if (eq == std::string::npos) {
            break;
        }
        std::string key = trim(text.substr(pos, eq - pos));
        std::string value;
        pos = eq + 1;

        if (pos < text.size() && text[pos] == '"') {
            size_t close = text.find('"', pos + 1);
            if (close == std::string::npos) {
                value = text.substr(pos + 1);
                pos = text.size();
            } else {
                value = text.substr(pos + 1, close - pos - 1);
                pos = close + 1;
            }
            size_t comma = text.find(',', pos);
            pos = comma == std::string::npos ? text.size() : comma + 1;
        } else {
            size_t comma = text.find(',', pos);
            if (comma == std::string::npos) {
                value = trim(text.substr(pos));
                pos = text.size();
            } else {
                value = trim(text.substr(pos, comma - pos));
                pos = comma + 1;
            }
        }
        if (!key.empty()) {
            attributes[key] = value;
        }
    }
    return attributes;
}

bool IsMasterPlaylist(const std::string& text) {
    return text.find("#EXT-X-STREAM-INF") != std::string::npos;
}

// ============================================================================
// Media playlist
// ============================================================================

Result<MediaPlaylist> ParseMediaPlaylist(const std::string& text, const std::string& base_url) {
    auto lines = split_lines(text);
    auto header = check_header(lines);
    if (header.is_error()) {
        return header.error();
    }
    if (IsMasterPlaylist(text)) {
        return Error::playlist_invalid("Attempted to play a variant playlist, open it as a variant stream instead");
    }

    MediaPlaylist playlist;
    playlist.url = base_url;

    std::optional<SegmentKey> key;
    std::map<std::string, int64_t> next_offset;  // per URI
    MediaSegment pending;
    bool have_extinf = false;
    std::optional<std::pair<int64_t, std::optional<int64_t>>> pending_range;

    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];

        if (starts_with(line, "#EXT-X-TARGETDURATION")) {
            auto v = parse_double(tag_value(line));
            if (!v) return Error::playlist_invalid("Invalid target duration: " + line);
            playlist.target_duration = *v;
        } else if (starts_with(line, "#EXT-X-MEDIA-SEQUENCE")) {
            auto v = parse_int(tag_value(line));
            if (!v) return Error::playlist_invalid("Invalid media sequence: " + line);
            playlist.media_sequence = *v;
        } else if (starts_with(line, "#EXT-X-PLAYLIST-TYPE")) {
            playlist.playlist_type = trim(tag_value(line));
        } else if (starts_with(line, "#EXT-X-ENDLIST")) {
            playlist.end_list = true;
        } else if (starts_with(line, "#EXT-X-I-FRAMES-ONLY")) {
            playlist.iframes_only = true;
        } else if (starts_with(line, "#EXT-X-DISCONTINUITY-SEQUENCE")) {
            // not needed for playback
        } else if (starts_with(line, "#EXT-X-DISCONTINUITY")) {
            pending.discontinuity = true;
        } else if (starts_with(line, "#EXTINF")) {
            std::string value = tag_value(line);
            size_t comma = value.find(',');
            auto duration = parse_double(value.substr(0, comma));
            if (!duration) return Error::playlist_invalid("Invalid segment duration: " + line);
            pending.duration = *duration;
            if (comma != std::string::npos) {
                pending.title = trim(value.substr(comma + 1));
            }
            have_extinf = true;
        } else if (starts_with(line, "#EXT-X-BYTERANGE")) {
            std::string value = tag_value(line);
            size_t at = value.find('@');
            auto length = parse_int(value.substr(0, at));
            if (!length || *length <= 0) return Error::playlist_invalid("Invalid byte range: " + line);
            std::optional<int64_t> offset;
            if (at != std::string::npos) {
                offset = parse_int(value.substr(at + 1));
                if (!offset) return Error::playlist_invalid("Invalid byte range offset: " + line);
            }
            pending_range = std::make_pair(*length, offset);
        } else if (starts_with(line, "#EXT-X-KEY")) {
            auto attrs = parse_attribute_list(tag_value(line));
            std::string method = attrs["METHOD"];
            if (method.empty()) return Error::playlist_invalid("EXT-X-KEY without METHOD");
            if (method == "NONE") {
                key.reset();
                continue;
            }
            SegmentKey k;
            k.method = method;
            if (!attrs["URI"].empty()) {
                k.uri = resolve_url(base_url, attrs["URI"]);
            }
            if (!attrs["IV"].empty()) {
                k.iv = parse_iv(attrs["IV"]);
                if (!k.iv) return Error::playlist_invalid("Invalid IV: " + attrs["IV"]);
            }
            key = k;
        } else if (line[0] == '#') {
            // Unknown tag or comment
        } else {
            if (!have_extinf) {
                return Error::playlist_invalid("Segment URI without #EXTINF: " + line);
            }
            pending.uri = resolve_url(base_url, line);
            pending.key = key;
            if (pending_range) {
                ByteRangeTag tag;
                tag.length = pending_range->first;
                tag.offset = pending_range->second.value_or(next_offset[pending.uri]);
                next_offset[pending.uri] = tag.offset + tag.length;
                pending.byterange = tag;
            }
            playlist.segments.push_back(std::move(pending));
            pending = MediaSegment();
            pending_range.reset();
            have_extinf = false;
        }
    }

    if (playlist.iframes_only) {
        return Error::playlist_invalid("Streams containing I-frames only are not playable");
    }
    return playlist;
}

// ============================================================================
// Variant (master) playlist
// ============================================================================

Result<std::vector<Variant>> ParseVariantPlaylist(const std::string& text, const std::string& base_url) {
    auto lines = split_lines(text);
    auto header = check_header(lines);
    if (header.is_error()) {
        return header.error();
    }
    if (!IsMasterPlaylist(text)) {
        return Error::playlist_invalid("Not a variant playlist: " + base_url);
    }

    // VIDEO renditions: GROUP-ID -> NAME
    std::map<std::string, std::string> video_names;
    for (const auto& line : lines) {
        if (!starts_with(line, "#EXT-X-MEDIA:")) continue;
        auto attrs = parse_attribute_list(tag_value(line));
        if (attrs["TYPE"] == "VIDEO" && !attrs["NAME"].empty()) {
            video_names[attrs["GROUP-ID"]] = attrs["NAME"];
        }
    }

    std::vector<Variant> variants;
    std::set<std::string> seen;
    for (size_t i = 0; i < lines.size(); ++i) {
        // I-frame variants use #EXT-X-I-FRAME-STREAM-INF and carry no URI line
        if (!starts_with(lines[i], "#EXT-X-STREAM-INF:")) continue;
        if (i + 1 >= lines.size() || lines[i + 1][0] == '#') {
            return Error::playlist_invalid("#EXT-X-STREAM-INF without URI");
        }

        auto attrs = parse_attribute_list(tag_value(lines[i]));
        Variant variant;
        variant.uri = resolve_url(base_url, lines[i + 1]);
        variant.codecs = attrs["CODECS"];
        if (auto bw = parse_int(attrs["BANDWIDTH"])) {
            variant.bandwidth = *bw;
        }
        const std::string& res = attrs["RESOLUTION"];
        size_t x = res.find('x');
        if (x != std::string::npos) {
            auto w = parse_int(res.substr(0, x));
            auto h = parse_int(res.substr(x + 1));
            if (w && h) {
                variant.resolution = Resolution{static_cast<int>(*w), static_cast<int>(*h)};
            }
        }

        auto video = video_names.find(attrs["VIDEO"]);
        if (!attrs["VIDEO"].empty() && video != video_names.end()) {
            variant.name = video->second;
        } else if (variant.resolution) {
            variant.name = std::to_string(variant.resolution->height) + "p";
        } else if (variant.bandwidth >= 1000) {
            variant.name = std::to_string(variant.bandwidth / 1000) + "k";
        } else if (variant.bandwidth > 0) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%gk", static_cast<double>(variant.bandwidth) / 1000.0);
            variant.name = buf;
        }
        ++i;

        if (variant.name.empty() || !seen.insert(variant.name).second) {
            continue;
        }
        variants.push_back(std::move(variant));
    }
    return variants;
}

} // namespace hls
} // namespace ssp
