#pragma once

#include "ssp_http.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace ssp {

// Decryption key reference for an encrypted segment
struct SegmentKey {
    std::string method;                         // "AES-128" is the only supported cipher
    std::string uri;                            // absolute key URI
    std::optional<std::array<uint8_t, 16>> iv;  // explicit IV, else derived from the sequence
};

// One fetchable unit of a segmented stream. Immutable once produced.
struct Segment {
    std::string url;
    std::optional<ByteRange> range;
    std::optional<SegmentKey> key;
    int64_t sequence = 0;
    int64_t group_id = 0;
    bool is_last = false;
    int64_t skip_bytes = 0;   // decoded bytes to discard before writing (seek landing)
    double duration = 0.0;    // seconds, 0 when unknown

    // Short label for log lines: "seq 12" or "bytes 0-2097151"
    std::string describe() const;
};

// Default HLS IV: the sequence number big-endian in the last 8 bytes
std::array<uint8_t, 16> sequence_iv(int64_t sequence);

} // namespace ssp
