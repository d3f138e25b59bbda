#include <segmented_stream_platform/ssp_segment.h>

namespace ssp {

std::string Segment::describe() const {
    std::string label = "seq " + std::to_string(sequence);
    if (range) {
        label += " bytes " + std::to_string(range->first) + "-" +
                 (range->last ? std::to_string(*range->last) : std::string());
    }
    return label + " group " + std::to_string(group_id);
}

std::array<uint8_t, 16> sequence_iv(int64_t sequence) {
    std::array<uint8_t, 16> iv{};
    uint64_t value = static_cast<uint64_t>(sequence);
    for (int i = 15; i >= 8; --i) {
        iv[static_cast<size_t>(i)] = static_cast<uint8_t>(value & 0xff);
        value >>= 8;
    }
    return iv;
}

} // namespace ssp
