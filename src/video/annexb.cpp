// =============================================================================
// DroidPilot - H.264 elementary stream framing helpers
// =============================================================================
#include "annexb.hpp"

namespace droidpilot::video {

namespace {

// Length of the start code at `pos` (3 or 4), 0 if none
size_t startCodeAt(const uint8_t* data, size_t size, size_t pos) {
    if (pos + 3 <= size && data[pos] == 0 && data[pos + 1] == 0) {
        if (data[pos + 2] == 1) return 3;
        if (pos + 4 <= size && data[pos + 2] == 0 && data[pos + 3] == 1) return 4;
    }
    return 0;
}

} // namespace

bool hasStartCode(const uint8_t* data, size_t size) {
    return data && startCodeAt(data, size, 0) != 0;
}

std::vector<uint8_t> maybeConvertFraming(const std::vector<uint8_t>& chunk) {
    if (chunk.empty() || hasStartCode(chunk.data(), chunk.size())) return chunk;

    std::vector<uint8_t> out;
    out.reserve(chunk.size() + 16);
    const size_t n = chunk.size();
    size_t i = 0;
    while (i + 4 <= n) {
        const uint32_t len = (static_cast<uint32_t>(chunk[i]) << 24) |
                             (static_cast<uint32_t>(chunk[i + 1]) << 16) |
                             (static_cast<uint32_t>(chunk[i + 2]) << 8) |
                             static_cast<uint32_t>(chunk[i + 3]);
        i += 4;
        if (len == 0 || len > n - i) return chunk;
        static const uint8_t START_CODE[4] = {0, 0, 0, 1};
        out.insert(out.end(), START_CODE, START_CODE + 4);
        out.insert(out.end(), chunk.begin() + static_cast<std::ptrdiff_t>(i),
                   chunk.begin() + static_cast<std::ptrdiff_t>(i + len));
        i += len;
    }
    // Trailing bytes that do not form a record
    if (i != n || out.empty()) return chunk;
    return out;
}

int nalUnitType(const std::vector<uint8_t>& chunk) {
    const uint8_t* data = chunk.data();
    const size_t size = chunk.size();
    for (size_t i = 0; i + 3 <= size; i++) {
        size_t sc = startCodeAt(data, size, i);
        if (sc == 0) continue;
        if (i + sc < size) return data[i + sc] & 0x1F;
        return -1;
    }
    return -1;
}

std::vector<NalUnit> splitNalUnits(const std::vector<uint8_t>& chunk) {
    std::vector<NalUnit> units;
    const uint8_t* data = chunk.data();
    const size_t size = chunk.size();

    size_t i = 0;
    while (i + 3 <= size) {
        size_t sc = startCodeAt(data, size, i);
        if (sc == 0) {
            i++;
            continue;
        }
        if (!units.empty()) units.back().size = i - units.back().offset;
        NalUnit unit;
        unit.offset = i;
        unit.type = i + sc < size ? (data[i + sc] & 0x1F) : -1;
        unit.size = size - i;
        units.push_back(unit);
        i += sc;
    }
    return units;
}

} // namespace droidpilot::video
