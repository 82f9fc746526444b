#pragma once
// =============================================================================
// DroidPilot - H.264 elementary stream framing helpers
// =============================================================================
// Chunks arrive either Annex-B framed (00 00 01 / 00 00 00 01 start codes) or
// as 4-byte big-endian length-prefixed records (AVCC). The decoder only takes
// Annex-B.
// =============================================================================
#include <cstddef>
#include <cstdint>
#include <vector>

namespace droidpilot::video {

constexpr int NAL_TYPE_IDR = 5;
constexpr int NAL_TYPE_SPS = 7;
constexpr int NAL_TYPE_PPS = 8;

// True if data starts with 00 00 01 or 00 00 00 01
bool hasStartCode(const uint8_t* data, size_t size);

// Pass-through for Annex-B input. Length-prefixed input is rewritten with a
// 4-byte start code per record; input that is not a valid record sequence is
// returned unchanged. Idempotent.
std::vector<uint8_t> maybeConvertFraming(const std::vector<uint8_t>& chunk);

// Low 5 bits of the first byte after the first start code, -1 if none
int nalUnitType(const std::vector<uint8_t>& chunk);

struct NalUnit {
    int type = -1;
    size_t offset = 0;  // start code position
    size_t size = 0;    // including start code
};

// Splits an Annex-B buffer at its start codes
std::vector<NalUnit> splitNalUnits(const std::vector<uint8_t>& chunk);

} // namespace droidpilot::video
