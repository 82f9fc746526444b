#pragma once
// =============================================================================
// DroidPilot - Still image encoding of decoded frames (stb_image_write)
// =============================================================================
#include <cstdint>
#include <vector>

#include "render_target.hpp"
#include "../result.hpp"

namespace droidpilot::video {

// RGBA frame -> PNG bytes
Result<std::vector<uint8_t>, IoError> encodePng(const Frame& frame);

} // namespace droidpilot::video
