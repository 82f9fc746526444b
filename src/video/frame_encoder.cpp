// =============================================================================
// DroidPilot - Still image encoding of decoded frames (stb_image_write)
// =============================================================================
// Owns STB_IMAGE_WRITE_IMPLEMENTATION for the whole project.
// =============================================================================
#include "frame_encoder.hpp"

#include "../droidpilot_log.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

namespace droidpilot::video {

namespace {

constexpr const char* TAG = "png";

void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

bool validFrame(const Frame& frame) {
    return frame.width > 0 && frame.height > 0 &&
           frame.rgba.size() >= static_cast<size_t>(frame.width) * frame.height * 4;
}

} // namespace

Result<std::vector<uint8_t>, IoError> encodePng(const Frame& frame) {
    if (!validFrame(frame)) return IoError("invalid frame");

    std::vector<uint8_t> png;
    int ok = stbi_write_png_to_func(appendToVector, &png, frame.width, frame.height, 4,
                                    frame.rgba.data(), frame.width * 4);
    if (!ok || png.empty()) {
        DPLOG_ERROR(TAG, "PNG encode failed (%dx%d)", frame.width, frame.height);
        return IoError("PNG encode failed");
    }
    return png;
}

} // namespace droidpilot::video
