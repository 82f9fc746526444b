// =============================================================================
// DroidPilot - Decoded frame sink
// =============================================================================
#include "render_target.hpp"

#include <cstring>

namespace droidpilot::video {

void FrameRenderTarget::present(const uint8_t* rgba, int width, int height, int64_t pts) {
    if (!rgba || width <= 0 || height <= 0) return;
    const size_t bytes = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_.rgba.resize(bytes);
        std::memcpy(latest_.rgba.data(), rgba, bytes);
        latest_.width = width;
        latest_.height = height;
        latest_.pts = pts;
        latest_.sequence = ++sequence_;
    }
    cv_.notify_all();
}

std::optional<Frame> FrameRenderTarget::waitForFrame(uint64_t after_sequence,
                                                     std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [&] { return sequence_ > after_sequence; })) {
        return std::nullopt;
    }
    return latest_;
}

uint64_t FrameRenderTarget::framesPresented() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

} // namespace droidpilot::video
