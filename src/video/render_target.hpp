#pragma once
// =============================================================================
// DroidPilot - Decoded frame sink
// =============================================================================
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace droidpilot::video {

struct Frame {
    int width = 0;
    int height = 0;
    int64_t pts = 0;
    uint64_t sequence = 0;      // 1 for the first presented frame
    std::vector<uint8_t> rgba;  // width * height * 4, tightly packed
};

class RenderTarget {
public:
    virtual ~RenderTarget() = default;

    // Called on the stream thread for every decoded frame. `rgba` is only
    // valid during the call.
    virtual void present(const uint8_t* rgba, int width, int height, int64_t pts) = 0;

    // Sequence number of the latest frame, 0 before the first one
    virtual uint64_t framesPresented() const = 0;

    // Latest frame once its sequence exceeds `after_sequence`, waiting up to
    // `timeout`. nullopt on timeout.
    virtual std::optional<Frame> waitForFrame(uint64_t after_sequence,
                                              std::chrono::milliseconds timeout) = 0;
};

// Keeps a copy of the last presented frame in memory
class FrameRenderTarget : public RenderTarget {
public:
    void present(const uint8_t* rgba, int width, int height, int64_t pts) override;
    uint64_t framesPresented() const override;
    std::optional<Frame> waitForFrame(uint64_t after_sequence,
                                      std::chrono::milliseconds timeout) override;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Frame latest_;
    uint64_t sequence_ = 0;
};

} // namespace droidpilot::video
