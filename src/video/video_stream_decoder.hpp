#pragma once
// =============================================================================
// DroidPilot - Video stream decoder
// =============================================================================
// Feeds the H.264 stream of the virtual display into a DecoderBackend.
//
// Lifecycle:
//   attach(target, w, h)  drop the decoder and pending chunks, keep SPS/PPS
//   onChunk(bytes)        Annex-B normalize; capture SPS/PPS (first wins),
//                         buffer until both are known, then build a decoder
//                         and drain the buffer in arrival order
//   submit error          drop the decoder and pending chunks, keep SPS/PPS;
//                         the next chunk rebuilds the decoder
//   detach()              drop decoder, buffer and target, keep SPS/PPS
//   captureFrame()        wait (bounded) for a frame presented since the
//                         last attach and encode it as PNG
//
// One mutex guards all state; onChunk runs on the stream thread while
// attach/detach/captureFrame run on the control thread.
// =============================================================================
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "decoder_backend.hpp"
#include "render_target.hpp"

namespace droidpilot::video {

class VideoStreamDecoder {
public:
    static constexpr size_t DEFAULT_PENDING_LIMIT = 100;
    static constexpr int CONSECUTIVE_FAILURE_ALERT = 5;

    struct Options {
        size_t pending_limit = DEFAULT_PENDING_LIMIT;
        int capture_timeout_ms = 1000;
    };

    struct Stats {
        uint64_t chunks_fed = 0;
        uint64_t chunks_dropped = 0;
        uint64_t frames_presented = 0;
        uint64_t decoder_creations = 0;
        uint64_t recoveries = 0;  // creations that followed a failure
        uint64_t consecutive_failures = 0;
    };

    VideoStreamDecoder(DecoderBackendFactory factory, Options options);
    explicit VideoStreamDecoder(DecoderBackendFactory factory);
    ~VideoStreamDecoder();

    VideoStreamDecoder(const VideoStreamDecoder&) = delete;
    VideoStreamDecoder& operator=(const VideoStreamDecoder&) = delete;

    // Shared ownership: a capture in flight keeps the target alive past detach()
    bool attach(std::shared_ptr<RenderTarget> target, int width, int height);
    void onChunk(const std::vector<uint8_t>& chunk);
    void detach();

    // Size change reported by the server. Drops the decoder, keeps SPS/PPS.
    void resize(int width, int height);

    // PNG of the newest frame presented since attach(); nullopt on timeout or
    // without a target
    std::optional<std::vector<uint8_t>> captureFrame(std::chrono::milliseconds timeout);
    std::optional<std::vector<uint8_t>> captureFrame();

    bool isAttached() const;
    bool hasDecoder() const;
    bool hasParameterSets() const;
    size_t pendingCount() const;
    Stats stats() const;

private:
    // Caller holds mutex_
    void releaseDecoderLocked();
    void captureParameterSetsLocked(const std::vector<uint8_t>& packet, bool& other_data);
    void bufferLocked(std::vector<uint8_t> packet);
    void tryCreateDecoderLocked();
    void submitLocked(const std::vector<uint8_t>& packet);
    void recordFailureLocked(const char* what, const std::string& message);

    DecoderBackendFactory factory_;
    Options options_;

    mutable std::mutex mutex_;
    std::unique_ptr<DecoderBackend> decoder_;
    std::shared_ptr<RenderTarget> target_;
    uint64_t attach_sequence_ = 0;  // target's frame count at attach()
    int width_ = 0;
    int height_ = 0;

    // Persist across attach / detach / decoder errors
    std::vector<uint8_t> sps_;
    std::vector<uint8_t> pps_;

    std::deque<std::vector<uint8_t>> pending_;
    Stats stats_;
    bool recovering_ = false;  // next creation follows a failure
};

} // namespace droidpilot::video
