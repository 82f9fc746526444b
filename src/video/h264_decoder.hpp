#pragma once
// =============================================================================
// DroidPilot - H.264 decoder backend (FFmpeg)
// =============================================================================
// - Input: Annex-B chunks (00 00 00 01 start codes)
// - SPS/PPS are handed over as extradata at open()
// - Output: RGBA frames presented to the render target as soon as
//   libavcodec releases them (low-delay, no reordering buffer)
//
// Not thread-safe; VideoStreamDecoder serializes all calls.
// =============================================================================
#include <cstdint>
#include <vector>

#include "decoder_backend.hpp"

// Forward declarations for FFmpeg types
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace droidpilot::video {

class H264Decoder : public DecoderBackend {
public:
    H264Decoder() = default;
    ~H264Decoder() override;

    // Owns FFmpeg resources
    H264Decoder(const H264Decoder&) = delete;
    H264Decoder& operator=(const H264Decoder&) = delete;

    Result<void, DecodeError> open(const std::vector<uint8_t>& sps,
                                   const std::vector<uint8_t>& pps,
                                   int width, int height,
                                   RenderTarget& target) override;
    Result<int, DecodeError> submit(const std::vector<uint8_t>& chunk) override;
    void close() override;

    static DecoderBackendFactory factory();

    uint64_t framesDecoded() const { return frames_decoded_; }
    bool isOpen() const { return codec_ctx_ != nullptr; }

private:
    Result<int, DecodeError> drainFrames();
    bool presentFrame(AVFrame* frame);

    AVCodecContext* codec_ctx_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVFrame* frame_rgba_ = nullptr;
    AVPacket* packet_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    RenderTarget* target_ = nullptr;

    int last_width_ = 0;
    int last_height_ = 0;
    int last_format_ = -1;

    // Tightly packed copy when swscale pads its rows
    std::vector<uint8_t> rgba_buffer_;

    uint64_t frames_decoded_ = 0;
    uint64_t receive_frame_errors_ = 0;
};

} // namespace droidpilot::video
