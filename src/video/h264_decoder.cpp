// =============================================================================
// DroidPilot - H.264 decoder backend (FFmpeg)
// =============================================================================
#include "h264_decoder.hpp"

#include <cstring>
#include <string>

#include "../droidpilot_log.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
#include <libavutil/mem.h>
#include <libswscale/swscale.h>
}

namespace droidpilot::video {

namespace {

constexpr const char* TAG = "h264";
constexpr int MAX_DIMENSION = 8192;

std::string avError(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

} // namespace

H264Decoder::~H264Decoder() {
    close();
}

DecoderBackendFactory H264Decoder::factory() {
    return []() -> std::unique_ptr<DecoderBackend> {
        return std::make_unique<H264Decoder>();
    };
}

Result<void, DecodeError> H264Decoder::open(const std::vector<uint8_t>& sps,
                                            const std::vector<uint8_t>& pps,
                                            int width, int height,
                                            RenderTarget& target) {
    close();

    const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_H264);
    if (!codec) return DecodeError("H.264 decoder not available in libavcodec");

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) return DecodeError("avcodec_alloc_context3 failed");

    // SPS followed by PPS, both Annex-B
    const size_t extra_size = sps.size() + pps.size();
    codec_ctx_->extradata = static_cast<uint8_t*>(
        av_mallocz(extra_size + AV_INPUT_BUFFER_PADDING_SIZE));
    if (!codec_ctx_->extradata) {
        avcodec_free_context(&codec_ctx_);
        return DecodeError("extradata allocation failed");
    }
    std::memcpy(codec_ctx_->extradata, sps.data(), sps.size());
    std::memcpy(codec_ctx_->extradata + sps.size(), pps.data(), pps.size());
    codec_ctx_->extradata_size = static_cast<int>(extra_size);

    codec_ctx_->width = width;
    codec_ctx_->height = height;

    // Error concealment for streaming
    codec_ctx_->flags |= AV_CODEC_FLAG_OUTPUT_CORRUPT;
    codec_ctx_->flags2 |= AV_CODEC_FLAG2_SHOW_ALL;

    // Low latency: frames leave the decoder as soon as they are complete
    codec_ctx_->flags |= AV_CODEC_FLAG_LOW_DELAY;
    codec_ctx_->thread_count = 1;

    int ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
        avcodec_free_context(&codec_ctx_);
        return DecodeError("avcodec_open2 failed: " + avError(ret), ret);
    }

    frame_ = av_frame_alloc();
    frame_rgba_ = av_frame_alloc();
    packet_ = av_packet_alloc();
    if (!frame_ || !frame_rgba_ || !packet_) {
        close();
        return DecodeError("frame/packet allocation failed");
    }

    target_ = &target;
    DPLOG_INFO(TAG, "Decoder opened %dx%d (extradata %zu bytes)", width, height, extra_size);
    return {};
}

void H264Decoder::close() {
    if (sws_ctx_) {
        sws_freeContext(sws_ctx_);
        sws_ctx_ = nullptr;
    }
    if (frame_rgba_) av_frame_free(&frame_rgba_);
    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    target_ = nullptr;
    last_width_ = 0;
    last_height_ = 0;
    last_format_ = -1;
}

Result<int, DecodeError> H264Decoder::submit(const std::vector<uint8_t>& chunk) {
    if (!codec_ctx_) return DecodeError("decoder not open");
    if (chunk.empty()) return 0;

    // av_new_packet adds the padding libavcodec reads past the end
    av_packet_unref(packet_);
    int ret = av_new_packet(packet_, static_cast<int>(chunk.size()));
    if (ret < 0) return DecodeError("av_new_packet failed: " + avError(ret), ret);
    std::memcpy(packet_->data, chunk.data(), chunk.size());

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
        return DecodeError("send_packet failed: " + avError(ret), ret);
    }
    return drainFrames();
}

Result<int, DecodeError> H264Decoder::drainFrames() {
    int frames_out = 0;
    for (;;) {
        int ret = avcodec_receive_frame(codec_ctx_, frame_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
        if (ret < 0) {
            receive_frame_errors_++;
            return DecodeError("receive_frame failed: " + avError(ret), ret);
        }

        if (frames_decoded_ < 3 || (frames_decoded_ + 1) % 300 == 0) {
            DPLOG_DEBUG(TAG, "Decoded frame #%llu: %dx%d",
                        static_cast<unsigned long long>(frames_decoded_ + 1),
                        frame_->width, frame_->height);
        }
        const bool presented = presentFrame(frame_);
        av_frame_unref(frame_);
        if (!presented) return DecodeError("frame conversion failed");
        frames_decoded_++;
        frames_out++;
    }
    return frames_out;
}

bool H264Decoder::presentFrame(AVFrame* frame) {
    const int width = frame->width;
    const int height = frame->height;
    if (width <= 0 || height <= 0 || width > MAX_DIMENSION || height > MAX_DIMENSION) {
        DPLOG_ERROR(TAG, "Invalid frame dimensions: %dx%d", width, height);
        return false;
    }

    // Reinitialize the scaler when the stream geometry changes
    if (width != last_width_ || height != last_height_ || frame->format != last_format_ || !sws_ctx_) {
        if (sws_ctx_) {
            sws_freeContext(sws_ctx_);
            sws_ctx_ = nullptr;
        }
        sws_ctx_ = sws_getContext(width, height, static_cast<AVPixelFormat>(frame->format),
                                  width, height, AV_PIX_FMT_RGBA,
                                  SWS_FAST_BILINEAR, nullptr, nullptr, nullptr);
        if (!sws_ctx_) {
            DPLOG_ERROR(TAG, "Failed to create SwsContext for %dx%d fmt=%d",
                        width, height, frame->format);
            return false;
        }

        av_frame_unref(frame_rgba_);
        frame_rgba_->format = AV_PIX_FMT_RGBA;
        frame_rgba_->width = width;
        frame_rgba_->height = height;
        if (av_frame_get_buffer(frame_rgba_, 32) < 0) {
            DPLOG_ERROR(TAG, "Failed to allocate RGBA frame buffer");
            av_frame_unref(frame_rgba_);
            sws_freeContext(sws_ctx_);
            sws_ctx_ = nullptr;
            return false;
        }
        last_width_ = width;
        last_height_ = height;
        last_format_ = frame->format;
        DPLOG_INFO(TAG, "Output geometry %dx%d", width, height);
    }

    int rows = sws_scale(sws_ctx_, frame->data, frame->linesize, 0, height,
                         frame_rgba_->data, frame_rgba_->linesize);
    if (rows != height) {
        DPLOG_WARN(TAG, "sws_scale returned %d rows (expected %d)", rows, height);
        return false;
    }
    if (!target_) return true;

    const int row_bytes = width * 4;
    if (frame_rgba_->linesize[0] == row_bytes) {
        target_->present(frame_rgba_->data[0], width, height, frame->pts);
        return true;
    }

    rgba_buffer_.resize(static_cast<size_t>(row_bytes) * height);
    uint8_t* dst = rgba_buffer_.data();
    const uint8_t* src = frame_rgba_->data[0];
    for (int y = 0; y < height; y++) {
        std::memcpy(dst, src, static_cast<size_t>(row_bytes));
        dst += row_bytes;
        src += frame_rgba_->linesize[0];
    }
    target_->present(rgba_buffer_.data(), width, height, frame->pts);
    return true;
}

} // namespace droidpilot::video
