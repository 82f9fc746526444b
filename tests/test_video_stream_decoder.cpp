// =============================================================================
// Unit tests for VideoStreamDecoder (src/video/video_stream_decoder.hpp)
// =============================================================================
// A scripted backend stands in for FFmpeg so buffering, parameter-set caching
// and recovery can be checked without real H.264 data.
// =============================================================================
#include <gtest/gtest.h>
#include "video/video_stream_decoder.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace droidpilot;
using namespace droidpilot::video;

using Bytes = std::vector<uint8_t>;

namespace {

const Bytes SPS = {0, 0, 0, 1, 0x67, 0x42, 0x00, 0x1F};
const Bytes PPS = {0, 0, 0, 1, 0x68, 0xCE, 0x3C, 0x80};

Bytes idr(uint8_t tag) {
    return {0, 0, 0, 1, 0x65, 0x88, tag};
}

Bytes slice(uint8_t tag) {
    return {0, 0, 0, 1, 0x41, 0x9A, tag};
}

const uint8_t PIXELS[2 * 2 * 4] = {255, 0, 0, 255, 0, 255, 0, 255,
                                   0, 0, 255, 255, 255, 255, 255, 255};

Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

// Shared between the test and every backend the factory creates
struct BackendScript {
    int opens = 0;
    int closes = 0;
    int factory_calls = 0;
    Bytes sps;
    Bytes pps;
    int width = 0;
    int height = 0;
    std::vector<Bytes> submitted;

    bool factory_returns_null = false;
    bool fail_open = false;
    int fail_next_submits = 0;
    bool present_frames = false;
};

class ScriptedBackend : public DecoderBackend {
public:
    explicit ScriptedBackend(std::shared_ptr<BackendScript> script) : script_(std::move(script)) {}

    Result<void, DecodeError> open(const Bytes& sps, const Bytes& pps, int width, int height,
                                   RenderTarget& target) override {
        script_->opens++;
        if (script_->fail_open) return DecodeError("open refused", -22);
        script_->sps = sps;
        script_->pps = pps;
        script_->width = width;
        script_->height = height;
        target_ = &target;
        return {};
    }

    Result<int, DecodeError> submit(const Bytes& chunk) override {
        if (script_->fail_next_submits > 0) {
            script_->fail_next_submits--;
            return DecodeError("corrupt slice", -1094995529);
        }
        script_->submitted.push_back(chunk);
        if (!script_->present_frames) return 0;
        target_->present(PIXELS, 2, 2, static_cast<int64_t>(script_->submitted.size()));
        return 1;
    }

    void close() override { script_->closes++; }

private:
    std::shared_ptr<BackendScript> script_;
    RenderTarget* target_ = nullptr;
};

} // namespace

class VideoStreamDecoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = std::make_shared<BackendScript>();
        decoder = std::make_unique<VideoStreamDecoder>(makeFactory());
    }

    DecoderBackendFactory makeFactory() {
        auto s = script;
        return [s]() -> std::unique_ptr<DecoderBackend> {
            s->factory_calls++;
            if (s->factory_returns_null) return nullptr;
            return std::make_unique<ScriptedBackend>(s);
        };
    }

    std::shared_ptr<BackendScript> script;
    std::shared_ptr<FrameRenderTarget> target = std::make_shared<FrameRenderTarget>();
    std::unique_ptr<VideoStreamDecoder> decoder;
};

// ---------------------------------------------------------------------------
// Parameter sets and buffering
// ---------------------------------------------------------------------------

TEST_F(VideoStreamDecoderTest, BuffersUntilParameterSetsArrive) {
    ASSERT_TRUE(decoder->attach(target, 720, 1280));

    decoder->onChunk(idr(1));
    EXPECT_EQ(decoder->pendingCount(), 1u);
    EXPECT_FALSE(decoder->hasDecoder());

    decoder->onChunk(SPS);
    EXPECT_FALSE(decoder->hasDecoder());
    EXPECT_EQ(decoder->pendingCount(), 1u);

    decoder->onChunk(PPS);
    EXPECT_TRUE(decoder->hasDecoder());
    EXPECT_EQ(decoder->pendingCount(), 0u);

    EXPECT_EQ(script->opens, 1);
    EXPECT_EQ(script->sps, SPS);
    EXPECT_EQ(script->pps, PPS);
    EXPECT_EQ(script->width, 720);
    EXPECT_EQ(script->height, 1280);
    EXPECT_EQ(script->submitted, (std::vector<Bytes>{idr(1)}));
}

TEST_F(VideoStreamDecoderTest, BacklogDrainsInArrivalOrder) {
    decoder->attach(target, 720, 1280);
    decoder->onChunk(idr(1));
    decoder->onChunk(slice(2));
    decoder->onChunk(slice(3));
    decoder->onChunk(concat({SPS, PPS}));

    EXPECT_EQ(script->submitted, (std::vector<Bytes>{idr(1), slice(2), slice(3)}));
    decoder->onChunk(slice(4));
    EXPECT_EQ(script->submitted.back(), slice(4));
}

TEST_F(VideoStreamDecoderTest, CombinedChunkStartsDecoder) {
    decoder->attach(target, 720, 1280);
    const Bytes keyframe = concat({SPS, PPS, idr(7)});
    decoder->onChunk(keyframe);

    EXPECT_TRUE(decoder->hasDecoder());
    EXPECT_EQ(script->sps, SPS);
    EXPECT_EQ(script->pps, PPS);
    EXPECT_EQ(script->submitted, (std::vector<Bytes>{keyframe}));
}

TEST_F(VideoStreamDecoderTest, LengthPrefixedInputIsNormalised) {
    decoder->attach(target, 720, 1280);
    decoder->onChunk({0, 0, 0, 4, 0x67, 0x42, 0x00, 0x1F});
    decoder->onChunk({0, 0, 0, 4, 0x68, 0xCE, 0x3C, 0x80});
    EXPECT_TRUE(decoder->hasDecoder());
    EXPECT_EQ(script->sps, SPS);
    EXPECT_EQ(script->pps, PPS);
}

TEST_F(VideoStreamDecoderTest, FirstParameterSetWins) {
    decoder->onChunk(SPS);
    decoder->onChunk({0, 0, 0, 1, 0x67, 0x64, 0x00, 0x28});
    decoder->onChunk(PPS);
    decoder->attach(target, 720, 1280);
    decoder->onChunk(idr(1));
    EXPECT_EQ(script->sps, SPS);
}

TEST_F(VideoStreamDecoderTest, PendingBufferIsCapped) {
    decoder->attach(target, 720, 1280);
    for (int i = 0; i < 105; i++) decoder->onChunk(slice(static_cast<uint8_t>(i)));

    EXPECT_EQ(decoder->pendingCount(), VideoStreamDecoder::DEFAULT_PENDING_LIMIT);
    auto stats = decoder->stats();
    EXPECT_EQ(stats.chunks_fed, 105u);
    EXPECT_EQ(stats.chunks_dropped, 5u);

    decoder->onChunk(concat({SPS, PPS}));
    ASSERT_EQ(script->submitted.size(), 100u);
    EXPECT_EQ(script->submitted.front(), slice(0));
    EXPECT_EQ(script->submitted.back(), slice(99));
}

TEST_F(VideoStreamDecoderTest, EmptyChunkIgnored) {
    decoder->onChunk({});
    EXPECT_EQ(decoder->stats().chunks_fed, 0u);
}

// ---------------------------------------------------------------------------
// Attach / detach / resize
// ---------------------------------------------------------------------------

TEST_F(VideoStreamDecoderTest, ParameterSetsSurviveDetach) {
    decoder->attach(target, 720, 1280);
    decoder->onChunk(concat({SPS, PPS, idr(1)}));
    ASSERT_TRUE(decoder->hasDecoder());

    decoder->detach();
    EXPECT_FALSE(decoder->isAttached());
    EXPECT_FALSE(decoder->hasDecoder());
    EXPECT_TRUE(decoder->hasParameterSets());
    EXPECT_EQ(script->closes, 1);

    decoder->attach(target, 720, 1280);
    decoder->onChunk(idr(2));
    EXPECT_TRUE(decoder->hasDecoder());
    EXPECT_EQ(script->opens, 2);
    EXPECT_EQ(script->submitted.back(), idr(2));
    EXPECT_EQ(decoder->stats().decoder_creations, 2u);
    EXPECT_EQ(decoder->stats().recoveries, 0u);
}

TEST_F(VideoStreamDecoderTest, ParameterSetsCapturedWhileDetached) {
    decoder->onChunk(SPS);
    decoder->onChunk(PPS);
    EXPECT_TRUE(decoder->hasParameterSets());
    EXPECT_FALSE(decoder->hasDecoder());
    EXPECT_EQ(script->factory_calls, 0);

    decoder->attach(target, 1080, 2400);
    decoder->onChunk(idr(1));
    EXPECT_TRUE(decoder->hasDecoder());
    EXPECT_EQ(script->width, 1080);
}

TEST_F(VideoStreamDecoderTest, AttachDropsPendingChunks) {
    decoder->attach(target, 720, 1280);
    decoder->onChunk(slice(1));
    decoder->onChunk(slice(2));
    decoder->attach(target, 720, 1280);
    EXPECT_EQ(decoder->pendingCount(), 0u);
}

TEST_F(VideoStreamDecoderTest, ResizeRebuildsDecoder) {
    decoder->attach(target, 720, 1280);
    decoder->onChunk(concat({SPS, PPS, idr(1)}));

    decoder->resize(720, 1280);
    EXPECT_TRUE(decoder->hasDecoder());

    decoder->resize(1080, 1920);
    EXPECT_FALSE(decoder->hasDecoder());
    decoder->onChunk(idr(2));
    EXPECT_TRUE(decoder->hasDecoder());
    EXPECT_EQ(script->width, 1080);
    EXPECT_EQ(script->height, 1920);
}

// ---------------------------------------------------------------------------
// Failures and recovery
// ---------------------------------------------------------------------------

TEST_F(VideoStreamDecoderTest, SubmitFailureRecovers) {
    decoder->attach(target, 720, 1280);
    decoder->onChunk(concat({SPS, PPS, idr(1)}));

    script->fail_next_submits = 1;
    decoder->onChunk(slice(2));
    EXPECT_FALSE(decoder->hasDecoder());
    EXPECT_TRUE(decoder->hasParameterSets());
    EXPECT_EQ(decoder->stats().consecutive_failures, 1u);

    decoder->onChunk(idr(3));
    EXPECT_TRUE(decoder->hasDecoder());
    EXPECT_EQ(script->submitted.back(), idr(3));

    auto stats = decoder->stats();
    EXPECT_EQ(stats.decoder_creations, 2u);
    EXPECT_EQ(stats.recoveries, 1u);
    EXPECT_EQ(stats.consecutive_failures, 0u);
}

TEST_F(VideoStreamDecoderTest, OpenFailureClearsBacklog) {
    script->fail_open = true;
    decoder->attach(target, 720, 1280);
    decoder->onChunk(idr(1));
    decoder->onChunk(concat({SPS, PPS}));

    EXPECT_FALSE(decoder->hasDecoder());
    EXPECT_EQ(decoder->pendingCount(), 0u);
    EXPECT_EQ(decoder->stats().consecutive_failures, 1u);

    script->fail_open = false;
    decoder->onChunk(idr(2));
    EXPECT_TRUE(decoder->hasDecoder());
    EXPECT_EQ(script->submitted, (std::vector<Bytes>{idr(2)}));
    EXPECT_EQ(decoder->stats().recoveries, 1u);
}

TEST_F(VideoStreamDecoderTest, NullBackendCountsAsFailure) {
    script->factory_returns_null = true;
    decoder->attach(target, 720, 1280);
    decoder->onChunk(concat({SPS, PPS, idr(1)}));
    EXPECT_FALSE(decoder->hasDecoder());
    EXPECT_EQ(decoder->stats().consecutive_failures, 1u);
}

TEST_F(VideoStreamDecoderTest, RepeatedFailuresAccumulate) {
    script->fail_open = true;
    decoder->attach(target, 720, 1280);
    decoder->onChunk(concat({SPS, PPS}));
    for (int i = 0; i < 6; i++) decoder->onChunk(idr(static_cast<uint8_t>(i)));
    EXPECT_EQ(decoder->stats().consecutive_failures, 7u);
    EXPECT_EQ(script->opens, 7);
}

// ---------------------------------------------------------------------------
// Frame capture
// ---------------------------------------------------------------------------

TEST_F(VideoStreamDecoderTest, CaptureWithoutTarget) {
    EXPECT_FALSE(decoder->captureFrame(std::chrono::milliseconds(10)).has_value());
}

TEST_F(VideoStreamDecoderTest, CaptureTimesOutWithoutFrames) {
    decoder->attach(target, 720, 1280);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(decoder->captureFrame(std::chrono::milliseconds(50)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST_F(VideoStreamDecoderTest, CaptureEncodesLatestFrame) {
    script->present_frames = true;
    decoder->attach(target, 720, 1280);
    decoder->onChunk(concat({SPS, PPS, idr(1)}));
    EXPECT_EQ(decoder->stats().frames_presented, 1u);

    auto png = decoder->captureFrame(std::chrono::milliseconds(100));
    ASSERT_TRUE(png.has_value());
    ASSERT_GT(png->size(), 8u);
    const Bytes signature = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    EXPECT_TRUE(std::equal(signature.begin(), signature.end(), png->begin()));
}

TEST_F(VideoStreamDecoderTest, FrameFromEarlierAttachIsNotCaptured) {
    script->present_frames = true;
    decoder->attach(target, 720, 1280);
    decoder->onChunk(concat({SPS, PPS, idr(1)}));
    ASSERT_TRUE(decoder->captureFrame(std::chrono::milliseconds(100)).has_value());

    decoder->detach();
    decoder->attach(target, 720, 1280);
    EXPECT_EQ(target->framesPresented(), 1u);
    EXPECT_FALSE(decoder->captureFrame(std::chrono::milliseconds(50)).has_value());

    // Cached parameter sets rebuild the decoder on the next slice
    decoder->onChunk(slice(2));
    EXPECT_EQ(target->framesPresented(), 2u);
    EXPECT_TRUE(decoder->captureFrame(std::chrono::milliseconds(100)).has_value());
}

TEST_F(VideoStreamDecoderTest, CaptureWaitsForFreshFrame) {
    script->present_frames = true;
    decoder->attach(target, 720, 1280);
    decoder->onChunk(concat({SPS, PPS}));

    auto pending = std::async(std::launch::async, [this] {
        return decoder->captureFrame(std::chrono::seconds(5));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    decoder->onChunk(idr(1));
    EXPECT_TRUE(pending.get().has_value());
}

TEST_F(VideoStreamDecoderTest, CaptureInFlightKeepsTargetAliveAfterDetach) {
    decoder->attach(target, 720, 1280);
    std::weak_ptr<FrameRenderTarget> weak = target;
    FrameRenderTarget* raw = target.get();

    auto pending = std::async(std::launch::async, [this] {
        return decoder->captureFrame(std::chrono::seconds(5));
    });
    // fixture + decoder + the capture's own reference
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (weak.use_count() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_EQ(weak.use_count(), 3);

    decoder->detach();
    target.reset();
    EXPECT_FALSE(weak.expired());

    raw->present(PIXELS, 2, 2, 0);
    EXPECT_TRUE(pending.get().has_value());
    EXPECT_TRUE(weak.expired());
}

TEST_F(VideoStreamDecoderTest, AttachRejectsNullTarget) {
    EXPECT_FALSE(decoder->attach(nullptr, 720, 1280));
    EXPECT_FALSE(decoder->isAttached());
}

