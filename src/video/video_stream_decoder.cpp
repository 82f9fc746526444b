// =============================================================================
// DroidPilot - Video stream decoder
// =============================================================================
#include "video_stream_decoder.hpp"

#include <string>
#include <utility>

#include "annexb.hpp"
#include "frame_encoder.hpp"
#include "../droidpilot_log.hpp"

namespace droidpilot::video {

namespace {

constexpr const char* TAG = "video";

// First 10 occurrences, then every 100th
bool shouldLog(uint64_t count) {
    return count <= 10 || count % 100 == 0;
}

} // namespace

VideoStreamDecoder::VideoStreamDecoder(DecoderBackendFactory factory, Options options)
    : factory_(std::move(factory)), options_(options) {}

VideoStreamDecoder::VideoStreamDecoder(DecoderBackendFactory factory)
    : VideoStreamDecoder(std::move(factory), Options{}) {}

VideoStreamDecoder::~VideoStreamDecoder() {
    std::lock_guard<std::mutex> lock(mutex_);
    releaseDecoderLocked();
}

bool VideoStreamDecoder::attach(std::shared_ptr<RenderTarget> target, int width, int height) {
    if (!target) {
        DPLOG_ERROR(TAG, "attach: null render target");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // SPS/PPS stay: the server does not resend them for a new target
    releaseDecoderLocked();
    pending_.clear();
    attach_sequence_ = target->framesPresented();
    target_ = std::move(target);
    width_ = width;
    height_ = height;
    DPLOG_INFO(TAG, "Attached %dx%d (parameter sets %s)", width, height,
               !sps_.empty() && !pps_.empty() ? "cached" : "pending");
    return true;
}

void VideoStreamDecoder::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    DPLOG_INFO(TAG, "Detaching");
    releaseDecoderLocked();
    target_.reset();
    pending_.clear();
}

void VideoStreamDecoder::resize(int width, int height) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (width == width_ && height == height_) return;
    DPLOG_INFO(TAG, "Stream size %dx%d -> %dx%d", width_, height_, width, height);
    width_ = width;
    height_ = height;
    releaseDecoderLocked();
}

void VideoStreamDecoder::onChunk(const std::vector<uint8_t>& chunk) {
    if (chunk.empty()) return;
    std::vector<uint8_t> packet = maybeConvertFraming(chunk);

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.chunks_fed++;

    if (decoder_) {
        submitLocked(packet);
        return;
    }

    bool other_data = false;
    captureParameterSetsLocked(packet, other_data);
    if (other_data) bufferLocked(std::move(packet));

    tryCreateDecoderLocked();
}

void VideoStreamDecoder::captureParameterSetsLocked(const std::vector<uint8_t>& packet,
                                                    bool& other_data) {
    const std::vector<NalUnit> units = splitNalUnits(packet);
    if (units.empty()) {
        other_data = true;
        return;
    }
    for (const NalUnit& unit : units) {
        std::vector<uint8_t>* slot = nullptr;
        if (unit.type == NAL_TYPE_SPS) slot = &sps_;
        else if (unit.type == NAL_TYPE_PPS) slot = &pps_;

        if (!slot) {
            other_data = true;
            continue;
        }
        if (slot->empty()) {
            auto begin = packet.begin() + static_cast<std::ptrdiff_t>(unit.offset);
            slot->assign(begin, begin + static_cast<std::ptrdiff_t>(unit.size));
            DPLOG_INFO(TAG, "Captured %s (%zu bytes)",
                       unit.type == NAL_TYPE_SPS ? "SPS" : "PPS", slot->size());
        }
    }
}

void VideoStreamDecoder::bufferLocked(std::vector<uint8_t> packet) {
    if (pending_.size() >= options_.pending_limit) {
        stats_.chunks_dropped++;
        if (shouldLog(stats_.chunks_dropped)) {
            DPLOG_WARN(TAG, "Pending buffer full (%zu), dropping chunk (dropped %llu)",
                       pending_.size(), static_cast<unsigned long long>(stats_.chunks_dropped));
        }
        return;
    }
    pending_.push_back(std::move(packet));
}

void VideoStreamDecoder::tryCreateDecoderLocked() {
    if (decoder_ || sps_.empty() || pps_.empty()) return;
    if (!target_ || width_ <= 0 || height_ <= 0) return;
    if (!factory_) {
        DPLOG_ERROR(TAG, "No decoder backend factory");
        return;
    }

    std::unique_ptr<DecoderBackend> backend = factory_();
    if (!backend) {
        recordFailureLocked("create", "backend factory returned null");
        pending_.clear();
        return;
    }
    auto opened = backend->open(sps_, pps_, width_, height_, *target_);
    if (opened.is_err()) {
        recordFailureLocked("open", opened.error().message);
        backend->close();
        pending_.clear();
        return;
    }

    decoder_ = std::move(backend);
    stats_.decoder_creations++;
    if (recovering_) {
        stats_.recoveries++;
        recovering_ = false;
    }

    std::deque<std::vector<uint8_t>> backlog;
    backlog.swap(pending_);
    DPLOG_INFO(TAG, "Decoder ready (%dx%d), draining %zu pending chunk(s)",
               width_, height_, backlog.size());
    for (const auto& packet : backlog) {
        if (!decoder_) break;  // failed mid-drain; rest of the backlog is dropped
        submitLocked(packet);
    }
}

void VideoStreamDecoder::submitLocked(const std::vector<uint8_t>& packet) {
    auto result = decoder_->submit(packet);
    if (result.is_err()) {
        recordFailureLocked("submit", result.error().message);
        releaseDecoderLocked();
        pending_.clear();
        return;
    }
    stats_.frames_presented += static_cast<uint64_t>(result.value());
    stats_.consecutive_failures = 0;
}

void VideoStreamDecoder::recordFailureLocked(const char* what, const std::string& message) {
    stats_.consecutive_failures++;
    recovering_ = true;
    const uint64_t n = stats_.consecutive_failures;
    if (n == static_cast<uint64_t>(CONSECUTIVE_FAILURE_ALERT)) {
        DPLOG_ERROR(TAG, "Decoder failed %llu times in a row (last %s: %s)",
                    static_cast<unsigned long long>(n), what, message.c_str());
    } else if (shouldLog(n)) {
        DPLOG_WARN(TAG, "Decoder %s failed: %s (consecutive %llu)",
                   what, message.c_str(), static_cast<unsigned long long>(n));
    }
}

void VideoStreamDecoder::releaseDecoderLocked() {
    if (!decoder_) return;
    decoder_->close();
    decoder_.reset();
}

std::optional<std::vector<uint8_t>> VideoStreamDecoder::captureFrame() {
    return captureFrame(std::chrono::milliseconds(options_.capture_timeout_ms));
}

std::optional<std::vector<uint8_t>> VideoStreamDecoder::captureFrame(std::chrono::milliseconds timeout) {
    std::shared_ptr<RenderTarget> target;
    uint64_t after = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = target_;
        after = attach_sequence_;
    }
    if (!target) {
        DPLOG_WARN(TAG, "captureFrame: no render target attached");
        return std::nullopt;
    }

    // Waits without holding mutex_ so the stream thread can keep presenting
    std::optional<Frame> frame = target->waitForFrame(after, timeout);
    if (!frame) {
        DPLOG_WARN(TAG, "captureFrame: no fresh frame within %lld ms",
                   static_cast<long long>(timeout.count()));
        return std::nullopt;
    }
    auto png = encodePng(*frame);
    if (png.is_err()) {
        DPLOG_WARN(TAG, "captureFrame: %s", png.error().message.c_str());
    }
    return png.ok();
}

bool VideoStreamDecoder::isAttached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_ != nullptr;
}

bool VideoStreamDecoder::hasDecoder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decoder_ != nullptr;
}

bool VideoStreamDecoder::hasParameterSets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !sps_.empty() && !pps_.empty();
}

size_t VideoStreamDecoder::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

VideoStreamDecoder::Stats VideoStreamDecoder::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace droidpilot::video
