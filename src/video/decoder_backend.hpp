#pragma once
// =============================================================================
// DroidPilot - Decoder backend interface
// =============================================================================
// One backend instance per decoder lifetime. VideoStreamDecoder drops the
// instance after any error and builds a fresh one from the cached parameter
// sets.
// =============================================================================
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "render_target.hpp"
#include "../result.hpp"

namespace droidpilot::video {

class DecoderBackend {
public:
    virtual ~DecoderBackend() = default;

    // sps / pps are Annex-B framed. Decoded frames go to `target`, which
    // outlives the backend.
    virtual Result<void, DecodeError> open(const std::vector<uint8_t>& sps,
                                           const std::vector<uint8_t>& pps,
                                           int width, int height,
                                           RenderTarget& target) = 0;

    // Feeds one Annex-B chunk and presents every frame that becomes ready.
    // Returns the number of frames presented.
    virtual Result<int, DecodeError> submit(const std::vector<uint8_t>& chunk) = 0;

    virtual void close() = 0;
};

using DecoderBackendFactory = std::function<std::unique_ptr<DecoderBackend>()>;

} // namespace droidpilot::video
