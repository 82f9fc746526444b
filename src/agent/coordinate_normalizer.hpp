#pragma once
// =============================================================================
// DroidPilot - Model coordinate space <-> device pixels
// =============================================================================
// Models emit positions on a 0..1000 grid. Pixel coordinates that happen to
// fall inside that range must not be rescaled, so detection is heuristic:
//   - either value outside 0..1000       -> pixels
//   - screen larger than 1200 on an axis -> normalized (pixels that small are
//                                           unlikely on such a screen)
//   - otherwise normalized when x < int(90% of width) or
//     y < int(90% of height)
// =============================================================================
#include <atomic>

#include "action.hpp"

namespace droidpilot::agent {

class CoordinateNormalizer {
public:
    static constexpr int NORMALIZED_MAX = 1000;
    static constexpr int LARGE_SCREEN_EDGE = 1200;
    static constexpr double SMALL_SCREEN_RATIO = 0.9;

    explicit CoordinateNormalizer(int width = 1080, int height = 2400);

    // Called when the device (or virtual display) reports its size
    void setScreenSize(int width, int height);
    int screenWidth() const { return width_.load(); }
    int screenHeight() const { return height_.load(); }

    bool isNormalized(int x, int y) const;

    // 0..1000 -> pixels, clamped to the screen
    Point toPixel(Point p) const;
    // pixels -> 0..1000
    Point toNormalized(Point p) const;

    // toPixel() when isNormalized(), else unchanged
    Point resolve(Point p) const;

private:
    std::atomic<int> width_;
    std::atomic<int> height_;
};

} // namespace droidpilot::agent
