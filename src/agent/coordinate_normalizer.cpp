// =============================================================================
// DroidPilot - Coordinate normalizer
// =============================================================================
#include "coordinate_normalizer.hpp"

#include <algorithm>

#include "../droidpilot_log.hpp"

namespace droidpilot::agent {

CoordinateNormalizer::CoordinateNormalizer(int width, int height)
    : width_(width), height_(height) {}

void CoordinateNormalizer::setScreenSize(int width, int height) {
    if (width <= 0 || height <= 0) {
        DPLOG_WARN("Normalizer", "Ignoring invalid screen size %dx%d", width, height);
        return;
    }
    width_ = width;
    height_ = height;
    DPLOG_DEBUG("Normalizer", "Screen size %dx%d", width, height);
}

bool CoordinateNormalizer::isNormalized(int x, int y) const {
    if (x < 0 || x > NORMALIZED_MAX || y < 0 || y > NORMALIZED_MAX) return false;

    const int w = width_.load();
    const int h = height_.load();
    if (w > LARGE_SCREEN_EDGE || h > LARGE_SCREEN_EDGE) return true;

    // Thresholds are truncated to whole pixels before comparing
    const int x_threshold = static_cast<int>(w * SMALL_SCREEN_RATIO);
    const int y_threshold = static_cast<int>(h * SMALL_SCREEN_RATIO);
    return x < x_threshold || y < y_threshold;
}

Point CoordinateNormalizer::toPixel(Point p) const {
    const int w = width_.load();
    const int h = height_.load();
    int px = static_cast<int>(p.x * w / static_cast<double>(NORMALIZED_MAX));
    int py = static_cast<int>(p.y * h / static_cast<double>(NORMALIZED_MAX));
    return {std::clamp(px, 0, w), std::clamp(py, 0, h)};
}

Point CoordinateNormalizer::toNormalized(Point p) const {
    const int w = width_.load();
    const int h = height_.load();
    if (w <= 0 || h <= 0) return p;
    int nx = static_cast<int>(p.x * static_cast<double>(NORMALIZED_MAX) / w);
    int ny = static_cast<int>(p.y * static_cast<double>(NORMALIZED_MAX) / h);
    return {std::clamp(nx, 0, NORMALIZED_MAX), std::clamp(ny, 0, NORMALIZED_MAX)};
}

Point CoordinateNormalizer::resolve(Point p) const {
    if (!isNormalized(p.x, p.y)) return p;
    return toPixel(p);
}

} // namespace droidpilot::agent
