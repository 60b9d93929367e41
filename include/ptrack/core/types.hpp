#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace ptrack {

// ============================================================================
// Time Types
// ============================================================================
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// ============================================================================
// Bounding Box
// ============================================================================

/**
 * @brief Axis-aligned box in pixel coordinates, corner form
 */
struct BoundingBox {
    float x1 = 0.0f;
    float y1 = 0.0f;
    float x2 = 0.0f;
    float y2 = 0.0f;

    float width() const { return x2 - x1; }
    float height() const { return y2 - y1; }
    float area() const { return width() * height(); }
};

/**
 * @brief Integer box as reported to consumers
 */
struct PixelBox {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    bool operator==(const PixelBox& other) const {
        return x1 == other.x1 && y1 == other.y1 && x2 == other.x2 && y2 == other.y2;
    }
};

// Truncates toward zero, saturating at the int range
inline int to_pixel(float v) {
    constexpr double lo = static_cast<double>(std::numeric_limits<int>::min());
    constexpr double hi = static_cast<double>(std::numeric_limits<int>::max());
    return static_cast<int>(std::clamp(static_cast<double>(v), lo, hi));
}

inline PixelBox to_pixel_box(const BoundingBox& box) {
    return PixelBox{to_pixel(box.x1), to_pixel(box.y1), to_pixel(box.x2), to_pixel(box.y2)};
}

// ============================================================================
// Detection
// ============================================================================

/**
 * @brief One detector output box for one frame
 */
struct Detection {
    BoundingBox bbox;
    float confidence = 0.0f;
    int class_id = 0;
    std::string class_name = "person";
};

// ============================================================================
// Tracked Object
// ============================================================================

/**
 * @brief One emitted track for one frame
 *
 * tracking_id is 1-based and stable for the same physical object while
 * it stays tracked.
 */
struct TrackedObject {
    PixelBox bbox;
    uint64_t tracking_id = 0;
    float confidence = 0.0f;
    std::string class_name = "person";

    int hit_streak = 0;
    int time_since_update = 0;
};

using TrackedObjects = std::vector<TrackedObject>;

// ============================================================================
// Tracker Statistics
// ============================================================================
struct TrackerStats {
    uint64_t frames_processed = 0;
    uint64_t tracks_created = 0;
    uint64_t tracks_pruned = 0;        // Removed after max_age misses
    uint64_t tracks_diverged = 0;      // Removed on non-finite state
    uint64_t detections_rejected = 0;  // Malformed input boxes
    uint64_t emitted_objects = 0;
};

}  // namespace ptrack
