#pragma once

#include "ptrack/core/types.hpp"
#include "ptrack/tracking/kalman_box_filter.hpp"

#include <cstdint>

namespace ptrack {

/**
 * @brief Lifecycle phase of a track
 */
enum class TrackState : uint8_t {
    TENTATIVE = 0,  // hit_streak < min_hits
    CONFIRMED,      // hit_streak >= min_hits
    DELETED         // Removed from the live set
};

inline const char* to_string(TrackState state) {
    switch (state) {
        case TrackState::TENTATIVE: return "TENTATIVE";
        case TrackState::CONFIRMED: return "CONFIRMED";
        case TrackState::DELETED: return "DELETED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief One hypothesized physical object across frames
 *
 * Owns the box filter and the lifecycle counters. Only observe() counts
 * as a hit; a freshly seeded track has hits == hit_streak == 0.
 */
class Track {
public:
    Track(uint64_t id, const Detection& seed, const KalmanNoise& noise);

    /**
     * @brief Advance one frame
     *
     * Resets hit_streak if the previous frame was already a miss, then
     * increments age and time_since_update.
     *
     * @return Predicted box (may be non-finite if the filter diverged)
     */
    BoundingBox predict();

    /**
     * @brief Correct with a matched detection
     *
     * @return false if the filter diverged
     */
    bool observe(const Detection& detection);

    /**
     * @brief Current estimate in corner form (does not advance the filter)
     */
    BoundingBox current_box() const;

    /**
     * @brief Lifecycle phase for a given confirmation threshold
     */
    TrackState state(int min_hits) const;

    void mark_deleted() { deleted_ = true; }

    uint64_t id() const { return id_; }
    int age() const { return age_; }
    int hits() const { return hits_; }
    int hit_streak() const { return hit_streak_; }
    int time_since_update() const { return time_since_update_; }

    // Confidence of the latest matched (or seeding) detection
    float confidence() const { return confidence_; }

    const KalmanBoxFilter& filter() const { return kf_; }

private:
    uint64_t id_;
    KalmanBoxFilter kf_;

    int age_ = 0;
    int hits_ = 0;
    int hit_streak_ = 0;
    int time_since_update_ = 0;
    float confidence_ = 0.0f;
    bool deleted_ = false;
};

}  // namespace ptrack
