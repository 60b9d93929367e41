#pragma once

#include "ptrack/core/types.hpp"
#include "ptrack/tracking/track.hpp"
#include "ptrack/tracking/tracker_config.hpp"

#include <cstdint>
#include <vector>

namespace ptrack {

/**
 * @brief IoU + Kalman multi-object tracker for one camera stream
 *
 * Each call to update() runs one full cycle:
 *   predict -> match -> update matched -> spawn -> prune -> emit
 *
 * The tracker is a single-writer object: one instance per stream, driven
 * from one thread. Ids come from a per-instance counter and are never
 * reused until reset().
 *
 * Usage:
 *   MultiObjectTracker tracker(TrackerConfig{});
 *   for each frame:
 *       auto objects = tracker.update(detections);
 */
class MultiObjectTracker {
public:
    /**
     * @throws ConfigurationError if config.validate() fails
     */
    explicit MultiObjectTracker(const TrackerConfig& config = TrackerConfig{});

    MultiObjectTracker(const MultiObjectTracker&) = delete;
    MultiObjectTracker& operator=(const MultiObjectTracker&) = delete;
    MultiObjectTracker(MultiObjectTracker&&) = default;
    MultiObjectTracker& operator=(MultiObjectTracker&&) = default;

    /**
     * @brief Process one frame of detections
     *
     * Malformed detections (non-finite or inverted boxes, non-finite
     * confidence) are dropped individually. Never throws on input.
     *
     * @param detections Detector output for the current frame
     * @return Emitted objects: confirmed tracks, or every live track while
     *         frame_count() <= min_hits
     */
    TrackedObjects update(const std::vector<Detection>& detections);

    /**
     * @brief Drop all tracks and restart frame and id counters
     *
     * Ids issued after a reset may repeat ids issued before it.
     */
    void reset();

    const TrackerConfig& config() const { return config_; }
    uint64_t frame_count() const { return frame_count_; }
    const std::vector<Track>& tracks() const { return tracks_; }
    const TrackerStats& stats() const { return stats_; }

private:
    std::vector<Detection> sanitize(const std::vector<Detection>& detections);

    void predict();
    void spawn(const Detection& detection);
    void prune();
    TrackedObjects emit();

    TrackerConfig config_;

    std::vector<Track> tracks_;
    uint64_t frame_count_ = 0;
    uint64_t next_id_ = 0;

    TrackerStats stats_;
};

}  // namespace ptrack
