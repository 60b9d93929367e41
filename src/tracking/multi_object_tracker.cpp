#include "ptrack/tracking/multi_object_tracker.hpp"
#include "ptrack/tracking/association.hpp"
#include "ptrack/tracking/geometry.hpp"
#include "ptrack/core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace ptrack {

namespace {

constexpr const char* kLogModule = "tracker";

}  // namespace

MultiObjectTracker::MultiObjectTracker(const TrackerConfig& config)
    : config_(config)
{
    if (auto error = config_.validate()) {
        PTRACK_LOG_ERROR(kLogModule, "Invalid tracker configuration: {}", *error);
        throw ConfigurationError(*error);
    }

    PTRACK_LOG_INFO(kLogModule, "MultiObjectTracker initialized: max_age={}, min_hits={}, iou={}",
                    config_.max_age, config_.min_hits, config_.iou_threshold);
}

TrackedObjects MultiObjectTracker::update(const std::vector<Detection>& detections) {
    const std::vector<Detection> dets = sanitize(detections);

    frame_count_++;
    stats_.frames_processed++;

    PTRACK_LOG_TRACE(kLogModule, "Frame {}: tracks={} detections={}",
                     frame_count_, tracks_.size(), dets.size());

    predict();

    if (!dets.empty() && !tracks_.empty()) {
        std::vector<BoundingBox> det_boxes;
        det_boxes.reserve(dets.size());
        for (const auto& det : dets) {
            det_boxes.push_back(det.bbox);
        }

        std::vector<BoundingBox> track_boxes;
        track_boxes.reserve(tracks_.size());
        for (const auto& track : tracks_) {
            track_boxes.push_back(track.current_box());
        }

        const AssociationResult assoc =
            associate(iou_matrix(det_boxes, track_boxes), config_.iou_threshold);

        for (const auto& [d, t] : assoc.matches) {
            Track& track = tracks_[t];
            const TrackState before = track.state(config_.min_hits);

            if (!track.observe(dets[d])) {
                PTRACK_LOG_WARN(kLogModule, "Track {} diverged on update, removing", track.id());
                track.mark_deleted();
                stats_.tracks_diverged++;
                continue;
            }

            if (before == TrackState::TENTATIVE &&
                track.state(config_.min_hits) == TrackState::CONFIRMED)
            {
                PTRACK_LOG_DEBUG(kLogModule, "Track {} confirmed (hits={})",
                                 track.id(), track.hits());
            }
        }

        // Spawn after all matches so track indices stay valid
        for (int d : assoc.unmatched_detections) {
            spawn(dets[d]);
        }
    } else {
        for (const auto& det : dets) {
            spawn(det);
        }
    }

    prune();

    return emit();
}

void MultiObjectTracker::reset() {
    tracks_.clear();
    frame_count_ = 0;
    next_id_ = 0;

    PTRACK_LOG_INFO(kLogModule, "MultiObjectTracker reset");
}

std::vector<Detection> MultiObjectTracker::sanitize(const std::vector<Detection>& detections) {
    std::vector<Detection> out;
    out.reserve(detections.size());

    for (const auto& det : detections) {
        if (!is_well_formed(det.bbox) || !std::isfinite(det.confidence)) {
            PTRACK_LOG_WARN(kLogModule, "Rejecting malformed detection [{}, {}, {}, {}] conf={}",
                            det.bbox.x1, det.bbox.y1, det.bbox.x2, det.bbox.y2, det.confidence);
            stats_.detections_rejected++;
            continue;
        }

        Detection clean = det;
        clean.confidence = std::clamp(det.confidence, 0.0f, 1.0f);
        out.push_back(std::move(clean));
    }

    return out;
}

void MultiObjectTracker::predict() {
    for (auto& track : tracks_) {
        const BoundingBox box = track.predict();

        if (!is_finite(box) || !track.filter().is_finite()) {
            PTRACK_LOG_WARN(kLogModule, "Track {} diverged on predict, removing", track.id());
            track.mark_deleted();
            stats_.tracks_diverged++;
        }
    }

    tracks_.erase(
        std::remove_if(tracks_.begin(), tracks_.end(),
            [&](const Track& t) { return t.state(config_.min_hits) == TrackState::DELETED; }),
        tracks_.end());
}

void MultiObjectTracker::spawn(const Detection& detection) {
    tracks_.emplace_back(next_id_++, detection, config_.noise);
    stats_.tracks_created++;

    PTRACK_LOG_DEBUG(kLogModule, "Create tentative track {} @ [{:.1f} {:.1f} {:.1f} {:.1f}]",
                     tracks_.back().id(),
                     detection.bbox.x1, detection.bbox.y1,
                     detection.bbox.x2, detection.bbox.y2);
}

void MultiObjectTracker::prune() {
    const size_t before = tracks_.size();

    for (auto& track : tracks_) {
        if (track.state(config_.min_hits) != TrackState::DELETED &&
            track.time_since_update() > config_.max_age)
        {
            track.mark_deleted();
            stats_.tracks_pruned++;
            PTRACK_LOG_DEBUG(kLogModule, "Track {} expired after {} missed frames",
                             track.id(), track.time_since_update());
        }
    }

    tracks_.erase(
        std::remove_if(tracks_.begin(), tracks_.end(),
            [&](const Track& t) { return t.state(config_.min_hits) == TrackState::DELETED; }),
        tracks_.end());

    const size_t after = tracks_.size();
    if (after != before) {
        PTRACK_LOG_DEBUG(kLogModule, "Pruned {} tracks (remaining={})", before - after, after);
    }
}

TrackedObjects MultiObjectTracker::emit() {
    TrackedObjects objects;

    // Report everything during the first min_hits frames so startup is not silent
    const bool warming_up = frame_count_ <= static_cast<uint64_t>(config_.min_hits);

    for (const auto& track : tracks_) {
        if (track.hit_streak() < config_.min_hits && !warming_up) {
            continue;
        }

        TrackedObject obj;
        obj.bbox = to_pixel_box(track.current_box());
        obj.tracking_id = track.id() + 1;
        obj.confidence = track.confidence();
        obj.class_name = config_.class_name;
        obj.hit_streak = track.hit_streak();
        obj.time_since_update = track.time_since_update();
        objects.push_back(std::move(obj));
    }

    stats_.emitted_objects += objects.size();
    return objects;
}

}  // namespace ptrack
