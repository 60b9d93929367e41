#include "ptrack/tracking/track.hpp"
#include "ptrack/tracking/geometry.hpp"

namespace ptrack {

namespace {

// Width used when the predicted size collapses
constexpr double kMinWidth = 1.0;

}  // namespace

Track::Track(uint64_t id, const Detection& seed, const KalmanNoise& noise)
    : id_(id)
    , kf_(noise)
    , confidence_(seed.confidence)
{
    kf_.initialize(to_cxcywh(seed.bbox));
}

BoundingBox Track::predict() {
    // Keep the filter well-posed when the box has shrunk to nothing
    auto& x = kf_.x();
    if (x(2) + x(3) <= 0.0) {
        x(2) = kMinWidth;
    }

    kf_.predict();
    age_++;

    if (time_since_update_ > 0) {
        hit_streak_ = 0;
    }
    time_since_update_++;

    return current_box();
}

bool Track::observe(const Detection& detection) {
    time_since_update_ = 0;
    hits_++;
    hit_streak_++;
    confidence_ = detection.confidence;

    return kf_.update(to_cxcywh(detection.bbox));
}

BoundingBox Track::current_box() const {
    const auto& x = kf_.x();
    return from_cxcywh(x(0), x(1), x(2), x(3));
}

TrackState Track::state(int min_hits) const {
    if (deleted_) {
        return TrackState::DELETED;
    }
    return hit_streak_ >= min_hits ? TrackState::CONFIRMED : TrackState::TENTATIVE;
}

}  // namespace ptrack
