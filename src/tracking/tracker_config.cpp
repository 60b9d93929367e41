#include "ptrack/tracking/tracker_config.hpp"
#include "ptrack/core/config.hpp"

#include <cmath>

namespace ptrack {

std::optional<std::string> TrackerConfig::validate() const {
    if (max_age <= 0) {
        return "max_age must be positive (got " + std::to_string(max_age) + ")";
    }
    if (min_hits <= 0) {
        return "min_hits must be positive (got " + std::to_string(min_hits) + ")";
    }
    if (!std::isfinite(iou_threshold) || iou_threshold < 0.0 || iou_threshold > 1.0) {
        return "iou_threshold must be within [0, 1] (got " + std::to_string(iou_threshold) + ")";
    }
    if (!(noise.measurement_noise > 0.0) || !std::isfinite(noise.measurement_noise)) {
        return "kalman.measurement_noise must be positive";
    }
    if (!(noise.velocity_uncertainty > 0.0) || !std::isfinite(noise.velocity_uncertainty)) {
        return "kalman.velocity_uncertainty must be positive";
    }
    if (!(noise.velocity_process_noise > 0.0) || !std::isfinite(noise.velocity_process_noise)) {
        return "kalman.velocity_process_noise must be positive";
    }
    if (class_name.empty()) {
        return "class_name must not be empty";
    }
    return std::nullopt;
}

TrackerConfig tracker_config_from(const Config& config) {
    TrackerConfig tc;

    tc.max_age = config.get_int("tracker.max_age", tc.max_age);
    tc.min_hits = config.get_int("tracker.min_hits", tc.min_hits);
    tc.iou_threshold = config.get_double("tracker.iou_threshold", tc.iou_threshold);
    tc.class_name = config.get_string("tracker.class_name", tc.class_name);

    tc.noise.measurement_noise = config.get_double(
        "tracker.kalman.measurement_noise", tc.noise.measurement_noise);
    tc.noise.velocity_uncertainty = config.get_double(
        "tracker.kalman.velocity_uncertainty", tc.noise.velocity_uncertainty);
    tc.noise.velocity_process_noise = config.get_double(
        "tracker.kalman.velocity_process_noise", tc.noise.velocity_process_noise);

    return tc;
}

}  // namespace ptrack
