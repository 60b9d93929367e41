#pragma once

#include "ptrack/tracking/kalman_box_filter.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace ptrack {

class Config;

/**
 * @brief Raised when a tracker is constructed with invalid parameters
 */
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Tracker configuration, fixed for the tracker's lifetime
 */
struct TrackerConfig {
    // ----------------------------
    // Assignment / lifecycle
    // ----------------------------
    int max_age = 30;             // Misses tolerated before deletion
    int min_hits = 3;             // Consecutive matches before confirmation
    double iou_threshold = 0.3;   // Minimum IoU of an accepted match

    // ----------------------------
    // Motion model
    // ----------------------------
    KalmanNoise noise;

    // Class label attached to every emitted object
    std::string class_name = "person";

    /**
     * @brief Check all parameters
     *
     * @return Description of the first violation, or nullopt if valid
     */
    std::optional<std::string> validate() const;
};

/**
 * @brief Read the "tracker" section of a configuration
 *
 * Keys that are absent keep their TrackerConfig defaults. The result is
 * not validated.
 */
TrackerConfig tracker_config_from(const Config& config);

}  // namespace ptrack
