#pragma once

#include "ptrack/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ptrack {

/**
 * @brief Recorded detector output, one entry per processed frame
 *
 * YAML layout:
 *
 *   frames:
 *     - detections:
 *         - bbox: [x1, y1, x2, y2]
 *           confidence: 0.91
 *     - detections: []
 */
struct DetectionLog {
    std::vector<std::vector<Detection>> frames;

    size_t total_detections() const {
        size_t n = 0;
        for (const auto& f : frames) n += f.size();
        return n;
    }
};

/**
 * @brief Load a detection log from a YAML file
 *
 * Entries without a 4-element numeric bbox are skipped with a warning.
 *
 * @return Parsed log, or nullopt if the file is missing or not valid YAML
 */
std::optional<DetectionLog> load_detection_log(const std::string& path);

/**
 * @brief Parse a detection log from YAML text
 */
std::optional<DetectionLog> parse_detection_log(const std::string& yaml_text);

}  // namespace ptrack
