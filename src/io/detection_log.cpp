#include "ptrack/io/detection_log.hpp"
#include "ptrack/core/logger.hpp"

#include <yaml-cpp/yaml.h>

namespace ptrack {

namespace {

constexpr const char* kLogModule = "detection_log";

std::optional<Detection> parse_detection(const YAML::Node& node, size_t frame, size_t index) {
    const YAML::Node bbox = node["bbox"];
    if (!bbox || !bbox.IsSequence() || bbox.size() != 4) {
        PTRACK_LOG_WARN(kLogModule, "Frame {} detection {}: bbox must be [x1, y1, x2, y2]",
                        frame, index);
        return std::nullopt;
    }

    try {
        Detection det;
        det.bbox.x1 = bbox[0].as<float>();
        det.bbox.y1 = bbox[1].as<float>();
        det.bbox.x2 = bbox[2].as<float>();
        det.bbox.y2 = bbox[3].as<float>();
        det.confidence = node["confidence"] ? node["confidence"].as<float>() : 1.0f;
        if (node["class"]) {
            det.class_name = node["class"].as<std::string>();
        }
        return det;
    } catch (const YAML::Exception& e) {
        PTRACK_LOG_WARN(kLogModule, "Frame {} detection {}: {}", frame, index, e.what());
        return std::nullopt;
    }
}

std::optional<DetectionLog> from_root(const YAML::Node& root) {
    const YAML::Node frames = root["frames"];
    if (!frames || !frames.IsSequence()) {
        PTRACK_LOG_ERROR(kLogModule, "Detection log has no 'frames' sequence");
        return std::nullopt;
    }

    DetectionLog log;
    log.frames.reserve(frames.size());

    for (size_t f = 0; f < frames.size(); ++f) {
        std::vector<Detection> detections;

        const YAML::Node dets = frames[f]["detections"];
        if (dets && dets.IsSequence()) {
            for (size_t i = 0; i < dets.size(); ++i) {
                if (auto det = parse_detection(dets[i], f, i)) {
                    detections.push_back(std::move(*det));
                }
            }
        }

        log.frames.push_back(std::move(detections));
    }

    return log;
}

}  // namespace

std::optional<DetectionLog> load_detection_log(const std::string& path) {
    try {
        auto log = from_root(YAML::LoadFile(path));
        if (log) {
            PTRACK_LOG_INFO(kLogModule, "Loaded {} frames ({} detections) from {}",
                            log->frames.size(), log->total_detections(), path);
        }
        return log;
    } catch (const YAML::Exception& e) {
        PTRACK_LOG_ERROR(kLogModule, "Failed to load detection log {}: {}", path, e.what());
        return std::nullopt;
    }
}

std::optional<DetectionLog> parse_detection_log(const std::string& yaml_text) {
    try {
        return from_root(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        PTRACK_LOG_ERROR(kLogModule, "Failed to parse detection log: {}", e.what());
        return std::nullopt;
    }
}

}  // namespace ptrack
