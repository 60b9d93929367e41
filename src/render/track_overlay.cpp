/**
 * @file track_overlay.cpp
 * @brief Tracked-object overlay using OpenCV
 */

#include "ptrack/render/track_overlay.hpp"
#include "ptrack/core/logger.hpp"

#include <opencv2/imgproc.hpp>
#include <iomanip>
#include <sstream>

namespace ptrack {

std::string id_label(const TrackedObject& object) {
    return "ID #" + std::to_string(object.tracking_id);
}

TrackOverlay::TrackOverlay(const TrackOverlayConfig& config)
    : config_(config)
{
}

void TrackOverlay::render_inplace(cv::Mat& image, const TrackedObjects& objects) const {
    if (image.empty()) {
        PTRACK_LOG_WARN("overlay", "TrackOverlay: empty image, nothing drawn");
        return;
    }

    for (const auto& obj : objects) {
        draw_object(image, obj);
    }
}

cv::Mat TrackOverlay::render(const cv::Mat& image, const TrackedObjects& objects) const {
    cv::Mat out = image.clone();
    render_inplace(out, objects);
    return out;
}

void TrackOverlay::draw_object(cv::Mat& image, const TrackedObject& object) const {
    const cv::Point top_left(object.bbox.x1, object.bbox.y1);
    const cv::Point bottom_right(object.bbox.x2, object.bbox.y2);

    cv::rectangle(image, top_left, bottom_right,
                  config_.colors.box_color, config_.line_thickness);

    // ID label on a filled background above the box
    const std::string label = id_label(object);
    int baseline = 0;
    cv::Size text_size = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX,
                                         config_.id_font_scale, 2, &baseline);

    cv::rectangle(image,
                  cv::Point(top_left.x, top_left.y - text_size.height - 15),
                  cv::Point(top_left.x + text_size.width + 10, top_left.y),
                  config_.colors.label_bg, cv::FILLED);

    cv::putText(image, label, cv::Point(top_left.x + 5, top_left.y - 8),
                cv::FONT_HERSHEY_SIMPLEX, config_.id_font_scale,
                config_.colors.label_text, 2);

    if (config_.draw_confidence) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << object.confidence;
        cv::putText(image, ss.str(), cv::Point(top_left.x, bottom_right.y + 20),
                    cv::FONT_HERSHEY_SIMPLEX, config_.confidence_font_scale,
                    config_.colors.box_color, 1);
    }
}

}  // namespace ptrack
