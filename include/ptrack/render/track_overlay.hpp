#pragma once

#include "ptrack/core/types.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace ptrack {

/**
 * @brief Overlay style for tracked objects
 */
struct TrackOverlayConfig {
    float id_font_scale = 0.8f;
    float confidence_font_scale = 0.5f;
    int line_thickness = 2;
    bool draw_confidence = true;

    // Colors (BGR format)
    struct Colors {
        cv::Scalar box_color{0, 255, 0};       // Green boxes
        cv::Scalar label_bg{0, 255, 0};        // Green ID label background
        cv::Scalar label_text{0, 0, 0};        // Black ID text
    } colors;
};

/**
 * @brief Draws tracked boxes with their persistent ids
 *
 * Each object gets its box, an "ID #n" label on a filled background above
 * the top-left corner, and its confidence below the box.
 */
class TrackOverlay {
public:
    explicit TrackOverlay(const TrackOverlayConfig& config = TrackOverlayConfig{});

    /**
     * @brief Render onto the image in place
     */
    void render_inplace(cv::Mat& image, const TrackedObjects& objects) const;

    /**
     * @brief Render onto a copy, leaving the input untouched
     */
    cv::Mat render(const cv::Mat& image, const TrackedObjects& objects) const;

    const TrackOverlayConfig& config() const { return config_; }

private:
    void draw_object(cv::Mat& image, const TrackedObject& object) const;

    TrackOverlayConfig config_;
};

/**
 * @brief Label text for a tracked object ("ID #7")
 */
std::string id_label(const TrackedObject& object);

}  // namespace ptrack
