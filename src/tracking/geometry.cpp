#include "ptrack/tracking/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace ptrack {

float iou(const BoundingBox& a, const BoundingBox& b) {
    float x1 = std::max(a.x1, b.x1);
    float y1 = std::max(a.y1, b.y1);
    float x2 = std::min(a.x2, b.x2);
    float y2 = std::min(a.y2, b.y2);

    float inter_w = std::max(0.0f, x2 - x1);
    float inter_h = std::max(0.0f, y2 - y1);
    float inter_area = inter_w * inter_h;

    float union_area = a.area() + b.area() - inter_area;
    if (!(union_area > 0.0f) || inter_area <= 0.0f) {
        return 0.0f;
    }

    return std::clamp(inter_area / union_area, 0.0f, 1.0f);
}

Eigen::Vector4d to_cxcywh(const BoundingBox& box) {
    const double w = static_cast<double>(box.x2) - box.x1;
    const double h = static_cast<double>(box.y2) - box.y1;
    return Eigen::Vector4d(box.x1 + w / 2.0, box.y1 + h / 2.0, w, h);
}

BoundingBox from_cxcywh(double cx, double cy, double w, double h) {
    BoundingBox box;
    box.x1 = static_cast<float>(cx - w / 2.0);
    box.y1 = static_cast<float>(cy - h / 2.0);
    box.x2 = static_cast<float>(cx + w / 2.0);
    box.y2 = static_cast<float>(cy + h / 2.0);
    return box;
}

bool is_finite(const BoundingBox& box) {
    return std::isfinite(box.x1) && std::isfinite(box.y1) &&
           std::isfinite(box.x2) && std::isfinite(box.y2);
}

bool is_well_formed(const BoundingBox& box) {
    return is_finite(box) && box.x2 >= box.x1 && box.y2 >= box.y1;
}

Eigen::MatrixXd iou_matrix(const std::vector<BoundingBox>& detections,
                           const std::vector<BoundingBox>& tracks) {
    Eigen::MatrixXd m(detections.size(), tracks.size());

    for (size_t d = 0; d < detections.size(); ++d) {
        for (size_t t = 0; t < tracks.size(); ++t) {
            m(d, t) = iou(detections[d], tracks[t]);
        }
    }

    return m;
}

}  // namespace ptrack
