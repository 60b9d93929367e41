#pragma once

#include "ptrack/core/types.hpp"

#include <Eigen/Dense>
#include <vector>

namespace ptrack {

/**
 * @brief Intersection over Union of two corner-form boxes
 *
 * @return Value in [0, 1]; 0 if the boxes do not overlap or the union
 *         area is not positive
 */
float iou(const BoundingBox& a, const BoundingBox& b);

/**
 * @brief Corner form to [cx, cy, w, h]
 */
Eigen::Vector4d to_cxcywh(const BoundingBox& box);

/**
 * @brief [cx, cy, w, h] to corner form
 */
BoundingBox from_cxcywh(double cx, double cy, double w, double h);

bool is_finite(const BoundingBox& box);

/**
 * @brief Finite and not inverted (zero width or height is allowed)
 */
bool is_well_formed(const BoundingBox& box);

/**
 * @brief IoU matrix, rows = detections, cols = track boxes
 */
Eigen::MatrixXd iou_matrix(const std::vector<BoundingBox>& detections,
                           const std::vector<BoundingBox>& tracks);

}  // namespace ptrack
