#pragma once

#include <Eigen/Dense>
#include <utility>
#include <vector>

namespace ptrack {

/**
 * @brief Outcome of matching detections to tracks
 *
 * The three sets are disjoint and together cover every detection and
 * every track index exactly once.
 */
struct AssociationResult {
    std::vector<std::pair<int, int>> matches;  // (detection, track)
    std::vector<int> unmatched_detections;
    std::vector<int> unmatched_tracks;
};

/**
 * @brief Optimal IoU matching with a quality gate
 *
 * Maximizes the total IoU over one-to-one pairs (minimizes 1 - IoU), then
 * rejects any pair with IoU below iou_threshold. A pair exactly at the
 * threshold is kept.
 *
 * @param ious IoU matrix, rows = detections, cols = tracks
 * @param iou_threshold Minimum IoU of an accepted pair
 */
AssociationResult associate(const Eigen::MatrixXd& ious, double iou_threshold);

}  // namespace ptrack
