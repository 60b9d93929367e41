#include "ptrack/tracking/association.hpp"
#include "ptrack/tracking/hungarian.hpp"
#include "ptrack/core/logger.hpp"

namespace ptrack {

AssociationResult associate(const Eigen::MatrixXd& ious, double iou_threshold) {
    const int num_dets = static_cast<int>(ious.rows());
    const int num_tracks = static_cast<int>(ious.cols());

    AssociationResult result;

    if (num_dets == 0 || num_tracks == 0) {
        for (int d = 0; d < num_dets; ++d) result.unmatched_detections.push_back(d);
        for (int t = 0; t < num_tracks; ++t) result.unmatched_tracks.push_back(t);
        return result;
    }

    if (!ious.allFinite()) {
        PTRACK_LOG_WARN("tracker", "Non-finite IoU matrix ({}x{}), skipping assignment",
                        num_dets, num_tracks);
    }

    const Eigen::MatrixXd cost = Eigen::MatrixXd::Ones(num_dets, num_tracks) - ious;
    const std::vector<int> assignment = Hungarian::solve(cost);

    std::vector<bool> track_matched(num_tracks, false);

    for (int d = 0; d < num_dets; ++d) {
        const int t = assignment[d];
        if (t >= 0 && ious(d, t) >= iou_threshold) {
            result.matches.emplace_back(d, t);
            track_matched[t] = true;
        } else {
            result.unmatched_detections.push_back(d);
        }
    }

    for (int t = 0; t < num_tracks; ++t) {
        if (!track_matched[t]) {
            result.unmatched_tracks.push_back(t);
        }
    }

    return result;
}

}  // namespace ptrack
