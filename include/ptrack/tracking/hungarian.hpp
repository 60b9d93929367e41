#pragma once

#include <Eigen/Dense>
#include <vector>

namespace ptrack {

/**
 * @brief Hungarian (Kuhn-Munkres) algorithm for minimum-cost assignment
 *
 * Solves the rectangular linear assignment problem exactly. When there
 * are more rows than columns the surplus rows stay unassigned.
 *
 * Output:
 *   assignment[i] = j  -> row i assigned to column j
 *   assignment[i] = -1 -> unassigned
 *
 * A cost matrix with non-finite entries is rejected and every row comes
 * back unassigned.
 */
class Hungarian {
public:
    static std::vector<int> solve(const Eigen::MatrixXd& cost);
};

}  // namespace ptrack
