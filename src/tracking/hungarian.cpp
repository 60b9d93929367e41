#include "ptrack/tracking/hungarian.hpp"

#include <limits>

namespace ptrack {

namespace {

// Potentials method, requires rows <= cols
std::vector<int> solve_wide(const Eigen::MatrixXd& a) {
    const int n = static_cast<int>(a.rows());
    const int m = static_cast<int>(a.cols());
    const double inf = std::numeric_limits<double>::infinity();

    std::vector<double> u(n + 1, 0.0), v(m + 1, 0.0);
    std::vector<int> p(m + 1, 0), way(m + 1, 0);

    for (int i = 1; i <= n; ++i) {
        p[0] = i;
        int j0 = 0;

        std::vector<double> minv(m + 1, inf);
        std::vector<bool> used(m + 1, false);

        do {
            used[j0] = true;
            const int i0 = p[j0];
            int j1 = 0;
            double delta = inf;

            for (int j = 1; j <= m; ++j) {
                if (used[j]) {
                    continue;
                }
                const double cur = a(i0 - 1, j - 1) - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                // Strict comparison keeps the lowest column on ties
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }

            for (int j = 0; j <= m; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }

            j0 = j1;
        } while (p[j0] != 0);

        // Augmenting path
        do {
            const int j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0);
    }

    std::vector<int> assignment(n, -1);
    for (int j = 1; j <= m; ++j) {
        if (p[j] != 0) {
            assignment[p[j] - 1] = j - 1;
        }
    }

    return assignment;
}

}  // namespace

std::vector<int> Hungarian::solve(const Eigen::MatrixXd& cost) {
    const int n = static_cast<int>(cost.rows());
    const int m = static_cast<int>(cost.cols());

    std::vector<int> assignment(n, -1);
    if (n == 0 || m == 0 || !cost.allFinite()) {
        return assignment;
    }

    if (n <= m) {
        return solve_wide(cost);
    }

    // Tall matrix: assign columns to rows, then invert
    const std::vector<int> by_col = solve_wide(cost.transpose());
    for (int j = 0; j < m; ++j) {
        if (by_col[j] >= 0) {
            assignment[by_col[j]] = j;
        }
    }

    return assignment;
}

}  // namespace ptrack
