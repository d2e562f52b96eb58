#include "track/assignment.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace track {

    // n <= m; a - (n x m) в 1-индексации внутри.
    static std::vector<int> hungarian(const cv::Mat &a) {
        const int n = a.rows;
        const int m = a.cols;
        const double inf = std::numeric_limits<double>::infinity();

        std::vector<double> u(n + 1, 0.0), v(m + 1, 0.0), minv(m + 1);
        std::vector<int> p(m + 1, 0), way(m + 1, 0);
        std::vector<bool> used(m + 1);

        for (int i = 1; i <= n; ++i) {
            p[0] = i;
            int j0 = 0;
            std::fill(minv.begin(), minv.end(), inf);
            std::fill(used.begin(), used.end(), false);
            do {
                used[j0] = true;
                const int i0 = p[j0];
                double delta = inf;
                int j1 = -1;
                for (int j = 1; j <= m; ++j) {
                    if (used[j]) continue;
                    const double cur = a.at<double>(i0 - 1, j - 1) - u[i0] - v[j];
                    if (cur < minv[j]) {
                        minv[j] = cur;
                        way[j] = j0;
                    }
                    if (minv[j] < delta) {
                        delta = minv[j];
                        j1 = j;
                    }
                }
                if (j1 < 0 || !std::isfinite(delta)) {
                    throw AssignmentError("no augmenting column for row " + std::to_string(i));
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
            do {
                const int j1 = way[j0];
                p[j0] = p[j1];
                j0 = j1;
            } while (j0 != 0);
        }

        std::vector<int> row_to_col(n, -1);
        for (int j = 1; j <= m; ++j) {
            if (p[j] != 0) row_to_col[p[j] - 1] = j - 1;
        }
        return row_to_col;
    }

    std::vector<int> solve_assignment(const cv::Mat &cost) {
        if (cost.type() != CV_64F || cost.dims != 2) {
            throw AssignmentError("cost matrix must be a 2-D CV_64F array");
        }
        if (cost.empty()) return std::vector<int>(static_cast<size_t>(cost.rows), -1);
        if (!cv::checkRange(cost, true)) {
            throw AssignmentError("cost matrix contains NaN or infinite values");
        }

        if (cost.rows <= cost.cols) return hungarian(cost);

        // строк больше: решаем транспонированную задачу
        const std::vector<int> col_to_row = hungarian(cost.t());
        std::vector<int> row_to_col(static_cast<size_t>(cost.rows), -1);
        for (int c = 0; c < cost.cols; ++c) {
            if (col_to_row[c] >= 0) row_to_col[col_to_row[c]] = c;
        }
        return row_to_col;
    }

} // namespace track
