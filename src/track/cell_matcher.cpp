#include "track/cell_matcher.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include "track/assignment.h"
#include "util/geo_utils.h"

/*
    Сопоставление old -> new

    1) cost_matrix(old, new)
       - нормировка размеров и отражаемости по максимуму обоих поколений (не меньше 1.0);
       - расстояние между центроидами в градусах (долгота через lon_delta) делится на
         distance_scale_deg и ограничивается 1.0;
       - пара вне гейта (|dx| или |dy| > max_gate_km) получает +inf.

    2) match(old, new)
       - пустой вход или нет ни одной пары дешевле kPenaltyCost -> Infeasible;
       - +inf заменяется большой конечной стоимостью, точный решатель назначает
         полный набор пар, пары с cost >= kPenaltyCost отбрасываются -> Optimal;
       - исключение решателя -> greedy(cost) -> Fallback (пишется в cerr).
*/

namespace track {

    // Замена +inf перед точным решателем.
    static constexpr double kBlockedCost = kPenaltyCost * 10.0;

    CellFeatures features_of(const CandidateCell &cell) {
        return {cell.centroid, cell.num_gates, cell.max_reflectivity_dbz};
    }

    CellFeatures features_of(const TrackedCell &cell) {
        if (const HistorySnapshot *last = cell.latest()) {
            return {last->centroid, last->num_gates, last->max_reflectivity_dbz};
        }
        return {cell.centroid, cell.num_gates, cell.max_reflectivity_dbz};
    }

    const char *to_string(MatchQuality quality) {
        switch (quality) {
            case MatchQuality::Optimal:
                return "optimal";
            case MatchQuality::Fallback:
                return "fallback";
            case MatchQuality::Infeasible:
                return "infeasible";
        }
        return "unknown";
    }

    CellMatcher::CellMatcher(const MatchingConfig &cfg)
            : cfg_(cfg), solver_(solve_assignment) {}

    void CellMatcher::set_solver(Solver solver) {
        solver_ = solver ? std::move(solver) : Solver(solve_assignment);
    }

    bool CellMatcher::within_gate(const CellFeatures &a, const CellFeatures &b) const {
        const double dx = std::abs(util::dx_km(a.centroid.lat, a.centroid.lon, b.centroid.lat, b.centroid.lon));
        const double dy = std::abs(util::dy_km(a.centroid.lat, b.centroid.lat));
        return dx <= cfg_.max_gate_km && dy <= cfg_.max_gate_km;
    }

    double CellMatcher::pair_cost(const CellFeatures &a, const CellFeatures &b,
                                  double max_gates, double max_refl) const {
        const double dlat = a.centroid.lat - b.centroid.lat;
        const double dlon = util::lon_delta(a.centroid.lon, b.centroid.lon);
        const double norm_dist = std::min(std::sqrt(dlat * dlat + dlon * dlon) / cfg_.distance_scale_deg, 1.0);
        const double norm_gates = std::abs(a.num_gates - b.num_gates) / max_gates;
        const double norm_refl = std::abs(a.max_reflectivity_dbz - b.max_reflectivity_dbz) / max_refl;
        return cfg_.w_distance * norm_dist +
               cfg_.w_num_gates * norm_gates +
               cfg_.w_max_reflectivity * norm_refl;
    }

    cv::Mat CellMatcher::cost_matrix(const std::vector<CellFeatures> &old_cells,
                                     const std::vector<CellFeatures> &new_cells) const {
        const int n_old = static_cast<int>(old_cells.size());
        const int n_new = static_cast<int>(new_cells.size());
        cv::Mat cost(n_old, n_new, CV_64F, cv::Scalar(std::numeric_limits<double>::infinity()));

        double max_gates = 1.0;
        double max_refl = 1.0;
        for (const auto *set : {&old_cells, &new_cells}) {
            for (const auto &c : *set) {
                max_gates = std::max(max_gates, static_cast<double>(c.num_gates));
                max_refl = std::max(max_refl, c.max_reflectivity_dbz);
            }
        }

        for (int i = 0; i < n_old; ++i) {
            for (int j = 0; j < n_new; ++j) {
                if (!within_gate(old_cells[i], new_cells[j])) continue;
                cost.at<double>(i, j) = pair_cost(old_cells[i], new_cells[j], max_gates, max_refl);
            }
        }
        return cost;
    }

    std::vector<Match> CellMatcher::greedy(const cv::Mat &cost) {
        std::vector<Match> pairs;
        for (int i = 0; i < cost.rows; ++i) {
            for (int j = 0; j < cost.cols; ++j) {
                const double c = cost.at<double>(i, j);
                if (std::isfinite(c) && c < kPenaltyCost) pairs.push_back({i, j, c});
            }
        }
        std::stable_sort(pairs.begin(), pairs.end(), [](const Match &a, const Match &b) {
            return a.cost < b.cost;
        });

        std::vector<bool> row_used(static_cast<size_t>(cost.rows), false);
        std::vector<bool> col_used(static_cast<size_t>(cost.cols), false);
        std::vector<Match> out;
        for (const auto &m : pairs) {
            if (row_used[m.old_index] || col_used[m.new_index]) continue;
            row_used[m.old_index] = true;
            col_used[m.new_index] = true;
            out.push_back(m);
        }
        return out;
    }

    static void fill_unmatched(MatchResult &result, int n_old, int n_new) {
        std::sort(result.matches.begin(), result.matches.end(), [](const Match &a, const Match &b) {
            return a.old_index < b.old_index;
        });
        std::vector<bool> old_used(static_cast<size_t>(n_old), false);
        std::vector<bool> new_used(static_cast<size_t>(n_new), false);
        for (const auto &m : result.matches) {
            old_used[m.old_index] = true;
            new_used[m.new_index] = true;
        }
        for (int i = 0; i < n_old; ++i) {
            if (!old_used[i]) result.unmatched_old.push_back(i);
        }
        for (int j = 0; j < n_new; ++j) {
            if (!new_used[j]) result.unmatched_new.push_back(j);
        }
    }

    MatchResult CellMatcher::match(const std::vector<CellFeatures> &old_cells,
                                   const std::vector<CellFeatures> &new_cells) const {
        MatchResult result;
        const int n_old = static_cast<int>(old_cells.size());
        const int n_new = static_cast<int>(new_cells.size());

        if (n_old == 0 || n_new == 0) {
            if (g_logging.matcher_logger) {
                std::cout << "[MATCH] nothing to match (old=" << n_old << ", new=" << n_new << ")" << std::endl;
            }
            fill_unmatched(result, n_old, n_new);
            return result;
        }

        const cv::Mat cost = cost_matrix(old_cells, new_cells);

        bool feasible = false;
        for (int i = 0; i < n_old && !feasible; ++i) {
            for (int j = 0; j < n_new && !feasible; ++j) {
                feasible = cost.at<double>(i, j) < kPenaltyCost;
            }
        }
        if (!feasible) {
            if (g_logging.matcher_logger) {
                std::cout << "[MATCH] no pair below penalty cost (old=" << n_old << ", new=" << n_new << ")"
                          << std::endl;
            }
            fill_unmatched(result, n_old, n_new);
            return result;
        }

        cv::Mat finite = cost.clone();
        finite.setTo(kBlockedCost, finite == std::numeric_limits<double>::infinity());

        try {
            const std::vector<int> assignment = solver_(finite);
            if (static_cast<int>(assignment.size()) != n_old) {
                throw AssignmentError("solver returned " + std::to_string(assignment.size()) +
                                      " rows, expected " + std::to_string(n_old));
            }
            std::vector<bool> col_used(static_cast<size_t>(n_new), false);
            for (int i = 0; i < n_old; ++i) {
                const int j = assignment[i];
                if (j < 0) continue;
                if (j >= n_new || col_used[j]) {
                    throw AssignmentError("solver returned invalid column " + std::to_string(j));
                }
                col_used[j] = true;
                const double c = cost.at<double>(i, j);
                if (std::isfinite(c) && c < kPenaltyCost) result.matches.push_back({i, j, c});
            }
            result.quality = MatchQuality::Optimal;
        } catch (const std::exception &e) {
            std::cerr << "[MATCH] assignment solver failed: " << e.what()
                      << "; falling back to greedy matching" << std::endl;
            result.matches = greedy(cost);
            result.quality = MatchQuality::Fallback;
        }

        fill_unmatched(result, n_old, n_new);
        if (g_logging.matcher_logger) {
            std::cout << "[MATCH] " << to_string(result.quality)
                      << " matched=" << result.matches.size()
                      << " unmatched_old=" << result.unmatched_old.size()
                      << " unmatched_new=" << result.unmatched_new.size()
                      << std::endl;
        }
        return result;
    }

} // namespace track
