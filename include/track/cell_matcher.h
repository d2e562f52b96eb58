#pragma once

#include <functional>
#include <vector>
#include <opencv2/core.hpp>

#include "config.h"
#include "core/storm_cell.h"

namespace track {

    // Стоимость, начиная с которой пара считается недопустимой.
    constexpr double kPenaltyCost = 1000.0;

    // Признаки ячейки, по которым считается стоимость пары.
    struct CellFeatures {
        LatLon centroid;
        int num_gates = 0;
        double max_reflectivity_dbz = 0.0;
    };

    CellFeatures features_of(const CandidateCell &cell);
    CellFeatures features_of(const TrackedCell &cell);

    struct Match {
        int old_index = -1;
        int new_index = -1;
        double cost = 0.0;
    };

    enum class MatchQuality {
        Optimal,   // - точный решатель
        Fallback,  // - решатель упал, жадное сопоставление
        Infeasible // - допустимых пар нет
    };

    const char *to_string(MatchQuality quality);

    struct MatchResult {
        MatchQuality quality = MatchQuality::Infeasible;
        std::vector<Match> matches;     // - по возрастанию old_index.
        std::vector<int> unmatched_old; // - кандидаты на завершение трека.
        std::vector<int> unmatched_new; // - кандидаты на новый трек.
    };

    // Сопоставление ячеек предыдущего поколения с ячейками нового скана.
    class CellMatcher {
    public:
        // Точный решатель; по умолчанию solve_assignment. Должен бросать при сбое.
        using Solver = std::function<std::vector<int>(const cv::Mat &)>;

        explicit CellMatcher(const MatchingConfig &cfg);

        void set_solver(Solver solver);

        // Смещение по каждой оси не больше max_gate_km.
        bool within_gate(const CellFeatures &a, const CellFeatures &b) const;

        // n_old x n_new, CV_64F; +inf для пар вне гейта.
        cv::Mat cost_matrix(const std::vector<CellFeatures> &old_cells,
                            const std::vector<CellFeatures> &new_cells) const;

        MatchResult match(const std::vector<CellFeatures> &old_cells,
                          const std::vector<CellFeatures> &new_cells) const;

        template <typename OldCell, typename NewCell>
        MatchResult match(const std::vector<OldCell> &old_cells, const std::vector<NewCell> &new_cells) const {
            std::vector<CellFeatures> a, b;
            a.reserve(old_cells.size());
            b.reserve(new_cells.size());
            for (const auto &c : old_cells) a.push_back(features_of(c));
            for (const auto &c : new_cells) b.push_back(features_of(c));
            return match(a, b);
        }

        // Все конечные пары дешевле kPenaltyCost по возрастанию стоимости,
        // берётся пара, если строка и столбец ещё свободны.
        static std::vector<Match> greedy(const cv::Mat &cost);

    private:
        double pair_cost(const CellFeatures &a, const CellFeatures &b,
                         double max_gates, double max_refl) const;

        MatchingConfig cfg_;
        Solver solver_;
    };

} // namespace track
