#pragma once

#include <opencv2/core.hpp>
#include <vector>

#include "config.h"
#include "core/storm_cell.h"
#include "geom/boundary_builder.h"

namespace blob {

    // Слияние ячеек одного скана в два этапа.
    //
    // A) малые ячейки (num_gates < max * size_ratio_threshold) вливаются в ближайшую
    //    по центроиду большую, если bbox малой, расширенный на buffer_km, касается
    //    bbox большой. Проходы повторяются, пока хоть одно слияние происходит.
    // B) пока есть пара ячеек с пересечением полигонов положительной площади,
    //    меньшая вливается в большую и просмотр начинается заново.
    //
    // Этап A проверяет соседство по bbox, этап B - по полигонам: пара может
    // пройти A раздельно, если bbox близки, а полигоны не пересекаются.
    class CellMerger {
    public:
        CellMerger(const MergeConfig& cfg, double alpha);

        // Выход: большие ячейки, затем оставшиеся малые (в исходном порядке).
        std::vector<CandidateCell> merge(std::vector<CandidateCell> cells) const;

        // Вливает small в large: сумма гейтов, центроид взвешенный по гейтам,
        // alpha-shape заново по точкам обеих границ, bbox - объединение.
        void absorb(CandidateCell& large, const CandidateCell& small) const;

        // Пересекаются ли полигоны (или bbox, если полигона нет) с площадью > 0.
        static bool overlaps(const CandidateCell& a, const CandidateCell& b);

    private:
        bool absorb_small(std::vector<CandidateCell>& large, std::vector<CandidateCell>& small) const;
        bool resolve_one_overlap(std::vector<CandidateCell>& cells) const;

        MergeConfig cfg_;
        geom::BoundaryBuilder builder_;
    };

} // namespace blob
