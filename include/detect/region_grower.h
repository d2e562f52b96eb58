#pragma once
#include <opencv2/core.hpp>

#include <functional>
#include <vector>
#include "config.h"
#include "core/reflectivity_grid.h"
#include "core/storm_cell.h"
#include "detect/seed_detector.h"

namespace detect {

    // Рост ядер по нижнему порогу с глобальным взаимным исключением.
    //
    // Принадлежность гейтов хранится в одной сетке владельцев (CV_32S, 0 = свободен),
    // поэтому гейт в любой момент принадлежит не более чем одной ячейке.
    // Внутри итерации кандидаты каждой ячейки считаются независимо (параллельно)
    // по состоянию на начало итерации, затем фиксируются последовательно по
    // возрастанию id: спорный гейт достаётся ячейке с меньшим id.
    class RegionGrower {
    public:
        // Вызывается после каждой итерации: номер итерации (с 1) и сетка владельцев.
        using SweepObserver = std::function<void(int, const cv::Mat&)>;

        explicit RegionGrower(const DetectionConfig& cfg);

        void set_sweep_observer(SweepObserver observer);

        // Полный проход: пороги, метки ядер, рост, отсев по min_gates,
        // статистики ячеек. Границы (alpha_shape/bbox) не заполняются.
        // Пустой результат, если ни один гейт не достиг seed_dbz.
        std::vector<CandidateCell> grow(const ReflectivityGrid& grid) const;

        // Рост по очищенной сетке. bounds/areas в seeds обновляются.
        // Возвращает сетку владельцев; sweeps - число выполненных итераций.
        cv::Mat grow_owners(const cv::Mat& refl, SeedLabels& seeds, int* sweeps = nullptr) const;

    private:
        CandidateCell make_cell(int id,
                                const cv::Mat& refl,
                                const cv::Mat& owner,
                                const cv::Rect& bounds,
                                const ReflectivityGrid& grid) const;

        DetectionConfig cfg_;
        SweepObserver observer_;
    };

} // namespace detect
