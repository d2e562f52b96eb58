#pragma once
#include <opencv2/core.hpp>

#include <vector>
#include "config.h"

namespace detect {

    // Помеченные ядра: labels - CV_32S, 0 = фон, 1..num_seeds - ядра.
    struct SeedLabels {
        cv::Mat labels;
        int num_seeds = 0;
        std::vector<cv::Rect> bounds; // - bbox ядра по индексу метки (bounds[0] не используется).
        std::vector<int> areas;       // - число гейтов ядра по индексу метки.
    };

    class SeedDetector {
    public:
        explicit SeedDetector(const DetectionConfig& cfg);

        // refl - очищенная от NaN сетка CV_32F. Если ни один гейт не достигает
        // seed_dbz, возвращает num_seeds == 0.
        SeedLabels detect(const cv::Mat& refl) const;

    private:
        DetectionConfig cfg_;
    };

} // namespace detect
