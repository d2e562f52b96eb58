#include "detect/seed_detector.h"

#include <opencv2/imgproc.hpp>

namespace detect {

    SeedDetector::SeedDetector(const DetectionConfig& cfg) : cfg_(cfg) {}

    SeedLabels SeedDetector::detect(const cv::Mat& refl) const {
        SeedLabels out;
        out.labels = cv::Mat::zeros(refl.size(), CV_32S);
        if (refl.empty()) return out;

        cv::Mat seed_mask;
        cv::compare(refl, cfg_.seed_dbz, seed_mask, cv::CMP_GE);
        if (cv::countNonZero(seed_mask) == 0) return out;

        cv::Mat stats, centroids;
        const int n = cv::connectedComponentsWithStats(seed_mask, out.labels, stats, centroids,
                                                       cfg_.connectivity, CV_32S);
        out.num_seeds = n - 1;
        out.bounds.resize(n);
        out.areas.resize(n, 0);
        for (int id = 1; id < n; ++id) {
            out.bounds[id] = cv::Rect(stats.at<int>(id, cv::CC_STAT_LEFT),
                                      stats.at<int>(id, cv::CC_STAT_TOP),
                                      stats.at<int>(id, cv::CC_STAT_WIDTH),
                                      stats.at<int>(id, cv::CC_STAT_HEIGHT));
            out.areas[id] = stats.at<int>(id, cv::CC_STAT_AREA);
        }
        return out;
    }

} // namespace detect
