#include "detect/region_grower.h"

#include <opencv2/core/utility.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include "util/geo_utils.h"

namespace detect {

    RegionGrower::RegionGrower(const DetectionConfig& cfg) : cfg_(cfg) {}

    void RegionGrower::set_sweep_observer(SweepObserver observer) {
        observer_ = std::move(observer);
    }

    cv::Mat RegionGrower::grow_owners(const cv::Mat& refl, SeedLabels& seeds, int* sweeps) const {
        cv::Mat owner = seeds.labels.clone();
        if (sweeps) *sweeps = 0;
        const int n = seeds.num_seeds;
        if (n == 0) return owner;

        cv::Mat expand_ok;
        cv::compare(refl, cfg_.expand_dbz, expand_ok, cv::CMP_GE);

        const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
        const cv::Rect frame(0, 0, refl.cols, refl.rows);

        for (int sweep = 0; sweep < cfg_.max_iterations; ++sweep) {
            std::vector<std::vector<cv::Point>> claims(static_cast<size_t>(n) + 1);

            // 1) кандидаты каждой ячейки: кольцо дилатации & (refl >= expand) & свободные.
            //    owner здесь только читается.
            cv::parallel_for_(cv::Range(1, n + 1), [&](const cv::Range& range) {
                for (int id = range.start; id < range.end; ++id) {
                    const cv::Rect& b = seeds.bounds[id];
                    const cv::Rect roi = cv::Rect(b.x - 1, b.y - 1, b.width + 2, b.height + 2) & frame;

                    const cv::Mat own = owner(roi) == id;
                    cv::Mat dilated;
                    cv::dilate(own, dilated, kernel);

                    const cv::Mat unclaimed = owner(roi) == 0;
                    const cv::Mat candidates = dilated & expand_ok(roi) & unclaimed;
                    if (cv::countNonZero(candidates) == 0) continue;

                    std::vector<cv::Point> pts;
                    cv::findNonZero(candidates, pts);
                    for (auto& p : pts) p += roi.tl();
                    claims[id] = std::move(pts);
                }
            });

            // 2) фиксация по возрастанию id
            int claimed = 0;
            for (int id = 1; id <= n; ++id) {
                for (const auto& p : claims[id]) {
                    int& o = owner.at<int>(p);
                    if (o != 0) continue;
                    o = id;
                    ++claimed;
                    ++seeds.areas[id];
                    seeds.bounds[id] |= cv::Rect(p, cv::Size(1, 1));
                }
            }

            if (sweeps) *sweeps = sweep + 1;
            if (observer_) observer_(sweep + 1, owner);

            if (claimed == 0) {
                if (g_logging.detection_logger) {
                    std::cout << "[DET] growth reached fixpoint after " << sweep + 1 << " sweeps" << std::endl;
                }
                break;
            }
        }
        return owner;
    }

    CandidateCell RegionGrower::make_cell(int id,
                                          const cv::Mat& refl,
                                          const cv::Mat& owner,
                                          const cv::Rect& bounds,
                                          const ReflectivityGrid& grid) const {
        CandidateCell cell;
        cell.id = id;
        cell.max_reflectivity_dbz = -std::numeric_limits<double>::infinity();

        // долгота копится как смещение от первого гейта (шов 0/360)
        double lon0 = 0.0;
        bool have_lon0 = false;
        double core_w = 0.0, core_lat = 0.0, core_dlon = 0.0;
        double sum_lat = 0.0, sum_dlon = 0.0;

        for (int r = bounds.y; r < bounds.y + bounds.height; ++r) {
            const int* own_row = owner.ptr<int>(r);
            const float* refl_row = refl.ptr<float>(r);
            for (int c = bounds.x; c < bounds.x + bounds.width; ++c) {
                if (own_row[c] != id) continue;
                const double v = refl_row[c];
                const cv::Point2d ll = grid.lonlat_at(r, c);
                if (!have_lon0) {
                    lon0 = ll.x;
                    have_lon0 = true;
                }
                const double dlon = util::lon_delta(lon0, ll.x);

                cell.gates.emplace_back(c, r);
                cell.max_reflectivity_dbz = std::max(cell.max_reflectivity_dbz, v);
                sum_lat += ll.y;
                sum_dlon += dlon;
                // взвешенный центроид по ядру (>= seed_dbz), вес линейный по dBZ
                if (v >= cfg_.seed_dbz && v > 0.0) {
                    core_w += v;
                    core_lat += v * ll.y;
                    core_dlon += v * dlon;
                }
            }
        }
        cell.num_gates = static_cast<int>(cell.gates.size());

        if (core_w > 0.0) {
            cell.centroid.lat = core_lat / core_w;
            cell.centroid.lon = lon0 + core_dlon / core_w;
        } else {
            cell.centroid.lat = sum_lat / cell.num_gates;
            cell.centroid.lon = lon0 + sum_dlon / cell.num_gates;
        }
        return cell;
    }

    std::vector<CandidateCell> RegionGrower::grow(const ReflectivityGrid& grid) const {
        grid.validate();
        std::vector<CandidateCell> cells;
        if (grid.reflectivity.empty()) return cells;

        const cv::Mat refl = grid.sanitized(cfg_.no_data_value);
        SeedLabels seeds = SeedDetector(cfg_).detect(refl);
        if (seeds.num_seeds == 0) {
            if (g_logging.detection_logger) {
                std::cout << "[DET] no gates >= " << cfg_.seed_dbz << " dBZ, nothing to grow" << std::endl;
            }
            return cells;
        }
        if (g_logging.detection_logger) {
            std::cout << "[DET] found " << seeds.num_seeds << " seed cells >= " << cfg_.seed_dbz << " dBZ" << std::endl;
        }

        int sweeps = 0;
        const cv::Mat owner = grow_owners(refl, seeds, &sweeps);

        int dropped = 0;
        for (int id = 1; id <= seeds.num_seeds; ++id) {
            if (seeds.areas[id] < cfg_.min_gates) {
                ++dropped;
                continue;
            }
            cells.push_back(make_cell(id, refl, owner, seeds.bounds[id], grid));
        }

        if (g_logging.detection_logger) {
            std::cout << "[DET] sweeps=" << sweeps
                      << " cells=" << cells.size()
                      << " dropped_below_min_gates=" << dropped
                      << std::endl;
        }
        return cells;
    }

} // namespace detect
