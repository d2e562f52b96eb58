#include "detect/region_grower.h"
#include "detect/seed_detector.h"
#include "test_support.h"

#include <limits>
#include <map>
#include <stdexcept>

using test_support::make_grid;
using test_support::fill_patch;
using test_support::nearly_equal;

namespace
{
const char* kSuite = "region-grower-regression";

int expect_true(bool cond, const std::string& message)
{
    return test_support::expect_true(kSuite, cond, message);
}

DetectionConfig base_config()
{
    DetectionConfig cfg;
    cfg.seed_dbz = 50.0;
    cfg.expand_dbz = 40.0;
    cfg.min_gates = 5;
    cfg.max_iterations = 100;
    cfg.connectivity = 4;
    return cfg;
}

int test_single_patch_yields_one_cell()
{
    int failures = 0;
    ReflectivityGrid grid = make_grid(50, 50, 0.0f, "2024-05-01T12:00:00");
    fill_patch(grid, 20, 20, 5, 5, 60.0f);

    const auto cells = detect::RegionGrower(base_config()).grow(grid);
    failures += expect_true(cells.size() == 1, "single 5x5 patch must give exactly one cell");
    if (cells.size() != 1) return failures;

    const CandidateCell& c = cells.front();
    failures += expect_true(c.num_gates >= 25, "cell must cover the whole patch");
    failures += expect_true(c.num_gates == static_cast<int>(c.gates.size()), "num_gates must equal gate count");
    failures += expect_true(nearly_equal(c.max_reflectivity_dbz, 60.0), "max reflectivity must be 60 dBZ");
    failures += expect_true(nearly_equal(c.centroid.lat, test_support::kLat0 + 22 * test_support::kStep),
                            "centroid latitude must be the patch center");
    failures += expect_true(nearly_equal(c.centroid.lon, test_support::kLon0 + 22 * test_support::kStep),
                            "centroid longitude must be the patch center");
    return failures;
}

int test_weak_grid_yields_no_cells()
{
    int failures = 0;
    ReflectivityGrid grid = make_grid(50, 50, 30.0f, "2024-05-01T12:00:00");
    bool threw = false;
    std::vector<CandidateCell> cells;
    try
    {
        cells = detect::RegionGrower(base_config()).grow(grid);
    }
    catch (const std::exception&)
    {
        threw = true;
    }
    failures += expect_true(!threw, "grid below seed threshold must not throw");
    failures += expect_true(cells.empty(), "grid below seed threshold must give no cells");
    return failures;
}

int test_hysteresis_band_extends_footprint()
{
    int failures = 0;
    ReflectivityGrid grid = make_grid(40, 40, 10.0f, "2024-05-01T12:00:00");
    fill_patch(grid, 10, 10, 7, 7, 45.0f);   // полоса роста
    fill_patch(grid, 12, 12, 3, 3, 60.0f);   // ядро
    fill_patch(grid, 30, 30, 4, 4, 45.0f);   // без ядра - не растёт

    const auto cells = detect::RegionGrower(base_config()).grow(grid);
    failures += expect_true(cells.size() == 1, "only the seeded region becomes a cell");
    if (cells.size() != 1) return failures;
    failures += expect_true(cells.front().num_gates == 49, "cell must grow over the whole 7x7 expand band");

    // центроид по ядру, а не по всей маске
    failures += expect_true(nearly_equal(cells.front().centroid.lat, test_support::kLat0 + 13 * test_support::kStep),
                            "weighted centroid must sit on the core");
    return failures;
}

int test_growth_is_exclusive_and_monotonic()
{
    int failures = 0;
    ReflectivityGrid grid = make_grid(30, 40, 0.0f, "2024-05-01T12:00:00");
    fill_patch(grid, 10, 2, 10, 36, 45.0f);
    fill_patch(grid, 14, 6, 2, 2, 60.0f);
    fill_patch(grid, 14, 30, 2, 2, 60.0f);

    DetectionConfig cfg = base_config();
    cfg.min_gates = 1;
    detect::RegionGrower grower(cfg);

    cv::Mat previous;
    std::map<int, int> previous_counts;
    bool reassigned = false;
    bool shrank = false;
    int observed_sweeps = 0;
    grower.set_sweep_observer([&](int, const cv::Mat& owner) {
        ++observed_sweeps;
        std::map<int, int> counts;
        for (int r = 0; r < owner.rows; ++r)
        {
            for (int c = 0; c < owner.cols; ++c)
            {
                const int o = owner.at<int>(r, c);
                if (o != 0) ++counts[o];
                if (!previous.empty())
                {
                    const int p = previous.at<int>(r, c);
                    if (p != 0 && p != o) reassigned = true;
                }
            }
        }
        for (const auto& kv : previous_counts)
        {
            if (counts[kv.first] < kv.second) shrank = true;
        }
        previous = owner.clone();
        previous_counts = counts;
    });

    const auto cells = grower.grow(grid);
    failures += expect_true(observed_sweeps > 0, "observer must see at least one sweep");
    failures += expect_true(!reassigned, "a claimed gate must never change owner");
    failures += expect_true(!shrank, "cell size must be non-decreasing across sweeps");
    failures += expect_true(cells.size() == 2, "two seeds in one band must stay two cells");

    int total = 0;
    for (const auto& c : cells) total += c.num_gates;
    failures += expect_true(total == 10 * 36, "the band must be split without gaps or double counting");
    return failures;
}

int test_contested_gate_goes_to_lower_id()
{
    int failures = 0;
    cv::Mat refl(1, 9, CV_32F, cv::Scalar(45.0f));
    refl.at<float>(0, 2) = 60.0f;
    refl.at<float>(0, 6) = 60.0f;

    DetectionConfig cfg = base_config();
    detect::SeedLabels seeds = detect::SeedDetector(cfg).detect(refl);
    failures += expect_true(seeds.num_seeds == 2, "two separate seeds expected");

    int sweeps = 0;
    const cv::Mat owner = detect::RegionGrower(cfg).grow_owners(refl, seeds, &sweeps);
    failures += expect_true(owner.at<int>(0, 4) == seeds.labels.at<int>(0, 2),
                            "equidistant gate must go to the lower id");
    failures += expect_true(cv::countNonZero(owner == 0) == 0, "every expandable gate must be claimed");
    failures += expect_true(seeds.areas[1] + seeds.areas[2] == 9, "areas must be updated during growth");
    return failures;
}

int test_growth_is_deterministic()
{
    int failures = 0;
    ReflectivityGrid grid = make_grid(60, 60, 0.0f, "2024-05-01T12:00:00");
    fill_patch(grid, 5, 5, 30, 40, 42.0f);
    fill_patch(grid, 8, 8, 3, 3, 58.0f);
    fill_patch(grid, 20, 30, 4, 2, 63.0f);
    fill_patch(grid, 30, 12, 2, 5, 51.0f);

    detect::RegionGrower grower(base_config());
    const auto a = grower.grow(grid);
    const auto b = grower.grow(grid);
    failures += expect_true(a.size() == b.size(), "same grid must give the same number of cells");
    for (size_t i = 0; i < a.size() && i < b.size(); ++i)
    {
        failures += expect_true(a[i].gates == b[i].gates, "cell gates must be identical run to run");
        failures += expect_true(a[i].centroid.lat == b[i].centroid.lat && a[i].centroid.lon == b[i].centroid.lon,
                                "cell centroid must be identical run to run");
    }
    return failures;
}

int test_small_cells_are_dropped()
{
    int failures = 0;
    ReflectivityGrid grid = make_grid(30, 30, 0.0f, "2024-05-01T12:00:00");
    fill_patch(grid, 2, 2, 1, 3, 60.0f);
    fill_patch(grid, 15, 15, 4, 4, 60.0f);

    DetectionConfig cfg = base_config();
    cfg.min_gates = 5;
    const auto cells = detect::RegionGrower(cfg).grow(grid);
    failures += expect_true(cells.size() == 1, "cell below min_gates must be dropped");
    if (!cells.empty()) failures += expect_true(cells.front().num_gates == 16, "surviving cell keeps its gates");
    return failures;
}

int test_no_data_and_nan_are_ignored()
{
    int failures = 0;
    ReflectivityGrid grid = make_grid(20, 20, 0.0f, "2024-05-01T12:00:00");
    fill_patch(grid, 5, 5, 5, 5, 60.0f);
    grid.reflectivity.at<float>(5, 5) = std::numeric_limits<float>::quiet_NaN();
    grid.reflectivity.at<float>(5, 6) = -999.0f;

    const auto cells = detect::RegionGrower(base_config()).grow(grid);
    failures += expect_true(cells.size() == 1, "patch with missing gates is still one cell");
    if (!cells.empty()) failures += expect_true(cells.front().num_gates == 23, "missing gates are not claimed");
    return failures;
}

int test_zero_iterations_keeps_seeds()
{
    int failures = 0;
    ReflectivityGrid grid = make_grid(20, 20, 45.0f, "2024-05-01T12:00:00");
    fill_patch(grid, 8, 8, 3, 3, 60.0f);

    DetectionConfig cfg = base_config();
    cfg.max_iterations = 0;
    const auto cells = detect::RegionGrower(cfg).grow(grid);
    failures += expect_true(cells.size() == 1 && cells.front().num_gates == 9,
                            "max_iterations = 0 must leave only the seed gates");
    return failures;
}

int test_grid_contract_violations_throw()
{
    int failures = 0;
    const cv::Mat refl(10, 10, CV_32F, cv::Scalar(0.0f));
    const cv::Mat lat_bad(7, 1, CV_64F, cv::Scalar(35.0));
    const cv::Mat lon(1, 10, CV_64F, cv::Scalar(260.0));

    bool threw = false;
    try
    {
        ReflectivityGrid::make(refl, lat_bad, lon, "2024-05-01T12:00:00");
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "mismatched latitude axis must throw invalid_argument");

    threw = false;
    try
    {
        ReflectivityGrid::make(refl, cv::Mat(), lon, "2024-05-01T12:00:00");
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "empty coordinates with non-empty data must throw invalid_argument");

    const cv::Mat lat2d(10, 10, CV_64F, cv::Scalar(35.5));
    const ReflectivityGrid ok = ReflectivityGrid::make(refl, lat2d, lon, "2024-05-01T12:00:00");
    failures += expect_true(ok.lon.size() == refl.size() && nearly_equal(ok.lonlat_at(3, 4).y, 35.5),
                            "2-D and 1-D coordinates must both be accepted");

    const cv::Mat lon_west(1, 10, CV_64F, cv::Scalar(-100.0));
    const ReflectivityGrid west = ReflectivityGrid::make(refl, lat2d, lon_west, "2024-05-01T12:00:00");
    failures += expect_true(nearly_equal(west.lonlat_at(0, 0).x, 260.0), "western longitudes are stored as 0..360");
    return failures;
}
} // namespace

int main()
{
    test_support::quiet_logging();

    int failures = 0;
    failures += test_single_patch_yields_one_cell();
    failures += test_weak_grid_yields_no_cells();
    failures += test_hysteresis_band_extends_footprint();
    failures += test_growth_is_exclusive_and_monotonic();
    failures += test_contested_gate_goes_to_lower_id();
    failures += test_growth_is_deterministic();
    failures += test_small_cells_are_dropped();
    failures += test_no_data_and_nan_are_ignored();
    failures += test_zero_iterations_keeps_seeds();
    failures += test_grid_contract_violations_throw();
    return test_support::finish(kSuite, failures);
}
