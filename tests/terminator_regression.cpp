#include "track/cell_terminator.h"
#include "test_support.h"

using test_support::box_cell;
using test_support::box_ring;

namespace
{
const char* kSuite = "terminator-regression";

int expect_true(bool cond, const std::string& message)
{
    return test_support::expect_true(kSuite, cond, message);
}

TerminationConfig base_config()
{
    TerminationConfig cfg;
    cfg.coverage_threshold_pct = 67.0;
    return cfg;
}

TrackedCell box_track(int id, int num_gates, double lon_min, double lat_min, double lon_max, double lat_max)
{
    TrackedCell c;
    c.id = id;
    c.num_gates = num_gates;
    c.alpha_shape = box_ring(lon_min, lat_min, lon_max, lat_max);
    c.bbox = BBox{lat_min, lat_max, lon_min, lon_max};
    c.centroid = {0.5 * (lat_min + lat_max), 0.5 * (lon_min + lon_max)};
    return c;
}

int test_contained_cell_is_removed()
{
    int failures = 0;
    std::vector<TrackedCell> cells;
    cells.push_back(box_track(1, 100, 260.0, 35.0, 260.2, 35.2));
    cells.push_back(box_track(2, 20, 260.05, 35.05, 260.1, 35.1));

    const auto out = track::CellTerminator(base_config()).terminate(cells);
    failures += expect_true(out.size() == 1 && out.front().id == 1, "fully covered smaller cell must be terminated");
    return failures;
}

int test_partial_overlap_is_kept()
{
    int failures = 0;
    std::vector<TrackedCell> cells;
    cells.push_back(box_track(1, 100, 260.0, 35.0, 260.2, 35.2));
    cells.push_back(box_track(2, 20, 260.15, 35.05, 260.25, 35.1));

    const double pct = track::CellTerminator::coverage_pct(cells[1].alpha_shape, cells[0].alpha_shape);
    failures += expect_true(std::abs(pct - 50.0) < 1.0, "half of the smaller cell must be covered");

    const auto out = track::CellTerminator(base_config()).terminate(cells);
    failures += expect_true(out.size() == 2, "50% coverage is below the threshold");
    return failures;
}

int test_equal_sizes_remove_the_later_cell()
{
    int failures = 0;
    std::vector<TrackedCell> cells;
    cells.push_back(box_track(7, 50, 260.0, 35.0, 260.1, 35.1));
    cells.push_back(box_track(3, 50, 260.0, 35.0, 260.1, 35.1));

    const auto removed = track::CellTerminator(base_config()).find_covered(
            {{7, 50, &cells[0].alpha_shape}, {3, 50, &cells[1].alpha_shape}});
    failures += expect_true(removed.size() == 1 && removed.front() == 1,
                            "on a size tie the earlier cell covers the later one");
    return failures;
}

int test_removed_cells_do_not_terminate_others()
{
    int failures = 0;
    // A покрывает B на 75%, B покрывает C на 75%, A покрывает C на 25%
    std::vector<TrackedCell> cells;
    cells.push_back(box_track(1, 100, 260.0, 35.0, 260.10, 35.1));
    cells.push_back(box_track(2, 80, 260.07, 35.0, 260.11, 35.1));
    cells.push_back(box_track(3, 60, 260.095, 35.0, 260.115, 35.1));

    const auto out = track::CellTerminator(base_config()).terminate(cells);
    failures += expect_true(out.size() == 2, "only the middle cell must be terminated");
    if (out.size() == 2)
    {
        failures += expect_true(out[0].id == 1 && out[1].id == 3, "survivors keep their order");
    }
    return failures;
}

int test_cells_without_polygon_are_never_terminated()
{
    int failures = 0;
    std::vector<TrackedCell> cells;
    cells.push_back(box_track(1, 100, 260.0, 35.0, 260.2, 35.2));
    cells.push_back(box_track(2, 5, 260.05, 35.05, 260.06, 35.06));
    cells[1].alpha_shape.clear();

    const auto out = track::CellTerminator(base_config()).terminate(cells);
    failures += expect_true(out.size() == 2, "coverage is measured on polygons only");
    failures += expect_true(track::CellTerminator::coverage_pct(Ring{}, cells[0].alpha_shape) == 0.0,
                            "empty ring has zero coverage");
    return failures;
}

int test_threshold_zero_needs_actual_overlap()
{
    int failures = 0;
    TerminationConfig cfg = base_config();
    cfg.coverage_threshold_pct = 0.0;
    std::vector<TrackedCell> cells;
    cells.push_back(box_track(1, 100, 260.0, 35.0, 260.1, 35.1));
    cells.push_back(box_track(2, 20, 261.0, 35.0, 261.05, 35.05));

    const auto out = track::CellTerminator(cfg).terminate(cells);
    failures += expect_true(out.size() == 2, "disjoint cells survive any threshold");
    return failures;
}

int test_works_on_candidates()
{
    int failures = 0;
    std::vector<CandidateCell> cells;
    cells.push_back(box_cell(4, 10, 260.02, 35.02, 260.04, 35.04));
    cells.push_back(box_cell(9, 300, 260.0, 35.0, 260.1, 35.1));

    const auto out = track::CellTerminator(base_config()).terminate(cells);
    failures += expect_true(out.size() == 1 && out.front().id == 9,
                            "larger cell later in the list still covers the smaller one");
    return failures;
}
} // namespace

int main()
{
    test_support::quiet_logging();

    int failures = 0;
    failures += test_contained_cell_is_removed();
    failures += test_partial_overlap_is_kept();
    failures += test_equal_sizes_remove_the_later_cell();
    failures += test_removed_cells_do_not_terminate_others();
    failures += test_cells_without_polygon_are_never_terminated();
    failures += test_threshold_zero_needs_actual_overlap();
    failures += test_works_on_candidates();
    return test_support::finish(kSuite, failures);
}
