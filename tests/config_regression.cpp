#include <toml++/toml.h>
#include "config.h"
#include "test_support.h"

#include <string_view>

using test_support::nearly_equal;

namespace
{
const char* kSuite = "config-regression";

int expect_true(bool cond, const std::string& message)
{
    return test_support::expect_true(kSuite, cond, message);
}

constexpr std::string_view kFullConfig = R"(
[detection]
seed_dbz = 45.0
expand_dbz = 35.0
min_gates = 10
max_iterations = 20
connectivity = 8
no_data_value = -99.0

[boundary]
alpha = 0.5

[merge]
size_ratio_threshold = 0.8
buffer_km = 2.0

[termination]
coverage_threshold_pct = 75.0
prune = true

[matching]
w_distance = 0.6
w_num_gates = 0.2
w_max_reflectivity = 0.2
max_gate_km = 15.0
distance_scale_deg = 5.0

[logging]
detection_logger = false
geometry_logger = true
merge_logger = false
termination_logger = false
matcher_logger = false
history_logger = false
store_logger = false
pipeline_logger = false
)";

int test_full_config_is_loaded()
{
    int failures = 0;
    const toml::table tbl = toml::parse(kFullConfig);
    AppConfig cfg;
    failures += expect_true(load_app_config(tbl, cfg), "complete config must load");
    failures += expect_true(nearly_equal(cfg.detection.seed_dbz, 45.0) && cfg.detection.connectivity == 8 &&
                                nearly_equal(cfg.detection.no_data_value, -99.0),
                            "detection table values");
    failures += expect_true(nearly_equal(cfg.boundary.alpha, 0.5), "boundary table values");
    failures += expect_true(nearly_equal(cfg.merge.buffer_km, 2.0), "merge table values");
    failures += expect_true(cfg.termination.prune && nearly_equal(cfg.termination.coverage_threshold_pct, 75.0),
                            "termination table values");
    failures += expect_true(nearly_equal(cfg.matching.max_gate_km, 15.0) &&
                                nearly_equal(cfg.matching.distance_scale_deg, 5.0),
                            "matching table values");
    failures += expect_true(cfg.logging.geometry_logger && !cfg.logging.pipeline_logger, "logging table values");
    return failures;
}

int test_invalid_table_keeps_defaults()
{
    int failures = 0;
    const toml::table tbl = toml::parse(R"(
[detection]
seed_dbz = 40.0
expand_dbz = 45.0
min_gates = 10
max_iterations = 20
connectivity = 4
no_data_value = -999.0

[boundary]
alpha = 0.3
)");
    AppConfig cfg;
    failures += expect_true(!load_app_config(tbl, cfg), "incomplete config must report failure");
    failures += expect_true(nearly_equal(cfg.detection.seed_dbz, 50.0) && nearly_equal(cfg.detection.expand_dbz, 40.0) &&
                                cfg.detection.min_gates == 25,
                            "expand above seed must leave all detection defaults");
    failures += expect_true(nearly_equal(cfg.boundary.alpha, 0.3), "valid tables are still applied");
    failures += expect_true(nearly_equal(cfg.matching.max_gate_km, 10.0), "missing tables keep defaults");
    return failures;
}

int test_bad_values_are_rejected()
{
    int failures = 0;
    DetectionConfig det;
    const toml::table bad_connectivity = toml::parse(R"(
[detection]
seed_dbz = 50.0
expand_dbz = 40.0
min_gates = 10
max_iterations = 20
connectivity = 6
no_data_value = -999.0
)");
    failures += expect_true(!load_detection_config(bad_connectivity, det) && det.connectivity == 4,
                            "connectivity other than 4 or 8 must be rejected");

    TerminationConfig term;
    const toml::table bad_type = toml::parse(R"(
[termination]
coverage_threshold_pct = "high"
prune = false
)");
    failures += expect_true(!load_termination_config(bad_type, term) &&
                                nearly_equal(term.coverage_threshold_pct, 67.0),
                            "wrong value type must be rejected");
    return failures;
}
} // namespace

int main()
{
    test_support::quiet_logging();

    int failures = 0;
    failures += test_full_config_is_loaded();
    failures += test_invalid_table_keeps_defaults();
    failures += test_bad_values_are_rejected();
    return test_support::finish(kSuite, failures);
}
