#include "util/geo_utils.h"
#include "util/timestamp.h"
#include "test_support.h"

#include <algorithm>
#include <vector>

using test_support::nearly_equal;

namespace
{
const char* kSuite = "timestamp-regression";

int expect_true(bool cond, const std::string& message)
{
    return test_support::expect_true(kSuite, cond, message);
}

// 2024-05-01T12:00:00Z
constexpr double kNoonMay1 = 1714564800.0;

int test_parse_formats()
{
    int failures = 0;
    const auto plain = util::parse_timestamp("2024-05-01T12:00:00");
    failures += expect_true(plain && nearly_equal(*plain, kNoonMay1), "plain ISO time must parse as UTC");

    const auto zulu = util::parse_timestamp("2024-05-01T12:00:00Z");
    failures += expect_true(zulu && nearly_equal(*zulu, kNoonMay1), "'Z' suffix must parse");

    const auto offset = util::parse_timestamp("2024-05-01T14:00:00+02:00");
    failures += expect_true(offset && nearly_equal(*offset, kNoonMay1), "offset must be applied");

    const auto space = util::parse_timestamp("2024-05-01 12:00:00.5");
    failures += expect_true(space && nearly_equal(*space, kNoonMay1 + 0.5), "space separator and fraction must parse");

    failures += expect_true(!util::parse_timestamp("not-a-time"), "garbage must not parse");
    failures += expect_true(!util::parse_timestamp("2024-13-01T00:00:00"), "month 13 must not parse");
    failures += expect_true(!util::parse_timestamp("2024-05-01T12:00:00 junk"), "trailing text must not parse");

    const auto now = util::parse_timestamp(util::utc_now_iso());
    failures += expect_true(now.has_value(), "current time string must parse");
    return failures;
}

int test_ordering_and_equality()
{
    int failures = 0;
    failures += expect_true(util::timestamp_less("2024-05-01T12:00:00", "2024-05-01T12:02:00"), "earlier sorts first");
    failures += expect_true(util::timestamp_less("2024-05-01T13:00:00+02:00", "2024-05-01T12:00:00"),
                            "ordering must use time, not text");
    failures += expect_true(!(util::timestamp_less("2024-05-01T12:00:00Z", "2024-05-01T12:00:00") &&
                              util::timestamp_less("2024-05-01T12:00:00", "2024-05-01T12:00:00Z")),
                            "equal instants must be ordered consistently");

    // неразобранная метка идёт после всех разобранных, порядок остаётся транзитивным
    const std::string east = "2024-05-01T10:00:00+02:00";
    const std::string plain = "2024-05-01T09:00:00";
    const std::string partial = "2024-05-01T09:30";
    failures += expect_true(util::timestamp_less(east, plain) && util::timestamp_less(plain, partial) &&
                                util::timestamp_less(east, partial) && !util::timestamp_less(partial, east),
                            "mixed parsed and unparsed stamps must order transitively");
    std::vector<std::string> stamps = {partial, plain, "scan-a", east};
    std::stable_sort(stamps.begin(), stamps.end(), util::timestamp_less);
    failures += expect_true(stamps == std::vector<std::string>({east, plain, partial, "scan-a"}),
                            "sort puts parsed stamps by time, then the rest by text");
    failures += expect_true(util::timestamp_equal("2024-05-01T12:00:00Z", "2024-05-01T12:00:00"),
                            "'Z' and plain UTC are the same instant");
    failures += expect_true(!util::timestamp_equal("2024-05-01T12:00:00", "2024-05-01T12:00:01"),
                            "different seconds are different instants");
    failures += expect_true(util::timestamp_equal("scan-a", "scan-a") && !util::timestamp_equal("scan-a", "scan-b"),
                            "unparseable stamps compare as text");
    return failures;
}

int test_timestamp_from_filename()
{
    int failures = 0;
    const auto mrms = util::timestamp_from_filename("/data/MRMS_MergedReflectivityQC_00.50_20240501-120200.grib2");
    failures += expect_true(mrms && *mrms == "2024-05-01T12:02:00", "MRMS file name stamp");

    const auto goes = util::timestamp_from_filename("OR_ABI-L2-CMIPC-M6C13_G16_s20241221200204_e20241221202577.nc");
    failures += expect_true(goes && *goes == "2024-05-01T12:00:20", "GOES day-of-year stamp");

    failures += expect_true(!util::timestamp_from_filename("/data/20240501-120200/grid.yml"),
                            "only the file name is searched");
    return failures;
}

int test_longitude_helpers()
{
    int failures = 0;
    failures += expect_true(nearly_equal(util::lon_delta(359.9, 0.1), 0.2, 1e-9), "delta across 0/360 goes east");
    failures += expect_true(nearly_equal(util::lon_delta(0.1, 359.9), -0.2, 1e-9), "delta across 0/360 goes west");
    failures += expect_true(nearly_equal(util::lon_to_0_360(-100.0), 260.0), "-180..180 -> 0..360");
    failures += expect_true(nearly_equal(util::lon_to_0_360(260.0), 260.0), "0..360 is left as is");
    failures += expect_true(nearly_equal(util::dy_km(35.0, 35.01), 1.11, 1e-9), "0.01 deg latitude is 1.11 km");

    double dlat = 0.0, dlon = 0.0;
    util::km_to_deg(60.0, 1.11, dlat, dlon);
    failures += expect_true(nearly_equal(dlat, 0.01, 1e-12) && nearly_equal(dlon, 0.02, 1e-9),
                            "km buffer in degrees widens with latitude");
    return failures;
}
} // namespace

int main()
{
    int failures = 0;
    failures += test_parse_formats();
    failures += test_ordering_and_equality();
    failures += test_timestamp_from_filename();
    failures += test_longitude_helpers();
    return test_support::finish(kSuite, failures);
}
