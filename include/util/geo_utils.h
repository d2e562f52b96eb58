#pragma once
#include <opencv2/core.hpp>

namespace util {

// 1 degree of latitude ~ 111 km; 1 degree of longitude ~ 111 km * cos(lat).
constexpr double kKmPerDegLat = 111.0;
// Longitude -180..180 -> 0..360.
double lon_to_0_360(double lon);

// Signed longitude difference (to - from) wrapped to [-180, 180).
double lon_delta(double lon_from, double lon_to);

// East-west / north-south displacement in km between two (lat, lon) points,
// latitude-corrected at the mean latitude. Signed: positive east / north.
double dx_km(double lat1, double lon1, double lat2, double lon2);
double dy_km(double lat1, double lat2);

// Buffer of `km` expressed in degrees at latitude `lat_deg`.
void km_to_deg(double lat_deg, double km, double &dlat, double &dlon);

// Local equirectangular projection of (lon, lat) points to km around an origin.
// x = east, y = north. Suitable for areas of a few hundred km.
struct LocalProjection {
    double origin_lat = 0.0;
    double origin_lon = 0.0;
    double cos_lat = 1.0;

    LocalProjection() = default;
    LocalProjection(double lat, double lon);

    cv::Point2d to_km(const cv::Point2d &lonlat) const;
};

} // namespace util
