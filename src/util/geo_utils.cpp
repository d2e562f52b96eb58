#include "util/geo_utils.h"
#include <algorithm>
#include <cmath>

namespace util {

static double deg2rad(double deg) {
    return deg * CV_PI / 180.0;
}

double lon_to_0_360(double lon) {
    return lon < 0.0 ? lon + 360.0 : lon;
}

double lon_delta(double lon_from, double lon_to) {
    double d = std::fmod(lon_to - lon_from, 360.0);
    if (d >= 180.0) d -= 360.0;
    if (d < -180.0) d += 360.0;
    return d;
}

double dx_km(double lat1, double lon1, double lat2, double lon2) {
    const double mean_lat = deg2rad(0.5 * (lat1 + lat2));
    return lon_delta(lon1, lon2) * kKmPerDegLat * std::cos(mean_lat);
}

double dy_km(double lat1, double lat2) {
    return (lat2 - lat1) * kKmPerDegLat;
}

void km_to_deg(double lat_deg, double km, double &dlat, double &dlon) {
    dlat = km / kKmPerDegLat;
    // у полюса cos -> 0; ограничиваем, чтобы буфер оставался конечным
    const double c = std::max(std::cos(deg2rad(lat_deg)), 1e-6);
    dlon = km / (kKmPerDegLat * c);
}

LocalProjection::LocalProjection(double lat, double lon)
        : origin_lat(lat), origin_lon(lon), cos_lat(std::cos(deg2rad(lat))) {}

cv::Point2d LocalProjection::to_km(const cv::Point2d &lonlat) const {
    return {lon_delta(origin_lon, lonlat.x) * kKmPerDegLat * cos_lat,
            (lonlat.y - origin_lat) * kKmPerDegLat};
}

} // namespace util
