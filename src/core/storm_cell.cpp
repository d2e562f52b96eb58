#include "core/storm_cell.h"

#include <algorithm>

std::optional<BBox> BBox::from_points(const std::vector<cv::Point2d> &lonlat) {
    if (lonlat.empty()) {
        return std::nullopt;
    }
    BBox b;
    b.lon_min = b.lon_max = lonlat.front().x;
    b.lat_min = b.lat_max = lonlat.front().y;
    for (const auto &p : lonlat) {
        b.lon_min = std::min(b.lon_min, p.x);
        b.lon_max = std::max(b.lon_max, p.x);
        b.lat_min = std::min(b.lat_min, p.y);
        b.lat_max = std::max(b.lat_max, p.y);
    }
    return b;
}

BBox BBox::united(const BBox &other) const {
    BBox u;
    u.lat_min = std::min(lat_min, other.lat_min);
    u.lat_max = std::max(lat_max, other.lat_max);
    u.lon_min = std::min(lon_min, other.lon_min);
    u.lon_max = std::max(lon_max, other.lon_max);
    return u;
}

bool BBox::near(const BBox &other, double buffer_lat, double buffer_lon) const {
    return !(lon_max + buffer_lon < other.lon_min ||
             lon_min - buffer_lon > other.lon_max ||
             lat_max + buffer_lat < other.lat_min ||
             lat_min - buffer_lat > other.lat_max);
}

Ring BBox::to_ring() const {
    return {{lon_min, lat_min},
            {lon_min, lat_max},
            {lon_max, lat_max},
            {lon_max, lat_min},
            {lon_min, lat_min}};
}

const char *to_string(GeometryStatus status) {
    switch (status) {
        case GeometryStatus::Polygon:
            return "polygon";
        case GeometryStatus::InsufficientGeometry:
            return "insufficient_geometry";
        case GeometryStatus::GeometryInvalid:
            return "geometry_invalid";
    }
    return "unknown";
}

HistorySnapshot make_snapshot(const CandidateCell &cell, const std::string &timestamp) {
    HistorySnapshot s;
    s.timestamp = timestamp;
    s.max_reflectivity_dbz = cell.max_reflectivity_dbz;
    s.num_gates = cell.num_gates;
    s.centroid = cell.centroid;
    return s;
}
