#include "blob/cell_merger.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include "geom/geometry.h"
#include "util/geo_utils.h"

namespace blob {

    // Пересечение меньше этой площади считается касанием (шум float в intersectConvexConvex).
    static constexpr double kMinOverlapKm2 = 1e-3;

    static Ring footprint(const CandidateCell& c) {
        if (geom::open_ring(c.alpha_shape).size() >= 3) return c.alpha_shape;
        if (c.bbox) return c.bbox->to_ring();
        return {};
    }

    // Точки границы для пересчёта alpha-shape; без полигона - углы bbox.
    static std::vector<cv::Point2d> outline_points(const CandidateCell& c) {
        if (!c.alpha_shape.empty()) return geom::open_ring(c.alpha_shape);
        if (c.bbox) return geom::open_ring(c.bbox->to_ring());
        return {};
    }

    static double centroid_dist_km(const LatLon& a, const LatLon& b) {
        const double dx = util::dx_km(a.lat, a.lon, b.lat, b.lon);
        const double dy = util::dy_km(a.lat, b.lat);
        return std::sqrt(dx * dx + dy * dy);
    }

    CellMerger::CellMerger(const MergeConfig& cfg, double alpha)
            : cfg_(cfg), builder_(alpha) {}

    bool CellMerger::overlaps(const CandidateCell& a, const CandidateCell& b) {
        if (a.bbox && b.bbox && !a.bbox->near(*b.bbox, 0.0, 0.0)) return false;
        const Ring ra = footprint(a);
        const Ring rb = footprint(b);
        if (ra.empty() || rb.empty()) return false;
        return geom::intersection_area_km2(ra, rb) > kMinOverlapKm2;
    }

    void CellMerger::absorb(CandidateCell& large, const CandidateCell& small) const {
        const int total = large.num_gates + small.num_gates;
        if (total > 0) {
            const double wl = static_cast<double>(large.num_gates) / total;
            const double ws = static_cast<double>(small.num_gates) / total;
            large.centroid.lat = large.centroid.lat * wl + small.centroid.lat * ws;
            // долготу усредняем через разность, чтобы не ломаться на шве 0/360
            large.centroid.lon += util::lon_delta(large.centroid.lon, small.centroid.lon) * ws;
        }
        large.num_gates = total;
        large.max_reflectivity_dbz = std::max(large.max_reflectivity_dbz, small.max_reflectivity_dbz);
        large.gates.insert(large.gates.end(), small.gates.begin(), small.gates.end());

        std::vector<cv::Point2d> pts = outline_points(large);
        const std::vector<cv::Point2d> other = outline_points(small);
        pts.insert(pts.end(), other.begin(), other.end());

        const geom::Boundary b = builder_.build(pts);
        if (b.status == GeometryStatus::Polygon) {
            large.alpha_shape = b.ring;
            large.geometry_status = GeometryStatus::Polygon;
        } else {
            large.alpha_shape.clear();
            large.geometry_status = b.status;
        }

        if (large.bbox && small.bbox) {
            large.bbox = large.bbox->united(*small.bbox);
        } else if (small.bbox) {
            large.bbox = small.bbox;
        }
    }

    bool CellMerger::absorb_small(std::vector<CandidateCell>& large, std::vector<CandidateCell>& small) const {
        bool merged_any = false;
        std::vector<CandidateCell> remaining;
        remaining.reserve(small.size());

        for (auto& s : small) {
            if (!s.bbox) {
                remaining.push_back(std::move(s));
                continue;
            }
            double buf_lat = 0.0, buf_lon = 0.0;
            util::km_to_deg(s.centroid.lat, cfg_.buffer_km, buf_lat, buf_lon);

            CandidateCell* closest = nullptr;
            double best = std::numeric_limits<double>::infinity();
            for (auto& l : large) {
                if (!l.bbox || !s.bbox->near(*l.bbox, buf_lat, buf_lon)) continue;
                const double d = centroid_dist_km(s.centroid, l.centroid);
                if (d < best) {
                    best = d;
                    closest = &l;
                }
            }

            if (!closest || s.num_gates >= closest->num_gates * cfg_.size_ratio_threshold) {
                remaining.push_back(std::move(s));
                continue;
            }

            if (g_logging.merge_logger) {
                std::cout << "[MERGE] small cell " << s.id << " (" << s.num_gates << " gates) -> cell "
                          << closest->id << " (" << closest->num_gates << " gates), dist=" << best << " km"
                          << std::endl;
            }
            absorb(*closest, s);
            merged_any = true;
        }
        small = std::move(remaining);
        return merged_any;
    }

    bool CellMerger::resolve_one_overlap(std::vector<CandidateCell>& cells) const {
        for (size_t i = 0; i < cells.size(); ++i) {
            for (size_t j = i + 1; j < cells.size(); ++j) {
                if (!overlaps(cells[i], cells[j])) continue;

                // при равенстве остаётся ячейка, стоящая раньше
                const size_t keep = cells[i].num_gates >= cells[j].num_gates ? i : j;
                const size_t drop = keep == i ? j : i;
                if (g_logging.merge_logger) {
                    std::cout << "[MERGE] overlap: cell " << cells[drop].id << " (" << cells[drop].num_gates
                              << " gates) -> cell " << cells[keep].id << " (" << cells[keep].num_gates
                              << " gates)" << std::endl;
                }
                absorb(cells[keep], cells[drop]);
                cells.erase(cells.begin() + static_cast<long>(drop));
                return true;
            }
        }
        return false;
    }

    std::vector<CandidateCell> CellMerger::merge(std::vector<CandidateCell> cells) const {
        if (cells.empty()) return {};

        int max_gates = 0;
        for (const auto& c : cells) max_gates = std::max(max_gates, c.num_gates);
        const double large_min = max_gates * cfg_.size_ratio_threshold;

        std::vector<CandidateCell> large, small;
        for (auto& c : cells) {
            if (c.num_gates >= large_min) {
                large.push_back(std::move(c));
            } else {
                small.push_back(std::move(c));
            }
        }

        // A) малые -> большие до неподвижной точки
        int passes = 0;
        while (!small.empty() && absorb_small(large, small)) ++passes;

        std::vector<CandidateCell> out = std::move(large);
        for (auto& s : small) out.push_back(std::move(s));

        // B) разрешение перекрытий; каждое слияние уменьшает число ячеек
        int overlap_merges = 0;
        while (resolve_one_overlap(out)) ++overlap_merges;

        if (g_logging.merge_logger) {
            std::cout << "[MERGE] in=" << cells.size()
                      << " out=" << out.size()
                      << " absorb_passes=" << passes
                      << " overlap_merges=" << overlap_merges
                      << std::endl;
        }
        return out;
    }

} // namespace blob
