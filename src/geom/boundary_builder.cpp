#include "geom/boundary_builder.h"

#include <algorithm>
#include <iostream>

#include "config.h"
#include "geom/alpha_shape.h"

namespace geom {

    static size_t distinct_points(std::vector<cv::Point2d> pts) {
        std::sort(pts.begin(), pts.end(), [](const cv::Point2d &a, const cv::Point2d &b) {
            return a.x < b.x || (a.x == b.x && a.y < b.y);
        });
        return static_cast<size_t>(std::unique(pts.begin(), pts.end()) - pts.begin());
    }

    BoundaryBuilder::BoundaryBuilder(double alpha) : alpha_(alpha) {}

    Boundary BoundaryBuilder::build(const std::vector<cv::Point2d> &lonlat) const {
        Boundary out;
        out.geometry = keep_largest(alpha_shape(lonlat, alpha_));

        const auto *poly = std::get_if<PolygonGeom>(&out.geometry);
        if (poly && open_ring(poly->ring).size() >= 3) {
            out.ring = poly->ring;

            // самопересечение (касание компонент в вершине и т.п.) - чиним выпуклой оболочкой
            std::vector<Triangle> tris;
            if (!triangulate(out.ring, tris)) {
                std::cerr << "[GEOM] self-intersecting boundary of " << lonlat.size()
                          << " points repaired by convex hull" << std::endl;
                out.ring = close_ring(convex_hull(open_ring(out.ring)));
                out.geometry = PolygonGeom{out.ring};
            }
            out.bbox = envelope(out.geometry);
            out.status = GeometryStatus::Polygon;
            return out;
        }

        out.bbox = BBox::from_points(lonlat);
        // 0-2 различные точки: полигона быть не может
        if (std::holds_alternative<std::monostate>(out.geometry) && lonlat.empty()) {
            out.status = GeometryStatus::InsufficientGeometry;
        } else if (std::holds_alternative<PointGeom>(out.geometry) || distinct_points(lonlat) < 3) {
            out.status = GeometryStatus::InsufficientGeometry;
        } else {
            out.status = GeometryStatus::GeometryInvalid;
            if (g_logging.geometry_logger) {
                std::cout << "[GEOM] alpha-shape of " << lonlat.size()
                          << " points is degenerate, using bbox" << std::endl;
            }
        }
        return out;
    }

    void BoundaryBuilder::apply(CandidateCell &cell, const ReflectivityGrid &grid) const {
        std::vector<cv::Point2d> lonlat;
        lonlat.reserve(cell.gates.size());
        for (const auto &g : cell.gates) lonlat.push_back(grid.lonlat_at(g.y, g.x));

        Boundary b = build(lonlat);
        cell.alpha_shape = std::move(b.ring);
        cell.bbox = b.bbox;
        cell.geometry_status = b.status;

        if (g_logging.geometry_logger) {
            std::cout << "[GEOM] cell " << cell.id
                      << " gates=" << cell.num_gates
                      << " status=" << to_string(cell.geometry_status)
                      << " ring=" << cell.alpha_shape.size()
                      << std::endl;
        }
    }

} // namespace geom
