#include "geom/geometry.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>

#include "util/geo_utils.h"

namespace geom {

    Ring open_ring(const Ring &ring) {
        Ring out;
        out.reserve(ring.size());
        for (const auto &p : ring) {
            if (!out.empty() && out.back() == p) continue;
            out.push_back(p);
        }
        while (out.size() > 1 && out.front() == out.back()) out.pop_back();
        return out;
    }

    Ring close_ring(Ring ring) {
        if (!ring.empty() && ring.front() != ring.back()) ring.push_back(ring.front());
        return ring;
    }

    double signed_area(const Ring &ring) {
        const Ring pts = open_ring(ring);
        const size_t n = pts.size();
        if (n < 3) return 0.0;
        double s = 0.0;
        for (size_t i = 0; i < n; ++i) {
            const auto &a = pts[i];
            const auto &b = pts[(i + 1) % n];
            s += a.x * b.y - b.x * a.y;
        }
        return 0.5 * s;
    }

    static util::LocalProjection projection_for(const Ring &a, const Ring &b) {
        double lat_sum = 0.0;
        size_t n = 0;
        for (const auto &p : a) { lat_sum += p.y; ++n; }
        for (const auto &p : b) { lat_sum += p.y; ++n; }
        const double lon0 = !a.empty() ? a.front().x : (!b.empty() ? b.front().x : 0.0);
        return util::LocalProjection(n ? lat_sum / static_cast<double>(n) : 0.0, lon0);
    }

    static Ring project(const Ring &ring, const util::LocalProjection &proj) {
        Ring out;
        out.reserve(ring.size());
        for (const auto &p : ring) out.push_back(proj.to_km(p));
        return out;
    }

    double ring_area_km2(const Ring &ring) {
        const Ring pts = open_ring(ring);
        if (pts.size() < 3) return 0.0;
        return std::abs(signed_area(project(pts, projection_for(pts, {}))));
    }

    const PolygonGeom *largest_polygon(const MultiPolygonGeom &multi) {
        const PolygonGeom *best = nullptr;
        double best_area = -1.0;
        for (const auto &poly : multi.polygons) {
            const double a = std::abs(signed_area(poly.ring));
            if (a > best_area) {
                best_area = a;
                best = &poly;
            }
        }
        return best;
    }

    Geometry keep_largest(Geometry geometry) {
        if (const auto *multi = std::get_if<MultiPolygonGeom>(&geometry)) {
            const PolygonGeom *best = largest_polygon(*multi);
            if (!best) return std::monostate{};
            return PolygonGeom{best->ring};
        }
        return geometry;
    }

    std::optional<BBox> envelope(const Geometry &geometry) {
        if (const auto *p = std::get_if<PointGeom>(&geometry)) {
            return BBox::from_points({p->point});
        }
        if (const auto *l = std::get_if<LineGeom>(&geometry)) {
            return BBox::from_points(l->points);
        }
        if (const auto *poly = std::get_if<PolygonGeom>(&geometry)) {
            return BBox::from_points(poly->ring);
        }
        if (const auto *multi = std::get_if<MultiPolygonGeom>(&geometry)) {
            std::vector<cv::Point2d> all;
            for (const auto &poly : multi->polygons) {
                all.insert(all.end(), poly.ring.begin(), poly.ring.end());
            }
            return BBox::from_points(all);
        }
        return std::nullopt;
    }

    std::vector<cv::Point2d> convex_hull(const std::vector<cv::Point2d> &points) {
        if (points.size() < 3) return points;

        // convexHull работает во float: сдвигаем к первой точке, чтобы не терять точность
        const cv::Point2d origin = points.front();
        std::vector<cv::Point2f> shifted;
        shifted.reserve(points.size());
        for (const auto &p : points) {
            shifted.emplace_back(static_cast<float>(p.x - origin.x), static_cast<float>(p.y - origin.y));
        }
        std::vector<int> idx;
        cv::convexHull(shifted, idx, false, false);

        std::vector<cv::Point2d> hull;
        hull.reserve(idx.size());
        for (int i : idx) hull.push_back(points[static_cast<size_t>(i)]);
        if (signed_area(hull) < 0.0) std::reverse(hull.begin(), hull.end());
        return hull;
    }

    static double cross(const cv::Point2d &o, const cv::Point2d &a, const cv::Point2d &b) {
        return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
    }

    static bool in_triangle(const cv::Point2d &p, const cv::Point2d &a, const cv::Point2d &b,
                            const cv::Point2d &c, double eps) {
        return cross(a, b, p) >= -eps && cross(b, c, p) >= -eps && cross(c, a, p) >= -eps;
    }

    // Собственное пересечение отрезков ab и cd (без касаний в концах).
    static bool segments_cross(const cv::Point2d &a, const cv::Point2d &b,
                               const cv::Point2d &c, const cv::Point2d &d, double eps) {
        const double d1 = cross(a, b, c);
        const double d2 = cross(a, b, d);
        const double d3 = cross(c, d, a);
        const double d4 = cross(c, d, b);
        return ((d1 > eps && d2 < -eps) || (d1 < -eps && d2 > eps)) &&
               ((d3 > eps && d4 < -eps) || (d3 < -eps && d4 > eps));
    }

    bool is_simple(const Ring &ring) {
        const Ring pts = open_ring(ring);
        const size_t n = pts.size();
        if (n < 3) return false;
        const auto box = BBox::from_points(pts);
        const double extent = std::max(box->lon_max - box->lon_min, box->lat_max - box->lat_min);
        const double eps = 1e-10 * extent * extent;
        for (size_t i = 0; i < n; ++i) {
            const cv::Point2d &a = pts[i];
            const cv::Point2d &b = pts[(i + 1) % n];
            for (size_t j = i + 2; j < n; ++j) {
                if (i == 0 && j == n - 1) continue;
                if (segments_cross(a, b, pts[j], pts[(j + 1) % n], eps)) return false;
            }
        }
        return true;
    }

    bool triangulate(const Ring &ring, std::vector<Triangle> &out) {
        std::vector<cv::Point2d> pts = open_ring(ring);
        if (pts.size() < 3 || !is_simple(pts)) return false;
        if (signed_area(pts) < 0.0) std::reverse(pts.begin(), pts.end());

        const auto box = BBox::from_points(pts);
        const double extent = std::max(box->lon_max - box->lon_min, box->lat_max - box->lat_min);
        const double eps = 1e-10 * extent * extent;

        std::vector<int> idx(pts.size());
        for (size_t i = 0; i < idx.size(); ++i) idx[i] = static_cast<int>(i);

        std::vector<Triangle> tris;
        while (idx.size() > 3) {
            const size_t m = idx.size();
            bool clipped = false;
            for (size_t k = 0; k < m; ++k) {
                const cv::Point2d &a = pts[idx[(k + m - 1) % m]];
                const cv::Point2d &b = pts[idx[k]];
                const cv::Point2d &c = pts[idx[(k + 1) % m]];
                const double cr = cross(a, b, c);

                // вырожденная вершина (на прямой или "шип") - просто выбрасываем
                if (std::abs(cr) <= eps) {
                    idx.erase(idx.begin() + static_cast<long>(k));
                    clipped = true;
                    break;
                }
                if (cr < 0.0) continue;

                bool blocked = false;
                for (size_t j = 0; j < m && !blocked; ++j) {
                    if (j == k || j == (k + m - 1) % m || j == (k + 1) % m) continue;
                    const cv::Point2d &p = pts[idx[j]];
                    if (p == a || p == b || p == c) continue;
                    blocked = in_triangle(p, a, b, c, eps);
                }
                if (blocked) continue;

                tris.push_back({a, b, c});
                idx.erase(idx.begin() + static_cast<long>(k));
                clipped = true;
                break;
            }
            if (!clipped) return false;
        }
        if (idx.size() == 3) {
            const Triangle t{pts[idx[0]], pts[idx[1]], pts[idx[2]]};
            if (std::abs(cross(t[0], t[1], t[2])) > eps) tris.push_back(t);
        }
        if (tris.empty()) return false;
        out.insert(out.end(), tris.begin(), tris.end());
        return true;
    }

    // Треугольники кольца; самопересекающееся кольцо заменяется выпуклой оболочкой.
    static std::vector<Triangle> triangles_of(const Ring &ring) {
        std::vector<Triangle> tris;
        if (triangulate(ring, tris)) return tris;

        const std::vector<cv::Point2d> hull = convex_hull(open_ring(ring));
        if (hull.size() < 3) return tris;
        std::cerr << "[GEOM] invalid ring of " << ring.size() << " points repaired by convex hull" << std::endl;
        for (size_t i = 1; i + 1 < hull.size(); ++i) {
            tris.push_back({hull[0], hull[i], hull[i + 1]});
        }
        return tris;
    }

    static std::vector<cv::Point2f> to_float(const Triangle &t) {
        std::vector<cv::Point2f> out;
        for (const auto &p : t) out.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
        return out;
    }

    double intersection_area_km2(const Ring &a, const Ring &b) {
        const Ring oa = open_ring(a);
        const Ring ob = open_ring(b);
        if (oa.size() < 3 || ob.size() < 3) return 0.0;

        const auto ba = BBox::from_points(oa);
        const auto bb = BBox::from_points(ob);
        if (!ba->near(*bb, 0.0, 0.0)) return 0.0;

        const util::LocalProjection proj = projection_for(oa, ob);
        const std::vector<Triangle> ta = triangles_of(project(oa, proj));
        const std::vector<Triangle> tb = triangles_of(project(ob, proj));

        double area = 0.0;
        for (const auto &t1 : ta) {
            const auto b1 = BBox::from_points({t1[0], t1[1], t1[2]});
            const std::vector<cv::Point2f> p1 = to_float(t1);
            for (const auto &t2 : tb) {
                const auto b2 = BBox::from_points({t2[0], t2[1], t2[2]});
                if (!b1->near(*b2, 0.0, 0.0)) continue;
                const std::vector<cv::Point2f> p2 = to_float(t2);
                std::vector<cv::Point2f> inter;
                const float s = cv::intersectConvexConvex(p1, p2, inter, true);
                if (s > 0.0f) area += s;
            }
        }
        return area;
    }

} // namespace geom
