#include "geom/alpha_shape.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <utility>

namespace geom {

    namespace {

        // Пространство Subdiv2D: точки масштабируются в квадрат [0, kScale].
        constexpr float kScale = 1000.0f;

        struct PointLess {
            bool operator()(const cv::Point2d &a, const cv::Point2d &b) const {
                return a.x < b.x || (a.x == b.x && a.y < b.y);
            }
        };

        struct Point2fLess {
            bool operator()(const cv::Point2f &a, const cv::Point2f &b) const {
                return a.x < b.x || (a.x == b.x && a.y < b.y);
            }
        };

        double circumradius(const cv::Point2d &a, const cv::Point2d &b, const cv::Point2d &c) {
            const double la = std::hypot(b.x - c.x, b.y - c.y);
            const double lb = std::hypot(a.x - c.x, a.y - c.y);
            const double lc = std::hypot(a.x - b.x, a.y - b.y);
            const double area2 = std::abs((b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x));
            if (area2 <= 0.0) return std::numeric_limits<double>::infinity();
            return la * lb * lc / (2.0 * area2);
        }

        // Все точки на одной прямой (в пределах относительной погрешности).
        bool collinear(const std::vector<cv::Point2d> &pts) {
            const cv::Point2d &a = pts.front();
            const cv::Point2d &b = pts.back();
            const double len2 = (b.x - a.x) * (b.x - a.x) + (b.y - a.y) * (b.y - a.y);
            for (const auto &p : pts) {
                const double cr = (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
                if (cr * cr > 1e-18 * len2 * len2) return false;
            }
            return true;
        }

        // Направленные граничные рёбра -> замкнутые контуры.
        std::vector<std::vector<int>> chain_loops(const std::vector<std::pair<int, int>> &edges) {
            std::map<int, std::vector<size_t>> outgoing;
            for (size_t i = 0; i < edges.size(); ++i) outgoing[edges[i].first].push_back(i);

            std::vector<bool> used(edges.size(), false);
            std::vector<std::vector<int>> loops;
            for (size_t start = 0; start < edges.size(); ++start) {
                if (used[start]) continue;
                std::vector<int> loop;
                size_t e = start;
                bool closed = false;
                while (!used[e]) {
                    used[e] = true;
                    loop.push_back(edges[e].first);
                    const int next_v = edges[e].second;
                    if (next_v == edges[start].first) {
                        closed = true;
                        break;
                    }
                    bool found = false;
                    for (size_t cand : outgoing[next_v]) {
                        if (!used[cand]) {
                            e = cand;
                            found = true;
                            break;
                        }
                    }
                    if (!found) break;
                }
                if (closed && loop.size() >= 3) loops.push_back(std::move(loop));
            }
            return loops;
        }

    } // namespace

    Geometry alpha_shape(const std::vector<cv::Point2d> &points, double alpha) {
        std::set<cv::Point2d, PointLess> unique_set(points.begin(), points.end());
        const std::vector<cv::Point2d> pts(unique_set.begin(), unique_set.end());

        if (pts.empty()) return std::monostate{};
        if (pts.size() == 1) return PointGeom{pts.front()};
        if (pts.size() == 2) return LineGeom{pts};
        // pts отсортированы лексикографически: front/back - концы отрезка
        if (collinear(pts)) return LineGeom{{pts.front(), pts.back()}};

        if (alpha <= 0.0) {
            return PolygonGeom{close_ring(convex_hull(pts))};
        }

        const auto box = BBox::from_points(pts);
        const double extent = std::max(box->lon_max - box->lon_min, box->lat_max - box->lat_min);
        const double scale = extent > 0.0 ? kScale / extent : 1.0;

        cv::Subdiv2D subdiv(cv::Rect(-10, -10, static_cast<int>(kScale) + 21, static_cast<int>(kScale) + 21));
        std::map<cv::Point2f, int, Point2fLess> index_of;
        for (size_t i = 0; i < pts.size(); ++i) {
            const cv::Point2f q(static_cast<float>((pts[i].x - box->lon_min) * scale),
                                static_cast<float>((pts[i].y - box->lat_min) * scale));
            if (index_of.count(q)) continue;
            index_of.emplace(q, static_cast<int>(i));
            subdiv.insert(q);
        }

        std::vector<cv::Vec6f> tri_list;
        subdiv.getTriangleList(tri_list);

        const double max_radius = 1.0 / alpha;
        std::set<std::pair<int, int>> directed;
        for (const auto &t : tri_list) {
            int idx[3];
            bool inside = true;
            for (int k = 0; k < 3 && inside; ++k) {
                const auto it = index_of.find(cv::Point2f(t[2 * k], t[2 * k + 1]));
                if (it == index_of.end()) {
                    inside = false;
                } else {
                    idx[k] = it->second;
                }
            }
            if (!inside) continue;

            const cv::Point2d &a = pts[idx[0]];
            const cv::Point2d &b = pts[idx[1]];
            const cv::Point2d &c = pts[idx[2]];
            if (circumradius(a, b, c) >= max_radius) continue;

            // ориентируем треугольник CCW
            if ((b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x) < 0.0) std::swap(idx[1], idx[2]);
            directed.emplace(idx[0], idx[1]);
            directed.emplace(idx[1], idx[2]);
            directed.emplace(idx[2], idx[0]);
        }
        if (directed.empty()) return std::monostate{};

        // граница - рёбра без встречного ребра
        std::vector<std::pair<int, int>> boundary;
        for (const auto &e : directed) {
            if (!directed.count({e.second, e.first})) boundary.push_back(e);
        }

        MultiPolygonGeom multi;
        for (const auto &loop : chain_loops(boundary)) {
            Ring ring;
            ring.reserve(loop.size() + 1);
            for (int i : loop) ring.push_back(pts[static_cast<size_t>(i)]);
            // CW контуры - дыры, в результат не попадают
            if (signed_area(ring) <= 0.0) continue;
            multi.polygons.push_back(PolygonGeom{close_ring(std::move(ring))});
        }

        if (multi.polygons.empty()) return std::monostate{};
        if (multi.polygons.size() == 1) return multi.polygons.front();
        return multi;
    }

} // namespace geom
