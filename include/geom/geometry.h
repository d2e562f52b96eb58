#pragma once

#include <array>
#include <optional>
#include <variant>
#include <vector>
#include <opencv2/core.hpp>

#include "core/storm_cell.h"

namespace geom {

    struct PointGeom {
        cv::Point2d point;
    };

    struct LineGeom {
        std::vector<cv::Point2d> points;
    };

    // Простой полигон без дыр; ring замкнут.
    struct PolygonGeom {
        Ring ring;
    };

    struct MultiPolygonGeom {
        std::vector<PolygonGeom> polygons;
    };

    // Результат построения границы; monostate - построить не удалось.
    using Geometry = std::variant<std::monostate, PointGeom, LineGeom, PolygonGeom, MultiPolygonGeom>;

    using Triangle = std::array<cv::Point2d, 3>;

    // Кольцо без повторяющейся замыкающей точки.
    Ring open_ring(const Ring &ring);

    // Замыкает кольцо, если оно не замкнуто.
    Ring close_ring(Ring ring);

    // Ориентированная площадь (shoelace) в единицах координат; CCW > 0.
    double signed_area(const Ring &ring);

    // Площадь кольца (lon, lat) в км^2 в локальной проекции.
    double ring_area_km2(const Ring &ring);

    // Компонента с наибольшей площадью; nullptr для пустого набора.
    const PolygonGeom *largest_polygon(const MultiPolygonGeom &multi);

    // MultiPolygon -> наибольший Polygon, остальные варианты без изменений.
    Geometry keep_largest(Geometry geometry);

    // Огибающая геометрии; nullopt для monostate.
    std::optional<BBox> envelope(const Geometry &geometry);

    // Выпуклая оболочка (открытое кольцо, CCW). Для < 3 точек возвращает их же.
    std::vector<cv::Point2d> convex_hull(const std::vector<cv::Point2d> &points);

    // Нет пересечений несмежных рёбер.
    bool is_simple(const Ring &ring);

    // Триангуляция простого полигона отсечением ушей.
    // false - полигон самопересекающийся или вырожденный.
    bool triangulate(const Ring &ring, std::vector<Triangle> &out);

    // Площадь пересечения двух колец (lon, lat) в км^2. Невалидные кольца
    // ремонтируются выпуклой оболочкой. Кольца короче 3 точек дают 0.
    double intersection_area_km2(const Ring &a, const Ring &b);

} // namespace geom
