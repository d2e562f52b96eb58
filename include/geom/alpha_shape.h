#pragma once

#include <vector>
#include <opencv2/core.hpp>

#include "geom/geometry.h"

namespace geom {

    // Alpha-shape (вогнутая оболочка) набора точек (lon, lat).
    //
    // Треугольники Делоне остаются в фигуре, если радиус описанной окружности
    // меньше 1/alpha (в единицах координат). alpha <= 0 - выпуклая оболочка.
    // 0 точек - monostate, 1 - PointGeom, 2 или все на одной прямой - LineGeom.
    // Несвязная фигура возвращается как MultiPolygonGeom (только внешние кольца),
    // monostate - если ни один треугольник не прошёл фильтр.
    Geometry alpha_shape(const std::vector<cv::Point2d> &points, double alpha);

} // namespace geom
