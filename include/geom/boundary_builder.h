#pragma once

#include <optional>
#include <vector>
#include <opencv2/core.hpp>

#include "core/reflectivity_grid.h"
#include "core/storm_cell.h"
#include "geom/geometry.h"

namespace geom {

    struct Boundary {
        Geometry geometry;        // - результат alpha-shape (MultiPolygon уже сведён к наибольшему).
        Ring ring;                // - замкнутое кольцо; пустое, если полигона нет.
        std::optional<BBox> bbox; // - огибающая полигона или исходных точек.
        GeometryStatus status = GeometryStatus::InsufficientGeometry;
    };

    // Граница ячейки по её гейтам: alpha-shape + bbox.
    // Полигон не построился - остаётся bbox исходных точек.
    class BoundaryBuilder {
    public:
        explicit BoundaryBuilder(double alpha);

        Boundary build(const std::vector<cv::Point2d> &lonlat) const;

        // Заполняет alpha_shape / bbox / geometry_status кандидата по его гейтам.
        void apply(CandidateCell &cell, const ReflectivityGrid &grid) const;

        double alpha() const { return alpha_; }

    private:
        double alpha_;
    };

} // namespace geom
