#pragma once

#include <opencv2/core.hpp>

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "config.h"
#include "core/reflectivity_grid.h"
#include "core/storm_cell.h"

// Общие помощники регрессионных тестов.
namespace test_support
{
inline bool nearly_equal(double a, double b, double tol = 1.0e-9)
{
    return std::abs(a - b) <= tol;
}

inline int expect_true(const char* suite, bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[" << suite << "] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

inline int finish(const char* suite, int failures)
{
    if (failures > 0)
    {
        std::cerr << "[" << suite << "] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }
    std::cout << "[" << suite << "] all checks passed" << std::endl;
    return 0;
}

// Только ошибки в cerr; информационные теги выключены.
inline void quiet_logging()
{
    g_logging = LoggingConfig{};
    g_logging.detection_logger = false;
    g_logging.geometry_logger = false;
    g_logging.merge_logger = false;
    g_logging.termination_logger = false;
    g_logging.matcher_logger = false;
    g_logging.history_logger = false;
    g_logging.store_logger = false;
    g_logging.pipeline_logger = false;
}

constexpr double kLat0 = 35.0;
constexpr double kLon0 = 260.0; // 0..360
constexpr double kStep = 0.01;

// Сетка rows x cols, заполненная fill, с 1-D осями: lat = kLat0 + r*kStep, lon = kLon0 + c*kStep.
inline ReflectivityGrid make_grid(int rows, int cols, float fill, const std::string& timestamp)
{
    cv::Mat refl(rows, cols, CV_32F, cv::Scalar(fill));
    cv::Mat lat(rows, 1, CV_64F);
    cv::Mat lon(1, cols, CV_64F);
    for (int r = 0; r < rows; ++r) lat.at<double>(r, 0) = kLat0 + r * kStep;
    for (int c = 0; c < cols; ++c) lon.at<double>(0, c) = kLon0 + c * kStep;
    return ReflectivityGrid::make(refl, lat, lon, timestamp);
}

inline void fill_patch(ReflectivityGrid& grid, int row, int col, int h, int w, float value)
{
    grid.reflectivity(cv::Rect(col, row, w, h)).setTo(value);
}

// Прямоугольник (lon, lat) как замкнутое CCW кольцо.
inline Ring box_ring(double lon_min, double lat_min, double lon_max, double lat_max)
{
    return {{lon_min, lat_min}, {lon_max, lat_min}, {lon_max, lat_max}, {lon_min, lat_max}, {lon_min, lat_min}};
}

// Кандидат с прямоугольной границей.
inline CandidateCell box_cell(int id, int num_gates, double lon_min, double lat_min, double lon_max, double lat_max,
                              double max_dbz = 55.0)
{
    CandidateCell c;
    c.id = id;
    c.num_gates = num_gates;
    c.max_reflectivity_dbz = max_dbz;
    c.centroid = {0.5 * (lat_min + lat_max), 0.5 * (lon_min + lon_max)};
    c.alpha_shape = box_ring(lon_min, lat_min, lon_max, lat_max);
    c.bbox = BBox{lat_min, lat_max, lon_min, lon_max};
    c.geometry_status = GeometryStatus::Polygon;
    return c;
}
} // namespace test_support
