#include "core/reflectivity_grid.h"

#include <cmath>
#include <stdexcept>

#include "util/geo_utils.h"

static bool is_vector(const cv::Mat &m) {
    return m.dims == 2 && (m.rows == 1 || m.cols == 1);
}

// Разворачивает 1-D ось в 2-D сетку rows x cols (аналог meshgrid).
static cv::Mat expand_axis(const cv::Mat &axis, int rows, int cols, bool along_rows) {
    cv::Mat flat;
    axis.reshape(1, 1).convertTo(flat, CV_64F);
    const int expected = along_rows ? rows : cols;
    if (flat.cols != expected) {
        throw std::invalid_argument("coordinate axis length " + std::to_string(flat.cols) +
                                    " does not match grid dimension " + std::to_string(expected));
    }
    cv::Mat out(rows, cols, CV_64F);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            out.at<double>(r, c) = flat.at<double>(0, along_rows ? r : c);
        }
    }
    return out;
}

static cv::Mat to_coordinate_grid(const cv::Mat &coord, int rows, int cols, bool along_rows,
                                  const char *name) {
    if (coord.empty()) {
        throw std::invalid_argument(std::string(name) + " coordinates are empty");
    }
    if (coord.rows == rows && coord.cols == cols) {
        cv::Mat out;
        coord.convertTo(out, CV_64F);
        return out;
    }
    if (is_vector(coord)) {
        return expand_axis(coord, rows, cols, along_rows);
    }
    throw std::invalid_argument(std::string(name) + " coordinates have shape " +
                                std::to_string(coord.rows) + "x" + std::to_string(coord.cols) +
                                ", grid is " + std::to_string(rows) + "x" + std::to_string(cols));
}

ReflectivityGrid ReflectivityGrid::make(const cv::Mat &refl, const cv::Mat &lat, const cv::Mat &lon,
                                        std::string timestamp) {
    if (refl.dims != 2 || refl.channels() != 1) {
        throw std::invalid_argument("reflectivity must be a single-channel 2-D array");
    }
    ReflectivityGrid grid;
    refl.convertTo(grid.reflectivity, CV_32F);
    grid.timestamp = std::move(timestamp);
    if (refl.empty()) {
        return grid;
    }
    grid.lat = to_coordinate_grid(lat, refl.rows, refl.cols, true, "latitude");
    grid.lon = to_coordinate_grid(lon, refl.rows, refl.cols, false, "longitude");
    // полигоны и центроиды держат долготу в 0..360
    for (int r = 0; r < grid.lon.rows; ++r) {
        auto *row = grid.lon.ptr<double>(r);
        for (int c = 0; c < grid.lon.cols; ++c) row[c] = util::lon_to_0_360(row[c]);
    }
    grid.validate();
    return grid;
}

void ReflectivityGrid::validate() const {
    if (reflectivity.dims != 2 || reflectivity.type() != CV_32F) {
        throw std::invalid_argument("reflectivity must be a CV_32F 2-D array");
    }
    if (reflectivity.empty()) {
        return;
    }
    if (lat.empty() || lon.empty()) {
        throw std::invalid_argument("coordinate arrays are empty while reflectivity is not");
    }
    if (lat.size() != reflectivity.size() || lon.size() != reflectivity.size()) {
        throw std::invalid_argument("coordinate arrays do not match reflectivity shape");
    }
    if (lat.type() != CV_64F || lon.type() != CV_64F) {
        throw std::invalid_argument("coordinate arrays must be CV_64F");
    }
}

cv::Mat ReflectivityGrid::sanitized(float no_data_value) const {
    cv::Mat out = reflectivity.clone();
    for (int r = 0; r < out.rows; ++r) {
        auto *row = out.ptr<float>(r);
        for (int c = 0; c < out.cols; ++c) {
            if (std::isnan(row[c]) || row[c] == no_data_value) {
                row[c] = kNoDataFill;
            }
        }
    }
    return out;
}
