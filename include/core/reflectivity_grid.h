#pragma once

#include <string>
#include <opencv2/core.hpp>

// Значение, которым заменяются NaN и сентинел "нет данных" перед порогами.
constexpr float kNoDataFill = -9999.0f;

// Сетка отражаемости одного скана. Не меняется в течение прохода детекции.
struct ReflectivityGrid {
    cv::Mat reflectivity; // - CV_32F, rows x cols, dBZ.
    cv::Mat lat;          // - CV_64F, rows x cols.
    cv::Mat lon;          // - CV_64F, rows x cols, соглашение 0..360.
    std::string timestamp;

    // Собирает сетку из отражаемости и координат. lat/lon могут быть 1-D
    // (строка или столбец длиной rows / cols) или 2-D той же формы, что и данные.
    // Бросает std::invalid_argument при несогласованной форме.
    static ReflectivityGrid make(const cv::Mat &refl, const cv::Mat &lat, const cv::Mat &lon,
                                 std::string timestamp);

    // Проверка контракта с поставщиком сетки; бросает std::invalid_argument.
    void validate() const;

    // Копия отражаемости, где NaN и no_data_value заменены на kNoDataFill.
    cv::Mat sanitized(float no_data_value) const;

    int rows() const { return reflectivity.rows; }
    int cols() const { return reflectivity.cols; }

    // (lon, lat) гейта.
    cv::Point2d lonlat_at(int row, int col) const {
        return {lon.at<double>(row, col), lat.at<double>(row, col)};
    }
};
