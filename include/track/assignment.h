#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace track {

    // Точный решатель не справился (NaN/inf в матрице, численный сбой).
    class AssignmentError : public std::runtime_error {
    public:
        explicit AssignmentError(const std::string &what) : std::runtime_error(what) {}
    };

    // Прямоугольная задача о назначениях минимальной стоимости (венгерский
    // алгоритм с потенциалами). cost - CV_64F, rows x cols, все значения конечны.
    // Возвращает для каждой строки номер столбца или -1 (строк больше, чем столбцов).
    // Назначается min(rows, cols) пар. Бросает AssignmentError.
    std::vector<int> solve_assignment(const cv::Mat &cost);

} // namespace track
