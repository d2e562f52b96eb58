#pragma once

#include <string>

#include "core/reflectivity_grid.h"

namespace io {

    // Сетка из файла cv::FileStorage (YAML/XML/JSON):
    //   reflectivity - матрица dBZ;
    //   lat, lon     - 1-D или 2-D матрицы координат;
    //   timestamp    - строка (необязательно; иначе из имени файла, иначе текущее UTC).
    // Бросает std::runtime_error (файл не читается, нет узла) или
    // std::invalid_argument (несогласованная форма).
    ReflectivityGrid load_grid(const std::string &path);

    void write_grid(const std::string &path, const ReflectivityGrid &grid);

} // namespace io
