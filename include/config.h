#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <toml++/toml.h>   // ОБЯЗАТЕЛЬНО, forward-decl НЕЛЬЗЯ


template <typename T>
static T read_required(const toml::table &tbl, std::string_view key) {
    const auto *node = tbl.get(key);
    if (!node) {
        throw std::runtime_error("missing key " + std::string(key));
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value " + std::string(key));
    }
    return *value;
}


// -------------------------- [detection] ---------------------------
struct DetectionConfig {
    double seed_dbz = 50.0;       // - порог ядра ячейки (dBZ).
    double expand_dbz = 40.0;     // - порог роста ячейки (dBZ), всегда <= seed_dbz.
    int min_gates = 25;           // - минимальное число гейтов выжившей ячейки.
    int max_iterations = 100;     // - максимум итераций роста.
    int connectivity = 4;         // - связность меток ядер (4 или 8).
    float no_data_value = -999.0f; // - сентинел "нет данных" во входной сетке.
};

// --------------------------- [boundary] ---------------------------
struct BoundaryConfig {
    // Параметр alpha-shape: меньше -> ближе к выпуклой оболочке.
    double alpha = 0.1;
};

// ----------------------------- [merge] ----------------------------
struct MergeConfig {
    double size_ratio_threshold = 0.9; // - доля от максимального размера, ниже которой ячейка "малая".
    double buffer_km = 1.0;            // - буфер соседства bbox (км).
};

// -------------------------- [termination] -------------------------
struct TerminationConfig {
    double coverage_threshold_pct = 67.0; // - процент покрытия, при котором меньшая ячейка снимается.
    bool prune = false;                   // - удалять снятые ячейки из сохраняемой коллекции.
};

// --------------------------- [matching] ---------------------------
struct MatchingConfig {
    double w_distance = 0.5;         // - вес расстояния между центроидами.
    double w_num_gates = 0.3;        // - вес разницы размеров.
    double w_max_reflectivity = 0.2; // - вес разницы максимальной отражаемости.
    double max_gate_km = 10.0;       // - предельное смещение за скан по каждой оси (км).
    double distance_scale_deg = 10.0; // - расстояние (градусы), при котором член расстояния достигает 1.0.
};

struct LoggingConfig {
    bool detection_logger = true;
    bool geometry_logger = false;
    bool merge_logger = true;
    bool termination_logger = true;
    bool matcher_logger = true;
    bool history_logger = true;
    bool store_logger = true;
    bool pipeline_logger = true;
};

struct AppConfig {
    DetectionConfig detection;
    BoundaryConfig boundary;
    MergeConfig merge;
    TerminationConfig termination;
    MatchingConfig matching;
    LoggingConfig logging;
};

// Флаги логирования процесса; выставляются из main после чтения config.toml.
extern LoggingConfig g_logging;

bool load_detection_config(const toml::table &tbl, DetectionConfig &cfg);
bool load_boundary_config(const toml::table &tbl, BoundaryConfig &cfg);
bool load_merge_config(const toml::table &tbl, MergeConfig &cfg);
bool load_termination_config(const toml::table &tbl, TerminationConfig &cfg);
bool load_matching_config(const toml::table &tbl, MatchingConfig &cfg);
bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg);

// Загружает все таблицы; возвращает false, если хотя бы одна не прочиталась.
bool load_app_config(const toml::table &tbl, AppConfig &cfg);
