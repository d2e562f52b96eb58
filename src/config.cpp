#include <toml++/toml.h>   // ДОЛЖНО БЫТЬ ПЕРВЫМ
#include "config.h"
#include <iostream>
#include <stdexcept>
#include <string_view>


// ============================================================================
// Реализация загрузки config.toml
//
// Важно:
//  - Любая ошибка парсинга не должна "убивать" приложение.
//  - В случае ошибки оставляем дефолты из структуры и возвращаем false.
//  - Значения сначала читаются во временную копию: частично прочитанная
//    таблица не попадает в рабочую конфигурацию.
//  - Все имена ключей должны соответствовать config.toml.
// ============================================================================

LoggingConfig g_logging;

static const toml::table &require_table(const toml::table &tbl, std::string_view name) {
    const auto *node = tbl.get(name);
    if (!node) {
        throw std::runtime_error("missing [" + std::string(name) + "] table");
    }
    const auto *table = node->as_table();
    if (!table) {
        throw std::runtime_error("invalid [" + std::string(name) + "] table");
    }
    return *table;
}

bool load_detection_config(const toml::table &tbl, DetectionConfig &cfg) {
// --------------------------- [detection] --------------------------
    try {
        const auto &det = require_table(tbl, "detection");
        DetectionConfig tmp;
        tmp.seed_dbz = read_required<double>(det, "seed_dbz");
        tmp.expand_dbz = read_required<double>(det, "expand_dbz");
        tmp.min_gates = read_required<int>(det, "min_gates");
        tmp.max_iterations = read_required<int>(det, "max_iterations");
        tmp.connectivity = read_required<int>(det, "connectivity");
        tmp.no_data_value = read_required<float>(det, "no_data_value");

        if (tmp.expand_dbz > tmp.seed_dbz) {
            throw std::runtime_error("expand_dbz must not exceed seed_dbz");
        }
        if (tmp.min_gates < 1) {
            throw std::runtime_error("min_gates must be >= 1");
        }
        if (tmp.max_iterations < 0) {
            throw std::runtime_error("max_iterations must be >= 0");
        }
        if (tmp.connectivity != 4 && tmp.connectivity != 8) {
            throw std::runtime_error("connectivity must be 4 or 8");
        }
        cfg = tmp;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "detection config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_boundary_config(const toml::table &tbl, BoundaryConfig &cfg) {
// ---------------------------- [boundary] --------------------------
    try {
        const auto &boundary = require_table(tbl, "boundary");
        BoundaryConfig tmp;
        tmp.alpha = read_required<double>(boundary, "alpha");
        if (tmp.alpha < 0.0) {
            throw std::runtime_error("alpha must be >= 0");
        }
        cfg = tmp;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "boundary config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_merge_config(const toml::table &tbl, MergeConfig &cfg) {
// ----------------------------- [merge] ----------------------------
    try {
        const auto &merge = require_table(tbl, "merge");
        MergeConfig tmp;
        tmp.size_ratio_threshold = read_required<double>(merge, "size_ratio_threshold");
        tmp.buffer_km = read_required<double>(merge, "buffer_km");
        if (tmp.size_ratio_threshold <= 0.0 || tmp.size_ratio_threshold > 1.0) {
            throw std::runtime_error("size_ratio_threshold must be in (0, 1]");
        }
        if (tmp.buffer_km < 0.0) {
            throw std::runtime_error("buffer_km must be >= 0");
        }
        cfg = tmp;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "merge config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_termination_config(const toml::table &tbl, TerminationConfig &cfg) {
// -------------------------- [termination] -------------------------
    try {
        const auto &term = require_table(tbl, "termination");
        TerminationConfig tmp;
        tmp.coverage_threshold_pct = read_required<double>(term, "coverage_threshold_pct");
        tmp.prune = read_required<bool>(term, "prune");
        if (tmp.coverage_threshold_pct < 0.0 || tmp.coverage_threshold_pct > 100.0) {
            throw std::runtime_error("coverage_threshold_pct must be in [0, 100]");
        }
        cfg = tmp;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "termination config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_matching_config(const toml::table &tbl, MatchingConfig &cfg) {
// ---------------------------- [matching] --------------------------
    try {
        const auto &matching = require_table(tbl, "matching");
        MatchingConfig tmp;
        tmp.w_distance = read_required<double>(matching, "w_distance");
        tmp.w_num_gates = read_required<double>(matching, "w_num_gates");
        tmp.w_max_reflectivity = read_required<double>(matching, "w_max_reflectivity");
        tmp.max_gate_km = read_required<double>(matching, "max_gate_km");
        tmp.distance_scale_deg = read_required<double>(matching, "distance_scale_deg");
        if (tmp.w_distance < 0.0 || tmp.w_num_gates < 0.0 || tmp.w_max_reflectivity < 0.0) {
            throw std::runtime_error("matching weights must be non-negative");
        }
        if (tmp.max_gate_km <= 0.0) {
            throw std::runtime_error("max_gate_km must be > 0");
        }
        if (tmp.distance_scale_deg <= 0.0) {
            throw std::runtime_error("distance_scale_deg must be > 0");
        }
        cfg = tmp;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "matching config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg) {
// ----------------------------- [logging] --------------------------
    try {
        const auto &logging = require_table(tbl, "logging");
        LoggingConfig tmp;
        tmp.detection_logger = read_required<bool>(logging, "detection_logger");
        tmp.geometry_logger = read_required<bool>(logging, "geometry_logger");
        tmp.merge_logger = read_required<bool>(logging, "merge_logger");
        tmp.termination_logger = read_required<bool>(logging, "termination_logger");
        tmp.matcher_logger = read_required<bool>(logging, "matcher_logger");
        tmp.history_logger = read_required<bool>(logging, "history_logger");
        tmp.store_logger = read_required<bool>(logging, "store_logger");
        tmp.pipeline_logger = read_required<bool>(logging, "pipeline_logger");
        cfg = tmp;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "logging config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_app_config(const toml::table &tbl, AppConfig &cfg) {
    bool ok = true;
    ok = load_detection_config(tbl, cfg.detection) && ok;
    ok = load_boundary_config(tbl, cfg.boundary) && ok;
    ok = load_merge_config(tbl, cfg.merge) && ok;
    ok = load_termination_config(tbl, cfg.termination) && ok;
    ok = load_matching_config(tbl, cfg.matching) && ok;
    ok = load_logging_config(tbl, cfg.logging) && ok;
    return ok;
}
