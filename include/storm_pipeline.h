#pragma once

#include <string>
#include <vector>
#include "config.h"
#include "core/reflectivity_grid.h"
#include "core/storm_cell.h"
#include "blob/cell_merger.h"
#include "detect/region_grower.h"
#include "geom/boundary_builder.h"
#include "track/cell_matcher.h"
#include "track/cell_terminator.h"
#include "track/history_tracker.h"

// Итог одного скана.
struct ScanReport {
    std::string timestamp;             // - время скана.
    std::vector<CandidateCell> cells;  // - ячейки скана после слияния.
    std::vector<int> terminated_ids;   // - треки прошлого поколения, снятые терминатором.
    track::MatchResult match;          // - индексы old -> по survivors, new -> по cells.
    track::HistoryStats history;       // - что изменилось в коллекции.
};

class StormPipeline {
public:
    // Загружает конфигурацию из TOML; при ошибке таблицы остаются значения по умолчанию.
    explicit StormPipeline(const toml::table &tbl);

    explicit StormPipeline(const AppConfig &cfg);

    // Рост ячеек, границы, слияние.
    std::vector<CandidateCell> detect(const ReflectivityGrid &grid) const;

    // Полный цикл: detect, терминатор на прошлом поколении, сопоставление,
    // обновление истории. tracked изменяется на месте.
    ScanReport update(std::vector<TrackedCell> &tracked, const ReflectivityGrid &grid) const;

private:
    static AppConfig config_from(const toml::table &tbl);

    AppConfig cfg_;                      // - действующая конфигурация.
    detect::RegionGrower grower_;        // - ядра + рост.
    geom::BoundaryBuilder boundary_;     // - alpha-shape и bbox.
    blob::CellMerger merger_;            // - слияние малых и перекрывающихся ячеек.
    track::CellTerminator terminator_;   // - снятие покрытых ячеек прошлого поколения.
    track::CellMatcher matcher_;         // - сопоставление поколений.
    track::HistoryTracker history_;      // - применение совпадений к истории.
};
