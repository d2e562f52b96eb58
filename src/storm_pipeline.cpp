#include "storm_pipeline.h"
#include <algorithm>
#include <iostream>
#include <unordered_set>

/*
  конвейер одного скана:
    grid -> RegionGrower -> BoundaryBuilder -> CellMerger      (новое поколение)
    tracked -> CellTerminator                                  (прошлое поколение)
    CellMatcher(survivors, cells) -> HistoryTracker -> tracked
 */

AppConfig StormPipeline::config_from(const toml::table &tbl) {
    AppConfig cfg;
    if (!load_app_config(tbl, cfg)) {
        std::cerr << "[PIPE] config incomplete, defaults used for failed tables" << std::endl;
    }
    return cfg;
}

StormPipeline::StormPipeline(const toml::table &tbl) : StormPipeline(config_from(tbl)) {}

StormPipeline::StormPipeline(const AppConfig &cfg)
        : cfg_(cfg),
          grower_(cfg.detection),
          boundary_(cfg.boundary.alpha),
          merger_(cfg.merge, cfg.boundary.alpha),
          terminator_(cfg.termination),
          matcher_(cfg.matching) {
    if (g_logging.pipeline_logger) {
        std::cout << "[PIPE] config: seed_dbz=" << cfg_.detection.seed_dbz
                  << " expand_dbz=" << cfg_.detection.expand_dbz
                  << " min_gates=" << cfg_.detection.min_gates
                  << " max_iterations=" << cfg_.detection.max_iterations
                  << " alpha=" << cfg_.boundary.alpha
                  << " size_ratio_threshold=" << cfg_.merge.size_ratio_threshold
                  << " buffer_km=" << cfg_.merge.buffer_km
                  << " coverage_threshold_pct=" << cfg_.termination.coverage_threshold_pct
                  << " max_gate_km=" << cfg_.matching.max_gate_km
                  << std::endl;
    }
}

std::vector<CandidateCell> StormPipeline::detect(const ReflectivityGrid &grid) const {
    std::vector<CandidateCell> cells = grower_.grow(grid);
    if (cells.empty()) {
        if (g_logging.pipeline_logger) {
            std::cout << "[PIPE] no cells in scan " << grid.timestamp << std::endl;
        }
        return cells;
    }
    for (auto &c : cells) boundary_.apply(c, grid);
    return merger_.merge(std::move(cells));
}

ScanReport StormPipeline::update(std::vector<TrackedCell> &tracked, const ReflectivityGrid &grid) const {
    ScanReport report;
    report.timestamp = grid.timestamp;
    report.cells = detect(grid);

    const std::vector<TrackedCell> survivors = terminator_.terminate(tracked);
    std::unordered_set<int> alive;
    for (const auto &c : survivors) alive.insert(c.id);
    for (const auto &c : tracked) {
        if (!alive.count(c.id)) report.terminated_ids.push_back(c.id);
    }

    report.match = matcher_.match(survivors, report.cells);
    report.history = history_.apply(tracked, survivors, report.cells, report.match.matches, grid.timestamp);

    if (cfg_.termination.prune && !report.terminated_ids.empty()) {
        // отметка выданных id остаётся на выживших; покрывшая ячейка всегда среди них
        int issued = 0;
        for (const auto &c : tracked) issued = std::max({issued, c.id, c.last_issued_id});

        const std::unordered_set<int> gone(report.terminated_ids.begin(), report.terminated_ids.end());
        tracked.erase(std::remove_if(tracked.begin(), tracked.end(),
                                     [&](const TrackedCell &c) { return gone.count(c.id) != 0; }),
                      tracked.end());
        for (auto &c : tracked) c.last_issued_id = issued;
    }

    if (g_logging.pipeline_logger) {
        std::cout << "[PIPE] scan " << report.timestamp
                  << ": cells=" << report.cells.size()
                  << " terminated=" << report.terminated_ids.size()
                  << " match=" << track::to_string(report.match.quality)
                  << " matched=" << report.match.matches.size()
                  << " new_tracks=" << report.history.created
                  << " tracked=" << tracked.size()
                  << std::endl;
    }
    return report;
}
