#include <toml++/toml.h>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include "config.h"
#include "io/cell_store.h"
#include "io/grid_loader.h"
#include "storm_pipeline.h"


static void print_usage(const char *argv0) {
    std::cerr << "usage: " << argv0 << " <grid.yml> [state.json] [config.toml]" << std::endl;
}


int main(int argc, char *argv[]) {

    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    if (argc < 2 || argc > 4) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string grid_path = argv[1];
    const std::string state_path = argc > 2 ? argv[2] : "stormcells.json";
    const std::string config_path = argc > 3 ? argv[3] : "config.toml";

    // получаем конфигурацию из config.toml; при ошибке работаем на значениях по умолчанию
    toml::table tbl;
    try {
        tbl = toml::parse_file(config_path);
    } catch (const toml::parse_error &e) {
        std::cerr << "config parse failed (" << config_path << ")  " << e.description()
                  << ", using defaults" << std::endl;
    }
    AppConfig cfg;
    if (!tbl.empty() && !load_app_config(tbl, cfg)) {
        std::cerr << "config incomplete (" << config_path << "), defaults used for failed tables" << std::endl;
    }
    g_logging = cfg.logging;

    StormPipeline pipeline(cfg);

    ReflectivityGrid grid;
    try {
        grid = io::load_grid(grid_path);
    } catch (const std::exception &e) {
        std::cerr << "[PIPE] grid load failed  " << e.what() << std::endl;
        return 2;
    }

    io::CellStore store(state_path);
    std::vector<TrackedCell> tracked = store.load();

    ScanReport report;
    try {
        report = pipeline.update(tracked, grid);
    } catch (const std::invalid_argument &e) {
        std::cerr << "[PIPE] invalid grid  " << e.what() << std::endl;
        return 2;
    }

    try {
        store.save(tracked);
    } catch (const std::exception &e) {
        std::cerr << "[STORE] save failed  " << e.what() << std::endl;
        return 3;
    }

    std::cout << "scan " << report.timestamp
              << ": " << report.cells.size() << " cells, "
              << report.match.matches.size() << " matched, "
              << report.history.created << " new, "
              << tracked.size() << " tracked" << std::endl;
    return 0;
}
