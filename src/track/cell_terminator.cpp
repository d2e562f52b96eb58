#include "track/cell_terminator.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>

#include "geom/geometry.h"

namespace track {

    CellTerminator::CellTerminator(const TerminationConfig &cfg) : cfg_(cfg) {}

    double CellTerminator::coverage_pct(const Ring &smaller, const Ring &larger) {
        if (geom::open_ring(smaller).size() < 3 || geom::open_ring(larger).size() < 3) return 0.0;
        const double area = geom::ring_area_km2(smaller);
        if (area <= 0.0) return 0.0;
        return geom::intersection_area_km2(smaller, larger) / area * 100.0;
    }

    std::vector<size_t> CellTerminator::find_covered(const std::vector<Footprint> &cells) const {
        std::vector<size_t> removed;
        if (cells.size() <= 1) return removed;

        // по убыванию размера; при равенстве - порядок скана
        std::vector<size_t> order(cells.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return cells[a].num_gates > cells[b].num_gates;
        });

        std::vector<bool> gone(cells.size(), false);
        for (size_t i = 1; i < order.size(); ++i) {
            const Footprint &smaller = cells[order[i]];
            if (!smaller.ring) continue;
            for (size_t j = 0; j < i; ++j) {
                if (gone[order[j]]) continue;
                const Footprint &larger = cells[order[j]];
                if (!larger.ring) continue;

                const double pct = coverage_pct(*smaller.ring, *larger.ring);
                if (pct <= 0.0 || pct < cfg_.coverage_threshold_pct) continue;

                gone[order[i]] = true;
                if (g_logging.termination_logger) {
                    std::cout << "[TERM] cell " << smaller.id << " ("
                              << std::fixed << std::setprecision(1) << geom::ring_area_km2(*smaller.ring)
                              << " km2) is " << pct << "% covered by cell " << larger.id << " ("
                              << geom::ring_area_km2(*larger.ring) << " km2)"
                              << std::defaultfloat << std::endl;
                }
                break;
            }
        }

        for (size_t i = 0; i < gone.size(); ++i) {
            if (gone[i]) removed.push_back(i);
        }
        if (g_logging.termination_logger) {
            std::cout << "[TERM] terminated " << removed.size() << " of " << cells.size() << " cells" << std::endl;
        }
        return removed;
    }

} // namespace track
