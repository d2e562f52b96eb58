#pragma once

#include <vector>

#include "config.h"
#include "core/storm_cell.h"

namespace track {

    // Что нужно терминатору от ячейки любого поколения.
    struct Footprint {
        int id = -1;
        int num_gates = 0;
        const Ring *ring = nullptr;
    };

    // Снимает ячейки, которые более чем на coverage_threshold_pct процентов
    // (от собственной площади) покрыты ячейкой большего размера.
    class CellTerminator {
    public:
        explicit CellTerminator(const TerminationConfig &cfg);

        // Индексы снимаемых ячеек (по возрастанию).
        std::vector<size_t> find_covered(const std::vector<Footprint> &cells) const;

        // Копия cells без снятых ячеек; порядок сохраняется.
        template <typename Cell>
        std::vector<Cell> terminate(const std::vector<Cell> &cells) const {
            std::vector<Footprint> fp;
            fp.reserve(cells.size());
            for (const auto &c : cells) fp.push_back({c.id, c.num_gates, &c.alpha_shape});

            const std::vector<size_t> covered = find_covered(fp);
            std::vector<Cell> out;
            out.reserve(cells.size() - covered.size());
            size_t k = 0;
            for (size_t i = 0; i < cells.size(); ++i) {
                if (k < covered.size() && covered[k] == i) {
                    ++k;
                    continue;
                }
                out.push_back(cells[i]);
            }
            return out;
        }

        // Процент площади smaller, покрытый larger. 0, если у кого-то нет полигона.
        static double coverage_pct(const Ring &smaller, const Ring &larger);

    private:
        TerminationConfig cfg_;
    };

} // namespace track
