#pragma once

#include <string>
#include <vector>

#include "core/storm_cell.h"
#include "track/cell_matcher.h"

namespace track {

    struct HistoryStats {
        int matched = 0;   // - совпадений применено.
        int appended = 0;  // - новых снимков в существующих треках.
        int refreshed = 0; // - снимков с той же меткой времени, обновлённых на месте.
        int created = 0;   // - новых треков.
    };

    // Применяет результат сопоставления к коллекции треков.
    //
    // Совпавший трек сохраняет id и историю; снимок скана добавляется, а если
    // снимок с той же меткой времени уже есть - обновляется на месте.
    // Несовпавшие новые ячейки получают свежие id. Несовпавшие старые треки
    // не трогаются.
    class HistoryTracker {
    public:
        // old_cells - то поколение, которое сопоставлялось (индексы в matches);
        // треки ищутся в tracked по id.
        HistoryStats apply(std::vector<TrackedCell> &tracked,
                           const std::vector<TrackedCell> &old_cells,
                           const std::vector<CandidateCell> &new_cells,
                           const std::vector<Match> &matches,
                           const std::string &timestamp) const;

        // true - снимок добавлен, false - обновлён существующий с той же меткой.
        // История после вызова упорядочена по времени.
        static bool upsert_snapshot(TrackedCell &cell, HistorySnapshot snapshot);

        // dx/dy (м) и dt (с) последнего снимка по двум последним.
        // false - снимков меньше двух или метки времени не разбираются / dt <= 0.
        static bool update_motion(TrackedCell &cell);

        // Первый id выше всех id и last_issued_id в tracked и old_cells,
        // так что id удалённых треков повторно не выдаются.
        static int next_free_id(const std::vector<TrackedCell> &tracked,
                                const std::vector<TrackedCell> &old_cells);

        // Новый трек из кандидата с единственным снимком.
        static TrackedCell make_track(int id, const CandidateCell &cell, const std::string &timestamp);
    };

} // namespace track
