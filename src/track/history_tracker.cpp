#include "track/history_tracker.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_map>

#include "config.h"
#include "util/geo_utils.h"
#include "util/timestamp.h"

namespace track {

    static void sort_history(std::vector<HistorySnapshot> &history) {
        std::stable_sort(history.begin(), history.end(), [](const HistorySnapshot &a, const HistorySnapshot &b) {
            return util::timestamp_less(a.timestamp, b.timestamp);
        });
    }

    // Текущие поля трека из кандидата.
    static void mirror(TrackedCell &track, const CandidateCell &cell) {
        track.centroid = cell.centroid;
        track.bbox = cell.bbox;
        track.alpha_shape = cell.alpha_shape;
        track.num_gates = cell.num_gates;
        track.max_reflectivity_dbz = cell.max_reflectivity_dbz;
    }

    bool HistoryTracker::upsert_snapshot(TrackedCell &cell, HistorySnapshot snapshot) {
        for (auto &s : cell.storm_history) {
            if (!util::timestamp_equal(s.timestamp, snapshot.timestamp)) continue;
            // поля обогащения и смещение остаются от прежнего снимка
            s.max_reflectivity_dbz = snapshot.max_reflectivity_dbz;
            s.num_gates = snapshot.num_gates;
            s.centroid = snapshot.centroid;
            return false;
        }
        cell.storm_history.push_back(std::move(snapshot));
        sort_history(cell.storm_history);
        return true;
    }

    bool HistoryTracker::update_motion(TrackedCell &cell) {
        auto &h = cell.storm_history;
        if (h.size() < 2) return false;

        HistorySnapshot &latest = h[h.size() - 1];
        const HistorySnapshot &prev = h[h.size() - 2];
        const auto t1 = util::parse_timestamp(prev.timestamp);
        const auto t2 = util::parse_timestamp(latest.timestamp);
        if (!t1 || !t2) {
            std::cerr << "[HIST] cell " << cell.id << ": cannot parse timestamps '" << prev.timestamp
                      << "' / '" << latest.timestamp << "', motion skipped" << std::endl;
            return false;
        }
        const double dt = *t2 - *t1;
        if (dt <= 0.0) return false;

        latest.dx = util::dx_km(prev.centroid.lat, prev.centroid.lon, latest.centroid.lat, latest.centroid.lon) * 1000.0;
        latest.dy = util::dy_km(prev.centroid.lat, latest.centroid.lat) * 1000.0;
        latest.dt = dt;
        return true;
    }

    int HistoryTracker::next_free_id(const std::vector<TrackedCell> &tracked,
                                     const std::vector<TrackedCell> &old_cells) {
        int max_id = 0;
        for (const auto *set : {&tracked, &old_cells}) {
            for (const auto &c : *set) max_id = std::max({max_id, c.id, c.last_issued_id});
        }
        return max_id + 1;
    }

    TrackedCell HistoryTracker::make_track(int id, const CandidateCell &cell, const std::string &timestamp) {
        TrackedCell track;
        track.id = id;
        mirror(track, cell);
        track.storm_history.push_back(make_snapshot(cell, timestamp));
        return track;
    }

    HistoryStats HistoryTracker::apply(std::vector<TrackedCell> &tracked,
                                       const std::vector<TrackedCell> &old_cells,
                                       const std::vector<CandidateCell> &new_cells,
                                       const std::vector<Match> &matches,
                                       const std::string &timestamp) const {
        HistoryStats stats;
        int next_id = next_free_id(tracked, old_cells);

        std::unordered_map<int, size_t> index_of;
        for (size_t i = 0; i < tracked.size(); ++i) index_of.emplace(tracked[i].id, i);

        std::vector<bool> new_used(new_cells.size(), false);
        for (const auto &m : matches) {
            if (m.old_index < 0 || m.old_index >= static_cast<int>(old_cells.size()) ||
                m.new_index < 0 || m.new_index >= static_cast<int>(new_cells.size())) {
                std::cerr << "[HIST] match (" << m.old_index << ", " << m.new_index << ") out of range, skipped"
                          << std::endl;
                continue;
            }
            const TrackedCell &old_cell = old_cells[m.old_index];
            const CandidateCell &fresh = new_cells[m.new_index];
            new_used[m.new_index] = true;

            auto it = index_of.find(old_cell.id);
            if (it == index_of.end()) {
                if (g_logging.history_logger) {
                    std::cout << "[HIST] track " << old_cell.id << " missing from collection, restored" << std::endl;
                }
                tracked.push_back(old_cell);
                it = index_of.emplace(old_cell.id, tracked.size() - 1).first;
            }
            TrackedCell &track = tracked[it->second];

            if (upsert_snapshot(track, make_snapshot(fresh, timestamp))) {
                ++stats.appended;
            } else {
                ++stats.refreshed;
            }
            // текущие поля отражают последний снимок; запоздавший скан их не трогает
            if (util::timestamp_equal(track.storm_history.back().timestamp, timestamp)) {
                mirror(track, fresh);
            }
            update_motion(track);
            ++stats.matched;

            if (g_logging.history_logger) {
                std::cout << "[HIST] track " << track.id << " <- scan cell " << fresh.id
                          << " cost=" << m.cost
                          << " history=" << track.storm_history.size()
                          << std::endl;
            }
        }

        for (size_t j = 0; j < new_cells.size(); ++j) {
            if (new_used[j]) continue;
            tracked.push_back(make_track(next_id, new_cells[j], timestamp));
            if (g_logging.history_logger) {
                std::cout << "[HIST] new track " << next_id << " from scan cell " << new_cells[j].id << std::endl;
            }
            ++next_id;
            ++stats.created;
        }

        if (g_logging.history_logger) {
            std::cout << "[HIST] matched=" << stats.matched
                      << " appended=" << stats.appended
                      << " refreshed=" << stats.refreshed
                      << " created=" << stats.created
                      << std::endl;
        }
        return stats;
    }

} // namespace track
