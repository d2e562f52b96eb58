#include "io/cell_store.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "config.h"
#include "util/timestamp.h"

namespace io {

    static const char *const kSnapshotKeys[] = {
        "timestamp", "max_reflectivity_dbz", "num_gates", "centroid", "dx", "dy", "dt"};
    static const char *const kCellKeys[] = {
        "id", "num_gates", "centroid", "bbox", "max_reflectivity_dbz", "alpha_shape", "storm_history",
        "last_issued_id"};

    template <size_t N>
    static bool is_known(const std::string &key, const char *const (&known)[N]) {
        for (const char *k : known) {
            if (key == k) return true;
        }
        return false;
    }

    template <size_t N>
    static json extras_of(const json &j, const char *const (&known)[N]) {
        json extra = json::object();
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!is_known(it.key(), known)) extra[it.key()] = it.value();
        }
        return extra;
    }

    static json latlon_to_json(const LatLon &p) {
        return json::array({p.lat, p.lon});
    }

    static LatLon latlon_from_json(const json &j) {
        if (!j.is_array() || j.size() != 2) {
            throw std::runtime_error("centroid must be [lat, lon]");
        }
        return {j.at(0).get<double>(), j.at(1).get<double>()};
    }

    static std::optional<double> optional_number(const json &j, const char *key) {
        const auto it = j.find(key);
        if (it == j.end() || it->is_null()) return std::nullopt;
        return it->get<double>();
    }

    json to_json(const HistorySnapshot &s) {
        json j = json::object();
        j["timestamp"] = s.timestamp;
        j["max_reflectivity_dbz"] = s.max_reflectivity_dbz;
        j["num_gates"] = s.num_gates;
        j["centroid"] = latlon_to_json(s.centroid);
        if (s.dx) j["dx"] = *s.dx;
        if (s.dy) j["dy"] = *s.dy;
        if (s.dt) j["dt"] = *s.dt;
        for (auto it = s.extra.begin(); it != s.extra.end(); ++it) {
            if (!is_known(it.key(), kSnapshotKeys)) j[it.key()] = it.value();
        }
        return j;
    }

    json to_json(const TrackedCell &c) {
        json j = json::object();
        j["id"] = c.id;
        j["num_gates"] = c.num_gates;
        j["centroid"] = latlon_to_json(c.centroid);
        if (c.bbox) {
            j["bbox"] = {{"lat_min", c.bbox->lat_min},
                         {"lat_max", c.bbox->lat_max},
                         {"lon_min", c.bbox->lon_min},
                         {"lon_max", c.bbox->lon_max}};
        } else {
            j["bbox"] = json::object();
        }
        j["max_reflectivity_dbz"] = c.max_reflectivity_dbz;

        json ring = json::array();
        for (const auto &p : c.alpha_shape) ring.push_back(json::array({p.x, p.y}));
        j["alpha_shape"] = std::move(ring);

        json history = json::array();
        for (const auto &s : c.storm_history) history.push_back(to_json(s));
        j["storm_history"] = std::move(history);
        if (c.last_issued_id > c.id) j["last_issued_id"] = c.last_issued_id;

        for (auto it = c.extra.begin(); it != c.extra.end(); ++it) {
            if (!is_known(it.key(), kCellKeys)) j[it.key()] = it.value();
        }
        return j;
    }

    json to_json(const std::vector<TrackedCell> &cells) {
        json j = json::array();
        for (const auto &c : cells) j.push_back(to_json(c));
        return j;
    }

    HistorySnapshot snapshot_from_json(const json &j) {
        if (!j.is_object()) {
            throw std::runtime_error("storm_history entry must be an object");
        }
        HistorySnapshot s;
        s.timestamp = j.at("timestamp").get<std::string>();
        s.max_reflectivity_dbz = j.value("max_reflectivity_dbz", 0.0);
        s.num_gates = j.value("num_gates", 0);
        if (j.contains("centroid")) s.centroid = latlon_from_json(j.at("centroid"));
        s.dx = optional_number(j, "dx");
        s.dy = optional_number(j, "dy");
        s.dt = optional_number(j, "dt");
        s.extra = extras_of(j, kSnapshotKeys);
        return s;
    }

    TrackedCell cell_from_json(const json &j) {
        if (!j.is_object()) {
            throw std::runtime_error("cell must be an object");
        }
        TrackedCell c;
        c.id = j.at("id").get<int>();

        if (const auto it = j.find("storm_history"); it != j.end()) {
            for (const auto &entry : *it) c.storm_history.push_back(snapshot_from_json(entry));
        }
        std::stable_sort(c.storm_history.begin(), c.storm_history.end(),
                         [](const HistorySnapshot &a, const HistorySnapshot &b) {
                             return util::timestamp_less(a.timestamp, b.timestamp);
                         });

        // верхние поля необязательны: по умолчанию - из последнего снимка
        const HistorySnapshot *last = c.latest();
        if (j.contains("centroid")) {
            c.centroid = latlon_from_json(j.at("centroid"));
        } else if (last) {
            c.centroid = last->centroid;
        }
        c.num_gates = j.value("num_gates", last ? last->num_gates : 0);
        c.max_reflectivity_dbz = j.value("max_reflectivity_dbz", last ? last->max_reflectivity_dbz : 0.0);

        if (const auto it = j.find("bbox"); it != j.end() && it->is_object() && !it->empty()) {
            BBox b;
            b.lat_min = it->at("lat_min").get<double>();
            b.lat_max = it->at("lat_max").get<double>();
            b.lon_min = it->at("lon_min").get<double>();
            b.lon_max = it->at("lon_max").get<double>();
            c.bbox = b;
        }

        if (const auto it = j.find("alpha_shape"); it != j.end() && it->is_array()) {
            for (const auto &p : *it) {
                if (!p.is_array() || p.size() != 2) {
                    throw std::runtime_error("alpha_shape point must be [lon, lat]");
                }
                c.alpha_shape.emplace_back(p.at(0).get<double>(), p.at(1).get<double>());
            }
        }
        c.last_issued_id = j.value("last_issued_id", 0);
        c.extra = extras_of(j, kCellKeys);
        return c;
    }

    CellStore::CellStore(std::string path) : path_(std::move(path)) {}

    std::vector<TrackedCell> CellStore::load() const {
        std::vector<TrackedCell> cells;
        std::ifstream in(path_);
        if (!in.is_open()) {
            if (g_logging.store_logger) {
                std::cout << "[STORE] " << path_ << " not found, starting with empty collection" << std::endl;
            }
            return cells;
        }
        if (in.peek() == std::ifstream::traits_type::eof()) {
            return cells;
        }

        json root;
        try {
            root = json::parse(in);
        } catch (const json::exception &e) {
            std::cerr << "[STORE] failed to parse " << path_ << ": " << e.what() << std::endl;
            return cells;
        }
        if (!root.is_array()) {
            std::cerr << "[STORE] " << path_ << ": top level must be an array" << std::endl;
            return cells;
        }

        size_t skipped = 0;
        for (const auto &item : root) {
            try {
                cells.push_back(cell_from_json(item));
            } catch (const std::exception &e) {
                ++skipped;
                std::cerr << "[STORE] skipping malformed cell: " << e.what() << std::endl;
            }
        }

        const size_t raw = cells.size();
        cells = deduplicate(std::move(cells));
        if (g_logging.store_logger) {
            std::cout << "[STORE] loaded " << raw << " cells from " << path_
                      << " (unique=" << cells.size() << ", skipped=" << skipped << ")" << std::endl;
        }
        return cells;
    }

    void CellStore::save(const std::vector<TrackedCell> &cells) const {
        const std::string tmp = path_ + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out.is_open()) {
                throw std::runtime_error("cannot open " + tmp + " for writing");
            }
            out << to_json(cells).dump(2) << '\n';
            if (!out.good()) {
                throw std::runtime_error("write to " + tmp + " failed");
            }
        }
        if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
            std::remove(tmp.c_str());
            throw std::runtime_error("cannot replace " + path_);
        }
        if (g_logging.store_logger) {
            std::cout << "[STORE] saved " << cells.size() << " cells to " << path_ << std::endl;
        }
    }

    std::vector<TrackedCell> CellStore::deduplicate(std::vector<TrackedCell> cells) {
        std::vector<TrackedCell> out;
        std::unordered_map<int, size_t> index_of;

        for (auto &c : cells) {
            const auto it = index_of.find(c.id);
            if (it == index_of.end()) {
                index_of.emplace(c.id, out.size());
                out.push_back(std::move(c));
                continue;
            }

            TrackedCell &kept = out[it->second];
            if (g_logging.store_logger) {
                std::cout << "[STORE] duplicate id " << c.id << " merged" << std::endl;
            }

            const bool newer = c.latest() && (!kept.latest() ||
                                              util::timestamp_less(kept.latest()->timestamp, c.latest()->timestamp));
            for (auto &s : c.storm_history) {
                const bool present = std::any_of(kept.storm_history.begin(), kept.storm_history.end(),
                                                 [&](const HistorySnapshot &k) {
                                                     return util::timestamp_equal(k.timestamp, s.timestamp);
                                                 });
                if (!present) kept.storm_history.push_back(std::move(s));
            }
            std::stable_sort(kept.storm_history.begin(), kept.storm_history.end(),
                             [](const HistorySnapshot &a, const HistorySnapshot &b) {
                                 return util::timestamp_less(a.timestamp, b.timestamp);
                             });

            kept.last_issued_id = std::max(kept.last_issued_id, c.last_issued_id);
            if (newer) {
                kept.centroid = c.centroid;
                kept.bbox = c.bbox;
                kept.alpha_shape = std::move(c.alpha_shape);
                kept.num_gates = c.num_gates;
                kept.max_reflectivity_dbz = c.max_reflectivity_dbz;
            }
            for (auto e = c.extra.begin(); e != c.extra.end(); ++e) {
                if (!kept.extra.contains(e.key())) kept.extra[e.key()] = e.value();
            }
        }
        return out;
    }

} // namespace io
