#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/storm_cell.h"

namespace io {

    using json = nlohmann::ordered_json;

    // Снимок / ячейка <-> JSON. Неизвестные ключи переносятся через extra
    // в исходном порядке. from_json бросает при нарушении схемы
    // (json::exception или std::runtime_error).
    json to_json(const HistorySnapshot &snapshot);
    json to_json(const TrackedCell &cell);
    json to_json(const std::vector<TrackedCell> &cells);

    HistorySnapshot snapshot_from_json(const json &j);
    TrackedCell cell_from_json(const json &j);

    // Коллекция сопровождаемых ячеек в JSON-файле.
    class CellStore {
    public:
        explicit CellStore(std::string path);

        // Нет файла / пустой файл - пустая коллекция. Нечитаемый файл - ошибка
        // в cerr и пустая коллекция. Битые элементы пропускаются.
        // Записи с одинаковым id сливаются (deduplicate).
        std::vector<TrackedCell> load() const;

        // Запись через временный файл; бросает std::runtime_error.
        void save(const std::vector<TrackedCell> &cells) const;

        const std::string &path() const { return path_; }

        // Слияние записей с одинаковым id: истории объединяются по меткам времени,
        // текущая геометрия берётся у записи с более поздним последним снимком.
        static std::vector<TrackedCell> deduplicate(std::vector<TrackedCell> cells);

    private:
        std::string path_;
    };

} // namespace io
