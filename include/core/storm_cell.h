#pragma once

#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>

// Кольцо полигона: точки (x = lon, y = lat), замкнутое (первая == последняя).
using Ring = std::vector<cv::Point2d>;

struct LatLon {
    double lat = 0.0;
    double lon = 0.0;
};

struct BBox {
    double lat_min = 0.0;
    double lat_max = 0.0;
    double lon_min = 0.0;
    double lon_max = 0.0;

    // Огибающая набора точек (lon, lat); для пустого набора - nullopt.
    static std::optional<BBox> from_points(const std::vector<cv::Point2d> &lonlat);

    // Объединение огибающих.
    BBox united(const BBox &other) const;

    // Пересекаются ли bbox, если этот расширить на buffer_lat/buffer_lon градусов.
    bool near(const BBox &other, double buffer_lat, double buffer_lon) const;

    // Прямоугольник как замкнутое кольцо (lon, lat).
    Ring to_ring() const;
};

// Как была получена граница ячейки.
enum class GeometryStatus {
    Polygon,              // - нормальный alpha-shape
    InsufficientGeometry, // - меньше 3 точек, остаётся только bbox
    GeometryInvalid       // - alpha-shape выродился, используется bbox
};

const char *to_string(GeometryStatus status);

// Кандидат одного скана (живёт только внутри одного прогона конвейера).
struct CandidateCell {
    int id = -1;                        // - локальный id скана (метка ядра).
    std::vector<cv::Point> gates;       // - гейты ячейки (x = столбец, y = строка).
    int num_gates = 0;                  // - число гейтов.
    double max_reflectivity_dbz = 0.0;  // - максимум отражаемости в маске.
    LatLon centroid;                    // - центроид (lat, lon).
    Ring alpha_shape;                   // - граница; пустая, если полигона нет.
    std::optional<BBox> bbox;           // - огибающая.
    GeometryStatus geometry_status = GeometryStatus::InsufficientGeometry;
};

struct HistorySnapshot {
    std::string timestamp;
    double max_reflectivity_dbz = 0.0;
    int num_gates = 0;
    LatLon centroid;
    // смещение к предыдущему снимку: dx/dy в метрах, dt в секундах
    std::optional<double> dx;
    std::optional<double> dy;
    std::optional<double> dt;
    // поля внешних стадий обогащения, переносятся без изменений
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();
};

// Сопровождаемая ячейка: id назначается один раз и больше не меняется.
struct TrackedCell {
    int id = -1;
    LatLon centroid;
    std::optional<BBox> bbox;
    Ring alpha_shape;
    int num_gates = 0;
    double max_reflectivity_dbz = 0.0;
    std::vector<HistorySnapshot> storm_history;
    // наибольший id, выданный коллекцией (в т.ч. удалённым трекам); 0 - не больше id
    int last_issued_id = 0;
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();

    const HistorySnapshot *latest() const {
        return storm_history.empty() ? nullptr : &storm_history.back();
    }
};

// Снимок истории из кандидата текущего скана.
HistorySnapshot make_snapshot(const CandidateCell &cell, const std::string &timestamp);
