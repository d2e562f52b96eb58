#include "io/grid_loader.h"

#include <opencv2/core/persistence.hpp>

#include <iostream>
#include <stdexcept>

#include "config.h"
#include "util/timestamp.h"

namespace io {

    static cv::Mat read_matrix(const cv::FileStorage &fs, const char *name, const std::string &path) {
        const cv::FileNode node = fs[name];
        if (node.empty()) {
            throw std::runtime_error(path + ": missing '" + name + "' node");
        }
        cv::Mat m;
        node >> m;
        return m;
    }

    ReflectivityGrid load_grid(const std::string &path) {
        cv::FileStorage fs;
        try {
            if (!fs.open(path, cv::FileStorage::READ)) {
                throw std::runtime_error("cannot open grid file " + path);
            }
        } catch (const cv::Exception &e) {
            throw std::runtime_error("cannot parse grid file " + path + ": " + e.what());
        }

        const cv::Mat refl = read_matrix(fs, "reflectivity", path);
        const cv::Mat lat = read_matrix(fs, "lat", path);
        const cv::Mat lon = read_matrix(fs, "lon", path);

        std::string timestamp;
        const cv::FileNode ts = fs["timestamp"];
        if (ts.isString()) {
            timestamp = static_cast<std::string>(ts);
        }
        if (timestamp.empty()) {
            if (const auto from_name = util::timestamp_from_filename(path)) {
                timestamp = *from_name;
            } else {
                timestamp = util::utc_now_iso();
                std::cerr << "[PIPE] no timestamp in " << path << ", using current time " << timestamp << std::endl;
            }
        }

        ReflectivityGrid grid = ReflectivityGrid::make(refl, lat, lon, timestamp);
        if (g_logging.pipeline_logger) {
            std::cout << "[PIPE] grid " << path << ": " << grid.rows() << "x" << grid.cols()
                      << " at " << grid.timestamp << std::endl;
        }
        return grid;
    }

    void write_grid(const std::string &path, const ReflectivityGrid &grid) {
        grid.validate();
        cv::FileStorage fs;
        if (!fs.open(path, cv::FileStorage::WRITE)) {
            throw std::runtime_error("cannot open grid file " + path + " for writing");
        }
        if (!grid.timestamp.empty()) {
            fs << "timestamp" << grid.timestamp;
        }
        fs << "reflectivity" << grid.reflectivity;
        fs << "lat" << grid.lat;
        fs << "lon" << grid.lon;
        fs.release();
    }

} // namespace io
