#include "util/timestamp.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <regex>

namespace util {

static std::string format_iso(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

std::optional<double> parse_timestamp(const std::string &ts) {
    int year = 0, mon = 0, day = 0, hour = 0, min = 0;
    double sec = 0.0;
    char sep = 0;
    int consumed = 0;
    const int n = std::sscanf(ts.c_str(), "%4d-%2d-%2d%c%2d:%2d:%lf%n",
                              &year, &mon, &day, &sep, &hour, &min, &sec, &consumed);
    if (n < 7 || (sep != 'T' && sep != ' ')) {
        return std::nullopt;
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec < 0.0 || sec >= 61.0) {
        return std::nullopt;
    }

    // хвост: пусто, 'Z' или смещение +hh:mm / -hh:mm
    double offset_s = 0.0;
    const std::string tail = ts.substr(static_cast<size_t>(consumed));
    if (!tail.empty() && tail != "Z") {
        char sign = 0;
        int oh = 0, om = 0;
        if (std::sscanf(tail.c_str(), "%c%2d:%2d", &sign, &oh, &om) != 3 || (sign != '+' && sign != '-')) {
            return std::nullopt;
        }
        offset_s = (oh * 3600.0 + om * 60.0) * (sign == '+' ? 1.0 : -1.0);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = 0;
    const std::time_t base = timegm(&tm);
    return static_cast<double>(base) + sec - offset_s;
}

bool timestamp_less(const std::string &a, const std::string &b) {
    const auto ta = parse_timestamp(a);
    const auto tb = parse_timestamp(b);
    // разобранные метки идут раньше неразобранных
    if (ta.has_value() != tb.has_value()) {
        return ta.has_value();
    }
    if (ta && *ta != *tb) {
        return *ta < *tb;
    }
    return a < b;
}

bool timestamp_equal(const std::string &a, const std::string &b) {
    if (a == b) {
        return true;
    }
    const auto ta = parse_timestamp(a);
    const auto tb = parse_timestamp(b);
    return ta && tb && *ta == *tb;
}

std::optional<std::string> timestamp_from_filename(const std::string &path) {
    const auto slash = path.find_last_of("/\\");
    const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);

    std::smatch m;
    static const std::regex mrms(R"((\d{8})-(\d{6}))");
    if (std::regex_search(name, m, mrms)) {
        const std::string d = m[1].str();
        const std::string t = m[2].str();
        return d.substr(0, 4) + "-" + d.substr(4, 2) + "-" + d.substr(6, 2) + "T" +
               t.substr(0, 2) + ":" + t.substr(2, 2) + ":" + t.substr(4, 2);
    }

    // GOES: s + год + день года + ЧЧММСС + десятые
    static const std::regex goes(R"(s(\d{4})(\d{3})(\d{2})(\d{2})(\d{2})\d)");
    if (std::regex_search(name, m, goes)) {
        std::tm tm{};
        tm.tm_year = std::stoi(m[1].str()) - 1900;
        tm.tm_mon = 0;
        tm.tm_mday = std::stoi(m[2].str());
        tm.tm_hour = std::stoi(m[3].str());
        tm.tm_min = std::stoi(m[4].str());
        tm.tm_sec = std::stoi(m[5].str());
        return format_iso(timegm(&tm));
    }
    return std::nullopt;
}

std::string utc_now_iso() {
    return format_iso(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

} // namespace util
