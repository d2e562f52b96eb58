#pragma once

#include <optional>
#include <string>

namespace util {

// Разбирает ISO-8601 подобную строку ("YYYY-MM-DDTHH:MM:SS[.fff][Z|+hh:mm]",
// допускается пробел вместо 'T') в секунды UTC от эпохи.
std::optional<double> parse_timestamp(const std::string &ts);

// Сравнение для сортировки истории: разобранные метки раньше неразобранных;
// разобранные по времени (при равенстве по тексту), остальные лексикографически.
bool timestamp_less(const std::string &a, const std::string &b);

// Один и тот же момент: по времени, если обе строки разбираются, иначе по строке.
bool timestamp_equal(const std::string &a, const std::string &b);

// Достаёт время скана из имени файла (MRMS "YYYYMMDD-HHMMSS" или GOES
// "sYYYYDDDHHMMSS"); возвращает "YYYY-MM-DDTHH:MM:SS".
std::optional<std::string> timestamp_from_filename(const std::string &path);

// Текущее время UTC в формате "YYYY-MM-DDTHH:MM:SS".
std::string utc_now_iso();

} // namespace util
