#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace byte_utils {

inline std::string format_bytes(std::int64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};

    if (bytes < 0) {
        return "?";
    }

    int unit_index = 0;
    std::uint64_t value = static_cast<std::uint64_t>(bytes);
    std::uint64_t scale = 1ULL;
    while (unit_index < 5 && value >= scale * 1024ULL) {
        scale *= 1024ULL;
        ++unit_index;
    }

    double in_unit = static_cast<double>(value) / static_cast<double>(scale);

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if (unit_index == 0) {
        oss.precision(0);
    } else {
        oss.precision(in_unit < 10.0 ? 2 : (in_unit < 100.0 ? 1 : 0));
    }

    oss << in_unit << ' ' << units[unit_index];
    return oss.str();
}

// "1.50 KB / 8.00 KB (18.8%)", or "1.50 KB" when the total is unknown.
inline std::string format_progress(std::int64_t current, std::int64_t total) {
    std::string text = format_bytes(current);
    if (total <= 0) {
        return text;
    }
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << text << " / " << format_bytes(total) << " ("
        << static_cast<double>(current) * 100.0 / static_cast<double>(total) << "%)";
    return oss.str();
}

} // namespace byte_utils
