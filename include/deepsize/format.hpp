#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>

#include "deepsize/footprint.hpp"


namespace deepsize {

// Insert thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string group_thousands(std::uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}


// Format bytes as a scaled human-readable value (binary units)
// Example: 1234567 -> "1.18 MB"
inline std::string format_bytes_scaled(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit_index = 0;

    while (value >= 1024.0 && unit_index < 4) {
        value /= 1024.0;
        ++unit_index;
    }

    if (unit_index == 0) {
        return std::format("{} B", bytes);
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, units[unit_index]);
}


// Example: 1234567 -> "1,234,567 bytes"
inline std::string format_bytes_exact(std::uint64_t bytes) {
    return std::format("{} bytes", group_thousands(bytes));
}


// Format bytes as: "<scaled> (<exact>)"
// Example: 1234567 -> "1.18 MB (1,234,567 bytes)"
inline std::string format_bytes(std::uint64_t bytes) {
    return std::format("{} ({})",
        format_bytes_scaled(bytes),
        format_bytes_exact(bytes)
    );
}


// One-line footprint summary
// Example: "static 32 B, dynamic 1.18 MB, total 1.18 MB"
inline std::string format_footprint(const footprint& fp, bool exact = false) {
    auto fmt = exact ? &format_bytes : &format_bytes_scaled;
    return std::format("static {}, dynamic {}, total {}",
        fmt(fp.static_bytes),
        fmt(fp.dynamic_bytes),
        fmt(fp.total_bytes())
    );
}

} // namespace deepsize
