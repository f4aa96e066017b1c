#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace scansync {

/**
 * @brief Format a byte count with SI units ("1.2 MB")
 */
inline std::string human_bytes(std::uint64_t bytes) {
    static const char* const kUnits[] = {"B", "kB", "MB", "GB", "TB", "PB"};
    if (bytes < 1000) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1000.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1000.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(value < 10.0 ? 1 : 0) << value << " " << kUnits[unit];
    return oss.str();
}

} // namespace scansync
