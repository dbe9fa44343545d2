#include "FormatUtils.hpp"
#include <iomanip>
#include <sstream>

std::string FormatUtils::format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

std::string FormatUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    std::ostringstream oss;
    if (ms < 1000) {
        oss << ms << "ms";
    } else {
        oss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    }
    return oss.str();
}
