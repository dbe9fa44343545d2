#pragma once
#include <chrono>
#include <cstdint>
#include <string>

class FormatUtils {
public:
    // binary units: "512 B", "1.50 KiB", "3.00 GiB"
    static std::string format_size(uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};
