#include "format_utils.hpp"
#include <cstdio>

std::string format_bytes(std::int64_t bytes)
{
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%.2f %s", size, units[unit_index]);
    return std::string(buffer);
}

std::string format_speed(int rate_bytes_per_sec)
{
    if (rate_bytes_per_sec == 0) {
        return "0 B/s";
    }

    return format_bytes(rate_bytes_per_sec) + "/s";
}

std::string format_percent(double progress)
{
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%.2f%%", progress * 100.0);
    return std::string(buffer);
}

std::string format_duration(std::chrono::seconds duration)
{
    long long seconds = duration.count();
    if (seconds < 0) {
        seconds = 0;
    }

    char buffer[64];
    if (seconds < 60) {
        snprintf(buffer, sizeof(buffer), "%llds", seconds);
    } else if (seconds < 3600) {
        snprintf(buffer, sizeof(buffer), "%lldm %llds", seconds / 60, seconds % 60);
    } else {
        snprintf(buffer, sizeof(buffer), "%lldh %lldm", seconds / 3600, (seconds % 3600) / 60);
    }
    return std::string(buffer);
}
