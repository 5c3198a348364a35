#ifndef FORMAT_UTILS_HPP
#define FORMAT_UTILS_HPP

#include <string>
#include <cstdint>
#include <chrono>

// 格式化字节数，例如 "1.50 MB"
std::string format_bytes(std::int64_t bytes);

// 格式化速度，例如 "512.00 KB/s"
std::string format_speed(int rate_bytes_per_sec);

// 格式化百分比，例如 "42.00%"
std::string format_percent(double progress);

// 格式化时长，例如 "45s"、"3m 20s"、"2h 5m"
std::string format_duration(std::chrono::seconds duration);

#endif // FORMAT_UTILS_HPP
