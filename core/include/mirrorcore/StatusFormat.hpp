// Small formatting helpers shared by status renderers.
#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace mirrorcore {

// 1536 -> "1.50 KiB"
inline std::string readableSize(std::uint64_t bytes) {
    static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0)
        std::snprintf(buf, sizeof(buf), "%llu B",
                      static_cast<unsigned long long>(bytes));
    else
        std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    return buf;
}

inline std::string readableSpeed(double bytesPerSecond) {
    if (!(bytesPerSecond > 0.0))
        return "0 B/s";
    return readableSize(static_cast<std::uint64_t>(bytesPerSecond)) + "/s";
}

// 3725s -> "1h2m5s"; unknown -> "-"
inline std::string readableTime(std::optional<std::chrono::seconds> secs) {
    if (!secs.has_value() || secs->count() < 0)
        return "-";
    long long rest = static_cast<long long>(secs->count());
    const long long days = rest / 86400;
    rest %= 86400;
    const long long hours = rest / 3600;
    rest %= 3600;
    const long long minutes = rest / 60;
    const long long seconds = rest % 60;
    std::string out;
    if (days)
        out += std::to_string(days) + "d";
    if (hours)
        out += std::to_string(hours) + "h";
    if (minutes)
        out += std::to_string(minutes) + "m";
    if (seconds || out.empty())
        out += std::to_string(seconds) + "s";
    return out;
}

// progressBar(45.0, 10) -> "[####------]"
inline std::string progressBar(double percent, int width = 10) {
    if (width <= 0)
        return "[]";
    if (!(percent > 0.0))
        percent = 0.0;
    if (percent > 100.0)
        percent = 100.0;
    const int filled = static_cast<int>(percent / 100.0 * width);
    return "[" + std::string(static_cast<std::size_t>(filled), '#') +
           std::string(static_cast<std::size_t>(width - filled), '-') + "]";
}

} // namespace mirrorcore
