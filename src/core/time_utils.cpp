#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <vector>

std::string format_uptime(double seconds) {
    if (seconds <= 0) return "-";

    int64_t total = static_cast<int64_t>(seconds);
    int64_t days = total / 86400;
    int64_t hours = (total % 86400) / 3600;
    int64_t mins = (total % 3600) / 60;
    int64_t secs = total % 60;

    std::vector<std::string> parts;
    if (days > 0) parts.push_back(fmt::format("{}d", days));
    if (hours > 0) parts.push_back(fmt::format("{}h", hours));
    if (mins > 0) parts.push_back(fmt::format("{}m", mins));

    if (parts.empty()) {
        return fmt::format("{}s", secs);
    }
    if (parts.size() > 2) parts.resize(2);
    std::string out;
    for (const auto& p : parts) out += p;
    return out;
}

std::string format_epoch_ms(int64_t epoch_ms) {
    if (epoch_ms <= 0) return "-";

    std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
    struct tm tm_buf = {};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string format_gb(double bytes) {
    if (bytes <= 0) return "0.00 GB";
    return fmt::format("{:.2f} GB", bytes / (1024.0 * 1024.0 * 1024.0));
}

std::string format_percent(double fraction) {
    return fmt::format("{:.2f}%", fraction * 100.0);
}
