#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <ctime>

std::string format_time_ago(const std::string& then, const std::string& now) {
    if (then.empty()) return "-";
    if (!is_iso_timestamp(then)) return "?";
    std::time_t then_t = parse_iso_time(then);

    std::time_t now_t;
    if (!now.empty()) {
        if (!is_iso_timestamp(now)) return "?";
        now_t = parse_iso_time(now);
    } else {
        now_t = std::time(nullptr);
    }

    long long seconds = static_cast<long long>(std::difftime(now_t, then_t));
    if (seconds < 5) return "just now";
    if (seconds < 60) return fmt::format("{}s ago", seconds);
    if (seconds < 3600) return fmt::format("{}m ago", seconds / 60);
    if (seconds < 86400) return fmt::format("{}h ago", seconds / 3600);
    return fmt::format("{}d ago", seconds / 86400);
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";
    if (!is_iso_timestamp(iso_time)) return "?";

    // Timestamps are stored in UTC; show them as such
    return iso_time.substr(0, 10) + " " + iso_time.substr(11, 5);
}
