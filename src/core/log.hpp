#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

// Debug trace: $PM_LOG_FILE, else <temp>/pm_debug.log
inline std::string pm_log_path() {
    static std::string path = env_or(ENV_LOG_FILE, (platform::temp_dir() / "pm_debug.log").string());
    return path;
}

inline void pm_log(const std::string& msg) {
    std::ofstream out(pm_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

