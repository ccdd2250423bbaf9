#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <utility>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log path: $SFTPOOL_LOG, else {tmp}/sftpool_debug.log
inline std::string sftpool_log_path() {
    static std::string path = [] {
        const char* env = std::getenv("SFTPOOL_LOG");
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / "sftpool_debug.log").string();
    }();
    return path;
}

// Append a timestamped line to the debug log. Sessions log from their own
// worker threads, so appends are serialized.
inline void sftpool_log(const std::string& msg) {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);

    std::ofstream out(sftpool_log_path(), std::ios::app);
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

template <typename... Args>
inline void sftpool_logf(fmt::format_string<Args...> format, Args&&... args) {
    sftpool_log(fmt::format(format, std::forward<Args>(args)...));
}
