#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log: one timestamped line per event, appended to
// $TMPDIR/avlink_debug.log unless a config overrides the path.

inline std::string& avlink_log_path_ref() {
    static std::string path = (platform::temp_dir() / "avlink_debug.log").string();
    return path;
}

inline std::mutex& avlink_log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::string avlink_log_path() {
    std::lock_guard<std::mutex> lock(avlink_log_mutex());
    return avlink_log_path_ref();
}

inline void set_avlink_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(avlink_log_mutex());
    avlink_log_path_ref() = path;
}

inline void avlink_log(const std::string& msg) {
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

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(avlink_log_mutex());
    std::ofstream out(avlink_log_path_ref(), std::ios::app);
    if (!out) return;
    out << line;
}
