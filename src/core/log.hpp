#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::mutex& hostmux_log_mutex() {
    static std::mutex m;
    return m;
}

inline std::string& hostmux_log_path_ref() {
    static std::string path = (platform::temp_dir() / "hostmux_debug.log").string();
    return path;
}

inline std::string hostmux_log_path() {
    std::lock_guard<std::mutex> lock(hostmux_log_mutex());
    return hostmux_log_path_ref();
}

// Redirect the debug log (settings.log_file). Empty keeps the default.
inline void set_hostmux_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(hostmux_log_mutex());
    hostmux_log_path_ref() = path;
}

inline void hostmux_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    // Reader threads of several sessions log concurrently.
    std::lock_guard<std::mutex> lock(hostmux_log_mutex());
    std::ofstream out(hostmux_log_path_ref(), std::ios::app);
    if (!out) return;
    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

inline void hostmux_log_ssh(const std::string& label, const std::string& cmd,
                            const SSHResult& r) {
    hostmux_log(fmt::format("{} CMD: {}", label, cmd));
    hostmux_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                            r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_TRUNCATE)));
    if (!r.stderr_data.empty())
        hostmux_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_TRUNCATE)));
}
