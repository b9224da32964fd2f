#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <filesystem>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Directory for the debug log and per-job logs. Defaults to the temp dir
// until the files directory is known; set_log_dir() moves it under state/.
inline std::filesystem::path& log_dir_ref() {
    static std::filesystem::path dir = platform::temp_dir() / "chartreader";
    return dir;
}

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline void set_log_dir(const std::filesystem::path& dir) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_dir_ref() = dir;
}

inline std::string chartreader_log_path() {
    return (log_dir_ref() / "chartreader_debug.log").string();
}

// Persistent job log path: <log dir>/jobs/{job_id}.log
inline std::string job_log_path(const std::string& job_id) {
    return (log_dir_ref() / "jobs" / (job_id + ".log")).string();
}

// Append a timestamped line to a job's persistent log file.
inline void append_job_log(const std::string& job_id, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::string path = job_log_path(job_id);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void chartreader_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::error_code ec;
    std::filesystem::create_directories(log_dir_ref(), ec);
    std::ofstream out(chartreader_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Same line to the job's log and the debug log.
inline void log_job_event(const std::string& job_id, const std::string& msg) {
    append_job_log(job_id, msg);
    chartreader_log(fmt::format("job {}: {}", job_id, msg));
}
