#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <ctime>

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    std::time_t start_t = parse_iso_time(start_time);
    if (start_t == 0) return "?";

    std::time_t end_t;
    if (!end_time.empty()) {
        end_t = parse_iso_time(end_time);
        if (end_t == 0) return "?";
    } else {
        end_t = std::time(nullptr);
    }

    int seconds = static_cast<int>(std::difftime(end_t, start_t));
    if (seconds < 0) seconds = 0;
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    std::time_t t = parse_iso_time(iso_time);
    if (t == 0) return "?";

    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%b %d %H:%M", &tm_buf);
    return std::string(buf);
}
