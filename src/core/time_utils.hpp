#pragma once

#include <string>

// Format the duration between two ISO UTC timestamps (see now_iso()).
// If end_time is empty, uses current time (for "still running" durations).
// Returns "2h35m", "14m22s", "8s", "-" if start is empty, "?" on parse failure.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Format an ISO UTC timestamp as local "Mon DD HH:MM" for job listings.
// Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);
