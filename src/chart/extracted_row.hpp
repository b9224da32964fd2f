#pragma once

#include <optional>
#include <string>
#include <vector>

// One chart entry as returned by the extraction call, after boundary
// normalization. Rank fields hold digits-only text or nothing.
struct ExtractedRow {
    std::string chart_title;
    std::string chart_section;
    std::optional<std::string> this_week_rank;
    std::optional<std::string> last_week_rank;
    std::optional<std::string> two_weeks_ago_rank;
    std::optional<std::string> weeks_on_chart;
    std::string title;
    std::string artist;
    std::string label;
};

// Grouping key for (section, title). Sections and titles never contain
// the separator after normalization.
inline std::string chart_group_key(const std::string& section, const std::string& title) {
    return section + "|||" + title;
}

inline std::string chart_group_key(const ExtractedRow& row) {
    return chart_group_key(row.chart_section, row.chart_title);
}
