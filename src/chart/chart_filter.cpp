#include "chart_filter.hpp"
#include <util/string_utils.hpp>
#include <map>
#include <regex>
#include <set>

static std::string normalize_for_match(const std::string& value) {
    return StringUtils::to_lower(StringUtils::collapse_whitespace(value));
}

static bool has_disco_or_dance(const std::string& value) {
    static const std::regex RE(R"(\b(?:disco|dance)\b)");
    return std::regex_search(normalize_for_match(value), RE);
}

static bool has_target_chart_title(const std::string& value) {
    static const std::regex RE(R"(\bclub\s*play\b|\b12\s*inch\b|\b12\s*in\.\b)");
    return has_disco_or_dance(value) || std::regex_search(normalize_for_match(value), RE);
}

ChartFilterResult filter_target_charts(const std::vector<ExtractedRow>& rows) {
    struct Group {
        std::string key;
        std::string section;
        bool section_match;
        bool title_match;
    };

    std::vector<Group> groups;
    std::set<std::string> seen_keys;
    for (const auto& row : rows) {
        auto key = chart_group_key(row);
        if (!seen_keys.insert(key).second) continue;
        groups.push_back({key, row.chart_section,
                          has_disco_or_dance(row.chart_section),
                          has_target_chart_title(row.chart_title)});
    }

    ChartFilterResult result;

    std::set<std::string> sections;
    for (const auto& g : groups) {
        if (g.section_match && sections.insert(g.section).second) {
            result.matched_sections.push_back(g.section);
        }
    }

    if (!sections.empty()) {
        result.mode = ChartFilterMode::Section;
        for (const auto& g : groups) {
            if (sections.count(g.section)) result.matched_group_keys.push_back(g.key);
        }
        for (const auto& row : rows) {
            if (sections.count(row.chart_section)) result.rows.push_back(row);
        }
        return result;
    }

    std::set<std::string> keys;
    for (const auto& g : groups) {
        if (g.title_match) {
            keys.insert(g.key);
            result.matched_group_keys.push_back(g.key);
        }
    }

    if (!keys.empty()) {
        result.mode = ChartFilterMode::Title;
        for (const auto& row : rows) {
            if (keys.count(chart_group_key(row))) result.rows.push_back(row);
        }
        return result;
    }

    result.mode = ChartFilterMode::None;
    return result;
}

const char* chart_filter_mode_name(ChartFilterMode mode) {
    switch (mode) {
        case ChartFilterMode::Section: return "section";
        case ChartFilterMode::Title:   return "title";
        case ChartFilterMode::None:    return "none";
    }
    return "none";
}
