#include "completeness.hpp"
#include "rank.hpp"
#include <core/constants.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <set>

static std::vector<std::regex> compile_patterns(const std::vector<std::string>& sources) {
    std::vector<std::regex> out;
    out.reserve(sources.size());
    for (const auto& s : sources) {
        out.emplace_back(s, std::regex::ECMAScript | std::regex::icase);
    }
    return out;
}

CompletenessChecker::CompletenessChecker(const CompletenessRules& rules)
    : min_expected_(rules.min_expected_rank),
      max_expected_(rules.max_expected_rank),
      title_patterns_(compile_patterns(rules.title_patterns)),
      filename_patterns_(compile_patterns(rules.filename_patterns)) {}

std::optional<int> CompletenessChecker::clamp_expected(long value) const {
    if (value < min_expected_ || value > max_expected_) return std::nullopt;
    return static_cast<int>(value);
}

// The first pattern that matches decides, even when its number is out of range.
std::optional<int> CompletenessChecker::first_pattern_match(
        const std::vector<std::regex>& patterns, const std::string& text) const {
    std::string trimmed = StringUtils::trim(text);
    if (trimmed.empty()) return std::nullopt;

    for (const auto& re : patterns) {
        std::smatch m;
        if (std::regex_search(trimmed, m, re) && m.size() > 1) {
            auto n = coerce_rank(m[1].str());
            if (!n) return std::nullopt;
            return clamp_expected(*n);
        }
    }
    return std::nullopt;
}

std::optional<int> CompletenessChecker::expected_max_from_title(const std::string& chart_title) const {
    return first_pattern_match(title_patterns_, chart_title);
}

std::optional<int> CompletenessChecker::expected_max_from_filename(const std::string& filename) const {
    return first_pattern_match(filename_patterns_, filename);
}

std::vector<MissingChartGroup> CompletenessChecker::find_missing_groups(
        const std::vector<ExtractedRow>& rows,
        const std::string& source_filename_hint) const {
    struct Group {
        std::string title;
        std::string section;
        std::vector<int> ranks;
        int row_count = 0;
    };

    std::map<std::string, size_t> index;
    std::vector<Group> groups;

    for (const auto& row : rows) {
        auto key = chart_group_key(row);
        auto it = index.find(key);
        if (it == index.end()) {
            it = index.emplace(key, groups.size()).first;
            groups.push_back(Group{row.chart_title, row.chart_section, {}, 0});
        }
        Group& g = groups[it->second];
        g.row_count++;
        if (auto r = coerce_rank(row.this_week_rank)) {
            g.ranks.push_back(*r);
        }
    }

    std::optional<int> from_filename;
    if (!source_filename_hint.empty()) {
        from_filename = expected_max_from_filename(source_filename_hint);
    }

    std::vector<MissingChartGroup> missing;
    for (const auto& g : groups) {
        if (g.ranks.empty()) continue;

        int min_rank = *std::min_element(g.ranks.begin(), g.ranks.end());
        int max_rank = *std::max_element(g.ranks.begin(), g.ranks.end());

        std::optional<int> expected = expected_max_from_title(g.title);
        if (!expected) expected = from_filename;
        if (!expected) expected = clamp_expected(max_rank);
        if (!expected) continue;

        int final_max = std::max(*expected, max_rank);
        if (final_max < min_rank) continue;

        int expected_count = final_max - min_rank + 1;
        if (g.row_count >= expected_count) continue;

        std::set<int> present(g.ranks.begin(), g.ranks.end());
        MissingChartGroup m;
        m.chart_title = g.title;
        m.chart_section = g.section;
        m.expected_max_rank = final_max;
        m.min_rank = min_rank;
        m.max_rank = max_rank;
        m.expected_row_count = expected_count;
        m.actual_row_count = g.row_count;
        for (int r = min_rank; r <= final_max; ++r) {
            if (!present.count(r)) m.missing_ranks.push_back(r);
        }
        missing.push_back(std::move(m));
    }

    return missing;
}

std::string format_rank_ranges(std::vector<int> ranks, int max_ranges) {
    if (max_ranges < 1) max_ranges = 1;
    std::sort(ranks.begin(), ranks.end());
    ranks.erase(std::unique(ranks.begin(), ranks.end()), ranks.end());
    if (ranks.empty()) return "";

    std::vector<std::pair<int, int>> ranges;
    for (int r : ranks) {
        if (ranges.empty() || r > ranges.back().second + 1) {
            ranges.emplace_back(r, r);
        } else {
            ranges.back().second = r;
        }
    }

    std::string text;
    size_t shown = std::min(ranges.size(), static_cast<size_t>(max_ranges));
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) text += ", ";
        const auto& [start, end] = ranges[i];
        text += (start == end) ? std::to_string(start) : fmt::format("{}-{}", start, end);
    }
    if (ranges.size() > shown) text += ", \xe2\x80\xa6";
    return text;
}

std::string summarize_missing_groups(const std::vector<MissingChartGroup>& groups) {
    std::string text = "Incomplete extraction: ";
    for (size_t i = 0; i < groups.size(); ++i) {
        const auto& g = groups[i];
        if (i > 0) text += "; ";
        std::string label = g.chart_title.empty() ? "(unknown chart)" : g.chart_title;
        if (!g.chart_section.empty()) label += " [" + g.chart_section + "]";
        text += fmt::format("{} {}/{} rows, missing {}", label, g.actual_row_count,
                            g.expected_row_count,
                            format_rank_ranges(g.missing_ranks, SUMMARY_MAX_RANK_RANGES));
    }
    return text;
}
