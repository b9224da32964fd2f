#pragma once

#include "extracted_row.hpp"
#include <core/types.hpp>
#include <optional>
#include <regex>
#include <string>
#include <vector>

struct MissingChartGroup {
    std::string chart_title;
    std::string chart_section;
    int expected_max_rank = 0;
    int min_rank = 0;              // observed
    int max_rank = 0;              // observed
    int expected_row_count = 0;
    int actual_row_count = 0;
    std::vector<int> missing_ranks;  // this-week ranks, ascending
};

// Detects chart groups whose this-week rank sequence has holes.
class CompletenessChecker {
public:
    explicit CompletenessChecker(const CompletenessRules& rules = CompletenessRules{});

    // Groups by (section, title) in first-seen order. The filename hint is
    // only consulted when a group's title carries no length marker.
    std::vector<MissingChartGroup> find_missing_groups(
        const std::vector<ExtractedRow>& rows,
        const std::string& source_filename_hint = "") const;

    // Expected max rank from the first title pattern that matches, clamped.
    std::optional<int> expected_max_from_title(const std::string& chart_title) const;
    std::optional<int> expected_max_from_filename(const std::string& filename) const;

private:
    std::optional<int> clamp_expected(long value) const;
    std::optional<int> first_pattern_match(const std::vector<std::regex>& patterns,
                                           const std::string& text) const;

    int min_expected_;
    int max_expected_;
    std::vector<std::regex> title_patterns_;
    std::vector<std::regex> filename_patterns_;
};

// "1-3, 7, 9-12" with at most max_ranges ranges, ", …" when truncated.
std::string format_rank_ranges(std::vector<int> ranks, int max_ranges = 20);

// One-line description of outstanding gaps, used as a run error.
std::string summarize_missing_groups(const std::vector<MissingChartGroup>& groups);
