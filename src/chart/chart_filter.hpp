#pragma once

#include "extracted_row.hpp"
#include <string>
#include <vector>

enum class ChartFilterMode { Section, Title, None };

struct ChartFilterResult {
    ChartFilterMode mode = ChartFilterMode::None;
    std::vector<ExtractedRow> rows;
    std::vector<std::string> matched_sections;
    std::vector<std::string> matched_group_keys;
};

// Keeps only rows belonging to the disco/dance chart family. A section
// header mentioning disco or dance selects every chart under it; failing
// that, individual chart titles (disco, dance, club play, 12 inch) are
// matched; otherwise nothing is kept.
ChartFilterResult filter_target_charts(const std::vector<ExtractedRow>& rows);

const char* chart_filter_mode_name(ChartFilterMode mode);
