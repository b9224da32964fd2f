#pragma once

#include <chart/completeness.hpp>
#include <string>
#include <vector>

std::string extraction_system_prompt();

std::string full_extraction_prompt();

// Lists each group as "N) title [section]: extracted a/b; missing thisWeekRank <ranges>".
std::string missing_rows_prompt(const std::vector<MissingChartGroup>& missing);
