#pragma once

#include <chart/extracted_row.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Parses model output text into normalized rows.
//
// Accepted shape: {"rows": [ {chartTitle, chartSection?, thisWeekRank?,
// lastWeekRank?, twoWeeksAgoRank?, weeksOnChart?, title, artist, label} ]}.
// Text fields must be strings; rank fields strings or null. A Markdown code
// fence around the JSON is tolerated. Any other shape throws ExtractionError.
// Rows whose chartTitle, title, artist or label is empty after
// normalization are dropped.
std::vector<ExtractedRow> parse_extraction_response(const std::string& text);

// Same, starting from an already-parsed document.
std::vector<ExtractedRow> parse_extraction_json(const nlohmann::json& doc);

// Row serialization used for audit payloads (camelCase keys, nulls kept).
nlohmann::json row_to_json(const ExtractedRow& row);
nlohmann::json rows_to_json(const std::vector<ExtractedRow>& rows);
