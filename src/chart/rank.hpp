#pragma once

#include <optional>
#include <string>

// Digits-only integer parse: "12*" -> 12, "(7)" -> 7, "NEW" / "-" / "" -> nullopt.
std::optional<int> coerce_rank(const std::optional<std::string>& value);
std::optional<int> coerce_rank(const std::string& value);
std::optional<int> coerce_rank(const char* value);

// Collapse whitespace, strip decorative symbols (* ★ ☆ • ● ○ ◆ ♦ ◦ ▪) from
// both edges and separator dashes from the end.
std::string normalize_extracted_text(const std::string& value);

// Rank cell text to digits only. Blank, dash-only and "NEW" become nullopt.
std::optional<std::string> normalize_rank_text(const std::optional<std::string>& value);

// First YYYY-MM-DD found in a filename.
std::optional<std::string> parse_entry_date(const std::string& filename);
