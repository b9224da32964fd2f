#include "response_parser.hpp"
#include <chart/rank.hpp>
#include <core/errors.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

static std::string strip_code_fence(const std::string& text) {
    std::string t = StringUtils::trim(text);
    if (t.rfind("```", 0) != 0) return t;

    auto first_nl = t.find('\n');
    if (first_nl == std::string::npos) return t;
    auto closing = t.rfind("```");
    if (closing == std::string::npos || closing <= first_nl) return t;
    return StringUtils::trim(t.substr(first_nl + 1, closing - first_nl - 1));
}

static std::string text_field(const json& obj, const char* key, size_t index) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw ExtractionError(fmt::format("rows[{}].{} is not a string", index, key));
    }
    return normalize_extracted_text(it->get<std::string>());
}

static std::optional<std::string> rank_field(const json& obj, const char* key, size_t index) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw ExtractionError(fmt::format("rows[{}].{} must be a string or null", index, key));
    }
    return normalize_rank_text(it->get<std::string>());
}

std::vector<ExtractedRow> parse_extraction_json(const json& doc) {
    if (!doc.is_object()) {
        throw ExtractionError("Extraction response is not a JSON object");
    }
    auto rows_it = doc.find("rows");
    if (rows_it == doc.end() || !rows_it->is_array()) {
        throw ExtractionError("Extraction response has no rows array");
    }

    std::vector<ExtractedRow> rows;
    size_t index = 0;
    for (const auto& item : *rows_it) {
        if (!item.is_object()) {
            throw ExtractionError(fmt::format("rows[{}] is not an object", index));
        }

        ExtractedRow row;
        row.chart_title = text_field(item, "chartTitle", index);
        row.chart_section = text_field(item, "chartSection", index);
        row.this_week_rank = rank_field(item, "thisWeekRank", index);
        row.last_week_rank = rank_field(item, "lastWeekRank", index);
        row.two_weeks_ago_rank = rank_field(item, "twoWeeksAgoRank", index);
        row.weeks_on_chart = rank_field(item, "weeksOnChart", index);
        row.title = text_field(item, "title", index);
        row.artist = text_field(item, "artist", index);
        row.label = text_field(item, "label", index);
        ++index;

        if (row.chart_title.empty() || row.title.empty() ||
            row.artist.empty() || row.label.empty()) {
            continue;
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<ExtractedRow> parse_extraction_response(const std::string& text) {
    json doc;
    try {
        doc = json::parse(strip_code_fence(text));
    } catch (const json::parse_error& e) {
        throw ExtractionError(std::string("Extraction response is not valid JSON: ") + e.what());
    }
    return parse_extraction_json(doc);
}

static json optional_to_json(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

json row_to_json(const ExtractedRow& row) {
    return json{
        {"chartTitle", row.chart_title},
        {"chartSection", row.chart_section},
        {"thisWeekRank", optional_to_json(row.this_week_rank)},
        {"lastWeekRank", optional_to_json(row.last_week_rank)},
        {"twoWeeksAgoRank", optional_to_json(row.two_weeks_ago_rank)},
        {"weeksOnChart", optional_to_json(row.weeks_on_chart)},
        {"title", row.title},
        {"artist", row.artist},
        {"label", row.label},
    };
}

json rows_to_json(const std::vector<ExtractedRow>& rows) {
    json arr = json::array();
    for (const auto& r : rows) arr.push_back(row_to_json(r));
    return arr;
}
