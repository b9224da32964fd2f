#include "rank.hpp"
#include <util/string_utils.hpp>
#include <climits>
#include <regex>
#include <vector>

// UTF-8 encodings of the decorations printed around chart cells.
static const std::vector<std::string> EDGE_DECORATIONS = {
    "*",
    "\xe2\x98\x85",  // ★
    "\xe2\x98\x86",  // ☆
    "\xe2\x80\xa2",  // •
    "\xe2\x97\x8f",  // ●
    "\xe2\x97\x8b",  // ○
    "\xe2\x97\x86",  // ◆
    "\xe2\x99\xa6",  // ♦
    "\xe2\x97\xa6",  // ◦
    "\xe2\x96\xaa",  // ▪
    " ",
};

static const std::vector<std::string> TRAILING_DASHES = {
    "-",
    "\xe2\x80\x90",  // hyphen
    "\xe2\x80\x91",  // non-breaking hyphen
    "\xe2\x80\x92",  // figure dash
    "\xe2\x80\x93",  // en dash
    "\xe2\x80\x94",  // em dash
    "\xe2\x88\x92",  // minus sign
};

static bool strip_prefix_any(std::string& text, const std::vector<std::string>& tokens) {
    for (const auto& t : tokens) {
        if (text.compare(0, t.size(), t) == 0) {
            text.erase(0, t.size());
            return true;
        }
    }
    return false;
}

static bool strip_suffix_any(std::string& text, const std::vector<std::string>& tokens) {
    for (const auto& t : tokens) {
        if (text.size() >= t.size() &&
            text.compare(text.size() - t.size(), t.size(), t) == 0) {
            text.erase(text.size() - t.size());
            return true;
        }
    }
    return false;
}

std::string normalize_extracted_text(const std::string& value) {
    std::string text = StringUtils::collapse_whitespace(value);
    if (text.empty()) return text;

    while (strip_prefix_any(text, EDGE_DECORATIONS)) {}
    while (strip_suffix_any(text, EDGE_DECORATIONS)) {}
    text = StringUtils::trim(text);

    while (strip_suffix_any(text, TRAILING_DASHES)) {}
    return StringUtils::trim(text);
}

static std::string digits_only(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c >= '0' && c <= '9') out += c;
    }
    return out;
}

std::optional<std::string> normalize_rank_text(const std::optional<std::string>& value) {
    if (!value) return std::nullopt;
    std::string text = normalize_extracted_text(*value);
    if (text.empty()) return std::nullopt;
    if (StringUtils::to_lower(text) == "new") return std::nullopt;

    std::string digits = digits_only(text);
    if (digits.empty()) return std::nullopt;
    return digits;
}

std::optional<int> coerce_rank(const std::string& value) {
    std::string digits = digits_only(value);
    if (digits.empty()) return std::nullopt;
    // Long digit runs are OCR noise, not ranks.
    if (digits.size() > 9) return std::nullopt;
    return std::stoi(digits);
}

std::optional<int> coerce_rank(const std::optional<std::string>& value) {
    if (!value) return std::nullopt;
    return coerce_rank(*value);
}

std::optional<int> coerce_rank(const char* value) {
    if (!value) return std::nullopt;
    return coerce_rank(std::string(value));
}

std::optional<std::string> parse_entry_date(const std::string& filename) {
    static const std::regex ENTRY_DATE_RE(R"((\d{4}-\d{2}-\d{2}))");
    std::smatch m;
    if (std::regex_search(filename, m, ENTRY_DATE_RE)) {
        return m[1].str();
    }
    return std::nullopt;
}
