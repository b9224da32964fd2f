#include "page_scorer.hpp"
#include <core/constants.hpp>
#include <util/string_utils.hpp>
#include <algorithm>
#include <regex>
#include <vector>

namespace {

struct WeightedPattern {
    std::regex re;
    double weight;
    int cap;
};

// Paired header: "dance/disco", "disco & dance", "dance music and disco", ...
#define DISCO_DANCE_PAIR \
    R"((?:dance(?:\s*music)?|disco)\s*(?:\/|&|and|\+|-)\s*(?:disco|dance(?:\s*music)?))"

const std::regex::flag_type RE_FLAGS = std::regex::ECMAScript | std::regex::icase;

const std::vector<WeightedPattern>& header_patterns() {
    static const std::vector<WeightedPattern> patterns = {
        {std::regex(R"(\bthis\s*week\b)", RE_FLAGS), 70, 2},
        {std::regex(R"(\blast\s*week\b)", RE_FLAGS), 60, 2},
        {std::regex(R"(\btwo\s*weeks?\s*ago\b)", RE_FLAGS), 45, 2},
        {std::regex(R"(\bweeks?\s*on\s*chart\b)", RE_FLAGS), 85, 2},
        {std::regex(R"(\bwks?\s*on\s*chart\b)", RE_FLAGS), 85, 2},
        {std::regex(R"(\bpeak\s*position\b)", RE_FLAGS), 35, 2},
        {std::regex(R"(\bbillboard\b)", RE_FLAGS), 18, 4},
        {std::regex(R"(\bchart\b)", RE_FLAGS), 12, 6},
        {std::regex(R"(\bartist\b)", RE_FLAGS), 14, 6},
        {std::regex(R"(\btitle\b)", RE_FLAGS), 14, 6},
        {std::regex(R"(\blabel\b)", RE_FLAGS), 14, 6},
        {std::regex(R"(\bhot\s*100\b)", RE_FLAGS), 28, 2},
    };
    return patterns;
}

// Specific titles first; the bare pair is a weaker signal.
const std::vector<WeightedPattern>& boost_patterns() {
    static const std::vector<WeightedPattern> patterns = {
        {std::regex(R"(\bclub\s*play\b)", RE_FLAGS), 5200, 2},
        {std::regex(R"(\bhot\s*)" DISCO_DANCE_PAIR R"(\b)", RE_FLAGS), 5600, 2},
        {std::regex(R"(\b)" DISCO_DANCE_PAIR R"(\s*top\s*\d{2,3}\b)", RE_FLAGS), 5600, 2},
        {std::regex(R"(\bdisco\s*top\s*\d{2,3}\b)", RE_FLAGS), 5600, 2},
        // Number dropped or garbled in the text layer
        {std::regex(R"(\b)" DISCO_DANCE_PAIR R"(\s*top\b(?!\s*\d{2,3}\b))", RE_FLAGS), 4200, 2},
        {std::regex(R"(\bdisco\s*top\b(?!\s*\d{2,3}\b))", RE_FLAGS), 4200, 2},
        {std::regex(R"(\b)" DISCO_DANCE_PAIR R"(\b)", RE_FLAGS), 1800, 3},
        {std::regex(R"(\b12\s*inch\b)", RE_FLAGS), 900, 2},
        {std::regex(R"(\b12\s*in\.\b)", RE_FLAGS), 900, 2},
    };
    return patterns;
}

#undef DISCO_DANCE_PAIR

int count_matches(const std::string& text, const std::regex& re, int limit) {
    int count = 0;
    auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != end; ++it) {
        if (++count >= limit) break;
    }
    return count;
}

int count_rank_tokens(const std::string& text, int limit) {
    static const std::regex RANK_TOKEN_RE(R"(\b\d{1,3}\b)");
    int count = 0;
    auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), RANK_TOKEN_RE); it != end; ++it) {
        int n = std::stoi(it->str());
        if (n >= RANK_TOKEN_MIN && n <= RANK_TOKEN_MAX) {
            if (++count >= limit) break;
        }
    }
    return count;
}

double preference_boost(const std::string& text, double base_score, int rank_count) {
    // Incidental "dance"/"disco" mentions on prose pages must not win.
    if (base_score < BOOST_GATE_BASE_SCORE && rank_count < BOOST_GATE_RANK_COUNT) return 0.0;

    double boost = 0.0;
    for (const auto& p : boost_patterns()) {
        boost += count_matches(text, p.re, p.cap) * p.weight;
    }
    return boost;
}

}  // namespace

PageScore score_page_text(const std::string& raw_text) {
    PageScore score;
    std::string text = StringUtils::to_lower(StringUtils::collapse_whitespace(raw_text));
    score.text_length = text.size();
    if (text.empty()) return score;

    double base = 0.0;
    for (const auto& p : header_patterns()) {
        base += count_matches(text, p.re, p.cap) * p.weight;
    }

    score.rank_count = count_rank_tokens(text, RANK_TOKEN_COUNT_CAP);
    base += score.rank_count * RANK_TOKEN_WEIGHT;
    base += std::min(LENGTH_BONUS_CAP, static_cast<double>(score.text_length) / LENGTH_BONUS_DIVISOR);

    score.base_score = base;
    score.preference_boost = preference_boost(text, base, score.rank_count);
    score.effective_score = base + score.preference_boost;
    return score;
}

bool looks_like_chart_page(const PageScore& score) {
    return score.base_score >= CHART_STRONG_BASE_SCORE ||
           score.rank_count >= CHART_STRONG_RANK_COUNT ||
           (score.base_score >= CHART_MIXED_BASE_SCORE && score.rank_count >= CHART_MIXED_RANK_COUNT);
}
