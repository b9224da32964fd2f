#pragma once

#include <string>

struct PageScore {
    double base_score = 0.0;       // header keywords + rank tokens + length bonus
    double preference_boost = 0.0; // disco/dance header boost, zero unless gated in
    double effective_score = 0.0;  // base_score + preference_boost
    int rank_count = 0;            // 1..200 number tokens, capped
    size_t text_length = 0;        // length after whitespace normalization
};

// Scores page text for chart-table likelihood. Pure and deterministic.
PageScore score_page_text(const std::string& raw_text);

// Decision policy for "this page carries a chart table".
bool looks_like_chart_page(const PageScore& score);
