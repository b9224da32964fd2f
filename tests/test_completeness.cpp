#include <gtest/gtest.h>
#include <chart/completeness.hpp>

static ExtractedRow row(const std::string& title, const std::string& section,
                        std::optional<std::string> rank) {
    ExtractedRow r;
    r.chart_title = title;
    r.chart_section = section;
    r.this_week_rank = std::move(rank);
    r.title = "Song";
    r.artist = "Artist";
    return r;
}

static std::vector<ExtractedRow> ranks(const std::string& title, const std::vector<int>& rs,
                                       const std::string& section = "") {
    std::vector<ExtractedRow> out;
    for (int r : rs) out.push_back(row(title, section, std::to_string(r)));
    return out;
}

TEST(Completeness, TitleMarkerExtendsExpectedMax) {
    CompletenessChecker checker;
    auto missing = checker.find_missing_groups(ranks("DISCO TOP 10", {1, 2, 3, 4, 5, 6, 7, 8}));
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].expected_max_rank, 10);
    EXPECT_EQ(missing[0].expected_row_count, 10);
    EXPECT_EQ(missing[0].actual_row_count, 8);
    EXPECT_EQ(missing[0].missing_ranks, (std::vector<int>{9, 10}));
}

TEST(Completeness, InteriorHoleWithoutMarker) {
    CompletenessChecker checker;
    auto missing = checker.find_missing_groups(ranks("Disco Action", {1, 2, 4, 5}));
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].expected_max_rank, 5);
    EXPECT_EQ(missing[0].missing_ranks, (std::vector<int>{3}));
}

TEST(Completeness, CompleteGroupNotReported) {
    CompletenessChecker checker;
    EXPECT_TRUE(checker.find_missing_groups(ranks("Disco Action", {1, 2, 3})).empty());
    EXPECT_TRUE(checker.find_missing_groups(ranks("HOT 5", {1, 2, 3, 4, 5})).empty());
}

TEST(Completeness, SequenceStartsAtObservedMin) {
    CompletenessChecker checker;
    auto missing = checker.find_missing_groups(ranks("Disco Action", {41, 42, 44}));
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].min_rank, 41);
    EXPECT_EQ(missing[0].missing_ranks, (std::vector<int>{43}));
}

TEST(Completeness, FilenameHintUsedWithoutTitleMarker) {
    CompletenessChecker checker;
    auto missing = checker.find_missing_groups(ranks("Disco Action", {1, 2, 3, 4, 5, 6, 7, 8}),
                                               "1979-03-10 disco-top-10.jpg");
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].missing_ranks, (std::vector<int>{9, 10}));
}

TEST(Completeness, TitleMarkerBeatsFilenameHint) {
    CompletenessChecker checker;
    auto missing = checker.find_missing_groups(ranks("TOP 10", {1, 2, 3}), "1979-03-10 top 80.jpg");
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].expected_max_rank, 10);
}

TEST(Completeness, GroupsWithoutRanksSkipped) {
    CompletenessChecker checker;
    std::vector<ExtractedRow> rows = {row("TOP 10", "", std::nullopt), row("TOP 10", "", std::string("NEW"))};
    // "NEW" has no digits, so the group has no rank to anchor on.
    EXPECT_TRUE(checker.find_missing_groups(rows).empty());
}

TEST(Completeness, GroupsKeyedBySectionAndTitle) {
    CompletenessChecker checker;
    auto rows = ranks("Weekly Chart", {1, 2, 3}, "Disco");
    auto other = ranks("Weekly Chart", {1, 3}, "Soul");
    rows.insert(rows.end(), other.begin(), other.end());
    auto missing = checker.find_missing_groups(rows);
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].chart_section, "Soul");
    EXPECT_EQ(missing[0].missing_ranks, (std::vector<int>{2}));
}

TEST(Completeness, OutOfRangeMarkerIgnored) {
    CompletenessChecker checker;
    EXPECT_EQ(checker.expected_max_from_title("TOP 500"), std::nullopt);
    EXPECT_EQ(checker.expected_max_from_title("HOT 100"), 100);
    EXPECT_EQ(checker.expected_max_from_title(""), std::nullopt);
    EXPECT_EQ(checker.expected_max_from_filename("disco-top-80.pdf"), 80);
}

TEST(Completeness, CustomRules) {
    CompletenessRules rules;
    rules.title_patterns = {R"(\bBEST\s*(\d+)\b)"};
    CompletenessChecker checker(rules);
    EXPECT_EQ(checker.expected_max_from_title("BEST 30"), 30);
    EXPECT_EQ(checker.expected_max_from_title("TOP 30"), std::nullopt);
}

TEST(RankRanges, CollapsesRuns) {
    EXPECT_EQ(format_rank_ranges({9, 1, 2, 3, 7, 10, 11, 12}), "1-3, 7, 9-12");
    EXPECT_EQ(format_rank_ranges({}), "");
    EXPECT_EQ(format_rank_ranges({5, 5}), "5");
}

TEST(RankRanges, Truncates) {
    EXPECT_EQ(format_rank_ranges({1, 3, 5, 7}, 2), "1, 3, \xe2\x80\xa6");
}

TEST(RankRanges, SummaryNamesGroups) {
    MissingChartGroup g;
    g.chart_title = "DISCO TOP 10";
    g.chart_section = "Disco";
    g.expected_row_count = 10;
    g.actual_row_count = 8;
    g.missing_ranks = {9, 10};
    EXPECT_EQ(summarize_missing_groups({g}),
              "Incomplete extraction: DISCO TOP 10 [Disco] 8/10 rows, missing 9-10");
}
