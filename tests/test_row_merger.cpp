#include <gtest/gtest.h>
#include <chart/row_merger.hpp>

static ExtractedRow row(const std::string& chart, std::optional<std::string> rank,
                        const std::string& title = "Song") {
    ExtractedRow r;
    r.chart_title = chart;
    r.this_week_rank = std::move(rank);
    r.title = title;
    return r;
}

static MissingChartGroup gap(const std::string& chart, std::vector<int> ranks) {
    MissingChartGroup g;
    g.chart_title = chart;
    g.missing_ranks = std::move(ranks);
    return g;
}

static std::vector<std::string> titles(const std::vector<ExtractedRow>& rows) {
    std::vector<std::string> out;
    for (const auto& r : rows) out.push_back(r.title);
    return out;
}

TEST(RowMerger, AcceptsOnlyMissingRanks) {
    std::vector<ExtractedRow> existing = {row("Disco", std::string("1"), "a"), row("Disco", std::string("3"), "c")};
    std::vector<ExtractedRow> incoming = {
        row("Disco", std::string("1"), "dup"),
        row("Disco", std::string("2"), "b"),
        row("Disco", std::string("4"), "unrequested"),
    };
    auto result = merge_missing_rows(existing, incoming, {gap("Disco", {2})});
    EXPECT_EQ(result.rows_added, 1);
    EXPECT_EQ(titles(result.merged), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(RowMerger, NeverDuplicatesWithinIncoming) {
    std::vector<ExtractedRow> existing = {row("Disco", std::string("1"), "a")};
    std::vector<ExtractedRow> incoming = {row("Disco", std::string("2"), "b"), row("Disco", std::string("2*"), "b2")};
    auto result = merge_missing_rows(existing, incoming, {gap("Disco", {2})});
    EXPECT_EQ(result.rows_added, 1);
    EXPECT_EQ(titles(result.merged), (std::vector<std::string>{"a", "b"}));
}

TEST(RowMerger, IgnoresOtherGroupsAndUnrankedRows) {
    std::vector<ExtractedRow> existing = {row("Disco", std::string("1"), "a")};
    std::vector<ExtractedRow> incoming = {row("Soul", std::string("2"), "x"), row("Disco", std::nullopt, "y")};
    auto result = merge_missing_rows(existing, incoming, {gap("Disco", {2})});
    EXPECT_EQ(result.rows_added, 0);
    EXPECT_EQ(result.merged.size(), 1u);
}

TEST(RowMerger, NoGapsNoChanges) {
    std::vector<ExtractedRow> existing = {row("Disco", std::string("1"), "a")};
    auto result = merge_missing_rows(existing, {row("Disco", std::string("2"), "b")}, {});
    EXPECT_EQ(result.rows_added, 0);
    EXPECT_EQ(titles(result.merged), (std::vector<std::string>{"a"}));
}

TEST(RowMerger, SortKeepsGroupOrderAndPutsUnrankedLast) {
    std::vector<ExtractedRow> rows = {
        row("B", std::string("2"), "b2"),
        row("A", std::nullopt, "a-none"),
        row("A", std::string("10"), "a10"),
        row("B", std::string("1"), "b1"),
        row("A", std::string("9"), "a9"),
    };
    sort_rows_by_group_and_rank(rows);
    EXPECT_EQ(titles(rows), (std::vector<std::string>{"b1", "b2", "a9", "a10", "a-none"}));
}
