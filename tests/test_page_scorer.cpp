#include <gtest/gtest.h>
#include <chart/page_scorer.hpp>
#include <string>

static std::string numbered_lines(int from, int to) {
    std::string out;
    for (int i = from; i <= to; ++i) {
        out += std::to_string(i) + " " + std::to_string(i + 1) + " Some Title Artist Name\n";
    }
    return out;
}

static std::string chart_page(const std::string& header) {
    return header + "\nTHIS WEEK LAST WEEK WKS ON CHART TITLE ARTIST LABEL\n" + numbered_lines(1, 40);
}

TEST(PageScorer, EmptyTextScoresZero) {
    auto s = score_page_text("   \n\t ");
    EXPECT_EQ(s.text_length, 0u);
    EXPECT_EQ(s.base_score, 0.0);
    EXPECT_EQ(s.effective_score, 0.0);
    EXPECT_FALSE(looks_like_chart_page(s));
}

TEST(PageScorer, ChartHeadersLookLikeChart) {
    auto s = score_page_text(chart_page("BILLBOARD HOT 100"));
    EXPECT_GT(s.base_score, 160.0);
    EXPECT_GE(s.rank_count, 40);
    EXPECT_TRUE(looks_like_chart_page(s));
}

TEST(PageScorer, ProseMentionGetsNoBoost) {
    auto s = score_page_text("Last night the disco and dance crowd packed the club on 5th street.");
    EXPECT_EQ(s.preference_boost, 0.0);
    EXPECT_FALSE(looks_like_chart_page(s));
}

TEST(PageScorer, DiscoHeaderBoostsChartPage) {
    auto plain = score_page_text(chart_page("HOT SOUL SINGLES"));
    auto disco = score_page_text(chart_page("DISCO TOP 80"));
    EXPECT_EQ(plain.preference_boost, 0.0);
    EXPECT_GT(disco.preference_boost, 0.0);
    EXPECT_DOUBLE_EQ(disco.effective_score, disco.base_score + disco.preference_boost);
    EXPECT_GT(disco.effective_score, plain.effective_score);
}

TEST(PageScorer, HotDanceDiscoOutranksHotRockTracks) {
    // 40 lines of two numbers each: 80 rank tokens per page.
    std::string body = "THIS WEEK LAST WEEK WKS ON CHART TITLE ARTIST LABEL\n" + numbered_lines(1, 40);
    auto disco = score_page_text("HOT DANCE/DISCO\n" + body);
    auto rock = score_page_text("HOT ROCK TRACKS\n" + body);
    EXPECT_GE(disco.rank_count, 80);
    EXPECT_EQ(rock.preference_boost, 0.0);
    EXPECT_GT(disco.preference_boost, 0.0);
    EXPECT_GT(disco.effective_score, rock.effective_score);
}

TEST(PageScorer, ClubPlayOutranksBarePair) {
    auto club = score_page_text(chart_page("DANCE/DISCO CLUB PLAY"));
    auto pair = score_page_text(chart_page("DANCE/DISCO"));
    EXPECT_GT(club.preference_boost, pair.preference_boost);
}

TEST(PageScorer, RankTokensOutsideRangeIgnored) {
    auto s = score_page_text("0 201 999 1979");
    EXPECT_EQ(s.rank_count, 0);
}

TEST(PageScorer, Deterministic) {
    std::string text = chart_page("HOT DANCE/DISCO");
    auto a = score_page_text(text);
    auto b = score_page_text(text);
    EXPECT_EQ(a.effective_score, b.effective_score);
    EXPECT_EQ(a.rank_count, b.rank_count);
}
