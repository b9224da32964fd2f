#include <gtest/gtest.h>
#include <chart/rank.hpp>

TEST(CoerceRank, StripsNonDigits) {
    EXPECT_EQ(coerce_rank("12*"), 12);
    EXPECT_EQ(coerce_rank("(7)"), 7);
    EXPECT_EQ(coerce_rank("007"), 7);
}

TEST(CoerceRank, NoDigitsIsNull) {
    EXPECT_EQ(coerce_rank("NEW"), std::nullopt);
    EXPECT_EQ(coerce_rank("-"), std::nullopt);
    EXPECT_EQ(coerce_rank(""), std::nullopt);
    EXPECT_EQ(coerce_rank(std::optional<std::string>{}), std::nullopt);
}

TEST(CoerceRank, LongDigitRunIsNull) {
    EXPECT_EQ(coerce_rank("12345678901"), std::nullopt);
}

TEST(NormalizeText, CollapsesWhitespace) {
    EXPECT_EQ(normalize_extracted_text("  Love \t  To\nLove  You "), "Love To Love You");
}

TEST(NormalizeText, StripsEdgeDecorations) {
    EXPECT_EQ(normalize_extracted_text("\xe2\x98\x85 I Will Survive \xe2\x98\x85"), "I Will Survive");
    EXPECT_EQ(normalize_extracted_text("**Casablanca*"), "Casablanca");
    EXPECT_EQ(normalize_extracted_text("\xe2\x80\xa2 Salsoul"), "Salsoul");
}

TEST(NormalizeText, StripsTrailingSeparatorDashes) {
    EXPECT_EQ(normalize_extracted_text("Gloria Gaynor -"), "Gloria Gaynor");
    EXPECT_EQ(normalize_extracted_text("Polydor \xe2\x80\x94 "), "Polydor");
}

TEST(NormalizeText, KeepsInnerDashes) {
    EXPECT_EQ(normalize_extracted_text("Jo-Jo Gunne"), "Jo-Jo Gunne");
    EXPECT_EQ(normalize_extracted_text("-Intro"), "-Intro");
}

TEST(NormalizeRankText, DigitsOnly) {
    EXPECT_EQ(normalize_rank_text(std::string(" 12* ")), std::optional<std::string>("12"));
    EXPECT_EQ(normalize_rank_text(std::string("(3)")), std::optional<std::string>("3"));
}

TEST(NormalizeRankText, BlankDashAndNewAreNull) {
    EXPECT_EQ(normalize_rank_text(std::string("")), std::nullopt);
    EXPECT_EQ(normalize_rank_text(std::string("--")), std::nullopt);
    EXPECT_EQ(normalize_rank_text(std::string("NEW")), std::nullopt);
    EXPECT_EQ(normalize_rank_text(std::string("new")), std::nullopt);
    EXPECT_EQ(normalize_rank_text(std::nullopt), std::nullopt);
}

TEST(EntryDate, FoundAnywhereInName) {
    EXPECT_EQ(parse_entry_date("1979-03-10_disco_top_80.pdf"), std::optional<std::string>("1979-03-10"));
    EXPECT_EQ(parse_entry_date("billboard 1978-11-25 p42.jpg"), std::optional<std::string>("1978-11-25"));
}

TEST(EntryDate, MissingIsNull) {
    EXPECT_EQ(parse_entry_date("scan_0042.png"), std::nullopt);
    EXPECT_EQ(parse_entry_date("1979-3-10.png"), std::nullopt);
}
