#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("chartreader_config_test_" + generate_id(8));
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& body) {
        fs::path p = test_dir / "chartreader.yaml";
        std::ofstream(p) << body;
        return p;
    }
};

TEST_F(ConfigTest, MissingFileIsError) {
    auto r = Config::load_file(test_dir / "nope.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Config not found"), std::string::npos);
}

TEST_F(ConfigTest, EmptyFileGivesDefaults) {
    auto r = Config::load_file(write_config(""));
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.worker().poll_interval_ms, 1000);
    EXPECT_EQ(c.worker().default_model, "gemini-2.5-flash");
    EXPECT_EQ(c.worker().fallback_model, "gemini-2.5-pro");
    EXPECT_TRUE(c.worker().target_chart_filter);
    EXPECT_EQ(c.pdf().candidate_limit, 12);
    EXPECT_EQ(c.completeness().min_expected_rank, 2);
    EXPECT_EQ(c.source_path(), std::optional<fs::path>(test_dir / "chartreader.yaml"));
}

TEST_F(ConfigTest, RelativeFilesDirResolvesAgainstConfigDir) {
    auto r = Config::load_file(write_config("files_dir: \"./data\"\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.layout().root, (fs::absolute(test_dir) / "data").lexically_normal());
    EXPECT_EQ(r.value.layout().new_dir(), r.value.layout().root / "new");
    EXPECT_EQ(r.value.layout().csv_path(), r.value.layout().root / "output.csv");
}

TEST_F(ConfigTest, ValuesAreClamped) {
    auto r = Config::load_file(write_config(
        "worker:\n"
        "  poll_interval_ms: 5\n"
        "  default_concurrency: 99\n"
        "pdf:\n"
        "  candidate_limit: 0\n"
        "  model_jpeg_quality: 400\n"
        "extraction:\n"
        "  endpoint: \"http://localhost:8080/v1//\"\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.worker().poll_interval_ms, 100);
    EXPECT_EQ(r.value.worker().default_concurrency, MAX_CONCURRENCY);
    EXPECT_EQ(r.value.pdf().candidate_limit, 1);
    EXPECT_EQ(r.value.pdf().model_jpeg_quality, 95);
    EXPECT_EQ(r.value.extraction().endpoint, "http://localhost:8080/v1");
}

TEST_F(ConfigTest, CompletenessPatternsAcceptScalarOrList) {
    auto r = Config::load_file(write_config(
        "completeness:\n"
        "  title_patterns: 'CLUB\\s*(\\d+)'\n"
        "  filename_patterns: ['chart(\\d+)', 'c(\\d+)']\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.completeness().title_patterns, std::vector<std::string>({"CLUB\\s*(\\d+)"}));
    EXPECT_EQ(r.value.completeness().filename_patterns.size(), 2u);
}

TEST_F(ConfigTest, PatternWithoutCaptureGroupIsRejected) {
    auto r = Config::load_file(write_config(
        "completeness:\n"
        "  title_patterns: ['TOP \\d+']\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("capture group"), std::string::npos);
}

TEST_F(ConfigTest, InvertedRankBoundsAreRejected) {
    auto r = Config::load_file(write_config(
        "completeness:\n"
        "  min_expected_rank: 50\n"
        "  max_expected_rank: 10\n"));
    EXPECT_TRUE(r.is_err());
}

TEST_F(ConfigTest, MalformedYamlIsError) {
    auto r = Config::load_file(write_config("worker: [unclosed\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse config"), std::string::npos);
}

TEST_F(ConfigTest, DefaultConfigRoundTripsThroughLoader) {
    fs::path p = test_dir / "sub" / "chartreader.yaml";
    ASSERT_TRUE(create_default_config(p).is_ok());
    ASSERT_TRUE(fs::exists(p));

    auto r = Config::load_file(p);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.layout().root, (fs::absolute(test_dir) / "sub" / "files").lexically_normal());
    EXPECT_EQ(r.value.pdf().model_dpi, 300);
}

TEST_F(ConfigTest, DefaultConfigDoesNotOverwrite) {
    fs::path p = write_config("files_dir: \"/srv/charts\"\n");
    ASSERT_TRUE(create_default_config(p).is_ok());
    auto r = Config::load_file(p);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.layout().root, fs::path("/srv/charts"));
}

TEST_F(ConfigTest, ExplicitPathWinsInLoad) {
    auto r = Config::load(write_config("worker:\n  default_model: \"local-model\"\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.worker().default_model, "local-model");
}
