#include <gtest/gtest.h>
#include <managers/files.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

TEST(Files, SupportedTypes) {
    EXPECT_TRUE(is_supported_file("a.JPG"));
    EXPECT_TRUE(is_supported_file("a.jpeg"));
    EXPECT_TRUE(is_supported_file("a.png"));
    EXPECT_TRUE(is_supported_file("a.webp"));
    EXPECT_TRUE(is_supported_file("a.Pdf"));
    EXPECT_FALSE(is_supported_file("a.tiff"));
    EXPECT_FALSE(is_supported_file("pdf"));
    EXPECT_EQ(mime_type_for("x.jpg"), "image/jpeg");
    EXPECT_EQ(mime_type_for("x.pdf"), "application/pdf");
    EXPECT_EQ(mime_type_for("x.gif"), "");
    EXPECT_TRUE(is_pdf_file("scan.PDF"));
    EXPECT_FALSE(is_pdf_file("scan.png"));
}

TEST(Files, SanitizeKeepsSafeCharacters) {
    EXPECT_EQ(sanitize_filename("1979-03-10_disco.pdf"), "1979-03-10_disco.pdf");
    EXPECT_EQ(sanitize_filename("Billboard 1979 (p. 42).png"), "Billboard_1979_p._42_.png");
    EXPECT_EQ(sanitize_filename("/tmp/uploads/../x y.jpg"), "x_y.jpg");
    EXPECT_EQ(sanitize_filename(""), "upload");
    EXPECT_EQ(sanitize_filename("   "), "upload");
}

TEST(Files, UniqueFilenameAppendsCounter) {
    std::set<std::string> taken = {"chart.png", "chart_1.png"};
    auto is_taken = [&](const std::string& n) { return taken.count(n) > 0; };
    EXPECT_EQ(make_unique_filename("free.png", is_taken), "free.png");
    EXPECT_EQ(make_unique_filename("chart.png", is_taken), "chart_2.png");
    EXPECT_EQ(make_unique_filename("chart copy.png", is_taken), "chart_copy.png");
}

TEST(Files, UniqueFilenameWithoutExtension) {
    auto is_taken = [](const std::string& n) { return n == "notes"; };
    EXPECT_EQ(make_unique_filename("notes", is_taken), "notes_1");
}

TEST(Files, UniqueFilenameExhausted) {
    auto always = [](const std::string&) { return true; };
    EXPECT_THROW(make_unique_filename("x.png", always), StoreError);
}

TEST(Files, ListSupportedSorted) {
    fs::path dir = fs::temp_directory_path() / ("chartreader_files_test_" + generate_id(8));
    fs::create_directories(dir / "sub.png");
    std::ofstream(dir / "b.png") << "x";
    std::ofstream(dir / "a.pdf") << "x";
    std::ofstream(dir / "notes.txt") << "x";

    EXPECT_EQ(list_supported_files(dir), (std::vector<std::string>{"a.pdf", "b.png"}));
    EXPECT_TRUE(list_supported_files(dir / "missing").empty());
    fs::remove_all(dir);
}
