#include "poppler_document.hpp"
#include <core/errors.hpp>
#include <managers/job_log.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <regex>

namespace fs = std::filesystem;

static constexpr double PDF_POINTS_PER_INCH = 72.0;

PopplerDocument::PopplerDocument(fs::path path) : path_(std::move(path)) {}

bool PopplerDocument::tools_available() {
    return platform::command_exists("pdfinfo") &&
           platform::command_exists("pdftotext") &&
           platform::command_exists("pdftoppm");
}

int PopplerDocument::page_count() {
    if (page_count_) return *page_count_;

    auto r = platform::run_capture("pdfinfo", {path_.string()});
    if (r.failed()) {
        throw ValidationError(fmt::format("Cannot read PDF {}: {}",
                                          path_.filename().string(), r.stderr_data));
    }

    static const std::regex PAGES_RE(R"((?:^|\n)Pages:\s+(\d+))");
    std::smatch m;
    if (!std::regex_search(r.stdout_data, m, PAGES_RE)) {
        throw ValidationError("PDF page count not reported for " + path_.filename().string());
    }
    page_count_ = std::stoi(m[1].str());
    return *page_count_;
}

void PopplerDocument::check_page(int page) {
    if (page < 1 || page > page_count()) {
        throw ValidationError(fmt::format("Page {} out of range (1-{})", page, page_count()));
    }
}

std::string PopplerDocument::page_text(int page) {
    check_page(page);
    auto n = std::to_string(page);
    auto r = platform::run_capture("pdftotext",
        {"-f", n, "-l", n, "-layout", "-nopgbrk", "-q", path_.string(), "-"});
    if (r.failed()) {
        // A page whose text layer cannot be read scores as textless
        chartreader_log(fmt::format("pdftotext failed on {} page {}: exit={}",
                                    path_.filename().string(), page, r.exit_code));
        return "";
    }
    return r.stdout_data;
}

// Page size in points from `pdfinfo -f n -l n`, if reported.
static bool page_size_points(const fs::path& path, int page, double& w, double& h) {
    auto n = std::to_string(page);
    auto r = platform::run_capture("pdfinfo", {"-f", n, "-l", n, path.string()});
    if (r.failed()) return false;

    static const std::regex SIZE_RE(R"(size:\s+([\d.]+)\s+x\s+([\d.]+)\s+pts)");
    std::smatch m;
    if (!std::regex_search(r.stdout_data, m, SIZE_RE)) return false;
    w = std::stod(m[1].str());
    h = std::stod(m[2].str());
    return w > 0 && h > 0;
}

cv::Mat PopplerDocument::render_page(int page, const RenderRequest& request) {
    check_page(page);

    double dpi = request.dpi;
    double w_pts = 0, h_pts = 0;
    if (page_size_points(path_, page, w_pts, h_pts)) {
        double w = std::ceil(w_pts * dpi / PDF_POINTS_PER_INCH);
        double h = std::ceil(h_pts * dpi / PDF_POINTS_PER_INCH);
        double scale = std::min({1.0, request.max_dimension / w, request.max_dimension / h,
                                 std::sqrt(static_cast<double>(request.max_pixels) / (w * h))});
        dpi = std::max(1.0, dpi * scale);
    }

    auto prefix = platform::temp_file("chartreader_page");
    auto n = std::to_string(page);
    auto r = platform::run_capture("pdftoppm",
        {"-f", n, "-l", n, "-r", fmt::format("{:.2f}", dpi),
         "-scale-to", std::to_string(request.max_dimension),
         "-png", "-singlefile", path_.string(), prefix.string()});

    fs::path png = prefix;
    png += ".png";
    if (r.failed()) {
        std::error_code ec;
        fs::remove(png, ec);
        throw ValidationError(fmt::format("Cannot render page {} of {}: {}",
                                          page, path_.filename().string(), r.stderr_data));
    }

    cv::Mat img = cv::imread(png.string(), cv::IMREAD_COLOR);
    std::error_code ec;
    fs::remove(png, ec);
    if (img.empty()) {
        throw ValidationError(fmt::format("Rendered page {} could not be decoded", page));
    }

    long pixels = static_cast<long>(img.cols) * img.rows;
    if (pixels > request.max_pixels) {
        double s = std::sqrt(static_cast<double>(request.max_pixels) / pixels);
        cv::resize(img, img, cv::Size(), s, s, cv::INTER_AREA);
    }
    return img;
}
