#pragma once

#include <opencv2/core.hpp>
#include <string>

// Render bounds for one page. The render is downscaled until both the
// longest side and the pixel count fit.
struct RenderRequest {
    int dpi = 50;
    int max_dimension = 900;
    long max_pixels = 1200000;
};

// Page-level access to a PDF. Pages are 1-based.
class PdfDocument {
public:
    virtual ~PdfDocument() = default;

    virtual int page_count() = 0;

    // Text layer of one page; empty for scanned pages without one.
    virtual std::string page_text(int page) = 0;

    // Rasterized page as an 8-bit BGR image.
    virtual cv::Mat render_page(int page, const RenderRequest& request) = 0;
};
