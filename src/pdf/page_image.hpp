#pragma once

#include "pdf_document.hpp"
#include <core/types.hpp>
#include <string>

// Encoded image handed to the extraction call.
struct ModelImage {
    std::string bytes;
    std::string mime_type;
    int width = 0;
    int height = 0;
};

// JPEG-encode a rendered page.
ModelImage encode_jpeg(const cv::Mat& image, int quality);

// Render one PDF page at model resolution and encode it.
ModelImage render_page_for_model(PdfDocument& doc, int page, const PdfConfig& config);
