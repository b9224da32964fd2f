#pragma once

#include "pdf_document.hpp"
#include <filesystem>
#include <optional>

// PdfDocument backed by the poppler-utils command line tools:
// pdfinfo for the page count, pdftotext for the text layer and pdftoppm
// for rendering. Failures throw ValidationError (unreadable document) or
// StoreError (tool missing or temp file trouble).
class PopplerDocument : public PdfDocument {
public:
    explicit PopplerDocument(std::filesystem::path path);

    int page_count() override;
    std::string page_text(int page) override;
    cv::Mat render_page(int page, const RenderRequest& request) override;

    // Verifies pdfinfo, pdftotext and pdftoppm are on PATH.
    static bool tools_available();

private:
    void check_page(int page);

    std::filesystem::path path_;
    std::optional<int> page_count_;
};
