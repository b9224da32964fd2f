#pragma once

#include "pdf_document.hpp"
#include "raster_scorer.hpp"
#include <core/cancel_token.hpp>
#include <core/types.hpp>
#include <vector>

struct PageCandidateScan {
    int page_count = 0;
    std::vector<int> candidates;  // best first, no duplicates
};

// Ranks the pages of a PDF by how likely they are to hold the target chart
// table. Text scoring decides first; pages without a convincing text layer
// are ranked by the raster strategy.
class PageSelector {
public:
    PageSelector(const RasterPageScorer& raster, const PdfConfig& config);

    // Ordered review queue using the configured scan and candidate limits.
    PageCandidateScan select_candidates(PdfDocument& doc, CancelToken* token = nullptr) const;

    PageCandidateScan select_candidates(PdfDocument& doc, int max_pages_to_scan,
                                        int candidate_limit, CancelToken* token = nullptr) const;

    // Single automatic pick. Throws ValidationError for a zero-page document.
    int select_best_page(PdfDocument& doc, CancelToken* token = nullptr) const;

private:
    struct TextCandidate;

    std::vector<TextCandidate> score_text_pages(PdfDocument& doc, int scan_pages,
                                                CancelToken* token) const;
    double score_raster_page(PdfDocument& doc, int page, CancelToken* token) const;
    int checked_page_count(PdfDocument& doc) const;

    const RasterPageScorer& raster_;
    PdfConfig config_;
};
