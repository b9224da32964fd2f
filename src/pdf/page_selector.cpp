#include "page_selector.hpp"
#include <chart/page_scorer.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <managers/job_log.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <set>

struct PageSelector::TextCandidate {
    int page;
    PageScore score;
};

static void checkpoint(CancelToken* token) {
    if (token) token->throw_if_cancelled();
}

PageSelector::PageSelector(const RasterPageScorer& raster, const PdfConfig& config)
    : raster_(raster), config_(config) {}

int PageSelector::checked_page_count(PdfDocument& doc) const {
    int count = doc.page_count();
    if (count < 1) {
        throw ValidationError("PDF has no pages");
    }
    return count;
}

// Chart-like pages only, preferred (boosted) first, then by score, text
// length and page number.
std::vector<PageSelector::TextCandidate> PageSelector::score_text_pages(
        PdfDocument& doc, int scan_pages, CancelToken* token) const {
    std::vector<TextCandidate> out;
    for (int page = 1; page <= scan_pages; ++page) {
        checkpoint(token);
        PageScore s = score_page_text(doc.page_text(page));
        if (looks_like_chart_page(s)) {
            out.push_back({page, s});
        }
    }

    std::sort(out.begin(), out.end(), [](const TextCandidate& a, const TextCandidate& b) {
        bool pa = a.score.preference_boost > 0;
        bool pb = b.score.preference_boost > 0;
        if (pa != pb) return pa;
        if (a.score.effective_score != b.score.effective_score)
            return a.score.effective_score > b.score.effective_score;
        if (a.score.text_length != b.score.text_length)
            return a.score.text_length > b.score.text_length;
        return a.page < b.page;
    });
    return out;
}

double PageSelector::score_raster_page(PdfDocument& doc, int page, CancelToken* token) const {
    checkpoint(token);
    RenderRequest req;
    req.dpi = config_.raster_dpi;
    req.max_dimension = config_.raster_max_dimension;
    req.max_pixels = RASTER_MAX_PIXELS;
    cv::Mat img = doc.render_page(page, req);
    checkpoint(token);
    return raster_.score(img);
}

PageCandidateScan PageSelector::select_candidates(PdfDocument& doc, CancelToken* token) const {
    return select_candidates(doc, config_.max_pages_to_scan, config_.candidate_limit, token);
}

PageCandidateScan PageSelector::select_candidates(PdfDocument& doc, int max_pages_to_scan,
                                                  int candidate_limit, CancelToken* token) const {
    checkpoint(token);
    PageCandidateScan scan;
    scan.page_count = checked_page_count(doc);

    int limit = std::max(1, candidate_limit);
    int scan_pages = std::min(scan.page_count, std::max(1, max_pages_to_scan));

    std::set<int> seen;
    auto push = [&](int page) {
        if (static_cast<int>(scan.candidates.size()) >= limit) return;
        if (seen.insert(page).second) scan.candidates.push_back(page);
    };

    auto text = score_text_pages(doc, scan_pages, token);
    int primary_limit = std::min(limit, config_.primary_text_candidates);
    for (int i = 0; i < static_cast<int>(text.size()) && i < primary_limit; ++i) {
        push(text[i].page);
    }

    if (static_cast<int>(scan.candidates.size()) < limit) {
        std::vector<std::pair<int, double>> raster;
        for (int page = 1; page <= scan_pages; ++page) {
            if (seen.count(page)) continue;
            raster.emplace_back(page, score_raster_page(doc, page, token));
        }
        std::sort(raster.begin(), raster.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });
        for (const auto& [page, score] : raster) {
            push(page);
        }
    }

    chartreader_log(fmt::format("page_selector: {} pages, {} text candidates, picked [{}]",
                                scan.page_count, text.size(),
                                fmt::join(scan.candidates, ",")));
    return scan;
}

int PageSelector::select_best_page(PdfDocument& doc, CancelToken* token) const {
    checkpoint(token);
    int count = checked_page_count(doc);
    int scan_pages = std::min(count, std::max(1, config_.best_page_scan_limit));

    auto text = score_text_pages(doc, scan_pages, token);
    if (!text.empty()) {
        return text.front().page;
    }

    // Scanned documents: no page looks like a chart by text
    int best_page = 1;
    double best_score = 0.0;
    bool have_best = false;
    for (int page = 1; page <= scan_pages; ++page) {
        double s = score_raster_page(doc, page, token);
        if (!have_best || s > best_score) {
            best_score = s;
            best_page = page;
            have_best = true;
        }
    }
    return best_page;
}
