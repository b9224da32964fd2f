#include "../base_cli.hpp"
#include "../theme.hpp"
#include "job_helpers.hpp"
#include <managers/files.hpp>
#include <pdf/page_selector.hpp>
#include <pdf/poppler_document.hpp>
#include <pdf/raster_scorer.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <fmt/format.h>

using json = nlohmann::json;

static fs::path job_file_path(BaseCLI& cli, const Job& job) {
    const auto& layout = cli.config->layout();
    return job.file_location == FileLocation::Completed
        ? layout.completed_dir() / job.filename
        : layout.new_dir() / job.filename;
}

// Stored candidates come from the worker's review scan; --rescan recomputes
// them here without touching the job.
static void do_candidates(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        cli.fail("Usage: candidates <job-id> [--rescan]");
        return;
    }
    if (!cli.require_store()) return;
    std::string id = resolve_job_id(cli, args[0]);
    if (id.empty()) return;
    bool rescan = args.size() > 1 && args[1] == "--rescan";

    auto job = cli.store->get_job(id);
    if (!job) return;
    if (!is_pdf_file(job->filename)) {
        cli.fail("Job is not a PDF: " + job->filename);
        return;
    }

    std::vector<int> pages;
    int page_count = job->pdf_page_count.value_or(0);

    if (!rescan && !job->pdf_candidate_pages.empty()) {
        try {
            pages = json::parse(job->pdf_candidate_pages).get<std::vector<int>>();
        } catch (const json::exception& e) {
            cli.fail(fmt::format("Stored candidates are unreadable: {}", e.what()));
            return;
        }
    } else {
        if (!PopplerDocument::tools_available()) {
            cli.fail("pdfinfo, pdftotext and pdftoppm are required (poppler-utils)");
            return;
        }
        std::cout << theme::step("Scanning " + job->filename + "...");
        PopplerDocument doc(job_file_path(cli, *job));
        DensityRasterScorer raster(cli.config->raster());
        PageSelector selector(raster, cli.config->pdf());
        auto scan = selector.select_candidates(doc);
        pages = scan.candidates;
        page_count = scan.page_count;
    }

    std::cout << theme::section(job->filename);
    std::cout << theme::kv("Pages", page_count > 0 ? std::to_string(page_count) : "?");
    if (job->pdf_selected_page) {
        std::cout << theme::kv("Selected", fmt::format("{}{}", *job->pdf_selected_page,
                                                       job->pdf_page_confirmed ? " (confirmed)" : ""));
    }
    std::string list;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (i) list += ", ";
        list += std::to_string(pages[i]);
    }
    std::cout << theme::kv("Candidates", list.empty() ? "-" : list);
    std::cout << "\n";
    if (job->status == JobStatus::AwaitingReview) {
        std::cout << theme::step(fmt::format("chartreader pick-page {} <page>", job->id.substr(0, 8)));
    }
}

static void do_pick_page(BaseCLI& cli, const std::vector<std::string>& args) {
    const std::string usage = "pick-page <job-id> <page>";
    if (args.size() < 2) {
        cli.fail("Usage: " + usage);
        return;
    }
    int page = 0;
    if (!parse_int_arg(cli, args[1], page, usage)) return;
    if (!cli.require_store()) return;
    std::string id = resolve_job_id(cli, args[0]);
    if (id.empty()) return;

    auto result = cli.control->confirm_page(id, page);
    if (result.is_err()) {
        cli.fail(result.error);
        return;
    }
    std::cout << theme::ok(fmt::format("Page {} confirmed, queued: {}", page, job_line(result.value)));
}

void register_pdf_commands(BaseCLI& cli) {
    cli.add_command("candidates", do_candidates, "Show candidate chart pages of a PDF job");
    cli.add_command("pick-page", do_pick_page, "Confirm the page to extract and requeue");
}
