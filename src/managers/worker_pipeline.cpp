#include "worker.hpp"
#include "files.hpp"
#include "job_log.hpp"
#include <chart/chart_filter.hpp>
#include <chart/rank.hpp>
#include <chart/row_merger.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <pdf/page_image.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

using json = nlohmann::json;

static json missing_groups_json(const std::vector<MissingChartGroup>& groups) {
    json arr = json::array();
    for (const auto& g : groups) {
        arr.push_back({
            {"chartTitle", g.chart_title},
            {"chartSection", g.chart_section},
            {"expectedMaxRank", g.expected_max_rank},
            {"minRank", g.min_rank},
            {"maxRank", g.max_rank},
            {"expectedRowCount", g.expected_row_count},
            {"actualRowCount", g.actual_row_count},
            {"missingRanks", g.missing_ranks},
        });
    }
    return arr;
}

// ── Job thread ──────────────────────────────────────────────

void Worker::run_job(Job job, std::string model, std::shared_ptr<CancelToken> token) {
    JobContext ctx{std::move(job), std::move(model), *token};
    ctx.audit["jobId"] = ctx.job.id;
    ctx.audit["filename"] = ctx.job.filename;
    ctx.audit["attempts"] = json::array();

    log_job_event(ctx.job.id, fmt::format("processing {}", ctx.job.filename));

    try {
        execute(ctx);
    } catch (const CancelledError& e) {
        std::string reason = ctx.token.reason();
        handle_cancelled(ctx, reason.empty() ? e.what() : reason);
    } catch (const std::exception& e) {
        // A stop that raced a failure still counts as a cancellation.
        if (token_fired(ctx)) {
            handle_cancelled(ctx, ctx.token.reason());
        } else {
            handle_failure(ctx, e.what());
        }
    }

    const std::string job_id = ctx.job.id;
    release_slot(job_id);

    try {
        promote_pending(job_id);
        tick();
    } catch (const std::exception& e) {
        chartreader_log(fmt::format("worker: post-job poll for {} failed: {}", job_id, e.what()));
    }

    retire_self();
}

// ── Pipeline ────────────────────────────────────────────────

void Worker::execute(JobContext& ctx) {
    ctx.token.throw_if_cancelled();
    set_progress(ctx, "validating_file");
    fs::path path = locate_file(ctx);

    std::string mime_type = mime_type_for(ctx.job.filename);
    if (mime_type.empty()) {
        std::string ext = path.extension().string();
        throw ValidationError(fmt::format("Unsupported file type: {}", ext.empty() ? "unknown" : ext));
    }

    std::string image;
    std::string image_mime;
    if (is_pdf_file(ctx.job.filename)) {
        if (!ctx.job.pdf_page_confirmed || !ctx.job.pdf_selected_page) {
            scan_pdf_for_review(ctx, path);
            return;
        }

        ctx.token.throw_if_cancelled();
        set_progress(ctx, "rendering_page");
        int page = *ctx.job.pdf_selected_page;
        auto doc = open_pdf_(path);
        auto rendered = render_page_for_model(*doc, page, config_.pdf());
        ctx.audit["page"] = {
            {"number", page},
            {"width", rendered.width},
            {"height", rendered.height},
        };
        image = std::move(rendered.bytes);
        image_mime = rendered.mime_type;
    } else {
        image = read_file_bytes(path);
        image_mime = mime_type;
    }

    // Full extraction; any failure here ends the job.
    ctx.token.throw_if_cancelled();
    set_progress(ctx, "extracting");
    auto full = extract_attempt(ctx, image, image_mime, ctx.model, ExtractionMode::Full, {});
    std::vector<ExtractedRow> rows = std::move(full.rows);
    if (rows.empty()) {
        throw ExtractionError("No rows extracted");
    }

    if (config_.worker().target_chart_filter) {
        auto filtered = filter_target_charts(rows);
        ctx.audit["chartFilter"] = {
            {"mode", chart_filter_mode_name(filtered.mode)},
            {"rowsBefore", rows.size()},
            {"rowsKept", filtered.rows.size()},
            {"matchedSections", filtered.matched_sections},
            {"matchedGroups", filtered.matched_group_keys},
        };
        if (filtered.rows.empty()) {
            throw ExtractionError(fmt::format(
                "No disco/dance chart found among {} extracted rows", rows.size()));
        }
        rows = std::move(filtered.rows);
    }

    // Targeted retries for missing ranks: primary model first, then the
    // fallback model once if gaps remain.
    ctx.token.throw_if_cancelled();
    set_progress(ctx, "checking_completeness");
    auto missing = checker_.find_missing_groups(rows, ctx.job.filename);
    std::string attributed_model = ctx.model;

    std::vector<std::string> retry_models;
    if (!missing.empty()) {
        retry_models.push_back(ctx.model);
        const std::string& fallback = config_.worker().fallback_model;
        if (!fallback.empty() && fallback != ctx.model) retry_models.push_back(fallback);
    }

    for (const auto& retry_model : retry_models) {
        if (missing.empty()) break;

        ctx.token.throw_if_cancelled();
        set_progress(ctx, retry_model == ctx.model ? "retrying_missing_rows"
                                                   : "escalating_missing_rows");
        log_job_event(ctx.job.id, fmt::format("{} group(s) incomplete, asking {} for missing rows",
                                              missing.size(), retry_model));
        try {
            auto resp = extract_attempt(ctx, image, image_mime, retry_model,
                                        ExtractionMode::MissingRows, missing);
            auto merged = merge_missing_rows(rows, resp.rows, missing);
            rows = std::move(merged.merged);
            missing = checker_.find_missing_groups(rows, ctx.job.filename);

            auto& attempt = ctx.audit["attempts"].back();
            attempt["rowsAdded"] = merged.rows_added;
            attempt["remainingMissingGroups"] = missing.size();

            log_job_event(ctx.job.id, fmt::format("{} added {} row(s), {} group(s) still incomplete",
                                                  retry_model, merged.rows_added, missing.size()));
            if (merged.rows_added > 0 && retry_model != ctx.model) {
                attributed_model = retry_model;
            }
        } catch (const ExtractionError& e) {
            // Already in the audit trail; a failed retry only leaves the gaps.
            log_job_event(ctx.job.id, fmt::format("missing-rows attempt with {} failed: {}",
                                                  retry_model, e.what()));
        }
    }
    ctx.audit["missingGroups"] = missing_groups_json(missing);

    persist_and_finish(ctx, path, std::move(rows), attributed_model, missing);
}

fs::path Worker::locate_file(JobContext& ctx) {
    const auto& layout = config_.layout();
    fs::path in_new = layout.new_dir() / ctx.job.filename;
    fs::path in_completed = layout.completed_dir() / ctx.job.filename;

    fs::path path;
    FileLocation location;
    std::error_code ec;
    if (fs::is_regular_file(in_new, ec)) {
        path = in_new;
        location = FileLocation::New;
    } else if (fs::is_regular_file(in_completed, ec)) {
        path = in_completed;
        location = FileLocation::Completed;
    } else {
        store_.update_job(ctx.job.id, [](Job& j) {
            j.file_location = FileLocation::Missing;
            return true;
        });
        throw ValidationError(fmt::format("File not found in new/completed: {}", ctx.job.filename));
    }

    auto entry_date = ctx.job.entry_date ? ctx.job.entry_date : parse_entry_date(ctx.job.filename);
    if (!entry_date) {
        throw ValidationError("Date not found in filename (expected YYYY-MM-DD)");
    }

    auto updated = store_.update_job(ctx.job.id, [&](Job& j) {
        j.file_location = location;
        if (!j.entry_date) j.entry_date = entry_date;
        return true;
    });
    if (updated) ctx.job = *updated;
    return path;
}

bool Worker::scan_pdf_for_review(JobContext& ctx, const fs::path& path) {
    set_progress(ctx, "scanning_pdf");
    auto doc = open_pdf_(path);
    auto scan = selector_.select_candidates(*doc, &ctx.token);
    if (scan.candidates.empty()) {
        throw ValidationError("No candidate pages found in PDF");
    }
    ctx.token.throw_if_cancelled();

    std::string candidates = json(scan.candidates).dump();
    bool suspended = false;
    auto updated = store_.update_job(ctx.job.id, [&](Job& j) {
        if (j.status != JobStatus::Processing) return false;
        j.status = JobStatus::AwaitingReview;
        j.progress_step = "awaiting_review";
        j.pdf_page_count = scan.page_count;
        j.pdf_candidate_pages = candidates;
        j.pdf_selected_page = scan.candidates.front();
        j.pdf_page_confirmed = false;
        j.finished_at = now_iso();
        suspended = true;
        return true;
    });
    if (!suspended) {
        // Status moved under us; the probe will say why.
        ctx.token.throw_if_cancelled();
        return false;
    }

    ctx.job = *updated;
    log_job_event(ctx.job.id, fmt::format("awaiting page review: {} page(s), candidates [{}]",
                                          scan.page_count, fmt::join(scan.candidates, ", ")));
    notify_job(ctx.job);
    return true;
}

ExtractionResponse Worker::extract_attempt(JobContext& ctx, const std::string& image,
                                           const std::string& mime_type, const std::string& model,
                                           ExtractionMode mode,
                                           const std::vector<MissingChartGroup>& groups) {
    ExtractionRequest request;
    request.image = image;
    request.mime_type = mime_type;
    request.model = model;
    request.mode = mode;
    request.missing_groups = groups;
    request.token = &ctx.token;

    json attempt = {
        {"model", model},
        {"mode", extraction_mode_name(mode)},
        {"startedAt", now_iso()},
    };
    if (mode == ExtractionMode::MissingRows) {
        attempt["requestedGroups"] = missing_groups_json(groups);
    }

    try {
        auto response = client_.extract(request);
        attempt["rowsReturned"] = response.rows.size();
        auto raw = json::parse(response.raw_json, nullptr, false);
        attempt["response"] = raw.is_discarded() ? json(response.raw_json) : raw;
        ctx.audit["attempts"].push_back(attempt);
        log_job_event(ctx.job.id, fmt::format("{} extraction with {} returned {} row(s)",
                                              extraction_mode_name(mode), model,
                                              response.rows.size()));
        return response;
    } catch (const ExtractionError& e) {
        attempt["error"] = e.what();
        ctx.audit["attempts"].push_back(attempt);
        throw;
    }
}

void Worker::persist_and_finish(JobContext& ctx, const fs::path& path,
                                std::vector<ExtractedRow> rows, const std::string& model,
                                const std::vector<MissingChartGroup>& missing) {
    ctx.token.throw_if_cancelled();
    set_progress(ctx, "writing_rows");

    std::string run_id = generate_id();
    std::string extracted_at = now_iso();
    std::string entry_date = ctx.job.entry_date.value_or("");

    std::vector<ChartRow> chart_rows;
    chart_rows.reserve(rows.size());
    for (const auto& r : rows) {
        ChartRow row;
        row.run_id = run_id;
        row.job_id = ctx.job.id;
        row.entry_date = entry_date;
        row.chart_title = r.chart_title;
        row.chart_section = r.chart_section;
        row.this_week_rank = coerce_rank(r.this_week_rank);
        row.last_week_rank = coerce_rank(r.last_week_rank);
        row.two_weeks_ago_rank = coerce_rank(r.two_weeks_ago_rank);
        row.weeks_on_chart = coerce_rank(r.weeks_on_chart);
        row.title = r.title;
        row.artist = r.artist;
        row.label = r.label;
        row.source_file = ctx.job.filename;
        row.extracted_at = extracted_at;
        chart_rows.push_back(std::move(row));
    }

    Run run;
    run.run_id = run_id;
    run.job_id = ctx.job.id;
    run.model = model;
    run.extracted_at = extracted_at;
    run.rows_inserted = static_cast<int>(chart_rows.size());
    run.status = missing.empty() ? RunStatus::Completed : RunStatus::Error;
    run.error = missing.empty() ? "" : summarize_missing_groups(missing);
    ctx.audit["model"] = model;
    ctx.audit["rowsInserted"] = run.rows_inserted;
    run.raw_result_json = ctx.audit.dump(2, ' ', false, json::error_handler_t::replace);

    ctx.previous_last_run_id = ctx.job.last_run_id;
    ctx.previous_rows_appended = ctx.job.rows_appended_last_run;
    store_.persist_run_with_rows(run, chart_rows, true);
    ctx.persisted_run_id = run_id;
    log_job_event(ctx.job.id, fmt::format("run {} stored: {} row(s), model {}",
                                          run_id, run.rows_inserted, model));

    // Gaps left after every retry: rows stay active, the job reports the gaps.
    if (!missing.empty()) {
        ctx.token.throw_if_cancelled();
        auto updated = store_.update_job(ctx.job.id, [&](Job& j) {
            if (j.status != JobStatus::Processing) return false;
            j.status = JobStatus::Error;
            j.progress_step = "error";
            j.error = run.error;
            j.finished_at = now_iso();
            return true;
        });
        if (!updated || updated->status != JobStatus::Error) {
            ctx.token.throw_if_cancelled();
        }
        log_job_event(ctx.job.id, run.error);
        if (updated) notify_job(*updated);
        enqueue_export();
        return;
    }

    if (ctx.job.file_location == FileLocation::New) {
        ctx.token.throw_if_cancelled();
        set_progress(ctx, "moving_file");

        const fs::path completed_dir = config_.layout().completed_dir();
        std::string final_name = make_unique_filename(ctx.job.filename, [&](const std::string& name) {
            std::error_code ec;
            return fs::exists(completed_dir / name, ec) || store_.filename_in_use(name, ctx.job.id);
        });

        try {
            platform::move_file(path, completed_dir / final_name);
        } catch (const fs::filesystem_error& e) {
            throw StoreError(fmt::format("Failed to move {} to completed/: {}",
                                         ctx.job.filename, e.what()));
        }

        if (final_name != ctx.job.filename) {
            store_.update_rows_source_file(run_id, final_name);
            log_job_event(ctx.job.id, fmt::format("stored as {}", final_name));
        }
        auto moved = store_.update_job(ctx.job.id, [&](Job& j) {
            j.filename = final_name;
            j.file_location = FileLocation::Completed;
            return true;
        });
        if (moved) ctx.job = *moved;
    }

    ctx.token.throw_if_cancelled();
    set_progress(ctx, "exporting_csv");

    bool completed = false;
    auto updated = store_.update_job(ctx.job.id, [&](Job& j) {
        if (j.status != JobStatus::Processing) return false;
        j.status = JobStatus::Completed;
        j.progress_step.clear();
        j.error.clear();
        j.finished_at = now_iso();
        completed = true;
        return true;
    });
    if (!completed) {
        ctx.token.throw_if_cancelled();
        throw StoreError("Job left processing state before completion");
    }

    ctx.job = *updated;
    log_job_event(ctx.job.id, fmt::format("completed: {} row(s)", run.rows_inserted));
    notify_job(ctx.job);
    enqueue_export();
}

void Worker::set_progress(JobContext& ctx, const std::string& step) {
    bool changed = false;
    auto updated = store_.update_job(ctx.job.id, [&](Job& j) {
        if (j.status != JobStatus::Processing) return false;
        j.progress_step = step;
        changed = true;
        return true;
    });
    if (!changed) return;

    ctx.job = *updated;
    append_job_log(ctx.job.id, "step: " + step);
    notify_job(ctx.job);
}

void Worker::promote_pending(const std::string& job_id) {
    bool promoted = false;
    auto updated = store_.update_job(job_id, [&](Job& j) {
        if (!j.pending_filename) return false;
        if (j.status == JobStatus::Processing || j.status == JobStatus::Deleted) return false;
        j.filename = *j.pending_filename;
        j.pending_filename.reset();
        j.status = JobStatus::Queued;
        j.progress_step.clear();
        j.error.clear();
        j.started_at.clear();
        j.finished_at.clear();
        j.file_location = FileLocation::New;
        j.pdf_selected_page.reset();
        j.pdf_page_confirmed = false;
        j.pdf_page_count.reset();
        j.pdf_candidate_pages.clear();
        promoted = true;
        return true;
    });
    if (!promoted) return;

    log_job_event(job_id, fmt::format("queued replacement upload {}", updated->filename));
    notify_job(*updated);
}
