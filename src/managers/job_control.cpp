#include "job_control.hpp"
#include "files.hpp"
#include "job_log.hpp"
#include "worker.hpp"
#include <chart/rank.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static void reset_for_requeue(Job& j) {
    j.status = JobStatus::Queued;
    j.progress_step.clear();
    j.error.clear();
    j.started_at.clear();
    j.finished_at.clear();
}

static void reset_page_selection(Job& j) {
    j.pdf_selected_page.reset();
    j.pdf_page_confirmed = false;
    j.pdf_page_count.reset();
    j.pdf_candidate_pages.clear();
}

JobControl::JobControl(JobStore& store, FilesLayout layout, Worker* worker)
    : store_(store), layout_(std::move(layout)), worker_(worker) {}

void JobControl::schedule() {
    if (!worker_) return;
    try {
        worker_->tick();
    } catch (const std::exception& e) {
        chartreader_log(fmt::format("control: scheduling pass failed: {}", e.what()));
    }
}

bool JobControl::stored_name_taken(const std::string& name) {
    std::error_code ec;
    if (fs::exists(layout_.new_dir() / name, ec)) return true;
    if (fs::exists(layout_.completed_dir() / name, ec)) return true;
    return store_.filename_in_use(name);
}

// ── Intake ──────────────────────────────────────────────────

Result<Job> JobControl::register_upload(const std::string& stored_filename,
                                        const std::string& original_name) {
    try {
        if (!is_supported_file(stored_filename)) {
            return Result<Job>::Err("Unsupported file type: " + stored_filename);
        }

        std::string canonical = sanitize_filename(original_name);
        auto existing = store_.find_live_by_canonical(canonical);

        if (existing) {
            bool busy = false;
            auto updated = store_.update_job(existing->id, [&](Job& j) {
                j.version_count += 1;
                if (j.status == JobStatus::Processing) {
                    j.pending_filename = stored_filename;
                    busy = true;
                    return true;
                }
                j.filename = stored_filename;
                j.file_location = FileLocation::New;
                j.pending_filename.reset();
                reset_page_selection(j);
                reset_for_requeue(j);
                return true;
            });
            if (!updated) return Result<Job>::Err("Job disappeared: " + existing->id);

            log_job_event(updated->id, busy
                ? fmt::format("new version {} held until the current run ends", stored_filename)
                : fmt::format("new version {} queued", stored_filename));
            if (!busy) schedule();
            return Result<Job>::Ok(*updated);
        }

        Job job;
        job.id = generate_id();
        job.filename = stored_filename;
        job.canonical_filename = canonical;
        job.entry_date = parse_entry_date(stored_filename);
        if (!job.entry_date) job.entry_date = parse_entry_date(canonical);
        job.created_at = now_iso();
        job.file_location = FileLocation::New;
        if (job.entry_date) {
            job.status = JobStatus::Queued;
        } else {
            job.status = JobStatus::Error;
            job.progress_step = "error";
            job.error = "Date not found in filename (expected YYYY-MM-DD)";
            job.finished_at = job.created_at;
        }

        store_.insert_job(job);
        log_job_event(job.id, fmt::format("registered {} ({})", stored_filename, to_string(job.status)));
        if (job.status == JobStatus::Queued) schedule();
        return Result<Job>::Ok(job);
    } catch (const std::exception& e) {
        return Result<Job>::Err(e.what());
    }
}

Result<Job> JobControl::import_file(const fs::path& source) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return Result<Job>::Err("Not a file: " + source.string());
    }
    std::string original = source.filename().string();
    if (!is_supported_file(original)) {
        return Result<Job>::Err("Unsupported file type: " + original);
    }

    std::string stored;
    try {
        stored = make_unique_filename(original, [this](const std::string& n) {
            return stored_name_taken(n);
        });
        fs::create_directories(layout_.new_dir());
        fs::copy_file(source, layout_.new_dir() / stored);
    } catch (const std::exception& e) {
        return Result<Job>::Err(fmt::format("Cannot copy {} into new/: {}", original, e.what()));
    }
    return register_upload(stored, original);
}

Result<std::vector<Job>> JobControl::scan_new_dir() {
    std::vector<Job> registered;
    try {
        for (const auto& name : list_supported_files(layout_.new_dir())) {
            if (store_.filename_in_use(name)) continue;
            auto r = register_upload(name, name);
            if (r.is_err()) {
                chartreader_log(fmt::format("control: scan skipped {}: {}", name, r.error));
                continue;
            }
            registered.push_back(r.value);
        }
    } catch (const std::exception& e) {
        return Result<std::vector<Job>>::Err(e.what());
    }
    return Result<std::vector<Job>>::Ok(registered);
}

// ── Job actions ─────────────────────────────────────────────

Result<Job> JobControl::rerun(const std::string& job_id) {
    try {
        std::string refusal;
        auto updated = store_.update_job(job_id, [&](Job& j) {
            if (j.status == JobStatus::Processing) {
                refusal = "Job is processing";
                return false;
            }
            if (j.status == JobStatus::Deleted) {
                refusal = "Job is deleted";
                return false;
            }
            reset_for_requeue(j);
            return true;
        });
        if (!updated) return Result<Job>::Err("Job not found: " + job_id);
        if (!refusal.empty()) return Result<Job>::Err(refusal);

        log_job_event(job_id, "rerun requested");
        schedule();
        return Result<Job>::Ok(*updated);
    } catch (const std::exception& e) {
        return Result<Job>::Err(e.what());
    }
}

Result<Job> JobControl::stop(const std::string& job_id) {
    try {
        std::string refusal;
        auto updated = store_.update_job(job_id, [&](Job& j) {
            if (!is_stoppable(j.status)) {
                refusal = fmt::format("Job is {}", to_string(j.status));
                return false;
            }
            j.status = JobStatus::Cancelled;
            j.progress_step = "cancelled";
            j.error = CANCELLED_BY_USER;
            j.finished_at = now_iso();
            return true;
        });
        if (!updated) return Result<Job>::Err("Job not found: " + job_id);
        if (!refusal.empty()) return Result<Job>::Err(refusal);

        log_job_event(job_id, "stop requested");
        if (worker_) worker_->request_cancel(job_id, CANCELLED_BY_USER);
        return Result<Job>::Ok(*updated);
    } catch (const std::exception& e) {
        return Result<Job>::Err(e.what());
    }
}

Result<Job> JobControl::delete_job(const std::string& job_id) {
    try {
        auto job = store_.get_job(job_id);
        if (!job) return Result<Job>::Err("Job not found: " + job_id);
        if (job->status == JobStatus::Processing) return Result<Job>::Err("Job is processing");

        // Files are removed best-effort; rows stay in the store.
        std::vector<fs::path> files = {
            layout_.new_dir() / job->filename,
            layout_.completed_dir() / job->filename,
        };
        if (job->pending_filename) files.push_back(layout_.new_dir() / *job->pending_filename);
        for (const auto& f : files) {
            std::error_code ec;
            fs::remove(f, ec);
            if (ec) chartreader_log(fmt::format("control: could not remove {}: {}", f.string(), ec.message()));
        }

        std::string refusal;
        auto updated = store_.update_job(job_id, [&](Job& j) {
            if (j.status == JobStatus::Processing) {
                refusal = "Job is processing";
                return false;
            }
            j.status = JobStatus::Deleted;
            j.progress_step.clear();
            j.error.clear();
            j.pending_filename.reset();
            j.finished_at = now_iso();
            j.file_location = FileLocation::Missing;
            return true;
        });
        if (!updated) return Result<Job>::Err("Job not found: " + job_id);
        if (!refusal.empty()) return Result<Job>::Err(refusal);

        log_job_event(job_id, "deleted");
        if (worker_) worker_->enqueue_export();
        return Result<Job>::Ok(*updated);
    } catch (const std::exception& e) {
        return Result<Job>::Err(e.what());
    }
}

Result<Job> JobControl::confirm_page(const std::string& job_id, int page) {
    try {
        std::string refusal;
        auto updated = store_.update_job(job_id, [&](Job& j) {
            if (!is_pdf_file(j.filename)) {
                refusal = "Job is not a PDF";
                return false;
            }
            if (j.status == JobStatus::Processing || j.status == JobStatus::Deleted) {
                refusal = fmt::format("Job is {}", to_string(j.status));
                return false;
            }
            int max_page = j.pdf_page_count.value_or(page);
            if (page < 1 || page > max_page) {
                refusal = fmt::format("Page {} is out of range 1-{}", page, max_page);
                return false;
            }
            j.pdf_selected_page = page;
            j.pdf_page_confirmed = true;
            reset_for_requeue(j);
            return true;
        });
        if (!updated) return Result<Job>::Err("Job not found: " + job_id);
        if (!refusal.empty()) return Result<Job>::Err(refusal);

        log_job_event(job_id, fmt::format("page {} confirmed", page));
        schedule();
        return Result<Job>::Ok(*updated);
    } catch (const std::exception& e) {
        return Result<Job>::Err(e.what());
    }
}

// ── Settings ────────────────────────────────────────────────

Result<WorkerSettings> JobControl::update_settings(const SettingsUpdate& update) {
    if (update.concurrency &&
        (*update.concurrency < MIN_CONCURRENCY || *update.concurrency > MAX_CONCURRENCY)) {
        return Result<WorkerSettings>::Err(fmt::format(
            "concurrency must be between {} and {}", MIN_CONCURRENCY, MAX_CONCURRENCY));
    }
    if (update.model && update.model->empty()) {
        return Result<WorkerSettings>::Err("model must not be empty");
    }

    try {
        auto settings = store_.update_settings([&](WorkerSettings& s) {
            if (update.concurrency) s.concurrency = *update.concurrency;
            if (update.paused) s.paused = *update.paused;
            if (update.model) s.model = *update.model;
        });
        chartreader_log(fmt::format("control: settings concurrency={} paused={} model={}",
                                    settings.concurrency, settings.paused, settings.model));
        schedule();
        return Result<WorkerSettings>::Ok(settings);
    } catch (const std::exception& e) {
        return Result<WorkerSettings>::Err(e.what());
    }
}
