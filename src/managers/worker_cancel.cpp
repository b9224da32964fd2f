#include "worker.hpp"
#include "job_log.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

// Run row for an attempt that never got as far as persisting rows.
static Run terminal_run(const std::string& job_id, const std::string& model,
                        RunStatus status, const std::string& error, json audit) {
    Run run;
    run.run_id = generate_id();
    run.job_id = job_id;
    run.model = model;
    run.extracted_at = now_iso();
    run.rows_inserted = 0;
    run.status = status;
    run.error = error;
    audit["error"] = error;
    audit["status"] = to_string(status);
    run.raw_result_json = audit.dump(2, ' ', false, json::error_handler_t::replace);
    return run;
}

// ── Cancellation ────────────────────────────────────────────

CancelToken::Probe Worker::persisted_status_probe(JobStore& store, const std::string& job_id) {
    return [&store, job_id]() -> std::optional<std::string> {
        try {
            auto job = store.get_job(job_id);
            if (!job) return std::string("Job no longer exists");
            if (job->status == JobStatus::Cancelled) {
                return job->error.empty() ? std::string(CANCELLED_BY_USER) : job->error;
            }
            if (job->status == JobStatus::Deleted) return std::string("Job deleted");
        } catch (const StoreError& e) {
            chartreader_log(fmt::format("worker: status probe for {} failed: {}", job_id, e.what()));
        }
        return std::nullopt;
    };
}

bool Worker::token_fired(JobContext& ctx) {
    try {
        return ctx.token.poll();
    } catch (const std::exception& e) {
        chartreader_log(fmt::format("worker: cancel check for {} failed: {}", ctx.job.id, e.what()));
        return ctx.token.cancelled();
    }
}

void Worker::handle_cancelled(JobContext& ctx, const std::string& reason) {
    const std::string& id = ctx.job.id;
    bool shutdown = reason == CANCELLED_BY_SHUTDOWN;
    log_job_event(id, "cancelled: " + reason);

    try {
        if (ctx.persisted_run_id) {
            // Rows were written; the run stays on record but stops being the
            // active one.
            store_.update_run_status(*ctx.persisted_run_id, RunStatus::Cancelled, reason);
            store_.update_job(id, [&](Job& j) {
                if (j.last_run_id != ctx.persisted_run_id) return false;
                j.last_run_id = ctx.previous_last_run_id;
                j.rows_appended_last_run = ctx.previous_rows_appended;
                return true;
            });
            enqueue_export();
        } else {
            store_.insert_run(terminal_run(id, ctx.model, RunStatus::Cancelled, reason, ctx.audit));
        }

        auto updated = store_.update_job(id, [&](Job& j) {
            if (j.status == JobStatus::Deleted) return false;
            if (shutdown) {
                if (j.status != JobStatus::Processing) return false;
                j.status = JobStatus::Queued;
                j.progress_step.clear();
                return true;
            }
            j.status = JobStatus::Cancelled;
            j.progress_step = "cancelled";
            j.error = reason;
            j.finished_at = now_iso();
            return true;
        });
        if (updated) notify_job(*updated);
    } catch (const std::exception& e) {
        chartreader_log(fmt::format("worker: recording cancellation of {} failed: {}", id, e.what()));
    }
}

// ── Failure ─────────────────────────────────────────────────

void Worker::handle_failure(JobContext& ctx, const std::string& message) {
    const std::string& id = ctx.job.id;
    log_job_event(id, "failed: " + message);

    try {
        if (ctx.persisted_run_id) {
            store_.update_run_status(*ctx.persisted_run_id, RunStatus::Error, message);
        } else {
            store_.insert_run(terminal_run(id, ctx.model, RunStatus::Error, message, ctx.audit));
        }

        auto updated = store_.update_job(id, [&](Job& j) {
            if (j.status != JobStatus::Processing) return false;
            j.status = JobStatus::Error;
            j.progress_step = "error";
            j.error = message;
            j.finished_at = now_iso();
            return true;
        });
        if (updated) notify_job(*updated);
    } catch (const std::exception& e) {
        chartreader_log(fmt::format("worker: recording failure of {} failed: {}", id, e.what()));
    }
}

// ── Observers ───────────────────────────────────────────────

void Worker::notify_job(const Job& job) {
    if (!events_.on_job) return;
    try {
        events_.on_job(job);
    } catch (const std::exception& e) {
        chartreader_log(fmt::format("worker: job observer threw: {}", e.what()));
    }
}
