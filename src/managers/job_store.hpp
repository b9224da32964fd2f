#pragma once

#include "job_state.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Persisted jobs, runs, chart rows and runtime settings.
//
// Every method is one transaction: it either applies completely or throws
// StoreError and leaves the previous state. Implementations must be safe to
// call from several worker threads at once.
class JobStore {
public:
    virtual ~JobStore() = default;

    // ── Jobs ───────────────────────────────────────────────────

    // Atomically flips up to `limit` queued jobs (oldest created first) to
    // processing and returns them.
    virtual std::vector<Job> claim_queued(int limit) = 0;

    virtual int count_processing() = 0;

    virtual std::optional<Job> get_job(const std::string& id) = 0;

    // All jobs in creation order, deleted ones included.
    virtual std::vector<Job> list_jobs() = 0;

    // Applies `mutate` to the stored job. Returning false from `mutate`
    // abandons the change (used for status-conditional updates). Returns the
    // job as stored afterwards, or nullopt when the id is unknown.
    virtual std::optional<Job> update_job(const std::string& id,
                                          const std::function<bool(Job&)>& mutate) = 0;

    // Inserts a new job. The id must be unique.
    virtual void insert_job(const Job& job) = 0;

    // Oldest non-deleted job with this canonical filename.
    virtual std::optional<Job> find_live_by_canonical(const std::string& canonical) = 0;

    // True when a live job other than `except_job_id` uses `filename`.
    virtual bool filename_in_use(const std::string& filename,
                                 const std::string& except_job_id = "") = 0;

    // Startup sweep: processing jobs go back to queued. Returns the count.
    virtual int requeue_processing() = 0;

    // ── Runs and rows ──────────────────────────────────────────

    // Records a run without rows. Increments the job's run_count.
    virtual void insert_run(const Run& run) = 0;

    // Appends rows to an existing run, assigning row ids.
    virtual void insert_rows(std::vector<ChartRow>& rows) = 0;

    // Records a run and its rows together, assigning row ids. With `activate`
    // and at least one row, the job's last_run_id and rows_appended_last_run
    // point at this run.
    virtual void persist_run_with_rows(const Run& run, std::vector<ChartRow>& rows,
                                       bool activate) = 0;

    // Terminal status update; the only change a run ever sees.
    virtual void update_run_status(const std::string& run_id, RunStatus status,
                                   const std::string& error) = 0;

    virtual std::optional<Run> get_run(const std::string& run_id) = 0;

    // Runs of a job, oldest first. raw_result_json is left empty; see run_payload().
    virtual std::vector<Run> runs_for_job(const std::string& job_id) = 0;

    virtual std::string run_payload(const std::string& run_id) = 0;

    virtual std::vector<ChartRow> rows_for_run(const std::string& run_id) = 0;

    virtual void update_rows_source_file(const std::string& run_id,
                                         const std::string& source_file) = 0;

    // ── Settings ───────────────────────────────────────────────

    virtual WorkerSettings settings() = 0;
    virtual WorkerSettings update_settings(const std::function<void(WorkerSettings&)>& mutate) = 0;
};
