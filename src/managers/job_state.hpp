#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class JobStatus {
    Queued,
    Processing,
    AwaitingReview,   // PDF waiting for a human page pick
    Completed,
    Error,
    Cancelled,
    Deleted,
};

enum class FileLocation { New, Completed, Missing };

enum class RunStatus { Completed, Error, Cancelled };

const char* to_string(JobStatus s);
const char* to_string(FileLocation l);
const char* to_string(RunStatus s);

// Parsers throw StoreError on unknown names.
JobStatus parse_job_status(const std::string& s);
FileLocation parse_file_location(const std::string& s);
RunStatus parse_run_status(const std::string& s);

// Queued, processing and awaiting review can still be stopped.
bool is_stoppable(JobStatus s);

struct Job {
    std::string id;
    std::string filename;                  // current file under new/ or completed/
    std::string canonical_filename;        // stable across re-uploads
    std::optional<std::string> entry_date; // YYYY-MM-DD, fixed once set
    JobStatus status = JobStatus::Queued;
    std::string progress_step;             // free-text substate, "" when idle
    std::string error;
    std::string created_at;
    std::string started_at;
    std::string finished_at;
    int run_count = 0;
    std::optional<std::string> last_run_id;  // active run, exported to CSV
    int rows_appended_last_run = 0;
    FileLocation file_location = FileLocation::New;
    int version_count = 1;
    std::optional<std::string> pending_filename;  // upload received while processing

    // PDF page selection
    std::optional<int> pdf_selected_page;
    bool pdf_page_confirmed = false;
    std::optional<int> pdf_page_count;
    std::string pdf_candidate_pages;       // JSON array of page numbers, best first
};

struct Run {
    std::string run_id;
    std::string job_id;
    std::string model;
    std::string extracted_at;
    int rows_inserted = 0;
    RunStatus status = RunStatus::Completed;
    std::string error;
    std::string raw_result_json;  // audit payload, stored beside the state file
};

struct ChartRow {
    int64_t id = 0;               // store-assigned, increasing; export order
    std::string run_id;
    std::string job_id;
    std::string entry_date;
    std::string chart_title;
    std::string chart_section;
    std::optional<int> this_week_rank;
    std::optional<int> last_week_rank;
    std::optional<int> two_weeks_ago_rank;
    std::optional<int> weeks_on_chart;
    std::string title;
    std::string artist;
    std::string label;
    std::string source_file;
    std::string extracted_at;
};

// Runtime settings, changed while the worker runs.
struct WorkerSettings {
    int concurrency = 2;
    bool paused = false;
    std::string model = "gemini-2.5-flash";
};
