#include "job_state.hpp"
#include <core/errors.hpp>

const char* to_string(JobStatus s) {
    switch (s) {
        case JobStatus::Queued:         return "queued";
        case JobStatus::Processing:     return "processing";
        case JobStatus::AwaitingReview: return "awaiting_review";
        case JobStatus::Completed:      return "completed";
        case JobStatus::Error:          return "error";
        case JobStatus::Cancelled:      return "cancelled";
        case JobStatus::Deleted:        return "deleted";
    }
    return "error";
}

const char* to_string(FileLocation l) {
    switch (l) {
        case FileLocation::New:       return "new";
        case FileLocation::Completed: return "completed";
        case FileLocation::Missing:   return "missing";
    }
    return "missing";
}

const char* to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Completed: return "completed";
        case RunStatus::Error:     return "error";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "error";
}

JobStatus parse_job_status(const std::string& s) {
    if (s == "queued") return JobStatus::Queued;
    if (s == "processing") return JobStatus::Processing;
    if (s == "awaiting_review") return JobStatus::AwaitingReview;
    if (s == "completed") return JobStatus::Completed;
    if (s == "error") return JobStatus::Error;
    if (s == "cancelled") return JobStatus::Cancelled;
    if (s == "deleted") return JobStatus::Deleted;
    throw StoreError("Unknown job status: " + s);
}

FileLocation parse_file_location(const std::string& s) {
    if (s == "new") return FileLocation::New;
    if (s == "completed") return FileLocation::Completed;
    if (s == "missing") return FileLocation::Missing;
    throw StoreError("Unknown file location: " + s);
}

RunStatus parse_run_status(const std::string& s) {
    if (s == "completed") return RunStatus::Completed;
    if (s == "error") return RunStatus::Error;
    if (s == "cancelled") return RunStatus::Cancelled;
    throw StoreError("Unknown run status: " + s);
}

bool is_stoppable(JobStatus s) {
    return s == JobStatus::Queued || s == JobStatus::Processing ||
           s == JobStatus::AwaitingReview;
}
