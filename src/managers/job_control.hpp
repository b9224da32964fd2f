#pragma once

#include "job_store.hpp"
#include <core/directory_structure.hpp>
#include <core/types.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

class Worker;

struct SettingsUpdate {
    std::optional<int> concurrency;
    std::optional<bool> paused;
    std::optional<std::string> model;
};

// Operator actions on jobs. Each one validates against the job's current
// state, applies a single store update and, when a worker runs in this
// process, triggers a scheduling pass. Without a worker the running `serve`
// picks the change up on its next poll.
class JobControl {
public:
    JobControl(JobStore& store, FilesLayout layout, Worker* worker = nullptr);

    // Registers a file already stored in new/. A live job with the same
    // canonical name absorbs it as a new version: idle jobs switch to it and
    // are requeued, a processing job keeps it as its pending replacement.
    Result<Job> register_upload(const std::string& stored_filename,
                                const std::string& original_name);

    // Copies a file into new/ under a collision-free name and registers it.
    Result<Job> import_file(const std::filesystem::path& source);

    // Registers every supported file in new/ that no job references yet.
    Result<std::vector<Job>> scan_new_dir();

    Result<Job> rerun(const std::string& job_id);
    Result<Job> stop(const std::string& job_id);
    Result<Job> delete_job(const std::string& job_id);
    Result<Job> confirm_page(const std::string& job_id, int page);

    Result<WorkerSettings> update_settings(const SettingsUpdate& update);

private:
    bool stored_name_taken(const std::string& name);
    void schedule();

    JobStore& store_;
    FilesLayout layout_;
    Worker* worker_;
};
