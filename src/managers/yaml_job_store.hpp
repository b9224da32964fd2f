#pragma once

#include "job_store.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

// JobStore backed by YAML files under the state directory:
//   state.yaml          settings, jobs and runs
//   rows/<run_id>.yaml  chart rows of one run
//   runs/<run_id>.json  raw audit payload of one run
//   state.lock          flock held for the length of each transaction
//
// The cached state is reloaded whenever state.yaml changed on disk, so a
// second process (the CLI while `serve` runs) sees and makes consistent
// updates. Writes go through temp-file-then-rename.
class YamlJobStore : public JobStore {
public:
    YamlJobStore(const fs::path& state_dir, const WorkerSettings& defaults);

    std::vector<Job> claim_queued(int limit) override;
    int count_processing() override;
    std::optional<Job> get_job(const std::string& id) override;
    std::vector<Job> list_jobs() override;
    std::optional<Job> update_job(const std::string& id,
                                  const std::function<bool(Job&)>& mutate) override;
    void insert_job(const Job& job) override;
    std::optional<Job> find_live_by_canonical(const std::string& canonical) override;
    bool filename_in_use(const std::string& filename,
                         const std::string& except_job_id = "") override;
    int requeue_processing() override;

    void insert_run(const Run& run) override;
    void insert_rows(std::vector<ChartRow>& rows) override;
    void persist_run_with_rows(const Run& run, std::vector<ChartRow>& rows,
                               bool activate) override;
    void update_run_status(const std::string& run_id, RunStatus status,
                           const std::string& error) override;
    std::optional<Run> get_run(const std::string& run_id) override;
    std::vector<Run> runs_for_job(const std::string& job_id) override;
    std::string run_payload(const std::string& run_id) override;
    std::vector<ChartRow> rows_for_run(const std::string& run_id) override;
    void update_rows_source_file(const std::string& run_id,
                                 const std::string& source_file) override;

    WorkerSettings settings() override;
    WorkerSettings update_settings(const std::function<void(WorkerSettings&)>& mutate) override;

    const fs::path& state_path() const { return state_path_; }

private:
    // Identity of state.yaml on disk. Every commit renames a fresh file into
    // place, so any change moves at least one of these.
    struct FileStamp {
        unsigned long long inode = 0;
        long long size = -1;
        long long mtime_ns = 0;
        bool operator==(const FileStamp& o) const {
            return inode == o.inode && size == o.size && mtime_ns == o.mtime_ns;
        }
    };

    struct StoreState {
        int64_t next_row_id = 1;
        WorkerSettings settings;
        std::vector<Job> jobs;
        std::vector<Run> runs;
    };

    // Runs fn against the current state under both locks.
    template <typename Fn>
    auto read(Fn&& fn);

    // Runs fn against a copy of the state under both locks and commits the
    // copy if fn returns true. Nothing changes when fn throws or the write fails.
    template <typename Fn>
    void write(Fn&& fn);

    void reload_if_changed();
    std::optional<FileStamp> stat_state_file() const;
    StoreState load_state() const;
    void save_state(const StoreState& state);

    fs::path rows_path(const std::string& run_id) const;
    fs::path payload_path(const std::string& run_id) const;
    std::vector<ChartRow> load_rows(const std::string& run_id) const;
    void save_rows(const std::string& run_id, const std::vector<ChartRow>& rows) const;

    static Job* find_job(StoreState& state, const std::string& id);
    static Run* find_run(StoreState& state, const std::string& run_id);

    fs::path state_dir_;
    fs::path state_path_;
    fs::path lock_path_;
    WorkerSettings defaults_;

    std::mutex mutex_;
    StoreState state_;
    FileStamp loaded_stamp_;
    bool loaded_ = false;
};
