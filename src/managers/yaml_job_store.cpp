#include "yaml_job_store.hpp"
#include "job_log.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <platform/file_lock.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <map>
#include <sys/stat.h>

// ── YAML helpers ──────────────────────────────────────────────

static std::optional<std::string> opt_string(const YAML::Node& n) {
    if (!n || n.IsNull()) return std::nullopt;
    return n.as<std::string>();
}

static std::optional<int> opt_int(const YAML::Node& n) {
    if (!n || n.IsNull()) return std::nullopt;
    return n.as<int>();
}

template <typename T>
static void emit_optional(YAML::Emitter& out, const char* key, const std::optional<T>& v) {
    out << YAML::Key << key << YAML::Value;
    if (v) out << *v;
    else out << YAML::Null;
}

static void emit_job(YAML::Emitter& out, const Job& j) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << j.id;
    out << YAML::Key << "filename" << YAML::Value << j.filename;
    out << YAML::Key << "canonical_filename" << YAML::Value << j.canonical_filename;
    emit_optional(out, "entry_date", j.entry_date);
    out << YAML::Key << "status" << YAML::Value << to_string(j.status);
    out << YAML::Key << "progress_step" << YAML::Value << j.progress_step;
    out << YAML::Key << "error" << YAML::Value << j.error;
    out << YAML::Key << "created_at" << YAML::Value << j.created_at;
    out << YAML::Key << "started_at" << YAML::Value << j.started_at;
    out << YAML::Key << "finished_at" << YAML::Value << j.finished_at;
    out << YAML::Key << "run_count" << YAML::Value << j.run_count;
    emit_optional(out, "last_run_id", j.last_run_id);
    out << YAML::Key << "rows_appended_last_run" << YAML::Value << j.rows_appended_last_run;
    out << YAML::Key << "file_location" << YAML::Value << to_string(j.file_location);
    out << YAML::Key << "version_count" << YAML::Value << j.version_count;
    emit_optional(out, "pending_filename", j.pending_filename);
    emit_optional(out, "pdf_selected_page", j.pdf_selected_page);
    out << YAML::Key << "pdf_page_confirmed" << YAML::Value << j.pdf_page_confirmed;
    emit_optional(out, "pdf_page_count", j.pdf_page_count);
    out << YAML::Key << "pdf_candidate_pages" << YAML::Value << j.pdf_candidate_pages;
    out << YAML::EndMap;
}

static Job parse_job(const YAML::Node& n) {
    Job j;
    j.id = n["id"].as<std::string>("");
    j.filename = n["filename"].as<std::string>("");
    j.canonical_filename = n["canonical_filename"].as<std::string>(j.filename);
    j.entry_date = opt_string(n["entry_date"]);
    j.status = parse_job_status(n["status"].as<std::string>("queued"));
    j.progress_step = n["progress_step"].as<std::string>("");
    j.error = n["error"].as<std::string>("");
    j.created_at = n["created_at"].as<std::string>("");
    j.started_at = n["started_at"].as<std::string>("");
    j.finished_at = n["finished_at"].as<std::string>("");
    j.run_count = n["run_count"].as<int>(0);
    j.last_run_id = opt_string(n["last_run_id"]);
    j.rows_appended_last_run = n["rows_appended_last_run"].as<int>(0);
    j.file_location = parse_file_location(n["file_location"].as<std::string>("new"));
    j.version_count = n["version_count"].as<int>(1);
    j.pending_filename = opt_string(n["pending_filename"]);
    j.pdf_selected_page = opt_int(n["pdf_selected_page"]);
    j.pdf_page_confirmed = n["pdf_page_confirmed"].as<bool>(false);
    j.pdf_page_count = opt_int(n["pdf_page_count"]);
    j.pdf_candidate_pages = n["pdf_candidate_pages"].as<std::string>("");
    return j;
}

static void emit_run(YAML::Emitter& out, const Run& r) {
    out << YAML::BeginMap;
    out << YAML::Key << "run_id" << YAML::Value << r.run_id;
    out << YAML::Key << "job_id" << YAML::Value << r.job_id;
    out << YAML::Key << "model" << YAML::Value << r.model;
    out << YAML::Key << "extracted_at" << YAML::Value << r.extracted_at;
    out << YAML::Key << "rows_inserted" << YAML::Value << r.rows_inserted;
    out << YAML::Key << "status" << YAML::Value << to_string(r.status);
    out << YAML::Key << "error" << YAML::Value << r.error;
    out << YAML::EndMap;
}

static Run parse_run(const YAML::Node& n) {
    Run r;
    r.run_id = n["run_id"].as<std::string>("");
    r.job_id = n["job_id"].as<std::string>("");
    r.model = n["model"].as<std::string>("");
    r.extracted_at = n["extracted_at"].as<std::string>("");
    r.rows_inserted = n["rows_inserted"].as<int>(0);
    r.status = parse_run_status(n["status"].as<std::string>("completed"));
    r.error = n["error"].as<std::string>("");
    return r;
}

static void emit_row(YAML::Emitter& out, const ChartRow& r) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << static_cast<long long>(r.id);
    out << YAML::Key << "job_id" << YAML::Value << r.job_id;
    out << YAML::Key << "entry_date" << YAML::Value << r.entry_date;
    out << YAML::Key << "chart_title" << YAML::Value << r.chart_title;
    out << YAML::Key << "chart_section" << YAML::Value << r.chart_section;
    emit_optional(out, "this_week_rank", r.this_week_rank);
    emit_optional(out, "last_week_rank", r.last_week_rank);
    emit_optional(out, "two_weeks_ago_rank", r.two_weeks_ago_rank);
    emit_optional(out, "weeks_on_chart", r.weeks_on_chart);
    out << YAML::Key << "title" << YAML::Value << r.title;
    out << YAML::Key << "artist" << YAML::Value << r.artist;
    out << YAML::Key << "label" << YAML::Value << r.label;
    out << YAML::Key << "source_file" << YAML::Value << r.source_file;
    out << YAML::Key << "extracted_at" << YAML::Value << r.extracted_at;
    out << YAML::EndMap;
}

static ChartRow parse_row(const YAML::Node& n, const std::string& run_id) {
    ChartRow r;
    r.id = n["id"].as<long long>(0);
    r.run_id = run_id;
    r.job_id = n["job_id"].as<std::string>("");
    r.entry_date = n["entry_date"].as<std::string>("");
    r.chart_title = n["chart_title"].as<std::string>("");
    r.chart_section = n["chart_section"].as<std::string>("");
    r.this_week_rank = opt_int(n["this_week_rank"]);
    r.last_week_rank = opt_int(n["last_week_rank"]);
    r.two_weeks_ago_rank = opt_int(n["two_weeks_ago_rank"]);
    r.weeks_on_chart = opt_int(n["weeks_on_chart"]);
    r.title = n["title"].as<std::string>("");
    r.artist = n["artist"].as<std::string>("");
    r.label = n["label"].as<std::string>("");
    r.source_file = n["source_file"].as<std::string>("");
    r.extracted_at = n["extracted_at"].as<std::string>("");
    return r;
}

static void write_atomic_or_throw(const fs::path& path, const std::string& content) {
    try {
        platform::write_file_atomic(path, content);
    } catch (const std::exception& e) {
        throw StoreError(fmt::format("Failed to write {}: {}", path.string(), e.what()));
    }
}

// ── Transactions ──────────────────────────────────────────────

template <typename Fn>
auto YamlJobStore::read(Fn&& fn) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_path_.string());
    if (!lock.held()) {
        throw StoreError("Could not lock " + lock_path_.string());
    }
    reload_if_changed();
    return fn(static_cast<const StoreState&>(state_));
}

template <typename Fn>
void YamlJobStore::write(Fn&& fn) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_path_.string());
    if (!lock.held()) {
        throw StoreError("Could not lock " + lock_path_.string());
    }
    reload_if_changed();

    StoreState next = state_;
    if (!fn(next)) return;

    save_state(next);
    state_ = std::move(next);
    auto stamp = stat_state_file();
    loaded_stamp_ = stamp ? *stamp : FileStamp{};
}

YamlJobStore::YamlJobStore(const fs::path& state_dir, const WorkerSettings& defaults)
    : state_dir_(state_dir),
      state_path_(state_dir / "state.yaml"),
      lock_path_(state_dir / "state.lock"),
      defaults_(defaults) {
    std::error_code ec;
    fs::create_directories(state_dir_ / "rows", ec);
    fs::create_directories(state_dir_ / "runs", ec);
    if (ec) {
        throw StoreError(fmt::format("Cannot create {}: {}", state_dir_.string(), ec.message()));
    }
}

std::optional<YamlJobStore::FileStamp> YamlJobStore::stat_state_file() const {
    struct stat st;
    if (::stat(state_path_.c_str(), &st) != 0) {
        if (errno == ENOENT) return std::nullopt;
        throw StoreError(fmt::format("Cannot stat {}: {}", state_path_.string(), std::strerror(errno)));
    }
    FileStamp stamp;
    stamp.inode = static_cast<unsigned long long>(st.st_ino);
    stamp.size = static_cast<long long>(st.st_size);
    stamp.mtime_ns = static_cast<long long>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    return stamp;
}

void YamlJobStore::reload_if_changed() {
    auto stamp = stat_state_file();
    if (!stamp) {
        if (!loaded_) {
            state_ = StoreState{};
            state_.settings = defaults_;
            loaded_ = true;
        }
        return;
    }
    if (loaded_ && *stamp == loaded_stamp_) return;

    state_ = load_state();
    loaded_stamp_ = *stamp;
    loaded_ = true;
}

YamlJobStore::StoreState YamlJobStore::load_state() const {
    StoreState state;
    state.settings = defaults_;

    try {
        YAML::Node root = YAML::LoadFile(state_path_.string());

        state.next_row_id = root["next_row_id"].as<long long>(1);

        if (root["settings"] && root["settings"].IsMap()) {
            auto s = root["settings"];
            state.settings.concurrency = s["concurrency"].as<int>(defaults_.concurrency);
            state.settings.paused = s["paused"].as<bool>(defaults_.paused);
            state.settings.model = s["model"].as<std::string>(defaults_.model);
        }

        if (root["jobs"] && root["jobs"].IsSequence()) {
            for (const auto& n : root["jobs"]) {
                state.jobs.push_back(parse_job(n));
            }
        }

        if (root["runs"] && root["runs"].IsSequence()) {
            for (const auto& n : root["runs"]) {
                state.runs.push_back(parse_run(n));
            }
        }
    } catch (const YAML::Exception& e) {
        throw StoreError(fmt::format("Corrupt state file {}: {}", state_path_.string(), e.what()));
    }

    return state;
}

void YamlJobStore::save_state(const StoreState& state) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "next_row_id" << YAML::Value << static_cast<long long>(state.next_row_id);

    // Settings
    out << YAML::Key << "settings" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "concurrency" << YAML::Value << state.settings.concurrency;
    out << YAML::Key << "paused" << YAML::Value << state.settings.paused;
    out << YAML::Key << "model" << YAML::Value << state.settings.model;
    out << YAML::EndMap;

    // Jobs
    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginSeq;
    for (const auto& j : state.jobs) emit_job(out, j);
    out << YAML::EndSeq;

    // Runs
    out << YAML::Key << "runs" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : state.runs) emit_run(out, r);
    out << YAML::EndSeq;

    out << YAML::EndMap;

    write_atomic_or_throw(state_path_, out.c_str());
}

fs::path YamlJobStore::rows_path(const std::string& run_id) const {
    return state_dir_ / "rows" / (run_id + ".yaml");
}

fs::path YamlJobStore::payload_path(const std::string& run_id) const {
    return state_dir_ / "runs" / (run_id + ".json");
}

std::vector<ChartRow> YamlJobStore::load_rows(const std::string& run_id) const {
    std::vector<ChartRow> rows;
    auto path = rows_path(run_id);
    if (!fs::exists(path)) return rows;

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root["rows"] && root["rows"].IsSequence()) {
            for (const auto& n : root["rows"]) {
                rows.push_back(parse_row(n, run_id));
            }
        }
    } catch (const YAML::Exception& e) {
        throw StoreError(fmt::format("Corrupt rows file {}: {}", path.string(), e.what()));
    }
    return rows;
}

void YamlJobStore::save_rows(const std::string& run_id, const std::vector<ChartRow>& rows) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "run_id" << YAML::Value << run_id;
    out << YAML::Key << "rows" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : rows) emit_row(out, r);
    out << YAML::EndSeq;
    out << YAML::EndMap;

    write_atomic_or_throw(rows_path(run_id), out.c_str());
}

Job* YamlJobStore::find_job(StoreState& state, const std::string& id) {
    for (auto& j : state.jobs) {
        if (j.id == id) return &j;
    }
    return nullptr;
}

Run* YamlJobStore::find_run(StoreState& state, const std::string& run_id) {
    for (auto& r : state.runs) {
        if (r.run_id == run_id) return &r;
    }
    return nullptr;
}

// ── Jobs ──────────────────────────────────────────────────────

std::vector<Job> YamlJobStore::claim_queued(int limit) {
    std::vector<Job> claimed;
    if (limit <= 0) return claimed;

    write([&](StoreState& s) {
        std::vector<Job*> queued;
        for (auto& j : s.jobs) {
            if (j.status == JobStatus::Queued) queued.push_back(&j);
        }
        if (queued.empty()) return false;

        std::stable_sort(queued.begin(), queued.end(), [](const Job* a, const Job* b) {
            return a->created_at < b->created_at;
        });
        if (static_cast<int>(queued.size()) > limit) queued.resize(limit);

        std::string now = now_iso();
        for (Job* j : queued) {
            j->status = JobStatus::Processing;
            j->progress_step = "starting";
            j->error.clear();
            j->started_at = now;
            j->finished_at.clear();
            claimed.push_back(*j);
        }
        return true;
    });

    for (const auto& j : claimed) {
        chartreader_log(fmt::format("store: claimed job {} ({})", j.id, j.filename));
    }
    return claimed;
}

int YamlJobStore::count_processing() {
    return read([](const StoreState& s) {
        return static_cast<int>(std::count_if(s.jobs.begin(), s.jobs.end(), [](const Job& j) {
            return j.status == JobStatus::Processing;
        }));
    });
}

std::optional<Job> YamlJobStore::get_job(const std::string& id) {
    return read([&](const StoreState& s) -> std::optional<Job> {
        for (const auto& j : s.jobs) {
            if (j.id == id) return j;
        }
        return std::nullopt;
    });
}

std::vector<Job> YamlJobStore::list_jobs() {
    return read([](const StoreState& s) { return s.jobs; });
}

std::optional<Job> YamlJobStore::update_job(const std::string& id,
                                            const std::function<bool(Job&)>& mutate) {
    std::optional<Job> result;
    write([&](StoreState& s) {
        Job* job = find_job(s, id);
        if (!job) return false;

        Job copy = *job;
        if (!mutate(copy)) {
            result = *job;
            return false;
        }
        copy.id = id;
        *job = copy;
        result = copy;
        return true;
    });
    return result;
}

void YamlJobStore::insert_job(const Job& job) {
    write([&](StoreState& s) {
        if (find_job(s, job.id)) {
            throw StoreError("Duplicate job id: " + job.id);
        }
        s.jobs.push_back(job);
        return true;
    });
}

std::optional<Job> YamlJobStore::find_live_by_canonical(const std::string& canonical) {
    return read([&](const StoreState& s) -> std::optional<Job> {
        const Job* oldest = nullptr;
        for (const auto& j : s.jobs) {
            if (j.status == JobStatus::Deleted || j.canonical_filename != canonical) continue;
            if (!oldest || j.created_at < oldest->created_at) oldest = &j;
        }
        if (oldest) return *oldest;
        return std::nullopt;
    });
}

bool YamlJobStore::filename_in_use(const std::string& filename,
                                   const std::string& except_job_id) {
    return read([&](const StoreState& s) {
        for (const auto& j : s.jobs) {
            if (j.id == except_job_id || j.status == JobStatus::Deleted) continue;
            if (j.filename == filename) return true;
            if (j.pending_filename && *j.pending_filename == filename) return true;
        }
        return false;
    });
}

int YamlJobStore::requeue_processing() {
    int count = 0;
    write([&](StoreState& s) {
        for (auto& j : s.jobs) {
            if (j.status != JobStatus::Processing) continue;
            j.status = JobStatus::Queued;
            j.progress_step.clear();
            ++count;
        }
        return count > 0;
    });
    return count;
}

// ── Runs and rows ─────────────────────────────────────────────

void YamlJobStore::insert_run(const Run& run) {
    std::vector<ChartRow> none;
    persist_run_with_rows(run, none, false);
}

void YamlJobStore::insert_rows(std::vector<ChartRow>& rows) {
    if (rows.empty()) return;

    write([&](StoreState& s) {
        std::map<std::string, std::vector<ChartRow*>> by_run;
        for (auto& r : rows) {
            if (!find_run(s, r.run_id)) {
                throw StoreError("Rows reference unknown run " + r.run_id);
            }
            r.id = s.next_row_id++;
            by_run[r.run_id].push_back(&r);
        }
        for (const auto& [run_id, batch] : by_run) {
            auto existing = load_rows(run_id);
            for (const ChartRow* r : batch) existing.push_back(*r);
            save_rows(run_id, existing);
        }
        return true;
    });
}

void YamlJobStore::persist_run_with_rows(const Run& run, std::vector<ChartRow>& rows,
                                         bool activate) {
    bool wrote_files = false;
    try {
        write([&](StoreState& s) {
            if (find_run(s, run.run_id)) {
                throw StoreError("Duplicate run id: " + run.run_id);
            }
            Job* job = find_job(s, run.job_id);
            if (!job) {
                throw StoreError("Run references unknown job " + run.job_id);
            }

            for (auto& r : rows) {
                r.run_id = run.run_id;
                r.id = s.next_row_id++;
            }
            wrote_files = true;
            if (!rows.empty()) save_rows(run.run_id, rows);
            if (!run.raw_result_json.empty()) {
                write_atomic_or_throw(payload_path(run.run_id), run.raw_result_json);
            }

            Run stored = run;
            stored.raw_result_json.clear();
            s.runs.push_back(stored);

            job->run_count += 1;
            // A run without rows never becomes the active one.
            if (activate && run.rows_inserted > 0) {
                job->last_run_id = run.run_id;
                job->rows_appended_last_run = run.rows_inserted;
            }
            return true;
        });
    } catch (const std::exception&) {
        if (wrote_files) {
            std::error_code ec;
            fs::remove(rows_path(run.run_id), ec);
            fs::remove(payload_path(run.run_id), ec);
        }
        throw;
    }
}

void YamlJobStore::update_run_status(const std::string& run_id, RunStatus status,
                                     const std::string& error) {
    write([&](StoreState& s) {
        Run* r = find_run(s, run_id);
        if (!r) throw StoreError("Unknown run " + run_id);
        r->status = status;
        r->error = error;
        return true;
    });
}

std::optional<Run> YamlJobStore::get_run(const std::string& run_id) {
    auto run = read([&](const StoreState& s) -> std::optional<Run> {
        for (const auto& r : s.runs) {
            if (r.run_id == run_id) return r;
        }
        return std::nullopt;
    });
    if (run) run->raw_result_json = run_payload(run_id);
    return run;
}

std::vector<Run> YamlJobStore::runs_for_job(const std::string& job_id) {
    return read([&](const StoreState& s) {
        std::vector<Run> out;
        for (const auto& r : s.runs) {
            if (r.job_id == job_id) out.push_back(r);
        }
        return out;
    });
}

std::string YamlJobStore::run_payload(const std::string& run_id) {
    auto path = payload_path(run_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) return "";
    return read_file_bytes(path);
}

std::vector<ChartRow> YamlJobStore::rows_for_run(const std::string& run_id) {
    return read([&](const StoreState&) { return load_rows(run_id); });
}

void YamlJobStore::update_rows_source_file(const std::string& run_id,
                                           const std::string& source_file) {
    write([&](StoreState&) {
        auto rows = load_rows(run_id);
        for (auto& r : rows) r.source_file = source_file;
        save_rows(run_id, rows);
        return false;  // state.yaml itself is unchanged
    });
}

// ── Settings ──────────────────────────────────────────────────

WorkerSettings YamlJobStore::settings() {
    return read([](const StoreState& s) { return s.settings; });
}

WorkerSettings YamlJobStore::update_settings(const std::function<void(WorkerSettings&)>& mutate) {
    WorkerSettings result;
    write([&](StoreState& s) {
        mutate(s.settings);
        result = s.settings;
        return true;
    });
    return result;
}
