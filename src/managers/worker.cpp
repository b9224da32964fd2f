#include "worker.hpp"
#include "job_log.hpp"
#include <pdf/poppler_document.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

// ── Construction / Destruction ──────────────────────────────

Worker::Worker(JobStore& store, ExtractionClient& client, const Config& config,
               WorkerEvents events, PdfOpener open_pdf)
    : store_(store),
      client_(client),
      config_(config),
      events_(std::move(events)),
      open_pdf_(std::move(open_pdf)),
      raster_(config.raster()),
      selector_(raster_, config.pdf()),
      checker_(config.completeness()),
      exporter_(store, config.layout().csv_path()) {
    if (!open_pdf_) {
        open_pdf_ = [](const fs::path& path) -> std::unique_ptr<PdfDocument> {
            return std::make_unique<PopplerDocument>(path);
        };
    }

    auto on_csv_updated = events_.on_csv_updated;
    auto on_csv_error = events_.on_csv_error;
    export_queue_ = std::make_unique<ExportQueue>(
        exporter_,
        [on_csv_updated](const CsvExportResult& r) {
            if (on_csv_updated) on_csv_updated(r);
        },
        [on_csv_error](const std::string& message) {
            if (on_csv_error) on_csv_error(message);
        });
}

Worker::~Worker() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void Worker::start() {
    if (running_) return;

    int swept = store_.requeue_processing();
    if (swept > 0) {
        chartreader_log(fmt::format("worker: requeued {} interrupted job(s)", swept));
    }

    stopping_ = false;
    running_ = true;
    poll_thread_ = std::thread(&Worker::poll_loop, this);
    chartreader_log(fmt::format("worker: started (poll every {}ms)",
                                config_.worker().poll_interval_ms));
}

void Worker::stop() {
    if (stopping_.exchange(true)) return;

    running_ = false;
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }

    // A tick already past its stopping_ check may still launch jobs; let it
    // finish so those jobs get cancelled below.
    { std::lock_guard<std::mutex> barrier(tick_mutex_); }

    std::vector<std::thread> threads;
    {
        std::unique_lock<std::mutex> lock(jobs_mutex_);
        for (auto& [id, slot] : jobs_) {
            slot.token->cancel(CANCELLED_BY_SHUTDOWN);
        }
        // Job threads release their own slots; wait for that, then join.
        jobs_cv_.wait(lock, [&] { return jobs_.empty() && finishing_.empty(); });
        threads.swap(retired_);
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    export_queue_->stop();
    chartreader_log("worker: stopped");
}

void Worker::poke() {
    wake_ = true;
}

// ── Poll loop ───────────────────────────────────────────────

void Worker::poll_loop() {
    while (running_) {
        try {
            tick();
        } catch (const std::exception& e) {
            chartreader_log(fmt::format("worker: tick failed: {}", e.what()));
        }

        // Sleep the poll interval in slices for responsive shutdown and pokes
        int slices = std::max(1, config_.worker().poll_interval_ms / WORKER_SLEEP_SLICE_MS);
        for (int i = 0; i < slices && running_ && !wake_; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(WORKER_SLEEP_SLICE_MS));
        }
        wake_ = false;
    }
}

// ── Scheduling ──────────────────────────────────────────────

void Worker::tick() {
    if (stopping_) return;
    std::lock_guard<std::mutex> guard(tick_mutex_);
    if (stopping_) return;

    reap_finished();

    WorkerSettings settings = store_.settings();
    if (settings.paused) return;

    int active = std::max(store_.count_processing(), live_job_count());
    int available = settings.concurrency - active;
    if (available <= 0) return;

    auto claimed = store_.claim_queued(available);
    for (const auto& job : claimed) {
        log_job_event(job.id, fmt::format("claimed (model {})", settings.model));
        notify_job(job);
        launch_job(job, settings.model);
    }
}

void Worker::launch_job(const Job& job, const std::string& model) {
    auto token = std::make_shared<CancelToken>();
    token->set_probe(persisted_status_probe(store_, job.id));

    std::lock_guard<std::mutex> lock(jobs_mutex_);
    JobSlot& slot = jobs_[job.id];
    slot.token = token;
    slot.thread = std::thread(&Worker::run_job, this, job, model, token);
}

// Joins only threads past their final tick, so joining never waits on a
// thread that wants tick_mutex_.
void Worker::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        done.swap(retired_);
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

void Worker::release_slot(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return;
    std::thread thread = std::move(it->second.thread);
    jobs_.erase(it);
    auto id = thread.get_id();
    finishing_.emplace(id, std::move(thread));
}

void Worker::retire_self() {
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = finishing_.find(std::this_thread::get_id());
        if (it != finishing_.end()) {
            retired_.push_back(std::move(it->second));
            finishing_.erase(it);
        }
    }
    jobs_cv_.notify_all();
}

bool Worker::request_cancel(const std::string& job_id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return false;
    it->second.token->cancel(reason);
    chartreader_log(fmt::format("worker: cancel requested for {}: {}", job_id, reason));
    return true;
}

int Worker::live_job_count() {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    return static_cast<int>(jobs_.size());
}

void Worker::wait_idle() {
    std::unique_lock<std::mutex> lock(jobs_mutex_);
    jobs_cv_.wait(lock, [&] { return jobs_.empty() && finishing_.empty(); });
}

// ── Export ──────────────────────────────────────────────────

void Worker::enqueue_export() {
    export_queue_->enqueue();
}

void Worker::flush_exports() {
    export_queue_->flush();
}
