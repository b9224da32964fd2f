#pragma once

#include "csv_exporter.hpp"
#include "export_queue.hpp"
#include "job_store.hpp"
#include <chart/completeness.hpp>
#include <core/cancel_token.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <extraction/extraction_client.hpp>
#include <pdf/page_selector.hpp>
#include <pdf/raster_scorer.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Observers. Called from worker threads; exceptions are logged and dropped.
struct WorkerEvents {
    std::function<void(const Job&)> on_job;
    std::function<void(const CsvExportResult&)> on_csv_updated;
    std::function<void(const std::string& message)> on_csv_error;
};

using PdfOpener = std::function<std::unique_ptr<PdfDocument>(const fs::path&)>;

// Claims queued jobs up to the configured concurrency and drives each one
// through validation, page selection, extraction, gap repair and
// persistence on its own thread. The store is the source of truth; the
// worker itself holds only cancellation tokens and the export queue.
class Worker {
public:
    Worker(JobStore& store, ExtractionClient& client, const Config& config,
           WorkerEvents events = {}, PdfOpener open_pdf = nullptr);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Requeues jobs left in processing by a previous process and starts the
    // poll thread.
    void start();

    // Stops polling, interrupts running jobs (they go back to queued) and
    // drains the export queue.
    void stop();

    // One scheduling pass. Safe to call from any thread at any time; a pass
    // with nothing to claim changes nothing and notifies no one.
    void tick();

    // Wakes the poll thread for an immediate tick.
    void poke();

    // Signals the token of a running job. False when the job is not running here.
    bool request_cancel(const std::string& job_id,
                        const std::string& reason = CANCELLED_BY_USER);

    // Blocks until no job thread is running or finishing.
    void wait_idle();

    // Queue a CSV re-export on the export thread.
    void enqueue_export();
    void flush_exports();

    int live_job_count();

private:
    struct JobSlot {
        std::thread thread;
        std::shared_ptr<CancelToken> token;
    };

    // Per-job state carried through the pipeline.
    struct JobContext {
        Job job;
        std::string model;
        CancelToken& token;
        std::optional<std::string> persisted_run_id;
        std::optional<std::string> previous_last_run_id;
        int previous_rows_appended = 0;
        nlohmann::json audit = nlohmann::json::object();
    };

    void poll_loop();
    void reap_finished();
    void launch_job(const Job& job, const std::string& model);

    // worker_pipeline.cpp
    void run_job(Job job, std::string model, std::shared_ptr<CancelToken> token);
    void execute(JobContext& ctx);
    fs::path locate_file(JobContext& ctx);
    bool scan_pdf_for_review(JobContext& ctx, const fs::path& path);
    ExtractionResponse extract_attempt(JobContext& ctx, const std::string& image,
                                       const std::string& mime_type, const std::string& model,
                                       ExtractionMode mode,
                                       const std::vector<MissingChartGroup>& groups);
    void persist_and_finish(JobContext& ctx, const fs::path& path,
                            std::vector<ExtractedRow> rows, const std::string& model,
                            const std::vector<MissingChartGroup>& missing);
    void set_progress(JobContext& ctx, const std::string& step);
    void promote_pending(const std::string& job_id);

    // worker_cancel.cpp
    bool token_fired(JobContext& ctx);
    void handle_cancelled(JobContext& ctx, const std::string& reason);
    void handle_failure(JobContext& ctx, const std::string& message);
    void release_slot(const std::string& job_id);
    void retire_self();
    void notify_job(const Job& job);
    static CancelToken::Probe persisted_status_probe(JobStore& store, const std::string& job_id);

    JobStore& store_;
    ExtractionClient& client_;
    const Config& config_;
    WorkerEvents events_;
    PdfOpener open_pdf_;

    DensityRasterScorer raster_;
    PageSelector selector_;
    CompletenessChecker checker_;
    CsvExporter exporter_;
    std::unique_ptr<ExportQueue> export_queue_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> wake_{false};
    std::thread poll_thread_;

    std::mutex tick_mutex_;

    std::mutex jobs_mutex_;
    std::condition_variable jobs_cv_;
    std::map<std::string, JobSlot> jobs_;                  // running jobs by id
    std::map<std::thread::id, std::thread> finishing_;    // released, still in their final tick
    std::vector<std::thread> retired_;                    // past their final tick, not yet joined
};
