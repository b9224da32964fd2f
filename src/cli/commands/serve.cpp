#include "../base_cli.hpp"
#include "../theme.hpp"
#include "job_helpers.hpp"
#include <core/constants.hpp>
#include <extraction/gemini_client.hpp>
#include <managers/job_log.hpp>
#include <managers/worker.hpp>
#include <platform/file_lock.hpp>
#include <platform/platform.hpp>
#include <pdf/poppler_document.hpp>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <mutex>
#include <fmt/format.h>

static std::atomic<bool> g_shutdown{false};

static void on_signal(int) {
    g_shutdown = true;
}

// Serializes event output from job threads.
static std::mutex& print_mutex() {
    static std::mutex m;
    return m;
}

static void print_event(const std::string& line) {
    std::lock_guard<std::mutex> lock(print_mutex());
    std::cout << line << std::flush;
}

static std::string event_line(const Job& job) {
    switch (job.status) {
        case JobStatus::Completed:
            return theme::ok(fmt::format("{} {} rows", job_line(job), job.rows_appended_last_run));
        case JobStatus::Error:
            return theme::fail(job_line(job));
        case JobStatus::AwaitingReview:
            return theme::step(job_line(job) + " (pick a page)");
        default:
            return theme::log(job_line(job));
    }
}

static void do_serve(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_store()) return;
    const Config& config = *cli.config;
    const auto& layout = config.layout();

    FileLock serve_lock((layout.state_dir() / "serve.lock").string(), FileLock::Mode::TryOnce);
    if (!serve_lock.held()) {
        cli.fail("Another worker is already serving " + layout.root.string());
        return;
    }

    if (!PopplerDocument::tools_available()) {
        std::cout << theme::info("poppler-utils not found; PDF jobs will fail");
    }

    GeminiClient client(config.extraction());

    WorkerEvents events;
    events.on_job = [](const Job& job) { print_event(event_line(job)); };
    events.on_csv_updated = [](const CsvExportResult& r) {
        print_event(theme::log(fmt::format("output.csv: {} rows at {}", r.total, r.updated_at)));
    };
    events.on_csv_error = [](const std::string& message) {
        print_event(theme::fail("CSV export failed: " + message));
    };

    Worker worker(*cli.store, client, config, events);
    JobControl control(*cli.store, layout, &worker);

    g_shutdown = false;
    auto prev_int = std::signal(SIGINT, on_signal);
    auto prev_term = std::signal(SIGTERM, on_signal);

    auto settings = cli.store->settings();
    std::cout << theme::banner();
    std::cout << theme::kv("Files", layout.root.string());
    std::cout << theme::kv("Model", settings.model);
    std::cout << theme::kv("Concurrency", std::to_string(settings.concurrency)
                                          + (settings.paused ? theme::yellow(" (paused)") : ""));
    std::cout << "\n" << theme::dim("    Ctrl+C to stop") << "\n\n" << std::flush;
    chartreader_log(fmt::format("serve: started on {}", layout.root.string()));

    worker.start();

    int poll_ms = std::max(config.worker().poll_interval_ms, WORKER_SLEEP_SLICE_MS);
    while (!g_shutdown) {
        auto scanned = control.scan_new_dir();
        if (scanned.is_err()) {
            chartreader_log("serve: scan failed: " + scanned.error);
        } else {
            for (const auto& job : scanned.value) {
                print_event(theme::info("registered " + job_line(job)));
            }
        }

        for (int waited = 0; waited < poll_ms && !g_shutdown; waited += WORKER_SLEEP_SLICE_MS) {
            platform::sleep_ms(WORKER_SLEEP_SLICE_MS);
        }
    }

    print_event(theme::step("Stopping worker..."));
    worker.stop();
    chartreader_log("serve: stopped");
    print_event(theme::ok("Worker stopped"));

    std::signal(SIGINT, prev_int);
    std::signal(SIGTERM, prev_term);
}

void register_serve_commands(BaseCLI& cli) {
    cli.add_command("serve", do_serve, "Run the worker and watch new/");
}
