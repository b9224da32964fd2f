#include "../base_cli.hpp"
#include "../theme.hpp"
#include "job_helpers.hpp"
#include <core/time_utils.hpp>
#include <managers/csv_exporter.hpp>
#include <managers/job_log.hpp>
#include <iostream>
#include <fstream>
#include <fmt/format.h>

// ── Intake ───────────────────────────────────────────────────

static void do_scan(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_store()) return;

    auto result = cli.control->scan_new_dir();
    if (result.is_err()) {
        cli.fail("Scan failed: " + result.error);
        return;
    }
    if (result.value.empty()) {
        std::cout << theme::dim("    Nothing new in " + cli.config->layout().new_dir().string()) << "\n";
        return;
    }
    for (const auto& job : result.value) {
        std::cout << theme::ok(job_line(job));
    }
}

static void do_import(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        cli.fail("Usage: import <file>...");
        return;
    }
    if (!cli.require_store()) return;

    for (const auto& arg : args) {
        auto result = cli.control->import_file(arg);
        if (result.is_err()) {
            cli.fail(arg + ": " + result.error);
            continue;
        }
        std::cout << theme::ok(job_line(result.value));
    }
}

// ── Listings ─────────────────────────────────────────────────

static void do_jobs(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_store()) return;
    bool all = !args.empty() && (args[0] == "--all" || args[0] == "-a");

    auto jobs = cli.store->list_jobs();
    int shown = 0;
    std::cout << "\n";
    std::cout << theme::color::DIM
              << fmt::format("  {:<10} {:<36} {:<16} {:<13} {:>4} {:>6}  {}",
                             "ID", "FILE", "STATUS", "CREATED", "RUNS", "ROWS", "STEP")
              << theme::color::RESET << "\n";
    for (const auto& job : jobs) {
        if (!all && job.status == JobStatus::Deleted) continue;
        std::string status = to_string(job.status);
        // Pad on the plain name; the color codes have no width.
        std::string pad(status.size() < 16 ? 16 - status.size() : 0, ' ');
        std::string step = job.status == JobStatus::Processing ? job.progress_step : job.error;
        std::cout << fmt::format("  {:<10} {:<36} ", job.id.substr(0, 8), job.filename)
                  << status_label(job.status) << pad
                  << fmt::format(" {:<13} {:>4} {:>6}  {}\n",
                                 format_timestamp(job.created_at), job.run_count,
                                 job.rows_appended_last_run, step);
        ++shown;
    }
    if (shown == 0) {
        std::cout << theme::dim("  No jobs found.") << "\n";
    }
    std::cout << "\n";
}

static void do_runs(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        cli.fail("Usage: runs <job-id> [--payload]");
        return;
    }
    if (!cli.require_store()) return;
    std::string id = resolve_job_id(cli, args[0]);
    if (id.empty()) return;
    bool payload = args.size() > 1 && args[1] == "--payload";

    auto job = cli.store->get_job(id);
    auto runs = cli.store->runs_for_job(id);
    std::cout << theme::section(job ? job->filename : id);
    if (runs.empty()) {
        std::cout << theme::dim("    No runs recorded.") << "\n\n";
        return;
    }
    for (const auto& run : runs) {
        bool active = job && job->last_run_id && *job->last_run_id == run.run_id;
        std::cout << fmt::format("    {} {:<22} {:>5} rows  {:<17} ",
                                 active ? "*" : " ", run.run_id.substr(0, 21),
                                 run.rows_inserted, run.model)
                  << status_label(run.status)
                  << theme::dim("  " + format_timestamp(run.extracted_at)) << "\n";
        if (!run.error.empty()) {
            std::cout << theme::dim("        " + run.error) << "\n";
        }
        if (payload) {
            std::cout << cli.store->run_payload(run.run_id) << "\n";
        }
    }
    std::cout << "\n";
}

static void do_logs(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        cli.fail("Usage: logs <job-id>");
        return;
    }
    if (!cli.require_store()) return;
    std::string id = resolve_job_id(cli, args[0]);
    if (id.empty()) return;

    std::ifstream f(job_log_path(id));
    if (!f) {
        std::cout << theme::dim("    No log for " + id) << "\n";
        return;
    }
    std::cout << f.rdbuf() << std::flush;
}

// ── Actions ──────────────────────────────────────────────────

static void report(BaseCLI& cli, const Result<Job>& result, const std::string& done) {
    if (result.is_err()) {
        cli.fail(result.error);
        return;
    }
    std::cout << theme::ok(done + ": " + job_line(result.value));
}

static void do_rerun(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_store()) return;
    std::string id = resolve_job_id(cli, args.empty() ? "" : args[0]);
    if (id.empty()) return;
    report(cli, cli.control->rerun(id), "Requeued");
}

static void do_stop(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_store()) return;
    std::string id = resolve_job_id(cli, args.empty() ? "" : args[0]);
    if (id.empty()) return;
    report(cli, cli.control->stop(id), "Stopped");
}

static void do_delete(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_store()) return;
    std::string id = resolve_job_id(cli, args.empty() ? "" : args[0]);
    if (id.empty()) return;
    auto result = cli.control->delete_job(id);
    report(cli, result, "Deleted");
    if (result.is_ok()) {
        std::cout << theme::dim("    output.csv is refreshed by the running worker or 'export'") << "\n";
    }
}

static void do_export(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_store()) return;
    CsvExporter exporter(*cli.store, cli.config->layout().csv_path());
    auto result = exporter.export_latest_runs_only();
    std::cout << theme::ok(fmt::format("Wrote {} rows to {}", result.total, exporter.path().string()));
}

void register_jobs_commands(BaseCLI& cli) {
    cli.add_command("scan", do_scan, "Register untracked files in new/");
    cli.add_command("import", do_import, "Copy files into new/ and queue them");
    cli.add_command("export", do_export, "Rewrite output.csv from active runs");
    cli.add_command("jobs", do_jobs, "List jobs (--all includes deleted)");
    cli.add_command("runs", do_runs, "List runs of a job (--payload prints audit)");
    cli.add_command("logs", do_logs, "Print a job's log");
    cli.add_command("rerun", do_rerun, "Queue a job again");
    cli.add_command("stop", do_stop, "Cancel a queued or running job");
    cli.add_command("delete", do_delete, "Delete a job and its files");
}
