#include "csv_exporter.hpp"
#include "job_log.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>

CsvExporter::CsvExporter(JobStore& store, fs::path csv_path)
    : store_(store), csv_path_(std::move(csv_path)) {}

const std::vector<std::string>& CsvExporter::columns() {
    static const std::vector<std::string> cols = {
        "entry_date", "chart_title", "chart_section",
        "this_week_rank", "last_week_rank", "two_weeks_ago_rank", "weeks_on_chart",
        "title", "artist", "label", "source_file", "run_id", "extracted_at",
    };
    return cols;
}

std::string CsvExporter::escape(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;

    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

static std::string rank_cell(const std::optional<int>& v) {
    return v ? std::to_string(*v) : "";
}

std::vector<ChartRow> CsvExporter::collect_rows() {
    struct Chosen {
        std::string run_id;
        std::string extracted_at;
        std::string created_at;
    };
    std::map<std::string, Chosen> by_canonical;

    for (const auto& job : store_.list_jobs()) {
        if (job.status == JobStatus::Deleted || !job.last_run_id) continue;

        std::optional<Run> run;
        for (auto& r : store_.runs_for_job(job.id)) {
            if (r.run_id == *job.last_run_id) run = std::move(r);
        }
        if (!run) {
            chartreader_log(fmt::format("csv: job {} points at missing run {}",
                                        job.id, *job.last_run_id));
            continue;
        }

        auto it = by_canonical.find(job.canonical_filename);
        bool newer = it == by_canonical.end() ||
                     run->extracted_at > it->second.extracted_at ||
                     (run->extracted_at == it->second.extracted_at &&
                      job.created_at > it->second.created_at);
        if (newer) {
            by_canonical[job.canonical_filename] = {run->run_id, run->extracted_at, job.created_at};
        }
    }

    std::vector<ChartRow> rows;
    for (const auto& [canonical, chosen] : by_canonical) {
        auto run_rows = store_.rows_for_run(chosen.run_id);
        rows.insert(rows.end(), run_rows.begin(), run_rows.end());
    }
    std::sort(rows.begin(), rows.end(), [](const ChartRow& a, const ChartRow& b) {
        return a.id < b.id;
    });
    return rows;
}

CsvExportResult CsvExporter::export_latest_runs_only() {
    CsvExportResult result;
    result.updated_at = now_iso();

    auto rows = collect_rows();

    std::string out;
    const auto& cols = columns();
    for (size_t i = 0; i < cols.size(); ++i) {
        if (i > 0) out += ',';
        out += cols[i];
    }
    out += '\n';

    for (const auto& r : rows) {
        const std::string cells[] = {
            r.entry_date, r.chart_title, r.chart_section,
            rank_cell(r.this_week_rank), rank_cell(r.last_week_rank),
            rank_cell(r.two_weeks_ago_rank), rank_cell(r.weeks_on_chart),
            r.title, r.artist, r.label, r.source_file, r.run_id, r.extracted_at,
        };
        bool first = true;
        for (const auto& cell : cells) {
            if (!first) out += ',';
            out += escape(cell);
            first = false;
        }
        out += '\n';
    }

    try {
        platform::write_file_atomic(csv_path_, out);
    } catch (const std::exception& e) {
        throw StoreError(fmt::format("CSV export failed: {}", e.what()));
    }

    result.total = static_cast<int>(rows.size());
    chartreader_log(fmt::format("csv: wrote {} rows to {}", result.total, csv_path_.string()));
    return result;
}
