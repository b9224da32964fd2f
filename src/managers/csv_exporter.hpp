#pragma once

#include "job_store.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct CsvExportResult {
    std::string updated_at;
    int total = 0;
};

// Writes output.csv from the active run of every live document. When more
// than one job shares a canonical filename, the one whose active run was
// extracted last wins. Rows appear in store row-id order.
class CsvExporter {
public:
    CsvExporter(JobStore& store, fs::path csv_path);

    // Rewrites the file through <csv>.tmp + rename. Throws StoreError.
    CsvExportResult export_latest_runs_only();

    // Rows that export_latest_runs_only() would write.
    std::vector<ChartRow> collect_rows();

    static const std::vector<std::string>& columns();

    // RFC 4180 field quoting.
    static std::string escape(const std::string& value);

    const fs::path& path() const { return csv_path_; }

private:
    JobStore& store_;
    fs::path csv_path_;
};
