#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "directory_structure.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from an explicit path, or the first of ./chartreader.yaml and
    // ~/.chartreader/config.yaml that exists. No file at all yields defaults.
    static Result<Config> load(const std::optional<fs::path>& explicit_path = std::nullopt);

    // Load a specific file. Relative files_dir resolves against its directory.
    static Result<Config> load_file(const fs::path& path);

    // Accessors
    const FilesLayout& layout() const { return layout_; }
    const WorkerConfig& worker() const { return worker_; }
    const ExtractionConfig& extraction() const { return extraction_; }
    const PdfConfig& pdf() const { return pdf_; }
    const RasterWeights& raster() const { return raster_; }
    const CompletenessRules& completeness() const { return completeness_; }
    const std::optional<fs::path>& source_path() const { return source_path_; }

    void set_files_dir(const fs::path& dir) { layout_.root = dir; }
    void set_worker(const WorkerConfig& w) { worker_ = w; }

public:
    Config();

private:
    FilesLayout layout_;
    WorkerConfig worker_;
    ExtractionConfig extraction_;
    PdfConfig pdf_;
    RasterWeights raster_;
    CompletenessRules completeness_;
    std::optional<fs::path> source_path_;
};

// Get paths
fs::path get_user_config_path();
fs::path get_local_config_path(const fs::path& dir = fs::current_path());

// Write a commented default config at path (no-op if it exists)
Result<void> create_default_config(const fs::path& path);
