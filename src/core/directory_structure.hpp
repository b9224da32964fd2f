#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Layout of the managed files directory:
//   new/          incoming uploads awaiting extraction
//   completed/    documents moved here after a successful run
//   state/        job store, run payloads, logs
//   output.csv    latest export
struct FilesLayout {
    fs::path root;

    fs::path new_dir() const { return root / "new"; }
    fs::path completed_dir() const { return root / "completed"; }
    fs::path state_dir() const { return root / "state"; }
    fs::path logs_dir() const { return state_dir() / "logs"; }
    fs::path csv_path() const;
};

// Creates the directories of the layout. Does not touch existing files.
void ensure_directory_structure(const FilesLayout& layout);

// Base ~/.chartreader path (user-level config lives here)
fs::path get_chartreader_root();
