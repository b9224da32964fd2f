#include "directory_structure.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>

fs::path FilesLayout::csv_path() const {
    return root / CSV_FILENAME;
}

fs::path get_chartreader_root() {
    return platform::home_dir() / ".chartreader";
}

void ensure_directory_structure(const FilesLayout& layout) {
    fs::create_directories(layout.new_dir());
    fs::create_directories(layout.completed_dir());
    fs::create_directories(layout.state_dir());
    fs::create_directories(layout.logs_dir());
}
