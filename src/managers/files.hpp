#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Inputs we know how to extract from: .jpg .jpeg .png .webp .pdf
bool is_supported_file(const std::string& filename);

// MIME type from the extension, "" for anything unsupported.
std::string mime_type_for(const std::string& filename);

bool is_pdf_file(const std::string& filename);

// Base name with every run of characters outside [A-Za-z0-9._-] replaced by
// '_'. Empty input becomes "upload".
std::string sanitize_filename(const std::string& original);

// Sanitized name, or base_N.ext for the first N in 1..9999 that is free.
// Throws StoreError when every candidate is taken.
std::string make_unique_filename(const std::string& desired,
                                 const std::function<bool(const std::string&)>& is_taken);

// Supported files directly inside dir, sorted by name.
std::vector<std::string> list_supported_files(const fs::path& dir);
