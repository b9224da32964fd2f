#include "files.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <util/string_utils.hpp>
#include <algorithm>
#include <cctype>

static std::string lower_extension(const std::string& filename) {
    return StringUtils::to_lower(fs::path(filename).extension().string());
}

std::string mime_type_for(const std::string& filename) {
    std::string ext = lower_extension(filename);
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".png") return "image/png";
    if (ext == ".webp") return "image/webp";
    if (ext == ".pdf") return "application/pdf";
    return "";
}

bool is_supported_file(const std::string& filename) {
    return !mime_type_for(filename).empty();
}

bool is_pdf_file(const std::string& filename) {
    return lower_extension(filename) == ".pdf";
}

static bool is_safe_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

std::string sanitize_filename(const std::string& original) {
    std::string base = StringUtils::trim(fs::path(original).filename().string());
    if (base.empty()) return "upload";

    std::string out;
    out.reserve(base.size());
    bool in_run = false;
    for (char c : base) {
        if (is_safe_char(c)) {
            out += c;
            in_run = false;
        } else if (!in_run) {
            out += '_';
            in_run = true;
        }
    }
    return out.empty() ? "upload" : out;
}

std::string make_unique_filename(const std::string& desired,
                                 const std::function<bool(const std::string&)>& is_taken) {
    std::string sanitized = sanitize_filename(desired);
    if (!is_taken(sanitized)) return sanitized;

    fs::path p(sanitized);
    std::string ext = p.extension().string();
    std::string base = sanitized.substr(0, sanitized.size() - ext.size());

    for (int i = 1; i <= UNIQUE_FILENAME_MAX_TRIES; ++i) {
        std::string candidate = base + "_" + std::to_string(i) + ext;
        if (!is_taken(candidate)) return candidate;
    }
    throw StoreError("Unable to find a unique filename for " + sanitized);
}

std::vector<std::string> list_supported_files(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return names;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (is_supported_file(name)) names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}
