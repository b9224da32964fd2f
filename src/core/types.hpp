#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct WorkerConfig {
    int poll_interval_ms = 1000;
    int default_concurrency = 2;
    std::string default_model = "gemini-2.5-flash";
    std::string fallback_model = "gemini-2.5-pro";  // escalation target for missing rows
    bool target_chart_filter = true;                // keep only disco/dance chart groups
};

struct ExtractionConfig {
    std::string endpoint = "https://generativelanguage.googleapis.com/v1beta";
    std::string api_key_env = "GOOGLE_GENERATIVE_AI_API_KEY";
    int connect_timeout_secs = 30;
    double temperature = 0.0;
};

struct PdfConfig {
    int max_pages_to_scan = 300;
    int candidate_limit = 12;
    int primary_text_candidates = 6;
    int best_page_scan_limit = 40;
    int raster_dpi = 50;
    int raster_max_dimension = 900;
    int model_dpi = 300;
    int model_max_dimension = 4096;
    int model_jpeg_quality = 95;
};

// Thresholds are on the 0..255 luminance scale, weights apply to densities.
struct RasterWeights {
    int black_threshold = 60;
    int mid_threshold = 200;
    int edge_delta = 22;
    double black_weight = 2.0;
    double edge_weight = 1.4;
    double bimodal_weight = 1.2;
    double mid_weight = 1.0;
};

// Expected-max-rank inference for the completeness check.
// Each pattern must have one capture group holding the number.
struct CompletenessRules {
    std::vector<std::string> title_patterns = {
        R"(\bTOP\s*(\d{2,3})\b)",
        R"(\bHOT\s*(\d{2,3})\b)",
    };
    std::vector<std::string> filename_patterns = {
        R"(\btop[_ -]?(\d{2,3})\b)",
    };
    int min_expected_rank = 2;
    int max_expected_rank = 200;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
