#include "config.hpp"
#include "constants.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>
#include <regex>

namespace fs = std::filesystem;

static fs::path default_files_dir() {
    const char* env = std::getenv("CHARTREADER_FILES_DIR");
    if (env && *env) return fs::path(env);
    return fs::current_path() / "files";
}

Config::Config() {
    layout_.root = default_files_dir();
}

fs::path get_user_config_path() {
    return get_chartreader_root() / "config.yaml";
}

fs::path get_local_config_path(const fs::path& dir) {
    return dir / CONFIG_FILENAME;
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    const char* default_config = R"(# chartreader configuration

# Holds new/, completed/, state/ and output.csv
files_dir: "./files"

worker:
  poll_interval_ms: 1000
  default_concurrency: 2
  default_model: "gemini-2.5-flash"
  fallback_model: "gemini-2.5-pro"
  target_chart_filter: true        # keep only disco/dance chart groups

extraction:
  endpoint: "https://generativelanguage.googleapis.com/v1beta"
  api_key_env: "GOOGLE_GENERATIVE_AI_API_KEY"
  connect_timeout_secs: 30
  temperature: 0

pdf:
  max_pages_to_scan: 300
  candidate_limit: 12
  primary_text_candidates: 6
  raster_dpi: 50
  raster_max_dimension: 900
  model_dpi: 300
  model_max_dimension: 4096
  model_jpeg_quality: 95

# Optional: raster page scoring
# raster:
#   black_threshold: 60
#   mid_threshold: 200
#   edge_delta: 22
#   black_weight: 2.0
#   edge_weight: 1.4
#   bimodal_weight: 1.2
#   mid_weight: 1.0

# Optional: expected chart length inference
# completeness:
#   min_expected_rank: 2
#   max_expected_rank: 200
#   title_patterns: ['\bTOP\s*(\d{2,3})\b', '\bHOT\s*(\d{2,3})\b']
#   filename_patterns: ['\btop[_ -]?(\d{2,3})\b']
)";

    try {
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static WorkerConfig parse_worker_config(const YAML::Node& node) {
    WorkerConfig w;
    w.poll_interval_ms = node["poll_interval_ms"].as<int>(w.poll_interval_ms);
    w.default_concurrency = node["default_concurrency"].as<int>(w.default_concurrency);
    w.default_model = node["default_model"].as<std::string>(w.default_model);
    w.fallback_model = node["fallback_model"].as<std::string>(w.fallback_model);
    w.target_chart_filter = node["target_chart_filter"].as<bool>(w.target_chart_filter);

    if (w.poll_interval_ms < 100) w.poll_interval_ms = 100;
    if (w.default_concurrency < MIN_CONCURRENCY) w.default_concurrency = MIN_CONCURRENCY;
    if (w.default_concurrency > MAX_CONCURRENCY) w.default_concurrency = MAX_CONCURRENCY;
    return w;
}

static ExtractionConfig parse_extraction_config(const YAML::Node& node) {
    ExtractionConfig e;
    e.endpoint = node["endpoint"].as<std::string>(e.endpoint);
    e.api_key_env = node["api_key_env"].as<std::string>(e.api_key_env);
    e.connect_timeout_secs = node["connect_timeout_secs"].as<int>(e.connect_timeout_secs);
    e.temperature = node["temperature"].as<double>(e.temperature);

    while (!e.endpoint.empty() && e.endpoint.back() == '/') e.endpoint.pop_back();
    return e;
}

static PdfConfig parse_pdf_config(const YAML::Node& node) {
    PdfConfig p;
    p.max_pages_to_scan = node["max_pages_to_scan"].as<int>(p.max_pages_to_scan);
    p.candidate_limit = node["candidate_limit"].as<int>(p.candidate_limit);
    p.primary_text_candidates = node["primary_text_candidates"].as<int>(p.primary_text_candidates);
    p.best_page_scan_limit = node["best_page_scan_limit"].as<int>(p.best_page_scan_limit);
    p.raster_dpi = node["raster_dpi"].as<int>(p.raster_dpi);
    p.raster_max_dimension = node["raster_max_dimension"].as<int>(p.raster_max_dimension);
    p.model_dpi = node["model_dpi"].as<int>(p.model_dpi);
    p.model_max_dimension = node["model_max_dimension"].as<int>(p.model_max_dimension);
    p.model_jpeg_quality = node["model_jpeg_quality"].as<int>(p.model_jpeg_quality);

    if (p.max_pages_to_scan < 1) p.max_pages_to_scan = 1;
    if (p.candidate_limit < 1) p.candidate_limit = 1;
    if (p.primary_text_candidates < 0) p.primary_text_candidates = 0;
    if (p.model_jpeg_quality < 1 || p.model_jpeg_quality > 100) p.model_jpeg_quality = 95;
    return p;
}

static RasterWeights parse_raster_config(const YAML::Node& node) {
    RasterWeights r;
    r.black_threshold = node["black_threshold"].as<int>(r.black_threshold);
    r.mid_threshold = node["mid_threshold"].as<int>(r.mid_threshold);
    r.edge_delta = node["edge_delta"].as<int>(r.edge_delta);
    r.black_weight = node["black_weight"].as<double>(r.black_weight);
    r.edge_weight = node["edge_weight"].as<double>(r.edge_weight);
    r.bimodal_weight = node["bimodal_weight"].as<double>(r.bimodal_weight);
    r.mid_weight = node["mid_weight"].as<double>(r.mid_weight);
    return r;
}

// Patterns accept a string or a list. Each is compiled once here so a bad
// expression fails the config load instead of the first extraction.
static void read_patterns(const YAML::Node& node, std::vector<std::string>& out) {
    if (!node) return;
    std::vector<std::string> patterns;
    if (node.IsScalar()) {
        patterns.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        patterns = node.as<std::vector<std::string>>(std::vector<std::string>());
    }
    for (const auto& p : patterns) {
        std::regex re(p, std::regex::icase);
        if (re.mark_count() < 1) {
            throw std::runtime_error("pattern has no capture group: " + p);
        }
    }
    out = patterns;
}

static CompletenessRules parse_completeness_config(const YAML::Node& node) {
    CompletenessRules c;
    c.min_expected_rank = node["min_expected_rank"].as<int>(c.min_expected_rank);
    c.max_expected_rank = node["max_expected_rank"].as<int>(c.max_expected_rank);
    read_patterns(node["title_patterns"], c.title_patterns);
    read_patterns(node["filename_patterns"], c.filename_patterns);

    if (c.min_expected_rank > c.max_expected_rank) {
        throw std::runtime_error("completeness.min_expected_rank exceeds max_expected_rank");
    }
    return c;
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.source_path_ = path;

        if (root["files_dir"]) {
            fs::path dir = root["files_dir"].as<std::string>();
            if (dir.is_relative()) {
                dir = fs::absolute(path).parent_path() / dir;
            }
            config.layout_.root = dir.lexically_normal();
        }

        config.worker_ = parse_worker_config(root["worker"] ? root["worker"] : YAML::Node());
        config.extraction_ = parse_extraction_config(root["extraction"] ? root["extraction"] : YAML::Node());
        config.pdf_ = parse_pdf_config(root["pdf"] ? root["pdf"] : YAML::Node());
        config.raster_ = parse_raster_config(root["raster"] ? root["raster"] : YAML::Node());
        config.completeness_ = parse_completeness_config(
            root["completeness"] ? root["completeness"] : YAML::Node());

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const std::optional<fs::path>& explicit_path) {
    if (explicit_path) {
        return load_file(*explicit_path);
    }

    fs::path local = get_local_config_path();
    if (fs::exists(local)) {
        return load_file(local);
    }

    fs::path user = get_user_config_path();
    if (fs::exists(user)) {
        return load_file(user);
    }

    return Result<Config>::Ok(Config{});
}
