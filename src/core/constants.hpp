#pragma once

// ── Worker ──────────────────────────────────────────────────
constexpr int WORKER_SLEEP_SLICE_MS      = 100;   // Poll loop sleeps in slices for responsive shutdown
constexpr int MIN_CONCURRENCY            = 1;
constexpr int MAX_CONCURRENCY            = 10;
constexpr int PROMPT_MAX_RANK_RANGES     = 60;    // Missing-rank ranges listed in a targeted prompt
constexpr int SUMMARY_MAX_RANK_RANGES    = 20;    // Missing-rank ranges listed in a gap summary

// ── Page scoring ────────────────────────────────────────────
constexpr int RANK_TOKEN_MIN             = 1;
constexpr int RANK_TOKEN_MAX             = 200;
constexpr int RANK_TOKEN_COUNT_CAP       = 300;
constexpr double RANK_TOKEN_WEIGHT       = 0.45;
constexpr double LENGTH_BONUS_DIVISOR    = 1000.0;
constexpr double LENGTH_BONUS_CAP        = 40.0;
constexpr double BOOST_GATE_BASE_SCORE   = 140.0;
constexpr int BOOST_GATE_RANK_COUNT      = 18;

// ── Chart-likeness ──────────────────────────────────────────
constexpr double CHART_STRONG_BASE_SCORE = 160.0;
constexpr int CHART_STRONG_RANK_COUNT    = 30;
constexpr double CHART_MIXED_BASE_SCORE  = 110.0;
constexpr int CHART_MIXED_RANK_COUNT     = 18;

// ── Rendering ───────────────────────────────────────────────
constexpr long RASTER_MAX_PIXELS         = 1200000;   // low-res scoring renders
constexpr long MODEL_MAX_PIXELS          = 12000000;  // page image sent to the model

// ── Files ───────────────────────────────────────────────────
constexpr int UNIQUE_FILENAME_MAX_TRIES  = 9999;
constexpr const char* CSV_FILENAME       = "output.csv";
constexpr const char* CONFIG_FILENAME    = "chartreader.yaml";

// ── Messages ────────────────────────────────────────────────
constexpr const char* CANCELLED_BY_USER  = "Cancelled by user";
constexpr const char* CANCELLED_BY_SHUTDOWN = "Interrupted by worker shutdown";
