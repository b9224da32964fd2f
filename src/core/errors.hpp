#pragma once

#include <stdexcept>
#include <string>

// Base for every error raised inside the extraction pipeline. The worker
// catches these at the per-job boundary and classifies them.
class ChartReaderError : public std::runtime_error {
public:
    explicit ChartReaderError(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad input: missing file, no date in the filename, unsupported type.
class ValidationError : public ChartReaderError {
public:
    explicit ValidationError(const std::string& msg) : ChartReaderError(msg) {}
};

// Remote model failure, malformed response, or nothing usable extracted.
class ExtractionError : public ChartReaderError {
public:
    explicit ExtractionError(const std::string& msg) : ChartReaderError(msg) {}
};

// Persistence or file-system failure.
class StoreError : public ChartReaderError {
public:
    explicit StoreError(const std::string& msg) : ChartReaderError(msg) {}
};

// Raised from cancellation checkpoints. Never reported as a failure.
class CancelledError : public ChartReaderError {
public:
    explicit CancelledError(const std::string& reason) : ChartReaderError(reason) {}
};
