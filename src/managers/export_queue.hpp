#pragma once

#include "csv_exporter.hpp"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Serializes CSV re-exports on one background thread. Requests that arrive
// while an export is running collapse into a single follow-up pass.
class ExportQueue {
public:
    using DoneCallback = std::function<void(const CsvExportResult&)>;
    using ErrorCallback = std::function<void(const std::string& message)>;

    ExportQueue(CsvExporter& exporter, DoneCallback on_done, ErrorCallback on_error);
    ~ExportQueue();

    ExportQueue(const ExportQueue&) = delete;
    ExportQueue& operator=(const ExportQueue&) = delete;

    void enqueue();

    // Blocks until every export requested before the call has finished.
    void flush();

    // Drains outstanding requests and joins the thread.
    void stop();

private:
    void export_loop();

    CsvExporter& exporter_;
    DoneCallback on_done_;
    ErrorCallback on_error_;

    std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t requested_ = 0;
    uint64_t completed_ = 0;
    bool stopping_ = false;
    std::thread thread_;
};
