#include "export_queue.hpp"
#include "job_log.hpp"
#include <fmt/format.h>

ExportQueue::ExportQueue(CsvExporter& exporter, DoneCallback on_done, ErrorCallback on_error)
    : exporter_(exporter), on_done_(std::move(on_done)), on_error_(std::move(on_error)) {
    thread_ = std::thread(&ExportQueue::export_loop, this);
}

ExportQueue::~ExportQueue() {
    stop();
}

void ExportQueue::enqueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        ++requested_;
    }
    cv_.notify_all();
}

void ExportQueue::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    uint64_t target = requested_;
    cv_.wait(lock, [&] { return completed_ >= target; });
}

void ExportQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ExportQueue::export_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [&] { return requested_ > completed_ || stopping_; });
        if (requested_ == completed_) break;  // stopping with nothing left

        uint64_t target = requested_;
        lock.unlock();

        try {
            auto result = exporter_.export_latest_runs_only();
            if (on_done_) on_done_(result);
        } catch (const std::exception& e) {
            chartreader_log(fmt::format("csv: export failed: {}", e.what()));
            if (on_error_) on_error_(e.what());
        }

        lock.lock();
        completed_ = target;
        cv_.notify_all();
    }
}
