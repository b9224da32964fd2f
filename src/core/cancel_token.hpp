#pragma once

#include "errors.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

// Cooperative cancellation shared between the worker and one job's pipeline.
// The pipeline calls throw_if_cancelled() at every checkpoint; long-running
// transfers poll cancelled() to abort early.
class CancelToken {
public:
    // Returns a reason when an outside source (e.g. another process flipping
    // the persisted status) wants the job stopped.
    using Probe = std::function<std::optional<std::string>()>;

    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // First reason wins; later calls are ignored.
    void cancel(const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return;
        reason_ = reason;
        cancelled_ = true;
    }

    bool cancelled() const { return cancelled_; }

    std::string reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    void set_probe(Probe probe) {
        std::lock_guard<std::mutex> lock(mutex_);
        probe_ = std::move(probe);
    }

    // Consults the probe when not yet cancelled. True once cancelled.
    bool poll() {
        if (!cancelled_) {
            Probe probe;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                probe = probe_;
            }
            if (probe) {
                if (auto reason = probe()) cancel(*reason);
            }
        }
        return cancelled_;
    }

    void throw_if_cancelled() {
        if (poll()) {
            throw CancelledError(reason());
        }
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::string reason_;
    Probe probe_;
};
