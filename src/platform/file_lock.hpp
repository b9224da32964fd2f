#pragma once
#include <string>

// RAII advisory lock on a file via flock().
// Blocking mode waits for the lock (used around job store transactions);
// TryOnce returns immediately and held() reports the outcome (used to keep
// a single `serve` instance per files directory).
// The lock is released when the object is destroyed or the process exits.
class FileLock {
public:
    enum class Mode { Blocking, TryOnce };

    explicit FileLock(const std::string& lock_path, Mode mode = Mode::Blocking);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};
