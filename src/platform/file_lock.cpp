#include "file_lock.hpp"
#include <cerrno>
#include <filesystem>

#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

FileLock::FileLock(const std::string& lock_path, Mode mode) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(lock_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) return;

    int op = LOCK_EX;
    if (mode == Mode::TryOnce) op |= LOCK_NB;

    int rc;
    do {
        rc = flock(fd_, op);
    } while (rc != 0 && errno == EINTR && mode == Mode::Blocking);

    if (rc != 0) {
        close(fd_);
        fd_ = -1;
    }
}

FileLock::~FileLock() {
    if (fd_ < 0) return;
    close(fd_);
    // flock is released automatically when fd is closed
}
