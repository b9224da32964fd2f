#include "platform.hpp"
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    // pid + counter + random keeps concurrent callers apart
    static std::atomic<unsigned> counter{0};
    static thread_local std::mt19937 rng(
        static_cast<unsigned>(std::time(nullptr)) ^ static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    return temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                         std::to_string(counter++) + "_" + std::to_string(dist(rng)));
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

void move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;

    if (ec.value() != EXDEV) {
        throw fs::filesystem_error("move failed", from, to, ec);
    }

    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
    fs::remove(from);
}

void write_file_atomic(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            throw std::runtime_error("Write failed for " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Cannot replace " + path.string());
    }
}

} // namespace platform
