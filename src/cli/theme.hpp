#pragma once

#include <string>
#include <fmt/format.h>

#define CHARTREADER_VERSION "0.4.0"

namespace theme {

// Palette (ANSI escape sequences)
// Ink blue:   #3E78B2
// Vinyl amber: #B07A2E
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string AMBER     = "\033[38;2;176;122;46m";
    const std::string WHITE     = "\033[97m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string blue(const std::string& s)   { return color::BLUE + s + color::RESET; }
inline std::string amber(const std::string& s)  { return color::AMBER + s + color::RESET; }
inline std::string bold(const std::string& s)   { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)  { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)    { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s) { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Just the horizontal line (callers control gaps)
inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; ++i) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Title + version + rule
inline std::string banner() {
    return
        "\n" + color::BLUE + color::BOLD
        + "  chartreader\n"
        + color::RESET + color::DIM + "  v" CHARTREADER_VERSION "\n"
        + "  Chart tables out of scanned pages"
        + color::RESET + "\n\n"
        + rule();
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<14}", key) + color::RESET + value + "\n";
}

} // namespace theme
