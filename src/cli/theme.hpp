#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string TEAL      = "\033[38;2;64;160;150m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string teal(const std::string& s)    { return color::TEAL + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    return "\n" + color::BLUE + color::BOLD + "  pm" + color::RESET
         + color::DIM + "  project manager v" + PM_VERSION + color::RESET + "\n";
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::TEAL + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::TEAL + "    > " + color::RESET + msg + "\n";
}

// Key-value row
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

// Usage row: command, argument placeholder, description
inline std::string usage(const std::string& cmd, const std::string& args, const std::string& desc) {
    return color::BLUE + "    " + cmd + color::RESET + " "
         + color::TEAL + args + color::RESET
         + color::DIM + fmt::format("{:>{}}", "", cmd.size() + args.size() < 34 ? 34 - cmd.size() - args.size() : 1)
         + desc + color::RESET + "\n";
}

} // namespace theme
