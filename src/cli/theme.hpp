#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Horizontal line, no surrounding blank lines
inline std::string rule() {
    return color::DIM + "  \xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80" + color::RESET + "\n";
}

// Banner: title + rule
inline std::string banner(const std::string& target) {
    return "\n" + color::BLUE + color::BOLD + "  sshexpect" + color::RESET
         + color::DIM + "  " + target + color::RESET + "\n\n" + rule();
}

// Section header with a blank line on each side
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
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
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Key-value row for :status and --list
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
