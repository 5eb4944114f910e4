#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

namespace StringUtils {

// Split on a single character. Keeps empty fields, so join(split(s)) == s.
std::vector<std::string> split(const std::string& str, char delimiter);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

std::string trim(const std::string& str);

// Split a command line into words, honouring single and double quotes.
std::vector<std::string> split_words(const std::string& line);

} // namespace StringUtils

// Drop the echoed command line from shell output: if the first line
// contains `command` verbatim, return the remaining lines, else `output`.
std::string strip_command_echo(const std::string& output, const std::string& command);
