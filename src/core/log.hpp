#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log sink. Defaults to <tmp>/sshexpect_debug.log; the CLI redirects
// it with the `log_file` config key.
inline std::string& sshexpect_log_path_ref() {
    static std::string path = (platform::temp_dir() / "sshexpect_debug.log").string();
    return path;
}

inline std::mutex& sshexpect_log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(sshexpect_log_mutex());
    sshexpect_log_path_ref() = path;
}

inline std::string log_path() {
    std::lock_guard<std::mutex> lock(sshexpect_log_mutex());
    return sshexpect_log_path_ref();
}

inline void sshexpect_log(const std::string& msg) {
    // Reader thread and caller thread both log
    std::lock_guard<std::mutex> lock(sshexpect_log_mutex());
    std::ofstream out(sshexpect_log_path_ref(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Shorten buffer contents for a log line, escaping CR/LF so one read
// stays on one line.
inline std::string log_preview(const std::string& text, size_t max_chars = LOG_PREVIEW_CHARS) {
    std::string out;
    size_t limit = text.size() < max_chars ? text.size() : max_chars;
    out.reserve(limit + 8);
    for (size_t i = 0; i < limit; ++i) {
        char c = text[i];
        if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else out += c;
    }
    if (text.size() > max_chars) {
        out += fmt::format("...(+{})", text.size() - max_chars);
    }
    return out;
}
