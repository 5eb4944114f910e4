#pragma once

#include <string>
#include <optional>
#include <functional>
#include <chrono>
#include <cstddef>
#include "constants.hpp"

// Outcome of a session operation
enum class Status {
    Ok,
    ConnectionFailed,   // transport/auth failure on open
    PromptNotFound,     // initial prompt not seen after opening
    NoMatch,            // read-until deadline expired without a match
    InvalidPattern,     // regex failed to compile
    LostConnection,     // write on a session that is not connected
    StreamClosed,       // reader hit EOF, nothing left to match against
    InvalidConfig,      // profile file missing or malformed
};

inline const char* status_name(Status s) {
    switch (s) {
    case Status::Ok:               return "ok";
    case Status::ConnectionFailed: return "connection failed";
    case Status::PromptNotFound:   return "prompt not found";
    case Status::NoMatch:          return "no match";
    case Status::InvalidPattern:   return "invalid pattern";
    case Status::LostConnection:   return "lost connection";
    case Status::StreamClosed:     return "stream closed";
    case Status::InvalidConfig:    return "invalid config";
    }
    return "unknown";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    Status status;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", Status::Ok};
    }

    static Result<T> Err(Status status, const std::string& err) {
        return {false, T{}, err, status};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    Status status;

    static Result<void> Ok() {
        return {true, "", Status::Ok};
    }

    static Result<void> Err(Status status, const std::string& err) {
        return {false, err, status};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Result of a read-until call. On any non-Ok status, text still holds
// whatever was drained from the buffer.
struct ReadResult {
    std::string text;
    Status status = Status::NoMatch;
    size_t pattern_index = 0;      // winning index for list matches
    std::string error;

    bool matched() const { return status == Status::Ok; }
};

// Connection parameters for one shell session
struct SessionConfig {
    std::string host;
    int port = DEFAULT_SSH_PORT;
    std::string user;
    std::string password;
    std::optional<std::string> ssh_key_path;
    std::string prompt;                                                 // prompt regex
    std::chrono::seconds timeout{DEFAULT_CMD_TIMEOUT_SECS};             // per read-until call
    std::chrono::seconds prompt_timeout{DEFAULT_PROMPT_TIMEOUT_SECS};   // initial prompt wait
    std::chrono::milliseconds poll_interval{DEFAULT_POLL_MS};           // idle poll quantum
    std::string term_type = DEFAULT_TERM_TYPE;
    int term_width = DEFAULT_TERM_WIDTH;
    int term_height = DEFAULT_TERM_HEIGHT;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
