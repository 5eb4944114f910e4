#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <chrono>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// SSH transport for one interactive shell: TCP connect, handshake,
// authentication, session channel, PTY and shell. Owns every libssh2
// handle and the socket; close() releases them in reverse order.
class SessionManager {
public:
    explicit SessionManager(const SessionConfig& config);
    ~SessionManager();

    // Status::ConnectionFailed with a readable message on any failure.
    Result<void> establish(StatusCallback callback = nullptr);
    void close();
    // Send a keepalive and probe the socket and channel for EOF.
    bool check_alive();

    LIBSSH2_CHANNEL* channel() { return channel_; }
    socket_t socket() const { return sock_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

private:
    SessionConfig config_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;
    socket_t sock_;
    bool active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    Result<void> fail(const std::string& reason, const std::string& message);
    Result<void> userauth(StatusCallback callback);
    Result<void> open_shell(StatusCallback callback);
};

// TCP connect budget for `timeout`, clamped to what poll() accepts.
int connect_budget_ms(std::chrono::seconds timeout);
