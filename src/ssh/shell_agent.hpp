#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "shell_session.hpp"

// Command-level driver over a ShellSession: tracks whether the session is
// connected, reconnects once before a write if it isn't, and keeps a history
// of the commands it sent.
//
// Not thread-safe: one caller at a time per agent.
class ShellAgent {
public:
    using Connector = std::function<Result<std::unique_ptr<ShellSession>>(
        const SessionConfig&, StatusCallback)>;

    // `connector` defaults to ShellSession::open (SSH).
    explicit ShellAgent(const SessionConfig& config, Connector connector = nullptr);
    ~ShellAgent();

    // Open the session unless already connected.
    Result<void> connect(StatusCallback callback = nullptr);

    // Close the session and clear the connected flag.
    void logout();

    // Write the command, don't wait. LostConnection if reconnecting fails.
    Result<void> send_command_no_wait(const std::string& command);

    // Write the command and read until the prompt.
    ReadResult send_command(const std::string& command);

    // send_command with the echoed command line removed from the output.
    ReadResult send_command_strip_command(const std::string& command);

    // Write the command and read until one of `patterns` or the prompt.
    ReadResult send_command_wait_for_list(const std::string& command,
                                          const std::vector<std::string>& patterns);

    void set_connected(bool connected) { connected_ = connected; }
    bool connected() const { return connected_; }

    const std::vector<std::string>& history() const { return history_; }
    const SessionConfig& config() const { return config_; }

    // Null until the first successful connect.
    ShellSession* session() { return session_.get(); }

private:
    SessionConfig config_;
    Connector connector_;
    std::unique_ptr<ShellSession> session_;
    bool connected_ = false;
    std::vector<std::string> history_;
};
