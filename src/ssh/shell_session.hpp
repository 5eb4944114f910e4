#pragma once

#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <core/types.hpp>
#include "stream.hpp"
#include "handoff_channel.hpp"
#include "stream_reader.hpp"
#include "buffered_matcher.hpp"
#include "expect.hpp"

class SessionManager;

// One interactive shell: the duplex stream, its reader thread, and the
// receive buffer the match engine consumes from.
//
//   auto opened = ShellSession::open(config);
//   if (opened.is_err()) ...;
//   auto& sh = *opened.value;
//   auto r = sh.send_command("uname -a");   // r.text ends at the prompt
//
// One caller at a time: read-until calls, writes and close() must not run
// concurrently on the same session.
class ShellSession {
public:
    // Wrap an already-established stream and start reading it.
    ShellSession(std::unique_ptr<Stream> stream, const SessionConfig& config);
    ~ShellSession();

    // Connect over SSH, start the shell and wait for the first prompt.
    // ConnectionFailed on transport/auth errors, PromptNotFound if the
    // prompt regex isn't seen within config.prompt_timeout.
    static Result<std::unique_ptr<ShellSession>> open(const SessionConfig& config,
                                                      StatusCallback callback = nullptr);

    // Consume everything up to and including the first prompt.
    Result<void> wait_for_prompt();

    // Send `text` followed by a newline. LostConnection if closed or the
    // write fails.
    Result<void> write(const std::string& text);

    ReadResult read_until(const std::string& literal, std::chrono::milliseconds timeout);
    ReadResult read_until_pattern(const std::string& pattern, std::chrono::milliseconds timeout);
    ReadResult read_until_any_pattern(const std::vector<std::string>& patterns,
                                      std::chrono::milliseconds timeout);

    // write(send) then read_until(literal).
    ReadResult write_then_read_until(const std::string& send, const std::string& literal,
                                     std::chrono::milliseconds timeout);

    // write(cmd) then read until the prompt, using config.timeout.
    ReadResult send_command(const std::string& cmd);

    // write(cmd) then read until any of `patterns` or the prompt. The
    // caller's patterns take precedence over the prompt.
    ReadResult send_command_wait_for_list(const std::string& cmd,
                                          std::vector<std::string> patterns);

    // Idempotent. Stops the reader and tears down the transport.
    void close();
    bool is_open() const { return open_; }

    // Background reader has exited (remote closed or errored).
    bool reader_stopped() const { return !reader_.running(); }

    // Open, reader still running and, over SSH, the transport answers a
    // keepalive.
    bool alive();

    const SessionConfig& config() const { return config_; }
    const std::string& buffer() const { return buffer_.buffer(); }

    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

private:
    SessionConfig config_;
    std::unique_ptr<SessionManager> transport_;   // null for injected streams
    std::unique_ptr<Stream> stream_;
    std::shared_ptr<HandoffChannel> channel_;
    BufferedMatcher buffer_;
    ExpectMatcher matcher_;
    StreamReader reader_;
    bool open_;
};
