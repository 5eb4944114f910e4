#include "shell_session.hpp"
#include "session.hpp"
#include "channel_stream.hpp"
#include <core/log.hpp>

ShellSession::ShellSession(std::unique_ptr<Stream> stream, const SessionConfig& config)
    : config_(config),
      stream_(std::move(stream)),
      channel_(std::make_shared<HandoffChannel>()),
      buffer_(channel_),
      matcher_(buffer_),
      reader_(*stream_, channel_),
      open_(true) {
    buffer_.set_poll_quantum(config_.poll_interval);
    reader_.start();
}

ShellSession::~ShellSession() {
    close();
}

Result<std::unique_ptr<ShellSession>> ShellSession::open(const SessionConfig& config,
                                                         StatusCallback callback) {
    using SessionResult = Result<std::unique_ptr<ShellSession>>;

    auto transport = std::make_unique<SessionManager>(config);
    auto established = transport->establish(callback);
    if (established.is_err()) {
        return SessionResult::Err(Status::ConnectionFailed, established.error);
    }

    auto stream = std::make_unique<ChannelStream>(transport->channel(), transport->io_mutex(),
                                                  transport->socket());
    auto session = std::make_unique<ShellSession>(std::move(stream), config);
    session->transport_ = std::move(transport);

    if (callback) callback("Waiting for prompt...");
    auto prompt = session->wait_for_prompt();
    if (prompt.is_err()) {
        session->close();
        return SessionResult::Err(prompt.status, prompt.error);
    }

    return SessionResult::Ok(std::move(session));
}

Result<void> ShellSession::wait_for_prompt() {
    auto result = matcher_.read_until_regex(config_.prompt, config_.prompt_timeout);
    if (result.status == Status::InvalidPattern) {
        return Result<void>::Err(Status::InvalidPattern, result.error);
    }
    if (!result.matched()) {
        std::string msg = result.text.empty()
            ? "Shell prompt not detected (no output received)"
            : "Shell prompt not detected: " + result.text.substr(0, LOG_PREVIEW_CHARS);
        sshexpect_log("session: " + log_preview(msg));
        return Result<void>::Err(Status::PromptNotFound, msg);
    }
    sshexpect_log("session: prompt detected: " + log_preview(result.text));
    return Result<void>::Ok();
}

Result<void> ShellSession::write(const std::string& text) {
    if (!open_) {
        return Result<void>::Err(Status::LostConnection, "Session is closed");
    }
    if (!write_all(*stream_, text + "\n")) {
        sshexpect_log("session: write failed for '" + log_preview(text) + "'");
        return Result<void>::Err(Status::LostConnection, "Failed to write to stream");
    }
    return Result<void>::Ok();
}

ReadResult ShellSession::read_until(const std::string& literal,
                                    std::chrono::milliseconds timeout) {
    return matcher_.read_until(literal, timeout);
}

ReadResult ShellSession::read_until_pattern(const std::string& pattern,
                                            std::chrono::milliseconds timeout) {
    return matcher_.read_until_regex(pattern, timeout);
}

ReadResult ShellSession::read_until_any_pattern(const std::vector<std::string>& patterns,
                                                std::chrono::milliseconds timeout) {
    return matcher_.read_until_any(patterns, timeout);
}

static ReadResult write_failure(const Result<void>& w) {
    ReadResult result;
    result.status = w.status;
    result.error = w.error;
    return result;
}

ReadResult ShellSession::write_then_read_until(const std::string& send,
                                               const std::string& literal,
                                               std::chrono::milliseconds timeout) {
    auto w = write(send);
    if (w.is_err()) return write_failure(w);
    return read_until(literal, timeout);
}

ReadResult ShellSession::send_command(const std::string& cmd) {
    auto w = write(cmd);
    if (w.is_err()) return write_failure(w);
    return read_until_pattern(config_.prompt, config_.timeout);
}

ReadResult ShellSession::send_command_wait_for_list(const std::string& cmd,
                                                    std::vector<std::string> patterns) {
    auto w = write(cmd);
    if (w.is_err()) return write_failure(w);
    patterns.push_back(config_.prompt);
    return read_until_any_pattern(patterns, config_.timeout);
}

bool ShellSession::alive() {
    if (!open_ || reader_stopped()) return false;
    return !transport_ || transport_->check_alive();
}

void ShellSession::close() {
    if (!open_) return;
    open_ = false;

    // Unblock the reader's read, then join it, then free the channel
    stream_->close();
    reader_.stop();
    if (transport_) {
        transport_->close();
    }
}
