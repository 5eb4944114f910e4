#include "shell_agent.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>

ShellAgent::ShellAgent(const SessionConfig& config, Connector connector)
    : config_(config), connector_(std::move(connector)) {
    if (!connector_) {
        connector_ = [](const SessionConfig& cfg, StatusCallback cb) {
            return ShellSession::open(cfg, std::move(cb));
        };
    }
}

ShellAgent::~ShellAgent() {
    logout();
}

Result<void> ShellAgent::connect(StatusCallback callback) {
    if (connected_) {
        return Result<void>::Ok();
    }

    // Drop any dead session before replacing it
    if (session_) {
        session_->close();
        session_.reset();
    }

    auto opened = connector_(config_, std::move(callback));
    if (opened.is_err()) {
        sshexpect_log(fmt::format("agent: connect to {} failed: {} ({})",
                                  config_.host, opened.error, status_name(opened.status)));
        return Result<void>::Err(opened.status, opened.error);
    }

    session_ = std::move(opened.value);
    connected_ = true;
    return Result<void>::Ok();
}

void ShellAgent::logout() {
    if (session_) {
        session_->close();
    }
    connected_ = false;
}

Result<void> ShellAgent::send_command_no_wait(const std::string& command) {
    if (!connected_) {
        sshexpect_log("agent: not connected, reconnecting before write");
    }
    auto c = connect();
    if (c.is_err()) {
        return Result<void>::Err(Status::LostConnection,
                                 "Lost connection and unable to re-establish: " + c.error);
    }

    history_.push_back(command);
    auto w = session_->write(command);
    if (w.is_err()) {
        connected_ = false;
        return w;
    }
    return Result<void>::Ok();
}

ReadResult ShellAgent::send_command(const std::string& command) {
    auto sent = send_command_no_wait(command);
    if (sent.is_err()) {
        ReadResult result;
        result.status = Status::LostConnection;
        result.error = sent.error;
        return result;
    }
    auto result = session_->read_until_pattern(config_.prompt, config_.timeout);
    if (result.status == Status::StreamClosed) {
        connected_ = false;
    }
    return result;
}

ReadResult ShellAgent::send_command_strip_command(const std::string& command) {
    auto result = send_command(command);
    if (result.status == Status::LostConnection) {
        return result;
    }
    result.text = strip_command_echo(result.text, command);
    return result;
}

ReadResult ShellAgent::send_command_wait_for_list(const std::string& command,
                                                  const std::vector<std::string>& patterns) {
    auto sent = send_command_no_wait(command);
    if (sent.is_err()) {
        ReadResult result;
        result.status = Status::LostConnection;
        result.error = sent.error;
        return result;
    }

    std::vector<std::string> all = patterns;
    all.push_back(config_.prompt);
    auto result = session_->read_until_any_pattern(all, config_.timeout);
    if (result.status == Status::StreamClosed) {
        connected_ = false;
    }
    return result;
}
