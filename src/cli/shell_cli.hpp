#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <vector>
#include <chrono>
#include <core/config.hpp>
#include <ssh/shell_agent.hpp>

// Interactive front end over a ShellAgent. Plain lines go to the remote
// shell; lines starting with ':' are handled locally.
class ShellCLI {
public:
    ShellCLI(const SessionConfig& config, const std::string& profile_name,
             ShellAgent::Connector connector = nullptr);

    using CommandHandler = std::function<void(ShellCLI&, const std::string&)>;

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& help);

    // Connect and print progress. False if the session could not be opened.
    bool connect();

    // readline loop until EOF or :quit.
    void run_repl();

    // Run each command in turn; returns the process exit code (0 if every
    // command saw the prompt).
    int run_batch(const std::vector<std::string>& commands);

    // Handle one REPL line (meta-command or remote command).
    void execute_line(const std::string& line);

    void print_help() const;
    void print_result(const ReadResult& result) const;

    ShellAgent& agent() { return agent_; }

private:
    std::string profile_name_;
    ShellAgent agent_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::vector<std::string> pending_patterns_;   // set by :expect
    std::chrono::milliseconds read_timeout_;      // for :read
    bool quit_ = false;

    void register_commands();
    std::string prompt_string() const;
};
