#include "shell_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

ShellCLI::ShellCLI(const SessionConfig& config, const std::string& profile_name,
                   ShellAgent::Connector connector)
    : profile_name_(profile_name), agent_(config, std::move(connector)),
      read_timeout_(config.timeout) {
    register_commands();
}

void ShellCLI::add_command(const std::string& name, CommandHandler handler,
                           const std::string& help) {
    commands_[name] = {handler, help};
}

void ShellCLI::register_commands() {
    add_command("help", [](ShellCLI& cli, const std::string&) {
        cli.print_help();
    }, "Show this help message");

    add_command("quit", [](ShellCLI& cli, const std::string&) {
        std::cout << theme::dim("Disconnecting...") << "\n";
        cli.quit_ = true;
    }, "Close the session and exit");

    add_command("history", [](ShellCLI& cli, const std::string&) {
        const auto& hist = cli.agent().history();
        if (hist.empty()) {
            std::cout << theme::dim("    (no commands sent)") << "\n";
            return;
        }
        for (size_t i = 0; i < hist.size(); ++i) {
            std::cout << theme::dim(fmt::format("  {:>4}  ", i + 1)) << hist[i] << "\n";
        }
    }, "List commands sent this session");

    add_command("expect", [](ShellCLI& cli, const std::string& args) {
        auto patterns = StringUtils::split_words(args);
        if (patterns.empty()) {
            cli.pending_patterns_.clear();
            std::cout << theme::info("Extra patterns cleared");
            return;
        }
        cli.pending_patterns_ = patterns;
        std::cout << theme::info(fmt::format("Next command also stops on {} pattern(s)",
                                             patterns.size()));
    }, "REGEX...  next command also stops on these patterns");

    add_command("timeout", [](ShellCLI& cli, const std::string& args) {
        int secs = safe_stoi(StringUtils::trim(args), -1);
        if (secs <= 0) {
            std::cout << theme::fail("Usage: :timeout SECONDS");
            return;
        }
        // Commands keep the profile timeout
        cli.read_timeout_ = std::chrono::seconds(secs);
        std::cout << theme::info(fmt::format("Read timeout for :read set to {}s", secs));
    }, "SECONDS  timeout for :read");

    add_command("raw", [](ShellCLI& cli, const std::string& args) {
        auto sent = cli.agent().send_command_no_wait(args);
        if (sent.is_err()) {
            std::cout << theme::fail(sent.error);
        }
    }, "TEXT  send a line without waiting for output");

    add_command("read", [](ShellCLI& cli, const std::string& args) {
        auto* session = cli.agent().session();
        if (!session || !cli.agent().connected()) {
            std::cout << theme::fail("Not connected.");
            return;
        }
        std::string pattern = args.empty() ? cli.agent().config().prompt : args;
        cli.print_result(session->read_until_pattern(pattern, cli.read_timeout_));
    }, "[REGEX]  read until REGEX (default: prompt)");

    add_command("status", [](ShellCLI& cli, const std::string&) {
        const auto& cfg = cli.agent().config();
        std::cout << theme::kv("Profile", cli.profile_name_);
        std::cout << theme::kv("Target", fmt::format("{}@{}:{}", cfg.user, cfg.host, cfg.port));
        std::cout << theme::kv("Prompt", cfg.prompt);
        std::cout << theme::kv("Timeout", fmt::format("{}s", cfg.timeout.count()));
        auto* session = cli.agent().session();
        std::string state = !cli.agent().connected() ? "disconnected"
                          : (session && session->alive()) ? "connected" : "unresponsive";
        std::cout << theme::kv("State", state);
        std::cout << theme::kv("Log", log_path());
    }, "Show connection details");
}

bool ShellCLI::connect() {
    auto callback = [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    };

    auto result = agent_.connect(callback);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("{}: {}", status_name(result.status), result.error));
        return false;
    }
    std::cout << theme::ok("Connected");
    return true;
}

void ShellCLI::print_result(const ReadResult& result) const {
    std::cout << result.text;
    if (!result.text.empty() && result.text.back() != '\n') {
        std::cout << "\n";
    }
    if (!result.matched()) {
        std::cout << theme::fail(fmt::format("{}: {}", status_name(result.status), result.error));
    } else if (result.pattern_index > 0) {
        std::cout << theme::log(fmt::format("matched pattern #{}", result.pattern_index));
    }
}

void ShellCLI::execute_line(const std::string& line) {
    if (!line.empty() && line[0] == ':') {
        auto space = line.find(' ');
        std::string name = line.substr(1, space == std::string::npos ? std::string::npos : space - 1);
        std::string args = space == std::string::npos ? "" : line.substr(space + 1);

        auto it = commands_.find(name);
        if (it == commands_.end()) {
            std::cout << theme::fail("Unknown command: :" + name);
            std::cout << theme::step("Type ':help' for available commands.");
            return;
        }
        it->second.first(*this, args);
        return;
    }

    ReadResult result;
    if (!pending_patterns_.empty()) {
        result = agent_.send_command_wait_for_list(line, pending_patterns_);
        result.text = strip_command_echo(result.text, line);
        pending_patterns_.clear();
    } else {
        result = agent_.send_command_strip_command(line);
    }
    print_result(result);
}

void ShellCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::color::BLUE
                  << fmt::format("    :{:<12}", name)
                  << theme::color::RESET
                  << theme::color::DIM
                  << entry.second
                  << theme::color::RESET << "\n";
    }
    std::cout << theme::dim("    Any other line is sent to the remote shell.") << "\n\n";
}

std::string ShellCLI::prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };
    const char* state_color = agent_.connected() ? theme::color::GREEN.c_str()
                                                 : theme::color::RED.c_str();
    return rl_esc(theme::color::BROWN) + "sshexpect"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(state_color) + profile_name_
         + rl_esc(theme::color::RESET) + "> ";
}

void ShellCLI::run_repl() {
    const auto& cfg = agent_.config();
    std::cout << theme::banner(fmt::format("{}@{}", cfg.user, cfg.host));

    if (!connect()) {
        return;
    }
    std::cout << theme::dim("    Type ':help' for commands, ':quit' to exit.") << "\n\n";

    while (!quit_) {
        std::string prompt = prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        std::string line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }
        add_history(line.c_str());

        execute_line(line);
    }

    agent_.logout();
}

int ShellCLI::run_batch(const std::vector<std::string>& commands) {
    if (!connect()) {
        return 2;
    }

    int exit_code = 0;
    for (const auto& cmd : commands) {
        auto result = agent_.send_command_strip_command(cmd);
        print_result(result);
        if (!result.matched()) {
            exit_code = 1;
            if (result.status == Status::LostConnection || result.status == Status::StreamClosed) {
                break;
            }
        }
    }

    agent_.logout();
    return exit_code;
}
