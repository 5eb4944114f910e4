#include <iostream>
#include <vector>
#include <string>
#include "cli/shell_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/log.hpp>

static const char* VERSION = "0.2.0";

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sshexpect "
              << theme::color::RESET << theme::color::BROWN << "PROFILE"
              << theme::color::RESET << theme::color::DIM
              << "              Open an interactive session" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshexpect "
              << theme::color::RESET << theme::color::BROWN << "PROFILE -c CMD..."
              << theme::color::RESET << theme::color::DIM
              << "     Run commands and exit" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshexpect --list"
              << theme::color::RESET << theme::color::DIM
              << "               List configured profiles" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config PATH         Profile file (default ~/.sshexpect/config.yaml)\n"
              << "    --version             Show version\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        fs::path config_path = Config::default_config_path();
        std::string profile;
        std::vector<std::string> commands;
        bool list = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "sshexpect"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--list") {
                list = true;
            } else if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("--config needs a path");
                    return 1;
                }
                config_path = argv[++i];
            } else if (arg == "-c") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("-c needs a command");
                    return 1;
                }
                commands.push_back(argv[++i]);
            } else if (profile.empty() && !arg.empty() && arg[0] != '-') {
                profile = arg;
            } else {
                std::cout << theme::fail("Unknown argument: " + arg);
                print_usage();
                return 1;
            }
        }

        auto config = Config::load(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }
        if (config.value.log_file()) {
            set_log_path(*config.value.log_file());
        }

        if (list) {
            std::cout << theme::section("Profiles");
            for (const auto& name : config.value.profile_names()) {
                auto p = config.value.profile(name);
                std::cout << theme::kv(name, p.is_ok()
                    ? fmt::format("{}@{}:{}", p.value.user, p.value.host, p.value.port)
                    : theme::red(p.error));
            }
            std::cout << "\n";
            return 0;
        }

        if (profile.empty()) {
            std::cout << theme::fail("Missing profile name.");
            print_usage();
            return 1;
        }

        auto session_config = config.value.profile(profile);
        if (session_config.is_err()) {
            std::cout << theme::fail(session_config.error);
            return 1;
        }

        ShellCLI cli(session_config.value, profile);
        if (!commands.empty()) {
            return cli.run_batch(commands);
        }
        cli.run_repl();
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
