#pragma once

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Connection profiles loaded from YAML:
//
//   log_file: /tmp/sshexpect.log
//   defaults: { port: 22, timeout: 30, prompt: '[$#>] ?$' }
//   profiles:
//     lab:
//       host: 10.0.0.5
//       user: admin
//       password: secret          # or ssh_key: ~/.ssh/id_ed25519
//       prompt: '\$ $'
//       terminal: { type: vt220, width: 500, height: 40 }
class Config {
public:
    Config() = default;

    // Load from a file (default: ~/.sshexpect/config.yaml)
    static Result<Config> load(const fs::path& path = default_config_path());

    // Parse YAML text directly
    static Result<Config> from_string(const std::string& yaml);

    // Resolve a profile: defaults overlaid by the profile's own keys.
    // Errors on unknown names, a missing host, a prompt that doesn't
    // compile, or a non-positive timeout or poll interval.
    Result<SessionConfig> profile(const std::string& name) const;

    std::vector<std::string> profile_names() const;
    bool has_profile(const std::string& name) const { return profiles_.count(name) > 0; }

    std::optional<std::string> log_file() const { return log_file_; }
    const fs::path& source_path() const { return source_path_; }

    static fs::path default_config_path();

private:
    SessionConfig defaults_;
    std::map<std::string, SessionConfig> profiles_;
    std::optional<std::string> log_file_;
    fs::path source_path_;
};
