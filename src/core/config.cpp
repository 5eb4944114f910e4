#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <re2/re2.h>

namespace fs = std::filesystem;

// Overlay the keys present in `node` onto `cfg`. Absent keys keep the
// incoming value, so profiles inherit from `defaults`.
static void overlay_session(const YAML::Node& node, SessionConfig& cfg) {
    if (node["host"])     cfg.host = node["host"].as<std::string>();
    if (node["port"])     cfg.port = node["port"].as<int>();
    if (node["user"])     cfg.user = node["user"].as<std::string>();
    if (node["password"]) cfg.password = node["password"].as<std::string>();
    if (node["prompt"])   cfg.prompt = node["prompt"].as<std::string>();

    auto key_node = node["ssh_key"] ? node["ssh_key"] : node["ssh_key_path"];
    if (key_node) {
        cfg.ssh_key_path = key_node.as<std::string>();
    }

    if (node["timeout"]) {
        cfg.timeout = std::chrono::seconds(node["timeout"].as<int>());
    }
    if (node["prompt_timeout"]) {
        cfg.prompt_timeout = std::chrono::seconds(node["prompt_timeout"].as<int>());
    }
    if (node["poll_ms"]) {
        cfg.poll_interval = std::chrono::milliseconds(node["poll_ms"].as<int>());
    }

    const auto& term = node["terminal"];
    if (term && term.IsMap()) {
        if (term["type"])   cfg.term_type = term["type"].as<std::string>();
        if (term["width"])  cfg.term_width = term["width"].as<int>();
        if (term["height"]) cfg.term_height = term["height"].as<int>();
    }
}

fs::path Config::default_config_path() {
    return platform::home_dir() / ".sshexpect" / "config.yaml";
}

static Result<void> parse_config(const YAML::Node& root, SessionConfig& defaults,
                                 std::map<std::string, SessionConfig>& profiles,
                                 std::optional<std::string>& log_file) {
    if (!root || root.IsNull()) {
        return Result<void>::Ok();
    }
    if (!root.IsMap()) {
        return Result<void>::Err(Status::InvalidConfig, "Config root must be a mapping");
    }

    if (root["log_file"]) {
        log_file = platform::expand_user(root["log_file"].as<std::string>()).string();
    }

    const auto& defaults_node = root["defaults"];
    if (defaults_node) {
        if (!defaults_node.IsMap()) {
            return Result<void>::Err(Status::InvalidConfig, "'defaults' must be a mapping");
        }
        overlay_session(defaults_node, defaults);
    }

    const auto& profiles_node = root["profiles"];
    if (profiles_node) {
        if (!profiles_node.IsMap()) {
            return Result<void>::Err(Status::InvalidConfig, "'profiles' must be a mapping");
        }
        for (const auto& kv : profiles_node) {
            std::string name = kv.first.as<std::string>();
            if (!kv.second.IsMap()) {
                return Result<void>::Err(Status::InvalidConfig,
                    fmt::format("Profile '{}' must be a mapping", name));
            }
            SessionConfig cfg = defaults;
            overlay_session(kv.second, cfg);
            profiles[name] = cfg;
        }
    }

    return Result<void>::Ok();
}

Result<Config> Config::from_string(const std::string& yaml) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml);
        auto parsed = parse_config(root, config.defaults_, config.profiles_, config.log_file_);
        if (parsed.is_err()) return Result<Config>::Err(parsed.status, parsed.error);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(Status::InvalidConfig,
                                   fmt::format("Invalid config: {}", e.what()));
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(Status::InvalidConfig,
                                   "Config file not found: " + path.string());
    }

    Config config;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto parsed = parse_config(root, config.defaults_, config.profiles_, config.log_file_);
        if (parsed.is_err()) return Result<Config>::Err(parsed.status, parsed.error);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(Status::InvalidConfig,
                                   fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
    config.source_path_ = path;
    return Result<Config>::Ok(config);
}

Result<SessionConfig> Config::profile(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        return Result<SessionConfig>::Err(Status::InvalidConfig,
                                          fmt::format("Unknown profile '{}'", name));
    }

    const SessionConfig& cfg = it->second;
    if (cfg.host.empty()) {
        return Result<SessionConfig>::Err(Status::InvalidConfig,
                                          fmt::format("Profile '{}' has no host", name));
    }
    if (cfg.prompt.empty()) {
        return Result<SessionConfig>::Err(Status::InvalidPattern,
                                          fmt::format("Profile '{}' has no prompt", name));
    }
    RE2::Options options;
    options.set_log_errors(false);
    RE2 check(cfg.prompt, options);
    if (!check.ok()) {
        return Result<SessionConfig>::Err(Status::InvalidPattern,
            fmt::format("Profile '{}' prompt '{}' is not a valid regex: {}",
                        name, cfg.prompt, check.error()));
    }
    if (cfg.timeout.count() <= 0) {
        return Result<SessionConfig>::Err(Status::InvalidConfig,
            fmt::format("Profile '{}' timeout must be positive (got {})", name,
                        cfg.timeout.count()));
    }
    if (cfg.prompt_timeout.count() < 0) {
        return Result<SessionConfig>::Err(Status::InvalidConfig,
            fmt::format("Profile '{}' prompt_timeout must not be negative (got {})", name,
                        cfg.prompt_timeout.count()));
    }
    if (cfg.poll_interval.count() <= 0) {
        return Result<SessionConfig>::Err(Status::InvalidConfig,
            fmt::format("Profile '{}' poll_ms must be positive (got {})", name,
                        cfg.poll_interval.count()));
    }
    return Result<SessionConfig>::Ok(cfg);
}

std::vector<std::string> Config::profile_names() const {
    std::vector<std::string> names;
    for (const auto& kv : profiles_) {
        names.push_back(kv.first);
    }
    return names;
}
