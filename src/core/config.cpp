#include "config.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

// Builds a Config from a parsed YAML root
class ConfigBuilder {
public:
    static Config build(const YAML::Node& root);
};

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".shellcast";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string()
                                 + ": " + ec.message());
    }

    const char* default_config = R"(# shellcast configuration

# Named SSH targets: shellcast <name>
targets:
  example:
    host: "localhost"
    port: 22
    user: ""
    # password: ""
    # key_path: "~/.ssh/id_ed25519"
    # passphrase: ""

# PS1 forced on the remote shell after connecting, and the template the
# prompt matcher expects. {user}/{host} come from the remote; {cwd} is a
# bounded wildcard.
shell:
  ps1: '[\u@\h \W]$ '
  prompt: '[{user}@{host} {cwd}]$ '
  max_cwd_length: 255

timeouts:
  connect_secs: 10
  init_secs: 15
  command_secs: 15
  drain_secs: 5

exec:
  max_output_bytes: 16777216

history:
  max_command_records: 100

pty:
  term: "xterm"
  cols: 80
  rows: 24

log:
  enabled: true
  # path: "/tmp/shellcast_debug.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        return (platform::home_dir() / path.substr(path.size() > 1 && path[1] == '/' ? 2 : 1)).string();
    }
    return path;
}

static SessionTarget parse_target(const YAML::Node& node) {
    SessionTarget target;
    target.host = node["host"].as<std::string>("");
    target.port = node["port"].as<int>(22);
    target.user = node["user"].as<std::string>("");
    target.password = node["password"].as<std::string>("");
    target.timeout = node["timeout"].as<int>(CONNECT_TIMEOUT_SECS);

    if (node["key_path"]) {
        target.key_path = expand_home(node["key_path"].as<std::string>());
    }
    if (node["passphrase"]) {
        target.passphrase = node["passphrase"].as<std::string>();
    }
    return target;
}

Config ConfigBuilder::build(const YAML::Node& root) {
    Config config;

    if (root["shell"]) {
        const auto& node = root["shell"];
        config.shell_.ps1 = node["ps1"].as<std::string>(DEFAULT_PS1);
        config.shell_.prompt_template = node["prompt"].as<std::string>(DEFAULT_PROMPT_TEMPLATE);
        config.shell_.max_cwd_length = node["max_cwd_length"].as<int>(MAX_CWD_LENGTH);
    }

    if (root["timeouts"]) {
        const auto& node = root["timeouts"];
        config.timeouts_.connect_secs = node["connect_secs"].as<int>(CONNECT_TIMEOUT_SECS);
        config.timeouts_.init_secs = node["init_secs"].as<int>(SHELL_INIT_TIMEOUT_SECS);
        config.timeouts_.command_secs = node["command_secs"].as<int>(CMD_TIMEOUT_SECS);
        config.timeouts_.drain_secs = node["drain_secs"].as<int>(DRAIN_TIMEOUT_SECS);
    }

    if (root["exec"]) {
        config.max_output_bytes_ = root["exec"]["max_output_bytes"].as<std::size_t>(MAX_OUTPUT_BYTES);
    }

    if (root["history"]) {
        config.max_command_records_ =
            root["history"]["max_command_records"].as<int>(MAX_COMMAND_RECORDS);
    }

    if (root["pty"]) {
        const auto& node = root["pty"];
        config.pty_.term = node["term"].as<std::string>(DEFAULT_TERM);
        config.pty_.cols = node["cols"].as<int>(DEFAULT_PTY_COLS);
        config.pty_.rows = node["rows"].as<int>(DEFAULT_PTY_ROWS);
    }

    if (root["log"]) {
        config.log_.enabled = root["log"]["enabled"].as<bool>(true);
        config.log_.path = expand_home(root["log"]["path"].as<std::string>(""));
    }

    if (root["targets"] && root["targets"].IsMap()) {
        for (const auto& kv : root["targets"]) {
            SessionTarget target = parse_target(kv.second);
            // Per-target timeout falls back to the global connect timeout
            if (!kv.second["timeout"]) {
                target.timeout = config.timeouts_.connect_secs;
            }
            config.targets_[kv.first.as<std::string>()] = target;
        }
    }

    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return Result<Config>::Ok(ConfigBuilder::build(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string(), ErrorCode::NotFound);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return Result<Config>::Ok(ConfigBuilder::build(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        // Defaults are usable without a file; targets just come from the command line
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_global_config_path());
}

std::optional<SessionTarget> Config::target(const std::string& name) const {
    auto it = targets_.find(name);
    if (it == targets_.end()) return std::nullopt;
    return it->second;
}

void Config::apply_logging() const {
    set_log_enabled(log_.enabled);
    if (!log_.path.empty()) {
        set_log_path(log_.path);
    }
}
