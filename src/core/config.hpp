#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <map>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Prompt forcing and matching
struct ShellConfig {
    std::string ps1 = DEFAULT_PS1;
    std::string prompt_template = DEFAULT_PROMPT_TEMPLATE;
    int max_cwd_length = MAX_CWD_LENGTH;
};

struct TimeoutConfig {
    int connect_secs = CONNECT_TIMEOUT_SECS;
    int init_secs = SHELL_INIT_TIMEOUT_SECS;
    int command_secs = CMD_TIMEOUT_SECS;
    int drain_secs = DRAIN_TIMEOUT_SECS;
};

struct PtyConfig {
    std::string term = DEFAULT_TERM;
    int cols = DEFAULT_PTY_COLS;
    int rows = DEFAULT_PTY_ROWS;
};

struct LogConfig {
    bool enabled = true;
    std::string path;                  // empty = <temp>/shellcast_debug.log
};

class Config {
public:
    // Load ~/.shellcast/config.yaml
    static Result<Config> load_global();

    // Load an explicit file
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (missing keys keep their defaults)
    static Result<Config> parse(const std::string& yaml_text);

    const ShellConfig& shell() const { return shell_; }
    const TimeoutConfig& timeouts() const { return timeouts_; }
    const PtyConfig& pty() const { return pty_; }
    const LogConfig& log() const { return log_; }
    std::size_t max_output_bytes() const { return max_output_bytes_; }
    int max_command_records() const { return max_command_records_; }
    const std::map<std::string, SessionTarget>& targets() const { return targets_; }

    std::optional<SessionTarget> target(const std::string& name) const;

    // Apply log settings to the process-wide logger
    void apply_logging() const;

public:
    Config() = default;

private:
    ShellConfig shell_;
    TimeoutConfig timeouts_;
    PtyConfig pty_;
    LogConfig log_;
    std::size_t max_output_bytes_ = MAX_OUTPUT_BYTES;
    int max_command_records_ = MAX_COMMAND_RECORDS;
    std::map<std::string, SessionTarget> targets_;

    friend class ConfigBuilder;
};

bool global_config_exists();
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config (no-op when one exists)
Result<void> create_default_config();
