#pragma once

#include "base_cli.hpp"
#include <optional>
#include <string>

// Command registration
void register_remote_commands(BaseCLI& cli);
void register_history_commands(BaseCLI& cli);

class ShellcastCLI : public BaseCLI {
public:
    ShellcastCLI();

    // Load config (explicit path or ~/.shellcast/config.yaml)
    bool load_config(const std::string& path = "");

    // Connect `target` (config name or user@host[:port]) and run the REPL
    void run_connected_repl(const std::string& target);

private:
    void register_all_commands();
    std::optional<SessionTarget> resolve_target(const std::string& target);

    bool quit_ = false;
};
