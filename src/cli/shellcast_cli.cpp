#include "shellcast_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <termios.h>
#include <unistd.h>
#include <cstdlib>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/ssh_channel.hpp>
#include <readline/readline.h>
#include <readline/history.h>

// Password prompt with terminal echo off
static std::string read_password(const std::string& prompt) {
    std::cout << prompt << std::flush;

    struct termios oldt, newt;
    bool tty = tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (tty) {
        newt = oldt;
        newt.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }

    std::string password;
    std::getline(std::cin, password);

    if (tty) tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    std::cout << "\n";
    return password;
}

ShellcastCLI::ShellcastCLI() : BaseCLI() {
    register_all_commands();
}

void ShellcastCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI&, const std::string&) {
        std::cout << theme::dim("    Disconnecting...") << "\n";
        quit_ = true;
    }, "Disconnect and exit");

    register_remote_commands(*this);
    register_history_commands(*this);
}

bool ShellcastCLI::load_config(const std::string& path) {
    auto result = path.empty() ? Config::load_global() : Config::load_file(path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config = result.value;
    config.apply_logging();
    return true;
}

std::optional<SessionTarget> ShellcastCLI::resolve_target(const std::string& target) {
    if (auto named = config.target(target)) {
        return named;
    }

    // user@host[:port]
    auto at = target.find('@');
    if (at == std::string::npos || at == 0 || at + 1 == target.size()) {
        std::cout << theme::fail("Unknown target: " + target);
        std::cout << theme::step("Use a name from " + get_global_config_path().string()
                                 + " or user@host[:port].");
        return std::nullopt;
    }

    SessionTarget t;
    t.user = target.substr(0, at);
    t.host = target.substr(at + 1);
    t.timeout = config.timeouts().connect_secs;
    auto colon = t.host.rfind(':');
    if (colon != std::string::npos) {
        t.port = safe_stoi(t.host.substr(colon + 1), 22);
        t.host = t.host.substr(0, colon);
    }
    t.password = read_password(fmt::format("    Password for {}@{}: ", t.user, t.host));
    return t;
}

void ShellcastCLI::run_connected_repl(const std::string& target_arg) {
    std::cout << theme::banner(SHELLCAST_VERSION);

    auto target = resolve_target(target_arg);
    if (!target) return;

    // Session names may not contain '@' or spaces
    std::string name = config.target(target_arg) ? target_arg : target->host;

    registry = std::make_unique<SessionRegistry>(SshChannel::opener(config.pty()),
                                                 SessionOptions::from_config(config));
    auto init = registry->init();
    if (init.is_err()) {
        std::cout << theme::fail(init.error);
        return;
    }

    std::cout << theme::section("Connecting");
    auto callback = [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    };

    auto connected = registry->connect(name, *target, callback);
    if (connected.is_err()) {
        std::cout << theme::fail("Connection failed: " + connected.error);
        registry->shutdown();
        return;
    }
    session_name = name;

    std::cout << theme::ok("Shell is ready");
    std::cout << theme::section("Connected");
    std::cout << theme::kv("Session", name);
    std::cout << theme::kv("Host", connected.value.host);
    std::cout << theme::kv("User", connected.value.user);
    std::cout << theme::kv("Log", shellcast_log_path());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_) {
        auto session = registry->find(session_name);
        if (!session || session->state() == SessionState::Failed) {
            std::cout << "\n" << theme::divider();
            std::cout << theme::fail("Connection to remote shell lost.");
            if (session) std::cout << theme::dim("    " + session->info().error) << "\n";
            std::cout << "\n";
            break;
        }

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        trim(line);
        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        // Anything that is not a REPL command goes to the remote shell
        if (has_command(command)) {
            execute_command(command, args);
        } else {
            execute_command("exec", line);
        }
    }

    registry->shutdown();
    registry.reset();
}
