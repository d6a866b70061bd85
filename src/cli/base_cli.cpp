#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI() = default;

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

bool BaseCLI::require_session() {
    if (!registry || session_name.empty() || !registry->find(session_name)) {
        std::cout << theme::fail("Not connected.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Remote",   {"exec", "signal", "monitor"}},
        {"History",  {"history", "records", "sessions"}},
        {"General",  {"help", "quit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::SAND << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::TEAL
                      << fmt::format("    {:<14}", name)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.second
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n" << theme::dim("    Any other line runs as a remote command.") << "\n\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string state;
    if (registry) {
        if (auto session = registry->find(session_name)) {
            state = session_state_name(session->state());
        }
    }

    if (state.empty()) {
        return rl_esc(theme::color::TEAL) + "shellcast"
             + rl_esc(theme::color::RESET) + "> ";
    }
    return rl_esc(theme::color::TEAL) + "shellcast"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::SAND) + session_name
         + rl_esc(theme::color::RESET) + "("
         + rl_esc(state == "ready" ? theme::color::GREEN : theme::color::YELLOW) + state
         + rl_esc(theme::color::RESET) + ")> ";
}
