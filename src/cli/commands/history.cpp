#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void do_history(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;

    auto result = cli.registry->history(cli.session_name);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << result.value << "\n";
}

static void do_records(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;

    auto result = cli.registry->command_records(cli.session_name);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    if (result.value.empty()) {
        std::cout << theme::dim("    No commands yet.") << "\n";
        return;
    }

    std::cout << theme::section("Commands");
    for (const auto& rec : result.value) {
        std::string status = rec.status == "success" ? theme::green(rec.status)
                           : rec.status == "failure" ? theme::yellow(rec.status)
                           : theme::red(rec.status);
        std::cout << fmt::format("    {}  {:<6} {:>6}ms  exit {:<4} ",
                                 to_iso(rec.started_at), command_source_name(rec.source),
                                 rec.duration_ms, rec.exit_code)
                  << status << "  " << rec.command << "\n";
    }
    std::cout << "\n";
}

static void do_sessions(BaseCLI& cli, const std::string&) {
    if (!cli.registry) {
        std::cout << theme::fail("Not connected.");
        return;
    }

    std::cout << theme::section("Sessions");
    for (const auto& s : cli.registry->list_sessions()) {
        std::cout << theme::kv(s.name, fmt::format("{}@{}  {}  since {}", s.user, s.host,
                                                   session_state_name(s.status),
                                                   to_iso(s.created_at)));
        if (!s.error.empty()) {
            std::cout << theme::fail(s.error);
        }
    }
    std::cout << "\n";
}

void register_history_commands(BaseCLI& cli) {
    cli.add_command("history", do_history, "Print the full terminal history");
    cli.add_command("records", do_records, "List executed commands with status");
    cli.add_command("sessions", do_sessions, "List open sessions");
}
