#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    if (arg.empty()) {
        std::cout << "Usage: exec <command>\n";
        return;
    }

    auto result = cli.registry->exec(cli.session_name, arg, std::nullopt, CommandSource::User);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("{}: {}", error_code_name(result.code), result.error));
        if (result.code == ErrorCode::Timeout) {
            std::cout << theme::step("The command may still be running. Try 'signal SIGINT'.");
        }
        return;
    }

    std::cout << result.value.stdout_data << std::flush;
    if (result.value.exit_code != 0) {
        std::cout << theme::dim(fmt::format("    exit {} ({}ms)", result.value.exit_code,
                                            result.value.duration_ms)) << "\n";
    }
}

static void do_signal(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    std::string sig = arg.empty() ? "SIGINT" : arg;

    auto result = cli.registry->send_signal(cli.session_name, sig);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::step("Supported: SIGINT, SIGTERM, SIGQUIT, SIGTSTP");
        return;
    }
    std::cout << theme::ok("Sent " + sig);
}

// Print the replay, then live output until the shell is idle again
static void do_monitor(BaseCLI& cli, const std::string&) {
    if (!cli.require_session()) return;

    auto session = cli.registry->find(cli.session_name);
    auto observer = cli.registry->attach_monitor(cli.session_name);
    if (observer.is_err()) {
        std::cout << theme::fail(observer.error);
        return;
    }

    std::cout << theme::section("Monitor");
    std::size_t replay_size = session->history().size();

    while (true) {
        auto ev = observer.value.next(std::chrono::milliseconds(500));
        if (ev.type == ObserverEvent::Type::End) {
            std::cout << "\n" << theme::info(ev.error.empty() ? "Session closed"
                                                              : "Session failed: " + ev.error);
            break;
        }
        if (ev.type == ObserverEvent::Type::Idle) {
            if (observer.value.cursor() >= replay_size &&
                session->state() != SessionState::Executing) {
                break;
            }
            continue;
        }

        std::cout << ev.chunk.data << std::flush;
        if (ev.chunk.sequence >= replay_size && ev.chunk.prompt_boundary &&
            session->state() != SessionState::Executing) {
            break;
        }
    }
    std::cout << "\n" << theme::dim(fmt::format("    {} chunks", observer.value.cursor())) << "\n";
}

void register_remote_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a command on the remote shell");
    cli.add_command("signal", do_signal, "Send SIGINT/SIGTERM/SIGQUIT/SIGTSTP to the shell");
    cli.add_command("monitor", do_monitor, "Replay history, then follow live output");
}
