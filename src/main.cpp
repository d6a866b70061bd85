#include <iostream>
#include <vector>
#include <string>
#include "cli/shellcast_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner(SHELLCAST_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    shellcast "
              << theme::color::RESET << theme::color::SAND << "<target>"
              << theme::color::RESET << theme::color::DIM
              << "          Connect a configured target" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    shellcast "
              << theme::color::RESET << theme::color::SAND << "user@host[:port]"
              << theme::color::RESET << theme::color::DIM
              << "  Connect with a password" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    shellcast init"
              << theme::color::RESET << theme::color::DIM
              << "              Write ~/.shellcast/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <path>         Use another config file\n"
              << "    shellcast --version     Show version\n"
              << "    shellcast --help        Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        std::string config_path;
        for (std::size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--config") {
                if (i + 1 >= args.size()) {
                    std::cout << theme::fail("--config needs a path.");
                    return 1;
                }
                config_path = args[i + 1];
                args.erase(args.begin() + static_cast<std::ptrdiff_t>(i),
                           args.begin() + static_cast<std::ptrdiff_t>(i) + 2);
                break;
            }
        }

        if (args.empty() || args[0] == "--help") {
            print_usage();
            return args.empty() ? 1 : 0;
        }

        std::string cmd = args[0];
        if (cmd == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "shellcast"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << SHELLCAST_VERSION << theme::color::RESET << "\n";
            return 0;
        }

        if (cmd == "init") {
            auto created = create_default_config();
            if (created.is_err()) {
                std::cout << theme::fail(created.error);
                return 1;
            }
            std::cout << theme::ok("Config at " + get_global_config_path().string());
            return 0;
        }

        ShellcastCLI cli;
        if (!cli.load_config(config_path)) {
            return 1;
        }
        cli.run_connected_repl(cmd);
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
