#include <algorithm>
#include <iostream>
#include <vector>
#include <string>
#include "cli/fleet_cli.hpp"
#include "cli/theme.hpp"

static void usage_row(const std::string& cmd, const std::string& arg, const std::string& help) {
    std::string padded = arg.empty() ? cmd : cmd + " ";
    std::cout << theme::color::BLUE << "    " << padded << theme::color::RESET
              << theme::color::BROWN << arg << theme::color::RESET
              << std::string(std::max<int>(2, 30 - static_cast<int>(padded.size() + arg.size())), ' ')
              << theme::color::DIM << help << theme::color::RESET << "\n";
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    usage_row("fleetctl", "", "Connect and enter REPL");
    usage_row("fleetctl setup", "", "Store panel URL and API key");
    usage_row("fleetctl list", "", "List instances by node");
    usage_row("fleetctl status", "", "Show fleet totals");
    usage_row("fleetctl start", "<id>", "Start an instance");
    usage_row("fleetctl stop", "<id>", "Stop an instance");
    usage_row("fleetctl cmd", "<id> <text>", "Send a console command");
    usage_row("fleetctl op", "<operator>", "Authorize an operator");
    usage_row("fleetctl deop", "<operator>", "Revoke an operator");
    usage_row("fleetctl operators", "", "List operators");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    <id> is a [position] from 'list', an instance name or an instance id.\n\n"
              << "    fleetctl --version        Show version\n"
              << "    fleetctl --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "fleetctl"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << FLEETCTL_VERSION << theme::color::RESET << "\n";
                return 0;
            }
            if (cmd == "--help" || cmd == "help") {
                print_usage();
                return 0;
            }
        }

        FleetCLI cli;

        if (argc == 1 || std::string(argv[1]) == "repl") {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "setup") {
            cli.run_setup();
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        if (!cli.run_command(cmd, args)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
