#include "fleet_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <termios.h>
#include <unistd.h>
#include <cstdlib>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <core/directory_structure.hpp>
#include <core/utils.hpp>
#include <readline/readline.h>
#include <readline/history.h>

FleetCLI::FleetCLI() : BaseCLI() {
    register_all_commands();
}

void FleetCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        cli.service->disconnect();
        std::exit(0);
    }, "Exit fleetctl");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        cli.service->disconnect();
        std::exit(0);
    }, "Exit fleetctl");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    add_command("setup", [this](BaseCLI& cli, const std::string& arg) {
        this->run_setup();
    }, "Store the panel URL and API key");

    register_instance_commands(*this);
    register_status_commands(*this);
    register_operator_commands(*this);
    register_credentials_commands(*this);
}

void FleetCLI::run_repl() {
    std::cout << theme::banner();

    // Preflight
    std::cout << theme::section("Preflight");
    auto issues = run_preflight_checks();
    bool blocking = false;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            blocking = true;
        }
        std::cout << theme::step(issue.fix);
    }
    if (blocking) {
        std::cout << "\n";
        return;
    }
    std::cout << theme::check("Global config loaded");

    // Preflight read the file itself; pick up anything written since startup
    auto reloaded = service->reload_config();
    if (reloaded.is_err()) {
        std::cout << theme::fail(reloaded.error) << "\n";
        return;
    }

    // Connect
    std::cout << theme::section("Connecting");
    auto connected = service->connect();
    if (connected.is_err()) {
        std::cout << theme::fail("Connection failed: " + connected.error) << "\n";
        return;
    }

    auto outcome = service->list([](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    });
    if (!outcome.ok()) {
        std::cout << theme::fail("Panel reports no nodes: " + outcome.error);
        std::cout << theme::dim("    Check panel.url and the API key, then run 'list'.") << "\n";
    } else {
        std::cout << theme::check("Panel is REACHABLE");
    }

    const auto& cfg = service->config();
    std::cout << theme::section("Connected");
    std::cout << theme::kv("Panel", cfg.panel().url);
    std::cout << theme::kv("Layout", cfg.api().layout);
    std::cout << theme::kv("Operator", operator_id);
    if (outcome.ok()) {
        std::cout << theme::kv("Fleet", std::to_string(outcome.snapshot->instances.size())
                                        + " instances on "
                                        + std::to_string(outcome.snapshot->nodes.size()) + " nodes");
    }
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (true) {
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
        trim(args);

        execute_command(command, args);
    }

    service->disconnect();
}

static std::string read_secret(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    struct termios oldt, newt;
    bool tty = tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (tty) {
        newt = oldt;
        newt.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }

    std::string secret;
    std::getline(std::cin, secret);

    if (tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    }
    std::cout << "\n";
    return secret;
}

void FleetCLI::run_setup() {
    ensure_fleetctl_directory_structure();

    // Create default config file if it doesn't exist
    auto config_result = create_default_global_config();
    if (config_result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + config_result.error);
        return;
    }

    std::cout << theme::banner();
    std::cout << theme::section("Panel Setup");
    std::cout << theme::dim("    The panel URL goes to ~/.fleetctl/config.yaml.") << "\n";
    std::cout << theme::dim("    The API key is kept in ~/.fleetctl/credentials.") << "\n\n";

    // URL
    std::string url;
    std::cout << theme::color::BROWN << "    Panel URL (blank keeps the config value): " << theme::color::RESET;
    std::cout.flush();
    std::getline(std::cin, url);
    trim(url);

    // Key
    std::string key = read_secret(
        theme::color::BROWN + "    API key: " + theme::color::RESET
    );
    trim(key);
    if (key.empty()) {
        std::cout << theme::fail("API key cannot be empty.");
        return;
    }

    auto& creds = CredentialManager::instance();
    auto r1 = creds.set("api_key", key);
    if (r1.is_err()) {
        std::cout << "\n" << theme::fail("Failed to store the API key: " + r1.error);
        return;
    }
    if (!url.empty()) {
        auto r2 = set_global_panel_url(url);
        if (r2.is_err()) {
            std::cout << "\n" << theme::fail(r2.error);
            return;
        }
    }

    auto reloaded = service->reload_config();
    if (reloaded.is_err()) {
        std::cout << theme::fail(reloaded.error);
        return;
    }

    std::cout << theme::divider();
    std::cout << theme::ok("Config file ready at " + get_global_config_path().string());
    std::cout << theme::ok("API key saved to ~/.fleetctl/credentials.");
    std::cout << theme::ok("Run 'fleetctl' to open the console.");
    std::cout << "\n";
}

bool FleetCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    if (!commands_.count(command)) {
        return false;
    }

    std::string args_str;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) args_str += " ";
        args_str += args[i];
    }

    // A fresh process holds no snapshot, so positions need a listing first
    if (command == "start" || command == "stop" || command == "cmd") {
        if (service->has_config() && !service->is_connected() && service->connect().is_ok()) {
            refresh_instances(*this);
        }
    }

    execute_command(command, args_str);
    return true;
}
