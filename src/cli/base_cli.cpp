#include "base_cli.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() : service(std::make_unique<FleetService>()) {
    if (service->has_config() && !service->config().operators().self.empty()) {
        operator_id = service->config().operators().self;
    } else {
        operator_id = get_local_operator();
    }
}

BaseCLI::BaseCLI(std::unique_ptr<FleetService> service, std::string operator_id)
    : service(std::move(service)), operator_id(std::move(operator_id)) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!service->has_config()) {
        std::cout << theme::fail("fleetctl is not configured. Run 'fleetctl setup' first.");
        return false;
    }
    return true;
}

bool BaseCLI::require_connection() {
    if (!require_config()) {
        return false;
    }
    if (!service->is_connected()) {
        auto result = service->connect();
        if (result.is_err()) {
            std::cout << theme::fail("Cannot reach the panel: " + result.error);
            return false;
        }
    }
    return true;
}

bool BaseCLI::require_authorized() {
    if (!require_config()) {
        return false;
    }
    if (!service->is_authorized(operator_id)) {
        std::cout << theme::fail("Operator '" + operator_id + "' is not authorized.");
        std::cout << theme::step("Ask an admin to run 'op " + operator_id + "'.");
        return false;
    }
    return true;
}

bool BaseCLI::require_admin() {
    if (!require_config()) {
        return false;
    }
    if (!service->is_admin(operator_id)) {
        std::cout << theme::fail("Only admins can manage operators.");
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
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Fleet",     {"list", "status", "start", "stop", "cmd"}},
        {"Operators", {"op", "deop", "operators"}},
        {"Setup",     {"setup", "credentials"}},
        {"General",   {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::BROWN) + "fleetctl" + rl_esc(theme::color::RESET);
    if (service->has_config()) {
        prompt += ":" + rl_esc(theme::color::BLUE) + operator_id + rl_esc(theme::color::RESET);
    }
    if (service->is_connected()) {
        prompt += "@" + rl_esc(theme::color::GREEN) + "panel" + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
