#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_instance_commands(BaseCLI& cli);
void register_status_commands(BaseCLI& cli);
void register_operator_commands(BaseCLI& cli);
void register_credentials_commands(BaseCLI& cli);

// Refresh the directory without printing; no-op when not connected
void refresh_instances(BaseCLI& cli);

class FleetCLI : public BaseCLI {
public:
    FleetCLI();

    void run_repl();
    void run_setup();
    // One-shot; returns false if the command is unknown
    bool run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
};
