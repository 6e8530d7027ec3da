#pragma once

#include <string>
#include <map>
#include <functional>
#include <memory>
#include <managers/fleet_service.hpp>

class BaseCLI {
public:
    BaseCLI();
    // Frontend over an already built service, acting as `operator_id`
    BaseCLI(std::unique_ptr<FleetService> service, std::string operator_id);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_connection();
    bool require_authorized();
    bool require_admin();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::unique_ptr<FleetService> service;
    std::string operator_id;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
