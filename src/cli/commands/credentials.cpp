#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/credentials.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <sstream>

static void do_credentials(BaseCLI& cli, const std::string& arg) {
    auto& creds = CredentialManager::instance();

    std::istringstream iss(arg);
    std::string action, key, value;
    iss >> action >> key;
    std::getline(iss, value);
    trim(value);

    if (action.empty() || action == "list") {
        std::cout << theme::section("Credentials");
        auto stored = creds.list();
        if (stored.empty()) {
            std::cout << theme::dim("    Nothing stored. Run 'setup' to save an API key.") << "\n\n";
            return;
        }
        for (const auto& info : stored) {
            std::cout << theme::kv(info.key, info.has_value ? "********" : theme::dim("(empty)"));
        }
        std::cout << "\n";
        return;
    }

    if (action == "set" && !key.empty() && !value.empty()) {
        auto result = creds.set(key, value);
        if (result.is_err()) {
            std::cout << theme::fail(result.error);
            return;
        }
        std::cout << theme::ok("Stored " + key);
        // Operator and key changes apply to this session too
        if (key == "operator") cli.operator_id = value;
        if (key == "api_key" && cli.service->has_config()) {
            auto reloaded = cli.service->reload_config();
            if (reloaded.is_err()) std::cout << theme::fail(reloaded.error);
        }
        return;
    }

    if (action == "remove" && !key.empty()) {
        auto result = creds.remove(key);
        if (result.is_err()) {
            std::cout << theme::fail(result.error + ": " + key);
            return;
        }
        std::cout << theme::ok("Removed " + key);
        return;
    }

    std::cout << theme::fail("Usage: credentials [list | set <key> <value> | remove <key>]");
    std::cout << theme::step("Keys: api_key, operator");
}

void register_credentials_commands(BaseCLI& cli) {
    cli.add_command("credentials", do_credentials, "List, set or remove stored secrets");
}
