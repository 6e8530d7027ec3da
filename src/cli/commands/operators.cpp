#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>

static void do_op(BaseCLI& cli, const std::string& arg) {
    std::string id = extract_operator_id(arg);
    if (id.empty()) {
        std::cout << theme::fail("Usage: op <operator>");
        return;
    }
    if (!cli.require_admin()) return;

    auto result = cli.service->authorize(cli.operator_id, id);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Authorized " + id);
}

static void do_deop(BaseCLI& cli, const std::string& arg) {
    std::string id = extract_operator_id(arg);
    if (id.empty()) {
        std::cout << theme::fail("Usage: deop <operator>");
        return;
    }
    if (!cli.require_admin()) return;

    auto result = cli.service->revoke(cli.operator_id, id);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Revoked " + id);
}

static void do_operators(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) return;

    std::cout << theme::section("Operators");
    const auto& admins = cli.service->config().operators().admins;
    if (admins.empty()) {
        std::cout << theme::kv("Admins", theme::dim("none configured, every operator is admin"));
    }
    for (const auto& id : admins) {
        std::cout << theme::kv("Admin", id);
    }

    auto allowed = cli.service->list_operators();
    if (allowed.empty()) {
        std::cout << theme::dim("    No authorized operators.") << "\n";
    }
    for (const auto& id : allowed) {
        std::cout << theme::kv("Operator", id);
    }

    std::cout << "\n" << theme::kv("You", cli.operator_id
        + (cli.service->is_authorized(cli.operator_id) ? "" : theme::dim(" (not authorized)")));
    std::cout << "\n";
}

void register_operator_commands(BaseCLI& cli) {
    cli.add_command("op", do_op, "Authorize an operator (admin)");
    cli.add_command("deop", do_deop, "Revoke an operator (admin)");
    cli.add_command("operators", do_operators, "List admins and authorized operators");
}
