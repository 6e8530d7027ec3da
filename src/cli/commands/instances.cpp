#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static std::string status_label(InstanceStatus s) {
    std::string name = instance_status_name(s);
    switch (s) {
    case InstanceStatus::Running:  return theme::green(name);
    case InstanceStatus::Starting:
    case InstanceStatus::Stopping: return theme::yellow(name);
    case InstanceStatus::Stopped:  return theme::red(name);
    case InstanceStatus::Unknown:  break;
    }
    return theme::dim(name);
}

static void print_snapshot(const InstanceSnapshot& snap) {
    std::cout << theme::section("Instances");

    for (const auto& node : snap.nodes) {
        std::cout << "  " << theme::brown(node.display_name)
                  << theme::dim("  " + node.id) << "\n";

        bool skipped = false;
        for (const auto& id : snap.skipped_nodes) {
            if (id == node.id) skipped = true;
        }
        if (skipped) {
            std::cout << theme::warn("Inventory unavailable, see the debug log");
            continue;
        }

        bool any = false;
        for (const auto& inst : snap.instances) {
            if (inst.node_id != node.id) continue;
            any = true;
            std::string tag = snap.is_ambiguous(inst.name) ? theme::dim("  (shared name)") : "";
            std::cout << theme::color::BLUE << fmt::format("    [{:>2}] ", inst.position)
                      << theme::color::RESET << fmt::format("{:<24}", inst.name)
                      << status_label(inst.status) << tag << "\n";
        }
        if (!any) {
            std::cout << theme::dim("    (no instances)") << "\n";
        }
        std::cout << "\n";
    }

    std::cout << theme::dim(fmt::format("    {} instances on {} nodes. Address them by [position], name or instance id.",
                                        snap.instances.size(), snap.nodes.size())) << "\n\n";
}

static bool refresh(BaseCLI& cli, bool verbose) {
    auto cb = [verbose](const std::string& msg) {
        if (verbose) std::cout << theme::dim("    " + msg) << "\n";
    };
    auto outcome = cli.service->list(cb);
    if (!outcome.ok()) {
        std::cout << theme::fail("No nodes available: " + outcome.error);
        return false;
    }
    return true;
}

// Positions only exist within a snapshot; take one if none is held yet
static void ensure_snapshot(BaseCLI& cli) {
    auto* dir = cli.service->directory();
    if (dir && dir->snapshot()->nodes.empty()) {
        refresh(cli, false);
    }
}

static void print_operation(const OperationResult& r, const std::string& verb) {
    switch (r.status) {
    case OperationResult::OK:
        std::cout << theme::ok(fmt::format("{} sent to {}", verb, r.instance_name));
        break;
    case OperationResult::NOT_FOUND:
        std::cout << theme::fail("No instance matches '" + r.identifier + "'");
        std::cout << theme::step("Run 'list' to see current positions.");
        break;
    case OperationResult::AMBIGUOUS:
        std::cout << theme::fail("'" + r.identifier + "' names more than one instance");
        std::cout << theme::step("Use the position or instance id shown by 'list'.");
        break;
    case OperationResult::COOLDOWN:
        std::cout << theme::warn(fmt::format("{} was controlled moments ago. Try again in {}s.",
                                             r.instance_name, r.cooldown_remaining_secs));
        break;
    case OperationResult::REMOTE_ERROR:
        std::cout << theme::fail(fmt::format("{} failed for {}: [{}] {}", verb, r.instance_name,
                                             r.remote_status, r.error));
        break;
    case OperationResult::NOT_CONNECTED:
        std::cout << theme::fail(r.error.empty() ? "Not connected" : r.error);
        break;
    }
}

static void do_list(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection() || !cli.require_authorized()) return;
    if (!refresh(cli, true)) return;
    print_snapshot(*cli.service->directory()->snapshot());
}

static void do_start(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: start <position|name|id>");
        return;
    }
    if (!cli.require_connection() || !cli.require_authorized()) return;
    ensure_snapshot(cli);
    print_operation(cli.service->start(arg), "Start");
}

static void do_stop(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: stop <position|name|id>");
        return;
    }
    if (!cli.require_connection() || !cli.require_authorized()) return;
    ensure_snapshot(cli);
    print_operation(cli.service->stop(arg), "Stop");
}

static void do_cmd(BaseCLI& cli, const std::string& arg) {
    auto space = arg.find(' ');
    std::string target = arg.substr(0, space);
    std::string text = space == std::string::npos ? "" : arg.substr(space + 1);
    if (target.empty() || text.empty()) {
        std::cout << theme::fail("Usage: cmd <position|name|id> <command text>");
        return;
    }
    if (!cli.require_connection() || !cli.require_authorized()) return;
    ensure_snapshot(cli);

    auto result = cli.service->send_command(target, text);
    print_operation(result, "Command");
    if (!result.ok()) return;

    if (result.output && !result.output->empty()) {
        std::cout << theme::section("Output");
        std::cout << *result.output;
        if (result.output->back() != '\n') std::cout << "\n";
        std::cout << "\n";
    } else {
        std::cout << theme::info("No console output captured.");
    }
}

void register_instance_commands(BaseCLI& cli) {
    cli.add_command("list", do_list, "Refresh and list instances by node");
    cli.add_command("start", do_start, "Start an instance");
    cli.add_command("stop", do_stop, "Stop an instance");
    cli.add_command("cmd", do_cmd, "Send a console command and show the output");
}

void refresh_instances(BaseCLI& cli) {
    if (cli.service->is_connected()) refresh(cli, false);
}
