#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/config.hpp>
#include <core/time_utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void print_node(const NodeSummary& node) {
    std::string mark = node.available ? theme::green("online") : theme::red("offline");
    std::cout << "  " << theme::brown(node.name) << "  " << mark << "\n";
    if (!node.available) {
        std::cout << "\n";
        return;
    }
    std::cout << theme::kv("Version", node.version.empty() ? "-" : node.version);
    std::cout << theme::kv("OS", node.os_version.empty() ? "-" : node.os_version);
    std::cout << theme::kv("CPU", format_percent(node.cpu_fraction));
    std::cout << theme::kv("Memory", fmt::format("{} / {}", format_gb(node.mem_used_bytes),
                                                 format_gb(node.mem_total_bytes)));
    std::cout << theme::kv("Instances", fmt::format("{} / {} running",
                                                    node.instance_running, node.instance_total));
    std::cout << "\n";
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection() || !cli.require_authorized()) return;

    auto result = cli.service->status();
    if (result.is_err()) {
        std::cout << theme::fail("Status unavailable: " + result.error);
        return;
    }
    const FleetSummary& s = result.value;

    std::cout << theme::section("Fleet");
    std::cout << theme::kv("Panel", cli.service->config().panel().url);
    std::cout << theme::kv("Version", s.panel_version.empty() ? "-" : s.panel_version);
    std::cout << theme::kv("Uptime", format_uptime(s.panel_uptime_secs));
    std::cout << theme::kv("Nodes", fmt::format("{} / {} online",
                                                s.node_count_available, s.node_count_total));
    std::cout << theme::kv("Instances", fmt::format("{} / {} running",
                                                    s.instance_count_running, s.instance_count_total));
    if (s.data_time_ms) {
        std::cout << theme::kv("As of", format_epoch_ms(*s.data_time_ms));
    }

    if (!s.per_node.empty()) {
        std::cout << theme::section("Nodes");
        for (const auto& node : s.per_node) {
            print_node(node);
        }
    }
}

void register_status_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show panel, node and instance totals");
}
