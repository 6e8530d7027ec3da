#include "status_aggregator.hpp"
#include <core/json_utils.hpp>
#include <fmt/format.h>

static NodeSummary summarize_node(const Json::Value& node, size_t index) {
    const Json::Value& sys = json_field::get(node, "system");
    const Json::Value& inst = json_field::get(node, "instance");

    NodeSummary s;
    s.name = json_field::str(node, "remarks");
    if (s.name.empty()) s.name = json_field::str(node, "hostname");
    if (s.name.empty()) s.name = fmt::format("Unnamed Node ({})", index + 1);

    s.available = json_field::boolean(node, "available");
    s.version = json_field::str(node, "version");
    s.os_version = json_field::str(sys, "version");
    if (s.os_version.empty()) s.os_version = json_field::str(sys, "release");

    s.cpu_fraction = json_field::num(sys, "cpuUsage");
    s.mem_total_bytes = json_field::num(sys, "totalmem");
    s.mem_used_bytes = s.mem_total_bytes * json_field::num(sys, "memUsage");

    s.instance_running = json_field::i64(inst, "running");
    s.instance_total = json_field::i64(inst, "total");
    return s;
}

FleetSummary summarize(const Json::Value& overview_data) {
    FleetSummary summary;

    const Json::Value& remote_count = json_field::get(overview_data, "remoteCount");
    summary.node_count_total = json_field::i64(remote_count, "total");
    summary.node_count_available = json_field::i64(remote_count, "available");

    summary.panel_version = json_field::str(overview_data, "version");
    summary.panel_uptime_secs = json_field::num(json_field::get(overview_data, "system"), "uptime");

    const Json::Value& remote = json_field::get(overview_data, "remote");
    if (remote.isArray()) {
        for (Json::ArrayIndex i = 0; i < remote.size(); ++i) {
            NodeSummary node = summarize_node(remote[i], i);
            summary.instance_count_total += node.instance_total;
            summary.instance_count_running += node.instance_running;
            summary.per_node.push_back(std::move(node));
        }
    }
    return summary;
}
