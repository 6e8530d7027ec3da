#include "route_table.hpp"

namespace {

struct OpName {
    RemoteOp op;
    const char* name;
};

const OpName OP_NAMES[] = {
    {RemoteOp::ListNodes,     "list_nodes"},
    {RemoteOp::ListInstances, "list_instances"},
    {RemoteOp::Start,         "start"},
    {RemoteOp::Stop,          "stop"},
    {RemoteOp::SendCommand,   "send_command"},
    {RemoteOp::OutputLog,     "output_log"},
};

const std::map<std::string, std::string> INSTANCE_PARAMS = {
    {"instance", "uuid"},
    {"node",     "daemonId"},
    {"command",  "command"},
};

const std::map<std::string, std::string> LISTING_PARAMS = {
    {"node",      "daemonId"},
    {"page",      "page"},
    {"page_size", "page_size"},
};

// Shared routes; the layouts differ only in the instance-control prefix.
std::map<RemoteOp, RouteSpec> build_layout(const std::string& control_prefix) {
    std::map<RemoteOp, RouteSpec> routes;
    routes[RemoteOp::ListNodes]     = {"/overview", "GET", {}};
    routes[RemoteOp::ListInstances] = {"/service/remote_service_instances", "GET", LISTING_PARAMS};
    routes[RemoteOp::Start]         = {control_prefix + "/open", "GET", INSTANCE_PARAMS};
    routes[RemoteOp::Stop]          = {control_prefix + "/stop", "GET", INSTANCE_PARAMS};
    routes[RemoteOp::SendCommand]   = {control_prefix + "/command", "GET", INSTANCE_PARAMS};
    routes[RemoteOp::OutputLog]     = {control_prefix + "/outputlog", "GET", INSTANCE_PARAMS};
    return routes;
}

} // namespace

const char* remote_op_name(RemoteOp op) {
    for (const auto& entry : OP_NAMES) {
        if (entry.op == op) return entry.name;
    }
    return "unknown";
}

std::optional<RemoteOp> remote_op_from_name(const std::string& name) {
    for (const auto& entry : OP_NAMES) {
        if (name == entry.name) return entry.op;
    }
    return std::nullopt;
}

std::vector<std::string> RouteTable::layouts() {
    return {"v10", "v9"};
}

Result<RouteTable> RouteTable::for_layout(const std::string& layout,
                                          const std::map<RemoteOp, RouteSpec>& overrides) {
    RouteTable table;
    table.layout_ = layout;

    if (layout == "v10") {
        table.routes_ = build_layout("/protected_instance");
    } else if (layout == "v9") {
        table.routes_ = build_layout("/instance");
    } else {
        return Result<RouteTable>::Err("Unknown API layout '" + layout + "' (expected v10 or v9)");
    }

    for (const auto& [op, patch] : overrides) {
        RouteSpec& spec = table.routes_[op];
        if (!patch.path.empty()) spec.path = patch.path;
        if (!patch.method.empty()) spec.method = patch.method;
        for (const auto& [role, name] : patch.params) {
            spec.params[role] = name;
        }
    }

    return Result<RouteTable>::Ok(table);
}

const RouteSpec& RouteTable::route(RemoteOp op) const {
    // Every RemoteOp is populated by for_layout()
    return routes_.at(op);
}
