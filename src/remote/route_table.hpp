#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <core/types.hpp>

// Config names for RemoteOp ("list_nodes", "start", ...)
const char* remote_op_name(RemoteOp op);
std::optional<RemoteOp> remote_op_from_name(const std::string& name);

// Maps each remote operation to the path, method and parameter names the
// panel expects. The panel has shipped incompatible route layouts, so the
// table is picked by name from config and can be patched per operation.
class RouteTable {
public:
    RouteTable() = default;

    // Build the table for a named layout ("v10", "v9") with overrides
    // merged on top. Override fields left empty keep the layout's value.
    static Result<RouteTable> for_layout(const std::string& layout,
                                         const std::map<RemoteOp, RouteSpec>& overrides = {});

    // Names of the built-in layouts
    static std::vector<std::string> layouts();

    const RouteSpec& route(RemoteOp op) const;
    const std::string& layout() const { return layout_; }

private:
    std::string layout_;
    std::map<RemoteOp, RouteSpec> routes_;
};
