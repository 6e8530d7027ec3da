#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote operations the client knows how to route
enum class RemoteOp {
    ListNodes,
    ListInstances,
    Start,
    Stop,
    SendCommand,
    OutputLog,
};

// One entry of the route table. `params` maps a logical role
// ("instance", "node", "command", "page", "page_size") to the query
// parameter name the panel expects.
struct RouteSpec {
    std::string path;
    std::string method = "GET";
    std::map<std::string, std::string> params;

    std::string param(const std::string& role) const {
        auto it = params.find(role);
        return it == params.end() ? role : it->second;
    }
};

// Configuration structures
struct PanelConfig {
    std::string url;
    std::string api_key;             // empty = read "api_key" from the credential store
    int timeout = 30;                // seconds, bounds every request
};

struct ApiConfig {
    std::string layout = "v10";      // built-in route layout ("v10" or "v9")
    int page_size = 100;
    std::map<RemoteOp, RouteSpec> route_overrides;
};

struct OperatorConfig {
    std::vector<std::string> admins;
    std::string self;                // operator id of the local user
};

struct OutputConfig {
    int delay_ms = 1000;             // wait before fetching the output log
    int tail_chars = 500;            // keep only the last N chars of the log
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
