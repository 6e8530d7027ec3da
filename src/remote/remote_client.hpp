#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <utility>
#include <json/json.h>
#include <core/types.hpp>
#include "http_transport.hpp"
#include "route_table.hpp"

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Every remote call ends up in this shape, whatever went wrong underneath.
//   504            connect / read timeout
//   500            other transport failure, or an undecodable 200 body
//   anything else  the panel's own status (or the HTTP status)
struct ApiResult {
    int status = 0;
    std::optional<Json::Value> data;
    std::optional<std::string> error;
    std::optional<int64_t> time_ms;     // panel timestamp, when it sends one

    bool ok() const { return status == 200; }

    // Best human-readable failure text: error, else string data, else fallback
    std::string message(const std::string& fallback = "unknown error") const;
};

class RemoteClient {
public:
    RemoteClient(const PanelConfig& panel, RouteTable routes,
                 std::shared_ptr<HttpTransport> transport);

    // Raw call against an endpoint path ("/overview" or "/api/overview").
    ApiResult call(const std::string& endpoint,
                   const std::string& method = "GET",
                   const QueryParams& params = {},
                   const std::optional<Json::Value>& body = std::nullopt);

    // Routed call: path and method come from the route table, `params` are
    // keyed by logical role ("instance", "node", ...) and renamed to the
    // layout's parameter names.
    ApiResult call(RemoteOp op, const QueryParams& params = {},
                   const std::optional<Json::Value>& body = std::nullopt);

    // Base URL + endpoint with the API prefix present exactly once
    std::string build_url(const std::string& endpoint) const;

private:
    std::string base_url_;
    std::string api_key_;
    int timeout_secs_;
    RouteTable routes_;
    std::shared_ptr<HttpTransport> transport_;

    ApiResult normalize(const HttpResponse& response) const;
};
