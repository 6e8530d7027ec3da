#include "remote_client.hpp"
#include <core/constants.hpp>
#include <core/json_utils.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <limits>

std::string ApiResult::message(const std::string& fallback) const {
    if (error && !error->empty()) return *error;
    if (data && data->isString() && !data->asString().empty()) return data->asString();
    return fallback;
}

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static bool method_supported(const std::string& method) {
    return method == "GET" || method == "POST" || method == "PUT" || method == "DELETE";
}

// Lift a decoded panel envelope {status, data, error, time} into ApiResult.
static ApiResult from_envelope(const Json::Value& body, int default_status) {
    ApiResult r;
    r.status = default_status;
    auto status = json_field::opt_i64(body, "status");
    if (status && *status >= std::numeric_limits<int>::min() &&
        *status <= std::numeric_limits<int>::max()) {
        r.status = static_cast<int>(*status);
    }

    const Json::Value& data = json_field::get(body, "data");
    if (body.isMember("data")) {
        r.data = data;
    }

    const Json::Value& error = json_field::get(body, "error");
    if (error.isString()) {
        r.error = error.asString();
    } else if (!error.isNull()) {
        r.error = to_json(error);
    }

    r.time_ms = json_field::opt_i64(body, "time");
    return r;
}

RemoteClient::RemoteClient(const PanelConfig& panel, RouteTable routes,
                           std::shared_ptr<HttpTransport> transport)
    : base_url_(panel.url),
      api_key_(panel.api_key),
      timeout_secs_(panel.timeout > 0 ? panel.timeout : REQUEST_TIMEOUT_SECS),
      routes_(std::move(routes)),
      transport_(std::move(transport)) {
    trim(base_url_);
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    // A base URL that already names the prefix would double it
    const std::string prefix = API_PREFIX;
    if (base_url_.size() >= prefix.size() &&
        base_url_.compare(base_url_.size() - prefix.size(), prefix.size(), prefix) == 0) {
        base_url_.erase(base_url_.size() - prefix.size());
    }
}

std::string RemoteClient::build_url(const std::string& endpoint) const {
    std::string path = endpoint;
    if (path.empty() || path[0] != '/') {
        path = "/" + path;
    }

    const std::string prefix = API_PREFIX;
    bool has_prefix = path == prefix || path.compare(0, prefix.size() + 1, prefix + "/") == 0;
    if (!has_prefix) {
        path = prefix + path;
    }
    return base_url_ + path;
}

ApiResult RemoteClient::call(const std::string& endpoint, const std::string& method,
                             const QueryParams& params,
                             const std::optional<Json::Value>& body) {
    std::string verb = to_upper(method);
    if (!method_supported(verb)) {
        ApiResult r;
        r.status = 400;
        r.error = "unsupported method";
        return r;
    }

    std::string url = build_url(endpoint);
    url += "?";
    url += API_KEY_PARAM;
    url += "=" + url_encode(api_key_);
    for (const auto& [key, value] : params) {
        url += "&" + url_encode(key) + "=" + url_encode(value);
    }

    HttpRequest request;
    request.method = verb;
    request.url = url;
    request.timeout_secs = timeout_secs_;
    request.headers = {
        {"Content-Type", "application/json; charset=utf-8"},
        {"Accept", "application/json"},
        {"X-Requested-With", "XMLHttpRequest"},
    };
    if (body) {
        request.body = to_json(*body);
    }

    HttpResponse response = transport_->perform(request);
    ApiResult result = normalize(response);
    if (response.transport_failed()) {
        fleet_log(fmt::format("API {} {} failed: {} ({})", verb, endpoint,
                              result.error.value_or(""), response.error));
    } else if (!result.ok()) {
        fleet_log(fmt::format("API {} {} -> {} {}", verb, endpoint, result.status,
                              result.message("")));
    }
    return result;
}

ApiResult RemoteClient::call(RemoteOp op, const QueryParams& params,
                             const std::optional<Json::Value>& body) {
    const RouteSpec& route = routes_.route(op);

    QueryParams wire;
    wire.reserve(params.size());
    for (const auto& [role, value] : params) {
        wire.emplace_back(route.param(role), value);
    }
    return call(route.path, route.method, wire, body);
}

ApiResult RemoteClient::normalize(const HttpResponse& response) const {
    ApiResult r;

    switch (response.failure) {
    case HttpResponse::CONNECT_TIMEOUT:
        r.status = 504;
        r.error = "connect timeout";
        return r;
    case HttpResponse::READ_TIMEOUT:
        r.status = 504;
        r.error = "read timeout";
        return r;
    case HttpResponse::OTHER:
        r.status = 500;
        r.error = response.error.empty() ? "transport failure" : response.error;
        return r;
    case HttpResponse::NONE:
        break;
    }

    int http_status = static_cast<int>(response.status_code);
    Json::Value body;
    std::string parse_error;
    bool parsed = parse_json(response.body, body, parse_error);
    if (parsed && !body.isObject()) {
        parsed = false;
        parse_error = "expected a JSON object";
    }

    if (http_status != 200) {
        if (parsed) {
            return from_envelope(body, http_status);
        }
        r.status = http_status;
        r.error = fmt::format("{}: {}", http_status,
                              utf8_prefix(response.body, ERROR_BODY_PREVIEW_CHARS));
        return r;
    }

    if (!parsed) {
        r.status = 500;
        r.error = "decode failure: " + parse_error;
        return r;
    }
    return from_envelope(body, 200);
}
