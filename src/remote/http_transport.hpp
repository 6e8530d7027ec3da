#pragma once

#include <string>
#include <vector>
#include <utility>

struct HttpRequest {
    std::string method;                                       // "GET", "POST", "PUT", "DELETE"
    std::string url;                                          // fully built, query string included
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;                                         // empty = no request body
    int timeout_secs = 30;
};

struct HttpResponse {
    enum Failure { NONE, CONNECT_TIMEOUT, READ_TIMEOUT, OTHER };

    Failure failure = NONE;
    long status_code = 0;
    std::string body;
    std::string error;          // transport error text when failure != NONE

    bool transport_failed() const { return failure != NONE; }
};

// Synchronous HTTP exchange. Implementations never throw for network
// faults; they report them through HttpResponse::failure.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

// libcurl-backed transport. One easy handle per request, so a single
// instance may be shared by concurrent callers.
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    HttpResponse perform(const HttpRequest& request) override;
};
