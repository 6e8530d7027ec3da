#include "http_transport.hpp"
#include <curl/curl.h>
#include <cstddef>
#include <limits>

static void ensure_curl_global_init() {
    static const bool inited = [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        return true;
    }();
    (void)inited;
}

static std::size_t write_body_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    if (!body || !ptr) return 0;

    // Guard overflow: n = size * nmemb
    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
        return 0;  // abort transfer
    }

    const std::size_t n = size * nmemb;
    body->append(ptr, n);
    return n;
}

CurlTransport::CurlTransport() {
    ensure_curl_global_init();
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.failure = HttpResponse::OTHER;
        response.error = "curl_easy_init failed";
        return response;
    }

    curl_slist* headers = nullptr;
    for (const auto& kv : request.headers) {
        std::string line = kv.first + ": " + kv.second;
        headers = curl_slist_append(headers, line.c_str());
    }

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_secs));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.timeout_secs));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_body_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else {
        // PUT and DELETE carry their JSON body through POSTFIELDS
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = http_code;

    if (res == CURLE_OPERATION_TIMEDOUT) {
        // A zero connect time means the TCP/TLS handshake never finished
        double connect_time = 0.0;
        curl_easy_getinfo(curl, CURLINFO_CONNECT_TIME, &connect_time);
        response.failure = connect_time > 0.0 ? HttpResponse::READ_TIMEOUT
                                              : HttpResponse::CONNECT_TIMEOUT;
        response.error = errbuf[0] ? errbuf : curl_easy_strerror(res);
    } else if (res != CURLE_OK) {
        response.failure = HttpResponse::OTHER;
        response.error = errbuf[0] ? errbuf : curl_easy_strerror(res);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}
