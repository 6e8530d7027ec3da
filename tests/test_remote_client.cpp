#include <gtest/gtest.h>
#include <remote/remote_client.hpp>
#include "fake_transport.hpp"

static RemoteClient make_client(std::shared_ptr<FakeTransport> transport,
                                const std::string& url = "http://panel:23333",
                                const std::string& layout = "v10") {
    PanelConfig panel;
    panel.url = url;
    panel.api_key = "k3y/+=";
    panel.timeout = 7;
    auto routes = RouteTable::for_layout(layout);
    return RemoteClient(panel, routes.value, transport);
}

// ── URL building ──

TEST(RemoteClient, PrefixAddedOnce) {
    auto fake = std::make_shared<FakeTransport>();
    auto client = make_client(fake);
    EXPECT_EQ(client.build_url("/overview"), "http://panel:23333/api/overview");
    EXPECT_EQ(client.build_url("/api/overview"), "http://panel:23333/api/overview");
    EXPECT_EQ(client.build_url("overview"), "http://panel:23333/api/overview");
}

TEST(RemoteClient, BaseUrlWithPrefixOrSlashNormalized) {
    auto fake = std::make_shared<FakeTransport>();
    EXPECT_EQ(make_client(fake, "http://panel/").build_url("/overview"),
              "http://panel/api/overview");
    EXPECT_EQ(make_client(fake, "http://panel/api/").build_url("/overview"),
              "http://panel/api/overview");
}

TEST(RemoteClient, ApiKeyFirstAndEncoded) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_json("/api/overview", R"({"status":200,"data":{}})");
    auto client = make_client(fake);

    client.call("/overview", "GET", {{"page", "2"}});
    ASSERT_EQ(fake->requests.size(), 1u);
    const std::string& url = fake->requests[0].url;
    EXPECT_EQ(url, "http://panel:23333/api/overview?apikey=k3y%2F%2B%3D&page=2");
}

TEST(RemoteClient, HeadersAndTimeout) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_json("/api/overview", R"({"status":200})");
    auto client = make_client(fake);
    client.call("/overview");

    ASSERT_EQ(fake->requests.size(), 1u);
    const auto& req = fake->requests[0];
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.timeout_secs, 7);
    bool has_requested_with = false;
    for (const auto& [name, value] : req.headers) {
        if (name == "X-Requested-With") has_requested_with = value == "XMLHttpRequest";
    }
    EXPECT_TRUE(has_requested_with);
}

TEST(RemoteClient, MethodCaseInsensitive) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_json("/api/overview", R"({"status":200})");
    auto client = make_client(fake);
    EXPECT_TRUE(client.call("/overview", "post").ok());
    EXPECT_EQ(fake->requests[0].method, "POST");
}

TEST(RemoteClient, UnsupportedMethodNeverSent) {
    auto fake = std::make_shared<FakeTransport>();
    auto client = make_client(fake);
    auto r = client.call("/overview", "PATCH");
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.error.value_or(""), "unsupported method");
    EXPECT_TRUE(fake->requests.empty());
}

// ── Normalization ──

TEST(RemoteClient, EnvelopeLifted) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_json("/api/overview", R"({"status":200,"data":{"version":"10.2"},"time":1700000000000})");
    auto r = make_client(fake).call("/overview");
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.data.has_value());
    EXPECT_EQ((*r.data)["version"].asString(), "10.2");
    EXPECT_EQ(r.time_ms.value_or(0), 1700000000000LL);
    EXPECT_FALSE(r.error.has_value());
}

TEST(RemoteClient, EnvelopeStatusWinsOverHttp) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_json("/api/overview", R"({"status":403,"data":"Permission denied"})", 403);
    auto r = make_client(fake).call("/overview");
    EXPECT_EQ(r.status, 403);
    EXPECT_EQ(r.message(), "Permission denied");
}

TEST(RemoteClient, NonJsonErrorBodyPreviewed) {
    auto fake = std::make_shared<FakeTransport>();
    std::string html = "<html>" + std::string(200, 'x') + "</html>";
    fake->on_json("/api/overview", html, 503);
    auto r = make_client(fake).call("/overview");
    EXPECT_EQ(r.status, 503);
    EXPECT_EQ(r.error.value_or(""), "503: " + html.substr(0, 100));
}

TEST(RemoteClient, OutOfRangeEnvelopeStatusKeepsHttpStatus) {
    auto fake = std::make_shared<FakeTransport>();
    // 2^32 + 200 would wrap to 200 if narrowed
    fake->on_json("/api/overview", R"({"status":4294967496,"error":"boom"})", 500);
    auto r = make_client(fake).call("/overview");
    EXPECT_EQ(r.status, 500);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.message(), "boom");

    fake->on_json("/api/overview", R"({"status":1e300,"error":"boom"})", 500);
    r = make_client(fake).call("/overview");
    EXPECT_EQ(r.status, 500);
    EXPECT_FALSE(r.ok());
}

TEST(RemoteClient, ErrorPreviewCutsOnCharacters) {
    auto fake = std::make_shared<FakeTransport>();
    // 99 ASCII bytes, then a two-byte character straddling byte 100
    std::string body = std::string(99, 'x') + "\xc3\xa9" + "tail";
    fake->on_json("/api/overview", body, 502);
    auto r = make_client(fake).call("/overview");
    EXPECT_EQ(r.status, 502);
    EXPECT_EQ(r.error.value_or(""), "502: " + std::string(99, 'x') + "\xc3\xa9");
}

TEST(RemoteClient, UndecodableSuccessIsDecodeFailure) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_json("/api/overview", "not json");
    auto r = make_client(fake).call("/overview");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.error.value_or("").rfind("decode failure", 0), 0u);
}

TEST(RemoteClient, NonObjectSuccessIsDecodeFailure) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_json("/api/overview", "[1,2,3]");
    auto r = make_client(fake).call("/overview");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.error.value_or("").rfind("decode failure", 0), 0u);
}

TEST(RemoteClient, TimeoutsMapTo504) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on("/api/overview", [](const HttpRequest&) {
        return FakeTransport::failure(HttpResponse::CONNECT_TIMEOUT, "Connection timed out");
    });
    fake->on("/api/protected_instance/open", [](const HttpRequest&) {
        return FakeTransport::failure(HttpResponse::READ_TIMEOUT, "Operation timed out");
    });
    auto client = make_client(fake);

    auto connect = client.call("/overview");
    EXPECT_EQ(connect.status, 504);
    EXPECT_EQ(connect.error.value_or(""), "connect timeout");

    auto read = client.call(RemoteOp::Start, {{"instance", "u1"}, {"node", "n1"}});
    EXPECT_EQ(read.status, 504);
    EXPECT_EQ(read.error.value_or(""), "read timeout");
}

TEST(RemoteClient, OtherTransportFailureIs500WithCause) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on("/api/overview", [](const HttpRequest&) {
        return FakeTransport::failure(HttpResponse::OTHER, "Could not resolve host: panel");
    });
    auto r = make_client(fake).call("/overview");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(r.error.value_or(""), "Could not resolve host: panel");
}

// ── Routed calls ──

TEST(RemoteClient, RoutedCallRenamesParams) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_json("/api/protected_instance/command", R"({"status":200,"data":true})");
    auto client = make_client(fake);

    auto r = client.call(RemoteOp::SendCommand,
                         {{"instance", "u1"}, {"node", "n1"}, {"command", "say hi"}});
    ASSERT_TRUE(r.ok());
    const std::string& url = fake->requests[0].url;
    EXPECT_EQ(FakeTransport::query_param(url, "uuid"), "u1");
    EXPECT_EQ(FakeTransport::query_param(url, "daemonId"), "n1");
    EXPECT_EQ(FakeTransport::query_param(url, "command"), "say%20hi");
}

TEST(RemoteClient, V9LayoutUsesInstancePrefix) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_json("/api/instance/stop", R"({"status":200})");
    auto client = make_client(fake, "http://panel:23333", "v9");
    EXPECT_TRUE(client.call(RemoteOp::Stop, {{"instance", "u1"}, {"node", "n1"}}).ok());
}
