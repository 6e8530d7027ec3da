#include <gtest/gtest.h>
#include <managers/status_aggregator.hpp>
#include <core/json_utils.hpp>

static Json::Value parse(const std::string& text) {
    Json::Value v;
    std::string error;
    EXPECT_TRUE(parse_json(text, v, error)) << error;
    return v;
}

static const char* OVERVIEW = R"({
    "version": "10.4.1",
    "system": {"uptime": 90061},
    "remoteCount": {"total": 3, "available": 2},
    "remote": [
        {"remarks": "Main", "available": true, "version": "4.2",
         "system": {"version": "Ubuntu 22.04", "cpuUsage": 1.4,
                    "totalmem": 8589934592, "memUsage": 0.5},
         "instance": {"running": 2, "total": 5}},
        {"hostname": "edge-1", "available": true,
         "system": {"release": "6.1.0"},
         "instance": {"running": 0, "total": 1}},
        {"available": false, "instance": {"running": 0, "total": 4}}
    ]
})";

TEST(StatusAggregator, FleetTotals) {
    auto s = summarize(parse(OVERVIEW));
    EXPECT_EQ(s.node_count_total, 3);
    EXPECT_EQ(s.node_count_available, 2);
    EXPECT_EQ(s.instance_count_total, 10);
    EXPECT_EQ(s.instance_count_running, 2);
    EXPECT_EQ(s.panel_version, "10.4.1");
    EXPECT_DOUBLE_EQ(s.panel_uptime_secs, 90061.0);
}

TEST(StatusAggregator, CpuNotClamped) {
    auto s = summarize(parse(OVERVIEW));
    ASSERT_EQ(s.per_node.size(), 3u);
    EXPECT_DOUBLE_EQ(s.per_node[0].cpu_fraction, 1.4);
}

TEST(StatusAggregator, MemoryUsedFromFraction) {
    auto s = summarize(parse(OVERVIEW));
    EXPECT_DOUBLE_EQ(s.per_node[0].mem_total_bytes, 8589934592.0);
    EXPECT_DOUBLE_EQ(s.per_node[0].mem_used_bytes, 4294967296.0);
}

TEST(StatusAggregator, NodeNameAndOsFallbacks) {
    auto s = summarize(parse(OVERVIEW));
    EXPECT_EQ(s.per_node[0].name, "Main");
    EXPECT_EQ(s.per_node[0].os_version, "Ubuntu 22.04");
    EXPECT_EQ(s.per_node[1].name, "edge-1");
    EXPECT_EQ(s.per_node[1].os_version, "6.1.0");
    EXPECT_EQ(s.per_node[2].name, "Unnamed Node (3)");
}

TEST(StatusAggregator, MissingFieldsAreZero) {
    auto s = summarize(parse(OVERVIEW));
    const auto& offline = s.per_node[2];
    EXPECT_FALSE(offline.available);
    EXPECT_DOUBLE_EQ(offline.cpu_fraction, 0.0);
    EXPECT_DOUBLE_EQ(offline.mem_used_bytes, 0.0);
    EXPECT_EQ(offline.version, "");
}

TEST(StatusAggregator, EmptyOverview) {
    auto s = summarize(Json::Value());
    EXPECT_EQ(s.node_count_total, 0);
    EXPECT_EQ(s.instance_count_total, 0);
    EXPECT_TRUE(s.per_node.empty());
}
