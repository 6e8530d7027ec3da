#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <json/json.h>

struct NodeSummary {
    std::string name;
    bool available = false;
    std::string version;
    std::string os_version;
    double cpu_fraction = 0.0;        // 0.0-1.0 as reported, never clamped
    double mem_used_bytes = 0.0;      // totalmem * memUsage
    double mem_total_bytes = 0.0;
    int64_t instance_running = 0;
    int64_t instance_total = 0;
};

struct FleetSummary {
    int64_t node_count_total = 0;
    int64_t node_count_available = 0;
    int64_t instance_count_total = 0;
    int64_t instance_count_running = 0;
    std::vector<NodeSummary> per_node;

    std::string panel_version;
    double panel_uptime_secs = 0.0;
    std::optional<int64_t> data_time_ms;   // panel timestamp of the overview
};

// Fold an overview `data` block into fleet totals. Missing or mistyped
// fields count as zero/unknown. Instance totals use each node's advertised
// figures, so nodes whose inventory could not be listed still count.
FleetSummary summarize(const Json::Value& overview_data);
