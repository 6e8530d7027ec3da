#pragma once

#include <string>
#include <vector>
#include <optional>
#include <json/json.h>
#include "fleet_model.hpp"

// Decoding of panel inventory payloads into the canonical model. All shape
// variance of the remote API is absorbed here; nothing past this point
// inspects raw JSON.

// Nodes from an overview `data` block (`data.remote[]`). Entries without a
// uuid are dropped.
std::vector<NodeInfo> decode_nodes(const Json::Value& overview_data);

// One instance entry. std::nullopt if it carries no instanceUuid.
std::optional<InstanceInfo> decode_instance(const Json::Value& entry, const std::string& node_id);

struct InstancePage {
    // BARE_LIST: `data` was the list itself.
    // WRAPPED:   `data` was {page, maxPage, data: [...]}.
    // INVALID:   neither; no instances.
    enum Shape { BARE_LIST, WRAPPED, INVALID } shape = INVALID;

    std::vector<InstanceInfo> instances;
    int page = 1;
    int max_page = 1;
    int dropped = 0;        // entries skipped for lacking an id
};

InstancePage decode_instance_page(const Json::Value& data, const std::string& node_id);
