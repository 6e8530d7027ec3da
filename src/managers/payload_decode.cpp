#include "payload_decode.hpp"
#include <core/constants.hpp>
#include <core/json_utils.hpp>

std::vector<NodeInfo> decode_nodes(const Json::Value& overview_data) {
    std::vector<NodeInfo> nodes;
    const Json::Value& remote = json_field::get(overview_data, "remote");
    if (!remote.isArray()) return nodes;

    for (const auto& entry : remote) {
        NodeInfo node;
        node.id = json_field::str(entry, "uuid");
        if (node.id.empty()) continue;

        node.display_name = json_field::str(entry, "remarks");
        if (node.display_name.empty()) node.display_name = json_field::str(entry, "ip");
        if (node.display_name.empty()) node.display_name = UNNAMED_NODE;
        nodes.push_back(node);
    }
    return nodes;
}

std::optional<InstanceInfo> decode_instance(const Json::Value& entry, const std::string& node_id) {
    InstanceInfo inst;
    inst.unique_id = json_field::str(entry, "instanceUuid");
    if (inst.unique_id.empty()) return std::nullopt;

    inst.node_id = node_id;
    inst.name = json_field::str(json_field::get(entry, "config"), "nickname");
    if (inst.name.empty()) inst.name = UNNAMED_INSTANCE;

    // Top-level status, else info.status
    auto code = json_field::opt_i64(entry, "status");
    if (!code) {
        code = json_field::opt_i64(json_field::get(entry, "info"), "status");
    }
    inst.status = code ? instance_status_from_code(*code) : InstanceStatus::Unknown;
    return inst;
}

InstancePage decode_instance_page(const Json::Value& data, const std::string& node_id) {
    InstancePage page;

    const Json::Value* list = nullptr;
    if (data.isArray()) {
        page.shape = InstancePage::BARE_LIST;
        list = &data;
    } else if (json_field::get(data, "data").isArray()) {
        page.shape = InstancePage::WRAPPED;
        list = &json_field::get(data, "data");
        page.page = static_cast<int>(json_field::i64(data, "page", 1));
        page.max_page = static_cast<int>(json_field::i64(data, "maxPage", page.page));
    } else {
        return page;
    }

    for (const auto& entry : *list) {
        auto inst = decode_instance(entry, node_id);
        if (inst) {
            page.instances.push_back(*inst);
        } else {
            page.dropped++;
        }
    }
    return page;
}
