#include "instance_directory.hpp"
#include "payload_decode.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>

const NodeInfo* InstanceSnapshot::find_node(const std::string& node_id) const {
    for (const auto& node : nodes) {
        if (node.id == node_id) return &node;
    }
    return nullptr;
}

const InstanceInfo* InstanceSnapshot::find_instance(const std::string& unique_id) const {
    auto it = id_index.find(unique_id);
    return it == id_index.end() ? nullptr : &instances[it->second];
}

InstanceSnapshot build_snapshot(std::vector<NodeInfo> nodes,
                                std::vector<InstanceInfo> collected,
                                std::vector<std::string> skipped_nodes) {
    InstanceSnapshot snap;
    snap.nodes = std::move(nodes);
    snap.skipped_nodes = std::move(skipped_nodes);

    // Ties keep discovery order
    std::stable_sort(collected.begin(), collected.end(),
                     [](const InstanceInfo& a, const InstanceInfo& b) {
                         return a.name < b.name;
                     });

    std::map<std::string, int> name_counts;
    for (const auto& inst : collected) {
        name_counts[inst.name]++;
    }
    for (const auto& [name, count] : name_counts) {
        if (count > 1) snap.ambiguous_names.insert(name);
    }

    snap.instances = std::move(collected);
    for (size_t i = 0; i < snap.instances.size(); ++i) {
        InstanceInfo& inst = snap.instances[i];
        inst.position = static_cast<int>(i + 1);
        snap.id_index[inst.unique_id] = i;
        if (!snap.is_ambiguous(inst.name)) {
            snap.name_index[inst.name] = i;
        }
    }
    return snap;
}

InstanceDirectory::InstanceDirectory(RemoteClient& client, int page_size)
    : client_(client),
      page_size_(page_size > 0 ? page_size : INSTANCE_PAGE_SIZE),
      snapshot_(std::make_shared<const InstanceSnapshot>()) {}

std::shared_ptr<const InstanceSnapshot> InstanceDirectory::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

bool InstanceDirectory::fetch_node_instances(const NodeInfo& node, std::vector<InstanceInfo>& out) {
    std::vector<InstanceInfo> collected;
    int page = 1;

    while (true) {
        auto result = client_.call(RemoteOp::ListInstances, {
            {"node", node.id},
            {"page", std::to_string(page)},
            {"page_size", std::to_string(page_size_)},
        });

        if (!result.ok()) {
            fleet_log(fmt::format("Directory: skipping node {} ({}): [{}] {}",
                                  node.display_name, node.id, result.status, result.message()));
            return false;
        }

        auto decoded = decode_instance_page(result.data.value_or(Json::Value()), node.id);
        if (decoded.shape == InstancePage::INVALID) {
            fleet_log(fmt::format("Directory: skipping node {} ({}): unrecognized instance list",
                                  node.display_name, node.id));
            return false;
        }
        if (decoded.dropped > 0) {
            fleet_log(fmt::format("Directory: node {} page {}: dropped {} entries without instanceUuid",
                                  node.id, page, decoded.dropped));
        }

        collected.insert(collected.end(), decoded.instances.begin(), decoded.instances.end());

        bool more = decoded.shape == InstancePage::WRAPPED &&
                    decoded.max_page > page &&
                    !decoded.instances.empty();
        if (!more) break;
        if (page >= INSTANCE_MAX_PAGES) {
            fleet_log(fmt::format("Directory: node {} reports {} pages, stopping at {}",
                                  node.id, decoded.max_page, INSTANCE_MAX_PAGES));
            break;
        }
        ++page;
    }

    out.insert(out.end(), collected.begin(), collected.end());
    return true;
}

RefreshOutcome InstanceDirectory::refresh(StatusCallback cb) {
    RefreshOutcome outcome;

    auto overview = client_.call(RemoteOp::ListNodes);
    std::vector<NodeInfo> nodes;
    if (overview.ok() && overview.data) {
        nodes = decode_nodes(*overview.data);
    }

    if (nodes.empty()) {
        outcome.status = RefreshOutcome::NO_NODES;
        outcome.error = overview.ok() ? "no nodes" : overview.message();
        fleet_log("Directory: refresh found no nodes: " + outcome.error);
        return outcome;
    }

    std::vector<InstanceInfo> collected;
    std::vector<std::string> skipped;
    for (const auto& node : nodes) {
        if (cb) cb("Listing instances on " + node.display_name);
        if (!fetch_node_instances(node, collected)) {
            skipped.push_back(node.id);
        }
    }

    auto snap = std::make_shared<const InstanceSnapshot>(
        build_snapshot(nodes, std::move(collected), std::move(skipped)));

    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_ = snap;
    }

    fleet_log(fmt::format("Directory: refreshed {} instances on {} nodes ({} skipped, {} ambiguous names)",
                          snap->instances.size(), snap->nodes.size(),
                          snap->skipped_nodes.size(), snap->ambiguous_names.size()));

    outcome.snapshot = snap;
    return outcome;
}

ResolveOutcome InstanceDirectory::resolve(const std::string& identifier) const {
    ResolveOutcome outcome;
    outcome.identifier = identifier;
    trim(outcome.identifier);
    const std::string& id = outcome.identifier;

    auto snap = snapshot();

    if (is_all_digits(id)) {
        // Longer digit strings cannot be a valid position
        if (id.size() <= 9) {
            size_t position = static_cast<size_t>(std::stoul(id));
            if (position >= 1 && position <= snap->instances.size()) {
                const InstanceInfo& inst = snap->instances[position - 1];
                outcome.status = ResolveOutcome::FOUND;
                outcome.ref = {inst.node_id, inst.unique_id};
            }
        }
        return outcome;
    }

    if (snap->is_ambiguous(id)) {
        outcome.status = ResolveOutcome::AMBIGUOUS;
        return outcome;
    }

    auto by_name = snap->name_index.find(id);
    if (by_name != snap->name_index.end()) {
        const InstanceInfo& inst = snap->instances[by_name->second];
        outcome.status = ResolveOutcome::FOUND;
        outcome.ref = {inst.node_id, inst.unique_id};
        return outcome;
    }

    auto by_id = snap->id_index.find(id);
    if (by_id != snap->id_index.end()) {
        const InstanceInfo& inst = snap->instances[by_id->second];
        outcome.status = ResolveOutcome::FOUND;
        outcome.ref = {inst.node_id, inst.unique_id};
    }
    return outcome;
}
