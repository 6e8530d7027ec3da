#pragma once

#include <string>
#include <vector>
#include <set>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <remote/remote_client.hpp>
#include "fleet_model.hpp"

// Immutable view of the fleet as of one refresh. Indices hold offsets
// into `instances`.
struct InstanceSnapshot {
    std::vector<NodeInfo> nodes;
    std::vector<InstanceInfo> instances;                     // sorted by name, positions 1..N
    std::unordered_map<std::string, size_t> name_index;      // unique names only
    std::unordered_map<std::string, size_t> id_index;        // every instance
    std::set<std::string> ambiguous_names;                   // names seen >= 2 times
    std::vector<std::string> skipped_nodes;                  // node ids whose listing failed

    const NodeInfo* find_node(const std::string& node_id) const;
    const InstanceInfo* find_instance(const std::string& unique_id) const;
    bool is_ambiguous(const std::string& name) const { return ambiguous_names.count(name) > 0; }
};

// Sort `collected` by name (stable, ordinal), assign positions and build
// the indices.
InstanceSnapshot build_snapshot(std::vector<NodeInfo> nodes,
                                std::vector<InstanceInfo> collected,
                                std::vector<std::string> skipped_nodes = {});

struct RefreshOutcome {
    enum Status { OK, NO_NODES } status = OK;
    std::shared_ptr<const InstanceSnapshot> snapshot;   // set when OK
    std::string error;                                  // remote error when NO_NODES

    bool ok() const { return status == OK; }
};

struct ResolveOutcome {
    enum Status { FOUND, AMBIGUOUS, NOT_FOUND } status = NOT_FOUND;
    InstanceRef ref;                                    // set when FOUND
    std::string identifier;                             // trimmed input

    bool found() const { return status == FOUND; }
};

// In-memory directory of every instance across every node. Refreshed only
// on request; resolution reads whatever snapshot is current, so positions
// and names may be stale if the fleet changed since the last refresh.
class InstanceDirectory {
public:
    InstanceDirectory(RemoteClient& client, int page_size);

    // Rebuild the snapshot from the panel and swap it in. A node whose
    // instance listing fails is skipped; no nodes at all leaves the held
    // snapshot untouched.
    RefreshOutcome refresh(StatusCallback cb = nullptr);

    // Resolve a position ("3"), unique name or unique id
    ResolveOutcome resolve(const std::string& identifier) const;

    // Current snapshot (empty before the first refresh)
    std::shared_ptr<const InstanceSnapshot> snapshot() const;

private:
    RemoteClient& client_;
    int page_size_;

    mutable std::mutex snapshot_mutex_;    // guards the pointer swap only
    std::shared_ptr<const InstanceSnapshot> snapshot_;

    // Fetch every page of one node's instances. False if the node must be
    // skipped.
    bool fetch_node_instances(const NodeInfo& node, std::vector<InstanceInfo>& out);
};
