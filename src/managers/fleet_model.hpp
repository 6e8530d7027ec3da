#pragma once

#include <string>

// Remote status codes: -1 unknown, 0 stopped, 1 stopping, 2 starting, 3 running
enum class InstanceStatus {
    Unknown,
    Stopped,
    Stopping,
    Starting,
    Running,
};

inline InstanceStatus instance_status_from_code(long long code) {
    switch (code) {
    case 0: return InstanceStatus::Stopped;
    case 1: return InstanceStatus::Stopping;
    case 2: return InstanceStatus::Starting;
    case 3: return InstanceStatus::Running;
    default: return InstanceStatus::Unknown;
    }
}

inline const char* instance_status_name(InstanceStatus s) {
    switch (s) {
    case InstanceStatus::Stopped:  return "STOPPED";
    case InstanceStatus::Stopping: return "STOPPING";
    case InstanceStatus::Starting: return "STARTING";
    case InstanceStatus::Running:  return "RUNNING";
    case InstanceStatus::Unknown:  break;
    }
    return "UNKNOWN";
}

// One management daemon
struct NodeInfo {
    std::string id;
    std::string display_name;
};

// One managed server process. `position` is assigned by the directory and
// is only meaningful within the snapshot that produced it.
struct InstanceInfo {
    int position = 0;
    std::string name;
    std::string unique_id;
    std::string node_id;
    InstanceStatus status = InstanceStatus::Unknown;
};

// (node, instance) pair the panel needs to address an instance
struct InstanceRef {
    std::string node_id;
    std::string unique_id;
};
