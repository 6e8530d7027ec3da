#include "directory_structure.hpp"
#include <platform/platform.hpp>

fs::path get_fleetctl_root() {
    return platform::home_dir() / ".fleetctl";
}

void ensure_fleetctl_directory_structure() {
    fs::create_directories(get_fleetctl_root());
}
