#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Ensures the base ~/.fleetctl directory exists.
// Creates directories as needed but does not overwrite files.
void ensure_fleetctl_directory_structure();

// Get the base ~/.fleetctl path
fs::path get_fleetctl_root();
