#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Persisted operator allow-list: ~/.fleetctl/operators.yaml
//
//   authorized:
//     - "10001"
//     - "alice"
class AuthorizationStore {
public:
    explicit AuthorizationStore(fs::path path);

    bool is_authorized(const std::string& operator_id) const;

    // Err if the id is empty, already present, or the file cannot be written
    Result<void> add(const std::string& operator_id);

    // Err if the id is not present or the file cannot be written
    Result<void> remove(const std::string& operator_id);

    std::vector<std::string> list() const;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    mutable std::mutex mutex_;

    std::vector<std::string> load_unlocked() const;
    Result<void> save_unlocked(const std::vector<std::string>& ids) const;
};
