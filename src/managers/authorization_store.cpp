#include "authorization_store.hpp"
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

AuthorizationStore::AuthorizationStore(fs::path path)
    : path_(std::move(path)) {}

std::vector<std::string> AuthorizationStore::load_unlocked() const {
    std::vector<std::string> ids;
    if (!fs::exists(path_)) {
        return ids;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        if (root["authorized"] && root["authorized"].IsSequence()) {
            for (const auto& n : root["authorized"]) {
                std::string id = n.as<std::string>("");
                if (!id.empty()) ids.push_back(id);
            }
        }
    } catch (const std::exception& e) {
        // Corrupted allow-list, treat as empty
        fleet_log("Operators: cannot read " + path_.string() + ": " + e.what());
        return {};
    }
    return ids;
}

Result<void> AuthorizationStore::save_unlocked(const std::vector<std::string>& ids) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "authorized" << YAML::Value << YAML::BeginSeq;
    for (const auto& id : ids) {
        out << YAML::DoubleQuoted << id;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    std::ofstream fout(path_.string(), std::ios::trunc);
    if (!fout) {
        return Result<void>::Err("Failed to write " + path_.string());
    }
    fout << out.c_str() << "\n";
    return Result<void>::Ok();
}

bool AuthorizationStore::is_authorized(const std::string& operator_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ids = load_unlocked();
    return std::find(ids.begin(), ids.end(), operator_id) != ids.end();
}

Result<void> AuthorizationStore::add(const std::string& operator_id) {
    if (operator_id.empty()) {
        return Result<void>::Err("Operator id is empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto ids = load_unlocked();
    if (std::find(ids.begin(), ids.end(), operator_id) != ids.end()) {
        return Result<void>::Err("Operator " + operator_id + " is already authorized");
    }
    ids.push_back(operator_id);
    return save_unlocked(ids);
}

Result<void> AuthorizationStore::remove(const std::string& operator_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ids = load_unlocked();
    auto it = std::find(ids.begin(), ids.end(), operator_id);
    if (it == ids.end()) {
        return Result<void>::Err("Operator " + operator_id + " is not authorized");
    }
    ids.erase(it);
    return save_unlocked(ids);
}

std::vector<std::string> AuthorizationStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_unlocked();
}
