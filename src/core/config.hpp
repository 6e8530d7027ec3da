#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.fleetctl/config.yaml
    static Result<Config> load_global();

    // Parse config from YAML text
    static Result<Config> parse(const std::string& yaml_text);

    // Load the global config, then apply environment overrides
    // (FLEETCTL_URL, FLEETCTL_API_KEY) and the stored API key
    static Result<Config> load();

    // Accessors
    const PanelConfig& panel() const { return panel_; }
    const ApiConfig& api() const { return api_; }
    const OperatorConfig& operators() const { return operators_; }
    const OutputConfig& output() const { return output_; }
    int cooldown_secs() const { return cooldown_secs_; }

    // True if `id` is listed under operators.admins
    bool is_admin(const std::string& id) const;

public:
    Config() = default;

private:
    PanelConfig panel_;
    ApiConfig api_;
    OperatorConfig operators_;
    OutputConfig output_;
    int cooldown_secs_ = 10;
};

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();

// Rewrite panel.url in the global config, creating the file if needed
Result<void> set_global_panel_url(const std::string& url);
