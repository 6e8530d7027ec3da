#include "config.hpp"
#include "constants.hpp"
#include "credentials.hpp"
#include "directory_structure.hpp"
#include <remote/route_table.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return get_fleetctl_root();
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

bool Config::is_admin(const std::string& id) const {
    const auto& admins = operators_.admins;
    return !id.empty() && std::find(admins.begin(), admins.end(), id) != admins.end();
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    // Default config content
    const char* default_config = R"(# fleetctl configuration
# Edit this file to point fleetctl at your management panel

panel:
  url: "http://127.0.0.1:23333"
  api_key: ""                      # Empty = use the key stored by 'fleetctl setup'
  timeout: 30                      # Seconds per API request

api:
  layout: "v10"                    # Route layout: v10 or v9
  page_size: 100
  # Per-operation overrides, e.g.:
  # routes:
  #   start: { path: "/protected_instance/open", method: "GET" }
  #   send_command: { params: { command: "cmd" } }

operators:
  admins: []                       # Operator ids allowed to op/deop others
  self: ""                         # Your operator id (default: $USER)

output:
  delay_ms: 1000                   # Wait before reading the console log
  tail_chars: 500

cooldown_secs: 10
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

Result<void> set_global_panel_url(const std::string& url) {
    auto created = create_default_global_config();
    if (created.is_err()) {
        return created;
    }

    fs::path config_path = get_global_config_path();
    try {
        YAML::Node root = YAML::LoadFile(config_path.string());
        root["panel"]["url"] = url;

        YAML::Emitter emitter;
        emitter << root;
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Cannot write " + config_path.string());
        }
        out << emitter.c_str() << "\n";
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to update config: " + std::string(e.what()));
    }
}

static PanelConfig parse_panel_config(const YAML::Node& node) {
    PanelConfig panel;
    panel.url = node["url"].as<std::string>(DEFAULT_PANEL_URL);
    panel.api_key = node["api_key"].as<std::string>("");
    panel.timeout = node["timeout"].as<int>(REQUEST_TIMEOUT_SECS);
    if (panel.timeout <= 0) panel.timeout = REQUEST_TIMEOUT_SECS;
    return panel;
}

static RouteSpec parse_route_override(const YAML::Node& node) {
    RouteSpec spec;
    spec.method = "";  // empty = keep the layout's method
    if (node.IsScalar()) {
        // Bare string shorthand: `start: /custom/open`
        spec.path = node.as<std::string>("");
        return spec;
    }
    spec.path = node["path"].as<std::string>("");
    spec.method = node["method"].as<std::string>("");
    if (node["params"] && node["params"].IsMap()) {
        for (const auto& kv : node["params"]) {
            spec.params[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }
    return spec;
}

static Result<ApiConfig> parse_api_config(const YAML::Node& node) {
    ApiConfig api;
    api.layout = node["layout"].as<std::string>(DEFAULT_LAYOUT);
    api.page_size = node["page_size"].as<int>(INSTANCE_PAGE_SIZE);
    if (api.page_size <= 0) api.page_size = INSTANCE_PAGE_SIZE;

    if (node["routes"] && node["routes"].IsMap()) {
        for (const auto& kv : node["routes"]) {
            std::string name = kv.first.as<std::string>();
            auto op = remote_op_from_name(name);
            if (!op) {
                return Result<ApiConfig>::Err("Unknown route '" + name + "' in api.routes");
            }
            api.route_overrides[*op] = parse_route_override(kv.second);
        }
    }

    // Validate early so a typo surfaces at load time, not on first call
    auto table = RouteTable::for_layout(api.layout, api.route_overrides);
    if (table.is_err()) {
        return Result<ApiConfig>::Err(table.error);
    }
    return Result<ApiConfig>::Ok(api);
}

static OperatorConfig parse_operator_config(const YAML::Node& node) {
    OperatorConfig ops;
    if (node["admins"]) {
        if (node["admins"].IsSequence()) {
            ops.admins = node["admins"].as<std::vector<std::string>>(std::vector<std::string>());
        } else if (node["admins"].IsScalar()) {
            ops.admins.push_back(node["admins"].as<std::string>());
        }
    }
    ops.self = node["self"].as<std::string>("");
    return ops;
}

static OutputConfig parse_output_config(const YAML::Node& node) {
    OutputConfig out;
    out.delay_ms = std::max(0, node["delay_ms"].as<int>(OUTPUT_LOG_DELAY_MS));
    out.tail_chars = node["tail_chars"].as<int>(OUTPUT_TAIL_CHARS);
    if (out.tail_chars <= 0) out.tail_chars = OUTPUT_TAIL_CHARS;
    return out;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.panel_ = parse_panel_config(root["panel"] ? root["panel"] : YAML::Node());

        auto api = parse_api_config(root["api"] ? root["api"] : YAML::Node());
        if (api.is_err()) {
            return Result<Config>::Err(api.error);
        }
        config.api_ = api.value;

        config.operators_ = parse_operator_config(root["operators"] ? root["operators"] : YAML::Node());
        config.output_ = parse_output_config(root["output"] ? root["output"] : YAML::Node());
        config.cooldown_secs_ = root["cooldown_secs"].as<int>(COOLDOWN_SECS);
        if (config.cooldown_secs_ < 0) config.cooldown_secs_ = COOLDOWN_SECS;

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Config not found at " + get_global_config_path().string());
    }

    std::ifstream in(get_global_config_path());
    if (!in) {
        return Result<Config>::Err("Cannot read " + get_global_config_path().string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text);
}

Result<Config> Config::load() {
    auto result = load_global();
    if (result.is_err()) {
        return result;
    }

    Config config = result.value;

    if (const char* url = std::getenv("FLEETCTL_URL")) {
        if (*url) config.panel_.url = url;
    }
    if (const char* key = std::getenv("FLEETCTL_API_KEY")) {
        if (*key) config.panel_.api_key = key;
    }

    // Key kept out of config.yaml: fall back to the credential store
    if (config.panel_.api_key.empty()) {
        auto stored = CredentialManager::instance().get("api_key");
        if (stored.is_ok()) {
            config.panel_.api_key = stored.value;
        }
    }

    return Result<Config>::Ok(config);
}
