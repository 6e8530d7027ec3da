#include "preflight.hpp"
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <fmt/format.h>

std::vector<PreflightIssue> check_global_config() {
    std::vector<PreflightIssue> issues;

    if (!global_config_exists()) {
        issues.push_back({
            "Global config not found at " + get_global_config_path().string(),
            "Run 'fleetctl setup'"
        });
        return issues;
    }

    auto result = Config::load();
    if (result.is_err()) {
        issues.push_back({"Failed to load global config: " + result.error, "Check YAML syntax"});
        return issues;
    }

    const auto& cfg = result.value;
    const std::string& url = cfg.panel().url;
    if (url.empty()) {
        issues.push_back({"Panel URL not configured", "Set panel.url in ~/.fleetctl/config.yaml"});
    } else if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        issues.push_back({
            fmt::format("Panel URL '{}' has no http:// or https:// scheme", url),
            "Fix panel.url in ~/.fleetctl/config.yaml"
        });
    }

    if (cfg.operators().admins.empty()) {
        issues.push_back({
            "No admins configured, every operator may op and deop",
            "List admin ids under operators.admins",
            true
        });
    }

    return issues;
}

std::vector<PreflightIssue> check_api_key() {
    std::vector<PreflightIssue> issues;

    auto result = Config::load();
    if (result.is_ok() && result.value.panel().api_key.empty()) {
        issues.push_back({"No API key configured", "Run 'fleetctl setup' or set FLEETCTL_API_KEY"});
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks() {
    std::vector<PreflightIssue> all;

    // No point checking the key if the config itself is missing or broken
    auto config_issues = check_global_config();
    all.insert(all.end(), config_issues.begin(), config_issues.end());
    for (const auto& issue : config_issues) {
        if (!issue.is_hint) return all;
    }

    auto key_issues = check_api_key();
    all.insert(all.end(), key_issues.begin(), key_issues.end());

    return all;
}
