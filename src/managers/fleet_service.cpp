#include "fleet_service.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

std::string tail_output(const std::string& log, size_t max_chars) {
    if (log.size() <= max_chars) return log;

    size_t start = log.size() - max_chars;
    // Skip UTF-8 continuation bytes so the tail starts on a character
    while (start < log.size() &&
           (static_cast<unsigned char>(log[start]) & 0xC0) == 0x80) {
        ++start;
    }
    return "..." + log.substr(start);
}

static std::filesystem::path operators_path(const ServiceDeps& deps) {
    return deps.operators_file.empty() ? get_fleetctl_root() / "operators.yaml"
                                       : deps.operators_file;
}

FleetService::FleetService()
    : transport_(std::make_shared<CurlTransport>()),
      cooldown_(std::chrono::seconds(COOLDOWN_SECS)),
      operators_(operators_path({})) {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config_ = config_result.value;
        cooldown_.set_window(std::chrono::seconds(config_->cooldown_secs()));
    }
}

FleetService::FleetService(Config config, ServiceDeps deps)
    : config_(std::move(config)),
      transport_(deps.transport ? deps.transport : std::make_shared<CurlTransport>()),
      cooldown_(std::chrono::seconds(config_->cooldown_secs()), deps.now),
      operators_(operators_path(deps)) {}

FleetService::~FleetService() {
    disconnect();
}

// ── Lifecycle ─────────────────────────────────────────────────

Result<void> FleetService::connect() {
    if (!config_.has_value()) {
        auto config_result = Config::load();
        if (config_result.is_err()) {
            return Result<void>::Err(config_result.error);
        }
        config_ = config_result.value;
        cooldown_.set_window(std::chrono::seconds(config_->cooldown_secs()));
    }

    const auto& cfg = config_.value();
    if (cfg.panel().url.empty()) {
        return Result<void>::Err("Panel URL is not configured");
    }

    auto routes = RouteTable::for_layout(cfg.api().layout, cfg.api().route_overrides);
    if (routes.is_err()) {
        return Result<void>::Err(routes.error);
    }

    directory_.reset();
    client_ = std::make_unique<RemoteClient>(cfg.panel(), routes.value, transport_);
    directory_ = std::make_unique<InstanceDirectory>(*client_, cfg.api().page_size);

    fleet_log(fmt::format("Service: connected to {} (layout {})", cfg.panel().url, cfg.api().layout));
    return Result<void>::Ok();
}

void FleetService::disconnect() {
    // Directory holds a reference to the client
    directory_.reset();
    client_.reset();
}

Result<void> FleetService::reload_config() {
    auto config_result = Config::load();
    if (config_result.is_err()) {
        return Result<void>::Err(config_result.error);
    }
    config_ = config_result.value;
    cooldown_.set_window(std::chrono::seconds(config_->cooldown_secs()));
    if (is_connected()) {
        return connect();
    }
    return Result<void>::Ok();
}

// ── Fleet operations ──────────────────────────────────────────

RefreshOutcome FleetService::list(StatusCallback cb) {
    if (!directory_) {
        RefreshOutcome outcome;
        outcome.status = RefreshOutcome::NO_NODES;
        outcome.error = "Not connected";
        return outcome;
    }
    return directory_->refresh(cb);
}

bool FleetService::resolve_into(const std::string& identifier, OperationResult& out) const {
    auto resolved = directory_->resolve(identifier);
    out.identifier = resolved.identifier;

    switch (resolved.status) {
    case ResolveOutcome::AMBIGUOUS:
        out.status = OperationResult::AMBIGUOUS;
        return false;
    case ResolveOutcome::NOT_FOUND:
        out.status = OperationResult::NOT_FOUND;
        return false;
    case ResolveOutcome::FOUND:
        break;
    }

    out.ref = resolved.ref;
    auto snap = directory_->snapshot();
    const InstanceInfo* inst = snap->find_instance(out.ref.unique_id);
    out.instance_name = inst ? inst->name : out.identifier;
    return true;
}

OperationResult FleetService::control(RemoteOp op, const std::string& identifier) {
    OperationResult out;
    if (!directory_) {
        out.error = "Not connected";
        return out;
    }
    if (!resolve_into(identifier, out)) {
        return out;
    }

    auto stamp = cooldown_.try_acquire(out.ref.unique_id);
    if (!stamp) {
        out.status = OperationResult::COOLDOWN;
        out.cooldown_remaining_secs = cooldown_.remaining_secs(out.ref.unique_id);
        return out;
    }

    auto result = client_->call(op, {
        {"instance", out.ref.unique_id},
        {"node", out.ref.node_id},
    });

    if (!result.ok()) {
        // A failed attempt should not lock the operator out
        cooldown_.release(out.ref.unique_id, *stamp);
        out.status = OperationResult::REMOTE_ERROR;
        out.remote_status = result.status;
        out.error = result.message();
        return out;
    }

    fleet_log(fmt::format("Service: {} {} ({}) on {}", remote_op_name(op),
                          out.instance_name, out.ref.unique_id, out.ref.node_id));
    out.status = OperationResult::OK;
    return out;
}

OperationResult FleetService::start(const std::string& identifier) {
    return control(RemoteOp::Start, identifier);
}

OperationResult FleetService::stop(const std::string& identifier) {
    return control(RemoteOp::Stop, identifier);
}

OperationResult FleetService::send_command(const std::string& identifier, const std::string& text) {
    OperationResult out;
    if (!directory_) {
        out.error = "Not connected";
        return out;
    }
    if (!resolve_into(identifier, out)) {
        return out;
    }

    auto sent = client_->call(RemoteOp::SendCommand, {
        {"instance", out.ref.unique_id},
        {"node", out.ref.node_id},
        {"command", text},
    });
    if (!sent.ok()) {
        out.status = OperationResult::REMOTE_ERROR;
        out.remote_status = sent.status;
        out.error = sent.message();
        return out;
    }
    out.status = OperationResult::OK;

    // Give the instance a moment to print before reading its log
    platform::sleep_ms(config_->output().delay_ms);

    auto log = client_->call(RemoteOp::OutputLog, {
        {"instance", out.ref.unique_id},
        {"node", out.ref.node_id},
    });
    if (log.ok() && log.data && log.data->isString()) {
        out.output = tail_output(log.data->asString(),
                                 static_cast<size_t>(config_->output().tail_chars));
    }
    return out;
}

Result<FleetSummary> FleetService::status() {
    if (!client_) {
        return Result<FleetSummary>::Err("Not connected");
    }

    auto overview = client_->call(RemoteOp::ListNodes);
    if (!overview.ok()) {
        return Result<FleetSummary>::Err(
            fmt::format("[{}] {}", overview.status, overview.message("unknown connection error")));
    }

    FleetSummary summary = summarize(overview.data.value_or(Json::Value()));
    summary.data_time_ms = overview.time_ms;
    return Result<FleetSummary>::Ok(summary);
}

// ── Operators ─────────────────────────────────────────────────

bool FleetService::is_admin(const std::string& operator_id) const {
    if (!config_.has_value()) return false;
    // No admins configured: single-operator install, everyone is admin
    if (config_->operators().admins.empty()) return !operator_id.empty();
    return config_->is_admin(operator_id);
}

bool FleetService::is_authorized(const std::string& operator_id) const {
    return is_admin(operator_id) || operators_.is_authorized(operator_id);
}

Result<void> FleetService::authorize(const std::string& actor, const std::string& operator_id) {
    if (!is_admin(actor)) {
        return Result<void>::Err("Only admins can authorize operators");
    }
    auto result = operators_.add(operator_id);
    if (result.is_ok()) {
        fleet_log(fmt::format("Service: {} authorized {}", actor, operator_id));
    }
    return result;
}

Result<void> FleetService::revoke(const std::string& actor, const std::string& operator_id) {
    if (!is_admin(actor)) {
        return Result<void>::Err("Only admins can revoke operators");
    }
    auto result = operators_.remove(operator_id);
    if (result.is_ok()) {
        fleet_log(fmt::format("Service: {} revoked {}", actor, operator_id));
    }
    return result;
}

std::vector<std::string> FleetService::list_operators() const {
    return operators_.list();
}
