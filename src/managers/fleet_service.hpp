#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <remote/http_transport.hpp>
#include <remote/remote_client.hpp>
#include "authorization_store.hpp"
#include "cooldown_gate.hpp"
#include "instance_directory.hpp"
#include "status_aggregator.hpp"

// Outcome of start / stop / send_command, for any frontend to render.
struct OperationResult {
    enum Status {
        OK,
        NOT_FOUND,          // identifier matched nothing in the current snapshot
        AMBIGUOUS,          // name shared by several instances
        COOLDOWN,           // rejected by the cooldown gate, not a failure
        REMOTE_ERROR,       // transport, panel or decode failure
        NOT_CONNECTED,
    } status = NOT_CONNECTED;

    std::string identifier;             // trimmed user input
    std::string instance_name;          // display name when resolved
    InstanceRef ref;
    int remote_status = 0;              // ApiResult status for REMOTE_ERROR
    std::string error;
    int cooldown_remaining_secs = 0;
    std::optional<std::string> output;  // send_command: tail of the console log

    bool ok() const { return status == OK; }
};

// Keep the last `max_chars` bytes of a console log, prefixed with "..."
// when cut. Never splits a UTF-8 sequence.
std::string tail_output(const std::string& log, size_t max_chars);

// Collaborators the service would otherwise create itself
struct ServiceDeps {
    std::shared_ptr<HttpTransport> transport;   // default: CurlTransport
    CooldownGate::NowFn now;                    // default: steady_clock
    std::filesystem::path operators_file;       // default: ~/.fleetctl/operators.yaml
};

// Headless service facade. Owns the remote client, directory, cooldown
// gate and allow-list; can be used by any frontend.
class FleetService {
public:
    // Loads ~/.fleetctl/config.yaml
    FleetService();
    explicit FleetService(Config config, ServiceDeps deps = {});
    ~FleetService();

    // ── Lifecycle ─────────────────────────────────────────────

    // Build the route table, client and directory from config.
    Result<void> connect();
    void disconnect();
    bool is_connected() const { return client_ != nullptr; }

    // ── Fleet operations ──────────────────────────────────────

    // Refresh the directory and return the new snapshot.
    RefreshOutcome list(StatusCallback cb = nullptr);

    OperationResult start(const std::string& identifier);
    OperationResult stop(const std::string& identifier);

    // Not subject to the cooldown gate. Waits output.delay_ms after a
    // successful send, then reads the console log tail.
    OperationResult send_command(const std::string& identifier, const std::string& text);

    // Fleet-wide totals from the overview.
    Result<FleetSummary> status();

    // ── Operators ─────────────────────────────────────────────

    // With no admins configured every operator counts as admin
    bool is_admin(const std::string& operator_id) const;
    bool is_authorized(const std::string& operator_id) const;

    // Admin-only changes to the allow-list
    Result<void> authorize(const std::string& actor, const std::string& operator_id);
    Result<void> revoke(const std::string& actor, const std::string& operator_id);
    std::vector<std::string> list_operators() const;

    // ── State queries ─────────────────────────────────────────

    bool has_config() const { return config_.has_value(); }
    const Config& config() const { return config_.value(); }
    Result<void> reload_config();

    InstanceDirectory* directory() { return directory_.get(); }
    CooldownGate& cooldown() { return cooldown_; }
    const AuthorizationStore& operators() const { return operators_; }

private:
    std::optional<Config> config_;
    std::shared_ptr<HttpTransport> transport_;
    CooldownGate cooldown_;
    AuthorizationStore operators_;
    std::unique_ptr<RemoteClient> client_;
    std::unique_ptr<InstanceDirectory> directory_;

    // Shared path for start/stop: resolve, gate, call, roll back on failure
    OperationResult control(RemoteOp op, const std::string& identifier);

    // Resolve into `out`; false if `out` already carries the failure
    bool resolve_into(const std::string& identifier, OperationResult& out) const;
};
