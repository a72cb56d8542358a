#pragma once

// Spawn-and-handshake sequence for one stdio server, and the Connection it
// produces.
//
// A Connection is CONNECTING from creation until the handshake either wins
// the race against the timeout (CONNECTED) or fails (CLOSED). Every path to
// CLOSED goes through one critical section, so the admission ticket is
// released exactly once no matter whether the owner, the shutdown drain, or
// the transport's own close notification gets there first.

#include "config.h"
#include "env.h"
#include "runtime.h"
#include "timer.h"
#include "transport.h"
#include "validator.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace toolgate {

// MCP protocol revision spoken during the handshake.
constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";
constexpr const char* CLIENT_NAME = "toolgate";
constexpr const char* CLIENT_VERSION = "1.0.0";

class Connection {
public:
    enum class State { CONNECTING, CONNECTED, CLOSED };

    // Invoked (from the transport's reader thread) when a CONNECTED
    // connection closes without the owner asking for it.
    using ClosedHandler = std::function<void()>;

    Connection(std::string label, AdmissionTicket ticket, ClosedHandler on_unsolicited_close = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    State state() const;
    const std::string& label() const { return label_; }
    bool admitted() const;
    pid_t pid() const;

    // Null unless CONNECTED.
    std::shared_ptr<Transport> transport() const;

    // Idempotent. Cancels a pending handshake timer, releases the admission
    // ticket and closes the transport (terminating the child). Returns true
    // if this call performed the teardown.
    bool close();

private:
    friend class ConnectionSupervisor;

    void on_transport_closed();

    const std::string label_;
    mutable std::mutex mu_;
    State state_{State::CONNECTING};
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<CancellableTimer> timer_;
    AdmissionTicket ticket_;
    ClosedHandler on_unsolicited_close_;
};

class ConnectionSupervisor {
public:
    explicit ConnectionSupervisor(RuntimeOptions opt, EnvLookup lookup = process_env_lookup());

    // Spawns `executable` with the validated arguments and environment, then
    // races initialize + notifications/initialized against the handshake
    // timeout. On success the connection's ticket is admitted and the
    // connection is CONNECTED. On failure the connection is closed (child
    // reaped, reservation returned) before ConnectionError propagates.
    void connect(const ValidatedCommand& cmd,
                 const std::string& executable,
                 const std::shared_ptr<Connection>& conn);

    std::chrono::milliseconds handshake_timeout() const {
        return std::chrono::milliseconds(opt_.handshake_timeout_ms);
    }

    const RuntimeOptions& options() const { return opt_; }

private:
    ProcLimits limits() const;

    RuntimeOptions opt_;
    EnvLookup lookup_;
};

// Params object for the initialize request.
json::Value initialize_params();

} // namespace toolgate
