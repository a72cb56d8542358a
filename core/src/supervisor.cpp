#include "toolgate/supervisor.h"
#include "toolgate/errors.h"
#include "toolgate/log.h"

#include <atomic>
#include <iostream>

namespace toolgate {

namespace {

// One-shot claim shared by the handshake path and the timer callback.
constexpr int CLAIM_PENDING = 0;
constexpr int CLAIM_HANDSHAKE = 1;
constexpr int CLAIM_TIMEOUT = 2;

// The initialize request itself waits a little longer than the timer, so
// the timer is always the one that reports a stalled handshake.
constexpr std::chrono::milliseconds REQUEST_SLACK{1000};

constexpr int CHILD_NICENESS = 10;

std::string connect_failure(const std::string& label, const std::string& why) {
    return "Failed to connect to MCP server \"" + label + "\": " + why;
}

json::Value failure_payload(const ConnectionError& e) {
    json::Value p = json::Value::object();
    p.set("kind", json::Value::string(connection_error_kind_name(e.kind())));
    p.set("message", json::Value::string(e.what()));
    return p;
}

} // namespace

json::Value initialize_params() {
    json::Value info = json::Value::object();
    info.set("name", json::Value::string(CLIENT_NAME));
    info.set("version", json::Value::string(CLIENT_VERSION));

    json::Value p = json::Value::object();
    p.set("protocolVersion", json::Value::string(MCP_PROTOCOL_VERSION));
    p.set("capabilities", json::Value::object());
    p.set("clientInfo", info);
    return p;
}

// --- Connection ---

Connection::Connection(std::string label, AdmissionTicket ticket, ClosedHandler on_unsolicited_close)
    : label_(std::move(label)),
      ticket_(std::move(ticket)),
      on_unsolicited_close_(std::move(on_unsolicited_close)) {}

Connection::~Connection() {
    close();
}

Connection::State Connection::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

bool Connection::admitted() const {
    std::lock_guard<std::mutex> lk(mu_);
    return ticket_.admitted();
}

pid_t Connection::pid() const {
    std::lock_guard<std::mutex> lk(mu_);
    return transport_ ? transport_->pid() : -1;
}

std::shared_ptr<Transport> Connection::transport() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_ == State::CONNECTED ? transport_ : nullptr;
}

bool Connection::close() {
    std::shared_ptr<Transport> t;
    std::shared_ptr<CancellableTimer> timer;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == State::CLOSED) return false;
        state_ = State::CLOSED;
        t = std::move(transport_);
        timer = std::move(timer_);
        ticket_.release();
    }
    // Outside the lock: terminate() may wait out the kill grace period.
    if (timer) timer->cancel();
    if (t) t->close();
    return true;
}

void Connection::on_transport_closed() {
    std::shared_ptr<Transport> t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        // While CONNECTING the pending initialize request fails on its own
        // and the supervisor unwinds.
        if (state_ != State::CONNECTED) return;
        state_ = State::CLOSED;
        t = std::move(transport_);
        ticket_.release();
    }
    json::Value p = json::Value::object();
    if (t) p.set("pid", json::Value::integer(static_cast<int64_t>(t->pid())));
    EventLog::global().event("transport_closed", label_, p);
    std::cerr << "[toolgate] server \"" << label_ << "\" closed the connection\n";

    // Reaps the exited child.
    if (t) t->close();
    if (on_unsolicited_close_) on_unsolicited_close_();
}

// --- ConnectionSupervisor ---

ConnectionSupervisor::ConnectionSupervisor(RuntimeOptions opt, EnvLookup lookup)
    : opt_(std::move(opt)), lookup_(std::move(lookup)) {}

ProcLimits ConnectionSupervisor::limits() const {
    ProcLimits lim;
    lim.rlimit_nofile = opt_.rlimit_nofile;
    lim.rlimit_fsize_mb = opt_.rlimit_fsize_mb;
    lim.rlimit_as_mb = opt_.rlimit_as_mb;
    lim.no_new_privs = opt_.no_new_privs;
    lim.kill_grace_ms = opt_.kill_grace_ms;
    return lim;
}

void ConnectionSupervisor::connect(const ValidatedCommand& cmd,
                                   const std::string& executable,
                                   const std::shared_ptr<Connection>& conn) {
    const std::string label = cmd.label();
    const auto timeout = handshake_timeout();

    try {
        EnvMap env = build_child_environment(cmd.env(), lookup_);

        std::weak_ptr<Connection> weak_conn = conn;
        std::shared_ptr<Transport> transport;
        try {
            transport = StdioTransport::spawn(
                executable, cmd.args(), env, limits(),
                [label](const std::string& msg) {
                    std::cerr << "[warn] MCP transport error for \"" << label << "\": " << msg << "\n";
                    json::Value p = json::Value::object();
                    p.set("message", json::Value::string(msg));
                    EventLog::global().event("transport_error", label, p);
                },
                [weak_conn] {
                    if (auto c = weak_conn.lock()) c->on_transport_closed();
                });
        } catch (const std::exception& e) {
            throw ConnectionError(ConnectionError::Kind::SPAWN_FAILED,
                                  connect_failure(label, e.what()), label, {},
                                  std::current_exception());
        }

        auto claim = std::make_shared<std::atomic<int>>(CLAIM_PENDING);
        std::weak_ptr<Transport> weak_transport = transport;
        auto timer = std::make_shared<CancellableTimer>(timeout, [claim, weak_transport] {
            int expected = CLAIM_PENDING;
            if (!claim->compare_exchange_strong(expected, CLAIM_TIMEOUT)) return;
            // Fails the in-flight initialize request immediately.
            if (auto t = weak_transport.lock()) t->close();
        });

        // t is this thread's own reference; conn->transport_ is only touched
        // under conn->mu_ since close() may take it at any moment.
        std::shared_ptr<Transport> t;
        {
            std::lock_guard<std::mutex> lk(conn->mu_);
            if (conn->state_ == Connection::State::CONNECTING) {
                conn->transport_ = transport;
                conn->timer_ = timer;
                t = std::move(transport);
            }
        }
        if (transport) {
            // close() won before the transport was attached.
            timer->cancel();
            transport->close();
            throw ConnectionError(ConnectionError::Kind::CLOSED,
                                  "MCP client for \"" + label + "\" was closed while connecting",
                                  label);
        }
        std::exception_ptr failure;
        std::string failure_msg;
        if (t) {
            try {
                json::Value result = t->request("initialize", initialize_params(), timeout + REQUEST_SLACK);
                if (!result.is_object()) {
                    throw TransportError("initialize returned a non-object result");
                }
                t->notify("notifications/initialized", json::Value());
            } catch (const TransportError& e) {
                failure = std::current_exception();
                failure_msg = e.what();
            }
        }

        timer->cancel();
        int expected = CLAIM_PENDING;
        const bool handshake_won = claim->compare_exchange_strong(expected, CLAIM_HANDSHAKE);

        std::lock_guard<std::mutex> lk(conn->mu_);
        conn->timer_.reset();
        if (conn->state_ != Connection::State::CONNECTING || !t) {
            throw ConnectionError(ConnectionError::Kind::CLOSED,
                                  "MCP client for \"" + label + "\" was closed while connecting",
                                  label, {}, failure);
        }
        if (!handshake_won) {
            throw ConnectionError(ConnectionError::Kind::TIMEOUT,
                                  "Timed out after " + std::to_string(timeout.count()) +
                                      "ms connecting to \"" + label + "\"",
                                  label, {}, failure);
        }
        if (failure) {
            throw ConnectionError(ConnectionError::Kind::HANDSHAKE_FAILED,
                                  connect_failure(label, failure_msg), label, {}, failure);
        }
        if (!t->is_open()) {
            throw ConnectionError(ConnectionError::Kind::HANDSHAKE_FAILED,
                                  connect_failure(label, "server exited during the handshake"), label);
        }
        conn->ticket_.admit();
        conn->state_ = Connection::State::CONNECTED;

        lower_priority(t->pid(), CHILD_NICENESS);

        json::Value p = json::Value::object();
        p.set("pid", json::Value::integer(static_cast<int64_t>(t->pid())));
        p.set("executable", json::Value::string(executable));
        EventLog::global().event("connect_ok", label, p);
    } catch (const ConnectionError& e) {
        conn->close();
        EventLog::global().event("connect_failed", label, failure_payload(e));
        throw;
    } catch (const std::exception& e) {
        conn->close();
        ConnectionError wrapped(ConnectionError::Kind::HANDSHAKE_FAILED,
                                connect_failure(label, e.what()), label, {},
                                std::current_exception());
        EventLog::global().event("connect_failed", label, failure_payload(wrapped));
        throw wrapped;
    }
}

} // namespace toolgate
