#include "toolgate/client.h"
#include "toolgate/errors.h"
#include "toolgate/log.h"
#include "toolgate/shutdown.h"
#include "toolgate/supervisor.h"
#include "toolgate/validator.h"

#include <iostream>

namespace toolgate {

const char* client_state_name(Client::State s) {
    switch (s) {
        case Client::State::DISCONNECTED: return "disconnected";
        case Client::State::CONNECTING: return "connecting";
        case Client::State::CONNECTED: return "connected";
        case Client::State::CLOSED: return "closed";
    }
    return "unknown";
}

std::shared_ptr<Client> Client::create(const std::string& label) {
    return create(label, ClientRuntime::global());
}

std::shared_ptr<Client> Client::create(const std::string& label, ClientRuntime& rt, ClientOptions opt) {
    const bool hook = opt.runtime.install_shutdown_hook;
    std::shared_ptr<Client> c(new Client(label, rt, std::move(opt)));
    rt.add(c);
    if (hook && &rt == &ClientRuntime::global()) ShutdownCoordinator::install();
    return c;
}

Client::Client(std::string label, ClientRuntime& rt, ClientOptions opt)
    : label_(std::move(label)), rt_(rt), opt_(std::move(opt)) {}

Client::~Client() {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lk(mu_);
        conn = std::move(conn_);
        state_ = State::CLOSED;
    }
    if (conn) {
        try {
            conn->close();
        } catch (const std::exception& e) {
            std::cerr << "[warn] Error closing MCP client for \"" << label_ << "\": " << e.what() << "\n";
        }
    }
    rt_.remove(this);
}

Client::State Client::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

pid_t Client::pid() const {
    std::lock_guard<std::mutex> lk(mu_);
    return conn_ ? conn_->pid() : -1;
}

void Client::connect(const ConnectionDescriptor& d) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == State::CONNECTED || state_ == State::CONNECTING) {
            throw ConnectionError(ConnectionError::Kind::ALREADY_CONNECTED,
                                  "MCP client for \"" + label_ + "\" is already connected", label_);
        }
        if (state_ == State::CLOSED) {
            throw ConnectionError(ConnectionError::Kind::CLOSED,
                                  "MCP client for \"" + label_ + "\" is closed", label_);
        }
        if (failed_) {
            throw ConnectionError(ConnectionError::Kind::CLOSED,
                                  "MCP client for \"" + label_ + "\" failed to connect and cannot be reused",
                                  label_);
        }
        state_ = State::CONNECTING;
    }

    try {
        if (d.label != label_) {
            throw ValidationError("Server label \"" + d.label + "\" does not match client \"" + label_ + "\"",
                                  label_, "label");
        }
        if (d.transport != TransportKind::STDIO) {
            throw ConnectionError(ConnectionError::Kind::UNSUPPORTED_TRANSPORT,
                                  "Server \"" + label_ + "\" is misconfigured: only STDIO transport is supported",
                                  label_);
        }

        ValidatedCommand cmd = validate(d, opt_.env);
        const ResolveOptions ro = opt_.resolve ? *opt_.resolve : ResolveOptions::from_environment();
        const std::string exe = resolve_executable(cmd.command(), label_, ro);

        AdmissionTicket ticket = AdmissionTicket::reserve(rt_);
        if (!ticket) {
            throw ConnectionError(ConnectionError::Kind::BUDGET_EXHAUSTED,
                                  "Maximum concurrent MCP connections (" +
                                      std::to_string(rt_.max_concurrent()) + ") reached",
                                  label_);
        }

        std::weak_ptr<Client> weak = shared_from_this();
        auto conn = std::make_shared<Connection>(label_, std::move(ticket), [weak] {
            if (auto c = weak.lock()) c->handle_disconnect();
        });
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (state_ != State::CONNECTING) {
                throw ConnectionError(ConnectionError::Kind::CLOSED,
                                      "MCP client for \"" + label_ + "\" was closed while connecting", label_);
            }
            conn_ = conn;
        }

        ConnectionSupervisor sup(opt_.runtime, opt_.env);
        sup.connect(cmd, exe, conn);

        bool raced = false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (state_ == State::CONNECTING) state_ = State::CONNECTED;
            else raced = true;
        }
        if (raced) {
            conn->close();
            throw ConnectionError(ConnectionError::Kind::CLOSED,
                                  "MCP client for \"" + label_ + "\" was closed while connecting", label_);
        }
    } catch (const Error&) {
        unwind_failed_connect();
        throw;
    } catch (const std::exception& e) {
        unwind_failed_connect();
        throw ConnectionError(ConnectionError::Kind::HANDSHAKE_FAILED,
                              "Failed to connect to MCP server \"" + label_ + "\": " + e.what(),
                              label_, {}, std::current_exception());
    }
}

void Client::unwind_failed_connect() {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lk(mu_);
        conn = std::move(conn_);
        if (state_ == State::CONNECTING) {
            state_ = State::DISCONNECTED;
            failed_ = true;
        }
    }
    if (conn) conn->close();
    rt_.remove(this);
}

void Client::handle_disconnect() {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == State::CLOSED) return;
        state_ = State::CLOSED;
        conn = std::move(conn_);
    }
    rt_.remove(this);
}

std::shared_ptr<Transport> Client::live_transport(const std::string& what, const std::string& tool) const {
    std::shared_ptr<Transport> t;
    State s;
    {
        std::lock_guard<std::mutex> lk(mu_);
        s = state_;
        if (s == State::CONNECTED && conn_) t = conn_->transport();
    }
    if (t) return t;
    if (s == State::CLOSED) {
        throw ConnectionError(ConnectionError::Kind::CLOSED,
                              "Cannot " + what + ": MCP client for \"" + label_ + "\" is closed", label_, tool);
    }
    throw ConnectionError(ConnectionError::Kind::NOT_CONNECTED,
                          "Cannot " + what + ": MCP client for \"" + label_ + "\" is not connected (" +
                              client_state_name(s) + ")",
                          label_, tool);
}

std::vector<ToolInfo> Client::list_tools() {
    std::shared_ptr<Transport> t = live_transport("list tools");
    const std::chrono::milliseconds timeout(opt_.runtime.handshake_timeout_ms);
    const std::string prefix = "Failed to list tools from server \"" + label_ + "\": ";

    std::vector<ToolInfo> out;
    std::string cursor;
    for (int page = 0; page < MAX_TOOL_PAGES; page++) {
        json::Value params = json::Value::object();
        if (!cursor.empty()) params.set("cursor", json::Value::string(cursor));

        json::Value res;
        try {
            res = t->request("tools/list", params, timeout);
        } catch (const TransportError& e) {
            throw ConnectionError(ConnectionError::Kind::CALL_FAILED, prefix + e.what(), label_, {},
                                  std::current_exception());
        }

        json::Value tools = res.at("tools");
        if (!tools.is_array()) {
            throw ConnectionError(ConnectionError::Kind::CALL_FAILED,
                                  prefix + "result has no \"tools\" array", label_);
        }
        for (size_t i = 0; i < tools.size(); i++) {
            json::Value tool = tools.at(i);
            auto name = tool.get_string("name");
            if (!name) {
                throw ConnectionError(ConnectionError::Kind::CALL_FAILED,
                                      prefix + "tool #" + std::to_string(out.size()) + " has no name",
                                      label_);
            }
            ToolInfo info;
            info.name = *name;
            auto desc = tool.get_string("description");
            if (desc && !desc->empty()) info.description = *desc;
            json::Value schema = tool.at("inputSchema");
            info.input_schema = schema.is_object() ? schema : json::Value::object();
            out.push_back(std::move(info));
        }

        auto next = res.get_string("nextCursor");
        if (!next || next->empty()) return out;
        cursor = *next;
    }
    throw ConnectionError(ConnectionError::Kind::CALL_FAILED,
                          prefix + "more than " + std::to_string(MAX_TOOL_PAGES) + " pages", label_);
}

json::Value Client::call_tool(const std::string& name, const json::Value& args) {
    if (args && !args.is_object()) {
        throw ConnectionError(ConnectionError::Kind::CALL_FAILED,
                              "Failed to call tool \"" + name + "\" on server \"" + label_ +
                                  "\": arguments must be a JSON object",
                              label_, name);
    }
    std::shared_ptr<Transport> t = live_transport("call tool \"" + name + "\"", name);
    const std::chrono::milliseconds timeout(opt_.runtime.handshake_timeout_ms);

    json::Value params = json::Value::object();
    params.set("name", json::Value::string(name));
    params.set("arguments", args ? args : json::Value::object());

    json::Value res;
    try {
        res = t->request("tools/call", params, timeout);
    } catch (const TransportError& e) {
        throw ConnectionError(ConnectionError::Kind::CALL_FAILED,
                              "Failed to call tool \"" + name + "\" on server \"" + label_ + "\": " + e.what(),
                              label_, name, std::current_exception());
    }

    json::Value content = res.at("content");
    if (content.is_array()) {
        return content.size() > 0 ? content.at(0) : json::Value::object();
    }
    return content ? content : json::Value::object();
}

void Client::close() {
    std::shared_ptr<Connection> conn;
    bool first = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        first = state_ != State::CLOSED;
        state_ = State::CLOSED;
        conn = std::move(conn_);
    }

    std::exception_ptr failure;
    std::string why;
    if (conn) {
        try {
            conn->close();
        } catch (const std::exception& e) {
            failure = std::current_exception();
            why = e.what();
        }
    }
    rt_.remove(this);

    if (first) EventLog::global().event("close", label_);
    if (failure) {
        std::cerr << "[warn] Error closing MCP client for \"" << label_ << "\": " << why << "\n";
        throw ConnectionError(ConnectionError::Kind::CLOSE_FAILED,
                              "Error closing MCP client for \"" + label_ + "\": " + why, label_, {}, failure);
    }
}

} // namespace toolgate
