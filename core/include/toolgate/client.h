#pragma once

// Client: the object callers hold for one tool-provider server.
//
//   DISCONNECTED --connect ok--> CONNECTED --close / server exit / drain--> CLOSED
//   DISCONNECTED --connect fails--> DISCONNECTED (terminal: connect is refused)
//   any state --close--> CLOSED
//
// A client registers itself with its ClientRuntime on creation and leaves
// the registry when it closes (explicitly, because the server went away, or
// because connect failed) or is destroyed.

#include "config.h"
#include "descriptor.h"
#include "env.h"
#include "json.h"
#include "proc.h"
#include "resolver.h"
#include "runtime.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolgate {

class Connection;
class Transport;

struct ToolInfo {
    std::string name;
    std::optional<std::string> description;
    json::Value input_schema;   // {} when the server omits it
};

struct ClientOptions {
    RuntimeOptions runtime = load_runtime_options();
    EnvLookup env = process_env_lookup();
    // Snapshot of the host (PATH, cwd, ...) taken at connect() when unset.
    std::optional<ResolveOptions> resolve;
};

// Upper bound on tools/list pages followed for one listing.
constexpr int MAX_TOOL_PAGES = 100;

class Client : public std::enable_shared_from_this<Client> {
public:
    enum class State { DISCONNECTED, CONNECTING, CONNECTED, CLOSED };

    static std::shared_ptr<Client> create(const std::string& label);
    static std::shared_ptr<Client> create(const std::string& label, ClientRuntime& rt, ClientOptions opt = {});

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Validates, resolves, admits, spawns and handshakes. ValidationError and
    // NotFoundError propagate unchanged; everything else is a ConnectionError.
    void connect(const ConnectionDescriptor& d);

    std::vector<ToolInfo> list_tools();

    // First content item of the result, or {} when there is none. Every
    // failure is a ConnectionError whose tool() is `name`.
    json::Value call_tool(const std::string& name, const json::Value& args);

    // Idempotent. Always ends CLOSED and unregistered; throws
    // ConnectionError(CLOSE_FAILED) only after doing both.
    void close();

    State state() const;
    bool is_connected() const { return state() == State::CONNECTED; }
    const std::string& label() const { return label_; }
    pid_t pid() const;

    ClientRuntime& runtime() const { return rt_; }

private:
    Client(std::string label, ClientRuntime& rt, ClientOptions opt);

    // Throws CLOSED or NOT_CONNECTED, naming `tool` when one is given.
    std::shared_ptr<Transport> live_transport(const std::string& what, const std::string& tool = {}) const;
    void handle_disconnect();
    void unwind_failed_connect();

    const std::string label_;
    ClientRuntime& rt_;
    const ClientOptions opt_;

    mutable std::mutex mu_;
    State state_{State::DISCONNECTED};
    bool failed_{false};
    std::shared_ptr<Connection> conn_;
};

const char* client_state_name(Client::State s);

} // namespace toolgate
