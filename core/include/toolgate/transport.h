#pragma once

// JSON-RPC 2.0 client transport to a tool-provider process.
//
// StdioTransport frames one JSON message per line on the child's
// stdin/stdout. A reader thread correlates responses with pending requests
// by id, answers server-initiated "ping", and reports:
//   - asynchronous protocol problems through the error handler (never thrown)
//   - an unsolicited end of stream (child exit) through the close handler
// close() initiated by the owner does not invoke the close handler.

#include "descriptor.h"
#include "json.h"
#include "proc.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace toolgate {

// Raised by transports; the Client wraps it into a ConnectionError.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& msg, int rpc_code = 0)
        : std::runtime_error(msg), rpc_code_(rpc_code) {}

    // JSON-RPC error code when the server answered with an error object.
    int rpc_code() const { return rpc_code_; }

private:
    int rpc_code_;
};

class Transport {
public:
    using ErrorHandler = std::function<void(const std::string& message)>;
    using CloseHandler = std::function<void()>;

    virtual ~Transport() = default;

    // Blocks until the matching response arrives, the transport closes, or
    // `timeout` elapses. Returns the "result" member.
    virtual json::Value request(const std::string& method,
                                const json::Value& params,
                                std::chrono::milliseconds timeout) = 0;

    virtual void notify(const std::string& method, const json::Value& params) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual pid_t pid() const = 0;
};

class StdioTransport : public Transport {
public:
    // Throws TransportError if the process cannot be started. Handlers are
    // installed before the reader starts, so an immediate exit is not missed.
    static std::shared_ptr<StdioTransport> spawn(const std::string& executable,
                                                 const std::vector<std::string>& args,
                                                 const EnvMap& env,
                                                 const ProcLimits& lim,
                                                 ErrorHandler on_error,
                                                 CloseHandler on_close);

    ~StdioTransport() override;

    json::Value request(const std::string& method,
                        const json::Value& params,
                        std::chrono::milliseconds timeout) override;
    void notify(const std::string& method, const json::Value& params) override;

    void close() override;
    bool is_open() const override { return !closed_.load(); }
    pid_t pid() const override { return pid_; }

    // Upper bound for a single inbound line.
    static constexpr size_t MAX_MESSAGE_BYTES = 32 * 1024 * 1024;

private:
    StdioTransport() = default;

    struct Pending {
        std::promise<json::Value> promise;
    };

    void reader_loop();
    void dispatch(const std::string& line);
    void send(const json::Value& msg);
    void fail_all_pending(const std::string& why);
    void report_error(const std::string& msg);

    ChildProcess proc_;
    pid_t pid_{-1};
    int wake_fd_[2]{-1, -1};

    std::thread reader_;
    std::mutex mu_;                 // pending_, next_id_
    std::mutex write_mu_;           // serializes writes to the child's stdin
    std::mutex close_mu_;           // serializes close()
    std::unordered_map<int64_t, std::shared_ptr<Pending>> pending_;
    int64_t next_id_{1};
    ErrorHandler on_error_;
    CloseHandler on_close_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> closing_{false};
};

} // namespace toolgate
