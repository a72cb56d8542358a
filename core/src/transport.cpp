#include "toolgate/transport.h"
#include "toolgate/env.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>

#ifndef _WIN32
  #include <fcntl.h>
  #include <poll.h>
  #include <signal.h>
  #include <unistd.h>
#endif

namespace toolgate {

static constexpr int RPC_METHOD_NOT_FOUND = -32601;

static void ignore_sigpipe_once() {
#ifndef _WIN32
    // A server that dies mid-write must surface as EPIPE, not kill the host.
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
#endif
}

static std::string clip(const std::string& s, size_t n = 200) {
    if (s.size() <= n) return s;
    return s.substr(0, n) + "...";
}

std::shared_ptr<StdioTransport> StdioTransport::spawn(const std::string& executable,
                                                      const std::vector<std::string>& args,
                                                      const EnvMap& env,
                                                      const ProcLimits& lim,
                                                      ErrorHandler on_error,
                                                      CloseHandler on_close) {
#ifdef _WIN32
    (void)executable; (void)args; (void)env; (void)lim; (void)on_error; (void)on_close;
    throw TransportError("stdio transport is not supported on Windows in this build");
#else
    ignore_sigpipe_once();

    std::shared_ptr<StdioTransport> t(new StdioTransport());
    t->on_error_ = std::move(on_error);
    t->on_close_ = std::move(on_close);

    if (pipe(t->wake_fd_) != 0) {
        throw TransportError(std::string("pipe(wake) failed: ") + std::strerror(errno));
    }
    for (int fd : t->wake_fd_) {
        int flags = fcntl(fd, F_GETFD, 0);
        if (flags >= 0) (void)fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(executable);
    argv.insert(argv.end(), args.begin(), args.end());

    std::string err;
    if (!t->proc_.spawn(executable, argv, to_envp(env), lim, &err)) {
        throw TransportError("failed to start " + executable + ": " + err);
    }
    t->pid_ = t->proc_.pid();

    t->reader_ = std::thread([raw = t.get()] { raw->reader_loop(); });
    return t;
#endif
}

StdioTransport::~StdioTransport() {
    close();
#ifndef _WIN32
    for (int& fd : wake_fd_) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
#endif
}

void StdioTransport::report_error(const std::string& msg) {
    if (on_error_) on_error_(msg);
    else std::cerr << "[transport] " << msg << "\n";
}

void StdioTransport::reader_loop() {
#ifndef _WIN32
    const int out_fd = proc_.stdout_fd();
    std::string buf;
    char chunk[8192];
    bool eof = false;

    while (true) {
        struct pollfd fds[2];
        fds[0].fd = out_fd;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wake_fd_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int pr = poll(fds, 2, -1);
        if (pr < 0) {
            if (errno == EINTR) continue;
            report_error(std::string("poll failed: ") + std::strerror(errno));
            eof = true;
            break;
        }
        if (fds[1].revents != 0) break;  // close() requested
        if (fds[0].revents == 0) continue;

        ssize_t n = read(out_fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            report_error(std::string("read failed: ") + std::strerror(errno));
            eof = true;
            break;
        }
        if (n == 0) {
            eof = true;
            break;
        }
        buf.append(chunk, (size_t)n);

        size_t pos;
        while ((pos = buf.find('\n')) != std::string::npos) {
            std::string line = buf.substr(0, pos);
            buf.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) dispatch(line);
        }
        if (buf.size() > MAX_MESSAGE_BYTES) {
            report_error("inbound message exceeds " + std::to_string(MAX_MESSAGE_BYTES) + " bytes; dropped");
            buf.clear();
        }
    }

    if (eof && !closing_.load()) {
        closed_.store(true);
        fail_all_pending("server process closed the connection");
        // The handler may drop the last reference to this transport; it runs
        // from a local copy and nothing touches members afterwards.
        CloseHandler cb = on_close_;
        if (cb) cb();
    }
#endif
}

void StdioTransport::dispatch(const std::string& line) {
    json::Value msg = json::Value::parse(line);
    if (!msg.is_object()) {
        report_error("unparseable message from server: " + clip(line));
        return;
    }

    if (auto method = msg.get_string("method")) {
        // Server-initiated request: answer ping, refuse everything else.
        if (msg.has("id")) {
            json::Value resp = json::Value::object();
            resp.set("jsonrpc", json::Value::string("2.0"));
            resp.set("id", msg.at("id"));
            if (*method == "ping") {
                resp.set("result", json::Value::object());
            } else {
                json::Value err = json::Value::object();
                err.set("code", json::Value::integer(RPC_METHOD_NOT_FOUND));
                err.set("message", json::Value::string("Method not found: " + *method));
                resp.set("error", err);
            }
            try {
                send(resp);
            } catch (const TransportError& e) {
                report_error(std::string("failed to answer server request: ") + e.what());
            }
        }
        // Notifications (logging, list_changed, progress) need no reply.
        return;
    }

    auto id = msg.get_int("id");
    if (!id) {
        report_error("response without a numeric id: " + clip(line));
        return;
    }

    std::shared_ptr<Pending> p;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = pending_.find(*id);
        if (it != pending_.end()) {
            p = it->second;
            pending_.erase(it);
        }
    }
    if (!p) {
        report_error("response for unknown request id " + std::to_string(*id));
        return;
    }

    if (msg.has("error")) {
        json::Value err = msg.at("error");
        const std::string m = err.get_string("message").value_or("unknown error");
        const int code = static_cast<int>(err.get_int("code").value_or(0));
        p->promise.set_exception(std::make_exception_ptr(
            TransportError("server error " + std::to_string(code) + ": " + m, code)));
        return;
    }
    // json-c refcounts are not atomic: the reader must hold no reference to
    // the result once the waiting thread can see it.
    json::Value result = msg.at("result");
    msg = json::Value();
    if (!result) result = json::Value::object();
    p->promise.set_value(std::move(result));
}

void StdioTransport::send(const json::Value& msg) {
    const std::string line = msg.dump() + "\n";
    std::lock_guard<std::mutex> lk(write_mu_);
    std::string err;
    if (!proc_.write_all(line, &err)) {
        throw TransportError("send failed: " + err);
    }
}

json::Value StdioTransport::request(const std::string& method,
                                    const json::Value& params,
                                    std::chrono::milliseconds timeout) {
    auto p = std::make_shared<Pending>();
    auto fut = p->promise.get_future();

    int64_t id = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        // Checked under mu_ so fail_all_pending() cannot miss this entry.
        if (closed_.load()) throw TransportError("transport is closed");
        id = next_id_++;
        pending_[id] = p;
    }

    json::Value msg = json::Value::object();
    msg.set("jsonrpc", json::Value::string("2.0"));
    msg.set("id", json::Value::integer(id));
    msg.set("method", json::Value::string(method));
    if (params) msg.set("params", params);

    try {
        send(msg);
    } catch (const TransportError&) {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.erase(id);
        throw;
    }

    if (fut.wait_for(timeout) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            pending_.erase(id);
        }
        throw TransportError("request " + method + " timed out after " +
                             std::to_string(timeout.count()) + "ms");
    }
    return fut.get();
}

void StdioTransport::notify(const std::string& method, const json::Value& params) {
    if (closed_.load()) throw TransportError("transport is closed");
    json::Value msg = json::Value::object();
    msg.set("jsonrpc", json::Value::string("2.0"));
    msg.set("method", json::Value::string(method));
    if (params) msg.set("params", params);
    send(msg);
}

void StdioTransport::fail_all_pending(const std::string& why) {
    std::unordered_map<int64_t, std::shared_ptr<Pending>> drained;
    {
        std::lock_guard<std::mutex> lk(mu_);
        drained.swap(pending_);
    }
    for (auto& kv : drained) {
        kv.second->promise.set_exception(std::make_exception_ptr(TransportError(why)));
    }
}

void StdioTransport::close() {
    std::lock_guard<std::mutex> lk(close_mu_);
    if (closing_.exchange(true)) return;
    closed_.store(true);

#ifndef _WIN32
    if (wake_fd_[1] >= 0) {
        char c = 1;
        ssize_t n = write(wake_fd_[1], &c, 1);
        (void)n;
    }
#endif
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) reader_.detach();
        else reader_.join();
    }

    {
        std::lock_guard<std::mutex> wl(write_mu_);
        proc_.close_stdin();
    }
    proc_.terminate();
    fail_all_pending("transport closed");
}

} // namespace toolgate
