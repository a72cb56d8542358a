#include "test_common.h"
#include "toolgate/supervisor.h"
#include "toolgate/transport.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace toolgate;
using namespace std::chrono_literals;

static std::shared_ptr<StdioTransport> start(const std::string& fixture,
                                             std::vector<std::string> args,
                                             Transport::ErrorHandler on_error = {},
                                             Transport::CloseHandler on_close = {}) {
    ProcLimits lim;
    lim.kill_grace_ms = 500;
    return StdioTransport::spawn(fixture, args, {{"PATH", "/usr/bin:/bin"}}, lim,
                                 std::move(on_error), std::move(on_close));
}

int main(int argc, char** argv) {
    expect_true(argc >= 2, "usage: test_transport <fixture_server>");
    const std::string fixture = argv[1];

    // Test 1: Handshake, listing, calls, server errors
    {
        auto t = start(fixture, {});
        expect_true(t->is_open(), "open after spawn");
        expect_true(t->pid() > 0, "pid");

        json::Value init = t->request("initialize", initialize_params(), 5s);
        expect_eq_str(init.get_string("protocolVersion").value_or(""), MCP_PROTOCOL_VERSION, "protocol version");
        t->notify("notifications/initialized", json::Value());

        json::Value list = t->request("tools/list", json::Value::object(), 5s);
        expect_eq_ll((long long)list.at("tools").size(), 4, "four tools");

        json::Value args = json::Value::object();
        args.set("name", json::Value::string("echo"));
        json::Value echo_args = json::Value::object();
        echo_args.set("text", json::Value::string("a/b \"quoted\""));
        args.set("arguments", echo_args);
        json::Value res = t->request("tools/call", args, 5s);
        expect_eq_str(res.at("content").at(0).get_string("text").value_or(""), "a/b \"quoted\"", "echo round trip");

        auto e = expect_throws<TransportError>([&] { t->request("resources/list", json::Value::object(), 5s); },
                                               "unknown method");
        expect_eq_ll(e.rpc_code(), -32601, "method not found code");

        t->close();
        expect_true(!t->is_open(), "closed");
        expect_throws<TransportError>([&] { t->request("ping", json::Value(), 1s); }, "request after close");
        t->close();
    }

    // Test 2: Concurrent requests are correlated by id
    {
        auto t = start(fixture, {});
        t->request("initialize", initialize_params(), 5s);
        std::atomic<int> ok{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; i++) {
            threads.emplace_back([&, i] {
                json::Value p = json::Value::object();
                p.set("name", json::Value::string("echo"));
                json::Value a = json::Value::object();
                a.set("text", json::Value::string("n" + std::to_string(i)));
                p.set("arguments", a);
                json::Value r = t->request("tools/call", p, 5s);
                if (r.at("content").at(0).get_string("text").value_or("") == "n" + std::to_string(i)) ok++;
            });
        }
        for (auto& th : threads) th.join();
        expect_eq_ll(ok.load(), 8, "every response matched its request");
    }

    // Test 3: Request timeout while the server stays silent
    {
        auto t = start(fixture, {"--hang"});
        auto e = expect_throws<TransportError>([&] { t->request("initialize", initialize_params(), 200ms); },
                                               "silent server");
        expect_true(contains(e.what(), "timed out after 200ms"), "timeout message: " + std::string(e.what()));
    }

    // Test 4: Garbage lines go to the error handler, not to callers
    {
        std::mutex mu;
        std::vector<std::string> errors;
        auto t = start(fixture, {"--bad-json"}, [&](const std::string& m) {
            std::lock_guard<std::mutex> lk(mu);
            errors.push_back(m);
        });
        json::Value init = t->request("initialize", initialize_params(), 5s);
        expect_true(init.is_object(), "handshake still succeeds");
        std::lock_guard<std::mutex> lk(mu);
        expect_eq_ll((long long)errors.size(), 1, "one protocol error reported");
        expect_true(contains(errors[0], "unparseable"), "error text");
    }

    // Test 5: Child exit triggers the close handler; owner close does not
    {
        std::atomic<int> closes{0};
        auto t = start(fixture, {"--exit-after-init", "0"}, {}, [&] { closes++; });
        t->request("initialize", initialize_params(), 5s);
        t->notify("notifications/initialized", json::Value());
        for (int i = 0; i < 100 && closes.load() == 0; i++) std::this_thread::sleep_for(50ms);
        expect_eq_ll(closes.load(), 1, "close handler ran once");
        expect_true(!t->is_open(), "transport marked closed");
        t->close();
        expect_eq_ll(closes.load(), 1, "explicit close after exit does not re-notify");

        std::atomic<int> closes2{0};
        auto t2 = start(fixture, {}, {}, [&] { closes2++; });
        t2->close();
        std::this_thread::sleep_for(100ms);
        expect_eq_ll(closes2.load(), 0, "owner close is silent");
    }

    // Test 6: A response is handed over with no reference left on the reader
    // thread (json-c refcounts are not atomic)
    {
        auto t = start(fixture, {});
        t->request("initialize", initialize_params(), 5s);
        for (int i = 0; i < 20; i++) {
            json::Value r = t->request("tools/list", json::Value::object(), 5s);
            json_object* raw = r.get();
            expect_true(raw != nullptr, "result present");
            json_object_get(raw);
            r = json::Value();
            expect_eq_ll(json_object_put(raw), 1, "caller held the only reference to the result");
        }
        t->close();
    }

    // Test 7: Exec failure surfaces from spawn()
    expect_throws<TransportError>([&] { start("/nonexistent/toolgate-binary", {}); }, "spawn failure");

    std::cerr << "test_transport: ALL PASSED" << std::endl;
    return 0;
}
