#include "test_common.h"
#include "toolgate/proc.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

using namespace toolgate;

static std::string read_line(int fd, int timeout_ms) {
    std::string out;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        struct pollfd p{fd, POLLIN, 0};
        if (poll(&p, 1, 50) <= 0) continue;
        char c;
        ssize_t n = read(fd, &c, 1);
        if (n <= 0) break;
        if (c == '\n') return out;
        out.push_back(c);
    }
    return out;
}

int main(int argc, char** argv) {
    expect_true(argc >= 2, "usage: test_proc <fixture_server>");
    const std::string fixture = argv[1];
    expect_true(std::filesystem::exists(fixture), "fixture not found: " + fixture);

    // Test 1: Pipes are wired to the child
    {
        ChildProcess p;
        std::string err;
        ProcLimits lim;
        expect_true(p.spawn(fixture, {fixture}, {"PATH=/usr/bin:/bin"}, lim, &err), "spawn: " + err);
        expect_true(p.pid() > 0, "pid assigned");
        expect_true(p.running(), "running");

        expect_true(p.write_all("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n", &err), "write: " + err);
        std::string line = read_line(p.stdout_fd(), 5000);
        expect_true(contains(line, "\"id\":1"), "ping answered: " + line);

        // EOF on stdin ends the fixture cleanly
        p.close_stdin();
        for (int i = 0; i < 100 && p.running(); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        expect_eq_ll(p.terminate(), 0, "clean exit code");
        expect_true(!p.running(), "reaped");
        expect_eq_ll(p.terminate(), 0, "terminate is idempotent");
    }

    // Test 2: A failed exec is reported by spawn()
    {
        ChildProcess p;
        std::string err;
        ProcLimits lim;
        expect_true(!p.spawn("/nonexistent/toolgate-binary", {"x"}, {}, lim, &err), "exec failure detected");
        expect_true(contains(err, "exec"), "error mentions exec: " + err);
        expect_true(p.pid() <= 0, "no pid on failure");
    }

    // Test 3: SIGTERM ignored -> SIGKILL after the grace period
    {
        ChildProcess p;
        std::string err;
        ProcLimits lim;
        lim.kill_grace_ms = 200;
        expect_true(p.spawn(fixture, {fixture, "--stubborn"}, {}, lim, &err), "spawn stubborn: " + err);
        const pid_t pid = p.pid();
        // let it install its SIGTERM disposition
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto start = std::chrono::steady_clock::now();
        int code = p.terminate();
        auto took = std::chrono::steady_clock::now() - start;
        expect_eq_ll(code, 128 + SIGKILL, "killed");
        expect_true(took >= std::chrono::milliseconds(150), "waited the grace period");
        expect_true(kill(pid, 0) != 0, "child gone");
    }

    // Test 4: Only the provided environment reaches the child
    {
        setenv("TOOLGATE_PROC_SECRET", "leak", 1);
        ChildProcess p;
        std::string err;
        ProcLimits lim;
        expect_true(p.spawn(fixture, {fixture}, {"ONLY=1"}, lim, &err), "spawn: " + err);
        expect_true(p.write_all(
            "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"getenv\","
            "\"arguments\":{\"name\":\"TOOLGATE_PROC_SECRET\"}}}\n", &err), "write: " + err);
        std::string line = read_line(p.stdout_fd(), 5000);
        expect_true(contains(line, "\"text\":\"\""), "secret withheld: " + line);
        p.terminate();
        unsetenv("TOOLGATE_PROC_SECRET");
    }

    // Test 5: The child outlives the thread that spawned it
    {
        ChildProcess p;
        std::string err;
        bool spawned = false;
        std::thread worker([&] {
            ProcLimits lim;
            spawned = p.spawn(fixture, {fixture}, {}, lim, &err);
        });
        worker.join();
        expect_true(spawned, "spawn from worker: " + err);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        expect_true(p.running(), "child alive after spawning thread exited (exit_code=" +
                                     std::to_string(p.exit_code()) + ")");

        expect_true(p.write_all("{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"ping\"}\n", &err), "write: " + err);
        std::string line = read_line(p.stdout_fd(), 5000);
        expect_true(contains(line, "\"id\":5"), "ping answered after worker exit: " + line);
        p.terminate();
    }

    // Test 6: Priority adjustment never fails loudly
    lower_priority(-1, 10);
    lower_priority(999999, 10);

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
