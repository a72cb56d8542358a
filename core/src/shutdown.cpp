#include "toolgate/shutdown.h"
#include "toolgate/client.h"
#include "toolgate/log.h"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#ifndef _WIN32
  #include <fcntl.h>
  #include <signal.h>
  #include <unistd.h>
#endif

namespace toolgate {

static std::once_flag g_install_once;
static std::atomic<bool> g_installed{false};
static int g_signal_pipe[2] = {-1, -1};

#ifndef _WIN32
static void on_signal(int signo) {
    // async-signal-safe: a single write to the self-pipe
    unsigned char b = static_cast<unsigned char>(signo);
    int saved = errno;
    ssize_t n = write(g_signal_pipe[1], &b, 1);
    (void)n;
    errno = saved;
}

static void watch_signals() {
    unsigned char b = 0;
    while (true) {
        ssize_t n = read(g_signal_pipe[0], &b, 1);
        if (n == 1) break;
        if (n < 0 && errno == EINTR) continue;
        // pipe gone; nothing left to watch
        return;
    }
    std::cerr << "[toolgate] received signal " << static_cast<int>(b) << ", closing MCP clients\n";
    ShutdownCoordinator::drain(ClientRuntime::global());
    std::cerr.flush();
    std::_Exit(0);
}
#endif

void ShutdownCoordinator::install() {
    std::call_once(g_install_once, [] {
#ifndef _WIN32
        if (pipe(g_signal_pipe) != 0) {
            std::cerr << "[warn] shutdown hook not installed: pipe failed: " << std::strerror(errno) << "\n";
            return;
        }
        for (int fd : g_signal_pipe) {
            int flags = fcntl(fd, F_GETFD, 0);
            if (flags >= 0) (void)fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
        }

        std::thread(watch_signals).detach();

        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = on_signal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        (void)sigaction(SIGINT, &sa, nullptr);
        (void)sigaction(SIGTERM, &sa, nullptr);
        g_installed.store(true);
#endif
    });
}

bool ShutdownCoordinator::installed() {
    return g_installed.load();
}

size_t ShutdownCoordinator::drain(ClientRuntime& rt) {
    std::vector<std::shared_ptr<Client>> clients = rt.snapshot();

    std::vector<std::future<void>> pending;
    pending.reserve(clients.size());
    for (const auto& c : clients) {
        pending.push_back(std::async(std::launch::async, [c] { c->close(); }));
    }

    int64_t failed = 0;
    for (size_t i = 0; i < pending.size(); i++) {
        try {
            pending[i].get();
        } catch (const std::exception& e) {
            failed++;
            std::cerr << "[warn] shutdown: closing \"" << clients[i]->label() << "\" failed: " << e.what() << "\n";
        }
    }

    json::Value p = json::Value::object();
    p.set("clients", json::Value::integer(static_cast<int64_t>(clients.size())));
    p.set("failed", json::Value::integer(failed));
    EventLog::global().event("shutdown_drain", "", p);
    return clients.size();
}

} // namespace toolgate
