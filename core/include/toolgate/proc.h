#pragma once

#include <string>
#include <vector>

#ifndef _WIN32
  #include <sys/types.h>
#else
  using pid_t = int;
#endif

namespace toolgate {

struct ProcLimits {
    int rlimit_nofile{1024};        // max open fds (0 = inherit)
    size_t rlimit_fsize_mb{0};      // max file size MB (0 = inherit)
    size_t rlimit_as_mb{0};         // virtual memory MB (0 = inherit)

    bool no_new_privs{false};

    // SIGTERM -> SIGKILL grace on terminate().
    int kill_grace_ms{2000};
};

// A long-lived child with its stdin/stdout connected to pipes. stderr is
// inherited so the server's own diagnostics reach the operator.
//
// The child runs in its own process group and inherits no descriptors
// beyond 0/1/2. It outlives the thread that spawned it; terminate() (or
// the destructor) ends it.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // argv[0] is passed to the child as-is; `executable` is what gets exec'd.
    // Returns false and fills *err if the pipes, fork, or exec failed; a
    // failed exec is reported here rather than as an early child exit.
    bool spawn(const std::string& executable,
               const std::vector<std::string>& argv,
               const std::vector<std::string>& envp,
               const ProcLimits& lim,
               std::string* err);

    pid_t pid() const { return pid_; }
    int stdin_fd() const { return in_fd_; }
    int stdout_fd() const { return out_fd_; }

    // Write everything or fail (EPIPE once the child is gone).
    bool write_all(const std::string& data, std::string* err);

    void close_stdin();

    // Non-blocking: reaps the child if it has exited.
    bool running();

    // Close stdin, SIGTERM the group, wait up to kill_grace_ms, then SIGKILL.
    // Always reaps. Idempotent; returns the exit code (128+signal if killed).
    int terminate();

    int exit_code() const { return exit_code_; }

private:
    void record_status(int status);

    pid_t pid_{-1};
    int in_fd_{-1};
    int out_fd_{-1};
    bool reaped_{false};
    int exit_code_{-1};
    int kill_grace_ms_{2000};
};

// Best-effort: raise the niceness of pid. Never reports failure.
void lower_priority(pid_t pid, int niceness);

} // namespace toolgate
