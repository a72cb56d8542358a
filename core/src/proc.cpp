#include "toolgate/proc.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#ifndef _WIN32
  #include <unistd.h>
  #include <fcntl.h>
  #include <signal.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <sys/resource.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace toolgate {

#ifndef _WIN32
static void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

static void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
    p[0] = p[1] = -1;
}
#endif

ChildProcess::~ChildProcess() {
    terminate();
}

bool ChildProcess::spawn(const std::string& executable,
                         const std::vector<std::string>& argv,
                         const std::vector<std::string>& envp,
                         const ProcLimits& lim,
                         std::string* err) {
#ifdef _WIN32
    (void)executable; (void)argv; (void)envp; (void)lim;
    if (err) *err = "stdio servers are not supported on Windows in this build";
    return false;
#else
    if (pid_ > 0) {
        if (err) *err = "process already spawned";
        return false;
    }
    if (executable.empty() || argv.empty()) {
        if (err) *err = "empty argv";
        return false;
    }
    kill_grace_ms_ = lim.kill_grace_ms;

    // Everything the child touches between fork and exec is prepared here:
    // only async-signal-safe calls are allowed in a forked child of a
    // multi-threaded process.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<char*> cenvp;
    cenvp.reserve(envp.size() + 1);
    for (const auto& s : envp) cenvp.push_back(const_cast<char*>(s.c_str()));
    cenvp.push_back(nullptr);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(in_pipe) != 0) {
        if (err) *err = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe(out_pipe) != 0) {
        if (err) *err = std::string("pipe(out) failed: ") + std::strerror(errno);
        close_pair(in_pipe);
        return false;
    }
    if (pipe(err_pipe) != 0) {
        if (err) *err = std::string("pipe(exec) failed: ") + std::strerror(errno);
        close_pair(in_pipe);
        close_pair(out_pipe);
        return false;
    }
    // Closed by a successful exec, so a zero-byte read means the exec went through.
    set_cloexec(err_pipe[1]);
    set_cloexec(in_pipe[1]);
    set_cloexec(out_pipe[0]);

    pid_t pid = fork();
    if (pid < 0) {
        if (err) *err = std::string("fork failed: ") + std::strerror(errno);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);

        // isolate process group so terminate() reaches the whole subtree
        (void)setpgid(0, 0);

        const int report_fd = err_pipe[1];
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != report_fd) (void)close(fd);
        }

        // the parent ignores SIGPIPE; dispositions set to SIG_IGN survive exec
        (void)signal(SIGPIPE, SIG_DFL);

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        // No PR_SET_PDEATHSIG: it fires when the forking thread exits, and
        // servers must outlive the thread that connected them.
#endif

        if (lim.rlimit_nofile > 0) {
            set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);
        }
        if (lim.rlimit_fsize_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_FSIZE, bytes, bytes);
        }
        if (lim.rlimit_as_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_AS, bytes, bytes);
        }

        execve(executable.c_str(), cargv.data(), cenvp.data());

        int e = errno;
        ssize_t n = write(report_fd, &e, sizeof(e));
        (void)n;
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int exec_errno = 0;
    ssize_t got = 0;
    while (true) {
        got = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
        if (got < 0 && errno == EINTR) continue;
        break;
    }
    close(err_pipe[0]);

    if (got == (ssize_t)sizeof(exec_errno)) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close(in_pipe[1]);
        close(out_pipe[0]);
        if (err) *err = "exec " + executable + " failed: " + std::strerror(exec_errno);
        return false;
    }

    pid_ = pid;
    in_fd_ = in_pipe[1];
    out_fd_ = out_pipe[0];
    reaped_ = false;
    exit_code_ = -1;
    return true;
#endif
}

bool ChildProcess::write_all(const std::string& data, std::string* err) {
#ifdef _WIN32
    (void)data;
    if (err) *err = "not supported";
    return false;
#else
    if (in_fd_ < 0) {
        if (err) *err = "stdin is closed";
        return false;
    }
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(in_fd_, data.data() + off, data.size() - off);
        if (n > 0) { off += (size_t)n; continue; }
        if (n < 0 && errno == EINTR) continue;
        if (err) *err = std::string("write failed: ") + std::strerror(errno);
        return false;
    }
    return true;
#endif
}

void ChildProcess::close_stdin() {
#ifndef _WIN32
    if (in_fd_ >= 0) {
        close(in_fd_);
        in_fd_ = -1;
    }
#endif
}

void ChildProcess::record_status(int status) {
#ifndef _WIN32
    if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exit_code_ = 128 + WTERMSIG(status);
    else exit_code_ = 128;
#else
    exit_code_ = status;
#endif
    reaped_ = true;
}

bool ChildProcess::running() {
#ifdef _WIN32
    return false;
#else
    if (pid_ <= 0 || reaped_) return false;
    int status = 0;
    pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
        record_status(status);
        return false;
    }
    if (w < 0 && errno != EINTR) {
        // ECHILD: someone else reaped it
        reaped_ = true;
        return false;
    }
    return true;
#endif
}

int ChildProcess::terminate() {
#ifndef _WIN32
    if (pid_ <= 0) return exit_code_;
    close_stdin();

    if (running()) {
        (void)kill(-pid_, SIGTERM);
        (void)kill(pid_, SIGTERM);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kill_grace_ms_);
        while (running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (!reaped_) {
            (void)kill(-pid_, SIGKILL);
            (void)kill(pid_, SIGKILL);
            int status = 0;
            pid_t w;
            while ((w = waitpid(pid_, &status, 0)) < 0 && errno == EINTR) {}
            if (w == pid_) record_status(status);
            else reaped_ = true;
        }
    }

    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
#endif
    return exit_code_;
}

void lower_priority(pid_t pid, int niceness) {
#ifndef _WIN32
    if (pid <= 0) return;
    // EPERM/ESRCH are expected on locked-down hosts; the server runs fine at default priority.
    (void)setpriority(PRIO_PROCESS, (id_t)pid, niceness);
#else
    (void)pid; (void)niceness;
#endif
}

} // namespace toolgate
