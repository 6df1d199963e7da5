#include "process_handle.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>     // fork, execvp, chdir, pipe2
#include <stdlib.h>     // setenv

namespace topology {

// Kill-and-wait fallback when a handle goes out of scope still running
static constexpr std::chrono::milliseconds kDestructorGrace{5000};

std::string ProcessSpec::describe() const {
    std::string joined;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) joined += ' ';
        joined += argv[i];
    }
    return shell ? "/bin/sh -lc \"" + joined + "\"" : joined;
}

const char* toString(HealthState state) {
    switch (state) {
        case HealthState::Unknown: return "unknown";
        case HealthState::Pending: return "pending";
        case HealthState::Ready:   return "ready";
        case HealthState::Failed:  return "failed";
        case HealthState::Stopped: return "stopped";
    }
    return "?";
}

ProcessHandle::ProcessHandle(std::string name, ProcessSpec spec, std::optional<HealthCheck> health)
    : name_(std::move(name)), spec_(std::move(spec)), health_(std::move(health)) {}

ProcessHandle::~ProcessHandle() {
    if (running()) terminate(kDestructorGrace);
}

// What the child reports back over the pipe when it cannot exec
struct ExecFailure {
    int stage = 0;   // 1 = chdir, 2 = exec
    int err = 0;
};

bool ProcessHandle::start() {
    if (running()) return true;
    exit_code_.reset();
    last_error_.clear();

    // Build cargv for execvp OR for /bin/sh -lc
    std::vector<std::string> local_argv;
    if (spec_.shell) {
        std::string joined;
        for (size_t i = 0; i < spec_.argv.size(); ++i) {
            if (i) joined += ' ';
            joined += spec_.argv[i];
        }
        if (!joined.empty()) local_argv = { "/bin/sh", "-lc", joined };
    } else {
        local_argv = spec_.argv;
    }
    if (local_argv.empty() || local_argv[0].empty()) {
        markFailed("empty argv; nothing to exec");
        return false;
    }

    std::vector<char*> cargv;
    cargv.reserve(local_argv.size() + 1);
    for (auto& s : local_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int report[2];
    if (::pipe2(report, O_CLOEXEC) != 0) {
        markFailed(std::string("pipe: ") + std::strerror(errno));
        return false;
    }

    const pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        ::close(report[0]);
        ::close(report[1]);
        markFailed(std::string("fork: ") + std::strerror(err));
        return false;
    }

    if (pid == 0) {
        // Child: own process group so the whole tree (incl. /bin/sh children)
        // can be signalled at once; die with the supervisor.
        ::close(report[0]);
        ::setpgid(0, 0);
        ::prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (::getppid() != parent) _exit(127);

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        ExecFailure failure;
        if (!spec_.cwd.empty() && ::chdir(spec_.cwd.c_str()) != 0) {
            failure.stage = 1;
            failure.err = errno;
        } else {
            for (const auto& kv : spec_.env) {
                ::setenv(kv.first.c_str(), kv.second.c_str(), 1);
            }
            ::execvp(cargv[0], cargv.data());
            failure.stage = 2;
            failure.err = errno;
        }
        ssize_t ignored = ::write(report[1], &failure, sizeof failure);
        (void)ignored;
        _exit(127);
    }

    ::close(report[1]);
    ::setpgid(pid, pid);  // races the child's own call; either one wins

    ExecFailure failure;
    ssize_t n;
    do {
        n = ::read(report[0], &failure, sizeof failure);
    } while (n == -1 && errno == EINTR);
    ::close(report[0]);

    pid_ = pid;
    if (n == static_cast<ssize_t>(sizeof failure)) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        pid_ = -1;
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : 127;
        markFailed(std::string(failure.stage == 1 ? "chdir " + spec_.cwd : "exec " + local_argv[0]) +
                   ": " + std::strerror(failure.err));
        return false;
    }

    state_ = HealthState::Pending;
    std::cout << "[Spawn] " << name_ << " pid=" << pid_ << " command: " << spec_.describe() << std::endl;
    return true;
}

void ProcessHandle::recordExit(int status) {
    pid_ = -1;
    if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exit_code_ = 128 + WTERMSIG(status);
    else exit_code_ = 1;

    if (state_ == HealthState::Ready) {
        state_ = HealthState::Stopped;
    } else if (state_ != HealthState::Failed) {
        // Gone before it ever became ready
        state_ = HealthState::Failed;
        last_error_ = "exited with code " + std::to_string(*exit_code_) + " before becoming ready";
    }
}

bool ProcessHandle::poll() {
    if (!running()) return false;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    if (r == -1) {
        if (errno == EINTR) return true;
        // ECHILD: somebody else reaped it; treat as an unexplained exit
        last_error_ = std::string("waitpid: ") + std::strerror(errno);
        pid_ = -1;
        exit_code_ = 1;
        state_ = state_ == HealthState::Ready ? HealthState::Stopped : HealthState::Failed;
        return false;
    }
    recordExit(status);
    return false;
}

void ProcessHandle::markReady() {
    if (state_ == HealthState::Pending || state_ == HealthState::Unknown) state_ = HealthState::Ready;
}

void ProcessHandle::markFailed(const std::string& reason) {
    state_ = HealthState::Failed;
    last_error_ = reason;
    std::cerr << "[Spawn] " << name_ << " failed: " << reason << std::endl;
}

bool ProcessHandle::signal(int sig) const {
    if (!running()) return false;
    if (::kill(-pid_, sig) == 0) return true;
    return ::kill(pid_, sig) == 0;
}

void ProcessHandle::terminate(std::chrono::milliseconds grace) {
    if (!running()) return;

    std::cout << "[Supervisor] Stopping " << name_ << " (pid=" << pid_ << ")" << std::endl;
    signal(SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (poll()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "[Supervisor] " << name_ << " ignored SIGTERM for "
                      << grace.count() << " ms, sending SIGKILL" << std::endl;
            signal(SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {}
            recordExit(status);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

} // namespace topology
