#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h> // pid_t

#include "health_probe.hpp"

namespace topology {

// --------- Process command spec for config-driven launch ---------
struct ProcessSpec {
    bool enabled = true;                          // if false, skip launching
    bool shell = false;                           // true => run via /bin/sh -lc "<joined argv>"
    std::vector<std::string> argv;                // full argv (argv[0] is the executable)
    std::string cwd;                              // working directory (optional)
    std::map<std::string, std::string> env;       // extra environment (optional)

    std::string describe() const;
};

enum class HealthState { Unknown, Pending, Ready, Failed, Stopped };

const char* toString(HealthState state);

// One supervised child. Owns the pid: destroying a live handle terminates
// and reaps the child.
class ProcessHandle {
public:
    ProcessHandle(std::string name, ProcessSpec spec, std::optional<HealthCheck> health = std::nullopt);
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // fork + exec. Unknown -> Pending on success, -> Failed when the command
    // cannot be executed (reported by the child over a close-on-exec pipe).
    bool start();

    // Non-blocking reap. Returns true while the child is still running;
    // records the exit code and moves to Stopped once it is gone.
    bool poll();

    bool running() const { return pid_ > 0; }

    void markReady();
    void markFailed(const std::string& reason);

    bool signal(int sig) const;

    // SIGTERM, wait up to `grace`, then SIGKILL. Always reaps.
    void terminate(std::chrono::milliseconds grace);

    const std::string& name() const { return name_; }
    const ProcessSpec& spec() const { return spec_; }
    const std::optional<HealthCheck>& health() const { return health_; }
    HealthState state() const { return state_; }
    pid_t pid() const { return pid_; }

    // Shell convention: exit status, or 128 + signal number
    std::optional<int> exitCode() const { return exit_code_; }
    const std::string& lastError() const { return last_error_; }

private:
    void recordExit(int status);

    std::string name_;
    ProcessSpec spec_;
    std::optional<HealthCheck> health_;

    HealthState state_ = HealthState::Unknown;
    pid_t pid_ = -1;
    std::optional<int> exit_code_;
    std::string last_error_;
};

} // namespace topology
