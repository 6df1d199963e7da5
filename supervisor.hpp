#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "health_probe.hpp"
#include "process_handle.hpp"

namespace topology {

using Clock = std::chrono::steady_clock;

// Brings up Backend then Router inside one container and lives exactly as
// long as the Router (the foreground process) does.
//
// State per child: Unknown -> Pending (start) -> Ready | Failed -> Stopped.
// A readiness timeout leaves the backend Pending and the Router is started
// anyway; API calls fail per request until the backend answers.
class Supervisor {
public:
    struct Config {
        std::chrono::milliseconds readiness_timeout{60000};
        std::chrono::milliseconds health_interval{500};
        std::chrono::milliseconds monitor_interval{200};
        std::chrono::milliseconds shutdown_grace{10000};
        std::chrono::milliseconds preflight_timeout{30000};

        // Run to completion before the router starts (e.g. `nginx -t`);
        // non-zero exit is fatal.
        std::optional<ProcessSpec> router_preflight;
    };

    Supervisor(Config cfg,
               std::unique_ptr<ProcessHandle> backend,
               std::unique_ptr<ProcessHandle> router,
               std::unique_ptr<HealthProbe> probe = std::make_unique<HttpHealthProbe>());
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Launch asynchronously. A command that cannot be executed ends up
    // Failed; the supervisor itself keeps going.
    bool start(ProcessHandle& handle);

    // Poll the handle's health check every health_interval until it answers
    // 2xx, the process exits, or `timeout` elapses. Never aborts on timeout.
    HealthState awaitReady(ProcessHandle& handle, std::chrono::milliseconds timeout);

    // Backend -> awaitReady -> preflight -> Router -> block on Router.
    // Returns the Router's exit code (128 + signal when it was killed), or
    // 1 when the Router could not be started.
    int run();

    // Async-signal-safe; run() notices within one monitor interval.
    void requestStop() { stop_requested_.store(true); }
    bool stopRequested() const { return stop_requested_.load(); }

    // Router first, then backend: SIGTERM, grace, SIGKILL, reap.
    void shutdown();

    ProcessHandle& backend() { return *backend_; }
    ProcessHandle& router() { return *router_; }

private:
    bool runPreflight(const ProcessSpec& spec);
    void monitorBackend(Clock::time_point& next_probe);
    void sleepUnlessStopped(std::chrono::milliseconds d) const;

    Config cfg_;
    std::unique_ptr<ProcessHandle> backend_;
    std::unique_ptr<ProcessHandle> router_;
    std::unique_ptr<HealthProbe>   probe_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace topology
