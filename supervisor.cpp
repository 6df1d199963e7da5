#include "supervisor.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace topology {

Supervisor::Supervisor(Config cfg,
                       std::unique_ptr<ProcessHandle> backend,
                       std::unique_ptr<ProcessHandle> router,
                       std::unique_ptr<HealthProbe> probe)
    : cfg_(std::move(cfg)),
      backend_(std::move(backend)),
      router_(std::move(router)),
      probe_(std::move(probe)) {}

Supervisor::~Supervisor() { shutdown(); }

void Supervisor::sleepUnlessStopped(std::chrono::milliseconds d) const {
    const auto until = Clock::now() + d;
    const auto slice = std::chrono::milliseconds(50);
    while (!stopRequested()) {
        auto now = Clock::now();
        if (now >= until) return;
        std::this_thread::sleep_for(std::min<Clock::duration>(slice, until - now));
    }
}

bool Supervisor::start(ProcessHandle& handle) {
    if (!handle.spec().enabled) {
        std::cout << "[Spawn] " << handle.name() << " disabled; not launching" << std::endl;
        return false;
    }
    return handle.start();
}

HealthState Supervisor::awaitReady(ProcessHandle& handle, std::chrono::milliseconds timeout) {
    if (!handle.poll()) return handle.state();

    if (!handle.health()) {
        handle.markReady();
        return handle.state();
    }

    const auto& check = *handle.health();
    const auto t0 = Clock::now();
    const auto deadline = t0 + timeout;
    unsigned attempts = 0;
    ProbeResult last;

    std::cout << "[Health] Waiting for " << handle.name() << " at http://"
              << check.host << ":" << check.port << check.path
              << " (timeout " << timeout.count() << " ms)" << std::endl;

    while (!stopRequested()) {
        if (!handle.poll()) {
            std::cerr << "[Health] " << handle.name() << " exited while waiting for readiness: "
                      << handle.lastError() << std::endl;
            return handle.state();
        }

        last = probe_->probe(check);
        ++attempts;
        if (last.ok) {
            handle.markReady();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();
            std::cout << "[Health] " << handle.name() << " ready after " << attempts
                      << " attempt(s), " << ms << " ms" << std::endl;
            return handle.state();
        }

        auto now = Clock::now();
        if (now >= deadline) break;
        sleepUnlessStopped(std::min(cfg_.health_interval,
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)));
    }

    if (!stopRequested()) {
        std::cerr << "[Health] WARNING: " << handle.name() << " not ready after "
                  << timeout.count() << " ms (" << attempts << " attempt(s), last: "
                  << (last.error.empty() ? "HTTP " + std::to_string(last.status) : last.error)
                  << "); continuing in degraded mode" << std::endl;
    }
    return handle.state();
}

bool Supervisor::runPreflight(const ProcessSpec& spec) {
    ProcessHandle check("router-preflight", spec);
    if (!check.start()) return false;

    const auto deadline = Clock::now() + cfg_.preflight_timeout;
    while (check.poll()) {
        if (Clock::now() >= deadline || stopRequested()) {
            std::cerr << "[Supervisor] Router preflight did not finish; aborting it" << std::endl;
            check.terminate(cfg_.shutdown_grace);
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    int code = check.exitCode().value_or(1);
    if (code != 0) {
        std::cerr << "[Supervisor] Router preflight exited with code " << code << std::endl;
        return false;
    }
    std::cout << "[Supervisor] Router preflight passed" << std::endl;
    return true;
}

void Supervisor::monitorBackend(Clock::time_point& next_probe) {
    if (!backend_->running()) return;

    if (!backend_->poll()) {
        std::cerr << "[Supervisor] " << backend_->name() << " exited with code "
                  << backend_->exitCode().value_or(-1)
                  << " (state " << toString(backend_->state())
                  << "); router keeps serving, API requests will fail" << std::endl;
        return;
    }

    // Degraded start: keep probing so the log shows when the backend came up
    if (backend_->state() == HealthState::Pending && backend_->health() && Clock::now() >= next_probe) {
        if (probe_->probe(*backend_->health()).ok) {
            backend_->markReady();
            std::cout << "[Health] " << backend_->name() << " became ready" << std::endl;
        }
        next_probe = Clock::now() + cfg_.health_interval;
    }
}

int Supervisor::run() {
    // 1) Backend, best-effort readiness
    if (start(*backend_)) {
        awaitReady(*backend_, cfg_.readiness_timeout);
    } else if (backend_->spec().enabled) {
        std::cerr << "[Supervisor] Backend did not start (" << backend_->lastError()
                  << "); router will surface errors per request" << std::endl;
    }

    if (stopRequested()) {
        shutdown();
        return 0;
    }

    // 2) Router config check, then the foreground process
    if (cfg_.router_preflight && !runPreflight(*cfg_.router_preflight)) {
        std::cerr << "[Supervisor] FATAL: router configuration rejected" << std::endl;
        shutdown();
        return 1;
    }

    if (!start(*router_)) {
        std::cerr << "[Supervisor] FATAL: router failed to start: " << router_->lastError() << std::endl;
        shutdown();
        int code = router_->exitCode().value_or(1);
        return code != 0 ? code : 1;
    }
    awaitReady(*router_, cfg_.readiness_timeout);

    // 3) Block on the router
    std::cout << "[Supervisor] Serving; router pid=" << router_->pid()
              << ", backend " << toString(backend_->state()) << std::endl;

    auto next_probe = Clock::now() + cfg_.health_interval;
    while (router_->poll()) {
        if (stopRequested()) {
            std::cout << "[Supervisor] Stop requested, shutting down" << std::endl;
            break;
        }
        monitorBackend(next_probe);
        sleepUnlessStopped(cfg_.monitor_interval);
    }

    if (!router_->running()) {
        std::cerr << "[Supervisor] Router exited with code " << router_->exitCode().value_or(-1) << std::endl;
    }

    shutdown();

    int code = router_->exitCode().value_or(1);
    std::cout << "[Supervisor] Exiting with code " << code << std::endl;
    return code;
}

void Supervisor::shutdown() {
    if (router_)  router_->terminate(cfg_.shutdown_grace);
    if (backend_) backend_->terminate(cfg_.shutdown_grace);
}

} // namespace topology
