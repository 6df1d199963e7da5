#include <catch2/catch.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <thread>

#include <unistd.h>

#include "supervisor.hpp"

using namespace topology;
using namespace std::chrono_literals;

namespace {

// Answers from a script instead of the network
class FakeProbe : public HealthProbe {
public:
    explicit FakeProbe(int ok_after) : ok_after_(ok_after) {}

    ProbeResult probe(const HealthCheck&) override {
        ++calls;
        ProbeResult r;
        if (ok_after_ >= 0 && calls > ok_after_) {
            r.ok = true;
            r.status = 200;
        } else {
            r.error = "connect: Connection refused";
        }
        return r;
    }

    int calls = 0;

private:
    int ok_after_;   // < 0 => never healthy
};

// Healthy once a fixed delay has passed since construction
class LateHealthCheck : public HealthProbe {
public:
    explicit LateHealthCheck(std::chrono::milliseconds delay) : healthy_at_(Clock::now() + delay) {}

    ProbeResult probe(const HealthCheck&) override {
        ProbeResult r;
        if (Clock::now() >= healthy_at_) {
            r.ok = true;
            r.status = 200;
            ++ok_answers;
        } else {
            r.error = "connect: Connection refused";
        }
        return r;
    }

    std::atomic<int> ok_answers{0};

private:
    Clock::time_point healthy_at_;
};

ProcessSpec shell(const std::string& cmd) {
    ProcessSpec sp;
    sp.shell = true;
    sp.argv = {cmd};
    return sp;
}

Supervisor::Config fast_config() {
    Supervisor::Config cfg;
    cfg.readiness_timeout = 300ms;
    cfg.health_interval = 20ms;
    cfg.monitor_interval = 20ms;
    cfg.shutdown_grace = 1000ms;
    return cfg;
}

} // namespace

TEST_CASE("Process handle runs a child and records its exit code", "[process]") {
    ProcessHandle h("child", shell("exit 3"));
    REQUIRE(h.start());
    REQUIRE(h.state() == HealthState::Pending);

    auto deadline = Clock::now() + 5s;
    while (h.poll() && Clock::now() < deadline) std::this_thread::sleep_for(10ms);

    REQUIRE_FALSE(h.running());
    REQUIRE(h.exitCode() == std::optional<int>(3));
    // Gone before it was ever marked ready
    REQUIRE(h.state() == HealthState::Failed);
}

TEST_CASE("Unexecutable command ends up Failed with 127", "[process]") {
    ProcessSpec sp;
    sp.argv = {"/nonexistent/topology-test-binary"};
    ProcessHandle h("missing", sp);

    REQUIRE_FALSE(h.start());
    REQUIRE(h.state() == HealthState::Failed);
    REQUIRE(h.exitCode() == std::optional<int>(127));
    REQUIRE_THAT(h.lastError(), Catch::Matchers::StartsWith("exec /nonexistent/topology-test-binary"));
}

TEST_CASE("Bad working directory is reported", "[process]") {
    ProcessSpec sp = shell("true");
    sp.cwd = "/nonexistent-dir";
    ProcessHandle h("cwd", sp);
    REQUIRE_FALSE(h.start());
    REQUIRE_THAT(h.lastError(), Catch::Matchers::StartsWith("chdir /nonexistent-dir"));
}

TEST_CASE("Terminate stops a ready child and reports the signal", "[process]") {
    ProcessHandle h("sleeper", shell("sleep 30"));
    REQUIRE(h.start());
    h.markReady();
    REQUIRE(h.state() == HealthState::Ready);

    auto t0 = Clock::now();
    h.terminate(2000ms);
    REQUIRE(Clock::now() - t0 < 2000ms);
    REQUIRE_FALSE(h.running());
    REQUIRE(h.state() == HealthState::Stopped);
    REQUIRE(h.exitCode() == std::optional<int>(128 + SIGTERM));
}

TEST_CASE("Terminate escalates to SIGKILL after the grace period", "[process]") {
    ProcessHandle h("stubborn", shell("trap '' TERM; sleep 30"));
    REQUIRE(h.start());
    std::this_thread::sleep_for(250ms);   // let the shell install its trap

    h.terminate(200ms);
    REQUIRE_FALSE(h.running());
    REQUIRE(h.exitCode() == std::optional<int>(128 + SIGKILL));
}

TEST_CASE("Readiness polling marks the backend Ready", "[supervisor]") {
    auto probe = std::make_unique<FakeProbe>(2);
    FakeProbe* fake = probe.get();

    auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 30"), HealthCheck{});
    auto router = std::make_unique<ProcessHandle>("router", shell("sleep 30"));
    Supervisor sup(fast_config(), std::move(backend), std::move(router), std::move(probe));

    REQUIRE(sup.start(sup.backend()));
    REQUIRE(sup.awaitReady(sup.backend(), 2000ms) == HealthState::Ready);
    REQUIRE(fake->calls == 3);
}

TEST_CASE("Readiness timeout is not fatal", "[supervisor]") {
    auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 30"), HealthCheck{});
    auto router = std::make_unique<ProcessHandle>("router", shell("exit 0"));
    Supervisor sup(fast_config(), std::move(backend), std::move(router), std::make_unique<FakeProbe>(-1));

    REQUIRE(sup.start(sup.backend()));
    auto t0 = Clock::now();
    REQUIRE(sup.awaitReady(sup.backend(), 200ms) == HealthState::Pending);
    REQUIRE(Clock::now() - t0 < 2000ms);
    REQUIRE(sup.backend().running());
}

TEST_CASE("Backend exiting during readiness wait is Failed", "[supervisor]") {
    auto backend = std::make_unique<ProcessHandle>("backend", shell("exit 4"), HealthCheck{});
    auto router = std::make_unique<ProcessHandle>("router", shell("exit 0"));
    Supervisor sup(fast_config(), std::move(backend), std::move(router), std::make_unique<FakeProbe>(-1));

    REQUIRE(sup.start(sup.backend()));
    REQUIRE(sup.awaitReady(sup.backend(), 2000ms) == HealthState::Failed);
    REQUIRE(sup.backend().exitCode() == std::optional<int>(4));
}

TEST_CASE("Router exit code becomes the supervisor's exit code", "[supervisor]") {
    SECTION("unhealthy backend still lets the router start") {
        auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 30"), HealthCheck{});
        auto router = std::make_unique<ProcessHandle>("router", shell("exit 7"));
        Supervisor sup(fast_config(), std::move(backend), std::move(router), std::make_unique<FakeProbe>(-1));

        REQUIRE(sup.run() == 7);
        REQUIRE_FALSE(sup.backend().running());
    }
    SECTION("clean router exit") {
        auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 30"), HealthCheck{});
        auto router = std::make_unique<ProcessHandle>("router", shell("sleep 0.2; exit 0"));
        Supervisor sup(fast_config(), std::move(backend), std::move(router), std::make_unique<FakeProbe>(0));

        REQUIRE(sup.run() == 0);
        REQUIRE(sup.backend().state() == HealthState::Stopped);
    }
    SECTION("disabled backend") {
        ProcessSpec off = shell("sleep 30");
        off.enabled = false;
        auto backend = std::make_unique<ProcessHandle>("backend", off, HealthCheck{});
        auto router = std::make_unique<ProcessHandle>("router", shell("exit 5"));
        Supervisor sup(fast_config(), std::move(backend), std::move(router), std::make_unique<FakeProbe>(-1));

        REQUIRE(sup.run() == 5);
        REQUIRE(sup.backend().state() == HealthState::Unknown);
    }
}

TEST_CASE("Router that cannot be executed fails the run", "[supervisor]") {
    ProcessSpec missing;
    missing.argv = {"/nonexistent/topology-router"};
    auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 30"));
    auto router = std::make_unique<ProcessHandle>("router", missing);
    Supervisor sup(fast_config(), std::move(backend), std::move(router), std::make_unique<FakeProbe>(0));

    REQUIRE(sup.run() == 127);
    REQUIRE(sup.router().state() == HealthState::Failed);
    REQUIRE_FALSE(sup.backend().running());
}

TEST_CASE("Failing router preflight aborts before the router starts", "[supervisor]") {
    Supervisor::Config cfg = fast_config();
    cfg.router_preflight = shell("exit 1");

    auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 30"));
    auto router = std::make_unique<ProcessHandle>("router", shell("sleep 30"));
    Supervisor sup(cfg, std::move(backend), std::move(router), std::make_unique<FakeProbe>(0));

    REQUIRE(sup.run() == 1);
    REQUIRE(sup.router().state() == HealthState::Unknown);
    REQUIRE_FALSE(sup.backend().running());
}

TEST_CASE("Stop request tears down a long-running router", "[supervisor]") {
    auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 30"));
    auto router = std::make_unique<ProcessHandle>("router", shell("sleep 30"));
    Supervisor sup(fast_config(), std::move(backend), std::move(router), std::make_unique<FakeProbe>(0));

    std::thread stopper([&sup]() {
        std::this_thread::sleep_for(300ms);
        sup.requestStop();
    });

    auto t0 = Clock::now();
    int code = sup.run();
    stopper.join();

    REQUIRE(Clock::now() - t0 < 5s);
    REQUIRE(code == 128 + SIGTERM);
    REQUIRE_FALSE(sup.router().running());
    REQUIRE_FALSE(sup.backend().running());
}

TEST_CASE("Backend that exits after becoming ready ends Stopped", "[supervisor]") {
    // No health check: marked Ready as soon as it is running
    auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 0.2; exit 9"));
    auto router = std::make_unique<ProcessHandle>("router", shell("sleep 1; exit 0"));
    Supervisor sup(fast_config(), std::move(backend), std::move(router), std::make_unique<FakeProbe>(0));

    REQUIRE(sup.run() == 0);
    REQUIRE_FALSE(sup.backend().running());
    REQUIRE(sup.backend().state() == HealthState::Stopped);
    REQUIRE(sup.backend().exitCode() == std::optional<int>(9));
}

TEST_CASE("Backend that misses the readiness window becomes Ready while serving", "[supervisor]") {
    Supervisor::Config cfg = fast_config();
    cfg.readiness_timeout = 100ms;

    auto probe = std::make_unique<LateHealthCheck>(400ms);
    LateHealthCheck* delayed = probe.get();

    auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 30"), HealthCheck{});
    auto router = std::make_unique<ProcessHandle>("router", shell("sleep 1.2; exit 0"));
    Supervisor sup(cfg, std::move(backend), std::move(router), std::move(probe));

    // Healthy only after the readiness window closed, so Ready can only come
    // from the monitor loop
    REQUIRE(sup.run() == 0);
    REQUIRE(delayed->ok_answers >= 1);
    // Terminated after it was marked Ready; a Pending backend would end Failed
    REQUIRE(sup.backend().state() == HealthState::Stopped);
    REQUIRE(sup.backend().exitCode() == std::optional<int>(128 + SIGTERM));
}

#ifdef TOPOLOGY_ROUTER_BINARY
TEST_CASE("Built-in router stopped by the supervisor reports SIGTERM", "[supervisor][router]") {
    namespace fs = std::filesystem;
    const fs::path root = fs::temp_directory_path() / ("topology-supervisor-test-ui-" + std::to_string(::getpid()));
    fs::create_directories(root);

    ProcessSpec router_spec;
    router_spec.argv = {TOPOLOGY_ROUTER_BINARY,
                        "--listen-address", "127.0.0.1",
                        "--port", "0",
                        "--backend", "127.0.0.1:1",
                        "--static-root", root.string(),
                        "--quiet"};

    auto backend = std::make_unique<ProcessHandle>("backend", shell("sleep 30"));
    auto router = std::make_unique<ProcessHandle>("router", router_spec);
    Supervisor sup(fast_config(), std::move(backend), std::move(router), std::make_unique<FakeProbe>(0));

    std::thread stopper([&sup]() {
        std::this_thread::sleep_for(700ms);
        sup.requestStop();
    });
    int code = sup.run();
    stopper.join();

    std::error_code ec;
    fs::remove_all(root, ec);

    REQUIRE(code == 128 + SIGTERM);
    REQUIRE(sup.router().exitCode() == std::optional<int>(128 + SIGTERM));
}
#endif
