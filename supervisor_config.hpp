#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "endpoint_resolver.hpp"
#include "errors.hpp"
#include "health_probe.hpp"
#include "nginx_config.hpp"
#include "process_handle.hpp"
#include "route_table.hpp"
#include "supervisor.hpp"

namespace topology {

enum class RouterMode { Builtin, Nginx, Command };

const char* toString(RouterMode mode);
RouterMode parseRouterMode(const std::string& s);   // throws ConfigError

struct BackendConfig {
    ProcessSpec   spec;
    std::string   host = "127.0.0.1";
    std::uint16_t port = 8000;
    std::string   health_path = "/health";
};

struct RouterConfig {
    RouterMode  mode = RouterMode::Builtin;
    ProcessSpec spec;                                   // mode == Command
    std::string binary = "topology_router";             // mode == Builtin
    std::string nginx_binary = "nginx";                 // mode == Nginx
    std::string nginx_conf_path = "/tmp/topology-nginx.conf";
};

struct AppConfig {
    std::uint16_t external_port = kCanonicalPort;

    BackendConfig backend;
    RouterConfig  router;

    std::string static_root = "/app/ui/dist";
    std::string index_document = "index.html";
    bool        strip_api_prefix = false;

    // Written into static_root before the router starts; empty disables it
    std::string runtime_config_file = "runtime-config.json";
    // Browser location assumed when resolving in development; empty =>
    // http://localhost:<external_port>
    std::string public_origin;

    unsigned readiness_timeout_sec = 60;
    unsigned health_interval_ms = 500;
    unsigned probe_timeout_ms = 2000;
    unsigned monitor_interval_ms = 200;
    unsigned shutdown_grace_ms = 10000;
};

// Overlays the keys present in `j` onto `cfg`. Throws ConfigError on type
// mismatches and out-of-range numbers; unknown keys are ignored.
void loadConfig(const nlohmann::json& j, AppConfig& cfg);
void loadConfigFile(const std::string& path, AppConfig& cfg);

// Throws ConfigError when a timing setting is outside its sane range
// (CLI overrides bypass loadConfig's checks).
void validateTimings(const AppConfig& cfg);

Upstream    backendUpstream(const AppConfig& cfg);
HealthCheck backendHealthCheck(const AppConfig& cfg);
RouteTable  buildRouteTable(const AppConfig& cfg);
NginxOptions nginxOptions(const AppConfig& cfg);
BrowserLocation assumedBrowserLocation(const AppConfig& cfg);

// argv the supervisor launches as the foreground process
ProcessSpec routerCommand(const AppConfig& cfg);
std::optional<ProcessSpec> routerPreflight(const AppConfig& cfg);

Supervisor::Config supervisorConfig(const AppConfig& cfg);

} // namespace topology
