#include "supervisor_config.hpp"

#include <fstream>
#include <iostream>

namespace topology {

using json = nlohmann::json;

const char* toString(RouterMode mode) {
    switch (mode) {
        case RouterMode::Builtin: return "builtin";
        case RouterMode::Nginx:   return "nginx";
        case RouterMode::Command: return "command";
    }
    return "?";
}

RouterMode parseRouterMode(const std::string& s) {
    if (s == "builtin") return RouterMode::Builtin;
    if (s == "nginx")   return RouterMode::Nginx;
    if (s == "command") return RouterMode::Command;
    throw ConfigError("unknown router mode '" + s + "' (expected builtin, nginx or command)");
}

static ProcessSpec parse_proc(const json& jp, ProcessSpec sp) {
    if (jp.contains("enabled")) sp.enabled = jp["enabled"].get<bool>();
    if (jp.contains("cwd")) sp.cwd = jp["cwd"].get<std::string>();
    if (jp.contains("shell")) sp.shell = jp["shell"].get<bool>();
    if (jp.contains("argv") && jp["argv"].is_array()) {
        sp.argv.clear();
        for (const auto& a : jp["argv"]) sp.argv.push_back(a.get<std::string>());
    }
    if (jp.contains("env") && jp["env"].is_object()) {
        for (auto it = jp["env"].begin(); it != jp["env"].end(); ++it) {
            sp.env[it.key()] = it.value().get<std::string>();
        }
    }
    return sp;
}

// Signed read: get<unsigned>() would wrap a negative value silently
static long long get_integer(const json& j, const char* key, long long min, long long max) {
    const auto& v = j[key];
    if (!v.is_number_integer()) throw ConfigError(std::string(key) + " must be an integer");
    auto n = v.get<long long>();
    if (n < min || n > max) {
        throw ConfigError(std::string(key) + " out of range: " + std::to_string(n) +
                          " (expected " + std::to_string(min) + ".." + std::to_string(max) + ")");
    }
    return n;
}

static std::uint16_t get_port(const json& j, const char* key) {
    return static_cast<std::uint16_t>(get_integer(j, key, 1, 65535));
}

// Bounds for the timing keys. Intervals below 10 ms turn the polling loops
// into busy loops.
struct TimingLimit {
    const char* key;
    unsigned AppConfig::*field;
    long long min;
    long long max;
};

static const TimingLimit kTimingLimits[] = {
    {"readiness_timeout_sec", &AppConfig::readiness_timeout_sec, 0, 86400},
    {"health_interval_ms",    &AppConfig::health_interval_ms,    10, 60000},
    {"probe_timeout_ms",      &AppConfig::probe_timeout_ms,      1, 600000},
    {"monitor_interval_ms",   &AppConfig::monitor_interval_ms,   10, 60000},
    {"shutdown_grace_ms",     &AppConfig::shutdown_grace_ms,     0, 600000},
};

void validateTimings(const AppConfig& cfg) {
    for (const auto& t : kTimingLimits) {
        long long v = cfg.*t.field;
        if (v < t.min || v > t.max) {
            throw ConfigError(std::string(t.key) + " out of range: " + std::to_string(v) +
                              " (expected " + std::to_string(t.min) + ".." + std::to_string(t.max) + ")");
        }
    }
}

void loadConfig(const json& j, AppConfig& cfg) {
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    try {
        if (j.contains("external_port")) cfg.external_port = get_port(j, "external_port");

        if (j.contains("backend") && j["backend"].is_object()) {
            const auto& jb = j["backend"];
            cfg.backend.spec = parse_proc(jb, cfg.backend.spec);
            if (jb.contains("host")) cfg.backend.host = jb["host"].get<std::string>();
            if (jb.contains("port")) cfg.backend.port = get_port(jb, "port");
            if (jb.contains("health_path")) cfg.backend.health_path = jb["health_path"].get<std::string>();
        }

        if (j.contains("router") && j["router"].is_object()) {
            const auto& jr = j["router"];
            if (jr.contains("mode")) cfg.router.mode = parseRouterMode(jr["mode"].get<std::string>());
            cfg.router.spec = parse_proc(jr, cfg.router.spec);
            if (jr.contains("binary")) cfg.router.binary = jr["binary"].get<std::string>();
            if (jr.contains("nginx_binary")) cfg.router.nginx_binary = jr["nginx_binary"].get<std::string>();
            if (jr.contains("nginx_conf_path")) cfg.router.nginx_conf_path = jr["nginx_conf_path"].get<std::string>();
        }

        if (j.contains("static_root")) cfg.static_root = j["static_root"].get<std::string>();
        if (j.contains("index_document")) cfg.index_document = j["index_document"].get<std::string>();
        if (j.contains("strip_api_prefix")) cfg.strip_api_prefix = j["strip_api_prefix"].get<bool>();
        if (j.contains("runtime_config_file")) cfg.runtime_config_file = j["runtime_config_file"].get<std::string>();
        if (j.contains("public_origin")) cfg.public_origin = j["public_origin"].get<std::string>();

        for (const auto& t : kTimingLimits) {
            if (j.contains(t.key)) cfg.*t.field = static_cast<unsigned>(get_integer(j, t.key, t.min, t.max));
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config: ") + e.what());
    }
}

void loadConfigFile(const std::string& path, AppConfig& cfg) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open config file: " + path);

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("config " + path + ": " + e.what());
    }
    loadConfig(j, cfg);
    std::cout << "[Config] Loaded " << path << std::endl;
}

Upstream backendUpstream(const AppConfig& cfg) {
    Upstream up;
    up.host = cfg.backend.host;
    up.port = cfg.backend.port;
    return up;
}

HealthCheck backendHealthCheck(const AppConfig& cfg) {
    HealthCheck hc;
    hc.host = cfg.backend.host;
    hc.port = cfg.backend.port;
    hc.path = cfg.backend.health_path;
    hc.timeout = std::chrono::milliseconds(cfg.probe_timeout_ms);
    return hc;
}

RouteTable buildRouteTable(const AppConfig& cfg) {
    return defaultRouteTable(backendUpstream(cfg), cfg.static_root, cfg.index_document, cfg.strip_api_prefix);
}

NginxOptions nginxOptions(const AppConfig& cfg) {
    NginxOptions opts;
    opts.listen_port = cfg.external_port;
    return opts;
}

BrowserLocation assumedBrowserLocation(const AppConfig& cfg) {
    if (!cfg.public_origin.empty()) return parseOrigin(cfg.public_origin);
    BrowserLocation loc;
    loc.port = std::to_string(cfg.external_port);
    return loc;
}

ProcessSpec routerCommand(const AppConfig& cfg) {
    switch (cfg.router.mode) {
        case RouterMode::Builtin: {
            ProcessSpec sp;
            sp.argv = {
                cfg.router.binary,
                "--port", std::to_string(cfg.external_port),
                "--backend", backendUpstream(cfg).hostPort(),
                "--static-root", cfg.static_root,
                "--index", cfg.index_document,
            };
            if (cfg.strip_api_prefix) sp.argv.push_back("--strip-api-prefix");
            return sp;
        }
        case RouterMode::Nginx: {
            ProcessSpec sp;
            sp.argv = { cfg.router.nginx_binary, "-g", "daemon off;", "-c", cfg.router.nginx_conf_path };
            return sp;
        }
        case RouterMode::Command:
            if (cfg.router.spec.argv.empty()) {
                throw ConfigError("router mode 'command' needs router.argv");
            }
            return cfg.router.spec;
    }
    throw ConfigError("unhandled router mode");
}

std::optional<ProcessSpec> routerPreflight(const AppConfig& cfg) {
    if (cfg.router.mode != RouterMode::Nginx) return std::nullopt;
    ProcessSpec sp;
    sp.argv = { cfg.router.nginx_binary, "-t", "-q", "-c", cfg.router.nginx_conf_path };
    return sp;
}

Supervisor::Config supervisorConfig(const AppConfig& cfg) {
    validateTimings(cfg);
    Supervisor::Config sc;
    sc.readiness_timeout = std::chrono::seconds(cfg.readiness_timeout_sec);
    sc.health_interval = std::chrono::milliseconds(cfg.health_interval_ms);
    sc.monitor_interval = std::chrono::milliseconds(cfg.monitor_interval_ms);
    sc.shutdown_grace = std::chrono::milliseconds(cfg.shutdown_grace_ms);
    sc.router_preflight = routerPreflight(cfg);
    return sc;
}

} // namespace topology
