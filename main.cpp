// main.cpp - Container entrypoint: backend + reverse proxy on one exposed port
// Starts the backend, waits (best effort) for its health endpoint, then runs
// the router as the foreground process and exits with the router's code.
//
// Example config (config.json):
// {
//   "external_port": 3737,
//
//   "backend": {
//     "argv": ["python", "-m", "uvicorn", "src.server.main:app",
//              "--host", "127.0.0.1", "--port", "8000"],
//     "cwd": "/app/python",
//     "env": { "PYTHONPATH": "/app/python/src" },
//     "host": "127.0.0.1",
//     "port": 8000,
//     "health_path": "/health"
//   },
//
//   "router": {
//     "mode": "builtin",                          // or "nginx" / "command"
//     "binary": "/usr/local/bin/topology_router",
//     "nginx_conf_path": "/tmp/topology-nginx.conf"
//   },
//
//   "static_root": "/app/ui/dist",
//   "index_document": "index.html",
//   "strip_api_prefix": false,
//   "runtime_config_file": "runtime-config.json",
//   "readiness_timeout_sec": 60,
//   "health_interval_ms": 500,
//   "shutdown_grace_ms": 10000
// }
//
// Run:
//   ./topology_supervisor --config ./config.json
//
// CLI still works without config:
//   ./topology_supervisor --backend-cmd "uvicorn main:app --port 8000" \
//       --static-root ./dist --router-mode builtin --port 3737

#include <atomic>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "endpoint_resolver.hpp"
#include "errors.hpp"
#include "nginx_config.hpp"
#include "route_table.hpp"
#include "supervisor.hpp"
#include "supervisor_config.hpp"

using namespace topology;

// --------------------------- signals -----------------------------------------
static std::atomic<Supervisor*> g_supervisor{nullptr};
static std::atomic<int> g_signal{0};

static void handle_signal(int sig) {
    g_signal = sig;
    if (Supervisor* s = g_supervisor.load()) s->requestStop();
}

// ----------------------------------- CLI -------------------------------------
static void print_usage(const char* argv0) {
    std::cerr <<
    "Usage:\n"
    "  " << argv0 << " [--config FILE.json]\n"
    "               [--port N] [--static-root DIR]\n"
    "               [--backend-cmd \"CMD ...\"] [--backend-host HOST] [--backend-port N]\n"
    "               [--health-path PATH] [--readiness-timeout SEC]\n"
    "               [--router-mode builtin|nginx|command] [--router-cmd \"CMD ...\"]\n"
    "               [--strip-api-prefix] [--print-endpoint]\n"
    "\n"
    "Options given on the command line override the config file.\n"
    "  --print-endpoint  Resolve the UI's API endpoint from PROD/MODE/VITE_API_URL,\n"
    "                    print it as JSON and exit\n";
}

// Digits only: std::stoul accepts "-1" and wraps it
static unsigned long parse_number(const std::string& s) {
    if (s.empty() || s.size() > 9 || s.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("not a number: '" + s + "'");
    }
    return std::stoul(s);
}

static std::uint16_t parse_port(const std::string& s) {
    unsigned long v = parse_number(s);
    if (v == 0 || v > 65535) throw ConfigError("port out of range: " + s);
    return static_cast<std::uint16_t>(v);
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    AppConfig cfg;
    bool print_endpoint = false;

    try {
        // -------------------------- Config file first --------------------------
        for (int i = 1; i + 1 < argc; ++i) {
            if (std::string(argv[i]) == "--config") loadConfigFile(argv[i + 1], cfg);
        }

        // -------------------------- CLI overrides --------------------------
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto need = [&](const char* name) {
                if (i + 1 >= argc) { std::cerr << name << " requires value\n"; print_usage(argv[0]); std::exit(2); }
                return std::string(argv[++i]);
            };
            if (a == "--config") need("--config");
            else if (a == "--port") cfg.external_port = parse_port(need("--port"));
            else if (a == "--static-root") cfg.static_root = need("--static-root");
            else if (a == "--backend-cmd") {
                cfg.backend.spec.argv = { need("--backend-cmd") };
                cfg.backend.spec.shell = true;
                cfg.backend.spec.enabled = true;
            }
            else if (a == "--backend-host") cfg.backend.host = need("--backend-host");
            else if (a == "--backend-port") cfg.backend.port = parse_port(need("--backend-port"));
            else if (a == "--health-path") cfg.backend.health_path = need("--health-path");
            else if (a == "--readiness-timeout") cfg.readiness_timeout_sec = static_cast<unsigned>(parse_number(need("--readiness-timeout")));
            else if (a == "--router-mode") cfg.router.mode = parseRouterMode(need("--router-mode"));
            else if (a == "--router-cmd") {
                cfg.router.mode = RouterMode::Command;
                cfg.router.spec.argv = { need("--router-cmd") };
                cfg.router.spec.shell = true;
            }
            else if (a == "--strip-api-prefix") cfg.strip_api_prefix = true;
            else if (a == "--print-endpoint") print_endpoint = true;
            else if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
            else { std::cerr << "Unknown arg: " << a << "\n"; print_usage(argv[0]); return 2; }
        }

        // -------------------------- Topology checks --------------------------
        RouteTable table = buildRouteTable(cfg);
        table.validate();

        EndpointConfig endpoint = resolveEndpoint(environmentFromProcess(assumedBrowserLocation(cfg)));
        if (print_endpoint) {
            std::cout << endpointDocument(endpoint).dump(2) << std::endl;
            return 0;
        }
        requireSameOriginRoute(table, endpoint);

        if (cfg.backend.spec.enabled && cfg.backend.spec.argv.empty()) {
            throw ConfigError("backend.argv is empty (set backend.enabled=false to run without a local backend)");
        }

        if (!cfg.runtime_config_file.empty()) {
            auto path = std::filesystem::path(cfg.static_root) / cfg.runtime_config_file;
            if (!writeEndpointDocument(endpoint, path.string())) {
                std::cerr << "[Supervisor] WARNING: UI falls back to its own endpoint resolution" << std::endl;
            }
        }

        if (cfg.router.mode == RouterMode::Nginx &&
            !writeNginxConfig(table, nginxOptions(cfg), cfg.router.nginx_conf_path)) {
            std::cerr << "[Supervisor] FATAL: cannot write router configuration" << std::endl;
            return 1;
        }

        // -------------------------- Run --------------------------
        auto backend = std::make_unique<ProcessHandle>("backend", cfg.backend.spec, backendHealthCheck(cfg));
        auto router  = std::make_unique<ProcessHandle>("router", routerCommand(cfg));

        std::cout << "[Supervisor] Mode " << toString(endpoint.mode)
                  << ", router " << toString(cfg.router.mode)
                  << " on :" << cfg.external_port
                  << ", backend " << backendUpstream(cfg).hostPort() << std::endl;

        Supervisor sup(supervisorConfig(cfg), std::move(backend), std::move(router));
        g_supervisor = &sup;
        if (g_signal) sup.requestStop();

        int code = sup.run();
        g_supervisor = nullptr;
        if (int sig = g_signal.load()) {
            std::cout << "[Signal] Stopped by signal " << sig << " (" << strsignal(sig) << ")" << std::endl;
        }
        return code;
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 2;
    }
}
