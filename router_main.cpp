// router_main.cpp - Built-in reverse proxy for the single exposed port
// Serves the UI bundle (SPA fallback) and passes /health, /docs and /api/*
// through to the backend on loopback. Launched by topology_supervisor in
// router mode "builtin"; runs until SIGINT/SIGTERM.
//
// Run:
//   ./topology_router --port 3737 --backend 127.0.0.1:8000 --static-root ./dist
//   ./topology_router --config ./config.json

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "errors.hpp"
#include "http_router.hpp"
#include "route_table.hpp"
#include "supervisor_config.hpp"

using namespace topology;

// --------------------------- signals -----------------------------------------
static std::atomic<int> g_signal{0};
static void handle_signal(int sig) { g_signal = sig; }

static void print_usage(const char* argv0) {
    std::cerr <<
    "Usage:\n"
    "  " << argv0 << " [--config FILE.json]\n"
    "               [--port N] [--listen-address ADDR]\n"
    "               [--backend HOST:PORT] [--static-root DIR] [--index FILE]\n"
    "               [--strip-api-prefix] [--quiet]\n";
}

// Digits only: std::stoul accepts "-1" and wraps it. 0 asks for an
// ephemeral port.
static std::uint16_t parse_port(const std::string& s, bool allow_zero = false) {
    if (s.empty() || s.size() > 5 || s.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("not a port number: '" + s + "'");
    }
    unsigned long v = std::stoul(s);
    if ((v == 0 && !allow_zero) || v > 65535) throw ConfigError("port out of range: " + s);
    return static_cast<std::uint16_t>(v);
}

static Upstream parse_host_port(const std::string& s) {
    auto colon = s.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == s.size()) {
        throw ConfigError("expected HOST:PORT, got '" + s + "'");
    }
    Upstream up;
    up.host = s.substr(0, colon);
    up.port = parse_port(s.substr(colon + 1));
    return up;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);

    AppConfig cfg;
    RouterOptions opts;

    try {
        for (int i = 1; i + 1 < argc; ++i) {
            if (std::string(argv[i]) == "--config") loadConfigFile(argv[i + 1], cfg);
        }

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto need = [&](const char* name) {
                if (i + 1 >= argc) { std::cerr << name << " requires value\n"; print_usage(argv[0]); std::exit(2); }
                return std::string(argv[++i]);
            };
            if (a == "--config") need("--config");
            else if (a == "--port") cfg.external_port = parse_port(need("--port"), true);
            else if (a == "--listen-address") opts.listen_address = need("--listen-address");
            else if (a == "--backend") {
                Upstream up = parse_host_port(need("--backend"));
                cfg.backend.host = up.host;
                cfg.backend.port = up.port;
            }
            else if (a == "--static-root") cfg.static_root = need("--static-root");
            else if (a == "--index") cfg.index_document = need("--index");
            else if (a == "--strip-api-prefix") cfg.strip_api_prefix = true;
            else if (a == "--quiet") opts.access_log = false;
            else if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
            else { std::cerr << "Unknown arg: " << a << "\n"; print_usage(argv[0]); return 2; }
        }

        RouteTable table = buildRouteTable(cfg);
        table.validate();
        opts.listen_port = cfg.external_port;

        HttpRouter router(std::move(table), opts);
        if (!router.start()) {
            std::cerr << "[Router] FATAL: cannot listen on " << opts.listen_address << ":" << opts.listen_port << std::endl;
            return 1;
        }

        while (!g_signal) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        const int sig = g_signal.load();
        std::cout << "[Signal] Received " << strsignal(sig) << ", shutting down" << std::endl;
        router.stop();
        // Shell convention, so the supervisor reports how the router ended
        return 128 + sig;
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 2;
    }
}
