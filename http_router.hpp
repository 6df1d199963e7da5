#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "route_table.hpp"

namespace topology {

struct RouterOptions {
    std::string   listen_address = "0.0.0.0";
    std::uint16_t listen_port = kCanonicalPort;     // 0 => ephemeral (tests)
    std::chrono::seconds client_idle_timeout{75};
    std::uint64_t max_request_body = 100ull * 1024 * 1024;
    std::string   forwarded_proto = "http";
    bool          access_log = true;
};

// Beast-based reverse proxy implementing a RouteTable on one port.
// Passthrough rules are forwarded to the backend with forwarding headers;
// everything else is served from the static root with SPA fallback.
// Upstream connect failures answer 502, upstream deadlines 504.
class HttpRouter {
public:
    HttpRouter(RouteTable table, RouterOptions options);
    ~HttpRouter();

    HttpRouter(const HttpRouter&) = delete;
    HttpRouter& operator=(const HttpRouter&) = delete;

    bool start();
    void stop();

    // Actual bound port once start() succeeded
    std::uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::thread io_thread_;
};

// "text/html" etc. by file extension; octet-stream when unknown
const char* mimeType(const std::string& path);

} // namespace topology
