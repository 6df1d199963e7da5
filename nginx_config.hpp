#pragma once

#include <cstdint>
#include <string>

#include "route_table.hpp"

namespace topology {

struct NginxOptions {
    std::uint16_t listen_port = kCanonicalPort;
    std::string   server_name = "_";
    std::string   pid_file = "/tmp/topology-nginx.pid";
    std::string   error_log = "/dev/stderr";
    std::string   access_log = "/dev/stdout";
    unsigned      worker_connections = 1024;
};

// Renders the ordered route table as a complete nginx.conf (events + http).
// Rules become `location` blocks in table order; exact rules use `location =`.
std::string renderNginxConfig(const RouteTable& table, const NginxOptions& options);

// Validates the table, renders it and writes it to `path`. Throws ConfigError
// on an invalid table, returns false (with a log line) on I/O failure.
bool writeNginxConfig(const RouteTable& table, const NginxOptions& options, const std::string& path);

} // namespace topology
