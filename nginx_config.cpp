#include "nginx_config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace topology {

static void render_passthrough(std::ostringstream& out, const RouteRule& r) {
    // No URI part on proxy_pass => nginx forwards the original URI untouched.
    // A trailing "/" replaces the matched prefix with "/".
    const bool strip = !r.preserve_prefix && r.match == MatchKind::Prefix;
    out << "        proxy_pass http://backend" << (strip ? "/" : "") << ";\n"
        << "        proxy_http_version 1.1;\n"
        << "        proxy_set_header Host $host;\n"
        << "        proxy_set_header X-Real-IP $remote_addr;\n"
        << "        proxy_set_header X-Forwarded-For $proxy_add_x_forwarded_for;\n"
        << "        proxy_set_header X-Forwarded-Proto $scheme;\n"
        << "        proxy_connect_timeout " << r.connect_timeout.count() << "s;\n"
        << "        proxy_read_timeout " << r.read_timeout.count() << "s;\n"
        << "        proxy_send_timeout " << r.read_timeout.count() << "s;\n";
    if (!r.buffering) {
        out << "        proxy_buffering off;\n"
            << "        proxy_cache off;\n"
            << "        proxy_set_header Connection \"\";\n";
    }
}

static void render_static(std::ostringstream& out, const RouteTable& table) {
    out << "        try_files $uri $uri/ /" << table.indexDocument() << ";\n";
}

std::string renderNginxConfig(const RouteTable& table, const NginxOptions& options) {
    std::ostringstream out;

    out << "# Generated by topology_supervisor; edits are overwritten on restart.\n"
        << "worker_processes 1;\n"
        << "pid " << options.pid_file << ";\n"
        << "error_log " << options.error_log << " warn;\n"
        << "\n"
        << "events {\n"
        << "    worker_connections " << options.worker_connections << ";\n"
        << "}\n"
        << "\n"
        << "http {\n"
        << "    include /etc/nginx/mime.types;\n"
        << "    default_type application/octet-stream;\n"
        << "    access_log " << options.access_log << ";\n"
        << "    sendfile on;\n"
        << "\n"
        << "    upstream backend {\n"
        << "        server " << table.backend().hostPort() << ";\n"
        << "    }\n"
        << "\n"
        << "    server {\n"
        << "        listen " << options.listen_port << ";\n"
        << "        server_name " << options.server_name << ";\n"
        << "        root " << table.staticRoot() << ";\n"
        << "        index " << table.indexDocument() << ";\n";

    for (const auto& r : table.rules()) {
        out << "\n        # " << r.name << " -> " << toString(r.target) << "\n";
        if (r.fallback) {
            out << "        location / {\n";
        } else if (r.match == MatchKind::Exact) {
            out << "        location = " << r.prefix << " {\n";
        } else {
            out << "        location " << r.prefix << " {\n";
        }

        std::ostringstream body;
        if (r.target == RouteTarget::BackendPassthrough) render_passthrough(body, r);
        else render_static(body, table);

        // location bodies sit one level deeper than the server block
        std::istringstream lines(body.str());
        std::string line;
        while (std::getline(lines, line)) out << "    " << line << "\n";
        out << "        }\n";
    }

    out << "    }\n"
        << "}\n";
    return out.str();
}

bool writeNginxConfig(const RouteTable& table, const NginxOptions& options, const std::string& path) {
    table.validate();

    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        std::cerr << "[Router] Cannot open nginx config for writing: " << path << std::endl;
        return false;
    }
    f << renderNginxConfig(table, options);
    if (!f.good()) {
        std::cerr << "[Router] Short write on nginx config: " << path << std::endl;
        return false;
    }
    std::cout << "[Router] nginx config written to " << path
              << " (" << table.rules().size() << " routes)" << std::endl;
    return true;
}

} // namespace topology
