#include "route_table.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>

namespace topology {

namespace fs = std::filesystem;

const char* toString(RouteTarget target) {
    return target == RouteTarget::BackendPassthrough ? "backend" : "static";
}

bool RouteRule::matches(const std::string& path) const {
    if (fallback) return true;
    if (match == MatchKind::Exact) return path == prefix;
    return path.compare(0, prefix.size(), prefix) == 0;
}

RouteTable::RouteTable(Upstream backend, std::string static_root, std::string index_document)
    : backend_(std::move(backend)),
      static_root_(std::move(static_root)),
      index_document_(std::move(index_document)) {
    RouteRule spa;
    spa.name = "spa";
    spa.prefix = "/";
    spa.target = RouteTarget::StaticRoot;
    spa.fallback = true;
    rules_.push_back(spa);
}

void RouteTable::add(RouteRule rule) {
    if (rule.fallback) {
        throw ConfigError("route '" + rule.name + "': only the built-in SPA rule may be a fallback");
    }
    auto it = rules_.end();
    if (!rules_.empty() && rules_.back().fallback) --it;
    rules_.insert(it, std::move(rule));
}

const RouteRule& RouteTable::match(const std::string& path) const {
    for (const auto& r : rules_) {
        if (r.matches(path)) return r;
    }
    // validate() guarantees a fallback; reaching here means the table was never validated
    throw ConfigError("no route matches '" + path + "' and the table has no fallback");
}

std::string RouteTable::upstreamTarget(const RouteRule& rule, const std::string& target) const {
    if (rule.preserve_prefix || rule.match != MatchKind::Prefix) return target;
    if (target.compare(0, rule.prefix.size(), rule.prefix) != 0) return target;

    std::string rest = target.substr(rule.prefix.size());
    if (rest.empty() || rest.front() != '/') rest.insert(rest.begin(), '/');
    return rest;
}

const RouteRule* RouteTable::findPassthrough(const std::string& prefix) const {
    for (const auto& r : rules_) {
        if (r.target == RouteTarget::BackendPassthrough && r.prefix == prefix) return &r;
    }
    return nullptr;
}

void RouteTable::validate() const {
    std::size_t fallbacks = 0;
    for (std::size_t i = 0; i < rules_.size(); ++i) {
        const auto& r = rules_[i];
        if (r.prefix.empty() || r.prefix.front() != '/') {
            throw ConfigError("route '" + r.name + "': prefix must start with '/'");
        }
        if (r.fallback) {
            ++fallbacks;
            if (i + 1 != rules_.size()) {
                throw ConfigError("route '" + r.name + "': fallback must be the last rule");
            }
            if (r.target != RouteTarget::StaticRoot) {
                throw ConfigError("route '" + r.name + "': fallback must serve the static root");
            }
        }
        if (r.target == RouteTarget::BackendPassthrough && !backend_.valid()) {
            throw ConfigError("route '" + r.name + "': passthrough without a backend address");
        }
    }
    if (fallbacks != 1) {
        throw ConfigError("route table needs exactly one fallback rule, found " + std::to_string(fallbacks));
    }
    if (static_root_.empty()) throw ConfigError("static root is not set");
    if (index_document_.empty()) throw ConfigError("entry document is not set");
}

std::optional<std::string> percentDecode(const std::string& in) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') { out.push_back(in[i]); continue; }
        if (i + 2 >= in.size()) return std::nullopt;
        int hi = hex(in[i + 1]);
        int lo = hex(in[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

static bool regular_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

StaticFile RouteTable::resolveStatic(const std::string& path) const {
    StaticFile out;

    auto decoded = percentDecode(path);
    if (!decoded || decoded->find('\0') != std::string::npos) {
        out.kind = StaticFile::Kind::Rejected;
        return out;
    }

    // Walk segments; ".." is never allowed to climb out of the root
    fs::path rel;
    std::stringstream ss(*decoded);
    std::string seg;
    while (std::getline(ss, seg, '/')) {
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            out.kind = StaticFile::Kind::Rejected;
            return out;
        }
        rel /= seg;
    }

    const fs::path root(static_root_);
    const fs::path candidate = root / rel;

    // try_files $uri $uri/ /index.html
    if (!rel.empty() && regular_file(candidate)) {
        out.kind = StaticFile::Kind::Direct;
        out.file = candidate.string();
        return out;
    }
    std::error_code ec;
    if (fs::is_directory(candidate, ec) && regular_file(candidate / index_document_)) {
        out.kind = rel.empty() ? StaticFile::Kind::EntryDocument : StaticFile::Kind::Direct;
        out.file = (candidate / index_document_).string();
        return out;
    }

    const fs::path entry = root / index_document_;
    if (regular_file(entry)) {
        out.kind = StaticFile::Kind::EntryDocument;
        out.file = entry.string();
        return out;
    }
    out.kind = StaticFile::Kind::Missing;
    return out;
}

RouteTable defaultRouteTable(const Upstream& backend,
                             const std::string& static_root,
                             const std::string& index_document,
                             bool strip_api_prefix) {
    RouteTable table(backend, static_root, index_document);

    RouteRule health;
    health.name = "health";
    health.prefix = "/health";
    health.match = MatchKind::Exact;
    health.target = RouteTarget::BackendPassthrough;
    table.add(health);

    RouteRule docs;
    docs.name = "docs";
    docs.prefix = "/docs";
    docs.target = RouteTarget::BackendPassthrough;
    table.add(docs);

    // Long-running backend operations and streamed responses live under /api/
    RouteRule api;
    api.name = "api";
    api.prefix = "/api/";
    api.target = RouteTarget::BackendPassthrough;
    api.preserve_prefix = !strip_api_prefix;
    api.buffering = false;
    api.connect_timeout = std::chrono::seconds(60);
    api.read_timeout = std::chrono::seconds(300);
    table.add(api);

    return table;
}

void requireSameOriginRoute(const RouteTable& table, const EndpointConfig& endpoint) {
    if (!endpoint.sameOrigin()) return;
    if (!table.findPassthrough("/api/")) {
        throw ConfigError("UI resolves the API same-origin but the router has no /api/ passthrough rule");
    }
}

} // namespace topology
