#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "endpoint_resolver.hpp"
#include "errors.hpp"

namespace topology {

// Backend address as seen from inside the container (loopback only)
struct Upstream {
    std::string   host = "127.0.0.1";
    std::uint16_t port = 8000;

    bool valid() const { return !host.empty() && port != 0; }
    std::string hostPort() const { return host + ":" + std::to_string(port); }
};

enum class MatchKind { Exact, Prefix };
enum class RouteTarget { StaticRoot, BackendPassthrough };

const char* toString(RouteTarget target);

struct RouteRule {
    std::string name;
    std::string prefix;                       // external path (exact or prefix)
    MatchKind   match = MatchKind::Prefix;
    RouteTarget target = RouteTarget::StaticRoot;
    bool        preserve_prefix = true;       // forward "/api/x" as "/api/x"
    bool        buffering = true;             // false => stream upstream body
    bool        fallback = false;             // SPA catch-all, always last

    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds read_timeout{60};

    bool matches(const std::string& path) const;
};

struct StaticFile {
    enum class Kind {
        Direct,         // path names an existing file (or directory index)
        EntryDocument,  // SPA fallback
        Rejected,       // ".." segments or malformed escapes
        Missing,        // no entry document under the static root
    };
    Kind        kind = Kind::Missing;
    std::string file;
};

class RouteTable {
public:
    RouteTable(Upstream backend, std::string static_root, std::string index_document = "index.html");

    // Inserts ahead of the fallback rule; priority is insertion order.
    void add(RouteRule rule);

    const std::vector<RouteRule>& rules() const { return rules_; }
    const Upstream& backend() const { return backend_; }
    const std::string& staticRoot() const { return static_root_; }
    const std::string& indexDocument() const { return index_document_; }

    // Exactly one rule for any path: first match in priority order, else fallback.
    // `path` excludes the query string.
    const RouteRule& match(const std::string& path) const;

    // Request-target (path + query) forwarded to the backend for `rule`
    std::string upstreamTarget(const RouteRule& rule, const std::string& target) const;

    // File to serve for a static path: the file itself, the directory's
    // index document, or the entry document (SPA fallback).
    StaticFile resolveStatic(const std::string& path) const;

    // Passthrough rule owning `prefix`, if any
    const RouteRule* findPassthrough(const std::string& prefix) const;

    // Throws ConfigError when the table cannot route every request.
    void validate() const;

private:
    Upstream backend_;
    std::string static_root_;
    std::string index_document_;
    std::vector<RouteRule> rules_;
};

// /health (exact) + /docs -> backend, /api/ -> backend (streamed), rest -> SPA
RouteTable defaultRouteTable(const Upstream& backend,
                             const std::string& static_root,
                             const std::string& index_document = "index.html",
                             bool strip_api_prefix = false);

// Same-origin UI needs the proxy to own /api/; throws ConfigError otherwise.
void requireSameOriginRoute(const RouteTable& table, const EndpointConfig& endpoint);

// "%2F" -> "/" etc.; nullopt on malformed escapes
std::optional<std::string> percentDecode(const std::string& in);

} // namespace topology
