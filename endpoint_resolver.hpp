#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace topology {

// Canonical externally exposed port of the stack (UI + API behind one proxy)
constexpr std::uint16_t kCanonicalPort = 3737;

// Relative prefix every API call goes through when served same-origin
constexpr const char* kApiBaseUrl = "/api";

enum class DeploymentMode { Production, Development };

const char* toString(DeploymentMode mode);

// Where the browser believes the page was loaded from (window.location)
struct BrowserLocation {
    std::string protocol = "http:";   // includes trailing ':'
    std::string hostname = "localhost";
    std::string port;                 // empty => scheme default
};

// Everything the resolver is allowed to look at. Filled once at the
// process boundary (environmentFromProcess) or by tests with literals.
struct ResolverInputs {
    bool production = false;
    std::optional<std::string> api_url_override;
    BrowserLocation location;
};

struct EndpointConfig {
    DeploymentMode mode = DeploymentMode::Development;
    std::string base_url;   // "" => same-origin relative addressing
    std::string base_path;  // base_url + "/api", or "/api"

    bool sameOrigin() const { return base_url.empty(); }
};

// Reads PROD / MODE / VITE_API_URL. The only place the resolver touches
// ambient process state.
ResolverInputs environmentFromProcess(const BrowserLocation& location);

// Parses "http://host:port" into a BrowserLocation; missing parts keep
// their defaults.
BrowserLocation parseOrigin(const std::string& origin);

// Pure resolution (one informational log line aside). Never fails.
EndpointConfig resolveEndpoint(const ResolverInputs& inputs);

std::string apiBasePath(const std::string& base_url);

// {mode, apiUrl, apiBasePath, apiBaseUrl} as consumed by the UI bundle
nlohmann::json endpointDocument(const EndpointConfig& endpoint);

// Writes endpointDocument() to path; false (with a log line) on I/O failure
bool writeEndpointDocument(const EndpointConfig& endpoint, const std::string& path);

} // namespace topology
