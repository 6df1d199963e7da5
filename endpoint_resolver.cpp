#include "endpoint_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace topology {

const char* toString(DeploymentMode mode) {
    return mode == DeploymentMode::Production ? "production" : "development";
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return false;
    std::string s = lowercase(v);
    return s == "1" || s == "true" || s == "yes";
}

ResolverInputs environmentFromProcess(const BrowserLocation& location) {
    ResolverInputs in;
    in.location = location;

    const char* mode = std::getenv("MODE");
    in.production = env_flag("PROD") || (mode && lowercase(mode) == "production");

    const char* url = std::getenv("VITE_API_URL");
    if (url && *url) in.api_url_override = std::string(url);
    return in;
}

BrowserLocation parseOrigin(const std::string& origin) {
    BrowserLocation loc;
    std::string u = origin;

    auto pos_protocol = u.find("://");
    if (pos_protocol != std::string::npos) {
        loc.protocol = u.substr(0, pos_protocol) + ":";
        u = u.substr(pos_protocol + 3);
    }

    auto slash = u.find('/');
    if (slash != std::string::npos) u = u.substr(0, slash);

    // "[::1]:3737" keeps the brackets in hostname, like window.location does
    auto bracket = u.rfind(']');
    auto colon = u.rfind(':');
    if (bracket != std::string::npos && colon != std::string::npos && colon < bracket) {
        colon = std::string::npos;
    }
    if (colon != std::string::npos) {
        loc.hostname = u.substr(0, colon);
        loc.port = u.substr(colon + 1);
    } else if (!u.empty()) {
        loc.hostname = u;
    }
    return loc;
}

static bool is_scheme_default_port(const BrowserLocation& loc) {
    if (loc.port.empty()) return true;
    if (loc.protocol == "http:" && loc.port == "80") return true;
    if (loc.protocol == "https:" && loc.port == "443") return true;
    return false;
}

std::string apiBasePath(const std::string& base_url) {
    if (base_url.empty()) return kApiBaseUrl;
    return base_url + kApiBaseUrl;
}

EndpointConfig resolveEndpoint(const ResolverInputs& inputs) {
    EndpointConfig out;

    if (inputs.production) {
        // Same-origin: UI and API share the single exposed port through the proxy
        out.mode = DeploymentMode::Production;
        out.base_url.clear();
        std::cout << "[Resolver] Production mode - using same-origin relative API paths" << std::endl;
    } else if (inputs.api_url_override && !inputs.api_url_override->empty()) {
        out.mode = DeploymentMode::Development;
        out.base_url = *inputs.api_url_override;
        std::cout << "[Resolver] Development mode - using API override: " << out.base_url << std::endl;
    } else {
        const auto& loc = inputs.location;
        std::string port = is_scheme_default_port(loc) ? std::to_string(kCanonicalPort) : loc.port;
        out.mode = DeploymentMode::Development;
        out.base_url = loc.protocol + "//" + loc.hostname + ":" + port;
        std::cout << "[Resolver] Development mode - using port: " << port << std::endl;
    }

    out.base_path = apiBasePath(out.base_url);
    return out;
}

nlohmann::json endpointDocument(const EndpointConfig& endpoint) {
    return nlohmann::json{
        {"mode", toString(endpoint.mode)},
        {"apiUrl", endpoint.base_url},
        {"apiBasePath", endpoint.base_path},
        {"apiBaseUrl", kApiBaseUrl},
    };
}

bool writeEndpointDocument(const EndpointConfig& endpoint, const std::string& path) {
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        std::cerr << "[Resolver] Cannot write runtime config: " << path << std::endl;
        return false;
    }
    f << endpointDocument(endpoint).dump(2) << "\n";
    if (!f.good()) {
        std::cerr << "[Resolver] Short write on runtime config: " << path << std::endl;
        return false;
    }
    std::cout << "[Resolver] Runtime config written to " << path << std::endl;
    return true;
}

} // namespace topology
