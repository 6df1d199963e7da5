#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace topology {

// HTTP GET contract consumed from a supervised process
struct HealthCheck {
    std::string   host = "127.0.0.1";
    std::uint16_t port = 8000;
    std::string   path = "/health";
    std::chrono::milliseconds timeout{2000};   // per attempt
};

struct ProbeResult {
    bool        ok = false;
    int         status = 0;    // HTTP status, 0 when no response was read
    std::string error;         // transport error, empty on any HTTP response
};

// Seam between the supervisor and the network; tests swap in fakes.
class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    virtual ProbeResult probe(const HealthCheck& check) = 0;
};

// One HTTP/1.1 GET per call over Boost.Beast. 2xx => ok; any other status,
// refused connection or deadline expiry => not ok.
class HttpHealthProbe : public HealthProbe {
public:
    ProbeResult probe(const HealthCheck& check) override;
};

} // namespace topology
