#include "health_probe.hpp"
#include "beast_io.hpp"

#include <boost/beast/http.hpp>

namespace topology {

namespace http = boost::beast::http;

ProbeResult HttpHealthProbe::probe(const HealthCheck& check) {
    ProbeResult result;
    BlockingIo io;

    beast::error_code ec;
    tcp::resolver resolver(io.context());
    auto endpoints = resolver.resolve(check.host, std::to_string(check.port), ec);
    if (ec) {
        result.error = "resolve " + check.host + ": " + ec.message();
        return result;
    }

    beast::tcp_stream stream(io.context());
    stream.expires_after(check.timeout);

    ec = io.run([&](auto handler) { stream.async_connect(endpoints, handler); });
    if (ec) {
        result.error = "connect: " + ec.message();
        return result;
    }

    http::request<http::empty_body> req{http::verb::get, check.path, 11};
    req.set(http::field::host, check.host + ":" + std::to_string(check.port));
    req.set(http::field::user_agent, "topology-health/1.0");
    req.set(http::field::connection, "close");

    ec = io.run([&](auto handler) { http::async_write(stream, req, handler); });
    if (ec) {
        result.error = "write: " + ec.message();
        return result;
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    ec = io.run([&](auto handler) { http::async_read(stream, buffer, res, handler); });
    if (ec) {
        result.error = "read: " + ec.message();
        return result;
    }

    beast::error_code ignore;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignore);

    result.status = static_cast<int>(res.result_int());
    result.ok = result.status >= 200 && result.status < 300;
    return result;
}

} // namespace topology
