#include <catch2/catch.hpp>

#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <unistd.h>

#include "beast_io.hpp"
#include "http_router.hpp"

using namespace topology;
namespace http = boost::beast::http;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Loopback HTTP server standing in for the backend. Echoes what it received
// as JSON; "/api/stream" answers with an EOF-delimited body, paths ending
// in "/chunked" answer with a chunked body and "/slow" answers after a few
// seconds.
class BackendStub {
public:
    BackendStub() : acceptor_(ioc_, {net::ip::make_address("127.0.0.1"), 0}) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { loop(); });
    }

    ~BackendStub() {
        stopping_ = true;
        beast::error_code ec;
        tcp::socket wake(ioc_);
        wake.connect({net::ip::make_address("127.0.0.1"), port_}, ec);
        thread_.join();
        for (auto& t : sessions_) t.join();
    }

    std::uint16_t port() const { return port_; }

private:
    void loop() {
        for (;;) {
            beast::error_code ec;
            tcp::socket sock(ioc_);
            acceptor_.accept(sock, ec);
            if (stopping_ || ec) return;
            sessions_.emplace_back([s = std::move(sock)]() mutable { serve(std::move(s)); });
        }
    }

    static void serve(tcp::socket sock) {
        beast::error_code ec;
        beast::flat_buffer buf;
        http::request<http::string_body> req;
        http::read(sock, buf, req, ec);
        if (ec) return;

        const std::string target(req.target().data(), req.target().size());

        if (target == "/api/stream") {
            const std::string raw =
                "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nConnection: close\r\n\r\nstreamed-body";
            net::write(sock, net::buffer(raw), ec);
            sock.shutdown(tcp::socket::shutdown_send, ec);
            return;
        }
        const std::string chunked_suffix = "/chunked";
        if (target.size() >= chunked_suffix.size() &&
            target.compare(target.size() - chunked_suffix.size(), chunked_suffix.size(), chunked_suffix) == 0) {
            const std::string raw =
                "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nTransfer-Encoding: chunked\r\n"
                "Connection: close\r\n\r\n5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n";
            net::write(sock, net::buffer(raw), ec);
            sock.shutdown(tcp::socket::shutdown_send, ec);
            return;
        }
        if (target.rfind("/slow", 0) == 0) {
            std::this_thread::sleep_for(std::chrono::seconds(3));
        }

        auto field = [&req](const char* name) {
            auto v = req[name];
            return std::string(v.data(), v.size());
        };
        json echo = {
            {"method", std::string(req.method_string().data(), req.method_string().size())},
            {"target", target},
            {"host", field("Host")},
            {"x_forwarded_for", field("X-Forwarded-For")},
            {"x_real_ip", field("X-Real-IP")},
            {"x_forwarded_proto", field("X-Forwarded-Proto")},
            {"body", req.body()},
        };

        http::response<http::string_body> res{http::status::ok, 11};
        res.set(http::field::content_type, "application/json");
        res.body() = echo.dump();
        res.keep_alive(false);
        res.prepare_payload();
        http::write(sock, res, ec);
        sock.shutdown(tcp::socket::shutdown_send, ec);
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
    std::vector<std::thread> sessions_;
};

struct StaticRoot {
    fs::path dir;

    StaticRoot() {
        dir = fs::temp_directory_path() / ("topology-router-test-ui-" + std::to_string(::getpid()));
        fs::create_directories(dir / "assets");
        std::ofstream(dir / "index.html") << "<html>entry</html>";
        std::ofstream(dir / "assets" / "app.js") << "console.log('ui')";
    }
    ~StaticRoot() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

std::uint16_t unused_port() {
    net::io_context ioc;
    tcp::acceptor a(ioc, {net::ip::make_address("127.0.0.1"), 0});
    return a.local_endpoint().port();
}

Upstream loopback(std::uint16_t port) {
    Upstream up;
    up.port = port;
    return up;
}

RouterOptions test_options() {
    RouterOptions opts;
    opts.listen_address = "127.0.0.1";
    opts.listen_port = 0;
    opts.access_log = false;
    return opts;
}

http::response<http::string_body> fetch(std::uint16_t port,
                                        http::verb method,
                                        const std::string& target,
                                        const std::string& body = "",
                                        const std::string& forwarded_for = "") {
    net::io_context ioc;
    tcp::socket sock(ioc);
    sock.connect({net::ip::make_address("127.0.0.1"), port});

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "ui.example.test");
    if (!forwarded_for.empty()) req.set("X-Forwarded-For", forwarded_for);
    req.body() = body;
    req.prepare_payload();
    http::write(sock, req);

    beast::flat_buffer buf;
    http::response_parser<http::string_body> parser;
    parser.body_limit(1024 * 1024);
    if (method == http::verb::head) parser.skip(true);
    http::read(sock, buf, parser);

    beast::error_code ec;
    sock.shutdown(tcp::socket::shutdown_both, ec);
    return parser.release();
}

// HTTP/1.0 request without keep-alive; returns everything the router sent
// until it closed the connection.
std::string fetch_http10(std::uint16_t port, const std::string& target) {
    net::io_context ioc;
    tcp::socket sock(ioc);
    sock.connect({net::ip::make_address("127.0.0.1"), port});

    const std::string raw = "GET " + target + " HTTP/1.0\r\nHost: ui.example.test\r\n\r\n";
    net::write(sock, net::buffer(raw));

    std::string out;
    char buf[4096];
    beast::error_code ec;
    for (;;) {
        std::size_t n = sock.read_some(net::buffer(buf), ec);
        out.append(buf, n);
        if (ec) break;
    }
    REQUIRE(ec == net::error::eof);
    return out;
}

std::string header(const http::response<http::string_body>& res, http::field f) {
    auto v = res[f];
    return std::string(v.data(), v.size());
}

} // namespace

TEST_CASE("Router passes API requests through with the prefix preserved", "[router]") {
    BackendStub backend;
    StaticRoot root;
    HttpRouter router(defaultRouteTable(loopback(backend.port()), root.dir.string()), test_options());
    REQUIRE(router.start());
    REQUIRE(router.port() != 0);

    SECTION("GET keeps path, query and Host") {
        auto res = fetch(router.port(), http::verb::get, "/api/widgets?x=1");
        REQUIRE(res.result() == http::status::ok);
        json echo = json::parse(res.body());
        CHECK(echo["method"] == "GET");
        CHECK(echo["target"] == "/api/widgets?x=1");
        CHECK(echo["host"] == "ui.example.test");
        CHECK(echo["x_real_ip"] == "127.0.0.1");
        CHECK(echo["x_forwarded_for"] == "127.0.0.1");
        CHECK(echo["x_forwarded_proto"] == "http");
    }
    SECTION("request body and existing X-Forwarded-For") {
        auto res = fetch(router.port(), http::verb::post, "/api/jobs", R"({"n":1})", "10.1.1.1");
        REQUIRE(res.result() == http::status::ok);
        json echo = json::parse(res.body());
        CHECK(echo["method"] == "POST");
        CHECK(echo["body"] == R"({"n":1})");
        CHECK(echo["x_forwarded_for"] == "10.1.1.1, 127.0.0.1");
    }
    SECTION("health and docs go to the backend") {
        CHECK(json::parse(fetch(router.port(), http::verb::get, "/health").body())["target"] == "/health");
        CHECK(json::parse(fetch(router.port(), http::verb::get, "/docs").body())["target"] == "/docs");
    }
    SECTION("EOF-delimited upstream body is relayed") {
        auto res = fetch(router.port(), http::verb::get, "/api/stream");
        REQUIRE(res.result() == http::status::ok);
        CHECK(res.body() == "streamed-body");
    }

    router.stop();
}

TEST_CASE("Chunked upstream bodies reach HTTP/1.0 clients unchunked", "[router]") {
    BackendStub backend;
    StaticRoot root;
    HttpRouter router(defaultRouteTable(loopback(backend.port()), root.dir.string()), test_options());
    REQUIRE(router.start());

    auto check = [](const std::string& raw) {
        auto split = raw.find("\r\n\r\n");
        REQUIRE(split != std::string::npos);
        std::string head = raw.substr(0, split);
        for (auto& c : head) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        CHECK(head.rfind("http/1.0 200", 0) == 0);
        CHECK(head.find("chunked") == std::string::npos);
        CHECK(raw.substr(split + 4) == "hello world");
    };

    SECTION("streamed rule") {
        check(fetch_http10(router.port(), "/api/chunked"));
    }
    SECTION("buffered rule") {
        check(fetch_http10(router.port(), "/docs/chunked"));
    }
    SECTION("HTTP/1.1 clients still get a decodable body") {
        auto res = fetch(router.port(), http::verb::get, "/api/chunked");
        REQUIRE(res.result() == http::status::ok);
        CHECK(res.body() == "hello world");
    }
}

TEST_CASE("Router strips the API prefix when configured", "[router]") {
    BackendStub backend;
    StaticRoot root;
    HttpRouter router(defaultRouteTable(loopback(backend.port()), root.dir.string(), "index.html", true),
                      test_options());
    REQUIRE(router.start());

    auto res = fetch(router.port(), http::verb::get, "/api/widgets?x=1");
    REQUIRE(res.result() == http::status::ok);
    CHECK(json::parse(res.body())["target"] == "/widgets?x=1");
}

TEST_CASE("Router serves the UI bundle with SPA fallback", "[router][static]") {
    StaticRoot root;
    HttpRouter router(defaultRouteTable(loopback(unused_port()), root.dir.string()), test_options());
    REQUIRE(router.start());

    SECTION("asset") {
        auto res = fetch(router.port(), http::verb::get, "/assets/app.js");
        REQUIRE(res.result() == http::status::ok);
        CHECK(res.body() == "console.log('ui')");
        CHECK(header(res, http::field::content_type) == "application/javascript");
    }
    SECTION("client-side route") {
        auto res = fetch(router.port(), http::verb::get, "/some/ui/route?tab=2");
        REQUIRE(res.result() == http::status::ok);
        CHECK(res.body() == "<html>entry</html>");
        CHECK(header(res, http::field::content_type) == "text/html");
        CHECK(header(res, http::field::cache_control) == "no-cache");
    }
    SECTION("/api without trailing slash belongs to the UI") {
        auto res = fetch(router.port(), http::verb::get, "/api");
        REQUIRE(res.result() == http::status::ok);
        CHECK(res.body() == "<html>entry</html>");
    }
    SECTION("HEAD reports the size without a body") {
        auto res = fetch(router.port(), http::verb::head, "/");
        REQUIRE(res.result() == http::status::ok);
        CHECK(header(res, http::field::content_length) == "18");
    }
    SECTION("writes are not allowed") {
        auto res = fetch(router.port(), http::verb::post, "/some/ui/route", "x");
        CHECK(res.result() == http::status::method_not_allowed);
        CHECK(header(res, http::field::allow) == "GET, HEAD");
    }
    SECTION("traversal is refused") {
        CHECK(fetch(router.port(), http::verb::get, "/%2e%2e/etc/passwd").result() == http::status::bad_request);
    }
}

TEST_CASE("Router answers 502 when the backend is down", "[router]") {
    StaticRoot root;
    HttpRouter router(defaultRouteTable(loopback(unused_port()), root.dir.string()), test_options());
    REQUIRE(router.start());

    CHECK(fetch(router.port(), http::verb::get, "/api/widgets").result() == http::status::bad_gateway);
    CHECK(fetch(router.port(), http::verb::get, "/health").result() == http::status::bad_gateway);
    // UI keeps working
    CHECK(fetch(router.port(), http::verb::get, "/").result() == http::status::ok);
}

TEST_CASE("Router answers 504 when the backend misses the read deadline", "[router]") {
    BackendStub backend;
    StaticRoot root;

    RouteTable table(loopback(backend.port()), root.dir.string());
    RouteRule slow;
    slow.name = "slow";
    slow.prefix = "/slow";
    slow.target = RouteTarget::BackendPassthrough;
    slow.read_timeout = std::chrono::seconds(1);
    table.add(slow);

    HttpRouter router(std::move(table), test_options());
    REQUIRE(router.start());

    CHECK(fetch(router.port(), http::verb::get, "/slow").result() == http::status::gateway_timeout);
}

TEST_CASE("Router refuses a port that is already taken", "[router]") {
    StaticRoot root;
    HttpRouter first(defaultRouteTable(loopback(unused_port()), root.dir.string()), test_options());
    REQUIRE(first.start());

    RouterOptions opts = test_options();
    opts.listen_port = first.port();
    HttpRouter second(defaultRouteTable(loopback(unused_port()), root.dir.string()), opts);
    CHECK_FALSE(second.start());
}

TEST_CASE("mimeType by extension", "[router]") {
    CHECK(std::string(mimeType("/x/index.html")) == "text/html");
    CHECK(std::string(mimeType("/x/app.JS")) == "application/javascript");
    CHECK(std::string(mimeType("/x/font.woff2")) == "font/woff2");
    CHECK(std::string(mimeType("/x.d/noext")) == "application/octet-stream");
}
