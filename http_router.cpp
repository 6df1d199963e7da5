#include "http_router.hpp"
#include "beast_io.hpp"

#include <boost/beast/http.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <limits>
#include <map>

namespace topology {

namespace http = boost::beast::http;

using Clock = std::chrono::steady_clock;

const char* mimeType(const std::string& path) {
    static const std::map<std::string, const char*> types = {
        {"htm", "text/html"}, {"html", "text/html"}, {"css", "text/css"},
        {"js", "application/javascript"}, {"mjs", "application/javascript"},
        {"json", "application/json"}, {"map", "application/json"},
        {"txt", "text/plain"}, {"xml", "application/xml"},
        {"png", "image/png"}, {"jpe", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"jpg", "image/jpeg"},
        {"gif", "image/gif"}, {"ico", "image/vnd.microsoft.icon"}, {"svg", "image/svg+xml"},
        {"svgz", "image/svg+xml"}, {"webp", "image/webp"},
        {"woff", "font/woff"}, {"woff2", "font/woff2"}, {"ttf", "font/ttf"},
        {"wasm", "application/wasm"},
    };

    auto dot = path.rfind('.');
    auto slash = path.rfind('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "application/octet-stream";
    }
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}

namespace {

constexpr const char* kServerName = "topology-router";

struct Shared {
    RouteTable    table;
    RouterOptions options;
};

// Hop-by-hop headers never cross the proxy. Transfer-Encoding stays: the
// serializer re-frames the body according to it.
template <class Fields>
void strip_hop_by_hop(Fields& f) {
    for (const char* name : {"Connection", "Keep-Alive", "Proxy-Connection", "TE", "Trailer", "Upgrade"}) {
        f.erase(name);
    }
}

bool is_quiet_close(const beast::error_code& ec) {
    return ec == http::error::end_of_stream || ec == beast::error::timeout ||
           ec == net::error::eof || ec == net::error::connection_reset ||
           ec == net::error::operation_aborted;
}

bool has_no_body(unsigned code) {
    return code < 200 || code == 204 || code == 304;
}

std::string str(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

class RouterSession {
public:
    RouterSession(const Shared& shared, BlockingIo& io, tcp::socket socket)
        : shared_(shared), io_(io), client_(std::move(socket)) {
        beast::error_code ec;
        auto ep = client_.socket().remote_endpoint(ec);
        client_ip_ = ec ? std::string("unknown") : ep.address().to_string();
    }

    void run() {
        for (;;) {
            client_.expires_after(shared_.options.client_idle_timeout);

            http::request_parser<http::string_body> parser;
            parser.body_limit(shared_.options.max_request_body);
            auto ec = io_.run([&](auto h) { http::async_read(client_, buffer_, parser, h); });
            if (ec == http::error::body_limit) {
                sendError(http::status::payload_too_large, 11, false, "request body over limit");
                break;
            }
            if (ec) {
                if (!is_quiet_close(ec)) {
                    std::cerr << "[Router] read from " << client_ip_ << ": " << ec.message() << std::endl;
                }
                break;
            }
            if (!handle(parser.release())) break;
        }

        beast::error_code ignore;
        client_.socket().shutdown(tcp::socket::shutdown_send, ignore);
    }

private:
    using Request = http::request<http::string_body>;

    // Returns whether the client connection stays open
    bool handle(Request&& req) {
        started_ = Clock::now();
        status_ = 0;
        method_ = str(req.method_string());
        target_ = str(req.target());

        if (target_.empty() || target_.front() != '/') {
            return sendError(http::status::bad_request, req.version(), false, "request-target must be origin-form");
        }

        const std::string path = target_.substr(0, target_.find('?'));
        const RouteRule& rule = shared_.table.match(path);

        bool keep = rule.target == RouteTarget::BackendPassthrough
            ? proxy(std::move(req), rule)
            : serveStatic(req, path);

        if (shared_.options.access_log) {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_).count();
            std::cout << "[Router] " << client_ip_ << " " << method_ << " " << target_
                      << " -> " << rule.name << " " << status_ << " " << ms << "ms" << std::endl;
        }
        return keep;
    }

    template <class Body>
    bool send(http::response<Body>& res) {
        status_ = res.result_int();
        res.set(http::field::server, kServerName);
        client_.expires_after(shared_.options.client_idle_timeout);
        auto ec = io_.run([&](auto h) { http::async_write(client_, res, h); });
        if (ec) {
            if (!is_quiet_close(ec)) {
                std::cerr << "[Router] write to " << client_ip_ << ": " << ec.message() << std::endl;
            }
            return false;
        }
        return res.keep_alive();
    }

    bool sendError(http::status status, unsigned version, bool keep_alive, const std::string& detail) {
        if (status == http::status::bad_gateway || status == http::status::gateway_timeout) {
            std::cerr << "[Router] " << method_ << " " << target_ << ": upstream "
                      << shared_.table.backend().hostPort() << " " << detail << std::endl;
        }
        http::response<http::string_body> res{status, version};
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.body() = std::to_string(static_cast<unsigned>(status)) + " " +
                     str(http::obsolete_reason(status)) + "\n";
        res.keep_alive(keep_alive);
        res.prepare_payload();
        return send(res);
    }

    // ---------------- static root ----------------

    bool serveStatic(const Request& req, const std::string& path) {
        if (req.method() != http::verb::get && req.method() != http::verb::head) {
            http::response<http::string_body> res{http::status::method_not_allowed, req.version()};
            res.set(http::field::allow, "GET, HEAD");
            res.keep_alive(req.keep_alive());
            res.prepare_payload();
            return send(res);
        }

        StaticFile file = shared_.table.resolveStatic(path);
        if (file.kind == StaticFile::Kind::Rejected) {
            return sendError(http::status::bad_request, req.version(), req.keep_alive(), "bad path");
        }
        if (file.kind == StaticFile::Kind::Missing) {
            return sendError(http::status::not_found, req.version(), req.keep_alive(), "no entry document");
        }

        beast::error_code ec;
        http::file_body::value_type body;
        body.open(file.file.c_str(), beast::file_mode::scan, ec);
        if (ec == beast::errc::no_such_file_or_directory) {
            return sendError(http::status::not_found, req.version(), req.keep_alive(), "vanished");
        }
        if (ec) {
            std::cerr << "[Router] open " << file.file << ": " << ec.message() << std::endl;
            return sendError(http::status::internal_server_error, req.version(), req.keep_alive(), ec.message());
        }

        const auto size = body.size();
        const char* type = mimeType(file.file);
        // Entry document must be revalidated so new bundles are picked up
        const bool entry = file.kind == StaticFile::Kind::EntryDocument;

        if (req.method() == http::verb::head) {
            http::response<http::empty_body> res{http::status::ok, req.version()};
            res.set(http::field::content_type, type);
            if (entry) res.set(http::field::cache_control, "no-cache");
            res.content_length(size);
            res.keep_alive(req.keep_alive());
            return send(res);
        }

        http::response<http::file_body> res{
            std::piecewise_construct,
            std::make_tuple(std::move(body)),
            std::make_tuple(http::status::ok, req.version())};
        res.set(http::field::content_type, type);
        if (entry) res.set(http::field::cache_control, "no-cache");
        res.content_length(size);
        res.keep_alive(req.keep_alive());
        return send(res);
    }

    // ---------------- backend passthrough ----------------

    static http::status upstream_failure(const beast::error_code& ec) {
        return ec == beast::error::timeout ? http::status::gateway_timeout : http::status::bad_gateway;
    }

    bool proxy(Request&& req, const RouteRule& rule) {
        const Upstream& backend = shared_.table.backend();
        const bool client_keep = req.keep_alive();
        const unsigned version = req.version();
        const bool head = req.method() == http::verb::head;

        beast::error_code ec;
        tcp::resolver resolver(io_.context());
        auto endpoints = resolver.resolve(backend.host, std::to_string(backend.port), ec);
        if (ec) return sendError(http::status::bad_gateway, version, client_keep, "resolve: " + ec.message());

        beast::tcp_stream upstream(io_.context());
        upstream.expires_after(rule.connect_timeout);
        ec = io_.run([&](auto h) { upstream.async_connect(endpoints, h); });
        if (ec) return sendError(upstream_failure(ec), version, client_keep, "connect: " + ec.message());

        // Same request, new address: only the target (per prefix policy),
        // hop-by-hop and forwarding headers change.
        const std::string original_host = str(req[http::field::host]);
        std::string forwarded_for = str(req["X-Forwarded-For"]);
        forwarded_for = forwarded_for.empty() ? client_ip_ : forwarded_for + ", " + client_ip_;

        req.target(shared_.table.upstreamTarget(rule, target_));
        strip_hop_by_hop(req);
        req.version(11);
        if (original_host.empty()) req.set(http::field::host, backend.hostPort());
        req.set("X-Real-IP", client_ip_);
        req.set("X-Forwarded-For", forwarded_for);
        req.set("X-Forwarded-Proto", shared_.options.forwarded_proto);
        req.keep_alive(false);
        req.prepare_payload();

        upstream.expires_after(rule.read_timeout);
        ec = io_.run([&](auto h) { http::async_write(upstream, req, h); });
        if (ec) return sendError(upstream_failure(ec), version, client_keep, "write: " + ec.message());

        bool keep = (rule.buffering || head)
            ? relayBuffered(upstream, rule, version, client_keep, head)
            : relayStreaming(upstream, rule, version, client_keep);

        beast::error_code ignore;
        upstream.socket().shutdown(tcp::socket::shutdown_both, ignore);
        return keep;
    }

    bool relayBuffered(beast::tcp_stream& upstream, const RouteRule& rule,
                       unsigned version, bool client_keep, bool head) {
        beast::flat_buffer upbuf;
        http::response_parser<http::string_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        if (head) parser.skip(true);

        upstream.expires_after(rule.read_timeout);
        auto ec = io_.run([&](auto h) { http::async_read(upstream, upbuf, parser, h); });
        if (ec) return sendError(upstream_failure(ec), version, client_keep, "read: " + ec.message());

        auto res = parser.release();
        strip_hop_by_hop(res);
        res.version(version);
        if (version == 10 && res.chunked()) {
            // HTTP/1.0 has no chunked coding; the body is complete here
            res.chunked(false);
            if (!head) res.prepare_payload();
        } else if (!head && !has_no_body(res.result_int()) && !res.has_content_length() && !res.chunked()) {
            res.prepare_payload();
        }
        res.keep_alive(client_keep);
        return send(res);
    }

    // Header first, then the body as it arrives (proxy_buffering off)
    bool relayStreaming(beast::tcp_stream& upstream, const RouteRule& rule,
                        unsigned version, bool client_keep) {
        beast::flat_buffer upbuf;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

        upstream.expires_after(rule.read_timeout);
        auto ec = io_.run([&](auto h) { http::async_read_header(upstream, upbuf, parser, h); });
        if (ec) return sendError(upstream_failure(ec), version, client_keep, "read header: " + ec.message());

        auto& res = parser.get();
        strip_hop_by_hop(res);
        res.version(version);

        bool keep = client_keep;
        if (version == 10 && res.chunked()) {
            // HTTP/1.0 client: relay the decoded body and delimit it by closing
            res.chunked(false);
            keep = false;
        } else if (!has_no_body(res.result_int()) && !res.has_content_length() && !res.chunked()) {
            // Upstream delimits by EOF: re-frame as chunked, or close after it
            if (version == 11) res.chunked(true);
            else keep = false;
        }
        res.keep_alive(keep);
        status_ = res.result_int();
        res.set(http::field::server, kServerName);

        http::serializer<false, http::buffer_body> sr{res};
        client_.expires_after(shared_.options.client_idle_timeout);
        ec = io_.run([&](auto h) { http::async_write_header(client_, sr, h); });
        if (ec) return false;

        char buf[16 * 1024];
        do {
            if (!parser.is_done()) {
                res.body().data = buf;
                res.body().size = sizeof(buf);

                upstream.expires_after(rule.read_timeout);
                ec = io_.run([&](auto h) { http::async_read_some(upstream, upbuf, parser, h); });
                if (ec == http::error::need_buffer) ec = {};
                if (ec) {
                    // Status line is already out; all we can do is drop the client
                    std::cerr << "[Router] " << method_ << " " << target_
                              << ": upstream stream broke: " << ec.message() << std::endl;
                    return false;
                }
                res.body().size = sizeof(buf) - res.body().size;
                res.body().data = buf;
                res.body().more = !parser.is_done();
            } else {
                res.body().data = nullptr;
                res.body().size = 0;
                res.body().more = false;
            }

            client_.expires_after(shared_.options.client_idle_timeout);
            ec = io_.run([&](auto h) { http::async_write(client_, sr, h); });
            if (ec == http::error::need_buffer) ec = {};
            if (ec) return false;
        } while (!parser.is_done() && !sr.is_done());

        return keep;
    }

    const Shared& shared_;
    BlockingIo& io_;
    beast::tcp_stream client_;
    beast::flat_buffer buffer_;
    std::string client_ip_;

    // per request
    Clock::time_point started_{};
    unsigned status_ = 0;
    std::string method_;
    std::string target_;
};

} // namespace

struct HttpRouter::Impl {
    Impl(RouteTable table, RouterOptions options)
        : shared(std::make_shared<const Shared>(Shared{std::move(table), std::move(options)})),
          ioc(1) {}

    std::shared_ptr<const Shared> shared;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::uint16_t bound_port = 0;

    std::atomic<bool> running{false};

    void do_accept() {
        // Each connection gets a private io_context driven by its own thread
        auto io = std::make_shared<BlockingIo>();
        acceptor->async_accept(
            io->context(),
            [this, io](beast::error_code ec, tcp::socket socket) {
                if (!running.load()) return;

                if (!ec) {
                    std::thread([shared = shared, io, sock = std::move(socket)]() mutable {
                        try {
                            RouterSession sess(*shared, *io, std::move(sock));
                            sess.run();
                        } catch (const std::exception& e) {
                            std::cerr << "[Router] session crashed: " << e.what() << std::endl;
                        }
                    }).detach();
                } else {
                    std::cerr << "[Router] accept: " << ec.message() << std::endl;
                }
                do_accept();
            });
    }
};

HttpRouter::HttpRouter(RouteTable table, RouterOptions options)
    : impl_(std::make_unique<Impl>(std::move(table), std::move(options))) {}

HttpRouter::~HttpRouter() { stop(); }

std::uint16_t HttpRouter::port() const { return impl_->bound_port; }

bool HttpRouter::start() {
    if (impl_->running.exchange(true)) return true;

    const auto& opts = impl_->shared->options;
    beast::error_code ec;

    auto address = net::ip::make_address(opts.listen_address, ec);
    if (ec) {
        std::cerr << "[Router] bad listen address '" << opts.listen_address << "': " << ec.message() << std::endl;
        impl_->running = false;
        return false;
    }

    impl_->acceptor = std::make_unique<tcp::acceptor>(impl_->ioc);
    tcp::endpoint endpoint{address, opts.listen_port};

    impl_->acceptor->open(endpoint.protocol(), ec);
    if (ec) { std::cerr << "[Router] acceptor open: " << ec.message() << std::endl; impl_->running = false; return false; }

    impl_->acceptor->set_option(net::socket_base::reuse_address(true), ec);
    if (ec) { std::cerr << "[Router] set_option: " << ec.message() << std::endl; impl_->running = false; return false; }

    impl_->acceptor->bind(endpoint, ec);
    if (ec) { std::cerr << "[Router] bind " << endpoint << ": " << ec.message() << std::endl; impl_->running = false; return false; }

    impl_->acceptor->listen(net::socket_base::max_listen_connections, ec);
    if (ec) { std::cerr << "[Router] listen: " << ec.message() << std::endl; impl_->running = false; return false; }

    impl_->bound_port = impl_->acceptor->local_endpoint().port();
    impl_->do_accept();

    io_thread_ = std::thread([this]() {
        const auto& table = impl_->shared->table;
        std::cout << "[Router] listening on :" << impl_->bound_port
                  << " -> backend " << table.backend().hostPort()
                  << ", static root " << table.staticRoot() << std::endl;
        impl_->ioc.run();
    });

    return true;
}

void HttpRouter::stop() {
    if (!impl_->running.exchange(false)) return;
    beast::error_code ec;
    if (impl_->acceptor) {
        impl_->acceptor->cancel(ec);
        impl_->acceptor->close(ec);
    }
    impl_->ioc.stop();
    if (io_thread_.joinable()) io_thread_.join();
}

} // namespace topology
