#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include <utility>

namespace topology {

namespace net   = boost::asio;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

// Runs one asynchronous Beast operation to completion on a private
// io_context, so callers can write straight-line code while still getting
// the tcp_stream deadline (expires_after) that sync operations ignore.
//
//   BlockingIo io;
//   beast::tcp_stream stream(io.context());
//   stream.expires_after(std::chrono::seconds(2));
//   auto ec = io.run([&](auto h) { stream.async_connect(endpoints, h); });
//
// A deadline expiry completes the operation with beast::error::timeout.
class BlockingIo {
public:
    BlockingIo() : ioc_(1) {}

    BlockingIo(const BlockingIo&) = delete;
    BlockingIo& operator=(const BlockingIo&) = delete;

    net::io_context& context() { return ioc_; }

    template <class Initiate>
    beast::error_code run(Initiate&& initiate) {
        beast::error_code result = net::error::would_block;
        std::forward<Initiate>(initiate)(
            [&result](beast::error_code ec, auto&&...) { result = ec; });
        ioc_.restart();
        ioc_.run();
        return result;
    }

private:
    net::io_context ioc_;
};

} // namespace topology
