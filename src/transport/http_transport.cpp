#include "transport/http_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

namespace {

[[nodiscard]] ProxyError transport_error(std::string message, const boost::system::error_code& ec)
{
    return ProxyError{ProxyErrorCode::kTransport, std::move(message), ec.message()};
}

}  // namespace

HttpTransport::HttpTransport(Origin                    origin,
                             std::chrono::milliseconds timeout,
                             std::uint64_t             max_body_bytes)
    : origin_{std::move(origin)}
    , timeout_{timeout}
    , max_body_bytes_{max_body_bytes}
{}

// ---------------------------------------------------------------------------
// round_trip
//   1. resolve (origin host, port)
//   2. connect          ┐
//   3. async_write      ├ tcp_stream.expires_after(timeout_)
//   4. async_read       ┘
//   5. 연결 종료 (재사용 없음)
// ---------------------------------------------------------------------------
auto HttpTransport::round_trip(HttpRequest request)
    -> asio::awaitable<std::expected<HttpResponse, ProxyError>>
{
    if (origin_.scheme != "http") {
        co_return std::unexpected(ProxyError{
            ProxyErrorCode::kTransport,
            "unsupported origin scheme",
            origin_.scheme
        });
    }

    const auto executor = co_await asio::this_coro::executor;
    boost::system::error_code ec;

    tcp::resolver resolver{executor};
    const auto endpoints = co_await resolver.async_resolve(
        origin_.host,
        origin_.effective_port(),
        asio::redirect_error(asio::use_awaitable, ec)
    );
    if (ec) {
        co_return std::unexpected(transport_error("failed to resolve origin " + origin_.authority(), ec));
    }

    beast::tcp_stream stream{executor};
    stream.expires_after(timeout_);

    co_await stream.async_connect(endpoints, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(transport_error("failed to connect to origin " + origin_.authority(), ec));
    }

    request.keep_alive(false);
    request.prepare_payload();

    stream.expires_after(timeout_);
    co_await http::async_write(stream, request, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(transport_error("failed to write request to origin", ec));
    }

    beast::flat_buffer                     buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(max_body_bytes_);
    if (request.method() == http::verb::head) {
        // HEAD 응답은 Content-Length 가 있어도 body 가 없다
        parser.skip(true);
    }

    stream.expires_after(timeout_);
    co_await http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(transport_error("failed to read response from origin", ec));
    }

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("[transport] shutdown: {}", ec.message());
    }

    co_return parser.release();
}
