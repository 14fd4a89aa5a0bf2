#include "health/status_endpoint.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// StatusEndpoint: HTTP/1.0 subset 구현
//
// 요청 첫 줄만 보고 경로를 판별한다. keep-alive 없음.
// ---------------------------------------------------------------------------

namespace {

std::string make_http_response(int status_code,
                               std::string_view status_text,
                               std::string_view body)
{
    return fmt::format(
        "HTTP/1.0 {} {}\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: {}\r\n"
        "Connection: close\r\n"
        "\r\n"
        "{}",
        status_code,
        status_text,
        body.size(),
        body
    );
}

std::string escape_json(std::string_view raw)
{
    std::string escaped;
    escaped.reserve(raw.size());
    for (char c : raw) {
        if (c == '"') { escaped += "\\\""; }
        else if (c == '\\') { escaped += "\\\\"; }
        else if (static_cast<unsigned char>(c) < 0x20) { escaped += ' '; }
        else { escaped += c; }
    }
    return escaped;
}

// -----------------------------------------------------------------------
// handle_connection
//   단일 HTTP 연결을 처리하는 코루틴. 응답 후 소켓 close.
// -----------------------------------------------------------------------
auto handle_connection(boost::asio::ip::tcp::socket socket, OriginStatusSource source)
    -> boost::asio::awaitable<void>
{
    std::array<char, 512> buf{};
    boost::system::error_code ec;

    std::size_t n = co_await socket.async_read_some(
        boost::asio::buffer(buf),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );

    if (ec) {
        spdlog::debug("[status] read error: {}", ec.message());
        co_return;
    }

    const std::string response = make_status_response(std::string_view{buf.data(), n}, source());

    co_await boost::asio::async_write(
        socket,
        boost::asio::buffer(response),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );

    if (ec) {
        spdlog::debug("[status] write error: {}", ec.message());
    }

    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

}  // namespace

auto make_status_response(std::string_view request, const OriginStatus& status) -> std::string
{
    const auto line_end = request.find("\r\n");
    const auto line     = request.substr(0, line_end);

    const bool is_get_health =
        line.starts_with("GET /health ") || line == "GET /health" ||
        line.starts_with("GET /health?");
    if (!is_get_health) {
        return make_http_response(404, "Not Found", R"({"status":"not found"})");
    }

    const std::string body = fmt::format(
        R"({{"status":"{}","origin":"{}","available":{},"load":{}}})",
        status.available ? "ok" : "unavailable",
        escape_json(status.origin),
        status.available ? "true" : "false",
        status.load
    );

    if (status.available) {
        return make_http_response(200, "OK", body);
    }
    return make_http_response(503, "Service Unavailable", body);
}

// ---------------------------------------------------------------------------
// StatusEndpoint 구현
// ---------------------------------------------------------------------------
StatusEndpoint::StatusEndpoint(std::uint16_t            port,
                               OriginStatusSource       source,
                               boost::asio::io_context& io_context)
    : source_{std::move(source)}
    , io_context_{io_context}
    , acceptor_{io_context}
{
    const auto endpoint = boost::asio::ip::tcp::endpoint{boost::asio::ip::tcp::v4(), port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

auto StatusEndpoint::run() -> boost::asio::awaitable<void>
{
    spdlog::info("[status] listening on port {}", port());

    while (true) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );

        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
                spdlog::info("[status] acceptor closed, stopping");
                break;
            }
            spdlog::warn("[status] accept error: {}", ec.message());
            continue;
        }

        boost::asio::co_spawn(
            io_context_,
            handle_connection(std::move(socket), source_),
            boost::asio::detached
        );
    }
}

void StatusEndpoint::stop()
{
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("[status] acceptor close error: {}", ec.message());
    }
}

auto StatusEndpoint::port() const -> std::uint16_t
{
    boost::system::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}
