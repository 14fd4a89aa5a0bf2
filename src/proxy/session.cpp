#include "proxy/session.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;

// ---------------------------------------------------------------------------
// Session 구현
//
// 흐름:
//   1. 클라이언트 IP 기록
//   2. 요청 루프:
//        expires_after(idle) → async_read (request_parser)
//        end_of_stream / timeout → 종료
//        ReverseProxy::serve(ProxyRequest, sink)
//        sink.release() → async_write
//        keep-alive 가 아니거나 closing_ 이면 종료
//   3. send 방향 shutdown → kClosed
// ---------------------------------------------------------------------------

Session::Session(std::uint64_t                 session_id,
                 boost::asio::ip::tcp::socket  client_socket,
                 std::shared_ptr<ReverseProxy> proxy,
                 std::chrono::seconds          idle_timeout)
    : session_id_{session_id}
    , stream_{std::move(client_socket)}
    , proxy_{std::move(proxy)}
    , idle_timeout_{idle_timeout}
{
    boost::system::error_code ec;
    const auto remote = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        client_ip_ = remote.address().to_string();
    }
}

auto Session::run() -> boost::asio::awaitable<void>
{
    // 코루틴 수명 동안 세션 유지
    auto self = shared_from_this();

    spdlog::debug("[session {}] opened from {}", session_id_, client_ip_);

    beast::flat_buffer buffer;

    while (!closing_.load(std::memory_order_acquire)) {
        state_ = SessionState::kReading;
        boost::system::error_code ec;

        http::request_parser<http::string_body> parser;
        parser.body_limit(kMaxRequestBodyBytes);

        stream_.expires_after(idle_timeout_);
        co_await http::async_read(stream_, buffer, parser,
                                  asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            if (ec == http::error::end_of_stream || ec == beast::error::timeout ||
                ec == asio::error::operation_aborted || ec == asio::error::connection_reset) {
                spdlog::debug("[session {}] closing: {}", session_id_, ec.message());
            } else {
                spdlog::warn("[session {}] read error: {}", session_id_, ec.message());
            }
            break;
        }

        HttpRequest request     = parser.release();
        const auto  version     = request.version();
        const bool  keep_alive  = request.keep_alive();

        // 디스패치 소요 시간은 transport timeout 이 제한한다
        state_ = SessionState::kDispatching;
        stream_.expires_never();

        ResponseSink sink{version, keep_alive};
        // named local: GCC 12 miscompiles a braced aggregate temporary inside co_await
        ProxyRequest proxy_request{std::move(request), "http", client_ip_};
        co_await proxy_->serve(std::move(proxy_request), sink);

        HttpResponse response = sink.release();
        const bool   reuse    = keep_alive && !closing_.load(std::memory_order_acquire);
        response.keep_alive(reuse);

        state_ = SessionState::kWriting;
        stream_.expires_after(idle_timeout_);
        co_await http::async_write(stream_, response,
                                   asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            spdlog::warn("[session {}] write error: {}", session_id_, ec.message());
            break;
        }
        if (!reuse) {
            break;
        }
    }

    boost::system::error_code close_ec;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, close_ec);
    stream_.socket().close(close_ec);
    state_ = SessionState::kClosed;

    spdlog::debug("[session {}] closed", session_id_);
}

void Session::close()
{
    if (closing_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // 요청 대기 중인 read 만 취소한다. 진행 중인 dispatch 는 끝까지 처리된다.
    asio::post(stream_.get_executor(), [self = shared_from_this()] {
        if (self->state_ == SessionState::kReading) {
            self->stream_.cancel();
        }
    });
}
