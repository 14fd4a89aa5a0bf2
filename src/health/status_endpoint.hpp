#pragma once

#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// OriginStatus
//   상태 응답에 싣는 origin 스냅샷.
// ---------------------------------------------------------------------------
struct OriginStatus {
    std::string  origin{};
    bool         available{false};
    std::int64_t load{0};
};

using OriginStatusSource = std::function<OriginStatus()>;

// ---------------------------------------------------------------------------
// StatusEndpoint
//   로드밸런서용 간단한 HTTP 상태 서버.
//
//   GET /health
//     - origin available   -> 200 OK + {"status":"ok","origin":...,"available":true,"load":N}
//     - origin unavailable -> 503 + {"status":"unavailable",...}
//   기타 경로 -> 404 + {"status":"not found"}
//   응답 후 소켓 즉시 close.
// ---------------------------------------------------------------------------
class StatusEndpoint {
public:
    // -----------------------------------------------------------------------
    // 생성자
    //   생성 시 포트를 바인딩한다 (port 0 이면 임의 포트, port() 로 확인).
    //   source     : 요청마다 호출되어 현재 상태를 돌려준다
    //   io_context : 연결 코루틴을 실행할 io_context
    // -----------------------------------------------------------------------
    StatusEndpoint(std::uint16_t            port,
                   OriginStatusSource       source,
                   boost::asio::io_context& io_context);

    ~StatusEndpoint() = default;

    StatusEndpoint(const StatusEndpoint&)            = delete;
    StatusEndpoint& operator=(const StatusEndpoint&) = delete;
    StatusEndpoint(StatusEndpoint&&)                 = delete;
    StatusEndpoint& operator=(StatusEndpoint&&)      = delete;

    // run
    //   Accept 루프. stop() 으로 acceptor 가 닫히면 반환한다.
    auto run() -> boost::asio::awaitable<void>;

    void stop();

    [[nodiscard]] auto port() const -> std::uint16_t;

private:
    OriginStatusSource             source_;
    boost::asio::io_context&       io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

// ---------------------------------------------------------------------------
// make_status_response
//   요청 바이트(첫 줄만 사용)와 상태로 전체 HTTP 응답 문자열을 만든다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto make_status_response(std::string_view request, const OriginStatus& status)
    -> std::string;
