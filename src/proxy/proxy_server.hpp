#pragma once

#include "health/status_endpoint.hpp"
#include "logger/structured_logger.hpp"
#include "proxy/reverse_proxy.hpp"
#include "proxy/session.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>

// ---------------------------------------------------------------------------
// ProxyConfig
//   ProxyServer 의 모든 설정 값을 담는다.
//   값은 main.cpp 에서 환경변수로부터 채운다.
//
//   listen_address         : 프록시가 바인딩할 IP 주소 (예: "0.0.0.0")
//   listen_port            : 프록시 리슨 포트 (0 이면 임의 포트)
//   origin_url             : origin URL. 비어 있지 않으면 routes 파일의 origin 보다 우선
//   routes_path            : 라우트 설정 파일 경로 (YAML)
//   upstream_timeout_sec   : origin 왕복 타임아웃 (초)
//   connection_timeout_sec : 클라이언트 연결 유휴 타임아웃 (초)
//   log_path               : 접근 로그 파일 경로
//   log_level              : "debug" | "info" | "warn" | "error"
//   status_port            : 상태 HTTP 서버 포트 (0 이면 임의 포트)
// ---------------------------------------------------------------------------
struct ProxyConfig {
    std::string   listen_address{};
    std::uint16_t listen_port{0};

    std::string   origin_url{};
    std::string   routes_path{};

    std::uint32_t upstream_timeout_sec{0};
    std::uint32_t connection_timeout_sec{0};

    std::string   log_path{};
    std::string   log_level{};

    std::uint16_t status_port{0};
};

// ---------------------------------------------------------------------------
// ProxyServer
//   라우트 로드 → ReverseProxy 생성 → TCP 리슨 → 세션 생성 → Graceful Shutdown.
//
//   사용 예:
//     ProxyServer server(config);
//     if (auto started = server.run(io_ctx); !started) { ... }
//     io_ctx.run();
//
//   Graceful Shutdown:
//     stop() 호출 시 새 연결을 거부하고 기존 세션이 완료되면 io_context 를 중단한다.
// ---------------------------------------------------------------------------
class ProxyServer {
public:
    explicit ProxyServer(ProxyConfig config);

    ~ProxyServer() = default;

    ProxyServer(const ProxyServer&)            = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;
    ProxyServer(ProxyServer&&)                 = delete;
    ProxyServer& operator=(ProxyServer&&)      = delete;

    // -----------------------------------------------------------------------
    // run
    //   설정 로드와 포트 바인딩을 동기적으로 수행한 뒤 accept 루프와 상태 서버를
    //   io_ctx 에 co_spawn 한다. 설정 / 바인딩 오류는 unexpected 로 반환한다.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto run(boost::asio::io_context& io_ctx) -> std::expected<void, std::string>;

    // -----------------------------------------------------------------------
    // stop
    //   - 새 연결 Accept 중단, 상태 서버 / 헬스 모니터 정지
    //   - 진행 중인 세션은 현재 요청을 끝낸 뒤 종료
    //   - 모든 세션 종료 후 io_context 중단 요청
    // -----------------------------------------------------------------------
    void stop();

    [[nodiscard]] auto listen_port() const -> std::uint16_t;
    [[nodiscard]] auto status_port() const -> std::uint16_t;
    [[nodiscard]] auto proxy() const noexcept -> const std::shared_ptr<ReverseProxy>& { return proxy_; }

private:
    // accept_loop: TCP Accept 루프 코루틴
    boost::asio::awaitable<void> accept_loop();

    ProxyConfig config_;
    bool        stopping_{false};

    std::shared_ptr<StructuredLogger>               logger_{};
    std::shared_ptr<ReverseProxy>                   proxy_{};
    std::unique_ptr<StatusEndpoint>                 status_endpoint_{};
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_{};
    std::unique_ptr<boost::asio::signal_set>        signals_{};

    std::atomic<std::uint64_t>                                  next_session_id_{1};
    std::unordered_map<std::uint64_t, std::shared_ptr<Session>> sessions_{};

    boost::asio::io_context* io_ctx_{nullptr};
};
