#pragma once

#include "proxy/reverse_proxy.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// SessionState
//   Session 의 생명주기 상태를 나타낸다.
//
//   kReading     : 다음 요청 대기 / 수신 중 (idle timeout 적용)
//   kDispatching : ReverseProxy::serve 진행 중
//   kWriting     : 응답 전송 중
//   kClosed      : 세션 종료
// ---------------------------------------------------------------------------
enum class SessionState : std::uint8_t {
    kReading     = 0,
    kDispatching = 1,
    kWriting     = 2,
    kClosed      = 3,
};

// ---------------------------------------------------------------------------
// Session
//   클라이언트 연결 1개의 HTTP/1.1 요청/응답 루프.
//
//   생명주기:
//     1. 생성자에서 소켓/의존성 주입
//     2. run() 코루틴: 요청 읽기 → serve → 응답 쓰기 (keep-alive 동안 반복)
//     3. close() 또는 EOF / 오류 / idle timeout 시 kClosed
//
//   스레드 안전성:
//     ProxyServer 의 단일 io_context 스레드에서만 실행된다.
// ---------------------------------------------------------------------------
class Session : public std::enable_shared_from_this<Session> {
public:
    static constexpr std::uint64_t kMaxRequestBodyBytes = 16ULL * 1024 * 1024;

    // -----------------------------------------------------------------------
    // 생성자
    //   session_id    : 프로세스 범위 유일 ID
    //   client_socket : accept 된 클라이언트 소켓 (move 소유권 이전)
    //   proxy         : 디스패처 (shared 소유권)
    //   idle_timeout  : 요청 대기 / 응답 쓰기 타임아웃
    // -----------------------------------------------------------------------
    Session(std::uint64_t                 session_id,
            boost::asio::ip::tcp::socket  client_socket,
            std::shared_ptr<ReverseProxy> proxy,
            std::chrono::seconds          idle_timeout);

    ~Session() = default;

    // 복사/이동 금지 (shared_ptr 로만 관리)
    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&)                 = delete;
    Session& operator=(Session&&)      = delete;

    auto run() -> boost::asio::awaitable<void>;

    // -----------------------------------------------------------------------
    // close
    //   요청 대기 중이면 즉시 종료하고, 처리 중이면 현재 응답을
    //   Connection: close 로 보낸 뒤 종료한다. 중복 호출은 no-op.
    // -----------------------------------------------------------------------
    void close();

    [[nodiscard]] auto state() const noexcept -> SessionState { return state_; }
    [[nodiscard]] auto id() const noexcept -> std::uint64_t { return session_id_; }

private:
    std::uint64_t                 session_id_;
    boost::beast::tcp_stream      stream_;
    std::shared_ptr<ReverseProxy> proxy_;
    std::chrono::seconds          idle_timeout_;
    std::string                   client_ip_{};

    SessionState      state_{SessionState::kReading};
    std::atomic<bool> closing_{false};
};
