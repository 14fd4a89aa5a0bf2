#pragma once

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>

#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// HTTP 메시지 타입
//   Boost.Beast 메시지를 그대로 사용한다. body 스트리밍은 transport 소관이므로
//   디스패처 레벨에서는 string_body 로 충분하다.
// ---------------------------------------------------------------------------
using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using HttpFields   = boost::beast::http::fields;

// ---------------------------------------------------------------------------
// ProxyRequest
//   클라이언트로부터 수신한 요청 + Beast 메시지에 없는 연결 메타데이터.
//
//   scheme         : 원래 요청의 scheme (X-Forwarded-Proto 값)
//   remote_address : 클라이언트 IP (X-Forwarded-For 에 추가된다)
// ---------------------------------------------------------------------------
struct ProxyRequest {
    HttpRequest message{};
    std::string scheme{"http"};
    std::string remote_address{};
};

// ---------------------------------------------------------------------------
// ResponseSink
//   클라이언트로 나갈 응답을 버퍼링한다.
//
//   - header() 로 헤더를 조작하고 write_header() 로 상태 코드를 확정한다.
//   - write_header() 는 최초 1회만 유효하다. 이후 호출은 무시된다.
//   - write() 는 상태 코드가 확정되지 않았으면 200 OK 로 확정한다.
//   - release() 는 Session 이 소켓에 쓰기 직전에 호출한다.
//   - HEAD 요청이면 release() 는 body 를 비우고 기존 Content-Length 를 유지한다.
// ---------------------------------------------------------------------------
class ResponseSink {
public:
    explicit ResponseSink(unsigned version = 11, bool keep_alive = true);

    [[nodiscard]] auto header() -> HttpFields&;
    [[nodiscard]] auto header() const -> const HttpFields&;

    void write_header(boost::beast::http::status status);
    void write(std::string_view data);

    void set_head_request(bool head) noexcept { head_request_ = head; }

    [[nodiscard]] auto header_written() const noexcept -> bool { return header_written_; }
    [[nodiscard]] auto head_request() const noexcept -> bool { return head_request_; }
    [[nodiscard]] auto status() const -> boost::beast::http::status;
    [[nodiscard]] auto body() const -> const std::string&;

    // release
    //   Content-Length 를 계산한 최종 응답을 반환한다. 이후 sink 는 비어 있다.
    [[nodiscard]] auto release() -> HttpResponse;

private:
    HttpResponse response_;
    bool         header_written_{false};
    bool         head_request_{false};
};

// ---------------------------------------------------------------------------
// Beast <-> std 문자열 뷰 변환 헬퍼
//   Boost 1.74 의 beast::string_view 는 boost::string_view 이므로
//   std::string_view 로 암묵 변환되지 않는다.
// ---------------------------------------------------------------------------
[[nodiscard]] inline auto to_std(boost::beast::string_view sv) noexcept -> std::string_view
{
    return std::string_view{sv.data(), sv.size()};
}

// ---------------------------------------------------------------------------
// RequestTarget
//   "/path?query" 를 경로와 query 로 분리한 결과.
// ---------------------------------------------------------------------------
struct RequestTarget {
    std::string path{};
    std::string query{};
};

[[nodiscard]] auto split_target(std::string_view target) -> RequestTarget;

// ---------------------------------------------------------------------------
// remove_hop_by_hop_headers
//   프록시 구간에서 전달되면 안 되는 hop-by-hop 헤더를 제거한다.
//   Connection 헤더에 나열된 헤더 이름도 함께 제거한다.
// ---------------------------------------------------------------------------
void remove_hop_by_hop_headers(HttpFields& fields);
