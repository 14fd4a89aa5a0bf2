#pragma once

#include "common/types.hpp"
#include "http/message.hpp"

#include <boost/asio/awaitable.hpp>

#include <expected>

// ---------------------------------------------------------------------------
// Transport
//   origin 과의 실제 네트워크 왕복을 담당하는 협력자.
//   연결 재사용, 타임아웃/재시도 정책은 구현체 소관이다.
//
//   round_trip
//     request : Host / 경로 / 헤더 준비가 끝난 전달용 요청 (값으로 받아
//               코루틴 프레임에 안전하게 보관)
//     성공    : origin 응답
//     실패    : kTransport (연결 불가, 리셋, 타임아웃)
// ---------------------------------------------------------------------------
class Transport {
public:
    virtual ~Transport() = default;

    virtual auto round_trip(HttpRequest request)
        -> boost::asio::awaitable<std::expected<HttpResponse, ProxyError>> = 0;
};
