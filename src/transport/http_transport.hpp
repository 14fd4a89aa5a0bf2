#pragma once

#include "common/origin.hpp"
#include "transport/transport.hpp"

#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// HttpTransport
//   Boost.Beast 기반 기본 Transport. 요청마다 새 TCP 연결을 사용한다.
//
//   - resolve → connect → write → read 전체에 timeout 을 적용한다.
//   - upstream 응답 body 는 max_body_bytes 까지 읽는다.
//   - https origin 은 지원하지 않는다 (kTransport).
// ---------------------------------------------------------------------------
class HttpTransport final : public Transport {
public:
    static constexpr std::uint64_t kDefaultMaxBodyBytes = 64ULL * 1024 * 1024;

    explicit HttpTransport(Origin                    origin,
                           std::chrono::milliseconds timeout        = std::chrono::seconds{30},
                           std::uint64_t             max_body_bytes = kDefaultMaxBodyBytes);

    auto round_trip(HttpRequest request)
        -> boost::asio::awaitable<std::expected<HttpResponse, ProxyError>> override;

private:
    Origin                    origin_;
    std::chrono::milliseconds timeout_;
    std::uint64_t             max_body_bytes_;
};
