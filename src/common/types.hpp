#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ProxyErrorCode
//   디스패처 전 구간에서 발생 가능한 오류 분류.
//
//   kConfiguration    : 잘못된 origin URL / path 패턴 (setup 단계, 치명적)
//   kRouteNotFound    : 라우팅 결과, 매칭되는 경로 없음
//   kMethodNotAllowed : 라우팅 결과, 경로는 있으나 메서드 불일치
//   kRewrite          : rewrite 대상 패턴 치환 실패 (요청 단위)
//   kModifier         : response modifier 가 반환한 오류
//   kTransport        : origin 연결 실패 / 리셋 / 타임아웃
//   kInternalFault    : 디스패처 경계에서 회수한 예외
// ---------------------------------------------------------------------------
enum class ProxyErrorCode : std::uint8_t {
    kConfiguration    = 0,
    kRouteNotFound    = 1,
    kMethodNotAllowed = 2,
    kRewrite          = 3,
    kModifier         = 4,
    kTransport        = 5,
    kInternalFault    = 6,
};

// ---------------------------------------------------------------------------
// ProxyError
//   std::expected<T, ProxyError> 패턴과 함께 사용한다.
//   error handler 는 모든 오류 종류에 대해 이 타입 하나만 받는다.
// ---------------------------------------------------------------------------
struct ProxyError {
    ProxyErrorCode code{ProxyErrorCode::kInternalFault};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명
    std::string    context{};  // 오류가 발생한 위치/입력 단편 (로깅용)
};

// ---------------------------------------------------------------------------
// to_string
//   로그 출력용 오류 코드 이름.
// ---------------------------------------------------------------------------
[[nodiscard]] inline auto to_string(ProxyErrorCode code) noexcept -> std::string_view
{
    switch (code) {
        case ProxyErrorCode::kConfiguration:    return "configuration";
        case ProxyErrorCode::kRouteNotFound:    return "route_not_found";
        case ProxyErrorCode::kMethodNotAllowed: return "method_not_allowed";
        case ProxyErrorCode::kRewrite:          return "rewrite";
        case ProxyErrorCode::kModifier:         return "modifier";
        case ProxyErrorCode::kTransport:        return "transport";
        case ProxyErrorCode::kInternalFault:    return "internal_fault";
    }
    return "unknown";
}
