#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// - ProxyErrorCode 는 include 하지 않고 문자열(code)로 받는다.
//   호출자: std::string{to_string(error.code)}
// - 요청 헤더 값은 기록하지 않는다 (Authorization, Cookie 노출 방지).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// AccessLog
//   요청 1건의 처리 결과.
//   route_path: 매칭된 등록 패턴 ("" = 매칭 없음)
//   upstream_target: origin 으로 전달된 target ("" = 전달 전 종료)
// ---------------------------------------------------------------------------
struct AccessLog {
    std::string                           method{};
    std::string                           target{};
    std::string                           host{};
    std::string                           client_ip{};
    std::string                           route_path{};
    std::string                           upstream_target{};
    unsigned                              status{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// ErrorLog
//   dispatch 중 발생한 오류 (error handler 로 전달된 ProxyError).
//   message/context 는 클라이언트에 직접 노출하지 않는다.
// ---------------------------------------------------------------------------
struct ErrorLog {
    std::string                           method{};
    std::string                           target{};
    std::string                           client_ip{};
    std::string                           code{};
    std::string                           message{};
    std::string                           context{};
    std::chrono::system_clock::time_point timestamp{};
};
