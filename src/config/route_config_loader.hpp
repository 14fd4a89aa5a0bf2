#pragma once

// ---------------------------------------------------------------------------
// route_config_loader.hpp
//
// YAML 라우트 설정 파일을 로드해 ReverseProxy 에 적용한다.
//
//   origin: http://backend:8000
//   request_headers:  { X-Proxy: [originmux] }
//   response_headers: { X-Served-By: [originmux] }
//   health_check: { period: 10s }
//   routes:
//     - { methods: "GET|POST", path: /items, rewrite: /api/items }
//     - { methods: GET, path: "/users/:id", request_headers: { X-Api: ["2"] } }
//     - { methods: "*", under: [/static, /assets] }
//     - { methods: GET, any: true }
//
// - load() 실패 시 std::unexpected(error_message). 부분 설정을 반환하지 않는다.
// - 경로 패턴 자체의 검증은 apply_route_config() (ReverseProxy 등록) 에서 한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "http/header_merge.hpp"
#include "proxy/reverse_proxy.hpp"
#include "router/route.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RouteEntry
//   routes 목록의 항목 하나. path / under / any 중 정확히 하나를 지정한다.
//
//   methods          : "*", "GET|POST", "GET" (필수)
//   path             : 단일 패턴 (rewrite 는 path 와만 함께 사용)
//   under            : prefix 목록, 각각 "<prefix>/*path" 로 등록
//   any              : true 이면 "/*path"
// ---------------------------------------------------------------------------
struct RouteEntry {
    std::string              methods{};
    std::string              path{};
    std::string              rewrite{};
    std::vector<std::string> under{};
    bool                     any{false};
    HeaderMap                request_headers{};
    HeaderMap                response_headers{};
};

// ---------------------------------------------------------------------------
// RouteConfig
//   origin 이 비어 있으면 호출자가 환경 변수 등으로 채워야 한다.
// ---------------------------------------------------------------------------
struct RouteConfig {
    std::string               origin{};
    HeaderMap                 request_headers{};
    HeaderMap                 response_headers{};
    std::chrono::milliseconds health_check_period{kDefaultHealthCheckPeriod};
    std::vector<RouteEntry>   routes{};
};

class RouteConfigLoader {
public:
    // load
    //   파일 없음, YAML 오류, 스키마 불일치 모두 실패.
    [[nodiscard]] static std::expected<RouteConfig, std::string>
    load(const std::filesystem::path& config_path);

    // parse
    //   문서 문자열에서 직접 파싱한다. source 는 오류 메시지용 이름.
    [[nodiscard]] static std::expected<RouteConfig, std::string>
    parse(const std::string& document, const std::string& source = "<memory>");
};

// ---------------------------------------------------------------------------
// parse_period
//   "10s", "500ms", "2m", "15" (초) → milliseconds. 0 이하나 형식 오류는 nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] auto parse_period(const std::string& text) -> std::optional<std::chrono::milliseconds>;

// make_header_modifier
//   headers 를 upstream 응답에 whole-value replace 로 덮어쓰는 modifier.
//   headers 가 비어 있으면 빈 function.
[[nodiscard]] auto make_header_modifier(HeaderMap headers) -> ResponseModifier;

// make_dispatch_options
//   전역 헤더 / 응답 헤더 / 헬스 주기를 DispatchOptions 로 옮긴다.
//   (훅과 logger 는 호출자가 채운다)
[[nodiscard]] auto make_dispatch_options(const RouteConfig& config) -> DispatchOptions;

// apply_route_config
//   모든 항목을 등록한다. 첫 번째 kConfiguration 오류에서 중단한다.
[[nodiscard]] auto apply_route_config(ReverseProxy& proxy, const RouteConfig& config)
    -> std::expected<void, ProxyError>;
