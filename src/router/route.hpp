#pragma once

#include "common/types.hpp"
#include "http/header_merge.hpp"
#include "http/message.hpp"

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// ResponseModifier
//   upstream 응답을 클라이언트로 릴레이하기 전에 수정하는 콜백.
//   실패를 반환하면 이후 modifier 는 실행되지 않는다.
// ---------------------------------------------------------------------------
using ResponseModifier = std::function<std::expected<void, ProxyError>(HttpResponse&)>;

// ---------------------------------------------------------------------------
// Route
//   (method 목록, path 패턴) 바인딩 + 선택적 rewrite / 헤더 / modifier.
//
//   methods          : 비어 있지 않은 HTTP 메서드 목록 (중복 허용, 의미 없음)
//   path             : "/users/:id", "/static/*path" 형태의 패턴
//   rewrite_path     : 같은 파라미터 이름을 쓰는 대상 패턴 (빈 문자열 = rewrite 없음)
//   request_headers  : 전달 요청에 덮어쓸 헤더
//   response_modifier: 라우트 전용 응답 modifier (없으면 빈 function)
//
//   with_* 세터는 수정된 사본을 반환한다.
// ---------------------------------------------------------------------------
struct Route {
    std::vector<std::string> methods{};
    std::string              path{};
    std::string              rewrite_path{};
    HeaderMap                request_headers{};
    ResponseModifier         response_modifier{};

    [[nodiscard]] auto with_rewrite_path(std::string target) const -> Route;
    [[nodiscard]] auto with_request_headers(HeaderMap headers) const -> Route;
    [[nodiscard]] auto with_response_modifier(ResponseModifier modifier) const -> Route;
};

// ---------------------------------------------------------------------------
// parse_methods
//   "*"      -> {GET, HEAD, OPTIONS, POST, PUT, PATCH, DELETE}
//   "A|B|C"  -> {A, B, C} (입력 순서 유지)
//   "GET"    -> {GET}
// ---------------------------------------------------------------------------
[[nodiscard]] auto parse_methods(std::string_view methods) -> std::vector<std::string>;

// make_route
//   parse_methods(methods) + path 로 Route 를 만든다.
[[nodiscard]] auto make_route(std::string_view methods, std::string_view path) -> Route;

// ---------------------------------------------------------------------------
// wildcard_path_under
//   prefix 아래 전체를 받는 패턴을 만든다. 중복/후행 슬래시는 정리한다.
//   "/static/" -> "/static/*path", "/" -> "/*path", "//a//b" -> "/a/b/*path"
// ---------------------------------------------------------------------------
[[nodiscard]] auto wildcard_path_under(std::string_view prefix) -> std::string;
