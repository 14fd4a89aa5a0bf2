#pragma once

#include "common/types.hpp"

#include <expected>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Origin
//   프록시가 요청을 전달하는 단일 업스트림 서버.
//   parse_origin() 으로만 생성하며 생성 후에는 불변으로 취급한다.
//
//   scheme    : "http" | "https"
//   host      : 호스트명 또는 IP (IPv6 는 대괄호 없이 저장)
//   port      : 포트 문자열 (URL 에 없으면 빈 문자열)
//   base_path : origin URL 의 경로 부분 (요청 경로 앞에 결합된다)
//   raw_query : origin URL 의 query 부분 (요청 query 와 '&' 로 병합된다)
// ---------------------------------------------------------------------------
struct Origin {
    std::string scheme{"http"};
    std::string host{};
    std::string port{};
    std::string base_path{};
    std::string raw_query{};

    // authority
    //   Host 헤더에 들어갈 "host[:port]" 문자열.
    [[nodiscard]] auto authority() const -> std::string;

    // effective_port
    //   port 가 비어 있으면 scheme 기본 포트("80"/"443")를 반환한다.
    [[nodiscard]] auto effective_port() const -> std::string;
};

// ---------------------------------------------------------------------------
// parse_origin
//   "http://backend:8000/base?x=1" 형태의 URL 을 Origin 으로 파싱한다.
//
//   실패(kConfiguration):
//     - scheme 누락 또는 http/https 이외
//     - host 비어 있음
//     - port 가 숫자가 아니거나 1..65535 범위 밖
//     - fragment('#') 포함
// ---------------------------------------------------------------------------
[[nodiscard]] auto parse_origin(std::string_view url)
    -> std::expected<Origin, ProxyError>;

// ---------------------------------------------------------------------------
// join_origin_path
//   origin base_path 와 요청 경로를 슬래시 하나로 결합한다.
//   ("/base" + "/items" -> "/base/items", "/base/" + "/items" -> "/base/items")
// ---------------------------------------------------------------------------
[[nodiscard]] auto join_origin_path(std::string_view base_path,
                                    std::string_view request_path) -> std::string;
