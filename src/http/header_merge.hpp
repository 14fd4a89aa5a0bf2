#pragma once

// ---------------------------------------------------------------------------
// header_merge.hpp
//
// 헤더 오버레이 헬퍼.
//
// [두 가지 병합 의미론]
// - merge_request_headers / merge_response_headers:
//     source 를 순서대로 적용하며, 같은 키가 여러 source 에 있으면
//     마지막 source 의 값 목록 전체가 남는다 (whole-value replace, append 아님).
// - merge_sink_headers:
//     키 하나의 값 목록 [v1, v2, v3] 에 대해 v1 은 set, v2/v3 는 add 한다
//     (first-set-then-add).
//
// 헤더 이름 비교는 Beast fields 와 동일하게 대소문자를 구분하지 않는다.
// ---------------------------------------------------------------------------

#include "http/message.hpp"

#include <initializer_list>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// HeaderMap
//   key -> 값 목록. 설정/라우트에서 선언하는 헤더 오버레이 단위.
// ---------------------------------------------------------------------------
using HeaderMap = std::map<std::string, std::vector<std::string>>;

void merge_request_headers(HttpRequest& request,
                           std::initializer_list<const HeaderMap*> sources);

void merge_response_headers(HttpResponse& response,
                            std::initializer_list<const HeaderMap*> sources);

void merge_sink_headers(ResponseSink& sink,
                        std::initializer_list<const HeaderMap*> sources);

// ---------------------------------------------------------------------------
// header_values
//   fields 에서 key 에 해당하는 값을 순서대로 모은다 (테스트/로깅용).
// ---------------------------------------------------------------------------
[[nodiscard]] auto header_values(const HttpFields& fields, const std::string& key)
    -> std::vector<std::string>;
