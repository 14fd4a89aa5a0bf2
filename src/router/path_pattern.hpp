#pragma once

#include "common/types.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// PathParam / PathParams
//   매칭 중 캡처된 파라미터. 패턴에 등장한 순서를 유지한다.
// ---------------------------------------------------------------------------
struct PathParam {
    std::string name{};
    std::string value{};
};

using PathParams = std::vector<PathParam>;

// find_param
//   이름으로 캡처 값을 찾는다. 없으면 std::nullopt.
[[nodiscard]] auto find_param(const PathParams& params, std::string_view name)
    -> std::optional<std::string_view>;

// ---------------------------------------------------------------------------
// SegmentKind
//   kLiteral  : 정확히 일치해야 하는 세그먼트 ("items")
//   kParam    : 비어 있지 않은 세그먼트 하나를 바인딩 (":id")
//   kWildcard : 나머지 경로 전체를 바인딩, 마지막 위치만 허용 ("*path")
// ---------------------------------------------------------------------------
enum class SegmentKind : std::uint8_t {
    kLiteral  = 0,
    kParam    = 1,
    kWildcard = 2,
};

struct PathSegment {
    SegmentKind kind{SegmentKind::kLiteral};
    std::string text{};  // literal 값 또는 파라미터 이름
};

// ---------------------------------------------------------------------------
// PathPattern
//   "/users/:id/files/*path" 형태의 경로 패턴을 세그먼트 단위로 컴파일한다.
//
//   parse()  : 구조 오류 시 kConfiguration 반환
//   match()  : 요청 경로가 패턴과 일치하면 캡처 목록, 아니면 std::nullopt
//   expand() : 캡처 목록을 대상 패턴에 치환 (rewrite). 실패 시 kRewrite
//
//   wildcard 캡처 값은 선두 슬래시를 포함하지 않는다.
//   ("/static/*path" 와 "/static/a/b.png" -> path = "a/b.png")
// ---------------------------------------------------------------------------
class PathPattern {
public:
    [[nodiscard]] static auto parse(std::string_view pattern)
        -> std::expected<PathPattern, ProxyError>;

    [[nodiscard]] auto match(std::string_view request_path) const
        -> std::optional<PathParams>;

    [[nodiscard]] auto expand(const PathParams& params) const
        -> std::expected<std::string, ProxyError>;

    [[nodiscard]] auto segments() const noexcept -> const std::vector<PathSegment>& { return segments_; }
    [[nodiscard]] auto text() const noexcept -> const std::string& { return text_; }

private:
    PathPattern() = default;

    std::string              text_{};
    std::vector<PathSegment> segments_{};
};

// ---------------------------------------------------------------------------
// split_path
//   "/a/b/" -> {"a", "b", ""}. 선두 슬래시 하나를 제거한 뒤 '/' 로 분리한다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto split_path(std::string_view path) -> std::vector<std::string_view>;
