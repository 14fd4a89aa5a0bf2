#pragma once

#include "common/types.hpp"
#include "router/path_pattern.hpp"
#include "router/route.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// MatchStatus
//   kMatched          : 요청 메서드 트리에서 경로가 매칭됨
//   kNotFound         : 어떤 메서드 트리에서도 매칭되지 않음
//   kMethodNotAllowed : 다른 메서드 트리에서만 매칭됨
// ---------------------------------------------------------------------------
enum class MatchStatus : std::uint8_t {
    kMatched          = 0,
    kNotFound         = 1,
    kMethodNotAllowed = 2,
};

// ---------------------------------------------------------------------------
// RouteMatch
//   route           : kMatched 일 때만 유효
//   params          : 매칭 중 캡처된 파라미터
//   allowed_methods : kMethodNotAllowed 일 때 경로가 매칭되는 메서드 목록
//                     (Allow 헤더 값, 등록 순서)
// ---------------------------------------------------------------------------
struct RouteMatch {
    MatchStatus                  status{MatchStatus::kNotFound};
    std::shared_ptr<const Route> route{};
    PathParams                   params{};
    std::vector<std::string>     allowed_methods{};
};

// ---------------------------------------------------------------------------
// Router
//   메서드별 세그먼트 트리. setup 단계에서만 insert 하고, 서빙 중에는
//   읽기 전용이므로 락 없이 여러 요청이 동시에 match 할 수 있다.
//
//   매칭 우선순위 (세그먼트 단위, 백트래킹):
//     1. literal 자식
//     2. 파라미터 자식 (비어 있지 않은 세그먼트)
//     3. 현재 노드의 wildcard
//
//   같은 (method, path) 를 다시 등록하면 기존 항목을 교체하고 경고 로그를 남긴다.
// ---------------------------------------------------------------------------
class Router {
public:
    Router();
    ~Router();

    Router(const Router&)            = delete;
    Router& operator=(const Router&) = delete;
    Router(Router&&) noexcept;
    Router& operator=(Router&&) noexcept;

    // insert
    //   route->path 를 method 트리에 넣는다.
    //   성공 시 교체된 기존 라우트를 반환한다 (없으면 nullptr).
    //   파라미터 이름만 다른 패턴 (/users/:id, /users/:uid) 은 같은 항목이다.
    //   패턴 구조 오류는 kConfiguration.
    [[nodiscard]] auto insert(std::string_view method, std::shared_ptr<const Route> route)
        -> std::expected<std::shared_ptr<const Route>, ProxyError>;

    [[nodiscard]] auto match(std::string_view method, std::string_view path) const -> RouteMatch;

    // size
    //   등록된 (method, path) 항목 수.
    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }

private:
    struct Entry;
    struct Node;

    [[nodiscard]] static auto lookup(const Node&                          node,
                                     const std::vector<std::string_view>& parts,
                                     std::size_t                          index) -> const Entry*;

    std::map<std::string, std::unique_ptr<Node>, std::less<>> trees_;   // no `{}`: GCC 12 would instantiate ~map with incomplete Node
    std::vector<std::string>                                  method_order_{};
    std::size_t                                               size_{0};
};
