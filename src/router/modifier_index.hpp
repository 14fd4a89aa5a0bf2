#pragma once

// ---------------------------------------------------------------------------
// modifier_index.hpp
//
// (method, 등록 path) -> 라우트 전용 ResponseModifier 인덱스. 헤더 전용.
//
// 라우트 자체는 Router 에서 이미 조회된 뒤에, 디스패처가 global modifier 다음
// 단계로 이 인덱스에서 route modifier 를 꺼낸다. 키는 요청 경로가 아니라
// 라우트가 등록될 때의 패턴 문자열이다 (rewrite 후 경로와 무관).
// ---------------------------------------------------------------------------

#include "router/route.hpp"

#include <compare>
#include <cstddef>
#include <map>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// RouteKey
//   중첩 map 대신 사용하는 명시적 복합 키.
// ---------------------------------------------------------------------------
struct RouteKey {
    std::string method{};
    std::string path{};

    auto operator<=>(const RouteKey&) const = default;
};

class ResponseModifierIndex {
public:
    // assign
    //   modifier 가 비어 있으면 기존 항목을 제거한다 (라우트 교체 시 이전
    //   라우트의 modifier 가 남지 않도록).
    void assign(RouteKey key, ResponseModifier modifier)
    {
        if (!modifier) {
            modifiers_.erase(key);
            return;
        }
        modifiers_.insert_or_assign(std::move(key), std::move(modifier));
    }

    void erase(const RouteKey& key) { modifiers_.erase(key); }

    // find
    //   없으면 nullptr.
    [[nodiscard]] auto find(const RouteKey& key) const -> const ResponseModifier*
    {
        const auto it = modifiers_.find(key);
        if (it == modifiers_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return modifiers_.size(); }

private:
    std::map<RouteKey, ResponseModifier> modifiers_{};
};
