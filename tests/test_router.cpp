// ---------------------------------------------------------------------------
// test_router.cpp
//
// Router 메서드별 트리 매칭 단위 테스트.
//
// [테스트 범위]
// - literal > 파라미터 > wildcard 우선순위와 백트래킹
// - 404 / 405 판정과 allowed_methods 등록 순서
// - 같은 (method, path) 재등록 시 교체
// - 파라미터 이름이 다른 패턴이 같은 노드를 공유할 때의 캡처
// ---------------------------------------------------------------------------

#include "router/router.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace {

std::shared_ptr<const Route> route_for(std::string_view path) {
    return std::make_shared<const Route>(make_route("GET", path));
}

void insert_ok(Router& router, std::string_view method, std::string_view path) {
    auto inserted = router.insert(method, route_for(path));
    ASSERT_TRUE(inserted.has_value()) << method << " " << path;
}

}  // namespace

// ---------------------------------------------------------------------------
// 기본 매칭
// ---------------------------------------------------------------------------
TEST(Router, MatchesRegisteredLiteral) {
    Router router;
    insert_ok(router, "GET", "/items");

    auto match = router.match("GET", "/items");
    EXPECT_EQ(match.status, MatchStatus::kMatched);
    ASSERT_NE(match.route, nullptr);
    EXPECT_EQ(match.route->path, "/items");
    EXPECT_EQ(router.size(), 1U);
}

TEST(Router, UnknownPathIsNotFound) {
    Router router;
    insert_ok(router, "GET", "/items");

    auto match = router.match("GET", "/other");
    EXPECT_EQ(match.status, MatchStatus::kNotFound);
    EXPECT_EQ(match.route, nullptr);
    EXPECT_TRUE(match.allowed_methods.empty());
}

TEST(Router, EmptyRouterIsNotFound) {
    Router router;
    EXPECT_EQ(router.match("GET", "/").status, MatchStatus::kNotFound);
}

TEST(Router, TrailingSlashIsDistinct) {
    Router router;
    insert_ok(router, "GET", "/items");

    EXPECT_EQ(router.match("GET", "/items/").status, MatchStatus::kNotFound);
}

// ---------------------------------------------------------------------------
// 우선순위
// ---------------------------------------------------------------------------
TEST(Router, LiteralBeatsParam) {
    Router router;
    insert_ok(router, "GET", "/users/:id");
    insert_ok(router, "GET", "/users/me");

    auto me = router.match("GET", "/users/me");
    ASSERT_EQ(me.status, MatchStatus::kMatched);
    EXPECT_EQ(me.route->path, "/users/me");
    EXPECT_TRUE(me.params.empty());

    auto other = router.match("GET", "/users/42");
    ASSERT_EQ(other.status, MatchStatus::kMatched);
    EXPECT_EQ(other.route->path, "/users/:id");
    EXPECT_EQ(find_param(other.params, "id"), "42");
}

TEST(Router, ParamBeatsWildcard) {
    Router router;
    insert_ok(router, "GET", "/files/*path");
    insert_ok(router, "GET", "/files/:name");

    auto single = router.match("GET", "/files/readme");
    ASSERT_EQ(single.status, MatchStatus::kMatched);
    EXPECT_EQ(single.route->path, "/files/:name");

    auto nested = router.match("GET", "/files/docs/readme");
    ASSERT_EQ(nested.status, MatchStatus::kMatched);
    EXPECT_EQ(nested.route->path, "/files/*path");
    EXPECT_EQ(find_param(nested.params, "path"), "docs/readme");
}

// literal 경로가 더 깊은 곳에서 막히면 wildcard 로 되돌아간다
TEST(Router, BacktracksFromDeadLiteralBranch) {
    Router router;
    insert_ok(router, "GET", "/static/css/site.css");
    insert_ok(router, "GET", "/static/*path");

    auto exact = router.match("GET", "/static/css/site.css");
    ASSERT_EQ(exact.status, MatchStatus::kMatched);
    EXPECT_EQ(exact.route->path, "/static/css/site.css");

    auto fallback = router.match("GET", "/static/css/other.css");
    ASSERT_EQ(fallback.status, MatchStatus::kMatched);
    EXPECT_EQ(fallback.route->path, "/static/*path");
    EXPECT_EQ(find_param(fallback.params, "path"), "css/other.css");
}

TEST(Router, WildcardMatchesItsPrefix) {
    Router router;
    insert_ok(router, "GET", "/static/*path");

    auto match = router.match("GET", "/static");
    ASSERT_EQ(match.status, MatchStatus::kMatched);
    EXPECT_EQ(find_param(match.params, "path"), "");
}

TEST(Router, ParamRejectsEmptySegment) {
    Router router;
    insert_ok(router, "GET", "/users/:id");

    EXPECT_EQ(router.match("GET", "/users/").status, MatchStatus::kNotFound);
}

// 같은 위치에 다른 이름을 쓴 두 패턴: 매칭된 항목의 이름으로 캡처한다
TEST(Router, ParamNamesComeFromMatchedPattern) {
    Router router;
    insert_ok(router, "GET", "/users/:id");
    insert_ok(router, "GET", "/users/:user_id/posts");

    auto user = router.match("GET", "/users/7");
    ASSERT_EQ(user.status, MatchStatus::kMatched);
    EXPECT_EQ(find_param(user.params, "id"), "7");

    auto posts = router.match("GET", "/users/7/posts");
    ASSERT_EQ(posts.status, MatchStatus::kMatched);
    EXPECT_EQ(find_param(posts.params, "user_id"), "7");
    EXPECT_FALSE(find_param(posts.params, "id").has_value());
}

// ---------------------------------------------------------------------------
// 405
// ---------------------------------------------------------------------------
TEST(Router, OtherMethodIsMethodNotAllowed) {
    Router router;
    insert_ok(router, "POST", "/items");
    insert_ok(router, "PUT", "/items");
    insert_ok(router, "GET", "/other");

    auto match = router.match("DELETE", "/items");
    EXPECT_EQ(match.status, MatchStatus::kMethodNotAllowed);
    EXPECT_EQ(match.route, nullptr);

    const std::vector<std::string> expected{"POST", "PUT"};
    EXPECT_EQ(match.allowed_methods, expected);
}

TEST(Router, MethodNotAllowedViaWildcard) {
    Router router;
    insert_ok(router, "GET", "/static/*path");

    auto match = router.match("POST", "/static/app.js");
    EXPECT_EQ(match.status, MatchStatus::kMethodNotAllowed);
    EXPECT_EQ(match.allowed_methods, std::vector<std::string>{"GET"});
}

// ---------------------------------------------------------------------------
// 등록
// ---------------------------------------------------------------------------
TEST(Router, ReinsertReplacesExistingEntry) {
    Router router;

    auto first = router.insert("GET", std::make_shared<const Route>(
        make_route("GET", "/items").with_rewrite_path("/v1/items")));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, nullptr);

    auto second = router.insert("GET", std::make_shared<const Route>(
        make_route("GET", "/items").with_rewrite_path("/v2/items")));
    ASSERT_TRUE(second.has_value());
    ASSERT_NE(*second, nullptr);
    EXPECT_EQ((*second)->rewrite_path, "/v1/items");

    EXPECT_EQ(router.size(), 1U);

    auto match = router.match("GET", "/items");
    ASSERT_EQ(match.status, MatchStatus::kMatched);
    EXPECT_EQ(match.route->rewrite_path, "/v2/items");
}

// 파라미터 이름만 다른 패턴은 같은 자리를 차지한다
TEST(Router, RenamedParamReplacesExistingEntry) {
    Router router;
    insert_ok(router, "GET", "/users/:id");

    auto replaced = router.insert("GET", route_for("/users/:uid"));
    ASSERT_TRUE(replaced.has_value());
    ASSERT_NE(*replaced, nullptr);
    EXPECT_EQ((*replaced)->path, "/users/:id");
    EXPECT_EQ(router.size(), 1U);

    auto match = router.match("GET", "/users/7");
    ASSERT_EQ(match.status, MatchStatus::kMatched);
    EXPECT_EQ(match.route->path, "/users/:uid");
    EXPECT_EQ(find_param(match.params, "uid"), "7");
}

TEST(Router, InvalidPatternIsConfigurationError) {
    Router router;

    auto inserted = router.insert("GET", route_for("/*path/tail"));
    ASSERT_FALSE(inserted.has_value());
    EXPECT_EQ(inserted.error().code, ProxyErrorCode::kConfiguration);
    EXPECT_EQ(router.size(), 0U);
}

TEST(Router, RootPathIsLiteral) {
    Router router;
    insert_ok(router, "GET", "/");

    EXPECT_EQ(router.match("GET", "/").status, MatchStatus::kMatched);
    EXPECT_EQ(router.match("GET", "/x").status, MatchStatus::kNotFound);
}
