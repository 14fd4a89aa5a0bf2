// ---------------------------------------------------------------------------
// test_origin.cpp
//
// parse_origin / join_origin_path 단위 테스트.
//
// [테스트 범위]
// - scheme / host / port / base_path / raw_query 분해
// - IPv6 리터럴과 authority() 대괄호 복원
// - 잘못된 URL 은 kConfiguration
// - base_path 와 요청 경로의 슬래시 결합
// ---------------------------------------------------------------------------

#include "common/origin.hpp"

#include <gtest/gtest.h>

// ---------------------------------------------------------------------------
// 정상 파싱
// ---------------------------------------------------------------------------
TEST(ParseOrigin, HostAndPort) {
    auto origin = parse_origin("http://backend:8000");
    ASSERT_TRUE(origin.has_value());

    EXPECT_EQ(origin->scheme, "http");
    EXPECT_EQ(origin->host, "backend");
    EXPECT_EQ(origin->port, "8000");
    EXPECT_TRUE(origin->base_path.empty());
    EXPECT_TRUE(origin->raw_query.empty());
    EXPECT_EQ(origin->authority(), "backend:8000");
}

TEST(ParseOrigin, BasePathAndQuery) {
    auto origin = parse_origin("http://backend/base?token=abc");
    ASSERT_TRUE(origin.has_value());

    EXPECT_EQ(origin->host, "backend");
    EXPECT_TRUE(origin->port.empty());
    EXPECT_EQ(origin->base_path, "/base");
    EXPECT_EQ(origin->raw_query, "token=abc");
    EXPECT_EQ(origin->authority(), "backend");
}

TEST(ParseOrigin, SchemeIsCaseInsensitive) {
    auto origin = parse_origin("HTTPS://secure.example.com");
    ASSERT_TRUE(origin.has_value());
    EXPECT_EQ(origin->scheme, "https");
    EXPECT_EQ(origin->effective_port(), "443");
}

TEST(ParseOrigin, EffectivePortDefaultsToSchemePort) {
    auto plain = parse_origin("http://backend");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->effective_port(), "80");

    auto explicit_port = parse_origin("http://backend:9000");
    ASSERT_TRUE(explicit_port.has_value());
    EXPECT_EQ(explicit_port->effective_port(), "9000");
}

TEST(ParseOrigin, Ipv6Literal) {
    auto origin = parse_origin("http://[::1]:8080/api");
    ASSERT_TRUE(origin.has_value());

    EXPECT_EQ(origin->host, "::1");
    EXPECT_EQ(origin->port, "8080");
    EXPECT_EQ(origin->base_path, "/api");
    EXPECT_EQ(origin->authority(), "[::1]:8080");
}

// ---------------------------------------------------------------------------
// 실패 케이스: 모두 kConfiguration
// ---------------------------------------------------------------------------
TEST(ParseOrigin, RejectsMalformedUrls) {
    const char* bad_urls[] = {
        "",
        "backend:8000",            // scheme 없음
        "ftp://backend",           // 지원하지 않는 scheme
        "http://",                 // host 없음
        "http://:8000",            // host 없음
        "http://backend:abc",      // 숫자가 아닌 port
        "http://backend:0",        // 범위 밖
        "http://backend:70000",    // 범위 밖
        "http://backend/#frag",    // fragment
        "http://user@backend",     // user info
        "http://[::1",             // 닫히지 않은 IPv6
    };

    for (const char* url : bad_urls) {
        auto origin = parse_origin(url);
        ASSERT_FALSE(origin.has_value()) << "url accepted: " << url;
        EXPECT_EQ(origin.error().code, ProxyErrorCode::kConfiguration) << url;
        EXPECT_EQ(origin.error().context, url);
    }
}

// ---------------------------------------------------------------------------
// join_origin_path
// ---------------------------------------------------------------------------
TEST(JoinOriginPath, EmptyBaseKeepsRequestPath) {
    EXPECT_EQ(join_origin_path("", "/items"), "/items");
    EXPECT_EQ(join_origin_path("", ""), "/");
}

TEST(JoinOriginPath, SingleSlashBetweenParts) {
    EXPECT_EQ(join_origin_path("/base", "/items"), "/base/items");
    EXPECT_EQ(join_origin_path("/base/", "/items"), "/base/items");
    EXPECT_EQ(join_origin_path("/base", "items"), "/base/items");
    EXPECT_EQ(join_origin_path("/base/", "items"), "/base/items");
}

TEST(JoinOriginPath, TrailingSlashPreserved) {
    EXPECT_EQ(join_origin_path("/base", "/items/"), "/base/items/");
    EXPECT_EQ(join_origin_path("/base", ""), "/base");
}
