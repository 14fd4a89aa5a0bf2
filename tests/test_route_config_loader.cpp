// ---------------------------------------------------------------------------
// test_route_config_loader.cpp
//
// RouteConfigLoader / parse_period / apply_route_config 단위 테스트.
//
// [테스트 범위]
// - 정상 문서 파싱: origin / 전역 헤더 / 헬스 주기 / routes
// - 헤더 값: 단일 문자열과 목록
// - 스키마 오류: methods 누락, path/under/any 중복 또는 누락, rewrite 단독 사용
// - 파일 없음 / YAML 문법 오류
// - apply_route_config: 항목별 등록과 첫 오류에서 중단
// ---------------------------------------------------------------------------

#include "config/route_config_loader.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

DispatchOptions always_up_options() {
    DispatchOptions options{};
    options.health_check        = [](const Origin&) { return true; };
    options.health_check_period = 1h;
    return options;
}

}  // namespace

// ---------------------------------------------------------------------------
// parse: 정상 문서
// ---------------------------------------------------------------------------
TEST(RouteConfigParse, FullDocument) {
    const std::string doc = R"(
origin: http://backend:8000
request_headers:
  X-Proxy: originmux
response_headers:
  X-Served-By: [originmux, edge]
health_check:
  period: 500ms
routes:
  - methods: "GET|POST"
    path: /items
    rewrite: /api/items
  - methods: GET
    path: /users/:id
    request_headers:
      X-Api-Version: ["2"]
  - methods: "*"
    under: [/static, /assets]
    response_headers:
      Cache-Control: "public, max-age=3600"
  - methods: GET
    any: true
)";

    auto cfg = RouteConfigLoader::parse(doc);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    EXPECT_EQ(cfg->origin, "http://backend:8000");
    EXPECT_EQ(cfg->request_headers.at("X-Proxy"), std::vector<std::string>{"originmux"});

    const std::vector<std::string> served_by{"originmux", "edge"};
    EXPECT_EQ(cfg->response_headers.at("X-Served-By"), served_by);
    EXPECT_EQ(cfg->health_check_period, 500ms);

    ASSERT_EQ(cfg->routes.size(), 4U);

    EXPECT_EQ(cfg->routes[0].methods, "GET|POST");
    EXPECT_EQ(cfg->routes[0].path, "/items");
    EXPECT_EQ(cfg->routes[0].rewrite, "/api/items");

    EXPECT_EQ(cfg->routes[1].request_headers.at("X-Api-Version"), std::vector<std::string>{"2"});

    const std::vector<std::string> prefixes{"/static", "/assets"};
    EXPECT_EQ(cfg->routes[2].under, prefixes);
    EXPECT_EQ(cfg->routes[2].response_headers.at("Cache-Control"),
              std::vector<std::string>{"public, max-age=3600"});

    EXPECT_TRUE(cfg->routes[3].any);
}

TEST(RouteConfigParse, DefaultsWhenSectionsMissing) {
    auto cfg = RouteConfigLoader::parse("origin: http://backend\n");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    EXPECT_TRUE(cfg->request_headers.empty());
    EXPECT_TRUE(cfg->response_headers.empty());
    EXPECT_EQ(cfg->health_check_period, kDefaultHealthCheckPeriod);
    EXPECT_TRUE(cfg->routes.empty());
}

// 알 수 없는 키는 경고만 남기고 무시한다
TEST(RouteConfigParse, UnknownKeysAreIgnored) {
    auto cfg = RouteConfigLoader::parse(R"(
origin: http://backend
timeout: 5
routes:
  - methods: GET
    path: /items
    retries: 3
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->routes.size(), 1U);
}

TEST(RouteConfigParse, UnderAcceptsSingleString) {
    auto cfg = RouteConfigLoader::parse(R"(
routes:
  - methods: GET
    under: /static
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    ASSERT_EQ(cfg->routes.size(), 1U);
    EXPECT_EQ(cfg->routes[0].under, std::vector<std::string>{"/static"});
}

// ---------------------------------------------------------------------------
// parse: 스키마 오류
// ---------------------------------------------------------------------------
TEST(RouteConfigParse, SchemaErrors) {
    const char* bad_documents[] = {
        // methods 누락
        "routes:\n  - path: /items\n",
        // path / under / any 모두 없음
        "routes:\n  - methods: GET\n",
        // path 와 any 동시 지정
        "routes:\n  - methods: GET\n    path: /items\n    any: true\n",
        // rewrite 는 path 와만 함께
        "routes:\n  - methods: GET\n    under: [/a]\n    rewrite: /b\n",
        // routes 가 목록이 아님
        "routes: /items\n",
        // 헤더 맵이 맵이 아님
        "request_headers: [a, b]\n",
        // 헬스 주기 형식 오류
        "health_check:\n  period: soon\n",
        // 최상위가 맵이 아님
        "- a\n- b\n",
    };

    for (const char* doc : bad_documents) {
        auto cfg = RouteConfigLoader::parse(doc, "bad.yaml");
        ASSERT_FALSE(cfg.has_value()) << "document accepted:\n" << doc;
        EXPECT_NE(cfg.error().find("bad.yaml"), std::string::npos) << cfg.error();
    }
}

TEST(RouteConfigParse, YamlSyntaxError) {
    auto cfg = RouteConfigLoader::parse("routes: [unclosed\n", "broken.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("broken.yaml"), std::string::npos);
}

// ---------------------------------------------------------------------------
// load: 파일
// ---------------------------------------------------------------------------
TEST(RouteConfigLoad, MissingFileFails) {
    auto cfg = RouteConfigLoader::load("/nonexistent/originmux/routes.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("cannot resolve"), std::string::npos);
}

TEST(RouteConfigLoad, LoadsFileFromDisk) {
    const auto dir = std::filesystem::temp_directory_path() / "originmux_test_route_config";
    std::filesystem::create_directories(dir);
    const auto path = dir / "routes.yaml";
    {
        std::ofstream out{path};
        out << "origin: http://127.0.0.1:8000\n"
               "routes:\n"
               "  - methods: GET\n"
               "    path: /healthz\n";
    }

    auto cfg = RouteConfigLoader::load(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->origin, "http://127.0.0.1:8000");
    ASSERT_EQ(cfg->routes.size(), 1U);
    EXPECT_EQ(cfg->routes[0].path, "/healthz");

    std::filesystem::remove_all(dir);
}

// ---------------------------------------------------------------------------
// parse_period
// ---------------------------------------------------------------------------
TEST(ParsePeriod, Units) {
    EXPECT_EQ(parse_period("10s"), std::chrono::milliseconds{10s});
    EXPECT_EQ(parse_period("500ms"), std::chrono::milliseconds{500});
    EXPECT_EQ(parse_period("2m"), std::chrono::milliseconds{2min});
    EXPECT_EQ(parse_period("15"), std::chrono::milliseconds{15s});
}

TEST(ParsePeriod, RejectsInvalid) {
    EXPECT_FALSE(parse_period("").has_value());
    EXPECT_FALSE(parse_period("0s").has_value());
    EXPECT_FALSE(parse_period("-1s").has_value());
    EXPECT_FALSE(parse_period("10h").has_value());
    EXPECT_FALSE(parse_period("abc").has_value());
}

TEST(ParsePeriod, RejectsValuesBeyondMillisecondRange) {
    EXPECT_FALSE(parse_period("9223372036854775807m").has_value());
    EXPECT_FALSE(parse_period("9223372036854775807s").has_value());
    EXPECT_FALSE(parse_period("153722867280913m").has_value());

    EXPECT_EQ(parse_period("9223372036854775807ms"), std::chrono::milliseconds::max());
    EXPECT_EQ(parse_period("153722867280912m"), std::chrono::milliseconds{153722867280912LL * 60'000});
}

// ---------------------------------------------------------------------------
// make_header_modifier / make_dispatch_options
// ---------------------------------------------------------------------------
TEST(MakeHeaderModifier, EmptyMapGivesEmptyFunction) {
    EXPECT_FALSE(make_header_modifier({}));
}

TEST(MakeHeaderModifier, ReplacesUpstreamValues) {
    auto modifier = make_header_modifier({{"Cache-Control", {"no-store"}}});
    ASSERT_TRUE(modifier);

    HttpResponse response{boost::beast::http::status::ok, 11};
    response.insert("Cache-Control", "public");

    ASSERT_TRUE(modifier(response).has_value());
    EXPECT_EQ(header_values(response, "Cache-Control"), std::vector<std::string>{"no-store"});
}

TEST(MakeDispatchOptions, CopiesGlobalSettings) {
    RouteConfig cfg{};
    cfg.request_headers     = {{"X-Proxy", {"originmux"}}};
    cfg.health_check_period = 3s;

    auto options = make_dispatch_options(cfg);
    EXPECT_EQ(options.request_headers.at("X-Proxy"), std::vector<std::string>{"originmux"});
    EXPECT_FALSE(options.modify_response);
    EXPECT_EQ(options.health_check_period, 3s);

    cfg.response_headers = {{"X-Served-By", {"originmux"}}};
    EXPECT_TRUE(make_dispatch_options(cfg).modify_response);
}

// ---------------------------------------------------------------------------
// apply_route_config
// ---------------------------------------------------------------------------
TEST(ApplyRouteConfig, RegistersEveryEntry) {
    auto cfg = RouteConfigLoader::parse(R"(
routes:
  - methods: "GET|POST"
    path: /items
    rewrite: /api/items
  - methods: GET
    under: [/static, /assets]
  - methods: DELETE
    any: true
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    auto proxy = ReverseProxy::create("http://backend:8000", always_up_options(), nullptr);
    ASSERT_TRUE(proxy.has_value());

    auto applied = apply_route_config(**proxy, *cfg);
    ASSERT_TRUE(applied.has_value()) << applied.error().message;

    // GET /items, POST /items, GET /static/*path, GET /assets/*path, DELETE /*path
    EXPECT_EQ((*proxy)->route_count(), 5U);
}

TEST(ApplyRouteConfig, StopsAtInvalidPattern) {
    auto cfg = RouteConfigLoader::parse(R"(
routes:
  - methods: GET
    path: /ok
  - methods: GET
    path: "/bad/*rest/tail"
  - methods: GET
    path: /never
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    auto proxy = ReverseProxy::create("http://backend:8000", always_up_options(), nullptr);
    ASSERT_TRUE(proxy.has_value());

    auto applied = apply_route_config(**proxy, *cfg);
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(applied.error().code, ProxyErrorCode::kConfiguration);
    EXPECT_EQ((*proxy)->route_count(), 1U);
}

// 샘플 설정 파일이 파싱되고 모두 등록 가능한지 확인
TEST(ApplyRouteConfig, SampleConfigIsValid) {
    const std::filesystem::path sample{ORIGINMUX_SOURCE_DIR "/config/routes.yaml"};

    auto cfg = RouteConfigLoader::load(sample);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    auto proxy = ReverseProxy::create(cfg->origin, always_up_options(), nullptr);
    ASSERT_TRUE(proxy.has_value());

    auto applied = apply_route_config(**proxy, *cfg);
    EXPECT_TRUE(applied.has_value());
    EXPECT_GT((*proxy)->route_count(), 0U);
}
