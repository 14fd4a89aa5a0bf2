// ---------------------------------------------------------------------------
// test_header_merge.cpp
//
// 헤더 오버레이 / hop-by-hop 제거 / ResponseSink 단위 테스트.
//
// [테스트 범위]
// - merge_request_headers / merge_response_headers: 키 단위 whole-value replace
// - merge_sink_headers: 첫 값 set, 이후 값 add
// - 대소문자 무시 키 비교
// - remove_hop_by_hop_headers: 고정 목록 + Connection 에 나열된 이름
// - ResponseSink: write_header 1회 확정, write 시 200 자동 확정
// ---------------------------------------------------------------------------

#include "http/header_merge.hpp"
#include "http/message.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace http = boost::beast::http;

// ---------------------------------------------------------------------------
// whole-value replace
// ---------------------------------------------------------------------------
TEST(MergeRequestHeaders, LaterSourceReplacesWholeValue) {
    HttpRequest request{http::verb::get, "/", 11};
    request.insert("X-Tag", "client");

    const HeaderMap global{{"X-Tag", {"global-1", "global-2"}}};
    const HeaderMap route{{"X-Tag", {"route"}}};

    merge_request_headers(request, {&global, &route});

    EXPECT_EQ(header_values(request, "X-Tag"), std::vector<std::string>{"route"});
}

TEST(MergeRequestHeaders, DisjointKeysAllApplied) {
    HttpRequest request{http::verb::get, "/", 11};

    const HeaderMap global{{"X-Proxy", {"originmux"}}};
    const HeaderMap route{{"X-Api-Version", {"2"}}};

    merge_request_headers(request, {&global, &route});

    EXPECT_EQ(header_values(request, "X-Proxy"), std::vector<std::string>{"originmux"});
    EXPECT_EQ(header_values(request, "X-Api-Version"), std::vector<std::string>{"2"});
}

TEST(MergeRequestHeaders, KeyComparisonIgnoresCase) {
    HttpRequest request{http::verb::get, "/", 11};
    request.insert("x-tag", "client");

    const HeaderMap overlay{{"X-TAG", {"proxy"}}};
    merge_request_headers(request, {&overlay});

    EXPECT_EQ(header_values(request, "X-Tag"), std::vector<std::string>{"proxy"});
}

TEST(MergeRequestHeaders, NullSourceIsSkipped) {
    HttpRequest request{http::verb::get, "/", 11};
    const HeaderMap overlay{{"X-A", {"1"}}};

    merge_request_headers(request, {nullptr, &overlay});
    EXPECT_EQ(header_values(request, "X-A"), std::vector<std::string>{"1"});
}

TEST(MergeResponseHeaders, MultipleValuesPreserveOrder) {
    HttpResponse response{http::status::ok, 11};
    response.insert("Cache-Control", "no-store");

    const HeaderMap overlay{{"Cache-Control", {"public", "max-age=60"}}};
    merge_response_headers(response, {&overlay});

    const std::vector<std::string> expected{"public", "max-age=60"};
    EXPECT_EQ(header_values(response, "Cache-Control"), expected);
}

// ---------------------------------------------------------------------------
// first-set-then-add
// ---------------------------------------------------------------------------
TEST(MergeSinkHeaders, FirstValueSetsRestAppend) {
    ResponseSink sink;
    sink.header().insert("Vary", "Cookie");

    const HeaderMap overlay{{"Vary", {"Accept", "Origin"}}};
    merge_sink_headers(sink, {&overlay});

    const std::vector<std::string> expected{"Accept", "Origin"};
    EXPECT_EQ(header_values(sink.header(), "Vary"), expected);
}

// 두 source 가 같은 키를 가지면 뒤 source 의 첫 값이 다시 set 한다
TEST(MergeSinkHeaders, SecondSourceResetsKey) {
    ResponseSink sink;

    const HeaderMap first{{"X-Tag", {"a", "b"}}};
    const HeaderMap second{{"X-Tag", {"c"}}};
    merge_sink_headers(sink, {&first, &second});

    EXPECT_EQ(header_values(sink.header(), "X-Tag"), std::vector<std::string>{"c"});
}

// ---------------------------------------------------------------------------
// remove_hop_by_hop_headers
// ---------------------------------------------------------------------------
TEST(RemoveHopByHopHeaders, StripsStandardList) {
    HttpResponse response{http::status::ok, 11};
    response.set(http::field::connection, "keep-alive");
    response.set(http::field::keep_alive, "timeout=5");
    response.set(http::field::transfer_encoding, "chunked");
    response.set(http::field::upgrade, "websocket");
    response.set(http::field::proxy_authorization, "Basic x");
    response.set(http::field::te, "trailers");
    response.set(http::field::content_type, "text/plain");

    remove_hop_by_hop_headers(response);

    EXPECT_EQ(response.count(http::field::connection), 0U);
    EXPECT_EQ(response.count(http::field::keep_alive), 0U);
    EXPECT_EQ(response.count(http::field::transfer_encoding), 0U);
    EXPECT_EQ(response.count(http::field::upgrade), 0U);
    EXPECT_EQ(response.count(http::field::proxy_authorization), 0U);
    EXPECT_EQ(response.count(http::field::te), 0U);
    EXPECT_EQ(response.count(http::field::content_type), 1U);
}

TEST(RemoveHopByHopHeaders, StripsNamesListedInConnection) {
    HttpRequest request{http::verb::get, "/", 11};
    request.set(http::field::connection, "close, X-Session-Token ,X-Trace");
    request.set("X-Session-Token", "secret");
    request.set("X-Trace", "1");
    request.set("X-Keep", "yes");

    remove_hop_by_hop_headers(request);

    EXPECT_EQ(request.count("X-Session-Token"), 0U);
    EXPECT_EQ(request.count("X-Trace"), 0U);
    EXPECT_EQ(request.count("X-Keep"), 1U);
}

// ---------------------------------------------------------------------------
// ResponseSink
// ---------------------------------------------------------------------------
TEST(ResponseSink, WriteDefaultsToOk) {
    ResponseSink sink;
    sink.write("hello");

    EXPECT_TRUE(sink.header_written());
    EXPECT_EQ(sink.status(), http::status::ok);
    EXPECT_EQ(sink.body(), "hello");
}

TEST(ResponseSink, FirstWriteHeaderWins) {
    ResponseSink sink;
    sink.write_header(http::status::not_found);
    sink.write_header(http::status::internal_server_error);
    sink.write("gone");

    EXPECT_EQ(sink.status(), http::status::not_found);
}

TEST(ResponseSink, ReleaseComputesContentLength) {
    ResponseSink sink{11, false};
    sink.header().set(http::field::content_type, "text/plain");
    sink.write("abc");
    sink.write("def");

    HttpResponse response = sink.release();
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response.body(), "abcdef");
    EXPECT_EQ(to_std(response[http::field::content_length]), "6");
    EXPECT_FALSE(response.keep_alive());

    // release 후 sink 는 초기 상태
    EXPECT_FALSE(sink.header_written());
    EXPECT_TRUE(sink.body().empty());
}

// ---------------------------------------------------------------------------
// split_target
// ---------------------------------------------------------------------------
TEST(SplitTarget, SeparatesQuery) {
    const auto target = split_target("/items?page=2&sort=asc");
    EXPECT_EQ(target.path, "/items");
    EXPECT_EQ(target.query, "page=2&sort=asc");
}

TEST(SplitTarget, EmptyPathBecomesRoot) {
    const auto target = split_target("?q=1");
    EXPECT_EQ(target.path, "/");
    EXPECT_EQ(target.query, "q=1");
}
