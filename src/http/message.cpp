#include "http/message.hpp"

#include <array>
#include <string>
#include <vector>

namespace http = boost::beast::http;

namespace {

// hop-by-hop 헤더 목록 (RFC 7230 6.1)
constexpr std::array<std::string_view, 9> kHopByHopHeaders = {
    "Connection",
    "Proxy-Connection",
    "Keep-Alive",
    "Proxy-Authenticate",
    "Proxy-Authorization",
    "Te",
    "Trailer",
    "Transfer-Encoding",
    "Upgrade",
};

[[nodiscard]] std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

// ---------------------------------------------------------------------------
// ResponseSink
// ---------------------------------------------------------------------------
ResponseSink::ResponseSink(unsigned version, bool keep_alive)
    : response_{http::status::ok, version}
{
    response_.keep_alive(keep_alive);
}

auto ResponseSink::header() -> HttpFields&
{
    return response_;
}

auto ResponseSink::header() const -> const HttpFields&
{
    return response_;
}

void ResponseSink::write_header(http::status status)
{
    if (header_written_) {
        return;
    }
    response_.result(status);
    header_written_ = true;
}

void ResponseSink::write(std::string_view data)
{
    if (!header_written_) {
        write_header(http::status::ok);
    }
    response_.body().append(data);
}

auto ResponseSink::status() const -> http::status
{
    return response_.result();
}

auto ResponseSink::body() const -> const std::string&
{
    return response_.body();
}

auto ResponseSink::release() -> HttpResponse
{
    HttpResponse out{std::move(response_)};
    if (head_request_) {
        // upstream 이 알려준 엔티티 길이를 유지한다
        if (!out.has_content_length() && !out.chunked()) {
            out.content_length(out.body().size());
        }
        out.body().clear();
    } else {
        out.prepare_payload();
    }

    response_       = HttpResponse{http::status::ok, out.version()};
    header_written_ = false;
    head_request_   = false;
    return out;
}

// ---------------------------------------------------------------------------
// split_target
// ---------------------------------------------------------------------------
auto split_target(std::string_view target) -> RequestTarget
{
    RequestTarget out{};
    if (const auto q = target.find('?'); q != std::string_view::npos) {
        out.path  = std::string{target.substr(0, q)};
        out.query = std::string{target.substr(q + 1)};
    } else {
        out.path = std::string{target};
    }
    if (out.path.empty()) {
        out.path = "/";
    }
    return out;
}

// ---------------------------------------------------------------------------
// remove_hop_by_hop_headers
// ---------------------------------------------------------------------------
void remove_hop_by_hop_headers(HttpFields& fields)
{
    // Connection: close, X-Foo  →  X-Foo 도 제거 대상
    std::vector<std::string> listed;
    const auto range = fields.equal_range(http::field::connection);
    for (auto it = range.first; it != range.second; ++it) {
        std::string_view value = to_std(it->value());
        while (!value.empty()) {
            const auto comma = value.find(',');
            const auto token = trim(value.substr(0, comma));
            if (!token.empty()) {
                listed.emplace_back(token);
            }
            if (comma == std::string_view::npos) {
                break;
            }
            value.remove_prefix(comma + 1);
        }
    }

    for (const auto& name : listed) {
        fields.erase(boost::beast::string_view{name.data(), name.size()});
    }
    for (const auto name : kHopByHopHeaders) {
        fields.erase(boost::beast::string_view{name.data(), name.size()});
    }
}
