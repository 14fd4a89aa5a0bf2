#include "common/origin.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace {

[[nodiscard]] ProxyError config_error(std::string message, std::string_view url)
{
    return ProxyError{
        ProxyErrorCode::kConfiguration,
        std::move(message),
        std::string{url}
    };
}

[[nodiscard]] std::string to_lower(std::string_view s)
{
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

auto Origin::authority() const -> std::string
{
    std::string out;
    // IPv6 리터럴은 Host 헤더에서 대괄호가 필요하다
    if (host.find(':') != std::string::npos) {
        out = "[" + host + "]";
    } else {
        out = host;
    }
    if (!port.empty()) {
        out += ':';
        out += port;
    }
    return out;
}

auto Origin::effective_port() const -> std::string
{
    if (!port.empty()) {
        return port;
    }
    return scheme == "https" ? "443" : "80";
}

// ---------------------------------------------------------------------------
// parse_origin
//   scheme "://" authority [path] ["?" query]
// ---------------------------------------------------------------------------
auto parse_origin(std::string_view url) -> std::expected<Origin, ProxyError>
{
    if (url.empty()) {
        return std::unexpected(config_error("origin url is empty", url));
    }
    if (url.find('#') != std::string_view::npos) {
        return std::unexpected(config_error("origin url must not contain a fragment", url));
    }

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(config_error("origin url has no scheme", url));
    }

    Origin origin{};
    origin.scheme = to_lower(url.substr(0, scheme_end));
    if (origin.scheme != "http" && origin.scheme != "https") {
        return std::unexpected(config_error("unsupported origin scheme '" + origin.scheme + "'", url));
    }

    std::string_view rest = url.substr(scheme_end + 3);

    // query 분리
    if (const auto q = rest.find('?'); q != std::string_view::npos) {
        origin.raw_query = std::string{rest.substr(q + 1)};
        rest             = rest.substr(0, q);
    }

    // authority / path 분리
    std::string_view authority = rest;
    if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
        authority        = rest.substr(0, slash);
        origin.base_path = std::string{rest.substr(slash)};
    }

    if (authority.find('@') != std::string_view::npos) {
        return std::unexpected(config_error("origin url must not carry user info", url));
    }

    std::string_view port_part{};
    if (!authority.empty() && authority.front() == '[') {
        // IPv6: [::1]:8080
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected(config_error("unterminated IPv6 literal", url));
        }
        origin.host = std::string{authority.substr(1, close - 1)};
        const auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return std::unexpected(config_error("unexpected characters after IPv6 literal", url));
            }
            port_part = tail.substr(1);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        origin.host = std::string{authority.substr(0, colon)};
        port_part   = authority.substr(colon + 1);
    } else {
        origin.host = std::string{authority};
    }

    if (origin.host.empty()) {
        return std::unexpected(config_error("origin url has no host", url));
    }

    if (!port_part.empty()) {
        unsigned int value{0};
        const auto* begin = port_part.data();
        const auto* end   = port_part.data() + port_part.size();
        auto [ptr, ec]    = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end || value == 0 || value > 65535) {
            return std::unexpected(config_error("invalid origin port '" + std::string{port_part} + "'", url));
        }
        origin.port = std::string{port_part};
    }

    return origin;
}

auto join_origin_path(std::string_view base_path, std::string_view request_path)
    -> std::string
{
    if (base_path.empty()) {
        return request_path.empty() ? std::string{"/"} : std::string{request_path};
    }

    const bool base_slash = base_path.back() == '/';
    const bool req_slash  = !request_path.empty() && request_path.front() == '/';

    std::string out{base_path};
    if (base_slash && req_slash) {
        out.append(request_path.substr(1));
    } else if (!base_slash && !req_slash && !request_path.empty()) {
        out += '/';
        out.append(request_path);
    } else {
        out.append(request_path);
    }
    return out;
}
