#include "router/path_pattern.hpp"

#include <algorithm>
#include <utility>

namespace {

[[nodiscard]] ProxyError pattern_error(ProxyErrorCode code,
                                       std::string message,
                                       std::string_view pattern)
{
    return ProxyError{code, std::move(message), std::string{pattern}};
}

}  // namespace

auto find_param(const PathParams& params, std::string_view name)
    -> std::optional<std::string_view>
{
    const auto it = std::find_if(params.begin(), params.end(),
                                 [name](const PathParam& p) { return p.name == name; });
    if (it == params.end()) {
        return std::nullopt;
    }
    return std::string_view{it->value};
}

auto split_path(std::string_view path) -> std::vector<std::string_view>
{
    std::vector<std::string_view> out;
    if (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    while (true) {
        const auto slash = path.find('/');
        out.push_back(path.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return out;
}

// ---------------------------------------------------------------------------
// PathPattern::parse
//
//   구조 오류 (kConfiguration):
//     - '/' 로 시작하지 않음
//     - ':' / '*' 뒤 이름이 비어 있음
//     - 세그먼트 중간에 ':' 또는 '*' 등장
//     - wildcard 가 마지막 세그먼트가 아님
//     - 같은 파라미터 이름 중복
// ---------------------------------------------------------------------------
auto PathPattern::parse(std::string_view pattern) -> std::expected<PathPattern, ProxyError>
{
    constexpr auto kCode = ProxyErrorCode::kConfiguration;

    if (pattern.empty() || pattern.front() != '/') {
        return std::unexpected(pattern_error(kCode, "path pattern must begin with '/'", pattern));
    }

    PathPattern out{};
    out.text_ = std::string{pattern};

    const auto parts = split_path(pattern);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const std::string_view part = parts[i];

        if (!part.empty() && (part.front() == ':' || part.front() == '*')) {
            const bool        wildcard = part.front() == '*';
            const std::string name{part.substr(1)};

            if (name.empty()) {
                return std::unexpected(pattern_error(
                    kCode, "parameter name must not be empty", pattern));
            }
            if (name.find_first_of(":*") != std::string::npos) {
                return std::unexpected(pattern_error(
                    kCode, "only one parameter per path segment is allowed", pattern));
            }
            if (wildcard && i + 1 != parts.size()) {
                return std::unexpected(pattern_error(
                    kCode, "wildcard '*" + name + "' must be the last path segment", pattern));
            }
            const bool duplicate = std::any_of(
                out.segments_.begin(), out.segments_.end(),
                [&name](const PathSegment& s) {
                    return s.kind != SegmentKind::kLiteral && s.text == name;
                });
            if (duplicate) {
                return std::unexpected(pattern_error(
                    kCode, "duplicate parameter name '" + name + "'", pattern));
            }

            out.segments_.push_back(PathSegment{
                wildcard ? SegmentKind::kWildcard : SegmentKind::kParam,
                name
            });
            continue;
        }

        if (part.find_first_of(":*") != std::string_view::npos) {
            return std::unexpected(pattern_error(
                kCode, "parameters must start a path segment", pattern));
        }
        out.segments_.push_back(PathSegment{SegmentKind::kLiteral, std::string{part}});
    }

    return out;
}

// ---------------------------------------------------------------------------
// PathPattern::match
//   wildcard 앞까지 세그먼트 수가 맞아야 하며, wildcard 는 나머지를
//   (빈 문자열 포함) 통째로 캡처한다.
// ---------------------------------------------------------------------------
auto PathPattern::match(std::string_view request_path) const -> std::optional<PathParams>
{
    if (request_path.empty() || request_path.front() != '/') {
        return std::nullopt;
    }

    const auto parts = split_path(request_path);
    PathParams params;

    std::size_t i = 0;
    for (const auto& seg : segments_) {
        if (seg.kind == SegmentKind::kWildcard) {
            // 나머지 세그먼트를 '/' 로 다시 이어 붙인다
            std::string rest;
            for (std::size_t j = i; j < parts.size(); ++j) {
                if (j > i) {
                    rest += '/';
                }
                rest.append(parts[j]);
            }
            params.push_back(PathParam{seg.text, std::move(rest)});
            return params;
        }

        if (i >= parts.size()) {
            return std::nullopt;
        }

        if (seg.kind == SegmentKind::kLiteral) {
            if (parts[i] != seg.text) {
                return std::nullopt;
            }
        } else {
            if (parts[i].empty()) {
                return std::nullopt;
            }
            params.push_back(PathParam{seg.text, std::string{parts[i]}});
        }
        ++i;
    }

    if (i != parts.size()) {
        return std::nullopt;
    }
    return params;
}

// ---------------------------------------------------------------------------
// PathPattern::expand
//   대상 패턴의 파라미터 세그먼트를 캡처 값으로 치환한다.
//   캡처되지 않은 이름을 참조하면 kRewrite.
// ---------------------------------------------------------------------------
auto PathPattern::expand(const PathParams& params) const -> std::expected<std::string, ProxyError>
{
    std::string out;
    for (const auto& seg : segments_) {
        out += '/';
        if (seg.kind == SegmentKind::kLiteral) {
            out += seg.text;
            continue;
        }

        const auto value = find_param(params, seg.text);
        if (!value) {
            return std::unexpected(pattern_error(
                ProxyErrorCode::kRewrite,
                "rewrite target references unknown parameter '" + seg.text + "'",
                text_));
        }
        out.append(*value);
    }
    return out.empty() ? std::string{"/"} : out;
}
