#include "router/route.hpp"

#include <utility>

auto Route::with_rewrite_path(std::string target) const -> Route
{
    Route copy{*this};
    copy.rewrite_path = std::move(target);
    return copy;
}

auto Route::with_request_headers(HeaderMap headers) const -> Route
{
    Route copy{*this};
    copy.request_headers = std::move(headers);
    return copy;
}

auto Route::with_response_modifier(ResponseModifier modifier) const -> Route
{
    Route copy{*this};
    copy.response_modifier = std::move(modifier);
    return copy;
}

auto parse_methods(std::string_view methods) -> std::vector<std::string>
{
    if (methods == "*") {
        return {"GET", "HEAD", "OPTIONS", "POST", "PUT", "PATCH", "DELETE"};
    }

    std::vector<std::string> out;
    while (true) {
        const auto bar = methods.find('|');
        out.emplace_back(methods.substr(0, bar));
        if (bar == std::string_view::npos) {
            break;
        }
        methods.remove_prefix(bar + 1);
    }
    return out;
}

auto make_route(std::string_view methods, std::string_view path) -> Route
{
    Route route{};
    route.methods = parse_methods(methods);
    route.path    = std::string{path};
    return route;
}

auto wildcard_path_under(std::string_view prefix) -> std::string
{
    std::string out;
    out.reserve(prefix.size() + 6);
    for (const char c : prefix) {
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out += c;
    }
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    return out + "/*path";
}
