#include "proxy/reverse_proxy.hpp"

#include "router/path_pattern.hpp"
#include "transport/http_transport.hpp"

#include <boost/beast/http/field.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace asio = boost::asio;
namespace http = boost::beast::http;

// ---------------------------------------------------------------------------
// ReverseProxy 구현
//
// dispatch 흐름:
//   1. split_target → Router::match
//   2. kNotFound / kMethodNotAllowed → 훅 또는 기본 응답, 종료
//   3. prepare_outgoing: X-Forwarded-* / Host / rewrite / target / 헤더 병합
//   4. Transport::round_trip (co_await)
//   5. apply_modifiers: global → route (ResponseModifierIndex)
//   6. relay_response
//
// serve 는 dispatch 를 감싸 LoadGuard, 예외 회수, 오류 훅, 접근 로그를 담당한다.
// ---------------------------------------------------------------------------

namespace {

[[nodiscard]] auto bsv(std::string_view sv) -> boost::beast::string_view
{
    return boost::beast::string_view{sv.data(), sv.size()};
}

void write_text(ResponseSink& sink, http::status status, std::string_view body)
{
    sink.header().set(http::field::content_type, "text/plain; charset=utf-8");
    sink.header().set("X-Content-Type-Options", "nosniff");
    sink.write_header(status);
    sink.write(body);
}

// 기본 오류 응답: upstream 쪽 실패는 502, 프록시 내부 실패는 500
void write_default_error(ResponseSink& sink, const ProxyError& error)
{
    switch (error.code) {
        case ProxyErrorCode::kTransport:
        case ProxyErrorCode::kModifier:
            write_text(sink, http::status::bad_gateway, "Bad Gateway");
            return;
        default:
            write_text(sink, http::status::internal_server_error, "Internal Server Error");
            return;
    }
}

// modifier 가 라우팅/설정 단계의 코드를 돌려주면 kModifier 로 분류한다
[[nodiscard]] auto classify_modifier_error(ProxyError error) -> ProxyError
{
    switch (error.code) {
        case ProxyErrorCode::kConfiguration:
        case ProxyErrorCode::kRouteNotFound:
        case ProxyErrorCode::kMethodNotAllowed:
            error.code = ProxyErrorCode::kModifier;
            break;
        default:
            break;
    }
    return error;
}

[[nodiscard]] auto configuration_error(std::string message, std::string context) -> ProxyError
{
    return ProxyError{ProxyErrorCode::kConfiguration, std::move(message), std::move(context)};
}

[[nodiscard]] auto merge_query(const std::string& origin_query, const std::string& request_query)
    -> std::string
{
    if (origin_query.empty() || request_query.empty()) {
        return origin_query + request_query;
    }
    return origin_query + "&" + request_query;
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성
// ---------------------------------------------------------------------------
auto ReverseProxy::create(std::string_view           origin_url,
                          DispatchOptions            options,
                          std::shared_ptr<Transport> transport)
    -> std::expected<std::unique_ptr<ReverseProxy>, ProxyError>
{
    auto origin = parse_origin(origin_url);
    if (!origin) {
        spdlog::error("[proxy] invalid origin '{}': {}", origin_url, origin.error().message);
        return std::unexpected(origin.error());
    }

    if (!transport) {
        transport = std::make_shared<HttpTransport>(*origin);
    }

    spdlog::info("[proxy] dispatching to {}://{}{}",
                 origin->scheme, origin->authority(), origin->base_path);

    return std::unique_ptr<ReverseProxy>(
        new ReverseProxy(std::move(*origin), std::move(options), std::move(transport)));
}

ReverseProxy::ReverseProxy(Origin origin, DispatchOptions options, std::shared_ptr<Transport> transport)
    : origin_{std::move(origin)}
    , options_{std::move(options)}
    , transport_{std::move(transport)}
    , health_{std::make_unique<HealthMonitor>(origin_, options_.health_check, options_.health_check_period)}
{}

ReverseProxy::~ReverseProxy()
{
    stop_health_check();
}

// ---------------------------------------------------------------------------
// 라우트 등록
// ---------------------------------------------------------------------------
auto ReverseProxy::handle_path(Route route) -> std::expected<void, ProxyError>
{
    if (serving_.load(std::memory_order_acquire)) {
        return std::unexpected(configuration_error(
            "routes cannot be registered after serving started", route.path));
    }
    if (route.methods.empty()) {
        return std::unexpected(configuration_error("route has no methods", route.path));
    }
    for (const auto& method : route.methods) {
        if (method.empty()) {
            return std::unexpected(configuration_error("empty method token", route.path));
        }
    }

    // 패턴 오류는 어떤 메서드 트리에도 넣기 전에 걸러진다
    if (auto pattern = PathPattern::parse(route.path); !pattern) {
        return std::unexpected(pattern.error());
    }

    const auto shared = std::make_shared<const Route>(std::move(route));
    for (const auto& method : shared->methods) {
        auto inserted = router_.insert(method, shared);
        if (!inserted) {
            return std::unexpected(inserted.error());
        }
        // 파라미터 이름만 다른 패턴으로 교체되면 이전 키를 지운다
        if (const auto& replaced = *inserted; replaced && replaced->path != shared->path) {
            modifiers_.erase(RouteKey{method, replaced->path});
        }
        modifiers_.assign(RouteKey{method, shared->path}, shared->response_modifier);
    }

    spdlog::debug("[proxy] registered {} methods for {}", shared->methods.size(), shared->path);
    return {};
}

auto ReverseProxy::pass_path(std::string_view methods, std::string_view path)
    -> std::expected<void, ProxyError>
{
    return handle_path(make_route(methods, path));
}

auto ReverseProxy::pass_paths(std::string_view methods, const std::vector<std::string>& paths)
    -> std::expected<void, ProxyError>
{
    for (const auto& path : paths) {
        if (auto result = pass_path(methods, path); !result) {
            return result;
        }
    }
    return {};
}

auto ReverseProxy::pass_any_path(std::string_view methods) -> std::expected<void, ProxyError>
{
    return pass_path(methods, "/*path");
}

auto ReverseProxy::pass_any_path_under(std::string_view                methods,
                                       const std::vector<std::string>& prefixes)
    -> std::expected<void, ProxyError>
{
    for (const auto& prefix : prefixes) {
        if (auto result = pass_path(methods, wildcard_path_under(prefix)); !result) {
            return result;
        }
    }
    return {};
}

auto ReverseProxy::rewrite_path(std::string_view methods,
                                std::string_view path,
                                std::string_view rewrite) -> std::expected<void, ProxyError>
{
    return handle_path(make_route(methods, path).with_rewrite_path(std::string{rewrite}));
}

// ---------------------------------------------------------------------------
// serve
// ---------------------------------------------------------------------------
auto ReverseProxy::serve(ProxyRequest request, ResponseSink& sink) -> asio::awaitable<void>
{
    serving_.store(true, std::memory_order_release);
    LoadGuard guard{load_};

    sink.set_head_request(request.message.method() == http::verb::head);

    const auto received_at = std::chrono::system_clock::now();
    const auto started     = std::chrono::steady_clock::now();

    DispatchTrace                   trace;
    std::expected<void, ProxyError> result;
    try {
        result = co_await dispatch(request, sink, trace);
    } catch (const std::exception& e) {
        result = std::unexpected(ProxyError{ProxyErrorCode::kInternalFault, e.what(), "dispatch"});
    } catch (...) {
        result = std::unexpected(
            ProxyError{ProxyErrorCode::kInternalFault, "unknown exception", "dispatch"});
    }

    if (!result) {
        handle_error(sink, request, result.error());
    }

    if (options_.logger) {
        AccessLog entry{};
        entry.method          = std::string{to_std(request.message.method_string())};
        entry.target          = std::string{to_std(request.message.target())};
        entry.host            = std::string{to_std(request.message[http::field::host])};
        entry.client_ip       = request.remote_address;
        entry.route_path      = std::move(trace.route_path);
        entry.upstream_target = std::move(trace.upstream_target);
        entry.status          = static_cast<unsigned>(sink.status());
        entry.timestamp       = received_at;
        entry.duration        = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        options_.logger->log_access(entry);
    }
}

auto ReverseProxy::dispatch(const ProxyRequest& request, ResponseSink& sink, DispatchTrace& trace)
    -> asio::awaitable<std::expected<void, ProxyError>>
{
    const auto method = std::string{to_std(request.message.method_string())};
    const auto target = split_target(to_std(request.message.target()));

    auto match = router_.match(method, target.path);
    if (match.status == MatchStatus::kNotFound) {
        not_found(sink, request);
        co_return std::expected<void, ProxyError>{};
    }
    if (match.status == MatchStatus::kMethodNotAllowed) {
        method_not_allowed(sink, request, match.allowed_methods);
        co_return std::expected<void, ProxyError>{};
    }

    const Route& route = *match.route;
    trace.route_path   = route.path;

    auto outgoing = prepare_outgoing(request, route, match.params, target);
    if (!outgoing) {
        co_return std::unexpected(outgoing.error());
    }
    trace.upstream_target = std::string{to_std(outgoing->target())};

    auto response = co_await transport_->round_trip(std::move(*outgoing));
    if (!response) {
        co_return std::unexpected(response.error());
    }

    if (auto modified = apply_modifiers(method, route, *response); !modified) {
        co_return std::unexpected(modified.error());
    }

    relay_response(*response, sink);
    co_return std::expected<void, ProxyError>{};
}

// ---------------------------------------------------------------------------
// prepare_outgoing
//   1. 원본 요청 복사
//   2. X-Forwarded-Proto / X-Forwarded-Host / X-Forwarded-For
//   3. Host = origin authority
//   4. rewrite (캡처 치환) → base_path 결합 → query 병합
//   5. 전역 헤더 → 라우트 헤더 병합 (whole-value replace)
//   6. hop-by-hop 헤더 제거
// ---------------------------------------------------------------------------
auto ReverseProxy::prepare_outgoing(const ProxyRequest&  request,
                                    const Route&         route,
                                    const PathParams&    params,
                                    const RequestTarget& target) const
    -> std::expected<HttpRequest, ProxyError>
{
    HttpRequest outgoing = request.message;

    const std::string original_host{to_std(request.message[http::field::host])};
    outgoing.set("X-Forwarded-Proto", request.scheme);
    outgoing.set("X-Forwarded-Host", original_host);

    if (!request.remote_address.empty()) {
        std::string forwarded_for;
        for (const auto& prior : header_values(outgoing, "X-Forwarded-For")) {
            forwarded_for += prior;
            forwarded_for += ", ";
        }
        forwarded_for += request.remote_address;
        outgoing.set("X-Forwarded-For", forwarded_for);
    }

    outgoing.set(http::field::host, origin_.authority());

    std::string path = target.path;
    if (!route.rewrite_path.empty()) {
        auto pattern = PathPattern::parse(route.rewrite_path);
        if (!pattern) {
            return std::unexpected(ProxyError{
                ProxyErrorCode::kRewrite,
                "invalid rewrite target: " + pattern.error().message,
                route.rewrite_path
            });
        }
        auto expanded = pattern->expand(params);
        if (!expanded) {
            return std::unexpected(expanded.error());
        }
        path = std::move(*expanded);
    }

    std::string upstream_target = join_origin_path(origin_.base_path, path);
    if (const auto query = merge_query(origin_.raw_query, target.query); !query.empty()) {
        upstream_target += '?';
        upstream_target += query;
    }
    outgoing.target(bsv(upstream_target));

    merge_request_headers(outgoing, {&options_.request_headers, &route.request_headers});
    remove_hop_by_hop_headers(outgoing);

    return outgoing;
}

auto ReverseProxy::apply_modifiers(std::string_view method,
                                   const Route&     route,
                                   HttpResponse&    response) const
    -> std::expected<void, ProxyError>
{
    if (options_.modify_response) {
        if (auto result = options_.modify_response(response); !result) {
            return std::unexpected(classify_modifier_error(std::move(result.error())));
        }
    }

    const auto* route_modifier = modifiers_.find(RouteKey{std::string{method}, route.path});
    if (route_modifier != nullptr) {
        if (auto result = (*route_modifier)(response); !result) {
            return std::unexpected(classify_modifier_error(std::move(result.error())));
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// 라우팅 실패 / 오류 응답
// ---------------------------------------------------------------------------
void ReverseProxy::not_found(ResponseSink& sink, const ProxyRequest& request) const
{
    if (options_.not_found_handler) {
        try {
            options_.not_found_handler(sink, request);
            return;
        } catch (const std::exception& e) {
            spdlog::error("[proxy] not-found handler threw: {}", e.what());
        } catch (...) {
            spdlog::error("[proxy] not-found handler threw a non-standard exception");
        }
    }
    write_text(sink, http::status::not_found, "404 page not found");
}

void ReverseProxy::method_not_allowed(ResponseSink&                   sink,
                                      const ProxyRequest&             request,
                                      const std::vector<std::string>& allowed) const
{
    std::string allow;
    for (const auto& method : allowed) {
        if (!allow.empty()) {
            allow += ", ";
        }
        allow += method;
    }
    sink.header().set(http::field::allow, allow);

    if (options_.method_not_allowed_handler) {
        try {
            options_.method_not_allowed_handler(sink, request);
            return;
        } catch (const std::exception& e) {
            spdlog::error("[proxy] method-not-allowed handler threw: {}", e.what());
        } catch (...) {
            spdlog::error("[proxy] method-not-allowed handler threw a non-standard exception");
        }
    }
    write_text(sink, http::status::method_not_allowed, "Method Not Allowed");
}

void ReverseProxy::handle_error(ResponseSink&       sink,
                                const ProxyRequest& request,
                                const ProxyError&   error) const
{
    const auto method = to_std(request.message.method_string());
    const auto target = to_std(request.message.target());

    spdlog::warn("[proxy] {} {} failed ({}): {} [{}]",
                 method, target, to_string(error.code), error.message, error.context);

    if (options_.logger) {
        ErrorLog entry{};
        entry.method    = std::string{method};
        entry.target    = std::string{target};
        entry.client_ip = request.remote_address;
        entry.code      = std::string{to_string(error.code)};
        entry.message   = error.message;
        entry.context   = error.context;
        entry.timestamp = std::chrono::system_clock::now();
        options_.logger->log_error(entry);
    }

    if (options_.error_handler) {
        try {
            options_.error_handler(sink, request, error);
            return;
        } catch (const std::exception& e) {
            spdlog::error("[proxy] error handler threw: {}", e.what());
        } catch (...) {
            spdlog::error("[proxy] error handler threw a non-standard exception");
        }
    }
    write_default_error(sink, error);
}

// ---------------------------------------------------------------------------
// 헬스 / 부하
// ---------------------------------------------------------------------------
auto ReverseProxy::is_available() const -> bool
{
    return health_->is_available();
}

void ReverseProxy::set_health_check_func(HealthCheckFunc check, std::chrono::milliseconds period)
{
    health_->set_check_func(std::move(check), period);
}

void ReverseProxy::stop_health_check()
{
    health_->stop();
}

// ---------------------------------------------------------------------------
// relay_response
// ---------------------------------------------------------------------------
void relay_response(HttpResponse& response, ResponseSink& sink)
{
    remove_hop_by_hop_headers(response);

    auto& out = sink.header();
    for (const auto& field : response) {
        out.insert(field.name_string(), field.value());
    }
    sink.write_header(static_cast<http::status>(response.result_int()));
    sink.write(response.body());
}
