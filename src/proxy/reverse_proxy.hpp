#pragma once

#include "common/origin.hpp"
#include "common/types.hpp"
#include "health/health_monitor.hpp"
#include "http/header_merge.hpp"
#include "http/message.hpp"
#include "logger/structured_logger.hpp"
#include "router/modifier_index.hpp"
#include "router/route.hpp"
#include "router/router.hpp"
#include "stats/load_counter.hpp"
#include "transport/transport.hpp"

#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// 훅 타입
//   ErrorHandler   : 요청 단위 오류 (kRewrite / kModifier / kTransport /
//                    kInternalFault) 를 응답으로 변환한다.
//   RequestHandler : 라우팅 실패 (404 / 405) 응답을 작성한다.
//
//   훅이 예외를 던지면 로그를 남기고 기본 응답으로 대체한다.
// ---------------------------------------------------------------------------
using ErrorHandler   = std::function<void(ResponseSink&, const ProxyRequest&, const ProxyError&)>;
using RequestHandler = std::function<void(ResponseSink&, const ProxyRequest&)>;

// ---------------------------------------------------------------------------
// DispatchOptions
//   디스패처 전역 설정. create() 에 한 번 넘기고 이후 변경하지 않는다.
//
//   request_headers     : 모든 전달 요청에 덮어쓸 헤더 (라우트 헤더보다 먼저 적용)
//   modify_response     : 라우트 modifier 보다 먼저 실행되는 전역 modifier
//   error_handler       : 비어 있으면 502 / 500 기본 응답
//   not_found_handler   : 비어 있으면 404 "404 page not found"
//   method_not_allowed_handler : 비어 있으면 405 + Allow 헤더
//   health_check        : 비어 있으면 tcp_probe
//   health_check_period : 0 이하이면 기본 주기 (10s)
//   logger              : 접근/오류 JSON 로그 (선택)
// ---------------------------------------------------------------------------
struct DispatchOptions {
    HeaderMap                         request_headers{};
    ResponseModifier                  modify_response{};
    ErrorHandler                      error_handler{};
    RequestHandler                    not_found_handler{};
    RequestHandler                    method_not_allowed_handler{};
    HealthCheckFunc                   health_check{};
    std::chrono::milliseconds         health_check_period{kDefaultHealthCheckPeriod};
    std::shared_ptr<StructuredLogger> logger{};
};

// ---------------------------------------------------------------------------
// ReverseProxy
//   단일 origin 리버스 프록시 디스패처.
//
//   요청 처리 단계 (serve):
//     Received → Matched → HeadersPrepared → Rewritten → Forwarded
//       → ModifiersApplied → Sent
//     Matched 이후 어느 단계에서든 NotFound / MethodNotAllowed / Errored 로 종료.
//
//   소유권:
//     Router, ResponseModifierIndex, HealthMonitor, LoadCounter 를 단독 소유한다.
//
//   스레드 안전성:
//     - 라우트 등록은 서빙 시작 전에만 허용된다 (첫 serve() 이후 kConfiguration).
//     - 서빙 중 Router / 인덱스 / options 는 읽기 전용이므로 락이 없다.
//     - load() / is_available() 은 언제든 호출 가능하다.
// ---------------------------------------------------------------------------
class ReverseProxy {
public:
    // create
    //   origin_url 을 파싱하고 헬스 모니터를 시작한다 (첫 probe 동기 실행).
    //   transport 가 nullptr 이면 HttpTransport 를 사용한다.
    //   잘못된 URL 은 kConfiguration.
    [[nodiscard]] static auto create(std::string_view           origin_url,
                                     DispatchOptions            options   = {},
                                     std::shared_ptr<Transport> transport = nullptr)
        -> std::expected<std::unique_ptr<ReverseProxy>, ProxyError>;

    ~ReverseProxy();

    ReverseProxy(const ReverseProxy&)            = delete;
    ReverseProxy& operator=(const ReverseProxy&) = delete;

    // -----------------------------------------------------------------------
    // 라우트 등록
    //   모두 handle_path() 위의 편의 함수다.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto handle_path(Route route) -> std::expected<void, ProxyError>;

    [[nodiscard]] auto pass_path(std::string_view methods, std::string_view path)
        -> std::expected<void, ProxyError>;

    [[nodiscard]] auto pass_paths(std::string_view methods, const std::vector<std::string>& paths)
        -> std::expected<void, ProxyError>;

    // "/*path"
    [[nodiscard]] auto pass_any_path(std::string_view methods) -> std::expected<void, ProxyError>;

    // 각 prefix 에 대해 "<prefix>/*path"
    [[nodiscard]] auto pass_any_path_under(std::string_view                methods,
                                           const std::vector<std::string>& prefixes)
        -> std::expected<void, ProxyError>;

    [[nodiscard]] auto rewrite_path(std::string_view methods,
                                    std::string_view path,
                                    std::string_view rewrite) -> std::expected<void, ProxyError>;

    // serve
    //   요청 1건을 처리해 sink 에 응답을 작성한다. 예외를 던지지 않는다.
    //   sink 는 코루틴이 끝날 때까지 유효해야 한다.
    auto serve(ProxyRequest request, ResponseSink& sink) -> boost::asio::awaitable<void>;

    // -----------------------------------------------------------------------
    // 헬스 / 부하
    // -----------------------------------------------------------------------
    [[nodiscard]] auto is_available() const -> bool;

    void set_health_check_func(HealthCheckFunc check, std::chrono::milliseconds period);
    void stop_health_check();

    [[nodiscard]] auto load() const noexcept -> std::int64_t { return load_.get(); }
    [[nodiscard]] auto origin() const noexcept -> const Origin& { return origin_; }
    [[nodiscard]] auto route_count() const noexcept -> std::size_t { return router_.size(); }
    [[nodiscard]] auto modifier_count() const noexcept -> std::size_t { return modifiers_.size(); }

private:
    ReverseProxy(Origin origin, DispatchOptions options, std::shared_ptr<Transport> transport);

    // 접근 로그용 dispatch 결과
    struct DispatchTrace {
        std::string route_path{};
        std::string upstream_target{};
    };

    auto dispatch(const ProxyRequest& request, ResponseSink& sink, DispatchTrace& trace)
        -> boost::asio::awaitable<std::expected<void, ProxyError>>;

    // 이 요청을 origin 으로 보낼 전달용 요청을 만든다 (헤더 / rewrite / target).
    [[nodiscard]] auto prepare_outgoing(const ProxyRequest& request,
                                        const Route&        route,
                                        const PathParams&   params,
                                        const RequestTarget& target) const
        -> std::expected<HttpRequest, ProxyError>;

    [[nodiscard]] auto apply_modifiers(std::string_view method,
                                       const Route&     route,
                                       HttpResponse&    response) const
        -> std::expected<void, ProxyError>;

    void not_found(ResponseSink& sink, const ProxyRequest& request) const;
    void method_not_allowed(ResponseSink& sink, const ProxyRequest& request,
                            const std::vector<std::string>& allowed) const;
    void handle_error(ResponseSink& sink, const ProxyRequest& request, const ProxyError& error) const;

    Origin                     origin_;
    DispatchOptions            options_;
    std::shared_ptr<Transport> transport_;

    Router                router_;
    ResponseModifierIndex modifiers_;
    LoadCounter           load_;
    std::atomic<bool>     serving_{false};

    // 마지막 멤버: 소멸 시 가장 먼저 루프를 정지한다
    std::unique_ptr<HealthMonitor> health_;
};

// ---------------------------------------------------------------------------
// relay_response
//   upstream 응답의 hop-by-hop 헤더를 제거하고 상태 / 헤더 / body 를 sink 로 복사한다.
// ---------------------------------------------------------------------------
void relay_response(HttpResponse& response, ResponseSink& sink);
