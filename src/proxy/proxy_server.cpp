#include "proxy/proxy_server.hpp"

#include "config/route_config_loader.hpp"
#include "transport/http_transport.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <utility>

// ---------------------------------------------------------------------------
// ProxyServer 구현
//
// run() 흐름:
//   1. io_ctx_ 저장
//   2. RouteConfigLoader::load(config_.routes_path)
//   3. origin 결정 (ORIGIN_URL > routes 파일)
//   4. logger_ 생성, ReverseProxy::create + apply_route_config
//   5. status_endpoint_ + co_spawn(run)
//   6. SIGTERM/SIGINT 핸들러
//   7. acceptor 바인딩 + co_spawn(accept_loop)
//
// stop() 흐름:
//   1. stopping_ = true
//   2. acceptor / status endpoint close, 헬스 모니터 정지
//   3. 활성 세션 각각 session->close()
//   4. 세션 0개이면 io_ctx_->stop()
// ---------------------------------------------------------------------------

namespace {

constexpr std::uint32_t kDefaultTimeoutSec = 30;

// 0 은 "설정 안 됨" 으로 보고 기본값을 쓴다
[[nodiscard]] std::chrono::seconds timeout_or_default(std::uint32_t seconds)
{
    return std::chrono::seconds{seconds > 0 ? seconds : kDefaultTimeoutSec};
}

void log_spawn_error(const char* what, std::exception_ptr eptr)
{
    if (!eptr) {
        return;
    }
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        spdlog::error("[server] {} error: {}", what, e.what());
    } catch (...) {
        spdlog::error("[server] {} error: non-standard exception", what);
    }
}

}  // namespace

ProxyServer::ProxyServer(ProxyConfig config)
    : config_{std::move(config)}
{}

// ---------------------------------------------------------------------------
// ProxyServer::run
// ---------------------------------------------------------------------------
auto ProxyServer::run(boost::asio::io_context& io_ctx) -> std::expected<void, std::string>
{
    io_ctx_ = &io_ctx;

    // -----------------------------------------------------------------------
    // 1. 라우트 설정 로드
    // -----------------------------------------------------------------------
    auto loaded = RouteConfigLoader::load(config_.routes_path);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    RouteConfig routes = std::move(*loaded);

    // -----------------------------------------------------------------------
    // 2. origin 결정
    // -----------------------------------------------------------------------
    const std::string origin_url = config_.origin_url.empty() ? routes.origin : config_.origin_url;
    if (origin_url.empty()) {
        return std::unexpected(std::string{"no origin configured (set ORIGIN_URL or 'origin' in routes file)"});
    }

    auto origin = parse_origin(origin_url);
    if (!origin) {
        return std::unexpected("invalid origin '" + origin_url + "': " + origin.error().message);
    }

    // -----------------------------------------------------------------------
    // 3. logger + ReverseProxy
    // -----------------------------------------------------------------------
    try {
        logger_ = std::make_shared<StructuredLogger>(parse_log_level(config_.log_level),
                                                     config_.log_path);
    } catch (const std::runtime_error& e) {
        return std::unexpected(std::string{e.what()});
    }

    DispatchOptions options = make_dispatch_options(routes);
    options.logger          = logger_;

    auto transport = std::make_shared<HttpTransport>(
        *origin, timeout_or_default(config_.upstream_timeout_sec));

    auto created = ReverseProxy::create(origin_url, std::move(options), std::move(transport));
    if (!created) {
        return std::unexpected(created.error().message);
    }
    proxy_ = std::move(*created);

    if (auto applied = apply_route_config(*proxy_, routes); !applied) {
        return std::unexpected(applied.error().message + " (" + applied.error().context + ")");
    }

    // -----------------------------------------------------------------------
    // 4. StatusEndpoint 생성 + co_spawn
    // -----------------------------------------------------------------------
    try {
        std::weak_ptr<ReverseProxy> weak_proxy = proxy_;
        status_endpoint_ = std::make_unique<StatusEndpoint>(
            config_.status_port,
            [weak_proxy]() {
                OriginStatus status{};
                if (const auto proxy = weak_proxy.lock()) {
                    status.origin    = proxy->origin().authority();
                    status.available = proxy->is_available();
                    status.load      = proxy->load();
                }
                return status;
            },
            io_ctx
        );
    } catch (const boost::system::system_error& e) {
        return std::unexpected("cannot bind status port " + std::to_string(config_.status_port)
                               + ": " + e.what());
    }

    boost::asio::co_spawn(
        io_ctx,
        status_endpoint_->run(),
        [](std::exception_ptr eptr) { log_spawn_error("status endpoint", eptr); }
    );

    // -----------------------------------------------------------------------
    // 5. 시그널 핸들러: SIGTERM / SIGINT → stop()
    // -----------------------------------------------------------------------
    signals_ = std::make_unique<boost::asio::signal_set>(io_ctx, SIGTERM, SIGINT);
    signals_->async_wait(
        [this](const boost::system::error_code& ec, int /*signum*/) {
            if (!ec) {
                spdlog::info("[server] shutdown signal received");
                stop();
            }
        }
    );

    // -----------------------------------------------------------------------
    // 6. acceptor 바인딩 + accept 루프
    // -----------------------------------------------------------------------
    try {
        const auto listen_addr = boost::asio::ip::make_address(config_.listen_address);
        const auto listen_ep   = boost::asio::ip::tcp::endpoint{listen_addr, config_.listen_port};

        acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_ctx);
        acceptor_->open(listen_ep.protocol());
        acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_->bind(listen_ep);
        acceptor_->listen();
    } catch (const boost::system::system_error& e) {
        return std::unexpected("cannot listen on " + config_.listen_address + ":"
                               + std::to_string(config_.listen_port) + ": " + e.what());
    }

    spdlog::info("[server] listening on {}:{} -> {}",
                 config_.listen_address, listen_port(), origin_url);

    boost::asio::co_spawn(
        io_ctx,
        accept_loop(),
        [](std::exception_ptr eptr) { log_spawn_error("accept loop", eptr); }
    );

    return {};
}

// ---------------------------------------------------------------------------
// accept_loop
// ---------------------------------------------------------------------------
boost::asio::awaitable<void> ProxyServer::accept_loop()
{
    const auto idle_timeout = timeout_or_default(config_.connection_timeout_sec);

    while (!stopping_) {
        boost::system::error_code ec;
        auto client_sock = co_await acceptor_->async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );

        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                spdlog::info("[server] acceptor closed");
                break;
            }
            if (!stopping_) {
                spdlog::warn("[server] accept error: {}", ec.message());
            }
            continue;
        }

        if (stopping_) {
            boost::system::error_code close_ec;
            client_sock.close(close_ec);
            continue;
        }

        const std::uint64_t sid = next_session_id_.fetch_add(1, std::memory_order_relaxed);

        auto session = std::make_shared<Session>(sid, std::move(client_sock), proxy_, idle_timeout);
        sessions_.emplace(sid, session);

        spdlog::debug("[server] new session {}", sid);

        // 세션 코루틴 spawn, 완료 시 sessions_ 에서 제거
        boost::asio::co_spawn(
            *io_ctx_,
            session->run(),
            [this, sid](std::exception_ptr eptr) {
                log_spawn_error("session", eptr);

                sessions_.erase(sid);
                spdlog::debug("[server] session {} removed (active: {})", sid, sessions_.size());

                if (stopping_ && sessions_.empty()) {
                    spdlog::info("[server] all sessions closed, stopping io_context");
                    io_ctx_->stop();
                }
            }
        );
    }
}

// ---------------------------------------------------------------------------
// ProxyServer::stop
// ---------------------------------------------------------------------------
void ProxyServer::stop()
{
    if (stopping_) {
        return;
    }

    stopping_ = true;

    spdlog::info("[server] stopping, active sessions: {}", sessions_.size());

    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
    if (status_endpoint_) {
        status_endpoint_->stop();
    }
    if (signals_) {
        boost::system::error_code ec;
        signals_->cancel(ec);
    }
    if (proxy_) {
        proxy_->stop_health_check();
    }

    for (auto& [sid, session] : sessions_) {
        spdlog::debug("[server] closing session {}", sid);
        session->close();
    }

    if (logger_) {
        logger_->flush();
    }

    if (sessions_.empty() && io_ctx_ != nullptr) {
        spdlog::info("[server] no active sessions, stopping io_context immediately");
        io_ctx_->stop();
    }
}

auto ProxyServer::listen_port() const -> std::uint16_t
{
    if (!acceptor_) {
        return 0;
    }
    boost::system::error_code ec;
    const auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

auto ProxyServer::status_port() const -> std::uint16_t
{
    return status_endpoint_ ? status_endpoint_->port() : 0;
}
