#include "health/health_monitor.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

// ---------------------------------------------------------------------------
// HealthMonitor 구현
//
// 루프 흐름 (probe_loop):
//   1. wake_.wait_for(stop_token, period): stop 요청 시 즉시 깨어남
//   2. stop 요청이면 종료
//   3. check(origin) 을 락 밖에서 실행
//   4. 결과를 mutex_ 아래에서 저장
//
// set_check_func 흐름:
//   1. lifecycle_mutex_ 획득
//   2. stop_locked()  : request_stop + join
//   3. period_ 교체 (probe 함수는 새 루프가 소유)
//   4. 새 check 동기 실행 + 저장
//   5. start_locked() : 새 jthread
// ---------------------------------------------------------------------------

namespace {

[[nodiscard]] HealthCheckFunc default_check()
{
    return [](const Origin& origin) { return tcp_probe(origin); };
}

// probe 가 던진 예외는 루프 스레드를 종료시키지 않도록 unavailable 로 처리
[[nodiscard]] bool run_check(const HealthCheckFunc& check, const Origin& origin)
{
    try {
        return check(origin);
    } catch (const std::exception& e) {
        spdlog::warn("[health] probe for {} threw: {}", origin.authority(), e.what());
        return false;
    } catch (...) {
        spdlog::warn("[health] probe for {} threw a non-standard exception", origin.authority());
        return false;
    }
}

}  // namespace

HealthMonitor::HealthMonitor(Origin origin)
    : HealthMonitor(std::move(origin), default_check(), kDefaultHealthCheckPeriod)
{}

HealthMonitor::HealthMonitor(Origin                    origin,
                             HealthCheckFunc           check,
                             std::chrono::milliseconds period)
    : origin_{std::move(origin)}
    , period_{period.count() > 0 ? period : kDefaultHealthCheckPeriod}
{
    if (!check) {
        check = default_check();
    }

    std::lock_guard lifecycle{lifecycle_mutex_};

    store(run_check(check, origin_));
    start_locked(std::move(check), period_);
}

HealthMonitor::~HealthMonitor()
{
    stop();
}

auto HealthMonitor::is_available() const -> bool
{
    std::lock_guard lock{mutex_};
    return available_;
}

void HealthMonitor::set_check_func(HealthCheckFunc check, std::chrono::milliseconds period)
{
    if (!check) {
        spdlog::warn("[health] empty check function, falling back to tcp probe");
        check = default_check();
    }
    if (period.count() <= 0) {
        spdlog::warn("[health] non-positive period {}ms, using default", period.count());
        period = kDefaultHealthCheckPeriod;
    }

    std::lock_guard lifecycle{lifecycle_mutex_};

    stop_locked();
    {
        std::lock_guard lock{mutex_};
        period_ = period;
    }

    // 새 주기의 첫 tick 까지 이전 결과가 남지 않도록 즉시 1회 실행
    store(run_check(check, origin_));
    start_locked(std::move(check), period);

    spdlog::info("[health] check function replaced for {} (period {}ms)",
                 origin_.authority(), period.count());
}

void HealthMonitor::stop()
{
    std::lock_guard lifecycle{lifecycle_mutex_};
    stop_locked();
}

auto HealthMonitor::state() const -> MonitorState
{
    std::lock_guard lock{mutex_};
    return state_;
}

auto HealthMonitor::period() const -> std::chrono::milliseconds
{
    std::lock_guard lock{mutex_};
    return period_;
}

void HealthMonitor::start_locked(HealthCheckFunc check, std::chrono::milliseconds period)
{
    loop_ = std::jthread{
        [this, check = std::move(check), period](std::stop_token stop) {
            probe_loop(std::move(stop), check, period);
        }
    };

    std::lock_guard lock{mutex_};
    state_ = MonitorState::kRunning;
}

void HealthMonitor::stop_locked()
{
    if (loop_.joinable()) {
        loop_.request_stop();
        loop_.join();
        spdlog::debug("[health] probe loop for {} stopped", origin_.authority());
    }

    std::lock_guard lock{mutex_};
    if (state_ == MonitorState::kRunning) {
        state_ = MonitorState::kStopped;
    }
}

void HealthMonitor::probe_loop(std::stop_token           stop,
                               HealthCheckFunc           check,
                               std::chrono::milliseconds period)
{
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock{wait_mutex_};
            wake_.wait_for(lock, stop, period, [] { return false; });
        }
        if (stop.stop_requested()) {
            break;
        }

        const bool available = run_check(check, origin_);
        store(available);
    }
}

void HealthMonitor::store(bool available)
{
    bool changed = false;
    {
        std::lock_guard lock{mutex_};
        changed    = (available_ != available);
        available_ = available;
    }
    if (changed) {
        spdlog::info("[health] origin {} is now {}",
                     origin_.authority(), available ? "available" : "unavailable");
    }
}

// ---------------------------------------------------------------------------
// tcp_probe
//   전용 io_context 에서 resolve → connect 를 실행하고 run_for(timeout) 으로
//   전체 소요 시간을 제한한다.
// ---------------------------------------------------------------------------
auto tcp_probe(const Origin& origin, std::chrono::milliseconds timeout) -> bool
{
    namespace asio = boost::asio;
    using tcp      = asio::ip::tcp;

    boost::system::error_code result = asio::error::timed_out;

    asio::io_context ioc;
    tcp::resolver    resolver{ioc};
    tcp::socket      socket{ioc};

    resolver.async_resolve(
        origin.host,
        origin.effective_port(),
        [&](const boost::system::error_code& ec, const tcp::resolver::results_type& endpoints) {
            if (ec) {
                result = ec;
                return;
            }
            asio::async_connect(
                socket,
                endpoints,
                [&](const boost::system::error_code& connect_ec, const tcp::endpoint& /*ep*/) {
                    result = connect_ec;
                }
            );
        }
    );

    ioc.run_for(timeout);

    boost::system::error_code close_ec;
    socket.close(close_ec);

    if (result) {
        spdlog::debug("[health] tcp probe {}:{} failed: {}",
                      origin.host, origin.effective_port(), result.message());
        return false;
    }
    return true;
}
