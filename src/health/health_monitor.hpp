#pragma once

#include "common/origin.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

// ---------------------------------------------------------------------------
// HealthCheckFunc
//   origin 가용성 판정 함수. true = 사용 가능.
//   백그라운드 스레드에서 동기 호출된다.
// ---------------------------------------------------------------------------
using HealthCheckFunc = std::function<bool(const Origin&)>;

inline constexpr std::chrono::milliseconds kDefaultHealthCheckPeriod{10'000};
inline constexpr std::chrono::milliseconds kDefaultHealthCheckTimeout{10'000};

// ---------------------------------------------------------------------------
// MonitorState
//   kIdle    : 첫 probe 이전
//   kRunning : 주기 probe 루프 동작 중
//   kStopped : 루프 종료 (stop() 호출 후)
// ---------------------------------------------------------------------------
enum class MonitorState : std::uint8_t {
    kIdle    = 0,
    kRunning = 1,
    kStopped = 2,
};

// ---------------------------------------------------------------------------
// HealthMonitor
//   origin 가용성을 주기적으로 확인하고 마지막 결과를 캐시한다.
//
//   생명주기:
//     1. 생성자에서 probe 1회를 동기 실행 → is_available() 즉시 유효
//     2. 백그라운드 루프 시작 (kRunning)
//     3. set_check_func() : 루프 정지 → 함수/주기 교체 → 새 함수 동기 실행 → 루프 재시작
//     4. stop() / 소멸자 : 루프 정지 (kStopped)
//
//   스레드 안전성:
//     - mutex_           : available_, period_, state_ 보호
//     - probe 함수는 루프 스레드가 자기 사본을 소유한다.
//     - lifecycle_mutex_ : set_check_func / stop 직렬화. 동시에 두 개의 루프가
//                          존재하지 않는다.
//     - 루프 정지는 stop 요청 후 join 하는 동기 랑데부다.
//     - probe 는 락 밖에서 실행하므로 is_available() 은 네트워크 I/O 로
//       블로킹되지 않는다.
// ---------------------------------------------------------------------------
class HealthMonitor {
public:
    // 기본 probe (tcp_probe) + 기본 주기
    explicit HealthMonitor(Origin origin);

    HealthMonitor(Origin                    origin,
                  HealthCheckFunc           check,
                  std::chrono::milliseconds period);

    ~HealthMonitor();

    // 복사/이동 금지 (스레드가 this 를 참조)
    HealthMonitor(const HealthMonitor&)            = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;
    HealthMonitor(HealthMonitor&&)                 = delete;
    HealthMonitor& operator=(HealthMonitor&&)      = delete;

    [[nodiscard]] auto is_available() const -> bool;

    // set_check_func
    //   check 가 비어 있으면 tcp_probe, period 가 0 이하이면 기본 주기를 사용한다.
    //   stop() 이후에 호출해도 루프가 다시 시작된다.
    void set_check_func(HealthCheckFunc check, std::chrono::milliseconds period);

    // stop
    //   이미 정지 상태면 no-op.
    void stop();

    [[nodiscard]] auto state()  const -> MonitorState;
    [[nodiscard]] auto period() const -> std::chrono::milliseconds;
    [[nodiscard]] auto origin() const noexcept -> const Origin& { return origin_; }

private:
    // *_locked: lifecycle_mutex_ 를 보유한 상태에서만 호출
    void start_locked(HealthCheckFunc check, std::chrono::milliseconds period);
    void stop_locked();

    void probe_loop(std::stop_token           stop,
                    HealthCheckFunc           check,
                    std::chrono::milliseconds period);

    void store(bool available);

    const Origin origin_;

    mutable std::mutex        mutex_;
    std::chrono::milliseconds period_;
    bool                      available_{false};
    MonitorState              state_{MonitorState::kIdle};

    std::mutex                  lifecycle_mutex_;
    std::mutex                  wait_mutex_;
    std::condition_variable_any wake_;
    std::jthread                loop_;
};

// ---------------------------------------------------------------------------
// tcp_probe
//   origin host:port 로 TCP 연결을 시도한다.
//   timeout 안에 연결되면 true, 오류/타임아웃이면 false.
//   연결 결과와 관계없이 소켓은 즉시 닫는다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto tcp_probe(const Origin&             origin,
                             std::chrono::milliseconds timeout = kDefaultHealthCheckTimeout)
    -> bool;
