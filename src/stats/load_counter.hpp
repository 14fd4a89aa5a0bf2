#pragma once

// ---------------------------------------------------------------------------
// load_counter.hpp
//
// origin 으로 전달 중인 요청 수 (in-flight load). 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - increment / decrement / get 모두 락 없이 atomic 연산만 사용한다.
// - get() 은 진행 중인 요청과 동시에 호출해도 안전하다.
//
// [불변식]
// - 값은 절대 음수가 되지 않는다. 짝이 맞지 않는 decrement 는 0 에서 멈춘다.
// - 모든 increment 가 decrement 로 짝지어지면 요청 완료 후 0 으로 돌아온다.
//
// [격리 원칙]
// - 카운터 갱신 실패가 데이터패스로 전파되지 않도록 모든 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstdint>

class LoadCounter {
public:
    LoadCounter() noexcept = default;
    ~LoadCounter()         = default;

    // 복사/이동 금지 (atomic 소유권 명확화)
    LoadCounter(const LoadCounter&)            = delete;
    LoadCounter& operator=(const LoadCounter&) = delete;
    LoadCounter(LoadCounter&&)                 = delete;
    LoadCounter& operator=(LoadCounter&&)      = delete;

    void increment() noexcept
    {
        value_.fetch_add(1, std::memory_order_relaxed);
    }

    // decrement
    //   CAS 루프로 0 미만 감소를 막는다.
    void decrement() noexcept
    {
        std::int64_t current = value_.load(std::memory_order_relaxed);
        while (current > 0) {
            if (value_.compare_exchange_weak(current, current - 1,
                                             std::memory_order_relaxed,
                                             std::memory_order_relaxed)) {
                return;
            }
        }
    }

    [[nodiscard]] auto get() const noexcept -> std::int64_t
    {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> value_{0};
};

// ---------------------------------------------------------------------------
// LoadGuard
//   요청 수명 전체를 감싸는 scoped acquire/release.
//   생성 시 increment, 소멸 시 decrement. 정상 반환과 예외 경로 모두 해당.
// ---------------------------------------------------------------------------
class LoadGuard {
public:
    explicit LoadGuard(LoadCounter& counter) noexcept
        : counter_{counter}
    {
        counter_.increment();
    }

    ~LoadGuard()
    {
        counter_.decrement();
    }

    LoadGuard(const LoadGuard&)            = delete;
    LoadGuard& operator=(const LoadGuard&) = delete;
    LoadGuard(LoadGuard&&)                 = delete;
    LoadGuard& operator=(LoadGuard&&)      = delete;

private:
    LoadCounter& counter_;
};
