#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// - 싱글턴 금지: ReverseProxy / ProxyServer 에 shared_ptr 로 주입한다.
// - 모든 구조체 필드는 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// StructuredLogger
//   AccessLog / ErrorLog 를 JSON 한 줄로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // log_access
    //   [고빈도 호출 경로] 요청마다 1회.
    void log_access(const AccessLog& entry);

    // log_error
    //   dispatch 오류를 warn 레벨로 기록한다.
    void log_error(const ErrorLog& entry);

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    [[nodiscard]] auto log_path() const -> const std::filesystem::path& { return log_path_; }

    // 버퍼에 남은 로그를 파일로 내보낸다.
    void flush();

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::string                     name_;
    std::shared_ptr<spdlog::logger> logger_;
};

// parse_log_level
//   "debug" | "info" | "warn" | "error" (대소문자 무시). 그 외는 kInfo.
[[nodiscard]] auto parse_log_level(std::string_view text) -> LogLevel;

// to_spdlog_level
//   진단 로그 (spdlog 기본 로거) 와 접근 로거가 같은 매핑을 쓴다.
[[nodiscard]] auto to_spdlog_level(LogLevel level) -> spdlog::level::level_enum;
