#include "logger/structured_logger.hpp"
#include "proxy/proxy_server.hpp"

#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

uint16_t env_u16(const char* name, uint16_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const int parsed = std::stoi(val);
        if (parsed < 1 || parsed > 65535) {
            spdlog::warn("env {}: value {} out of range, using default {}", name, parsed, default_val);
            return default_val;
        }
        return static_cast<uint16_t>(parsed);
    } catch (const std::logic_error&) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
}

uint32_t env_u32(const char* name, uint32_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const long parsed = std::stol(val);
        if (parsed <= 0) {
            spdlog::warn("env {}: non-positive value {}, using default {}", name, parsed, default_val);
            return default_val;
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::logic_error&) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    ProxyConfig config;
    config.listen_address         = env_str("PROXY_LISTEN_ADDR",      "0.0.0.0");
    config.listen_port            = env_u16("PROXY_LISTEN_PORT",      8080);
    config.origin_url             = env_str("ORIGIN_URL",             "");
    config.routes_path            = env_str("ROUTES_PATH",            "config/routes.yaml");
    config.log_path               = env_str("LOG_PATH",               "/tmp/originmux/access.log");
    config.log_level              = env_str("LOG_LEVEL",              "info");
    config.status_port            = env_u16("STATUS_PORT",            9090);
    config.upstream_timeout_sec   = env_u32("UPSTREAM_TIMEOUT_SEC",   30);
    config.connection_timeout_sec = env_u32("CONNECTION_TIMEOUT_SEC", 30);

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    spdlog::set_level(to_spdlog_level(parse_log_level(config.log_level)));

    spdlog::info("Starting originmux");
    spdlog::info("Listen: {}:{}", config.listen_address, config.listen_port);
    spdlog::info("Routes: {}", config.routes_path);
    spdlog::info("Status port: {}", config.status_port);
    spdlog::info("Log level: {}", config.log_level);

    // ── ProxyServer 생성 및 실행 ────────────────────────────────────────
    boost::asio::io_context ioc;
    ProxyServer server{config};

    if (auto started = server.run(ioc); !started) {
        spdlog::critical("Startup failed: {}", started.error());
        return EXIT_FAILURE;
    }
    ioc.run();

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("originmux stopped");

    return EXIT_SUCCESS;
}
