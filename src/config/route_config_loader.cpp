// ---------------------------------------------------------------------------
// route_config_loader.cpp
//
// YAML 라우트 설정 파일을 로드하여 RouteConfig 구조체로 파싱한다.
//
// - All-or-nothing: 항목 하나라도 잘못되면 전체 실패.
// - 알 수 없는 키는 경고만 출력한다 (오타 조기 발견).
// - 필드 누락 시 구조체 기본값을 적용한다. 단 routes[].methods 는 필수.
// ---------------------------------------------------------------------------

#include "config/route_config_loader.hpp"

#include <charconv>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

// 스키마 오류는 YAML::Exception 과 같은 경로로 처리하기 위해 예외로 올린다
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& key) {
    const YAML::Node value = node[key];
    if (!value) {
        return {};
    }
    if (!value.IsScalar()) {
        throw SchemaError(fmt::format("'{}' must be a string", key));
    }
    return value.as<std::string>();
}

// ---------------------------------------------------------------------------
// 헤더 맵: 값은 문자열 하나 또는 문자열 목록
//   X-Api: "2"          → {"2"}
//   X-Api: ["1", "2"]   → {"1", "2"}
// ---------------------------------------------------------------------------
[[nodiscard]] HeaderMap read_header_map(const YAML::Node& node, const std::string& where) {
    HeaderMap headers;
    if (!node || node.IsNull()) {
        return headers;
    }
    if (!node.IsMap()) {
        throw SchemaError(fmt::format("'{}' must be a map of header name to values", where));
    }

    for (const auto& item : node) {
        const auto name = item.first.as<std::string>();
        if (name.empty()) {
            throw SchemaError(fmt::format("'{}' contains an empty header name", where));
        }

        std::vector<std::string> values;
        if (item.second.IsScalar()) {
            values.push_back(item.second.as<std::string>());
        } else if (item.second.IsSequence()) {
            for (const auto& value : item.second) {
                if (!value.IsScalar()) {
                    throw SchemaError(fmt::format("'{}.{}' values must be strings", where, name));
                }
                values.push_back(value.as<std::string>());
            }
        } else {
            throw SchemaError(fmt::format("'{}.{}' must be a string or a list", where, name));
        }
        headers[name] = std::move(values);
    }
    return headers;
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node,
                                                            const std::string& where) {
    std::vector<std::string> result;
    if (!node) {
        return result;
    }
    if (node.IsScalar()) {
        result.push_back(node.as<std::string>());
        return result;
    }
    if (!node.IsSequence()) {
        throw SchemaError(fmt::format("'{}' must be a string or a list", where));
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw SchemaError(fmt::format("'{}' entries must be strings", where));
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

void warn_unknown_keys(const YAML::Node& node, const std::set<std::string>& known,
                       const std::string& where) {
    for (const auto& item : node) {
        const auto key = item.first.as<std::string>();
        if (known.count(key) == 0) {
            spdlog::warn("route_config: unknown key '{}' in {}", key, where);
        }
    }
}

// ---------------------------------------------------------------------------
// routes[] 항목 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] RouteEntry parse_route_entry(const YAML::Node& node, std::size_t index) {
    const std::string where = fmt::format("routes[{}]", index);
    if (!node.IsMap()) {
        throw SchemaError(fmt::format("'{}' must be a map", where));
    }
    warn_unknown_keys(node,
                      {"methods", "path", "rewrite", "under", "any",
                       "request_headers", "response_headers"},
                      where);

    RouteEntry entry{};
    entry.methods = read_string(node, "methods");
    if (entry.methods.empty()) {
        throw SchemaError(fmt::format("'{}.methods' is required", where));
    }

    entry.path    = read_string(node, "path");
    entry.rewrite = read_string(node, "rewrite");
    entry.under   = read_string_sequence(node["under"], where + ".under");
    if (node["any"]) {
        entry.any = node["any"].as<bool>();
    }

    const int kinds = (entry.path.empty() ? 0 : 1)
                    + (entry.under.empty() ? 0 : 1)
                    + (entry.any ? 1 : 0);
    if (kinds != 1) {
        throw SchemaError(fmt::format(
            "'{}' must set exactly one of 'path', 'under' or 'any'", where));
    }
    if (!entry.rewrite.empty() && entry.path.empty()) {
        throw SchemaError(fmt::format("'{}.rewrite' requires 'path'", where));
    }

    entry.request_headers  = read_header_map(node["request_headers"], where + ".request_headers");
    entry.response_headers = read_header_map(node["response_headers"], where + ".response_headers");
    return entry;
}

// ---------------------------------------------------------------------------
// 최상위 문서 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] RouteConfig parse_root(const YAML::Node& root) {
    warn_unknown_keys(root,
                      {"origin", "request_headers", "response_headers", "health_check", "routes"},
                      "top level");

    RouteConfig cfg{};
    cfg.origin           = read_string(root, "origin");
    cfg.request_headers  = read_header_map(root["request_headers"], "request_headers");
    cfg.response_headers = read_header_map(root["response_headers"], "response_headers");

    const YAML::Node health = root["health_check"];
    if (health && !health.IsNull()) {
        if (!health.IsMap()) {
            throw SchemaError("'health_check' must be a map");
        }
        const auto raw = read_string(health, "period");
        if (!raw.empty()) {
            const auto period = parse_period(raw);
            if (!period) {
                throw SchemaError(fmt::format("invalid health_check.period '{}'", raw));
            }
            cfg.health_check_period = *period;
        }
    }

    const YAML::Node routes = root["routes"];
    if (routes && !routes.IsNull()) {
        if (!routes.IsSequence()) {
            throw SchemaError("'routes' must be a list");
        }
        cfg.routes.reserve(routes.size());
        for (std::size_t i = 0; i < routes.size(); ++i) {
            cfg.routes.push_back(parse_route_entry(routes[i], i));
        }
    }
    return cfg;
}

[[nodiscard]] std::expected<RouteConfig, std::string>
parse_node(const YAML::Node& root, const std::string& source) {
    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "route_config: '{}' is not a valid YAML map (top-level)", source);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        RouteConfig cfg = parse_root(root);
        spdlog::info("route_config: loaded '{}': routes={}, health_check.period={}ms",
                     source, cfg.routes.size(), cfg.health_check_period.count());
        return cfg;
    } catch (const SchemaError& e) {
        const std::string err = fmt::format("route_config: invalid '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("route_config: YAML error in '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// RouteConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<RouteConfig, std::string>
RouteConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "route_config: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("route_config: loading routes from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "route_config: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "route_config: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "route_config: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_node(root, canonical_path.string());
}

std::expected<RouteConfig, std::string>
RouteConfigLoader::parse(const std::string& document, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(document);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "route_config: YAML parse error in '{}' at line {}, col {}: {}",
            source, e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return parse_node(root, source);
}

// ---------------------------------------------------------------------------
// parse_period: "10s" / "500ms" / "2m" / "15"
// ---------------------------------------------------------------------------
auto parse_period(const std::string& text) -> std::optional<std::chrono::milliseconds>
{
    const char* begin = text.data();
    const char* end   = text.data() + text.size();

    long long value{0};
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || value <= 0) {
        return std::nullopt;
    }

    const std::string unit{ptr, end};
    long long         factor{0};  // 단위당 ms
    if (unit.empty() || unit == "s") {
        factor = 1'000;
    } else if (unit == "ms") {
        factor = 1;
    } else if (unit == "m") {
        factor = 60'000;
    } else {
        return std::nullopt;
    }

    // milliseconds 표현 범위를 넘는 값은 거부
    if (value > std::chrono::milliseconds::max().count() / factor) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{value * factor};
}

auto make_header_modifier(HeaderMap headers) -> ResponseModifier
{
    if (headers.empty()) {
        return {};
    }
    return [headers = std::move(headers)](HttpResponse& response) -> std::expected<void, ProxyError> {
        merge_response_headers(response, {&headers});
        return {};
    };
}

auto make_dispatch_options(const RouteConfig& config) -> DispatchOptions
{
    DispatchOptions options{};
    options.request_headers     = config.request_headers;
    options.modify_response     = make_header_modifier(config.response_headers);
    options.health_check_period = config.health_check_period;
    return options;
}

// ---------------------------------------------------------------------------
// apply_route_config
//   path  → make_route(methods, path) (+ rewrite)
//   under → 각 prefix 마다 make_route(methods, wildcard_path_under(prefix))
//   any   → make_route(methods, "/*path")
// ---------------------------------------------------------------------------
auto apply_route_config(ReverseProxy& proxy, const RouteConfig& config)
    -> std::expected<void, ProxyError>
{
    for (const auto& entry : config.routes) {
        std::vector<std::string> paths;
        if (!entry.path.empty()) {
            paths.push_back(entry.path);
        } else if (entry.any) {
            paths.emplace_back("/*path");
        } else {
            for (const auto& prefix : entry.under) {
                paths.push_back(wildcard_path_under(prefix));
            }
        }

        for (const auto& path : paths) {
            Route route = make_route(entry.methods, path)
                              .with_rewrite_path(entry.rewrite)
                              .with_request_headers(entry.request_headers)
                              .with_response_modifier(make_header_modifier(entry.response_headers));

            if (auto registered = proxy.handle_path(std::move(route)); !registered) {
                spdlog::error("route_config: route '{} {}' rejected: {}",
                              entry.methods, path, registered.error().message);
                return registered;
            }
        }
    }

    spdlog::info("route_config: {} route entries registered", proxy.route_count());
    return {};
}
