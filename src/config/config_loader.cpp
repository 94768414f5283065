#include "config/config_loader.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "logger/structured_logger.hpp"

namespace {

struct ConfigValueError {
    std::string message;
};

// 양의 정수 필드. 없으면 fallback, 0 이하/비정수면 오류.
template <typename T>
[[nodiscard]] T read_positive(const YAML::Node& section, const char* key, T fallback) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    std::int64_t value = 0;
    try {
        value = node.as<std::int64_t>();
    } catch (const YAML::Exception&) {
        throw ConfigValueError{fmt::format("'{}' must be an integer", key)};
    }
    if (value <= 0) {
        throw ConfigValueError{fmt::format("'{}' must be positive", key)};
    }
    return static_cast<T>(value);
}

[[nodiscard]] std::chrono::seconds read_seconds(const YAML::Node& section, const char* key,
                                                std::chrono::seconds fallback) {
    return std::chrono::seconds(read_positive<std::int64_t>(section, key, fallback.count()));
}

[[nodiscard]] std::chrono::milliseconds read_millis(const YAML::Node& section, const char* key,
                                                    std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(read_positive<std::int64_t>(section, key, fallback.count()));
}

[[nodiscard]] bool read_flag(const YAML::Node& section, const char* key, bool fallback) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        throw ConfigValueError{fmt::format("'{}' must be a boolean", key)};
    }
}

[[nodiscard]] std::optional<std::string> read_text(const YAML::Node& section, const char* key) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        throw ConfigValueError{fmt::format("'{}' must be a string", key)};
    }
    return node.as<std::string>();
}

// 섹션이 있으면 map 이어야 한다
[[nodiscard]] YAML::Node section_of(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (node && !node.IsNull() && !node.IsMap()) {
        throw ConfigValueError{fmt::format("section '{}' must be a map", name)};
    }
    return node ? node : YAML::Node(YAML::NodeType::Map);
}

void parse_token(const YAML::Node& root, AuthConfig& config) {
    const YAML::Node s   = section_of(root, "token");
    TokenServiceConfig& t = config.token;

    if (auto issuer = read_text(s, "issuer")) {
        t.issuer = *issuer;
    }
    if (const YAML::Node aud = s["audience"]; aud && !aud.IsNull()) {
        t.audience.clear();
        if (aud.IsScalar()) {
            t.audience.push_back(aud.as<std::string>());
        } else if (aud.IsSequence()) {
            for (const auto& item : aud) {
                t.audience.push_back(item.as<std::string>());
            }
        } else {
            throw ConfigValueError{"'audience' must be a string or a sequence"};
        }
    }

    t.access_ttl  = read_seconds(s, "access_ttl_s", t.access_ttl);
    t.refresh_ttl = read_seconds(s, "refresh_ttl_s", t.refresh_ttl);
    t.id_ttl      = read_seconds(s, "id_ttl_s", t.id_ttl);
    t.max_ttl     = std::max({t.access_ttl, t.refresh_ttl, t.id_ttl});

    // 기본 보존 기간 = 2 × 최장 수명
    t.key_retention = read_seconds(s, "key_retention_s", t.max_ttl * 2);
    if (t.key_retention < t.max_ttl) {
        throw ConfigValueError{fmt::format("'key_retention_s' ({}) must be >= the longest token ttl ({})",
                                           t.key_retention.count(), t.max_ttl.count())};
    }

    if (auto alg = read_text(s, "algorithm")) {
        const auto parsed = parse_signing_algorithm(*alg);
        if (!parsed) {
            throw ConfigValueError{fmt::format("unsupported algorithm '{}' (RS256, RS384, ES384)", *alg)};
        }
        t.algorithm = *parsed;
    }

    config.token_storage_path = read_text(s, "storage_path");
}

void parse_jwks(const YAML::Node& root, JwksCacheConfig& j) {
    const YAML::Node s = section_of(root, "jwks");
    j.default_ttl       = read_seconds(s, "default_ttl_s", j.default_ttl);
    j.min_ttl           = read_seconds(s, "min_ttl_s", j.min_ttl);
    j.max_ttl           = read_seconds(s, "max_ttl_s", j.max_ttl);
    j.request_timeout   = read_millis(s, "request_timeout_ms", j.request_timeout);
    j.max_response_size = read_positive<std::size_t>(s, "max_response_size", j.max_response_size);
    j.allow_http        = read_flag(s, "allow_http", j.allow_http);
    j.retry_backoff     = read_millis(s, "retry_backoff_ms", j.retry_backoff);
    j.max_staleness     = read_seconds(s, "max_staleness_s", j.max_staleness);

    // max_retries 는 0 허용
    if (const YAML::Node n = s["max_retries"]; n && !n.IsNull()) {
        const auto retries = n.as<std::int64_t>();
        if (retries < 0) {
            throw ConfigValueError{"'max_retries' must not be negative"};
        }
        j.max_retries = static_cast<std::uint32_t>(retries);
    }

    if (j.min_ttl > j.max_ttl) {
        throw ConfigValueError{"'min_ttl_s' must not exceed 'max_ttl_s'"};
    }
}

void parse_script(const YAML::Node& root, ScriptSandboxConfig& sc) {
    const YAML::Node s = section_of(root, "script");
    sc.timeout = read_millis(s, "timeout_ms", sc.timeout);

    const YAML::Node lw = section_of(s, "lightweight");
    auto& l = sc.lightweight;
    l.max_operations  = read_positive<std::uint64_t>(lw, "max_operations", l.max_operations);
    l.max_call_levels = read_positive<std::uint32_t>(lw, "max_call_levels", l.max_call_levels);
    l.max_expr_depth  = read_positive<std::uint32_t>(lw, "max_expr_depth", l.max_expr_depth);
    l.max_string_size = read_positive<std::size_t>(lw, "max_string_size", l.max_string_size);
    l.max_array_size  = read_positive<std::size_t>(lw, "max_array_size", l.max_array_size);
    l.max_map_size    = read_positive<std::size_t>(lw, "max_map_size", l.max_map_size);

    const YAML::Node qj = section_of(s, "quickjs");
    auto& q = sc.quickjs;
    q.pool_size        = read_positive<std::size_t>(qj, "pool_size", q.pool_size);
    q.memory_limit     = read_positive<std::size_t>(qj, "memory_limit", q.memory_limit);
    q.max_stack_size   = read_positive<std::size_t>(qj, "max_stack_size", q.max_stack_size);
    q.checkout_timeout = read_millis(qj, "checkout_timeout_ms", q.checkout_timeout);
}

void parse_evaluation(const YAML::Node& root, EvaluatorConfig& e) {
    const YAML::Node s = section_of(root, "evaluation");
    e.evaluate_scopes_first = read_flag(s, "evaluate_scopes_first", e.evaluate_scopes_first);
    e.deadline              = read_millis(s, "deadline_ms", e.deadline);
}

[[nodiscard]] std::expected<AuthConfig, std::string>
parse_root(const YAML::Node& root, const std::string& origin) {
    if (!root || root.IsNull()) {
        return AuthConfig{};
    }
    if (!root.IsMap()) {
        return std::unexpected(fmt::format("config '{}': root must be a map", origin));
    }

    AuthConfig config;
    try {
        parse_token(root, config);
        parse_jwks(root, config.jwks);
        parse_script(root, config.script);
        parse_evaluation(root, config.evaluation);

        if (auto policies = read_text(root, "policies")) {
            config.policy_path = *policies;
        }

        const YAML::Node logging = section_of(root, "logging");
        if (auto level = read_text(logging, "level")) {
            config.logging.level = parse_log_level(*level);
        }
        if (auto path = read_text(logging, "path")) {
            config.logging.path = *path;
        }
    } catch (const ConfigValueError& e) {
        return std::unexpected(fmt::format("config '{}': {}", origin, e.message));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("config '{}': {}", origin, e.what()));
    }
    return config;
}

}  // namespace

std::expected<AuthConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        return std::unexpected(fmt::format("config file not found: {}", config_path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("failed to parse config '{}': {}", config_path.string(), e.what()));
    }

    auto config = parse_root(root, config_path.string());
    if (config) {
        spdlog::info("config: loaded '{}' (policies='{}', scopes_first={})", config_path.string(),
                     config->policy_path, config->evaluation.evaluate_scopes_first);
    }
    return config;
}

std::expected<AuthConfig, std::string> ConfigLoader::parse(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("failed to parse config: {}", e.what()));
    }
    return parse_root(root, "<inline>");
}
