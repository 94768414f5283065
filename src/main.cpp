#include "config/config_loader.hpp"
#include "common/json_util.hpp"
#include "federation/http_jwks_fetcher.hpp"
#include "federation/jwks_cache.hpp"
#include "logger/structured_logger.hpp"
#include "oauth/pkce.hpp"
#include "policy/in_memory_policy_store.hpp"
#include "policy/pattern_matcher.hpp"
#include "policy/policy_context.hpp"
#include "policy/policy_evaluator.hpp"
#include "policy/policy_loader.hpp"
#include "script/script_sandbox.hpp"
#include "token/file_auth_store.hpp"
#include "token/in_memory_auth_store.hpp"
#include "token/token_service.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// 종료 코드
//   0: 성공 / allow
//   1: deny 또는 실행 실패
//   2: 사용법 오류
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitDeny  = 1;
constexpr int kExitUsage = 2;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

void print_usage() {
    std::cerr <<
        "usage: authgate <command> [args]\n"
        "\n"
        "commands:\n"
        "  evaluate <context.json>                 evaluate a request context against the policies\n"
        "  issue <subject> <client_id> <scope...>  issue an access token\n"
        "  introspect <token>                      RFC 7662 introspection\n"
        "  revoke <token>                          RFC 7009 revocation\n"
        "  rotate-keys                             activate a new signing key\n"
        "  jwks                                    print the public JWK set\n"
        "  pkce-challenge <verifier>               print the S256 code challenge\n"
        "  refresh-jwks <jwks_uri>                 fetch a remote JWK set and list its key ids\n"
        "\n"
        "environment:\n"
        "  AUTHGATE_CONFIG, AUTHGATE_POLICY_PATH, AUTHGATE_LOG_PATH, AUTHGATE_LOG_LEVEL\n";
}

void print_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << '\n';
}

// ── 설정: 파일 → 환경변수 override ──────────────────────────────────────
std::optional<AuthConfig> load_config() {
    AuthConfig config;
    const std::string path = env_str("AUTHGATE_CONFIG", "");
    if (!path.empty()) {
        auto loaded = ConfigLoader::load(path);
        if (!loaded) {
            spdlog::error("{}", loaded.error());
            return std::nullopt;
        }
        config = std::move(*loaded);
    }

    config.policy_path  = env_str("AUTHGATE_POLICY_PATH", config.policy_path);
    config.logging.path = env_str("AUTHGATE_LOG_PATH", config.logging.path);
    const std::string level = env_str("AUTHGATE_LOG_LEVEL", "");
    if (!level.empty()) {
        config.logging.level = parse_log_level(level);
    }
    return config;
}

void init_console_logger(LogLevel level) {
    // stdout 은 명령 결과(JSON, 토큰) 전용
    auto logger = spdlog::stderr_color_mt("authgate");
    spdlog::set_default_logger(logger);
    switch (level) {
        case LogLevel::kDebug: spdlog::set_level(spdlog::level::debug); break;
        case LogLevel::kInfo:  spdlog::set_level(spdlog::level::info);  break;
        case LogLevel::kWarn:  spdlog::set_level(spdlog::level::warn);  break;
        case LogLevel::kError: spdlog::set_level(spdlog::level::err);   break;
    }
}

std::unique_ptr<StructuredLogger> open_audit_log(const LoggingConfig& logging) {
    try {
        return std::make_unique<StructuredLogger>(logging.level, logging.path);
    } catch (const std::exception& e) {
        spdlog::warn("audit log '{}' unavailable, continuing without it: {}", logging.path, e.what());
        return nullptr;
    }
}

// ── 토큰 서비스 구성 ────────────────────────────────────────────────────
std::unique_ptr<TokenService> make_token_service(const AuthConfig& config, AuditSink* audit) {
    std::shared_ptr<TokenStorage>      storage;
    std::shared_ptr<SigningKeyStorage> key_storage;
    if (config.token_storage_path) {
        auto store  = std::make_shared<FileAuthStore>(*config.token_storage_path);
        storage     = store;
        key_storage = store;
    } else {
        spdlog::warn("token.storage_path not set, keys and revocations are kept in memory only");
        auto store  = std::make_shared<InMemoryAuthStore>();
        storage     = store;
        key_storage = store;
    }

    auto service = std::make_unique<TokenService>(config.token, storage, key_storage, audit);
    if (auto ready = service->ensure_signing_key(); !ready) {
        spdlog::error("failed to prepare signing key: {}", ready.error().message);
        return nullptr;
    }
    return service;
}

// ── evaluate ────────────────────────────────────────────────────────────
int cmd_evaluate(const AuthConfig& config, AuditSink* audit, const std::string& context_path) {
    std::ifstream in(context_path);
    if (!in) {
        spdlog::error("cannot open context file '{}'", context_path);
        return kExitDeny;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto json = parse_json(buffer.str());
    if (!json) {
        spdlog::error("invalid context JSON: {}", json.error());
        return kExitDeny;
    }
    auto ctx = policy_context_from_json(*json);
    if (!ctx) {
        spdlog::error("invalid policy context: {}", ctx.error());
        return kExitDeny;
    }

    auto policies = PolicyLoader::load(config.policy_path);
    if (!policies) {
        spdlog::error("{}", policies.error());
        return kExitDeny;
    }

    InMemoryPolicyStore store(std::move(*policies));
    PatternMatcher      matcher;
    auto                sandbox = ScriptSandbox::create(config.script);
    PolicyEvaluator     evaluator(store, matcher, *sandbox, audit, config.evaluation);

    const EvaluationResult result = evaluator.evaluate_with_audit(*ctx);
    print_json(to_json(result));
    return is_allow(result.decision) ? EXIT_SUCCESS : kExitDeny;
}

// ── issue ───────────────────────────────────────────────────────────────
int cmd_issue(const AuthConfig& config, AuditSink* audit, const std::vector<std::string>& args) {
    auto service = make_token_service(config, audit);
    if (!service) {
        return kExitDeny;
    }

    std::string scopes;
    for (std::size_t i = 2; i < args.size(); ++i) {
        if (!scopes.empty()) {
            scopes.push_back(' ');
        }
        scopes += args[i];
    }

    auto token = service->issue(args[0], args[1], scopes, TokenKind::kAccess, config.token.access_ttl);
    if (!token) {
        spdlog::error("issue failed ({}): {}", to_string(token.error().code), token.error().message);
        return kExitDeny;
    }
    std::cout << token->raw << '\n';
    return EXIT_SUCCESS;
}

// ── introspect / revoke / rotate-keys / jwks ───────────────────────────
int cmd_introspect(const AuthConfig& config, AuditSink* audit, const std::string& raw) {
    auto service = make_token_service(config, audit);
    if (!service) {
        return kExitDeny;
    }
    print_json(service->introspect(raw).to_json());
    return EXIT_SUCCESS;
}

int cmd_revoke(const AuthConfig& config, AuditSink* audit, const std::string& raw) {
    auto service = make_token_service(config, audit);
    if (!service) {
        return kExitDeny;
    }
    if (auto revoked = service->revoke_token(raw); !revoked) {
        spdlog::error("revoke failed ({}): {}", to_string(revoked.error().code), revoked.error().message);
        return kExitDeny;
    }
    return EXIT_SUCCESS;
}

int cmd_rotate_keys(const AuthConfig& config, AuditSink* audit) {
    auto service = make_token_service(config, audit);
    if (!service) {
        return kExitDeny;
    }
    auto kid = service->rotate_keys();
    if (!kid) {
        spdlog::error("key rotation failed: {}", kid.error().message);
        return kExitDeny;
    }
    std::cout << *kid << '\n';
    return EXIT_SUCCESS;
}

int cmd_jwks(const AuthConfig& config, AuditSink* audit) {
    auto service = make_token_service(config, audit);
    if (!service) {
        return kExitDeny;
    }
    print_json(service->jwks());
    return EXIT_SUCCESS;
}

int cmd_pkce_challenge(const std::string& verifier) {
    if (auto valid = Pkce::validate_verifier(verifier); !valid) {
        spdlog::error("{}: {}", valid.error().oauth_error(), valid.error().message);
        return kExitDeny;
    }
    std::cout << Pkce::challenge_from(verifier) << '\n';
    return EXIT_SUCCESS;
}

// ── refresh-jwks ──────────────────────────────────────────────────────
int cmd_refresh_jwks(const AuthConfig& config, const std::string& uri) {
    JwksCache cache(config.jwks, std::make_shared<HttpJwksFetcher>());

    auto count = cache.refresh(uri);
    if (!count) {
        spdlog::error("jwks refresh failed ({}): {}", to_string(count.error().code), count.error().message);
        return kExitDeny;
    }
    auto keys = cache.find_signing_keys(uri);
    if (!keys) {
        spdlog::error("jwks lookup failed ({}): {}", to_string(keys.error().code), keys.error().message);
        return kExitDeny;
    }

    Json::Value out(Json::objectValue);
    out["jwksUri"] = uri;
    Json::Value kids(Json::arrayValue);
    for (const auto& key : *keys) {
        Json::Value item(Json::objectValue);
        item["kid"] = key.kid();
        item["alg"] = std::string(to_string(key.algorithm()));
        kids.append(std::move(item));
    }
    out["keys"] = std::move(kids);
    print_json(out);
    return EXIT_SUCCESS;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }
    const std::string              command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    const auto config = load_config();
    if (!config) {
        return kExitDeny;
    }
    init_console_logger(config->logging.level);
    const auto audit = open_audit_log(config->logging);

    try {
        if (command == "evaluate" && args.size() == 1) {
            return cmd_evaluate(*config, audit.get(), args[0]);
        }
        if (command == "issue" && args.size() >= 2) {
            return cmd_issue(*config, audit.get(), args);
        }
        if (command == "introspect" && args.size() == 1) {
            return cmd_introspect(*config, audit.get(), args[0]);
        }
        if (command == "revoke" && args.size() == 1) {
            return cmd_revoke(*config, audit.get(), args[0]);
        }
        if (command == "rotate-keys" && args.empty()) {
            return cmd_rotate_keys(*config, audit.get());
        }
        if (command == "jwks" && args.empty()) {
            return cmd_jwks(*config, audit.get());
        }
        if (command == "pkce-challenge" && args.size() == 1) {
            return cmd_pkce_challenge(args[0]);
        }
        if (command == "refresh-jwks" && args.size() == 1) {
            return cmd_refresh_jwks(*config, args[0]);
        }
    } catch (const ConfigurationError& e) {
        spdlog::error("configuration error: {}", e.what());
        return kExitDeny;
    }

    print_usage();
    return kExitUsage;
}
