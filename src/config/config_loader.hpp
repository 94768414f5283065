#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// authgate 전체 설정 (YAML). 섹션: token, jwks, script, evaluation,
// policies, logging.
//
// [설계 원칙]
// - All-or-nothing: 한 필드라도 잘못되면 오류를 반환하고 부분 설정은 없다.
// - 누락된 필드는 각 구조체 기본값을 사용한다.
// - 시간 값 단위는 키 이름 접미사로 표기한다 (_s, _ms).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "federation/jwks_types.hpp"
#include "logger/log_types.hpp"
#include "policy/policy_evaluator.hpp"
#include "script/script_types.hpp"
#include "token/token_service.hpp"

struct LoggingConfig {
    LogLevel    level{LogLevel::kInfo};
    std::string path{"/tmp/authgate.log"};
};

struct AuthConfig {
    TokenServiceConfig         token{};
    std::optional<std::string> token_storage_path{};  // 없으면 in-memory 저장소
    JwksCacheConfig            jwks{};
    ScriptSandboxConfig        script{};
    EvaluatorConfig            evaluation{};
    std::string                policy_path{"config/policies.yaml"};
    LoggingConfig              logging{};
};

class ConfigLoader {
public:
    [[nodiscard]] static std::expected<AuthConfig, std::string>
    load(const std::filesystem::path& config_path);

    [[nodiscard]] static std::expected<AuthConfig, std::string>
    parse(std::string_view yaml_text);
};
