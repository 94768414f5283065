#pragma once

// ---------------------------------------------------------------------------
// token_service.hpp
//
// 서명 토큰(access / refresh / id) 발급, 검증, 폐기, 인트로스펙션, 키 교체.
//
// [fail-close 원칙]
// 1. 서명 검증 실패, 형식 오류, issuer 불일치 → 오류 반환 (ValidatedClaims 없음)
// 2. exp 경과 → kExpired
// 3. 폐기 집합 포함 → kRevoked
// 4. 폐기 여부를 확인할 수 없음(저장소 장애) → kStorageUnavailable
//    (확인 불가 = 유효 아님)
//
// [키 교체]
// - 새 토큰은 current 키 하나로만 서명한다.
// - 검증은 retire_after 가 지나지 않은 모든 키로 수행한다.
//   kid 힌트를 먼저 시도하고, 실패 시 나머지 키를 선형 탐색한다.
// - key_retention >= max_ttl 을 생성 시점에 강제하여, 해당 키로 서명된
//   미만료 토큰이 남아 있는 동안 키가 삭제되지 않도록 한다.
//
// [수평 확장]
// 키/폐기 상태의 원본은 저장소다. 로컬 키 캐시는 읽기 전용 사본이며,
// 모르는 kid 를 만나면 저장소에서 다시 읽는다 (다른 노드의 rotate 반영).
// ---------------------------------------------------------------------------

#include "logger/audit_sink.hpp"
#include "token/signing_key.hpp"
#include "token/token_storage.hpp"
#include "token/token_types.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

// ---------------------------------------------------------------------------
// TokenServiceConfig
// ---------------------------------------------------------------------------
struct TokenServiceConfig {
    std::string              issuer{"https://authgate.local"};
    std::vector<std::string> audience{};
    std::chrono::seconds     access_ttl{3600};
    std::chrono::seconds     refresh_ttl{30 * 24 * 3600};
    std::chrono::seconds     id_ttl{3600};
    std::chrono::seconds     max_ttl{30 * 24 * 3600};        // issue() 의 ttl 상한
    std::chrono::seconds     key_retention{30 * 24 * 3600};  // >= max_ttl
    SigningAlgorithm         algorithm{SigningAlgorithm::kRS256};
};

class TokenService {
public:
    using Clock     = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using NowFn     = std::function<TimePoint()>;

    // 생성자
    //   storage / key_storage 가 nullptr 이거나 key_retention < max_ttl 이면
    //   ConfigurationError.
    //   audit 는 선택 (nullptr 이면 감사 이벤트 생략).
    TokenService(TokenServiceConfig                 config,
                 std::shared_ptr<TokenStorage>      storage,
                 std::shared_ptr<SigningKeyStorage> key_storage,
                 AuditSink*                         audit = nullptr,
                 NowFn                              now   = &Clock::now);

    ~TokenService() = default;

    TokenService(const TokenService&)            = delete;
    TokenService& operator=(const TokenService&) = delete;

    // ensure_signing_key
    //   저장소에서 키를 읽고, current 키가 없으면 새로 생성한다.
    [[nodiscard]] std::expected<void, TokenError> ensure_signing_key();

    // issue
    //   current 키로 서명한 토큰을 발급한다. access/refresh 는 저장소에 기록한다.
    //   서명 전에 키 저장소를 다시 읽어 다른 노드의 교체를 반영한다.
    //   current 키가 없으면 kConfiguration, 키 저장소 장애는 kStorageUnavailable.
    [[nodiscard]] std::expected<Token, TokenError> issue(const IssueRequest& request);

    [[nodiscard]] std::expected<Token, TokenError>
    issue(const std::string& subject, const std::string& client_id, const std::string& scopes,
          TokenKind kind, std::chrono::seconds ttl);

    // validate
    //   서명 → 클레임 형식 → issuer → exp → 폐기 여부 순으로 검사한다.
    [[nodiscard]] std::expected<ValidatedClaims, TokenError> validate(std::string_view raw);

    // revoke
    //   jti 를 폐기 집합에 추가한다 (TTL = 남은 수명). 저장소 쓰기 성공 후 반환.
    [[nodiscard]] std::expected<void, TokenError> revoke(const std::string& jti, TimePoint expires_at);

    // revoke_token (RFC 7009)
    //   형식 오류/알 수 없는/이미 폐기된 토큰은 성공으로 처리한다.
    //   이미 만료된 토큰은 기록 없이 성공으로 처리한다 (validate 가 거부).
    [[nodiscard]] std::expected<void, TokenError>
    revoke_token(std::string_view raw, std::optional<TokenTypeHint> hint = std::nullopt);

    // introspect (RFC 7662)
    //   예외/오류를 내지 않는다. 검증 실패 시 active=false 만 반환.
    [[nodiscard]] IntrospectionResult introspect(std::string_view raw);

    // rotate_keys
    //   새 키를 current 로 활성화하고, 직전 current 키에
    //   retire_after = now + key_retention 을 설정한다. 새 kid 반환.
    [[nodiscard]] std::expected<std::string, TokenError> rotate_keys();

    // jwks
    //   검증 가능한 모든 키의 공개 JWK 집합 {keys:[...]}.
    [[nodiscard]] Json::Value jwks() const;

    // cleanup_expired
    //   만료된 폐기/토큰 레코드와 보존 기간이 끝난 키를 삭제한다.
    [[nodiscard]] std::expected<std::size_t, TokenError> cleanup_expired();

    [[nodiscard]] std::optional<std::string> current_kid() const;

    [[nodiscard]] const TokenServiceConfig& config() const noexcept { return config_; }

private:
    // 저장소에서 키 목록을 다시 읽어 로컬 캐시를 교체한다.
    [[nodiscard]] std::expected<void, TokenError> reload_keys();

    // 서명 검증만 수행 (exp/폐기 검사 없음)
    [[nodiscard]] std::expected<ValidatedClaims, TokenError> verify_signature(std::string_view raw);

    void emit(const char* event, const std::string& id,
              const std::string& client_id, std::string_view kind) const;

    TokenServiceConfig                 config_;
    std::shared_ptr<TokenStorage>      storage_;
    std::shared_ptr<SigningKeyStorage> key_storage_;
    AuditSink*                         audit_;
    NowFn                              now_;

    mutable std::shared_mutex          keys_mutex_;
    std::vector<SigningKey>            keys_;
    std::optional<std::string>         current_kid_;
};
