#pragma once

// ---------------------------------------------------------------------------
// federated_token_validator.hpp
//
// 외부 IdP 가 발급한 JWT 를 JwksCache 의 키로 검증한다.
//
// [fail-close]
// JWKS 조회 실패, kid 미발견, stale 초과는 모두 kSignatureInvalid 로 처리한다.
// 호출자는 message 로 원인을 구분할 수 있다.
// ---------------------------------------------------------------------------

#include "federation/jwks_cache.hpp"
#include "token/token_types.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

struct FederatedIssuer {
    std::string                jwks_uri{};
    std::optional<std::string> issuer{};    // 설정 시 iss 일치 검사
    std::optional<std::string> audience{};  // 설정 시 aud 포함 검사
};

class FederatedTokenValidator {
public:
    using NowFn = std::function<std::chrono::system_clock::time_point()>;

    explicit FederatedTokenValidator(JwksCache& cache, NowFn now = &std::chrono::system_clock::now);

    [[nodiscard]] std::expected<ValidatedClaims, TokenError>
    validate(std::string_view raw, const FederatedIssuer& issuer) const;

private:
    JwksCache& cache_;
    NowFn      now_;
};
