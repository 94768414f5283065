#pragma once

// ---------------------------------------------------------------------------
// token_types.hpp
//
// Token Service 의 값 타입 정의.
//
// [와이어 클레임]
//   iss, sub, aud[], exp, iat, jti, scope(공백 구분), client_id,
//   patient?, encounter?, fhirUser?, nonce?(id token), token_use
//
// [순환 의존성]
// token_types.hpp 는 common/ 만 include 한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

enum class TokenKind : std::uint8_t {
    kAccess  = 0,
    kRefresh = 1,
    kId      = 2,
};

[[nodiscard]] std::string_view to_string(TokenKind kind) noexcept;
[[nodiscard]] std::optional<TokenKind> parse_token_kind(std::string_view text) noexcept;

// ---------------------------------------------------------------------------
// Token
//   발급 결과. raw 는 서명된 JWS 문자열이며 저장소에는 raw 를 저장하지 않는다.
// ---------------------------------------------------------------------------
struct Token {
    std::string                           jti{};
    std::string                           subject{};
    std::string                           client_id{};
    std::string                           scopes{};       // 공백 구분
    std::chrono::system_clock::time_point issued_at{};
    std::chrono::system_clock::time_point expires_at{};
    TokenKind                             kind{TokenKind::kAccess};
    std::string                           kid{};
    std::string                           raw{};
};

// ---------------------------------------------------------------------------
// IssueRequest
//   ttl 은 음수일 수 있다 (이미 만료된 토큰. 테스트/도구용).
//   audience 가 비어 있으면 access/refresh 는 설정 audience,
//   id token 은 client_id 를 aud 로 사용한다.
// ---------------------------------------------------------------------------
struct IssueRequest {
    std::string                subject{};
    std::string                client_id{};
    std::string                scopes{};
    TokenKind                  kind{TokenKind::kAccess};
    std::chrono::seconds       ttl{3600};
    std::optional<std::string> patient{};
    std::optional<std::string> encounter{};
    std::optional<std::string> fhir_user{};
    std::optional<std::string> nonce{};
    std::vector<std::string>   audience{};
};

// ---------------------------------------------------------------------------
// ValidatedClaims
//   서명, 만료, 폐기 검사를 모두 통과한 클레임. PolicyContext 입력.
// ---------------------------------------------------------------------------
struct ValidatedClaims {
    std::string                iss{};
    std::string                sub{};
    std::vector<std::string>   aud{};
    std::int64_t               exp{0};
    std::int64_t               iat{0};
    std::optional<std::int64_t> nbf{};
    std::string                jti{};
    std::string                scope{};
    std::string                client_id{};
    std::optional<std::string> patient{};
    std::optional<std::string> encounter{};
    std::optional<std::string> fhir_user{};
    std::optional<std::string> nonce{};
    TokenKind                  kind{TokenKind::kAccess};
    std::string                kid{};

    // JWT payload → ValidatedClaims. 필수 클레임(sub, exp, iat) 누락 시 오류.
    // jti 는 외부(federated) 토큰에서 생략될 수 있어 여기서는 선택이다.
    [[nodiscard]] static std::expected<ValidatedClaims, std::string> from_json(const Json::Value& payload);
};

// ---------------------------------------------------------------------------
// TokenErrorCode / TokenError
//   호출자(transport 레이어)가 401/400 등으로 매핑한다.
// ---------------------------------------------------------------------------
enum class TokenErrorCode : std::uint8_t {
    kExpired            = 0,
    kRevoked            = 1,
    kSignatureInvalid   = 2,
    kMalformed          = 3,
    kInvalidIssuer      = 4,
    kConfiguration      = 5,  // 활성 서명 키 부재 등
    kStorageUnavailable = 6,
    kNotYetValid        = 7,  // nbf > now
};

[[nodiscard]] std::string_view to_string(TokenErrorCode code) noexcept;

struct TokenError {
    TokenErrorCode code{TokenErrorCode::kMalformed};
    std::string    message{};
};

// ---------------------------------------------------------------------------
// TokenTypeHint (RFC 7009 §2.1)
// ---------------------------------------------------------------------------
enum class TokenTypeHint : std::uint8_t {
    kAccessToken  = 0,
    kRefreshToken = 1,
};

// 알 수 없는 hint 는 "unsupported_token_type" 오류
[[nodiscard]] std::expected<TokenTypeHint, std::string> parse_token_type_hint(std::string_view text);

// ---------------------------------------------------------------------------
// IntrospectionResult (RFC 7662 §2.2)
//   active == false 이면 다른 모든 필드는 비어 있고 JSON 에도 출력되지 않는다.
// ---------------------------------------------------------------------------
struct IntrospectionResult {
    bool                        active{false};
    std::optional<std::string>  scope{};
    std::optional<std::string>  client_id{};
    std::optional<std::string>  username{};
    std::optional<std::string>  token_type{};
    std::optional<std::int64_t> exp{};
    std::optional<std::int64_t> iat{};
    std::optional<std::int64_t> nbf{};
    std::optional<std::string>  sub{};
    std::vector<std::string>    aud{};
    std::optional<std::string>  iss{};
    std::optional<std::string>  jti{};
    std::optional<std::string>  patient{};
    std::optional<std::string>  encounter{};
    std::optional<std::string>  fhir_user{};

    [[nodiscard]] static IntrospectionResult inactive() { return IntrospectionResult{}; }
    [[nodiscard]] static IntrospectionResult from_claims(const ValidatedClaims& claims);

    [[nodiscard]] Json::Value to_json() const;
};
