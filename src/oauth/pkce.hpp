#pragma once

// ---------------------------------------------------------------------------
// pkce.hpp
//
// RFC 7636 Proof Key for Code Exchange (S256 전용).
//
// [보안 원칙]
// - challenge = base64url(SHA-256(verifier)), method 는 "S256" 고정.
// - "plain" 방식은 어떤 경우에도 수용하지 않는다.
// - challenge 비교는 상수 시간 비교(CRYPTO_memcmp)로 수행한다.
// - verifier 는 비밀값이므로 로그에 출력 금지.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// PkceError
//   OAuth 오류 코드로 그대로 매핑된다.
//   kInvalidRequest → "invalid_request" (형식 오류, 미지원 method)
//   kInvalidGrant   → "invalid_grant"   (verifier 불일치)
// ---------------------------------------------------------------------------
enum class PkceErrorCode : std::uint8_t {
    kInvalidRequest = 0,
    kInvalidGrant   = 1,
};

struct PkceError {
    PkceErrorCode code{PkceErrorCode::kInvalidRequest};
    std::string   message{};

    [[nodiscard]] std::string_view oauth_error() const noexcept {
        return code == PkceErrorCode::kInvalidGrant ? "invalid_grant" : "invalid_request";
    }
};

class Pkce {
public:
    static constexpr std::size_t kMinLength = 43;
    static constexpr std::size_t kMaxLength = 128;
    static constexpr std::string_view kMethodS256 = "S256";

    // verifier 길이(43..128) 및 문자 집합 [A-Za-z0-9-._~] 검사
    [[nodiscard]] static std::expected<void, PkceError> validate_verifier(std::string_view verifier);

    // challenge 형식 검사 (S256 결과는 항상 43자 base64url)
    [[nodiscard]] static std::expected<void, PkceError> validate_challenge(std::string_view challenge);

    // method 검사. "S256" 이외는 invalid_request.
    [[nodiscard]] static std::expected<void, PkceError> validate_method(std::string_view method);

    // challenge_from
    //   verifier 로부터 S256 challenge 를 계산한다. 형식 검사 없음.
    [[nodiscard]] static std::string challenge_from(std::string_view verifier);

    // verify
    //   challenge 와 verifier 가 대응하는지 검사한다.
    [[nodiscard]] static bool verify(std::string_view challenge, std::string_view verifier);

    // verify_request
    //   토큰 교환 시점 전체 검사 (method, verifier 형식, 일치 여부).
    [[nodiscard]] static std::expected<void, PkceError>
    verify_request(std::string_view challenge, std::string_view method, std::string_view verifier);

    // generate_verifier
    //   OpenSSL RNG 로 32바이트를 뽑아 43자 verifier 를 만든다.
    [[nodiscard]] static std::string generate_verifier();
};
