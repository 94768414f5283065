#pragma once

// ---------------------------------------------------------------------------
// signing_key.hpp
//
// JWS 서명/검증 키. OpenSSL EVP_PKEY 를 감싼다.
//
// [키 수명]
// - current      : 새 토큰 서명에 사용되는 단 하나의 키
// - retire_after : 교체(rotate) 후 검증 전용으로 남는 기한.
//                  이 시각 이전에는 절대 삭제하지 않는다.
//                  (해당 키로 서명된 미만료 토큰이 존재할 수 있음)
//
// [소유권]
// EVP_PKEY 는 불변 객체로 취급하고 shared_ptr 로 공유한다.
// SigningKey 복사는 참조 카운트 증가만 일으킨다.
//
// [보안 주의]
// private_pem() 결과는 저장소에만 전달하고 로그 출력 금지.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

typedef struct evp_pkey_st EVP_PKEY;

enum class SigningAlgorithm : std::uint8_t {
    kRS256 = 0,
    kRS384 = 1,
    kES384 = 2,
};

[[nodiscard]] std::string_view to_string(SigningAlgorithm alg) noexcept;
[[nodiscard]] std::optional<SigningAlgorithm> parse_signing_algorithm(std::string_view name) noexcept;

class SigningKey {
public:
    using Clock     = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // generate
    //   새 키 쌍을 생성한다. RSA 는 2048 bit, ES384 는 P-384.
    //   kid 는 랜덤 UUID(v4).
    [[nodiscard]] static std::expected<SigningKey, std::string>
    generate(SigningAlgorithm alg, TimePoint now = Clock::now());

    // from_private_pem
    //   저장소에 보관된 PKCS#8 PEM 으로부터 복원한다.
    [[nodiscard]] static std::expected<SigningKey, std::string>
    from_private_pem(std::string kid, SigningAlgorithm alg, const std::string& pem);

    // from_jwk
    //   공개 JWK (RSA: n/e, EC: crv/x/y) 로부터 검증 전용 키를 만든다.
    [[nodiscard]] static std::expected<SigningKey, std::string> from_jwk(const Json::Value& jwk);

    [[nodiscard]] const std::string& kid() const noexcept { return kid_; }
    [[nodiscard]] SigningAlgorithm   algorithm() const noexcept { return alg_; }
    [[nodiscard]] bool               has_private() const noexcept { return has_private_; }

    [[nodiscard]] TimePoint                created_at() const noexcept { return created_at_; }
    [[nodiscard]] std::optional<TimePoint> retire_after() const noexcept { return retire_after_; }
    void set_created_at(TimePoint tp) noexcept { created_at_ = tp; }
    void set_retire_after(std::optional<TimePoint> tp) noexcept { retire_after_ = tp; }

    // retire_after 가 없거나 아직 지나지 않았으면 검증에 사용 가능
    [[nodiscard]] bool usable_for_verification(TimePoint now) const noexcept {
        return !retire_after_ || now < *retire_after_;
    }

    // sign
    //   JWS signing input 에 대한 서명 바이트를 반환한다.
    //   ES384 는 DER 이 아닌 JWS 형식(R||S, 96 bytes)으로 변환된다.
    [[nodiscard]] std::expected<std::vector<std::uint8_t>, std::string>
    sign(std::string_view signing_input) const;

    // verify
    //   서명 검증. 알고리즘 불일치/형식 오류는 false.
    [[nodiscard]] bool verify(std::string_view signing_input,
                              const std::vector<std::uint8_t>& signature) const;

    // 공개 JWK: {kty, kid, use:"sig", alg, n, e} 또는 {kty, kid, use, alg, crv, x, y}
    [[nodiscard]] Json::Value to_public_jwk() const;

    // PKCS#8 PEM (개인키 보유 시에만)
    [[nodiscard]] std::expected<std::string, std::string> private_pem() const;

private:
    SigningKey(std::string kid, SigningAlgorithm alg, std::shared_ptr<EVP_PKEY> pkey, bool has_private);

    std::string                kid_;
    SigningAlgorithm           alg_{SigningAlgorithm::kRS256};
    std::shared_ptr<EVP_PKEY>  pkey_;
    bool                       has_private_{false};
    TimePoint                  created_at_{};
    std::optional<TimePoint>   retire_after_{};
};
