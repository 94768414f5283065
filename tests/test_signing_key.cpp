// ---------------------------------------------------------------------------
// test_signing_key.cpp
//
// SigningKey (OpenSSL EVP) 및 JWS 코덱 단위 테스트.
//
// [테스트 범위]
// - RS256 / RS384 / ES384 생성, 서명, 검증
// - PEM 직렬화 후 복원한 키로 검증
// - 공개 JWK 왕복 (검증 전용 키는 서명 불가)
// - 변조된 서명 입력 / 서명 바이트 → 검증 실패
// - JWS 디코딩: 세그먼트 수, base64url, alg none / 비문자열 alg 거부
// - JWK 멤버 타입 오류 (kty/kid/alg/crv 비문자열) → 예외 없이 오류 반환
//
// [알려진 한계]
// - RSA 2048 키 생성은 느리므로 테스트마다 새로 만들지 않고
//   공용 fixture 에서 한 번만 생성한다.
// ---------------------------------------------------------------------------

#include "common/base64url.hpp"
#include "common/json_util.hpp"
#include "token/jwt.hpp"
#include "token/signing_key.hpp"

#include <gtest/gtest.h>

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace {

class SigningKeyTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        auto rsa = SigningKey::generate(SigningAlgorithm::kRS256);
        ASSERT_TRUE(rsa.has_value()) << rsa.error();
        rsa_key_ = std::move(*rsa);

        auto ec = SigningKey::generate(SigningAlgorithm::kES384);
        ASSERT_TRUE(ec.has_value()) << ec.error();
        ec_key_ = std::move(*ec);
    }

    static void TearDownTestSuite() {
        rsa_key_.reset();
        ec_key_.reset();
    }

    static const SigningKey& rsa() { return *rsa_key_; }
    static const SigningKey& ec() { return *ec_key_; }

    static std::optional<SigningKey> rsa_key_;
    static std::optional<SigningKey> ec_key_;
};

std::optional<SigningKey> SigningKeyTest::rsa_key_;
std::optional<SigningKey> SigningKeyTest::ec_key_;

Json::Value sample_claims() {
    Json::Value claims(Json::objectValue);
    claims["sub"] = "user-1";
    claims["iat"] = Json::Int64{1700000000};
    claims["exp"] = Json::Int64{1700003600};
    return claims;
}

}  // namespace

// ===========================================================================
// 알고리즘 이름
// ===========================================================================

TEST(SigningAlgorithm, NamesRoundTrip) {
    EXPECT_EQ(to_string(SigningAlgorithm::kRS256), "RS256");
    EXPECT_EQ(to_string(SigningAlgorithm::kRS384), "RS384");
    EXPECT_EQ(to_string(SigningAlgorithm::kES384), "ES384");
    EXPECT_EQ(parse_signing_algorithm("ES384"), SigningAlgorithm::kES384);
    EXPECT_FALSE(parse_signing_algorithm("none").has_value());
    EXPECT_FALSE(parse_signing_algorithm("HS256").has_value());
}

// ===========================================================================
// 서명 / 검증
// ===========================================================================

TEST_F(SigningKeyTest, Rs256_SignAndVerify) {
    EXPECT_TRUE(rsa().has_private());
    EXPECT_FALSE(rsa().kid().empty());

    auto sig = rsa().sign("header.payload");
    ASSERT_TRUE(sig.has_value()) << sig.error();
    EXPECT_EQ(sig->size(), 256u);
    EXPECT_TRUE(rsa().verify("header.payload", *sig));
    EXPECT_FALSE(rsa().verify("header.payload2", *sig));
}

TEST_F(SigningKeyTest, Es384_UsesFixedLengthSignature) {
    auto sig = ec().sign("header.payload");
    ASSERT_TRUE(sig.has_value()) << sig.error();
    EXPECT_EQ(sig->size(), 96u);
    EXPECT_TRUE(ec().verify("header.payload", *sig));

    auto tampered = *sig;
    tampered[10] ^= 0x01;
    EXPECT_FALSE(ec().verify("header.payload", tampered));

    tampered = *sig;
    tampered.pop_back();
    EXPECT_FALSE(ec().verify("header.payload", tampered));
}

TEST_F(SigningKeyTest, WrongKey_DoesNotVerify) {
    auto other = SigningKey::generate(SigningAlgorithm::kES384);
    ASSERT_TRUE(other.has_value());
    auto sig = ec().sign("data");
    ASSERT_TRUE(sig.has_value());
    EXPECT_FALSE(other->verify("data", *sig));
}

// ===========================================================================
// PEM / JWK
// ===========================================================================

TEST_F(SigningKeyTest, PrivatePem_RoundTrip) {
    auto pem = rsa().private_pem();
    ASSERT_TRUE(pem.has_value()) << pem.error();
    EXPECT_NE(pem->find("BEGIN PRIVATE KEY"), std::string::npos);

    auto restored = SigningKey::from_private_pem(rsa().kid(), SigningAlgorithm::kRS256, *pem);
    ASSERT_TRUE(restored.has_value()) << restored.error();
    EXPECT_EQ(restored->kid(), rsa().kid());

    auto sig = restored->sign("input");
    ASSERT_TRUE(sig.has_value());
    EXPECT_TRUE(rsa().verify("input", *sig));
}

TEST_F(SigningKeyTest, PrivatePem_AlgorithmMismatch_Rejected) {
    auto pem = ec().private_pem();
    ASSERT_TRUE(pem.has_value());
    EXPECT_FALSE(SigningKey::from_private_pem("k", SigningAlgorithm::kRS256, *pem).has_value());
}

TEST_F(SigningKeyTest, PublicJwk_Rsa) {
    const Json::Value jwk = rsa().to_public_jwk();
    EXPECT_EQ(jwk["kty"].asString(), "RSA");
    EXPECT_EQ(jwk["kid"].asString(), rsa().kid());
    EXPECT_EQ(jwk["use"].asString(), "sig");
    EXPECT_EQ(jwk["alg"].asString(), "RS256");
    EXPECT_TRUE(jwk.isMember("n"));
    EXPECT_TRUE(jwk.isMember("e"));
    EXPECT_FALSE(jwk.isMember("d"));

    auto public_key = SigningKey::from_jwk(jwk);
    ASSERT_TRUE(public_key.has_value()) << public_key.error();
    EXPECT_FALSE(public_key->has_private());
    EXPECT_FALSE(public_key->sign("x").has_value());
    EXPECT_FALSE(public_key->private_pem().has_value());

    auto sig = rsa().sign("x");
    ASSERT_TRUE(sig.has_value());
    EXPECT_TRUE(public_key->verify("x", *sig));
}

TEST_F(SigningKeyTest, PublicJwk_Ec) {
    const Json::Value jwk = ec().to_public_jwk();
    EXPECT_EQ(jwk["kty"].asString(), "EC");
    EXPECT_EQ(jwk["crv"].asString(), "P-384");
    EXPECT_EQ(base64url_decode(jwk["x"].asString())->size(), 48u);
    EXPECT_EQ(base64url_decode(jwk["y"].asString())->size(), 48u);

    auto public_key = SigningKey::from_jwk(jwk);
    ASSERT_TRUE(public_key.has_value()) << public_key.error();
    EXPECT_EQ(public_key->algorithm(), SigningAlgorithm::kES384);

    auto sig = ec().sign("y");
    ASSERT_TRUE(sig.has_value());
    EXPECT_TRUE(public_key->verify("y", *sig));
}

TEST(SigningKeyJwk, InvalidJwk_Rejected) {
    Json::Value not_object("string");
    EXPECT_FALSE(SigningKey::from_jwk(not_object).has_value());

    Json::Value oct(Json::objectValue);
    oct["kty"] = "oct";
    oct["k"]   = "c2VjcmV0";
    EXPECT_FALSE(SigningKey::from_jwk(oct).has_value());

    Json::Value rsa_missing_e(Json::objectValue);
    rsa_missing_e["kty"] = "RSA";
    rsa_missing_e["n"]   = "AQAB";
    EXPECT_FALSE(SigningKey::from_jwk(rsa_missing_e).has_value());

    Json::Value p256(Json::objectValue);
    p256["kty"] = "EC";
    p256["crv"] = "P-256";
    p256["x"]   = "AA";
    p256["y"]   = "AA";
    EXPECT_FALSE(SigningKey::from_jwk(p256).has_value());
}

TEST(SigningKeyJwk, NonStringMembers_RejectedWithoutThrowing) {
    Json::Value numeric_kty(Json::objectValue);
    numeric_kty["kty"] = 7;
    Json::Value object_kid(Json::objectValue);
    object_kid["kty"]      = "RSA";
    object_kid["kid"]["x"] = 1;
    Json::Value array_alg(Json::objectValue);
    array_alg["kty"] = "RSA";
    array_alg["n"]   = "AQAB";
    array_alg["e"]   = "AQAB";
    array_alg["alg"] = Json::Value(Json::arrayValue);
    Json::Value bool_crv(Json::objectValue);
    bool_crv["kty"] = "EC";
    bool_crv["crv"] = true;

    for (const auto* jwk : {&numeric_kty, &object_kid, &array_alg, &bool_crv}) {
        std::expected<SigningKey, std::string> r = std::unexpected(std::string());
        EXPECT_NO_THROW(r = SigningKey::from_jwk(*jwk));
        ASSERT_FALSE(r.has_value());
        EXPECT_NE(r.error().find("must be a string"), std::string::npos) << r.error();
    }
}

TEST(SigningKeyLifetime, UsableUntilRetireAfter) {
    auto key = SigningKey::generate(SigningAlgorithm::kES384);
    ASSERT_TRUE(key.has_value());
    const auto now = std::chrono::system_clock::now();

    EXPECT_TRUE(key->usable_for_verification(now));
    key->set_retire_after(now + std::chrono::hours(1));
    EXPECT_TRUE(key->usable_for_verification(now));
    EXPECT_FALSE(key->usable_for_verification(now + std::chrono::hours(1)));
}

// ===========================================================================
// JWS 코덱
// ===========================================================================

TEST_F(SigningKeyTest, EncodeDecode_PreservesHeaderAndClaims) {
    auto raw = encode_jwt(sample_claims(), ec());
    ASSERT_TRUE(raw.has_value()) << raw.error();

    auto parts = decode_jwt(*raw);
    ASSERT_TRUE(parts.has_value()) << parts.error();
    EXPECT_EQ(parts->algorithm, SigningAlgorithm::kES384);
    EXPECT_EQ(parts->kid, ec().kid());
    EXPECT_EQ(parts->header["typ"].asString(), "JWT");
    EXPECT_EQ(parts->claims["sub"].asString(), "user-1");
    EXPECT_TRUE(ec().verify(parts->signing_input, parts->signature));
}

TEST(JwtDecode, SegmentCount) {
    EXPECT_FALSE(decode_jwt("").has_value());
    EXPECT_FALSE(decode_jwt("abc").has_value());
    EXPECT_FALSE(decode_jwt("a.b").has_value());
    EXPECT_FALSE(decode_jwt("a.b.c.d").has_value());
}

TEST(JwtDecode, AlgNone_Rejected) {
    const std::string header  = base64url_encode(R"({"alg":"none","typ":"JWT"})");
    const std::string payload = base64url_encode(R"({"sub":"x"})");
    auto parts = decode_jwt(header + "." + payload + ".");
    ASSERT_FALSE(parts.has_value());
    EXPECT_NE(parts.error().find("none"), std::string::npos);
}

TEST(JwtDecode, NonStringAlg_Rejected) {
    const std::string payload = base64url_encode(R"({"sub":"x"})");
    for (const char* header_json : {R"({"alg":{"x":1}})", R"({"alg":256})", R"({"typ":"JWT"})"}) {
        std::expected<JwtParts, std::string> parts = std::unexpected(std::string());
        EXPECT_NO_THROW(parts = decode_jwt(base64url_encode(header_json) + "." + payload + ".AA"));
        ASSERT_FALSE(parts.has_value()) << header_json;
        EXPECT_NE(parts.error().find("alg must be a string"), std::string::npos) << parts.error();
    }
}

TEST(JwtDecode, NonJsonPayload_Rejected) {
    const std::string header = base64url_encode(R"({"alg":"RS256"})");
    EXPECT_FALSE(decode_jwt(header + "." + base64url_encode("not json") + ".AA").has_value());
    EXPECT_FALSE(decode_jwt(header + "." + base64url_encode("[1,2]") + ".AA").has_value());
    EXPECT_FALSE(decode_jwt(header + ".!!!.AA").has_value());
}
