// ---------------------------------------------------------------------------
// signing_key.cpp
//
// OpenSSL 3 EVP 기반 키 생성/직렬화/서명/검증.
//
// [ES384 서명 형식]
// OpenSSL 은 ECDSA 서명을 DER(SEQUENCE{r, s}) 로 생성하지만 JWS(RFC 7518
// §3.4)는 고정 길이 R||S 를 요구한다. sign/verify 에서 상호 변환한다.
//
// [fail-close]
// 키 타입과 알고리즘이 맞지 않거나 서명 길이가 다르면 verify 는 false.
// ---------------------------------------------------------------------------

#include "token/signing_key.hpp"

#include "common/base64url.hpp"
#include "common/json_util.hpp"
#include "common/uuid.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>

namespace {

constexpr std::size_t kEs384CoordSize = 48;

struct BioFree      { void operator()(BIO* p) const noexcept { BIO_free(p); } };
struct BnFree       { void operator()(BIGNUM* p) const noexcept { BN_free(p); } };
struct MdCtxFree    { void operator()(EVP_MD_CTX* p) const noexcept { EVP_MD_CTX_free(p); } };
struct PkeyCtxFree  { void operator()(EVP_PKEY_CTX* p) const noexcept { EVP_PKEY_CTX_free(p); } };
struct ParamBldFree { void operator()(OSSL_PARAM_BLD* p) const noexcept { OSSL_PARAM_BLD_free(p); } };
struct ParamFree    { void operator()(OSSL_PARAM* p) const noexcept { OSSL_PARAM_free(p); } };
struct EcdsaSigFree { void operator()(ECDSA_SIG* p) const noexcept { ECDSA_SIG_free(p); } };

using BioPtr      = std::unique_ptr<BIO, BioFree>;
using BnPtr       = std::unique_ptr<BIGNUM, BnFree>;
using MdCtxPtr    = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;
using PkeyCtxPtr  = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxFree>;
using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, ParamBldFree>;
using ParamPtr    = std::unique_ptr<OSSL_PARAM, ParamFree>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigFree>;

[[nodiscard]] std::shared_ptr<EVP_PKEY> wrap_pkey(EVP_PKEY* raw) {
    return std::shared_ptr<EVP_PKEY>(raw, [](EVP_PKEY* p) { EVP_PKEY_free(p); });
}

// OpenSSL 오류 큐의 마지막 메시지 (없으면 fallback)
[[nodiscard]] std::string openssl_error(std::string_view fallback) {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return std::string(fallback);
    }
    std::array<char, 256> buf{};
    ERR_error_string_n(code, buf.data(), buf.size());
    return fmt::format("{}: {}", fallback, buf.data());
}

[[nodiscard]] const EVP_MD* digest_for(SigningAlgorithm alg) noexcept {
    switch (alg) {
        case SigningAlgorithm::kRS256: return EVP_sha256();
        case SigningAlgorithm::kRS384: return EVP_sha384();
        case SigningAlgorithm::kES384: return EVP_sha384();
    }
    return EVP_sha256();
}

[[nodiscard]] bool is_rsa(SigningAlgorithm alg) noexcept {
    return alg == SigningAlgorithm::kRS256 || alg == SigningAlgorithm::kRS384;
}

[[nodiscard]] std::string bn_to_base64url(const BIGNUM* bn, std::size_t pad_to = 0) {
    const std::size_t len = pad_to != 0 ? pad_to : static_cast<std::size_t>(BN_num_bytes(bn));
    std::vector<std::uint8_t> bytes(len);
    if (pad_to != 0) {
        BN_bn2binpad(bn, bytes.data(), static_cast<int>(len));
    } else {
        BN_bn2bin(bn, bytes.data());
    }
    return base64url_encode(bytes.data(), bytes.size());
}

// 선택 문자열 멤버. 없으면 fallback, 문자열이 아니면 오류.
[[nodiscard]] std::expected<std::string, std::string>
string_member(const Json::Value& jwk, const char* name, const char* fallback) {
    if (!jwk.isMember(name)) {
        return std::string(fallback);
    }
    auto value = json_string_member(jwk, name);
    if (!value) {
        return std::unexpected(fmt::format("jwk member '{}' must be a string", name));
    }
    return std::move(*value);
}

[[nodiscard]] std::expected<std::vector<std::uint8_t>, std::string>
decode_member(const Json::Value& jwk, const char* name) {
    if (!jwk.isMember(name) || !jwk[name].isString()) {
        return std::unexpected(fmt::format("jwk is missing '{}'", name));
    }
    auto bytes = base64url_decode(jwk[name].asString());
    if (!bytes || bytes->empty()) {
        return std::unexpected(fmt::format("jwk member '{}' is not base64url", name));
    }
    return std::move(*bytes);
}

// DER ECDSA → R||S
[[nodiscard]] std::expected<std::vector<std::uint8_t>, std::string>
der_to_jose(const std::vector<std::uint8_t>& der) {
    const unsigned char* p = der.data();
    EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
    if (!sig) {
        return std::unexpected(openssl_error("cannot decode ECDSA signature"));
    }
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    std::vector<std::uint8_t> out(kEs384CoordSize * 2);
    if (BN_bn2binpad(r, out.data(), kEs384CoordSize) < 0 ||
        BN_bn2binpad(s, out.data() + kEs384CoordSize, kEs384CoordSize) < 0) {
        return std::unexpected(std::string("ECDSA coordinate overflow"));
    }
    return out;
}

// R||S → DER ECDSA. 길이가 맞지 않으면 빈 벡터.
[[nodiscard]] std::vector<std::uint8_t> jose_to_der(const std::vector<std::uint8_t>& jose) {
    if (jose.size() != kEs384CoordSize * 2) {
        return {};
    }
    EcdsaSigPtr sig(ECDSA_SIG_new());
    BIGNUM* r = BN_bin2bn(jose.data(), kEs384CoordSize, nullptr);
    BIGNUM* s = BN_bin2bn(jose.data() + kEs384CoordSize, kEs384CoordSize, nullptr);
    if (!sig || r == nullptr || s == nullptr || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
        BN_free(r);
        BN_free(s);
        return {};
    }
    const int len = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (len <= 0) {
        return {};
    }
    std::vector<std::uint8_t> der(static_cast<std::size_t>(len));
    unsigned char* out = der.data();
    i2d_ECDSA_SIG(sig.get(), &out);
    return der;
}

}  // namespace

std::string_view to_string(SigningAlgorithm alg) noexcept {
    switch (alg) {
        case SigningAlgorithm::kRS256: return "RS256";
        case SigningAlgorithm::kRS384: return "RS384";
        case SigningAlgorithm::kES384: return "ES384";
    }
    return "RS256";
}

std::optional<SigningAlgorithm> parse_signing_algorithm(std::string_view name) noexcept {
    if (name == "RS256") return SigningAlgorithm::kRS256;
    if (name == "RS384") return SigningAlgorithm::kRS384;
    if (name == "ES384") return SigningAlgorithm::kES384;
    return std::nullopt;
}

SigningKey::SigningKey(std::string kid, SigningAlgorithm alg,
                       std::shared_ptr<EVP_PKEY> pkey, bool has_private)
    : kid_(std::move(kid))
    , alg_(alg)
    , pkey_(std::move(pkey))
    , has_private_(has_private)
{}

// ---------------------------------------------------------------------------
// generate
// ---------------------------------------------------------------------------
std::expected<SigningKey, std::string> SigningKey::generate(SigningAlgorithm alg, TimePoint now) {
    EVP_PKEY* raw = is_rsa(alg)
        ? EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", static_cast<std::size_t>(2048))
        : EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-384");
    if (raw == nullptr) {
        return std::unexpected(openssl_error("key generation failed"));
    }
    auto pkey = wrap_pkey(raw);
    SigningKey key(uuid_v4(), alg, std::move(pkey), true);
    key.created_at_ = now;
    return key;
}

// ---------------------------------------------------------------------------
// from_private_pem
// ---------------------------------------------------------------------------
std::expected<SigningKey, std::string>
SigningKey::from_private_pem(std::string kid, SigningAlgorithm alg, const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return std::unexpected(openssl_error("BIO_new_mem_buf failed"));
    }
    EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (raw == nullptr) {
        return std::unexpected(openssl_error(fmt::format("cannot read private key kid={}", kid)));
    }
    auto pkey = wrap_pkey(raw);
    const bool type_ok = is_rsa(alg) ? EVP_PKEY_is_a(raw, "RSA") == 1 : EVP_PKEY_is_a(raw, "EC") == 1;
    if (!type_ok) {
        return std::unexpected(fmt::format("key kid={} does not match algorithm {}", kid, to_string(alg)));
    }
    return SigningKey(std::move(kid), alg, std::move(pkey), true);
}

// ---------------------------------------------------------------------------
// from_jwk
// ---------------------------------------------------------------------------
std::expected<SigningKey, std::string> SigningKey::from_jwk(const Json::Value& jwk) {
    if (!jwk.isObject()) {
        return std::unexpected(std::string("jwk is not an object"));
    }
    auto kty_member = string_member(jwk, "kty", "");
    if (!kty_member) return std::unexpected(kty_member.error());
    auto kid_member = string_member(jwk, "kid", "");
    if (!kid_member) return std::unexpected(kid_member.error());
    const std::string kty = std::move(*kty_member);
    const std::string kid = std::move(*kid_member);

    ParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld) {
        return std::unexpected(openssl_error("OSSL_PARAM_BLD_new failed"));
    }

    SigningAlgorithm alg{};
    const char*      keytype = nullptr;
    BnPtr            n_bn;
    BnPtr            e_bn;
    std::vector<std::uint8_t> ec_point;

    if (kty == "RSA") {
        auto n = decode_member(jwk, "n");
        if (!n) return std::unexpected(n.error());
        auto e = decode_member(jwk, "e");
        if (!e) return std::unexpected(e.error());

        auto alg_name = string_member(jwk, "alg", "RS256");
        if (!alg_name) return std::unexpected(alg_name.error());
        const auto parsed = parse_signing_algorithm(*alg_name);
        if (!parsed || !is_rsa(*parsed)) {
            return std::unexpected(fmt::format("unsupported RSA jwk alg '{}'", *alg_name));
        }
        alg     = *parsed;
        keytype = "RSA";
        n_bn.reset(BN_bin2bn(n->data(), static_cast<int>(n->size()), nullptr));
        e_bn.reset(BN_bin2bn(e->data(), static_cast<int>(e->size()), nullptr));
        if (!n_bn || !e_bn ||
            OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n_bn.get()) != 1 ||
            OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e_bn.get()) != 1) {
            return std::unexpected(openssl_error("cannot build RSA parameters"));
        }
    } else if (kty == "EC") {
        auto crv = string_member(jwk, "crv", "");
        if (!crv) return std::unexpected(crv.error());
        if (*crv != "P-384") {
            return std::unexpected(fmt::format("unsupported EC curve '{}'", *crv));
        }
        auto x = decode_member(jwk, "x");
        if (!x) return std::unexpected(x.error());
        auto y = decode_member(jwk, "y");
        if (!y) return std::unexpected(y.error());
        if (x->size() != kEs384CoordSize || y->size() != kEs384CoordSize) {
            return std::unexpected(std::string("EC coordinates must be 48 bytes for P-384"));
        }
        alg     = SigningAlgorithm::kES384;
        keytype = "EC";
        ec_point.reserve(1 + 2 * kEs384CoordSize);
        ec_point.push_back(0x04);
        ec_point.insert(ec_point.end(), x->begin(), x->end());
        ec_point.insert(ec_point.end(), y->begin(), y->end());
        if (OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, "P-384", 0) != 1 ||
            OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                             ec_point.data(), ec_point.size()) != 1) {
            return std::unexpected(openssl_error("cannot build EC parameters"));
        }
    } else {
        return std::unexpected(fmt::format("unsupported jwk kty '{}'", kty));
    }

    ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, keytype, nullptr));
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
        return std::unexpected(openssl_error("EVP_PKEY_fromdata_init failed"));
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.get()) != 1 || raw == nullptr) {
        return std::unexpected(openssl_error(fmt::format("invalid {} jwk kid={}", kty, kid)));
    }
    return SigningKey(kid, alg, wrap_pkey(raw), false);
}

// ---------------------------------------------------------------------------
// sign
// ---------------------------------------------------------------------------
std::expected<std::vector<std::uint8_t>, std::string>
SigningKey::sign(std::string_view signing_input) const {
    if (!has_private_) {
        return std::unexpected(fmt::format("key kid={} has no private material", kid_));
    }
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, digest_for(alg_), nullptr, pkey_.get()) != 1) {
        return std::unexpected(openssl_error("EVP_DigestSignInit failed"));
    }

    const auto* data = reinterpret_cast<const unsigned char*>(signing_input.data());
    std::size_t sig_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, data, signing_input.size()) != 1) {
        return std::unexpected(openssl_error("EVP_DigestSign (size) failed"));
    }
    std::vector<std::uint8_t> sig(sig_len);
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, data, signing_input.size()) != 1) {
        return std::unexpected(openssl_error("EVP_DigestSign failed"));
    }
    sig.resize(sig_len);

    if (alg_ == SigningAlgorithm::kES384) {
        return der_to_jose(sig);
    }
    return sig;
}

// ---------------------------------------------------------------------------
// verify
// ---------------------------------------------------------------------------
bool SigningKey::verify(std::string_view signing_input,
                        const std::vector<std::uint8_t>& signature) const {
    if (!pkey_ || signature.empty()) {
        return false;
    }

    std::vector<std::uint8_t> der;
    const std::vector<std::uint8_t>* sig = &signature;
    if (alg_ == SigningAlgorithm::kES384) {
        der = jose_to_der(signature);
        if (der.empty()) {
            return false;
        }
        sig = &der;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, digest_for(alg_), nullptr, pkey_.get()) != 1) {
        ERR_clear_error();
        return false;
    }
    const int rc = EVP_DigestVerify(ctx.get(), sig->data(), sig->size(),
                                    reinterpret_cast<const unsigned char*>(signing_input.data()),
                                    signing_input.size());
    if (rc != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// to_public_jwk
// ---------------------------------------------------------------------------
Json::Value SigningKey::to_public_jwk() const {
    Json::Value jwk(Json::objectValue);
    jwk["kid"] = kid_;
    jwk["use"] = "sig";
    jwk["alg"] = std::string(to_string(alg_));

    if (is_rsa(alg_)) {
        BIGNUM* n = nullptr;
        BIGNUM* e = nullptr;
        EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_RSA_N, &n);
        EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_RSA_E, &e);
        BnPtr n_guard(n);
        BnPtr e_guard(e);
        jwk["kty"] = "RSA";
        if (n != nullptr && e != nullptr) {
            jwk["n"] = bn_to_base64url(n);
            jwk["e"] = bn_to_base64url(e);
        }
    } else {
        BIGNUM* x = nullptr;
        BIGNUM* y = nullptr;
        EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_EC_PUB_X, &x);
        EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_EC_PUB_Y, &y);
        BnPtr x_guard(x);
        BnPtr y_guard(y);
        jwk["kty"] = "EC";
        jwk["crv"] = "P-384";
        if (x != nullptr && y != nullptr) {
            jwk["x"] = bn_to_base64url(x, kEs384CoordSize);
            jwk["y"] = bn_to_base64url(y, kEs384CoordSize);
        }
    }
    return jwk;
}

// ---------------------------------------------------------------------------
// private_pem
// ---------------------------------------------------------------------------
std::expected<std::string, std::string> SigningKey::private_pem() const {
    if (!has_private_) {
        return std::unexpected(fmt::format("key kid={} has no private material", kid_));
    }
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return std::unexpected(openssl_error("PEM_write_bio_PrivateKey failed"));
    }
    char*      data = nullptr;
    const long len  = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || data == nullptr) {
        return std::unexpected(std::string("empty PEM output"));
    }
    return std::string(data, static_cast<std::size_t>(len));
}
