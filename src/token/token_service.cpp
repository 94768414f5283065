// ---------------------------------------------------------------------------
// token_service.cpp
//
// [검증 순서]
// 1. JWS 구조 디코딩            → kMalformed
// 2. kid 힌트 키 → 나머지 키 선형 탐색 → kSignatureInvalid
// 3. 필수 클레임(sub, jti, exp, iat) → kMalformed
// 4. iss == config.issuer       → kInvalidIssuer
// 5. exp > now                  → kExpired
// 6. nbf <= now (있을 때)        → kNotYetValid
// 7. 폐기 집합 조회               → kRevoked / kStorageUnavailable
//
// [다중 노드 서명 키]
// issue() 는 매번 저장소에서 키 목록을 다시 읽고 current 키로 서명한다.
// 다른 노드가 교체한 뒤에도 이전 키로 서명하면, 그 키가 retire_after 에
// 삭제될 때 아직 유효한 토큰이 검증 불가가 된다.
//
// [알려진 한계]
// - 시계 오차(leeway)는 허용하지 않는다. exp == now 는 만료로 본다.
// - nbf 는 발급하지 않는다.
// ---------------------------------------------------------------------------

#include "token/token_service.hpp"

#include "common/uuid.hpp"
#include "token/jwt.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] std::int64_t to_epoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] TokenError storage_failure(const StorageError& err) {
    return TokenError{TokenErrorCode::kStorageUnavailable, err.message};
}

}  // namespace

// ---------------------------------------------------------------------------
// TokenService 생성자
// ---------------------------------------------------------------------------
TokenService::TokenService(TokenServiceConfig                 config,
                           std::shared_ptr<TokenStorage>      storage,
                           std::shared_ptr<SigningKeyStorage> key_storage,
                           AuditSink*                         audit,
                           NowFn                              now)
    : config_(std::move(config))
    , storage_(std::move(storage))
    , key_storage_(std::move(key_storage))
    , audit_(audit)
    , now_(std::move(now))
{
    if (!storage_ || !key_storage_) {
        throw ConfigurationError("token_service: token and key storage are required");
    }
    if (config_.key_retention < config_.max_ttl) {
        throw ConfigurationError(fmt::format(
            "token_service: key_retention ({}s) must be >= max_ttl ({}s)",
            config_.key_retention.count(), config_.max_ttl.count()));
    }
    if (!now_) {
        now_ = &Clock::now;
    }
}

// ---------------------------------------------------------------------------
// reload_keys
// ---------------------------------------------------------------------------
std::expected<void, TokenError> TokenService::reload_keys() {
    auto stored = key_storage_->load_keys();
    if (!stored) {
        spdlog::error("token_service: cannot load signing keys: {}", stored.error().message);
        return std::unexpected(storage_failure(stored.error()));
    }

    std::vector<SigningKey>    loaded;
    std::optional<std::string> current;
    loaded.reserve(stored->size());

    for (const auto& rec : *stored) {
        const auto alg = parse_signing_algorithm(rec.algorithm);
        if (!alg) {
            spdlog::error("token_service: key kid={} has unknown algorithm '{}', skipped",
                          rec.kid, rec.algorithm);
            continue;
        }
        auto key = SigningKey::from_private_pem(rec.kid, *alg, rec.private_pem);
        if (!key) {
            spdlog::error("token_service: key kid={} cannot be restored, skipped: {}",
                          rec.kid, key.error());
            continue;
        }
        key->set_created_at(rec.created_at);
        key->set_retire_after(rec.retire_after);
        if (rec.current) {
            current = rec.kid;
        }
        loaded.push_back(std::move(*key));
    }

    std::unique_lock lock(keys_mutex_);
    keys_        = std::move(loaded);
    current_kid_ = std::move(current);
    return {};
}

// ---------------------------------------------------------------------------
// ensure_signing_key
// ---------------------------------------------------------------------------
std::expected<void, TokenError> TokenService::ensure_signing_key() {
    if (auto r = reload_keys(); !r) {
        return r;
    }
    if (current_kid()) {
        return {};
    }
    spdlog::info("token_service: no current signing key, generating one");
    auto kid = rotate_keys();
    if (!kid) {
        return std::unexpected(kid.error());
    }
    return {};
}

std::optional<std::string> TokenService::current_kid() const {
    std::shared_lock lock(keys_mutex_);
    return current_kid_;
}

// ---------------------------------------------------------------------------
// issue
// ---------------------------------------------------------------------------
std::expected<Token, TokenError> TokenService::issue(const IssueRequest& request) {
    if (auto r = reload_keys(); !r) {
        return std::unexpected(r.error());
    }

    std::optional<SigningKey> signer;
    {
        std::shared_lock lock(keys_mutex_);
        if (current_kid_) {
            const auto it = std::find_if(keys_.begin(), keys_.end(),
                                         [this](const SigningKey& k) { return k.kid() == *current_kid_; });
            if (it != keys_.end()) {
                signer = *it;
            }
        }
    }
    if (!signer) {
        spdlog::error("token_service: issue refused, no active signing key");
        return std::unexpected(TokenError{TokenErrorCode::kConfiguration, "no active signing key"});
    }

    auto ttl = request.ttl;
    if (ttl > config_.max_ttl) {
        spdlog::warn("token_service: ttl {}s exceeds max_ttl {}s, clamped", ttl.count(), config_.max_ttl.count());
        ttl = config_.max_ttl;
    }

    const TimePoint now = now_();
    Token token;
    token.jti        = uuid_v4();
    token.subject    = request.subject;
    token.client_id  = request.client_id;
    token.scopes     = request.scopes;
    token.kind       = request.kind;
    token.kid        = signer->kid();
    token.issued_at  = std::chrono::time_point_cast<std::chrono::seconds>(now);
    token.expires_at = token.issued_at + ttl;

    Json::Value claims(Json::objectValue);
    claims["iss"]       = config_.issuer;
    claims["sub"]       = token.subject;
    claims["iat"]       = Json::Int64{to_epoch(token.issued_at)};
    claims["exp"]       = Json::Int64{to_epoch(token.expires_at)};
    claims["jti"]       = token.jti;
    claims["client_id"] = token.client_id;
    claims["token_use"] = std::string(to_string(token.kind));
    if (!token.scopes.empty()) {
        claims["scope"] = token.scopes;
    }

    std::vector<std::string> audience = request.audience;
    if (audience.empty()) {
        audience = request.kind == TokenKind::kId ? std::vector<std::string>{request.client_id}
                                                  : config_.audience;
    }
    if (!audience.empty()) {
        Json::Value aud(Json::arrayValue);
        for (const auto& a : audience) {
            aud.append(a);
        }
        claims["aud"] = std::move(aud);
    }
    if (request.patient)   claims["patient"]   = *request.patient;
    if (request.encounter) claims["encounter"] = *request.encounter;
    if (request.fhir_user) claims["fhirUser"]  = *request.fhir_user;
    if (request.nonce && request.kind == TokenKind::kId) {
        claims["nonce"] = *request.nonce;
    }

    auto raw = encode_jwt(claims, *signer);
    if (!raw) {
        spdlog::error("token_service: signing failed kid={}: {}", signer->kid(), raw.error());
        return std::unexpected(TokenError{TokenErrorCode::kConfiguration, raw.error()});
    }
    token.raw = std::move(*raw);

    // access/refresh 는 영속 레코드. 기록 실패 시 토큰을 내보내지 않는다.
    if (token.kind != TokenKind::kId) {
        TokenRecord record{token.jti, token.subject, token.client_id, token.scopes,
                           token.kind, token.issued_at, token.expires_at};
        if (auto persisted = storage_->persist(record); !persisted) {
            spdlog::error("token_service: cannot persist token jti={}: {}",
                          token.jti, persisted.error().message);
            return std::unexpected(storage_failure(persisted.error()));
        }
    }

    emit("issued", token.jti, token.client_id, to_string(token.kind));
    return token;
}

std::expected<Token, TokenError>
TokenService::issue(const std::string& subject, const std::string& client_id,
                    const std::string& scopes, TokenKind kind, std::chrono::seconds ttl) {
    IssueRequest request;
    request.subject   = subject;
    request.client_id = client_id;
    request.scopes    = scopes;
    request.kind      = kind;
    request.ttl       = ttl;
    return issue(request);
}

// ---------------------------------------------------------------------------
// verify_signature
// ---------------------------------------------------------------------------
std::expected<ValidatedClaims, TokenError> TokenService::verify_signature(std::string_view raw) {
    auto parts = decode_jwt(raw);
    if (!parts) {
        return std::unexpected(TokenError{TokenErrorCode::kMalformed, parts.error()});
    }

    const TimePoint now = now_();

    // kid 힌트 우선, 이후 나머지 키 선형 탐색
    const auto try_keys = [&](bool& kid_known) -> std::optional<std::string> {
        std::shared_lock lock(keys_mutex_);
        kid_known = parts->kid.empty();
        for (const auto& key : keys_) {
            if (key.kid() == parts->kid) {
                kid_known = true;
                if (key.usable_for_verification(now) && key.algorithm() == parts->algorithm &&
                    key.verify(parts->signing_input, parts->signature)) {
                    return key.kid();
                }
            }
        }
        for (const auto& key : keys_) {
            if (key.kid() == parts->kid || !key.usable_for_verification(now) ||
                key.algorithm() != parts->algorithm) {
                continue;
            }
            if (key.verify(parts->signing_input, parts->signature)) {
                return key.kid();
            }
        }
        return std::nullopt;
    };

    bool kid_known = false;
    auto verified_by = try_keys(kid_known);
    if (!verified_by && !kid_known) {
        // 다른 노드가 교체한 키일 수 있다
        if (auto r = reload_keys(); !r) {
            return std::unexpected(r.error());
        }
        verified_by = try_keys(kid_known);
    }
    if (!verified_by) {
        return std::unexpected(TokenError{TokenErrorCode::kSignatureInvalid,
                                          "no verification key accepted the signature"});
    }

    auto claims = ValidatedClaims::from_json(parts->claims);
    if (!claims) {
        return std::unexpected(TokenError{TokenErrorCode::kMalformed, claims.error()});
    }
    claims->kid = *verified_by;
    if (claims->jti.empty()) {
        return std::unexpected(TokenError{TokenErrorCode::kMalformed, "token is missing jti"});
    }

    if (claims->iss != config_.issuer) {
        return std::unexpected(TokenError{TokenErrorCode::kInvalidIssuer,
                                          fmt::format("unexpected issuer '{}'", claims->iss)});
    }
    return std::move(*claims);
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------
std::expected<ValidatedClaims, TokenError> TokenService::validate(std::string_view raw) {
    auto claims = verify_signature(raw);
    if (!claims) {
        return claims;
    }

    const std::int64_t now = to_epoch(now_());
    if (claims->exp <= now) {
        return std::unexpected(TokenError{TokenErrorCode::kExpired, "token has expired"});
    }
    if (claims->nbf && *claims->nbf > now) {
        return std::unexpected(TokenError{TokenErrorCode::kNotYetValid, "token is not yet valid"});
    }

    auto revoked = storage_->is_revoked(claims->jti);
    if (!revoked) {
        spdlog::error("token_service: revocation check failed jti={}: {}",
                      claims->jti, revoked.error().message);
        return std::unexpected(storage_failure(revoked.error()));
    }
    if (*revoked) {
        return std::unexpected(TokenError{TokenErrorCode::kRevoked, "token has been revoked"});
    }
    return claims;
}

// ---------------------------------------------------------------------------
// revoke
// ---------------------------------------------------------------------------
std::expected<void, TokenError> TokenService::revoke(const std::string& jti, TimePoint expires_at) {
    if (expires_at <= now_()) {
        // 이미 만료된 토큰은 validate 에서 거부되므로 기록할 필요가 없다
        spdlog::debug("token_service: revoke jti={} skipped, already expired", jti);
        return {};
    }
    if (auto r = storage_->revoke(jti, expires_at); !r) {
        spdlog::error("token_service: revoke failed jti={}: {}", jti, r.error().message);
        return std::unexpected(storage_failure(r.error()));
    }
    emit("revoked", jti, "", "");
    return {};
}

// ---------------------------------------------------------------------------
// revoke_token (RFC 7009)
// ---------------------------------------------------------------------------
std::expected<void, TokenError>
TokenService::revoke_token(std::string_view raw, std::optional<TokenTypeHint> hint) {
    auto claims = verify_signature(raw);
    if (!claims) {
        if (claims.error().code == TokenErrorCode::kStorageUnavailable) {
            return std::unexpected(claims.error());
        }
        // 무효 토큰 폐기 요청은 성공으로 응답한다 (RFC 7009 §2.2)
        spdlog::debug("token_service: revoke ignored for invalid token: {}", claims.error().message);
        return {};
    }

    if (hint) {
        const bool hinted_refresh = *hint == TokenTypeHint::kRefreshToken;
        if (hinted_refresh != (claims->kind == TokenKind::kRefresh)) {
            spdlog::debug("token_service: token_type_hint does not match token jti={}", claims->jti);
        }
    }

    return revoke(claims->jti, TimePoint{std::chrono::seconds{claims->exp}});
}

// ---------------------------------------------------------------------------
// introspect
// ---------------------------------------------------------------------------
IntrospectionResult TokenService::introspect(std::string_view raw) {
    auto claims = validate(raw);
    if (!claims) {
        return IntrospectionResult::inactive();
    }
    return IntrospectionResult::from_claims(*claims);
}

// ---------------------------------------------------------------------------
// rotate_keys
// ---------------------------------------------------------------------------
std::expected<std::string, TokenError> TokenService::rotate_keys() {
    const TimePoint now = now_();

    auto key = SigningKey::generate(config_.algorithm, now);
    if (!key) {
        spdlog::error("token_service: key generation failed: {}", key.error());
        return std::unexpected(TokenError{TokenErrorCode::kConfiguration, key.error()});
    }
    auto pem = key->private_pem();
    if (!pem) {
        return std::unexpected(TokenError{TokenErrorCode::kConfiguration, pem.error()});
    }

    StoredSigningKey stored;
    stored.kid         = key->kid();
    stored.algorithm   = std::string(to_string(key->algorithm()));
    stored.private_pem = std::move(*pem);
    stored.created_at  = now;
    stored.current     = true;

    if (auto r = key_storage_->insert_key_as_current(stored, now + config_.key_retention); !r) {
        spdlog::error("token_service: cannot store rotated key: {}", r.error().message);
        return std::unexpected(storage_failure(r.error()));
    }
    if (auto r = reload_keys(); !r) {
        return std::unexpected(r.error());
    }

    spdlog::info("token_service: signing key rotated kid={} alg={}", stored.kid, stored.algorithm);
    emit("rotated", stored.kid, "", "");
    return stored.kid;
}

// ---------------------------------------------------------------------------
// jwks
// ---------------------------------------------------------------------------
Json::Value TokenService::jwks() const {
    const TimePoint now = now_();
    Json::Value keys(Json::arrayValue);
    {
        std::shared_lock lock(keys_mutex_);
        for (const auto& key : keys_) {
            if (key.usable_for_verification(now)) {
                keys.append(key.to_public_jwk());
            }
        }
    }
    Json::Value out(Json::objectValue);
    out["keys"] = std::move(keys);
    return out;
}

// ---------------------------------------------------------------------------
// cleanup_expired
// ---------------------------------------------------------------------------
std::expected<std::size_t, TokenError> TokenService::cleanup_expired() {
    const TimePoint now = now_();

    auto tokens = storage_->cleanup_expired(now);
    if (!tokens) {
        return std::unexpected(storage_failure(tokens.error()));
    }
    auto keys = key_storage_->remove_retired(now);
    if (!keys) {
        return std::unexpected(storage_failure(keys.error()));
    }
    if (*keys > 0) {
        if (auto r = reload_keys(); !r) {
            return std::unexpected(r.error());
        }
    }
    spdlog::debug("token_service: cleanup removed {} records and {} keys", *tokens, *keys);
    return *tokens + *keys;
}

void TokenService::emit(const char* event, const std::string& id,
                        const std::string& client_id, std::string_view kind) const {
    if (audit_ == nullptr) {
        return;
    }
    TokenEventLog entry;
    entry.event      = event;
    entry.subject_id = id;
    entry.client_id  = client_id;
    entry.kind       = std::string(kind);
    entry.timestamp  = now_();
    audit_->on_token_event(entry);
}
