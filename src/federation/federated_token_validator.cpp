#include "federation/federated_token_validator.hpp"

#include "token/jwt.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

FederatedTokenValidator::FederatedTokenValidator(JwksCache& cache, NowFn now)
    : cache_(cache)
    , now_(std::move(now))
{}

std::expected<ValidatedClaims, TokenError>
FederatedTokenValidator::validate(std::string_view raw, const FederatedIssuer& issuer) const {
    auto parts = decode_jwt(raw);
    if (!parts) {
        return std::unexpected(TokenError{TokenErrorCode::kMalformed, parts.error()});
    }

    bool verified = false;
    std::string kid;
    if (!parts->kid.empty()) {
        auto key = cache_.get_key(issuer.jwks_uri, parts->kid);
        if (!key) {
            spdlog::warn("federated_token_validator: key lookup failed for '{}': {}",
                         issuer.jwks_uri, key.error().message);
            return std::unexpected(TokenError{TokenErrorCode::kSignatureInvalid,
                                              fmt::format("{}: {}", to_string(key.error().code), key.error().message)});
        }
        verified = key->algorithm() == parts->algorithm &&
                   key->verify(parts->signing_input, parts->signature);
        kid = key->kid();
    } else {
        auto keys = cache_.find_signing_keys(issuer.jwks_uri);
        if (!keys) {
            return std::unexpected(TokenError{TokenErrorCode::kSignatureInvalid,
                                              fmt::format("{}: {}", to_string(keys.error().code), keys.error().message)});
        }
        for (const auto& key : *keys) {
            if (key.algorithm() == parts->algorithm && key.verify(parts->signing_input, parts->signature)) {
                verified = true;
                kid = key.kid();
                break;
            }
        }
    }
    if (!verified) {
        return std::unexpected(TokenError{TokenErrorCode::kSignatureInvalid, "federated token signature is invalid"});
    }

    auto claims = ValidatedClaims::from_json(parts->claims);
    if (!claims) {
        return std::unexpected(TokenError{TokenErrorCode::kMalformed, claims.error()});
    }
    claims->kid = kid;

    if (issuer.issuer && claims->iss != *issuer.issuer) {
        return std::unexpected(TokenError{TokenErrorCode::kInvalidIssuer,
                                          fmt::format("unexpected issuer '{}'", claims->iss)});
    }
    if (issuer.audience &&
        std::find(claims->aud.begin(), claims->aud.end(), *issuer.audience) == claims->aud.end()) {
        return std::unexpected(TokenError{TokenErrorCode::kMalformed, "token audience does not match"});
    }

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(now_().time_since_epoch()).count();
    if (claims->exp <= now) {
        return std::unexpected(TokenError{TokenErrorCode::kExpired, "federated token has expired"});
    }
    if (claims->nbf && *claims->nbf > now) {
        return std::unexpected(TokenError{TokenErrorCode::kNotYetValid, "federated token is not yet valid"});
    }
    return std::move(*claims);
}
