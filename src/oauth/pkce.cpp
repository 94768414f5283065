#include "oauth/pkce.hpp"

#include "common/base64url.hpp"

#include <array>
#include <stdexcept>

#include <fmt/format.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace {

[[nodiscard]] bool is_unreserved(char ch) noexcept {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
           ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

}  // namespace

std::expected<void, PkceError> Pkce::validate_verifier(std::string_view verifier) {
    if (verifier.size() < kMinLength || verifier.size() > kMaxLength) {
        return std::unexpected(PkceError{
            PkceErrorCode::kInvalidRequest,
            fmt::format("code_verifier length {} outside {}..{}", verifier.size(), kMinLength, kMaxLength)});
    }
    for (const char ch : verifier) {
        if (!is_unreserved(ch)) {
            return std::unexpected(PkceError{PkceErrorCode::kInvalidRequest,
                                             "code_verifier contains invalid characters"});
        }
    }
    return {};
}

std::expected<void, PkceError> Pkce::validate_challenge(std::string_view challenge) {
    if (challenge.size() != 43) {
        return std::unexpected(PkceError{PkceErrorCode::kInvalidRequest,
                                         "code_challenge must be 43 characters for S256"});
    }
    for (const char ch : challenge) {
        const bool ok = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
                        (ch >= '0' && ch <= '9') || ch == '-' || ch == '_';
        if (!ok) {
            return std::unexpected(PkceError{PkceErrorCode::kInvalidRequest,
                                             "code_challenge is not base64url"});
        }
    }
    return {};
}

std::expected<void, PkceError> Pkce::validate_method(std::string_view method) {
    if (method == kMethodS256) {
        return {};
    }
    if (method == "plain") {
        return std::unexpected(PkceError{PkceErrorCode::kInvalidRequest,
                                         "code_challenge_method 'plain' is not allowed"});
    }
    return std::unexpected(PkceError{PkceErrorCode::kInvalidRequest,
                                     fmt::format("unsupported code_challenge_method '{}'", method)});
}

std::string Pkce::challenge_from(std::string_view verifier) {
    std::array<std::uint8_t, SHA256_DIGEST_LENGTH> digest{};
    SHA256(reinterpret_cast<const unsigned char*>(verifier.data()), verifier.size(), digest.data());
    return base64url_encode(digest.data(), digest.size());
}

bool Pkce::verify(std::string_view challenge, std::string_view verifier) {
    const std::string computed = challenge_from(verifier);
    if (computed.size() != challenge.size()) {
        return false;
    }
    return CRYPTO_memcmp(computed.data(), challenge.data(), computed.size()) == 0;
}

std::expected<void, PkceError>
Pkce::verify_request(std::string_view challenge, std::string_view method, std::string_view verifier) {
    if (auto r = validate_method(method); !r) {
        return r;
    }
    if (auto r = validate_verifier(verifier); !r) {
        return r;
    }
    if (!verify(challenge, verifier)) {
        return std::unexpected(PkceError{PkceErrorCode::kInvalidGrant,
                                         "code_verifier does not match code_challenge"});
    }
    return {};
}

std::string Pkce::generate_verifier() {
    std::array<std::uint8_t, 32> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("pkce: RAND_bytes failed");
    }
    return base64url_encode(bytes.data(), bytes.size());
}
