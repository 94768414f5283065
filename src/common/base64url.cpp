// ---------------------------------------------------------------------------
// base64url.cpp
//
// OpenSSL EVP_EncodeBlock / EVP_DecodeBlock 위에서 알파벳만 치환한다.
// EVP_DecodeBlock 은 패딩 바이트까지 길이에 포함하므로 직접 보정한다.
// ---------------------------------------------------------------------------

#include "common/base64url.hpp"

#include <algorithm>

#include <openssl/evp.h>

std::string base64url_encode(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return {};
    }
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data, static_cast<int>(len));
    out.resize(static_cast<std::size_t>(written));

    for (auto& ch : out) {
        if (ch == '+') {
            ch = '-';
        } else if (ch == '/') {
            ch = '_';
        }
    }
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    return out;
}

std::string base64url_encode(std::string_view data) {
    return base64url_encode(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::optional<std::vector<std::uint8_t>> base64url_decode(std::string_view text) {
    if (text.empty()) {
        return std::vector<std::uint8_t>{};
    }
    // 길이 % 4 == 1 은 어떤 바이트열로도 만들 수 없다
    if (text.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string std_b64;
    std_b64.reserve(text.size() + 3);
    for (const char ch : text) {
        if ((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
            std_b64 += ch;
        } else if (ch == '-') {
            std_b64 += '+';
        } else if (ch == '_') {
            std_b64 += '/';
        } else {
            return std::nullopt;
        }
    }
    const std::size_t pad = (4 - std_b64.size() % 4) % 4;
    std_b64.append(pad, '=');

    std::vector<std::uint8_t> out(std_b64.size() / 4 * 3);
    const int decoded = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(std_b64.data()),
                                        static_cast<int>(std_b64.size()));
    if (decoded < 0 || static_cast<std::size_t>(decoded) < pad) {
        return std::nullopt;
    }
    out.resize(static_cast<std::size_t>(decoded) - pad);
    return out;
}

std::optional<std::string> base64url_decode_string(std::string_view text) {
    auto bytes = base64url_decode(text);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}
