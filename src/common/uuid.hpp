#pragma once

#include <string>

// uuid_v4
//   OpenSSL RNG 기반 RFC 4122 v4 UUID (소문자 hex, 하이픈 포함).
//   RNG 실패 시 std::runtime_error.
[[nodiscard]] std::string uuid_v4();
