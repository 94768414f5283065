#pragma once

// ---------------------------------------------------------------------------
// token_storage.hpp
//
// Token Service 가 소비하는 영속 저장소 계약.
//
// [일관성 요구사항]
// - revoke() 성공 반환 후의 is_revoked() 는 반드시 true (read-after-write).
//   eventual consistency 창을 허용하지 않는다.
// - 모든 쓰기는 레코드 단위로 원자적이어야 한다. 취소/실패한 호출이
//   절반만 반영된 상태를 남기지 않는다.
// - 서비스는 수평 확장(stateless)을 가정하므로 쓰기 직렬화는 저장소의
//   트랜잭션 보장에 맡기고, 프로세스 내부 lock 에 의존하지 않는다.
//
// [오류 처리]
// 저장소 장애는 StorageError 로 반환한다. Token Service 는 이를
// TokenErrorCode::kStorageUnavailable 로 변환한다 (fail-close).
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "token/token_types.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TokenRecord
//   access/refresh 토큰의 영속 레코드. raw 토큰 문자열은 저장하지 않는다.
// ---------------------------------------------------------------------------
struct TokenRecord {
    std::string                           jti{};
    std::string                           subject{};
    std::string                           client_id{};
    std::string                           scopes{};
    TokenKind                             kind{TokenKind::kAccess};
    std::chrono::system_clock::time_point issued_at{};
    std::chrono::system_clock::time_point expires_at{};
};

// ---------------------------------------------------------------------------
// TokenStorage
// ---------------------------------------------------------------------------
class TokenStorage {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~TokenStorage() = default;

    [[nodiscard]] virtual std::expected<void, StorageError> persist(const TokenRecord& record) = 0;

    [[nodiscard]] virtual std::expected<std::optional<TokenRecord>, StorageError>
    find(const std::string& jti) = 0;

    [[nodiscard]] virtual std::expected<bool, StorageError> is_revoked(const std::string& jti) = 0;

    // jti 를 폐기 집합에 추가한다. expires_at 이후 cleanup 대상.
    // 이미 폐기된 jti 는 성공으로 처리한다 (멱등).
    [[nodiscard]] virtual std::expected<void, StorageError>
    revoke(const std::string& jti, TimePoint expires_at) = 0;

    // 만료된 폐기 항목과 토큰 레코드를 삭제하고 삭제 건수를 반환한다.
    [[nodiscard]] virtual std::expected<std::size_t, StorageError> cleanup_expired(TimePoint now) = 0;
};

// ---------------------------------------------------------------------------
// StoredSigningKey
//   저장소에 보관되는 서명 키. private_pem 은 PKCS#8 PEM.
// ---------------------------------------------------------------------------
struct StoredSigningKey {
    std::string                                          kid{};
    std::string                                          algorithm{};   // "RS256" 등
    std::string                                          private_pem{};
    std::chrono::system_clock::time_point                created_at{};
    std::optional<std::chrono::system_clock::time_point> retire_after{};
    bool                                                 current{false};
};

// ---------------------------------------------------------------------------
// SigningKeyStorage
// ---------------------------------------------------------------------------
class SigningKeyStorage {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~SigningKeyStorage() = default;

    [[nodiscard]] virtual std::expected<std::vector<StoredSigningKey>, StorageError> load_keys() = 0;

    // insert_key_as_current
    //   단일 트랜잭션으로 (1) 기존 current 키의 current=false,
    //   retire_after=previous_retire_after 설정 (2) 새 키를 current 로 삽입.
    [[nodiscard]] virtual std::expected<void, StorageError>
    insert_key_as_current(const StoredSigningKey& key, TimePoint previous_retire_after) = 0;

    // current 가 아니고 retire_after 가 지난 키만 삭제한다.
    [[nodiscard]] virtual std::expected<std::size_t, StorageError> remove_retired(TimePoint now) = 0;
};
